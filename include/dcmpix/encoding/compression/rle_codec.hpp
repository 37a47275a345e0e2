#ifndef DCMPIX_ENCODING_COMPRESSION_RLE_CODEC_HPP
#define DCMPIX_ENCODING_COMPRESSION_RLE_CODEC_HPP

#include "dcmpix/encoding/compression/compression_codec.hpp"

#include <memory>

namespace dcmpix::encoding::compression {

/// Maximum number of RLE segments in a frame
constexpr std::size_t kRleMaxSegments = 15;

/// RLE header size (64 bytes: segment count + 15 offsets)
constexpr std::size_t kRleHeaderSize = 64;

/**
 * @brief Order of the byte segments of a multi-byte sample.
 *
 * The standard stores the most significant byte's segment first. Some
 * encoders write the least significant byte first; decoding their output
 * needs little_endian.
 */
enum class rle_segment_order {
    big_endian,    ///< MSB segment first (conformant)
    little_endian  ///< LSB segment first (non-conformant writers)
};

/**
 * @brief Reads the segment offsets from the 64-byte RLE header.
 *
 * @param frame All bytes of one RLE frame
 * @return One offset per segment, or invalid_rle_header when the frame is
 *         shorter than the header, declares more than 15 segments, or has
 *         offsets inside the header, past the end of the frame or decreasing
 */
[[nodiscard]] Result<std::vector<uint32_t>> parse_rle_header(std::span<const uint8_t> frame);

/**
 * @brief Decodes one RLE frame.
 *
 * Output is little-endian with planar configuration 1 (all samples of the
 * first component, then the second, ...).
 *
 * Errors:
 * - unsupported_encoding: bits_allocated not a multiple of 8
 * - invalid_rle_header: see parse_rle_header()
 * - segment_count_mismatch: header count differs from samples x bytes
 * - segment_length_mismatch: a segment decodes to fewer than rows x columns
 *   bytes (longer segments are truncated with a warning)
 */
[[nodiscard]] Result<std::vector<uint8_t>> rle_decode_frame(
    std::span<const uint8_t> frame,
    const frame_geometry& geometry,
    rle_segment_order order = rle_segment_order::big_endian);

/**
 * @brief Encodes one frame as RLE.
 *
 * The pixels are little-endian, laid out per geometry.planar_configuration.
 * Segments are written MSB first and padded to even length.
 *
 * Errors:
 * - invalid_parameter: zero rows or columns, or pixel size differs from
 *   geometry.frame_size_bytes()
 * - unsupported_encoding: bits_allocated not a multiple of 8, or more than
 *   15 segments needed
 */
[[nodiscard]] Result<std::vector<uint8_t>> rle_encode_frame(
    std::span<const uint8_t> pixels,
    const frame_geometry& geometry);

/**
 * @brief DICOM RLE Lossless codec implementation.
 *
 * Implements DICOM Transfer Syntax 1.2.840.10008.1.2.5 with no external
 * library. Any whole-byte sample size is supported as long as the frame
 * needs at most 15 segments (e.g. 8, 16 or 32 bits, 1 to 3 samples).
 *
 * Thread Safety:
 * - Instances hold no mutable state and may be shared between threads
 *
 * @see DICOM PS3.5 Annex G - RLE Lossless Compression
 */
class rle_codec final : public compression_codec {
public:
    /// DICOM Transfer Syntax UID for RLE Lossless
    static constexpr std::string_view kTransferSyntaxUID = "1.2.840.10008.1.2.5";

    /**
     * @brief Constructs an RLE codec instance.
     * @param order Segment order assumed when decoding
     */
    explicit rle_codec(rle_segment_order order = rle_segment_order::big_endian);

    ~rle_codec() override;

    rle_codec(const rle_codec&) = delete;
    rle_codec& operator=(const rle_codec&) = delete;
    rle_codec(rle_codec&&) noexcept;
    rle_codec& operator=(rle_codec&&) noexcept;

    /// @name Codec Information
    /// @{

    [[nodiscard]] std::string_view transfer_syntax_uid() const noexcept override;
    [[nodiscard]] std::string_view name() const noexcept override;
    [[nodiscard]] bool is_lossy() const noexcept override;
    [[nodiscard]] bool can_encode(const frame_geometry& geometry) const noexcept override;
    [[nodiscard]] bool can_decode(const frame_geometry& geometry) const noexcept override;

    [[nodiscard]] rle_segment_order segment_order() const noexcept;

    /// @}

    /// @name Frame Operations
    /// @{

    /**
     * @brief Compresses one frame to RLE.
     * @see rle_encode_frame()
     */
    [[nodiscard]] codec_result encode(
        std::span<const uint8_t> pixel_data,
        const frame_geometry& geometry) const override;

    /**
     * @brief Decompresses one RLE frame.
     *
     * The output geometry always has planar_configuration 1.
     * @see rle_decode_frame()
     */
    [[nodiscard]] codec_result decode(
        std::span<const uint8_t> compressed_data,
        const frame_geometry& geometry) const override;

    /// @}

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace dcmpix::encoding::compression

#endif  // DCMPIX_ENCODING_COMPRESSION_RLE_CODEC_HPP
