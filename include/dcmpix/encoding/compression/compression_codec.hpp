#ifndef DCMPIX_ENCODING_COMPRESSION_COMPRESSION_CODEC_HPP
#define DCMPIX_ENCODING_COMPRESSION_COMPRESSION_CODEC_HPP

#include "dcmpix/encoding/compression/frame_geometry.hpp"
#include <dcmpix/core/result.hpp>

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace dcmpix::encoding::compression {

/**
 * @brief Successful result of encoding or decoding one frame.
 */
struct compression_result {
    /// Processed frame bytes
    std::vector<uint8_t> data;

    /// Layout of data (decoders may normalize planar configuration)
    frame_geometry output_geometry;
};

/**
 * @brief Result type alias for codec operations using dcmpix::Result<T>
 */
using codec_result = dcmpix::Result<compression_result>;

/**
 * @brief Abstract base class for pixel data codecs.
 *
 * One implementation per Transfer Syntax. RLE Lossless ships with the
 * library; other schemes are attached through codec_factory.
 *
 * Thread Safety:
 * - Codec instances are NOT required to be thread-safe
 * - Create one instance per thread for concurrent work
 */
class compression_codec {
public:
    virtual ~compression_codec() = default;

    /// @name Codec Information
    /// @{

    [[nodiscard]] virtual std::string_view transfer_syntax_uid() const noexcept = 0;

    /**
     * @brief Returns a human-readable name for the codec.
     */
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    [[nodiscard]] virtual bool is_lossy() const noexcept = 0;

    /**
     * @brief Checks if this codec can handle frames with this geometry.
     */
    [[nodiscard]] virtual bool can_encode(const frame_geometry& geometry) const noexcept = 0;

    [[nodiscard]] virtual bool can_decode(const frame_geometry& geometry) const noexcept = 0;

    /// @}

    /// @name Frame Operations
    /// @{

    /**
     * @brief Compresses one uncompressed frame.
     *
     * @param pixel_data Frame bytes laid out as described by geometry
     * @param geometry Declared frame layout
     * @return codec_result containing the compressed frame or an error
     */
    [[nodiscard]] virtual codec_result encode(
        std::span<const uint8_t> pixel_data,
        const frame_geometry& geometry) const = 0;

    /**
     * @brief Decompresses one compressed frame.
     *
     * @param compressed_data All bytes of a single frame
     * @param geometry Declared frame layout
     * @return codec_result containing the frame bytes or an error
     */
    [[nodiscard]] virtual codec_result decode(
        std::span<const uint8_t> compressed_data,
        const frame_geometry& geometry) const = 0;

    /// @}

protected:
    compression_codec() = default;
    compression_codec(const compression_codec&) = default;
    compression_codec& operator=(const compression_codec&) = default;
    compression_codec(compression_codec&&) = default;
    compression_codec& operator=(compression_codec&&) = default;
};

}  // namespace dcmpix::encoding::compression

#endif  // DCMPIX_ENCODING_COMPRESSION_COMPRESSION_CODEC_HPP
