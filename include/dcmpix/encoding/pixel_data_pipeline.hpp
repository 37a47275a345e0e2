/**
 * @file pixel_data_pipeline.hpp
 * @brief Frame assembly plus codec, in both directions
 *
 * Decoding: encapsulated Pixel Data value -> frames -> decoded pixel bytes.
 * Encoding: pixel bytes -> compressed frames -> encapsulated value.
 */

#ifndef DCMPIX_ENCODING_PIXEL_DATA_PIPELINE_HPP
#define DCMPIX_ENCODING_PIXEL_DATA_PIPELINE_HPP

#include "dcmpix/core/result.hpp"
#include "dcmpix/encoding/compression/compression_codec.hpp"
#include "dcmpix/encoding/compression/frame_geometry.hpp"
#include "dcmpix/encoding/compression/rle_codec.hpp"
#include "dcmpix/encoding/encapsulation/frame_reader.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace dcmpix::encoding {

/**
 * @struct pipeline_config
 * @brief Settings for pixel_data_pipeline
 */
struct pipeline_config {
    /// Transfer Syntax of the encapsulated data
    std::string transfer_syntax_uid{compression::rle_codec::kTransferSyntaxUID};

    /// Boundary heuristic and Extended Offset Table; the frame count comes
    /// from the geometry passed to each call
    encapsulation::frame_read_options read_options;

    /// Fragments written per frame when encoding
    std::size_t fragments_per_frame = 1;

    /// Fill the Basic Offset Table when encoding
    bool include_offset_table = true;

    /// Segment order assumed when decoding RLE
    compression::rle_segment_order segment_order = compression::rle_segment_order::big_endian;

    /// Decode/encode frames on the shared thread pool
    bool parallel = false;
};

/**
 * @class pixel_data_pipeline
 * @brief Converts between encapsulated Pixel Data and per-frame pixel bytes
 *
 * The codec is chosen from pipeline_config::transfer_syntax_uid through
 * codec_factory; RLE Lossless honours pipeline_config::segment_order.
 *
 * Thread Safety: const methods may be called concurrently.
 */
class pixel_data_pipeline {
public:
    using frame_bytes = std::vector<uint8_t>;

    explicit pixel_data_pipeline(pipeline_config config = {});

    /**
     * @brief Decodes every frame; the first failure aborts.
     *
     * @param encapsulated Value of the Pixel Data element, starting at the BOT
     * @param geometry Declared layout; number_of_frames drives frame assembly
     */
    [[nodiscard]] Result<std::vector<frame_bytes>> decode_frames(
        std::span<const uint8_t> encapsulated,
        const compression::frame_geometry& geometry) const;

    /**
     * @brief Decodes every frame, keeping one result per frame.
     *
     * A frame that fails to assemble or decode does not affect the others.
     * If the container itself cannot be opened the result holds that single
     * error. Frames are decoded on the thread pool when parallel is set.
     */
    [[nodiscard]] std::vector<Result<frame_bytes>> decode_frames_independently(
        std::span<const uint8_t> encapsulated,
        const compression::frame_geometry& geometry) const;

    /**
     * @brief Compresses and encapsulates frames.
     *
     * @param frames Uncompressed frames, each geometry.frame_size_bytes() long
     * @param geometry Layout of every frame
     * @return Value for the Pixel Data element (without the Sequence Delimiter)
     */
    [[nodiscard]] Result<frame_bytes> encode_frames(
        const std::vector<frame_bytes>& frames,
        const compression::frame_geometry& geometry) const;

    [[nodiscard]] const pipeline_config& config() const noexcept { return config_; }

private:
    [[nodiscard]] std::unique_ptr<compression::compression_codec> make_codec() const;

    [[nodiscard]] encapsulation::frame_read_options read_options_for(
        const compression::frame_geometry& geometry) const;

    [[nodiscard]] Result<frame_bytes> decode_one(
        std::span<const uint8_t> frame,
        const compression::frame_geometry& geometry) const;

    pipeline_config config_;
};

}  // namespace dcmpix::encoding

#endif  // DCMPIX_ENCODING_PIXEL_DATA_PIPELINE_HPP
