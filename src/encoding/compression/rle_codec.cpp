#include "dcmpix/encoding/compression/rle_codec.hpp"
#include "dcmpix/encoding/compression/rle_segment.hpp"
#include "dcmpix/integration/logger_adapter.hpp"

namespace dcmpix::encoding::compression {

namespace {

using dcmpix::integration::logger_adapter;
using dcmpix::integration::nonconformance;

/**
 * @brief Reads a 32-bit little-endian value from buffer.
 */
inline uint32_t read_le32(const uint8_t* data) {
    return static_cast<uint32_t>(data[0]) |
           (static_cast<uint32_t>(data[1]) << 8) |
           (static_cast<uint32_t>(data[2]) << 16) |
           (static_cast<uint32_t>(data[3]) << 24);
}

/**
 * @brief Writes a 32-bit little-endian value to buffer.
 */
inline void write_le32(uint8_t* data, uint32_t value) {
    data[0] = static_cast<uint8_t>(value & 0xFF);
    data[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
    data[2] = static_cast<uint8_t>((value >> 16) & 0xFF);
    data[3] = static_cast<uint8_t>((value >> 24) & 0xFF);
}

/**
 * @brief Index of the segment holding byte k (0 = LSB) of sample s.
 */
std::size_t segment_index(std::size_t sample, std::size_t byte_position,
                          std::size_t bytes_per_sample, rle_segment_order order) {
    const std::size_t within = order == rle_segment_order::big_endian
                                   ? bytes_per_sample - 1 - byte_position
                                   : byte_position;
    return sample * bytes_per_sample + within;
}

}  // namespace

// ============================================================================
// Free functions
// ============================================================================

Result<std::vector<uint32_t>> parse_rle_header(std::span<const uint8_t> frame) {
    if (frame.size() < kRleHeaderSize) {
        return dcmpix_error<std::vector<uint32_t>>(
            error_codes::invalid_rle_header,
            dcmpix::compat::format(
                "RLE frame of {} bytes is too small for the 64 byte header",
                frame.size()));
    }

    const uint32_t count = read_le32(frame.data());
    if (count > kRleMaxSegments) {
        return dcmpix_error<std::vector<uint32_t>>(
            error_codes::invalid_rle_header,
            dcmpix::compat::format(
                "The RLE header declares {} segments, at most 15 are allowed", count));
    }

    std::vector<uint32_t> offsets(count);
    for (uint32_t i = 0; i < count; ++i) {
        offsets[i] = read_le32(frame.data() + 4 + i * 4);

        if (offsets[i] < kRleHeaderSize || offsets[i] > frame.size()) {
            return dcmpix_error<std::vector<uint32_t>>(
                error_codes::invalid_rle_header,
                dcmpix::compat::format(
                    "Invalid offset {} for RLE segment {} in a {} byte frame",
                    offsets[i], i, frame.size()));
        }
        if (i > 0 && offsets[i] < offsets[i - 1]) {
            return dcmpix_error<std::vector<uint32_t>>(
                error_codes::invalid_rle_header,
                dcmpix::compat::format(
                    "RLE segment offsets decrease ({} after {})",
                    offsets[i], offsets[i - 1]));
        }
    }

    return ok<std::vector<uint32_t>>(std::move(offsets));
}

Result<std::vector<uint8_t>> rle_decode_frame(std::span<const uint8_t> frame,
                                              const frame_geometry& geometry,
                                              rle_segment_order order) {
    if (!geometry.byte_aligned()) {
        return dcmpix_error<std::vector<uint8_t>>(
            error_codes::unsupported_encoding,
            dcmpix::compat::format(
                "Unable to decode RLE encoded pixel data with a (0028,0100) "
                "'Bits Allocated' value of {}", geometry.bits_allocated));
    }

    auto header = parse_rle_header(frame);
    if (header.is_err()) {
        return forward_error<std::vector<uint8_t>>(header);
    }

    auto offsets = std::move(header.value());
    const std::size_t expected_segments = geometry.segment_count();
    if (offsets.size() != expected_segments) {
        return dcmpix_error<std::vector<uint8_t>>(
            error_codes::segment_count_mismatch,
            dcmpix::compat::format(
                "The number of RLE segments ({}) doesn't match the expected "
                "amount ({})", offsets.size(), expected_segments));
    }
    offsets.push_back(static_cast<uint32_t>(frame.size()));

    const std::size_t bytes_per_sample = geometry.bytes_per_sample();
    const std::size_t pixels = geometry.pixels_per_frame();
    const std::size_t plane_stride = bytes_per_sample * pixels;

    std::vector<uint8_t> output(geometry.frame_size_bytes());

    for (std::size_t s = 0; s < geometry.samples_per_pixel; ++s) {
        for (std::size_t k = 0; k < bytes_per_sample; ++k) {
            const std::size_t index = segment_index(s, k, bytes_per_sample, order);
            const auto segment = frame.subspan(offsets[index],
                                               offsets[index + 1] - offsets[index]);

            auto decoded = decode_rle_segment(segment, pixels);

            if (decoded.size() < pixels) {
                return dcmpix_error<std::vector<uint8_t>>(
                    error_codes::segment_length_mismatch,
                    dcmpix::compat::format(
                        "The amount of decoded RLE segment data doesn't match the "
                        "expected amount ({} vs. {} bytes) for segment {}",
                        decoded.size(), pixels, index));
            }
            if (decoded.size() > pixels) {
                logger_adapter::log_nonconformance(
                    nonconformance::rle_segment_overrun,
                    dcmpix::compat::format(
                        "The decoded RLE segment {} contains {} bytes more than "
                        "expected; the excess will be discarded",
                        index, decoded.size() - pixels));
            }

            const std::size_t start = k + s * plane_stride;
            for (std::size_t p = 0; p < pixels; ++p) {
                output[start + p * bytes_per_sample] = decoded[p];
            }
        }
    }

    return ok<std::vector<uint8_t>>(std::move(output));
}

Result<std::vector<uint8_t>> rle_encode_frame(std::span<const uint8_t> pixels,
                                              const frame_geometry& geometry) {
    if (!geometry.byte_aligned()) {
        return dcmpix_error<std::vector<uint8_t>>(
            error_codes::unsupported_encoding,
            dcmpix::compat::format(
                "Unable to RLE encode pixel data with a (0028,0100) 'Bits "
                "Allocated' value of {}", geometry.bits_allocated));
    }

    if (geometry.rows == 0 || geometry.columns == 0 || geometry.samples_per_pixel == 0) {
        return dcmpix_error<std::vector<uint8_t>>(
            error_codes::invalid_parameter,
            dcmpix::compat::format(
                "Invalid frame geometry: {} rows, {} columns, {} samples per pixel",
                geometry.rows, geometry.columns, geometry.samples_per_pixel));
    }

    const std::size_t num_segments = geometry.segment_count();
    if (num_segments > kRleMaxSegments) {
        return dcmpix_error<std::vector<uint8_t>>(
            error_codes::unsupported_encoding,
            dcmpix::compat::format(
                "RLE encoding needs {} segments for {} samples of {} bits; "
                "at most 15 are allowed",
                num_segments, geometry.samples_per_pixel, geometry.bits_allocated));
    }

    const std::size_t expected_size = geometry.frame_size_bytes();
    if (pixels.size() != expected_size) {
        return dcmpix_error<std::vector<uint8_t>>(
            error_codes::invalid_parameter,
            dcmpix::compat::format(
                "Pixel data size mismatch: expected {}, got {}",
                expected_size, pixels.size()));
    }

    const std::size_t bytes_per_sample = geometry.bytes_per_sample();
    const std::size_t pixel_count = geometry.pixels_per_frame();
    const std::size_t samples = geometry.samples_per_pixel;
    const std::size_t columns = geometry.columns;
    const bool interleaved = geometry.planar_configuration == 0;

    // One byte plane per segment, MSB plane of each sample first
    std::vector<std::vector<uint8_t>> encoded_segments;
    encoded_segments.reserve(num_segments);

    std::vector<uint8_t> plane(pixel_count);
    for (std::size_t s = 0; s < samples; ++s) {
        for (std::size_t msb = 0; msb < bytes_per_sample; ++msb) {
            const std::size_t k = bytes_per_sample - 1 - msb;
            for (std::size_t p = 0; p < pixel_count; ++p) {
                const std::size_t sample_index =
                    interleaved ? p * samples + s : s * pixel_count + p;
                plane[p] = pixels[sample_index * bytes_per_sample + k];
            }

            // Each row is encoded separately; runs never cross a row boundary
            const std::span<const uint8_t> plane_view(plane);
            std::vector<uint8_t> encoded;
            for (std::size_t row = 0; row < geometry.rows; ++row) {
                auto row_bytes = encode_rle_segment(plane_view.subspan(row * columns, columns));
                encoded.insert(encoded.end(), row_bytes.begin(), row_bytes.end());
            }
            if (encoded.size() % 2 != 0) {
                encoded.push_back(0);  // Padding byte
            }
            encoded_segments.push_back(std::move(encoded));
        }
    }

    std::size_t total_size = kRleHeaderSize;
    for (const auto& seg : encoded_segments) {
        total_size += seg.size();
    }

    std::vector<uint8_t> output(kRleHeaderSize, 0);
    output.reserve(total_size);

    write_le32(output.data(), static_cast<uint32_t>(num_segments));

    auto current_offset = static_cast<uint32_t>(kRleHeaderSize);
    for (std::size_t i = 0; i < num_segments; ++i) {
        write_le32(output.data() + 4 + i * 4, current_offset);
        current_offset += static_cast<uint32_t>(encoded_segments[i].size());
    }

    for (const auto& seg : encoded_segments) {
        output.insert(output.end(), seg.begin(), seg.end());
    }

    return ok<std::vector<uint8_t>>(std::move(output));
}

// ============================================================================
// rle_codec
// ============================================================================

/**
 * @brief PIMPL implementation for rle_codec.
 */
class rle_codec::impl {
public:
    explicit impl(rle_segment_order order) : order_(order) {}

    [[nodiscard]] rle_segment_order order() const noexcept { return order_; }

    [[nodiscard]] codec_result encode(std::span<const uint8_t> pixel_data,
                                      const frame_geometry& geometry) const {
        auto encoded = rle_encode_frame(pixel_data, geometry);
        if (encoded.is_err()) {
            return forward_error<compression_result>(encoded);
        }
        return ok<compression_result>(
            compression_result{std::move(encoded.value()), geometry});
    }

    [[nodiscard]] codec_result decode(std::span<const uint8_t> compressed_data,
                                      const frame_geometry& geometry) const {
        auto decoded = rle_decode_frame(compressed_data, geometry, order_);
        if (decoded.is_err()) {
            return forward_error<compression_result>(decoded);
        }

        frame_geometry output_geometry = geometry;
        output_geometry.planar_configuration = 1;  // Always planar output
        return ok<compression_result>(
            compression_result{std::move(decoded.value()), output_geometry});
    }

private:
    rle_segment_order order_;
};

rle_codec::rle_codec(rle_segment_order order)
    : impl_(std::make_unique<impl>(order)) {}

rle_codec::~rle_codec() = default;

rle_codec::rle_codec(rle_codec&&) noexcept = default;

rle_codec& rle_codec::operator=(rle_codec&&) noexcept = default;

std::string_view rle_codec::transfer_syntax_uid() const noexcept {
    return kTransferSyntaxUID;
}

std::string_view rle_codec::name() const noexcept {
    return "RLE Lossless";
}

bool rle_codec::is_lossy() const noexcept {
    return false;
}

bool rle_codec::can_encode(const frame_geometry& geometry) const noexcept {
    if (!geometry.byte_aligned()) {
        return false;
    }
    if (geometry.rows == 0 || geometry.columns == 0 || geometry.samples_per_pixel == 0) {
        return false;
    }
    return geometry.segment_count() <= kRleMaxSegments;
}

bool rle_codec::can_decode(const frame_geometry& geometry) const noexcept {
    return geometry.byte_aligned() && geometry.segment_count() <= kRleMaxSegments;
}

rle_segment_order rle_codec::segment_order() const noexcept {
    return impl_->order();
}

codec_result rle_codec::encode(std::span<const uint8_t> pixel_data,
                               const frame_geometry& geometry) const {
    return impl_->encode(pixel_data, geometry);
}

codec_result rle_codec::decode(std::span<const uint8_t> compressed_data,
                               const frame_geometry& geometry) const {
    return impl_->decode(compressed_data, geometry);
}

}  // namespace dcmpix::encoding::compression
