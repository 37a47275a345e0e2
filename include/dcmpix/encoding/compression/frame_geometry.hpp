#ifndef DCMPIX_ENCODING_COMPRESSION_FRAME_GEOMETRY_HPP
#define DCMPIX_ENCODING_COMPRESSION_FRAME_GEOMETRY_HPP

#include <cstddef>
#include <cstdint>

namespace dcmpix::encoding::compression {

/**
 * @brief Declared layout of the pixel data of one frame.
 *
 * Taken from the Image Pixel Module of the enclosing dataset. The codecs do
 * not interpret pixel values; these attributes only size and order bytes.
 */
struct frame_geometry {
    /// Rows (0028,0010)
    uint32_t rows{0};

    /// Columns (0028,0011)
    uint32_t columns{0};

    /// Samples per Pixel (0028,0002)
    uint16_t samples_per_pixel{1};

    /// Bits Allocated (0028,0100); RLE needs a multiple of 8
    uint16_t bits_allocated{8};

    /// Planar Configuration (0028,0006)
    /// 0 = interleaved (R1G1B1R2G2B2...), 1 = separate planes (RRR...GGG...BBB...)
    uint16_t planar_configuration{1};

    /// Number of Frames (0028,0008)
    uint32_t number_of_frames{1};

    [[nodiscard]] std::size_t pixels_per_frame() const noexcept {
        return static_cast<std::size_t>(rows) * columns;
    }

    [[nodiscard]] std::size_t bytes_per_sample() const noexcept {
        return bits_allocated / 8;
    }

    /// One RLE segment per byte of every sample
    [[nodiscard]] std::size_t segment_count() const noexcept {
        return static_cast<std::size_t>(samples_per_pixel) * bytes_per_sample();
    }

    /**
     * @brief Size of one uncompressed frame in bytes.
     */
    [[nodiscard]] std::size_t frame_size_bytes() const noexcept {
        return pixels_per_frame() * samples_per_pixel * bytes_per_sample();
    }

    [[nodiscard]] bool byte_aligned() const noexcept {
        return bits_allocated > 0 && bits_allocated % 8 == 0;
    }
};

}  // namespace dcmpix::encoding::compression

#endif  // DCMPIX_ENCODING_COMPRESSION_FRAME_GEOMETRY_HPP
