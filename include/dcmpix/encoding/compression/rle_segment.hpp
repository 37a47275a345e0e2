#ifndef DCMPIX_ENCODING_COMPRESSION_RLE_SEGMENT_HPP
#define DCMPIX_ENCODING_COMPRESSION_RLE_SEGMENT_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace dcmpix::encoding::compression {

/**
 * @brief Decodes one RLE segment (PackBits variant).
 *
 * Header byte h:
 * - 0 <= h <= 127: copy the next h+1 bytes literally
 * - 129 <= h <= 255: repeat the next byte 257-h times
 * - h == 128: no operation
 *
 * Decoding runs until the input is exhausted; there is no end marker. A run
 * cut short by the end of the input copies what is available, so the pad
 * byte of an even-padded segment is harmless.
 *
 * @param input Exactly the bytes of one segment
 * @param size_hint Expected decoded size, used only to reserve memory
 * @return Decoded bytes
 */
[[nodiscard]] std::vector<uint8_t> decode_rle_segment(std::span<const uint8_t> input,
                                                      std::size_t size_hint = 0);

/**
 * @brief Encodes bytes as one RLE segment.
 *
 * Runs of 3 or more identical bytes become replicate runs; everything else
 * goes into literal runs. Both are capped at 128 bytes. The output is not
 * padded. Frame encoders call this once per row and append the results.
 */
[[nodiscard]] std::vector<uint8_t> encode_rle_segment(std::span<const uint8_t> input);

}  // namespace dcmpix::encoding::compression

#endif  // DCMPIX_ENCODING_COMPRESSION_RLE_SEGMENT_HPP
