#ifndef DCMPIX_ENCODING_ENCAPSULATION_ENCAPSULATOR_HPP
#define DCMPIX_ENCODING_ENCAPSULATION_ENCAPSULATOR_HPP

#include "dcmpix/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace dcmpix::encoding::encapsulation {

/**
 * @brief Splits one frame into fragments of even length.
 *
 * Every fragment except the last gets the same even length, close to
 * len / nr_fragments. The last fragment takes the remainder and is padded
 * with a single 0x00 byte when its length is odd, so the fragment lengths
 * always add up to the frame length rounded up to even.
 *
 * @param frame Compressed frame bytes
 * @param nr_fragments Number of fragments to produce
 * @return The fragments, or fragmentation_limit_exceeded if nr_fragments is 0
 *         or the frame is too short to give every fragment at least 2 bytes
 *         after padding
 */
[[nodiscard]] Result<std::vector<std::vector<uint8_t>>> fragment_frame(
    std::span<const uint8_t> frame, std::size_t nr_fragments);

/**
 * @brief Fragments a frame and wraps each fragment as an Item.
 */
[[nodiscard]] Result<std::vector<uint8_t>> itemize_frame(
    std::span<const uint8_t> frame, std::size_t nr_fragments);

/**
 * @brief Builds the value of an encapsulated Pixel Data element.
 *
 * The output always starts with a BOT item; it is empty unless
 * include_bot is set. The closing Sequence Delimiter is left to the element
 * writer.
 *
 * @param frames Compressed frames in order
 * @param fragments_per_frame Number of fragments for every frame
 * @param include_bot Fill the Basic Offset Table
 * @return The encapsulated bytes, or fragmentation_limit_exceeded /
 *         offset_table_overflow
 */
[[nodiscard]] Result<std::vector<uint8_t>> encapsulate(
    const std::vector<std::vector<uint8_t>>& frames,
    std::size_t fragments_per_frame = 1,
    bool include_bot = true);

/**
 * @brief Encapsulated data together with its Extended Offset Table.
 */
struct extended_encapsulation {
    /// Value of Pixel Data (7FE0,0010), with an empty BOT
    std::vector<uint8_t> pixel_data;

    /// Value of Extended Offset Table (7FE0,0001)
    std::vector<uint8_t> extended_offset_table;

    /// Value of Extended Offset Table Lengths (7FE0,0002)
    std::vector<uint8_t> extended_offset_table_lengths;
};

/**
 * @brief Encapsulates one fragment per frame and builds the Extended Offset
 *        Table for it.
 *
 * Suitable for data whose offsets overflow the 32-bit BOT. Lengths of odd
 * frames are recorded after padding.
 */
[[nodiscard]] Result<extended_encapsulation> encapsulate_extended(
    const std::vector<std::vector<uint8_t>>& frames);

}  // namespace dcmpix::encoding::encapsulation

#endif  // DCMPIX_ENCODING_ENCAPSULATION_ENCAPSULATOR_HPP
