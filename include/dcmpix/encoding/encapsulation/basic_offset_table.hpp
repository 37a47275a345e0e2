#ifndef DCMPIX_ENCODING_ENCAPSULATION_BASIC_OFFSET_TABLE_HPP
#define DCMPIX_ENCODING_ENCAPSULATION_BASIC_OFFSET_TABLE_HPP

#include "dcmpix/core/result.hpp"
#include "dcmpix/encoding/byte_source.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace dcmpix::encoding::encapsulation {

/**
 * @brief Parses the Basic Offset Table, the first item of the container.
 *
 * The source must be positioned at the BOT item tag. On success it is left
 * positioned at the first fragment item. A zero-length BOT yields an empty
 * vector, meaning no boundary information is available.
 *
 * Errors (malformed_container):
 * - no item (Sequence Delimiter or end of data) where the BOT belongs
 * - item length not a multiple of 4
 * - first offset not 0, or offsets not strictly increasing
 *
 * @param source Positioned at the start of the encapsulated value
 * @return Frame offsets relative to the first byte after the BOT item
 */
[[nodiscard]] Result<std::vector<uint32_t>> parse_basic_offsets(byte_source& source);

/// @overload Parses from the start of an in-memory buffer.
[[nodiscard]] Result<std::vector<uint32_t>> parse_basic_offsets(
    std::span<const uint8_t> buffer);

/**
 * @brief Computes BOT offsets from the fragment lengths of each frame.
 *
 * Entry i is the sum of (8 + length) over every fragment of frames 0..i-1,
 * so entry 0 is always 0. Lengths are the even (padded) fragment lengths.
 *
 * @return offset_table_overflow if an offset exceeds 0xFFFFFFFF; such data
 *         needs an Extended Offset Table instead
 */
[[nodiscard]] Result<std::vector<uint32_t>> build_basic_offsets(
    const std::vector<std::vector<std::size_t>>& fragment_lengths_per_frame);

/**
 * @brief Appends a BOT item holding the given offsets (possibly none).
 */
void write_basic_offset_table(std::vector<uint8_t>& out,
                              std::span<const uint32_t> offsets);

}  // namespace dcmpix::encoding::encapsulation

#endif  // DCMPIX_ENCODING_ENCAPSULATION_BASIC_OFFSET_TABLE_HPP
