#ifndef DCMPIX_ENCODING_ENCAPSULATION_ITEM_CODEC_HPP
#define DCMPIX_ENCODING_ENCAPSULATION_ITEM_CODEC_HPP

#include "dcmpix/core/result.hpp"
#include "dcmpix/encoding/byte_source.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace dcmpix::encoding::encapsulation {

/// Group number shared by Item and delimiter tags
constexpr uint16_t kItemGroup = 0xFFFE;

/// Item (FFFE,E000)
constexpr uint16_t kItemElement = 0xE000;

/// Sequence Delimitation Item (FFFE,E0DD)
constexpr uint16_t kSequenceDelimiterElement = 0xE0DD;

/// Length value reserved for undefined length; never valid for fragments
constexpr uint32_t kUndefinedLength = 0xFFFFFFFF;

/// Tag (4) + length (4)
constexpr std::size_t kItemHeaderSize = 8;

/**
 * @brief Decoded Item tag and length, plus the position of the tag.
 */
struct item_header {
    uint16_t group{0};
    uint16_t element{0};
    uint32_t length{0};
    std::uint64_t offset{0};

    [[nodiscard]] constexpr bool is_item() const noexcept {
        return group == kItemGroup && element == kItemElement;
    }

    [[nodiscard]] constexpr bool is_sequence_delimiter() const noexcept {
        return group == kItemGroup && element == kSequenceDelimiterElement;
    }
};

/**
 * @brief Outcome of reading one item from a container.
 */
enum class item_status {
    value,               ///< An Item was read; its value is in item_read::value
    sequence_delimiter,  ///< The Sequence Delimiter terminated the container
    end_of_data          ///< Fewer than 4 bytes remained for a tag
};

struct item_read {
    item_status status{item_status::end_of_data};
    std::vector<uint8_t> value;
    /// Absolute position of the item tag
    std::uint64_t offset{0};
};

/**
 * @brief Reads an 8-byte item header at the current position.
 *
 * Returns std::nullopt when fewer than 4 bytes are left for the tag.
 * A tag that is present with a truncated length field is an error.
 * The tag itself is not validated here.
 */
[[nodiscard]] Result<std::optional<item_header>> read_item_header(byte_source& source);

/**
 * @brief Checks that a header may appear among the fragment items.
 *
 * Fails with malformed_container for a tag that is neither Item nor
 * Sequence Delimiter, and for an Item of length 0xFFFFFFFF.
 */
[[nodiscard]] VoidResult validate_item_header(const item_header& header);

/**
 * @brief Reads one Item (or the Sequence Delimiter) from the source.
 *
 * On success the source is positioned after the item value, or after the
 * delimiter's length field. The delimiter value is never read, even if its
 * length field is non-zero.
 *
 * Errors (malformed_container, message includes the byte offset):
 * - a tag other than Item or Sequence Delimiter
 * - a length field that is cut short
 * - length 0xFFFFFFFF
 * - fewer value bytes than the declared length
 */
[[nodiscard]] Result<item_read> read_item(byte_source& source);

/**
 * @brief Appends FE FF 00 E0 | length | value to out.
 *
 * Values longer than 0xFFFFFFFE bytes cannot be represented; callers keep
 * fragments well below that.
 */
void write_item(std::vector<uint8_t>& out, std::span<const uint8_t> value);

/**
 * @brief Appends FE FF DD E0 00 00 00 00 to out.
 */
void write_sequence_delimiter(std::vector<uint8_t>& out);

}  // namespace dcmpix::encoding::encapsulation

#endif  // DCMPIX_ENCODING_ENCAPSULATION_ITEM_CODEC_HPP
