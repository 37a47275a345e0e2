#ifndef DCMPIX_ENCODING_ENCAPSULATION_FRAGMENT_READER_HPP
#define DCMPIX_ENCODING_ENCAPSULATION_FRAGMENT_READER_HPP

#include "dcmpix/core/result.hpp"
#include "dcmpix/encoding/byte_source.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace dcmpix::encoding::encapsulation {

/**
 * @brief Lazy, single-pass reader of fragment item values.
 *
 * The source must be positioned at the first fragment item (that is, after
 * the Basic Offset Table). Each call to next() reads one item. The sequence
 * ends at the Sequence Delimiter or at the end of the data; both are normal
 * termination. After an error or the end, done() is true and next() keeps
 * returning std::nullopt.
 *
 * The iterator holds a reference to the source, which must outlive it.
 *
 * @example
 * @code
 * fragment_iterator fragments(source);
 * while (true) {
 *     auto result = fragments.next();
 *     if (result.is_err()) { ... }
 *     if (!result.value()) break;
 *     consume(*result.value());
 * }
 * @endcode
 */
class fragment_iterator {
public:
    explicit fragment_iterator(byte_source& source) noexcept;

    /**
     * @brief Reads the next fragment value.
     * @return The value, std::nullopt at the end, or malformed_container
     */
    [[nodiscard]] Result<std::optional<std::vector<uint8_t>>> next();

    [[nodiscard]] bool done() const noexcept { return done_; }

    /// Absolute position of the item tag of the last fragment returned
    [[nodiscard]] std::uint64_t last_offset() const noexcept { return last_offset_; }

private:
    byte_source* source_;
    std::uint64_t last_offset_{0};
    bool done_{false};
};

/**
 * @brief Number of fragments and the absolute position of each item tag.
 */
struct fragment_table {
    std::size_t count{0};
    std::vector<std::uint64_t> offsets;
};

/**
 * @brief Walks the fragment items without keeping their values.
 *
 * The source must be positioned at the first fragment item. Its position is
 * restored afterwards, whether or not parsing succeeds.
 */
[[nodiscard]] Result<fragment_table> parse_fragments(byte_source& source);

}  // namespace dcmpix::encoding::encapsulation

#endif  // DCMPIX_ENCODING_ENCAPSULATION_FRAGMENT_READER_HPP
