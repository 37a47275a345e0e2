#ifndef DCMPIX_ENCODING_ENCAPSULATION_FRAME_READER_HPP
#define DCMPIX_ENCODING_ENCAPSULATION_FRAME_READER_HPP

#include "dcmpix/core/result.hpp"
#include "dcmpix/encoding/byte_source.hpp"
#include "dcmpix/encoding/encapsulation/fragment_reader.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace dcmpix::encoding::encapsulation {

/**
 * @brief How to split fragments into frames when the BOT is empty.
 *
 * Without a Basic Offset Table the container alone cannot say which
 * fragments belong to which frame. A multi-frame read with no offset table
 * fails unless one of these heuristics is requested explicitly.
 */
enum class frame_boundary_heuristic {
    none,                  ///< No guessing; multi-frame data needs a BOT or EOT
    equal_fragment_count,  ///< Same number of fragments in every frame
    end_of_image_marker    ///< A frame ends at a fragment holding JPEG EOI/EOC (FF D9)
};

/**
 * @brief Extended Offset Table, one entry per frame.
 *
 * offsets[i] is the position of frame i's fragment item tag relative to the
 * first byte after the BOT item; lengths[i] is that fragment's length.
 */
struct extended_offset_table {
    std::vector<std::uint64_t> offsets;
    std::vector<std::uint64_t> lengths;

    /**
     * @brief Decodes the raw values of (7FE0,0001) and (7FE0,0002).
     *
     * Both must be multiples of 8 bytes and hold the same number of entries.
     */
    [[nodiscard]] static Result<extended_offset_table> parse(
        std::span<const uint8_t> offsets_value,
        std::span<const uint8_t> lengths_value);
};

/**
 * @struct frame_read_options
 * @brief Controls frame assembly from an encapsulated container
 */
struct frame_read_options {
    /// Value of Number of Frames (0028,0008) of the enclosing dataset
    uint32_t number_of_frames = 1;

    /// Used only when the BOT is empty and no EOT is supplied
    frame_boundary_heuristic heuristic = frame_boundary_heuristic::none;

    /// Takes precedence over the BOT when present
    std::optional<extended_offset_table> extended_offsets;
};

/**
 * @brief Lazy, single-pass reader yielding one buffer per frame.
 *
 * Opened over a source positioned at the BOT item. Frame boundaries come from
 * the Extended Offset Table if supplied, else from the BOT, else from the
 * frame count and heuristic in frame_read_options.
 *
 * The iterator keeps a reference to the source and moves its position;
 * use one iterator per source at a time.
 */
class frame_iterator {
public:
    using frame_bytes = std::vector<uint8_t>;

    /**
     * @brief Parses the BOT and prepares frame assembly.
     *
     * @return malformed_container for an invalid BOT, or frame_boundary_error
     *         when the options cannot be satisfied (EOT sizes differ,
     *         multi-frame data without boundary information, fragment count
     *         not divisible by the frame count)
     */
    [[nodiscard]] static Result<frame_iterator> open(byte_source& source,
                                                     const frame_read_options& options);

    /**
     * @brief Assembles the next frame.
     * @return The frame, std::nullopt after the last one, or an error. After
     *         an error the iterator is finished.
     */
    [[nodiscard]] Result<std::optional<frame_bytes>> next();

    /**
     * @brief Skips frames without returning them.
     *
     * Uses the offset table to jump directly when one is available.
     *
     * @return frame_index_out_of_range if fewer than count frames remain
     */
    [[nodiscard]] VoidResult skip(std::size_t count);

    [[nodiscard]] bool done() const noexcept { return done_; }

    /// Index of the frame the next call to next() will return
    [[nodiscard]] std::size_t frame_index() const noexcept { return frame_index_; }

    /// Number of frames, if known before reading them
    [[nodiscard]] std::optional<std::size_t> frame_count() const noexcept;

    [[nodiscard]] const std::vector<uint32_t>& basic_offsets() const noexcept {
        return basic_offsets_;
    }

private:
    enum class mode { extended, basic, single, equal_count, end_of_image };

    frame_iterator(byte_source& source, frame_read_options options,
                   std::vector<uint32_t> basic_offsets, std::uint64_t fragments_start);

    Result<std::optional<frame_bytes>> next_extended();
    Result<std::optional<frame_bytes>> next_basic();
    Result<std::optional<frame_bytes>> next_single();
    Result<std::optional<frame_bytes>> next_equal_count();
    Result<std::optional<frame_bytes>> next_end_of_image();

    Result<std::optional<frame_bytes>> fail(int code, const std::string& message);

    byte_source* source_;
    frame_read_options options_;
    std::vector<uint32_t> basic_offsets_;
    std::uint64_t fragments_start_{0};
    fragment_iterator fragments_;
    mode mode_{mode::single};

    std::size_t frame_index_{0};
    std::uint64_t running_offset_{0};
    std::size_t fragments_per_frame_{0};
    bool done_{false};
};

/**
 * @brief Returns a single frame by index.
 *
 * The source must be positioned at the BOT item; its position is restored
 * afterwards. With a BOT or EOT only the requested frame's fragments are
 * read.
 *
 * @return frame_index_out_of_range if the container holds fewer frames
 */
[[nodiscard]] Result<std::vector<uint8_t>> get_frame(byte_source& source,
                                                     std::size_t index,
                                                     const frame_read_options& options);

/**
 * @brief Assembles every frame of the container.
 */
[[nodiscard]] Result<std::vector<std::vector<uint8_t>>> read_frames(
    byte_source& source, const frame_read_options& options);

/// @overload Reads from an in-memory buffer starting at the BOT item.
[[nodiscard]] Result<std::vector<std::vector<uint8_t>>> read_frames(
    std::span<const uint8_t> buffer, const frame_read_options& options = {});

}  // namespace dcmpix::encoding::encapsulation

#endif  // DCMPIX_ENCODING_ENCAPSULATION_FRAME_READER_HPP
