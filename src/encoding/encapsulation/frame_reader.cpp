#include "dcmpix/encoding/encapsulation/frame_reader.hpp"
#include "dcmpix/encoding/encapsulation/basic_offset_table.hpp"
#include "dcmpix/encoding/encapsulation/item_codec.hpp"
#include "dcmpix/integration/logger_adapter.hpp"

#include <algorithm>

namespace dcmpix::encoding::encapsulation {

namespace {

using dcmpix::integration::logger_adapter;
using dcmpix::integration::nonconformance;
using frame_value = std::optional<std::vector<uint8_t>>;

inline std::uint64_t read_le64(const uint8_t* data) {
    std::uint64_t value = 0;
    for (int i = 7; i >= 0; --i) {
        value = (value << 8) | data[i];
    }
    return value;
}

/// JPEG EOI and JPEG 2000 EOC share the FF D9 marker
bool ends_with_eoi_marker(const std::vector<uint8_t>& fragment) {
    constexpr std::size_t kSearchWindow = 10;
    const std::size_t window = std::min(fragment.size(), kSearchWindow);
    const auto first = fragment.end() - static_cast<std::ptrdiff_t>(window);
    for (auto it = first; it != fragment.end() && it + 1 != fragment.end(); ++it) {
        if (*it == 0xFF && *(it + 1) == 0xD9) {
            return true;
        }
    }
    return false;
}

std::vector<std::uint64_t> decode_le64_array(std::span<const uint8_t> value) {
    std::vector<std::uint64_t> result(value.size() / 8);
    for (std::size_t i = 0; i < result.size(); ++i) {
        result[i] = read_le64(value.data() + i * 8);
    }
    return result;
}

template <typename T>
Result<T> from_void_error(const VoidResult& source) {
    const auto& err = source.error();
    return dcmpix_error<T>(err.code, err.message);
}

}  // namespace

// ============================================================================
// extended_offset_table
// ============================================================================

Result<extended_offset_table> extended_offset_table::parse(
    std::span<const uint8_t> offsets_value,
    std::span<const uint8_t> lengths_value) {

    if (offsets_value.size() % 8 != 0 || lengths_value.size() % 8 != 0) {
        return dcmpix_error<extended_offset_table>(
            error_codes::malformed_container,
            dcmpix::compat::format(
                "Extended Offset Table values must be multiples of 8 bytes "
                "(offsets {}, lengths {})",
                offsets_value.size(), lengths_value.size()));
    }

    if (offsets_value.size() != lengths_value.size()) {
        return dcmpix_error<extended_offset_table>(
            error_codes::frame_boundary_error,
            dcmpix::compat::format(
                "The Extended Offset Table holds {} offsets but {} lengths",
                offsets_value.size() / 8, lengths_value.size() / 8));
    }

    extended_offset_table table;
    table.offsets = decode_le64_array(offsets_value);
    table.lengths = decode_le64_array(lengths_value);
    return ok<extended_offset_table>(std::move(table));
}

// ============================================================================
// frame_iterator
// ============================================================================

frame_iterator::frame_iterator(byte_source& source, frame_read_options options,
                               std::vector<uint32_t> basic_offsets,
                               std::uint64_t fragments_start)
    : source_(&source),
      options_(std::move(options)),
      basic_offsets_(std::move(basic_offsets)),
      fragments_start_(fragments_start),
      fragments_(source) {}

Result<frame_iterator> frame_iterator::open(byte_source& source,
                                            const frame_read_options& options) {
    auto offsets_result = parse_basic_offsets(source);
    if (offsets_result.is_err()) {
        return forward_error<frame_iterator>(offsets_result);
    }

    frame_iterator it(source, options, std::move(offsets_result.value()), source.tell());
    const auto number_of_frames = static_cast<std::size_t>(options.number_of_frames);

    if (options.extended_offsets) {
        const auto& eot = *options.extended_offsets;
        if (eot.offsets.size() != eot.lengths.size()) {
            return dcmpix_error<frame_iterator>(
                error_codes::frame_boundary_error,
                dcmpix::compat::format(
                    "The Extended Offset Table holds {} offsets but {} lengths",
                    eot.offsets.size(), eot.lengths.size()));
        }
        if (!it.basic_offsets_.empty()) {
            logger_adapter::debug(
                "Ignoring a {} entry Basic Offset Table in favour of the "
                "Extended Offset Table", it.basic_offsets_.size());
        }
        if (eot.offsets.size() != number_of_frames) {
            logger_adapter::log_nonconformance(
                nonconformance::offset_table_mismatch,
                dcmpix::compat::format(
                    "The Extended Offset Table lists {} frames but the number of "
                    "frames is {}", eot.offsets.size(), number_of_frames));
        }
        it.mode_ = mode::extended;
    } else if (!it.basic_offsets_.empty()) {
        if (it.basic_offsets_.size() != number_of_frames) {
            logger_adapter::log_nonconformance(
                nonconformance::offset_table_mismatch,
                dcmpix::compat::format(
                    "The Basic Offset Table lists {} frames but the number of "
                    "frames is {}; using the Basic Offset Table",
                    it.basic_offsets_.size(), number_of_frames));
        }
        it.mode_ = mode::basic;
    } else if (number_of_frames <= 1) {
        it.mode_ = mode::single;
    } else {
        switch (options.heuristic) {
            case frame_boundary_heuristic::equal_fragment_count: {
                auto table_result = parse_fragments(source);
                if (table_result.is_err()) {
                    return forward_error<frame_iterator>(table_result);
                }
                const auto count = table_result.value().count;
                if (count == 0 || count % number_of_frames != 0) {
                    return dcmpix_error<frame_iterator>(
                        error_codes::frame_boundary_error,
                        dcmpix::compat::format(
                            "Unable to divide {} fragments evenly between {} frames",
                            count, number_of_frames));
                }
                it.fragments_per_frame_ = count / number_of_frames;
                it.mode_ = mode::equal_count;
                logger_adapter::debug(
                    "No Basic Offset Table; assuming {} fragments per frame",
                    it.fragments_per_frame_);
                break;
            }
            case frame_boundary_heuristic::end_of_image_marker:
                it.mode_ = mode::end_of_image;
                logger_adapter::debug(
                    "No Basic Offset Table; splitting frames at JPEG EOI markers");
                break;
            case frame_boundary_heuristic::none:
            default:
                return dcmpix_error<frame_iterator>(
                    error_codes::frame_boundary_error,
                    dcmpix::compat::format(
                        "Unable to determine the boundaries of {} frames: the Basic "
                        "Offset Table is empty and neither an Extended Offset Table "
                        "nor a boundary heuristic was supplied",
                        number_of_frames));
        }
    }

    return ok<frame_iterator>(std::move(it));
}

std::optional<std::size_t> frame_iterator::frame_count() const noexcept {
    switch (mode_) {
        case mode::extended:
            return options_.extended_offsets->offsets.size();
        case mode::basic:
            return basic_offsets_.size();
        case mode::single:
            return 1;
        case mode::equal_count:
            return static_cast<std::size_t>(options_.number_of_frames);
        case mode::end_of_image:
        default:
            return std::nullopt;
    }
}

Result<frame_value> frame_iterator::next() {
    if (done_) {
        return ok<frame_value>(std::nullopt);
    }

    switch (mode_) {
        case mode::extended:
            return next_extended();
        case mode::basic:
            return next_basic();
        case mode::equal_count:
            return next_equal_count();
        case mode::end_of_image:
            return next_end_of_image();
        case mode::single:
        default:
            return next_single();
    }
}

Result<frame_value> frame_iterator::fail(int code, const std::string& message) {
    done_ = true;
    return dcmpix_error<frame_value>(code, message);
}

Result<frame_value> frame_iterator::next_extended() {
    const auto& eot = *options_.extended_offsets;
    if (frame_index_ >= eot.offsets.size()) {
        done_ = true;
        return ok<frame_value>(std::nullopt);
    }

    const auto offset = eot.offsets[frame_index_];
    const auto length = eot.lengths[frame_index_];
    const auto position = fragments_start_ + offset + kItemHeaderSize;

    if (!source_->seek(position)) {
        return fail(error_codes::frame_boundary_error,
                    dcmpix::compat::format(
                        "Frame {} starts at offset {}, past the end of the data",
                        frame_index_, position));
    }

    frame_bytes frame;
    const auto received = read_bounded(*source_, length, frame);
    if (received != length) {
        return fail(error_codes::frame_boundary_error,
                    dcmpix::compat::format(
                        "Frame {} declares {} bytes in the Extended Offset Table "
                        "but only {} are available",
                        frame_index_, length, received));
    }

    ++frame_index_;
    return ok<frame_value>(std::move(frame));
}

Result<frame_value> frame_iterator::next_basic() {
    if (frame_index_ >= basic_offsets_.size()) {
        done_ = true;
        return ok<frame_value>(std::nullopt);
    }

    frame_bytes frame;
    const bool is_last = frame_index_ + 1 == basic_offsets_.size();

    if (is_last) {
        // The final frame takes every remaining fragment
        std::size_t fragment_count = 0;
        while (true) {
            auto fragment = fragments_.next();
            if (fragment.is_err()) {
                done_ = true;
                return forward_error<frame_value>(fragment);
            }
            if (!fragment.value()) {
                break;
            }
            const auto& value = *fragment.value();
            frame.insert(frame.end(), value.begin(), value.end());
            running_offset_ += kItemHeaderSize + value.size();
            ++fragment_count;
        }

        if (fragment_count == 0) {
            return fail(error_codes::frame_boundary_error,
                        dcmpix::compat::format(
                            "No fragments found for frame {}, the last frame in the "
                            "Basic Offset Table", frame_index_));
        }
    } else {
        const std::uint64_t boundary = basic_offsets_[frame_index_ + 1];
        while (running_offset_ < boundary) {
            auto fragment = fragments_.next();
            if (fragment.is_err()) {
                done_ = true;
                return forward_error<frame_value>(fragment);
            }
            if (!fragment.value()) {
                return fail(error_codes::frame_boundary_error,
                            dcmpix::compat::format(
                                "The fragments ended at offset {} before frame {} "
                                "reached the next frame's offset {}",
                                running_offset_, frame_index_, boundary));
            }
            const auto& value = *fragment.value();
            frame.insert(frame.end(), value.begin(), value.end());
            running_offset_ += kItemHeaderSize + value.size();
        }

        if (running_offset_ != boundary) {
            return fail(error_codes::frame_boundary_error,
                        dcmpix::compat::format(
                            "A fragment of frame {} straddles the frame boundary: "
                            "it ends at offset {} but the next frame starts at {}",
                            frame_index_, running_offset_, boundary));
        }
    }

    logger_adapter::trace("Assembled frame {} ({} bytes) using the Basic Offset Table",
                          frame_index_, frame.size());
    ++frame_index_;
    return ok<frame_value>(std::move(frame));
}

Result<frame_value> frame_iterator::next_single() {
    if (frame_index_ >= 1) {
        done_ = true;
        return ok<frame_value>(std::nullopt);
    }

    frame_bytes frame;
    std::size_t fragment_count = 0;
    while (true) {
        auto fragment = fragments_.next();
        if (fragment.is_err()) {
            done_ = true;
            return forward_error<frame_value>(fragment);
        }
        if (!fragment.value()) {
            break;
        }
        const auto& value = *fragment.value();
        frame.insert(frame.end(), value.begin(), value.end());
        ++fragment_count;
    }

    if (fragment_count == 0) {
        return fail(error_codes::frame_boundary_error,
                    "The encapsulated pixel data contains no fragments");
    }

    ++frame_index_;
    return ok<frame_value>(std::move(frame));
}

Result<frame_value> frame_iterator::next_equal_count() {
    if (frame_index_ >= options_.number_of_frames) {
        done_ = true;
        return ok<frame_value>(std::nullopt);
    }

    frame_bytes frame;
    for (std::size_t i = 0; i < fragments_per_frame_; ++i) {
        auto fragment = fragments_.next();
        if (fragment.is_err()) {
            done_ = true;
            return forward_error<frame_value>(fragment);
        }
        if (!fragment.value()) {
            return fail(error_codes::frame_boundary_error,
                        dcmpix::compat::format(
                            "The fragments ended inside frame {}", frame_index_));
        }
        const auto& value = *fragment.value();
        frame.insert(frame.end(), value.begin(), value.end());
    }

    ++frame_index_;
    return ok<frame_value>(std::move(frame));
}

Result<frame_value> frame_iterator::next_end_of_image() {
    frame_bytes frame;
    std::size_t fragment_count = 0;

    while (!fragments_.done()) {
        auto fragment = fragments_.next();
        if (fragment.is_err()) {
            done_ = true;
            return forward_error<frame_value>(fragment);
        }
        if (!fragment.value()) {
            break;
        }
        const auto& value = *fragment.value();
        frame.insert(frame.end(), value.begin(), value.end());
        ++fragment_count;

        if (ends_with_eoi_marker(value)) {
            ++frame_index_;
            return ok<frame_value>(std::move(frame));
        }
    }

    done_ = true;

    if (fragment_count > 0) {
        logger_adapter::log_nonconformance(
            nonconformance::missing_end_marker,
            dcmpix::compat::format(
                "The end of the encapsulated pixel data was reached without a JPEG "
                "EOI/EOC marker; frame {} may be invalid", frame_index_));
        ++frame_index_;
    }

    if (frame_index_ != options_.number_of_frames) {
        logger_adapter::log_nonconformance(
            nonconformance::marker_frame_count,
            dcmpix::compat::format(
                "Found {} frames using JPEG EOI/EOC markers but the number of frames is {}",
                frame_index_, options_.number_of_frames));
    }

    if (fragment_count > 0) {
        return ok<frame_value>(std::move(frame));
    }
    return ok<frame_value>(std::nullopt);
}

VoidResult frame_iterator::skip(std::size_t count) {
    if (count == 0) {
        return ok();
    }

    const auto target = frame_index_ + count;
    const auto known = frame_count();

    if (known && target > *known) {
        return dcmpix_void_error(
            error_codes::frame_index_out_of_range,
            dcmpix::compat::format(
                "Cannot skip to frame {}, the container holds {} frames",
                target, *known));
    }

    if (mode_ == mode::extended) {
        frame_index_ = target;
        return ok();
    }

    if (mode_ == mode::basic && target < basic_offsets_.size()) {
        const auto position = fragments_start_ + basic_offsets_[target];
        if (!source_->seek(position)) {
            done_ = true;
            return dcmpix_void_error(
                error_codes::frame_boundary_error,
                dcmpix::compat::format(
                    "Frame {} starts at offset {}, past the end of the data",
                    target, position));
        }
        running_offset_ = basic_offsets_[target];
        frame_index_ = target;
        return ok();
    }

    for (std::size_t i = 0; i < count; ++i) {
        auto frame = next();
        if (frame.is_err()) {
            const auto& err = frame.error();
            return dcmpix_void_error(err.code, err.message);
        }
        if (!frame.value()) {
            return dcmpix_void_error(
                error_codes::frame_index_out_of_range,
                dcmpix::compat::format(
                    "Cannot skip to frame {}, the container holds {} frames",
                    target, frame_index_));
        }
    }
    return ok();
}

// ============================================================================
// Free functions
// ============================================================================

Result<std::vector<uint8_t>> get_frame(byte_source& source, std::size_t index,
                                       const frame_read_options& options) {
    position_guard restore(source);

    auto it_result = frame_iterator::open(source, options);
    if (it_result.is_err()) {
        return forward_error<std::vector<uint8_t>>(it_result);
    }
    auto& it = it_result.value();

    if (auto total = it.frame_count(); total && index >= *total) {
        return dcmpix_error<std::vector<uint8_t>>(
            error_codes::frame_index_out_of_range,
            dcmpix::compat::format(
                "Frame index {} is out of range, the container holds {} frames",
                index, *total));
    }

    auto skipped = it.skip(index);
    if (skipped.is_err()) {
        return from_void_error<std::vector<uint8_t>>(skipped);
    }

    auto frame = it.next();
    if (frame.is_err()) {
        return forward_error<std::vector<uint8_t>>(frame);
    }
    if (!frame.value()) {
        return dcmpix_error<std::vector<uint8_t>>(
            error_codes::frame_index_out_of_range,
            dcmpix::compat::format(
                "Frame index {} is out of range, the container holds {} frames",
                index, it.frame_index()));
    }

    return ok<std::vector<uint8_t>>(std::move(*frame.value()));
}

Result<std::vector<std::vector<uint8_t>>> read_frames(byte_source& source,
                                                      const frame_read_options& options) {
    using frame_list = std::vector<std::vector<uint8_t>>;

    auto it_result = frame_iterator::open(source, options);
    if (it_result.is_err()) {
        return forward_error<frame_list>(it_result);
    }
    auto& it = it_result.value();

    frame_list frames;
    if (auto total = it.frame_count()) {
        frames.reserve(*total);
    }

    while (true) {
        auto frame = it.next();
        if (frame.is_err()) {
            return forward_error<frame_list>(frame);
        }
        if (!frame.value()) {
            break;
        }
        frames.push_back(std::move(*frame.value()));
    }

    return ok<frame_list>(std::move(frames));
}

Result<std::vector<std::vector<uint8_t>>> read_frames(std::span<const uint8_t> buffer,
                                                      const frame_read_options& options) {
    memory_byte_source source(buffer);
    return read_frames(source, options);
}

}  // namespace dcmpix::encoding::encapsulation
