#include "dcmpix/encoding/encapsulation/encapsulator.hpp"
#include "dcmpix/encoding/encapsulation/basic_offset_table.hpp"
#include "dcmpix/encoding/encapsulation/item_codec.hpp"
#include "dcmpix/integration/logger_adapter.hpp"

namespace dcmpix::encoding::encapsulation {

namespace {

using fragment_list = std::vector<std::vector<uint8_t>>;

void append_le64(std::vector<uint8_t>& out, std::uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

}  // namespace

Result<fragment_list> fragment_frame(std::span<const uint8_t> frame,
                                     std::size_t nr_fragments) {
    const std::size_t length = frame.size();

    if (nr_fragments == 0 || 2 * nr_fragments > length + 1) {
        return dcmpix_error<fragment_list>(
            error_codes::fragmentation_limit_exceeded,
            dcmpix::compat::format(
                "Cannot split a frame of {} bytes into {} fragments",
                length, nr_fragments));
    }

    // Even stride for all but the last fragment, leaving it at least one byte
    std::size_t stride = length / nr_fragments;
    if (stride % 2 != 0) {
        ++stride;
    }
    if ((nr_fragments - 1) * stride >= length) {
        stride -= 2;
    }

    fragment_list fragments;
    fragments.reserve(nr_fragments);

    std::size_t pos = 0;
    for (std::size_t i = 0; i + 1 < nr_fragments; ++i) {
        fragments.emplace_back(frame.begin() + pos, frame.begin() + pos + stride);
        pos += stride;
    }

    auto& last = fragments.emplace_back(frame.begin() + pos, frame.end());
    if (last.size() % 2 != 0) {
        last.push_back(0x00);
    }

    return ok<fragment_list>(std::move(fragments));
}

Result<std::vector<uint8_t>> itemize_frame(std::span<const uint8_t> frame,
                                           std::size_t nr_fragments) {
    auto fragments = fragment_frame(frame, nr_fragments);
    if (fragments.is_err()) {
        return forward_error<std::vector<uint8_t>>(fragments);
    }

    std::vector<uint8_t> output;
    for (const auto& fragment : fragments.value()) {
        write_item(output, fragment);
    }
    return ok<std::vector<uint8_t>>(std::move(output));
}

Result<std::vector<uint8_t>> encapsulate(const std::vector<std::vector<uint8_t>>& frames,
                                         std::size_t fragments_per_frame,
                                         bool include_bot) {
    std::vector<fragment_list> fragmented;
    fragmented.reserve(frames.size());

    for (std::size_t i = 0; i < frames.size(); ++i) {
        auto fragments = fragment_frame(frames[i], fragments_per_frame);
        if (fragments.is_err()) {
            const auto& err = fragments.error();
            return dcmpix_error<std::vector<uint8_t>>(
                err.code, dcmpix::compat::format("Frame {}: {}", i, err.message));
        }
        fragmented.push_back(std::move(fragments.value()));
    }

    std::vector<uint32_t> offsets;
    if (include_bot) {
        std::vector<std::vector<std::size_t>> lengths(fragmented.size());
        for (std::size_t i = 0; i < fragmented.size(); ++i) {
            for (const auto& fragment : fragmented[i]) {
                lengths[i].push_back(fragment.size());
            }
        }

        auto offsets_result = build_basic_offsets(lengths);
        if (offsets_result.is_err()) {
            return forward_error<std::vector<uint8_t>>(offsets_result);
        }
        offsets = std::move(offsets_result.value());
    }

    std::vector<uint8_t> output;
    write_basic_offset_table(output, offsets);
    for (const auto& fragments : fragmented) {
        for (const auto& fragment : fragments) {
            write_item(output, fragment);
        }
    }

    integration::logger_adapter::debug(
        "Encapsulated {} frames ({} fragments each, BOT {}) into {} bytes",
        frames.size(), fragments_per_frame, include_bot ? "filled" : "empty",
        output.size());

    return ok<std::vector<uint8_t>>(std::move(output));
}

Result<extended_encapsulation> encapsulate_extended(
    const std::vector<std::vector<uint8_t>>& frames) {

    auto pixel_data = encapsulate(frames, 1, false);
    if (pixel_data.is_err()) {
        return forward_error<extended_encapsulation>(pixel_data);
    }

    extended_encapsulation result;
    result.pixel_data = std::move(pixel_data.value());
    result.extended_offset_table.reserve(frames.size() * 8);
    result.extended_offset_table_lengths.reserve(frames.size() * 8);

    std::uint64_t offset = 0;
    for (const auto& frame : frames) {
        const std::uint64_t length = frame.size() + (frame.size() % 2);
        append_le64(result.extended_offset_table, offset);
        append_le64(result.extended_offset_table_lengths, length);
        offset += kItemHeaderSize + length;
    }

    return ok<extended_encapsulation>(std::move(result));
}

}  // namespace dcmpix::encoding::encapsulation
