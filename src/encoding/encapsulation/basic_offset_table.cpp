#include "dcmpix/encoding/encapsulation/basic_offset_table.hpp"
#include "dcmpix/encoding/encapsulation/item_codec.hpp"
#include "dcmpix/integration/logger_adapter.hpp"

#include <limits>

namespace dcmpix::encoding::encapsulation {

namespace {

inline uint32_t read_le32(const uint8_t* data) {
    return static_cast<uint32_t>(data[0]) |
           (static_cast<uint32_t>(data[1]) << 8) |
           (static_cast<uint32_t>(data[2]) << 16) |
           (static_cast<uint32_t>(data[3]) << 24);
}

inline void write_le32(uint8_t* data, uint32_t value) {
    data[0] = static_cast<uint8_t>(value & 0xFF);
    data[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
    data[2] = static_cast<uint8_t>((value >> 16) & 0xFF);
    data[3] = static_cast<uint8_t>((value >> 24) & 0xFF);
}

}  // namespace

Result<std::vector<uint32_t>> parse_basic_offsets(byte_source& source) {
    const auto start = source.tell();

    auto item_result = read_item(source);
    if (item_result.is_err()) {
        return forward_error<std::vector<uint32_t>>(item_result);
    }

    const auto& item = item_result.value();
    if (item.status != item_status::value) {
        return dcmpix_error<std::vector<uint32_t>>(
            error_codes::malformed_container,
            dcmpix::compat::format(
                "Expected the Basic Offset Table item at offset {}, found {}",
                start,
                item.status == item_status::sequence_delimiter
                    ? "a Sequence Delimiter" : "the end of the data"));
    }

    if (item.value.size() % 4 != 0) {
        return dcmpix_error<std::vector<uint32_t>>(
            error_codes::malformed_container,
            dcmpix::compat::format(
                "The length of the Basic Offset Table item ({}) is not a multiple of 4",
                item.value.size()));
    }

    std::vector<uint32_t> offsets;
    offsets.reserve(item.value.size() / 4);
    for (std::size_t i = 0; i < item.value.size(); i += 4) {
        offsets.push_back(read_le32(item.value.data() + i));
    }

    if (!offsets.empty() && offsets.front() != 0) {
        return dcmpix_error<std::vector<uint32_t>>(
            error_codes::malformed_container,
            dcmpix::compat::format(
                "The first Basic Offset Table entry is {}, expected 0",
                offsets.front()));
    }

    for (std::size_t i = 1; i < offsets.size(); ++i) {
        if (offsets[i] <= offsets[i - 1]) {
            return dcmpix_error<std::vector<uint32_t>>(
                error_codes::malformed_container,
                dcmpix::compat::format(
                    "Basic Offset Table entries are not strictly increasing "
                    "(entry {} is {}, entry {} is {})",
                    i - 1, offsets[i - 1], i, offsets[i]));
        }
    }

    integration::logger_adapter::debug(
        "Parsed Basic Offset Table with {} entries", offsets.size());

    return ok<std::vector<uint32_t>>(std::move(offsets));
}

Result<std::vector<uint32_t>> parse_basic_offsets(std::span<const uint8_t> buffer) {
    memory_byte_source source(buffer);
    return parse_basic_offsets(source);
}

Result<std::vector<uint32_t>> build_basic_offsets(
    const std::vector<std::vector<std::size_t>>& fragment_lengths_per_frame) {

    constexpr auto kMaxOffset = static_cast<std::uint64_t>(
        std::numeric_limits<uint32_t>::max());

    std::vector<uint32_t> offsets;
    offsets.reserve(fragment_lengths_per_frame.size());

    std::uint64_t running = 0;
    for (std::size_t frame = 0; frame < fragment_lengths_per_frame.size(); ++frame) {
        if (running > kMaxOffset) {
            return dcmpix_error<std::vector<uint32_t>>(
                error_codes::offset_table_overflow,
                dcmpix::compat::format(
                    "The offset of frame {} ({}) exceeds the maximum Basic Offset "
                    "Table value; use an Extended Offset Table instead",
                    frame, running));
        }
        offsets.push_back(static_cast<uint32_t>(running));

        for (auto length : fragment_lengths_per_frame[frame]) {
            running += kItemHeaderSize + length;
        }
    }

    return ok<std::vector<uint32_t>>(std::move(offsets));
}

void write_basic_offset_table(std::vector<uint8_t>& out,
                              std::span<const uint32_t> offsets) {
    std::vector<uint8_t> value(offsets.size() * 4);
    for (std::size_t i = 0; i < offsets.size(); ++i) {
        write_le32(value.data() + i * 4, offsets[i]);
    }
    write_item(out, value);
}

}  // namespace dcmpix::encoding::encapsulation
