#include "dcmpix/encoding/encapsulation/item_codec.hpp"
#include "dcmpix/integration/logger_adapter.hpp"

#include <array>
#include <string>

namespace dcmpix::encoding::encapsulation {

namespace {

using dcmpix::integration::logger_adapter;
using dcmpix::integration::nonconformance;

constexpr uint16_t read_le16(const uint8_t* data) {
    return static_cast<uint16_t>(data[0] | (data[1] << 8));
}

constexpr uint32_t read_le32(const uint8_t* data) {
    return static_cast<uint32_t>(data[0]) |
           (static_cast<uint32_t>(data[1]) << 8) |
           (static_cast<uint32_t>(data[2]) << 16) |
           (static_cast<uint32_t>(data[3]) << 24);
}

void write_le16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
}

void write_le32(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
}

std::string format_tag(uint16_t group, uint16_t element) {
    return dcmpix::compat::format("({:04X},{:04X})", group, element);
}

}  // namespace

Result<std::optional<item_header>> read_item_header(byte_source& source) {
    const auto offset = source.tell();

    std::array<uint8_t, kItemHeaderSize> buffer{};
    const auto tag_bytes = source.read(std::span<uint8_t>(buffer.data(), 4));
    if (tag_bytes < 4) {
        return ok<std::optional<item_header>>(std::nullopt);
    }

    const auto length_bytes = source.read(std::span<uint8_t>(buffer.data() + 4, 4));
    if (length_bytes < 4) {
        return dcmpix_error<std::optional<item_header>>(
            error_codes::malformed_container,
            dcmpix::compat::format(
                "Unable to read the length of the item with tag {} at offset {}",
                format_tag(read_le16(buffer.data()), read_le16(buffer.data() + 2)),
                offset));
    }

    item_header header;
    header.group = read_le16(buffer.data());
    header.element = read_le16(buffer.data() + 2);
    header.length = read_le32(buffer.data() + 4);
    header.offset = offset;
    return ok<std::optional<item_header>>(header);
}

VoidResult validate_item_header(const item_header& header) {
    if (!header.is_item() && !header.is_sequence_delimiter()) {
        return dcmpix_void_error(
            error_codes::malformed_container,
            dcmpix::compat::format(
                "Unexpected tag {} at offset {}, expected an Item (FFFE,E000) "
                "or Sequence Delimiter (FFFE,E0DD)",
                format_tag(header.group, header.element), header.offset));
    }

    if (header.is_item() && header.length == kUndefinedLength) {
        return dcmpix_void_error(
            error_codes::malformed_container,
            dcmpix::compat::format(
                "Undefined item length at offset {} in encapsulated pixel data",
                header.offset));
    }

    return ok();
}

Result<item_read> read_item(byte_source& source) {
    auto header_result = read_item_header(source);
    if (header_result.is_err()) {
        return forward_error<item_read>(header_result);
    }

    const auto& maybe_header = get_value(header_result);
    if (!maybe_header) {
        return ok<item_read>(item_read{item_status::end_of_data, {}, source.tell()});
    }

    const item_header& header = *maybe_header;

    if (header.is_sequence_delimiter()) {
        if (header.length != 0) {
            logger_adapter::log_nonconformance(
                nonconformance::delimiter_length,
                dcmpix::compat::format("Sequence Delimiter at offset {} has length {}; ignored",
                                       header.offset, header.length));
        }
        return ok<item_read>(item_read{item_status::sequence_delimiter, {}, header.offset});
    }

    auto valid = validate_item_header(header);
    if (valid.is_err()) {
        return dcmpix_error<item_read>(valid.error().code, valid.error().message);
    }

    item_read result;
    result.status = item_status::value;
    result.offset = header.offset;

    const auto received = read_bounded(source, header.length, result.value);
    if (received != header.length) {
        return dcmpix_error<item_read>(
            error_codes::malformed_container,
            dcmpix::compat::format(
                "Item at offset {} declares {} bytes but only {} are available",
                header.offset, header.length, received));
    }

    return ok<item_read>(std::move(result));
}

void write_item(std::vector<uint8_t>& out, std::span<const uint8_t> value) {
    out.reserve(out.size() + kItemHeaderSize + value.size());
    write_le16(out, kItemGroup);
    write_le16(out, kItemElement);
    write_le32(out, static_cast<uint32_t>(value.size()));
    out.insert(out.end(), value.begin(), value.end());
}

void write_sequence_delimiter(std::vector<uint8_t>& out) {
    write_le16(out, kItemGroup);
    write_le16(out, kSequenceDelimiterElement);
    write_le32(out, 0);
}

}  // namespace dcmpix::encoding::encapsulation
