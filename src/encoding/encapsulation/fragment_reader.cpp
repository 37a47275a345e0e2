#include "dcmpix/encoding/encapsulation/fragment_reader.hpp"
#include "dcmpix/encoding/encapsulation/item_codec.hpp"

#include "dcmpix/compat/format.hpp"

namespace dcmpix::encoding::encapsulation {

using fragment_value = std::optional<std::vector<uint8_t>>;

fragment_iterator::fragment_iterator(byte_source& source) noexcept
    : source_(&source) {}

Result<fragment_value> fragment_iterator::next() {
    if (done_) {
        return ok<fragment_value>(std::nullopt);
    }

    auto item_result = read_item(*source_);
    if (item_result.is_err()) {
        done_ = true;
        return forward_error<fragment_value>(item_result);
    }

    auto& item = item_result.value();
    if (item.status != item_status::value) {
        done_ = true;
        return ok<fragment_value>(std::nullopt);
    }

    last_offset_ = item.offset;
    return ok<fragment_value>(std::move(item.value));
}

Result<fragment_table> parse_fragments(byte_source& source) {
    position_guard restore(source);

    fragment_table table;
    while (true) {
        auto header_result = read_item_header(source);
        if (header_result.is_err()) {
            return forward_error<fragment_table>(header_result);
        }

        const auto& header = header_result.value();
        if (!header || header->is_sequence_delimiter()) {
            break;
        }

        auto valid = validate_item_header(*header);
        if (valid.is_err()) {
            return dcmpix_error<fragment_table>(valid.error().code, valid.error().message);
        }

        table.offsets.push_back(header->offset);
        ++table.count;

        if (!source.seek(source.tell() + header->length)) {
            return dcmpix_error<fragment_table>(
                error_codes::malformed_container,
                dcmpix::compat::format(
                    "Item at offset {} declares {} bytes past the end of the data",
                    header->offset, header->length));
        }
    }

    return ok<fragment_table>(std::move(table));
}

}  // namespace dcmpix::encoding::encapsulation
