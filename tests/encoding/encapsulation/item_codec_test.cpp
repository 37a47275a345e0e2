#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "dcmpix/encoding/encapsulation/item_codec.hpp"

#include <vector>

using namespace dcmpix;
using namespace dcmpix::encoding;
using namespace dcmpix::encoding::encapsulation;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("write_item and write_sequence_delimiter", "[encoding][encapsulation][item]") {
    SECTION("item layout is tag, length, value") {
        std::vector<uint8_t> out;
        const std::vector<uint8_t> value = {0x01, 0x02, 0x03, 0x04};
        write_item(out, value);

        const std::vector<uint8_t> expected = {
            0xFE, 0xFF, 0x00, 0xE0, 0x04, 0x00, 0x00, 0x00,
            0x01, 0x02, 0x03, 0x04};
        REQUIRE(out == expected);
    }

    SECTION("empty item") {
        std::vector<uint8_t> out;
        write_item(out, {});
        const std::vector<uint8_t> expected = {
            0xFE, 0xFF, 0x00, 0xE0, 0x00, 0x00, 0x00, 0x00};
        REQUIRE(out == expected);
    }

    SECTION("items are appended") {
        std::vector<uint8_t> out = {0x99};
        write_item(out, std::vector<uint8_t>{0x01, 0x02});
        REQUIRE(out.size() == 1 + kItemHeaderSize + 2);
        CHECK(out[0] == 0x99);
    }

    SECTION("sequence delimiter") {
        std::vector<uint8_t> out;
        write_sequence_delimiter(out);
        const std::vector<uint8_t> expected = {
            0xFE, 0xFF, 0xDD, 0xE0, 0x00, 0x00, 0x00, 0x00};
        REQUIRE(out == expected);
    }
}

TEST_CASE("read_item walks items", "[encoding][encapsulation][item]") {
    std::vector<uint8_t> buffer;
    write_item(buffer, std::vector<uint8_t>{0xAA, 0xBB});
    write_item(buffer, std::vector<uint8_t>{0xCC, 0xDD, 0xEE, 0xFF});
    write_sequence_delimiter(buffer);

    memory_byte_source source(buffer);

    auto first = read_item(source);
    REQUIRE(first.is_ok());
    CHECK(first.value().status == item_status::value);
    CHECK(first.value().offset == 0);
    CHECK(first.value().value == std::vector<uint8_t>{0xAA, 0xBB});

    auto second = read_item(source);
    REQUIRE(second.is_ok());
    CHECK(second.value().offset == 10);
    CHECK(second.value().value.size() == 4);

    auto delimiter = read_item(source);
    REQUIRE(delimiter.is_ok());
    CHECK(delimiter.value().status == item_status::sequence_delimiter);
    CHECK(delimiter.value().offset == 22);

    auto end = read_item(source);
    REQUIRE(end.is_ok());
    CHECK(end.value().status == item_status::end_of_data);
}

TEST_CASE("read_item tolerates a non-zero delimiter length", "[encoding][encapsulation][item]") {
    const std::vector<uint8_t> buffer = {
        0xFE, 0xFF, 0xDD, 0xE0, 0x04, 0x00, 0x00, 0x00};
    memory_byte_source source(buffer);

    auto result = read_item(source);
    REQUIRE(result.is_ok());
    CHECK(result.value().status == item_status::sequence_delimiter);
    CHECK(source.tell() == 8);
}

TEST_CASE("read_item rejects malformed items", "[encoding][encapsulation][item]") {
    SECTION("undefined length reports the item offset") {
        std::vector<uint8_t> buffer;
        write_item(buffer, {});                                   // BOT, offset 0
        write_item(buffer, std::vector<uint8_t>{1, 2, 3, 4});     // offset 8
        const std::vector<uint8_t> undefined = {
            0xFE, 0xFF, 0x00, 0xE0, 0xFF, 0xFF, 0xFF, 0xFF};      // offset 20
        buffer.insert(buffer.end(), undefined.begin(), undefined.end());

        memory_byte_source source(buffer);
        REQUIRE(read_item(source).is_ok());
        REQUIRE(read_item(source).is_ok());

        auto result = read_item(source);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::malformed_container);
        CHECK_THAT(result.error().message, ContainsSubstring("offset 20"));
    }

    SECTION("unexpected tag") {
        const std::vector<uint8_t> buffer = {
            0xE0, 0x7F, 0x10, 0x00, 0x00, 0x00, 0x00, 0x00};
        memory_byte_source source(buffer);

        auto result = read_item(source);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::malformed_container);
        CHECK_THAT(result.error().message, ContainsSubstring("(7FE0,0010)"));
    }

    SECTION("truncated length field") {
        const std::vector<uint8_t> buffer = {0xFE, 0xFF, 0x00, 0xE0, 0x04, 0x00};
        memory_byte_source source(buffer);

        auto result = read_item(source);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::malformed_container);
    }

    SECTION("value shorter than its length") {
        const std::vector<uint8_t> buffer = {
            0xFE, 0xFF, 0x00, 0xE0, 0x08, 0x00, 0x00, 0x00, 0x01, 0x02};
        memory_byte_source source(buffer);

        auto result = read_item(source);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::malformed_container);
    }

    SECTION("length far beyond the data") {
        const std::vector<uint8_t> buffer = {
            0xFE, 0xFF, 0x00, 0xE0, 0xF0, 0xFF, 0xFF, 0xFF, 0x01, 0x02, 0x03, 0x04};
        memory_byte_source source(buffer);

        auto result = read_item(source);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::malformed_container);
        CHECK_THAT(result.error().message, ContainsSubstring("only 4 are available"));
    }

    SECTION("fewer than 4 bytes is the end of the data") {
        const std::vector<uint8_t> buffer = {0xFE, 0xFF, 0x00};
        memory_byte_source source(buffer);

        auto result = read_item(source);
        REQUIRE(result.is_ok());
        CHECK(result.value().status == item_status::end_of_data);
    }
}

TEST_CASE("read_item_header decodes tag and length", "[encoding][encapsulation][item]") {
    const std::vector<uint8_t> buffer = {
        0xFE, 0xFF, 0x00, 0xE0, 0x10, 0x20, 0x00, 0x00};
    memory_byte_source source(buffer);

    auto result = read_item_header(source);
    REQUIRE(result.is_ok());
    REQUIRE(result.value().has_value());

    const auto& header = *result.value();
    CHECK(header.group == kItemGroup);
    CHECK(header.element == kItemElement);
    CHECK(header.length == 0x2010);
    CHECK(header.is_item());
    CHECK_FALSE(header.is_sequence_delimiter());
}

TEST_CASE("validate_item_header", "[encoding][encapsulation][item]") {
    item_header header;
    header.group = kItemGroup;
    header.element = kItemElement;
    header.length = 16;
    header.offset = 24;

    SECTION("items with a defined length are accepted") {
        CHECK(validate_item_header(header).is_ok());
    }

    SECTION("the sequence delimiter is accepted with any length") {
        header.element = kSequenceDelimiterElement;
        header.length = kUndefinedLength;
        CHECK(validate_item_header(header).is_ok());
    }

    SECTION("undefined item length") {
        header.length = kUndefinedLength;
        auto result = validate_item_header(header);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::malformed_container);
        CHECK_THAT(result.error().message, ContainsSubstring("offset 24"));
    }

    SECTION("foreign tag") {
        header.group = 0x7FE0;
        header.element = 0x0010;
        auto result = validate_item_header(header);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::malformed_container);
        CHECK_THAT(result.error().message, ContainsSubstring("(7FE0,0010)"));
    }
}
