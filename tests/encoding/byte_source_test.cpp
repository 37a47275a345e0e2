/**
 * @file byte_source_test.cpp
 * @brief Unit tests for memory and stream byte sources
 */

#include <dcmpix/encoding/byte_source.hpp>

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <sstream>
#include <string>
#include <vector>

using namespace dcmpix::encoding;

TEST_CASE("memory_byte_source reads, tells and seeks", "[encoding][byte_source]") {
    const std::vector<uint8_t> data = {0x01, 0x02, 0x03, 0x04, 0x05};
    memory_byte_source source(data);

    SECTION("reads forward and reports position") {
        std::array<uint8_t, 2> buffer{};
        REQUIRE(source.read(buffer) == 2);
        CHECK(buffer[0] == 0x01);
        CHECK(buffer[1] == 0x02);
        CHECK(source.tell() == 2);
        CHECK(source.remaining() == 3);
    }

    SECTION("short read at the end of the data") {
        REQUIRE(source.seek(3));
        std::array<uint8_t, 4> buffer{};
        REQUIRE(source.read(buffer) == 2);
        CHECK(buffer[0] == 0x04);
        CHECK(buffer[1] == 0x05);
        CHECK(source.read(buffer) == 0);
    }

    SECTION("seek to the end is allowed, past the end is not") {
        REQUIRE(source.seek(5));
        CHECK(source.remaining() == 0);
        REQUIRE_FALSE(source.seek(6));
        CHECK(source.tell() == 5);
    }

    SECTION("independent sources over one buffer") {
        memory_byte_source other(data);
        std::array<uint8_t, 3> buffer{};
        REQUIRE(source.read(buffer) == 3);
        CHECK(other.tell() == 0);
    }
}

TEST_CASE("stream_byte_source wraps std::istream", "[encoding][byte_source]") {
    const std::string bytes("\x10\x20\x30\x40", 4);
    std::istringstream stream(bytes);
    stream_byte_source source(stream);

    SECTION("reads and seeks") {
        std::array<uint8_t, 3> buffer{};
        REQUIRE(source.read(buffer) == 3);
        CHECK(buffer[2] == 0x30);
        CHECK(source.tell() == 3);

        REQUIRE(source.seek(1));
        REQUIRE(source.read(buffer) == 3);
        CHECK(buffer[0] == 0x20);
        CHECK(buffer[2] == 0x40);
    }

    SECTION("position survives a short read") {
        std::array<uint8_t, 8> buffer{};
        REQUIRE(source.read(buffer) == 4);
        CHECK(source.tell() == 4);
        REQUIRE(source.seek(0));
        REQUIRE(source.read(buffer) == 4);
    }
}

TEST_CASE("position_guard restores the position", "[encoding][byte_source]") {
    const std::vector<uint8_t> data(16, 0xAA);
    memory_byte_source source(data);
    REQUIRE(source.seek(4));

    {
        position_guard guard(source);
        std::array<uint8_t, 8> buffer{};
        REQUIRE(source.read(buffer) == 8);
        CHECK(source.tell() == 12);
    }

    CHECK(source.tell() == 4);
}

TEST_CASE("read_bounded appends at most the available bytes", "[encoding][byte_source]") {
    const std::vector<uint8_t> data = {1, 2, 3, 4, 5, 6};
    memory_byte_source source(data);

    SECTION("a length within the data") {
        std::vector<uint8_t> out = {9};
        CHECK(read_bounded(source, 4, out) == 4);
        CHECK(out == std::vector<uint8_t>{9, 1, 2, 3, 4});
        CHECK(source.tell() == 4);
    }

    SECTION("a length larger than any buffer stops at the end of the data") {
        std::vector<uint8_t> out;
        CHECK(read_bounded(source, 0xFFFF'FFFF'FFFF'FFFFULL, out) == data.size());
        CHECK(out == data);
        CHECK(source.remaining() == 0);
    }

    SECTION("zero length reads nothing") {
        std::vector<uint8_t> out;
        CHECK(read_bounded(source, 0, out) == 0);
        CHECK(out.empty());
        CHECK(source.tell() == 0);
    }
}
