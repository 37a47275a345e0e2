#include <catch2/catch_test_macros.hpp>

#include "dcmpix/encoding/compression/rle_segment.hpp"

#include <random>
#include <vector>

using namespace dcmpix::encoding::compression;

namespace {

using bytes = std::vector<uint8_t>;

bytes create_noise(std::size_t length, uint32_t seed) {
    bytes data(length);
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    for (auto& value : data) {
        value = static_cast<uint8_t>(dist(gen));
    }
    return data;
}

/// Mix of runs and noise
bytes create_mixed(std::size_t length, uint32_t seed) {
    bytes data(length);
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dist(0, 3);
    uint8_t current = 0;
    for (auto& value : data) {
        if (dist(gen) == 0) {
            current = static_cast<uint8_t>(gen());
        }
        value = current;
    }
    return data;
}

}  // namespace

TEST_CASE("decode_rle_segment header bytes", "[encoding][compression][rle]") {
    SECTION("single literal byte") {
        CHECK(decode_rle_segment(bytes{0x00, 0xAB}) == bytes{0xAB});
    }

    SECTION("literal run") {
        CHECK(decode_rle_segment(bytes{0x02, 0x01, 0x02, 0x03}) == bytes{0x01, 0x02, 0x03});
    }

    SECTION("replicate run") {
        CHECK(decode_rle_segment(bytes{0xFE, 0x07}) == bytes{0x07, 0x07, 0x07});
        CHECK(decode_rle_segment(bytes{0x81, 0x09}) == bytes(128, 0x09));
    }

    SECTION("header 128 is ignored") {
        CHECK(decode_rle_segment(bytes{0x80, 0x00, 0x05}) == bytes{0x05});
        CHECK(decode_rle_segment(bytes{0x80}).empty());
    }

    SECTION("mixed literal and replicate") {
        const bytes input = {0x01, 0x0A, 0x0B, 0xFD, 0x0C, 0x00, 0x0D};
        CHECK(decode_rle_segment(input) == bytes{0x0A, 0x0B, 0x0C, 0x0C, 0x0C, 0x0C, 0x0D});
    }
}

TEST_CASE("decode_rle_segment on truncated input", "[encoding][compression][rle]") {
    SECTION("literal shorter than declared") {
        CHECK(decode_rle_segment(bytes{0x04, 0x01, 0x02}) == bytes{0x01, 0x02});
    }

    SECTION("replicate without its value") {
        CHECK(decode_rle_segment(bytes{0x00, 0x01, 0xFE}) == bytes{0x01});
    }

    SECTION("trailing pad byte") {
        CHECK(decode_rle_segment(bytes{0x00, 0x01, 0x00}) == bytes{0x01});
    }

    SECTION("empty input") {
        CHECK(decode_rle_segment(bytes{}).empty());
    }
}

TEST_CASE("encode_rle_segment output", "[encoding][compression][rle]") {
    SECTION("a run of three is replicated") {
        CHECK(encode_rle_segment(bytes{0x05, 0x05, 0x05}) == bytes{0xFE, 0x05});
    }

    SECTION("a run of two stays literal") {
        CHECK(encode_rle_segment(bytes{0x05, 0x05, 0x06}) == bytes{0x02, 0x05, 0x05, 0x06});
    }

    SECTION("runs are capped at 128") {
        const auto encoded = encode_rle_segment(bytes(300, 0x11));
        CHECK(encoded == bytes{0x81, 0x11, 0x81, 0x11, 0xD5, 0x11});
    }

    SECTION("literals are capped at 128") {
        bytes input(200);
        for (std::size_t i = 0; i < input.size(); ++i) {
            input[i] = static_cast<uint8_t>(i);
        }
        const auto encoded = encode_rle_segment(input);
        REQUIRE(encoded.size() == 202);
        CHECK(encoded[0] == 127);
        CHECK(encoded[129] == 71);
    }

    SECTION("empty input") {
        CHECK(encode_rle_segment(bytes{}).empty());
    }
}

TEST_CASE("encode_rle_segment round trip", "[encoding][compression][rle]") {
    for (std::size_t length : {0u, 1u, 2u, 3u, 127u, 128u, 129u, 256u, 257u, 1000u}) {
        const bytes uniform(length, 0x42);
        CHECK(decode_rle_segment(encode_rle_segment(uniform), length) == uniform);

        const auto noise = create_noise(length, static_cast<uint32_t>(length));
        CHECK(decode_rle_segment(encode_rle_segment(noise), length) == noise);

        const auto mixed = create_mixed(length, static_cast<uint32_t>(length) + 7);
        CHECK(decode_rle_segment(encode_rle_segment(mixed), length) == mixed);
    }
}
