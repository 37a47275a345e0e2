/**
 * @file pixel_data_pipeline_test.cpp
 * @brief Tests for frame assembly combined with the RLE codec
 */

#include <dcmpix/encoding/compression/rle_codec.hpp>
#include <dcmpix/encoding/encapsulation/encapsulator.hpp>
#include <dcmpix/encoding/pixel_data_pipeline.hpp>
#include <dcmpix/integration/thread_adapter.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <chrono>
#include <thread>
#include <utility>
#include <vector>

using namespace dcmpix;
using namespace dcmpix::encoding;
using namespace std::chrono_literals;
using Catch::Matchers::StartsWith;

namespace {

using bytes = std::vector<uint8_t>;

compression::frame_geometry make_geometry(uint32_t frames) {
    compression::frame_geometry geometry;
    geometry.rows = 6;
    geometry.columns = 5;
    geometry.samples_per_pixel = 3;
    geometry.bits_allocated = 16;
    geometry.planar_configuration = 1;
    geometry.number_of_frames = frames;
    return geometry;
}

std::vector<bytes> create_frames(const compression::frame_geometry& geometry) {
    std::vector<bytes> frames;
    for (uint32_t f = 0; f < geometry.number_of_frames; ++f) {
        bytes frame(geometry.frame_size_bytes());
        for (std::size_t i = 0; i < frame.size(); ++i) {
            frame[i] = static_cast<uint8_t>((i / 7) * (f + 1));
        }
        frames.push_back(std::move(frame));
    }
    return frames;
}

/// RLE encodes every frame, replacing frame bad_index with garbage
bytes encapsulate_with_corrupt_frame(const std::vector<bytes>& frames,
                                     const compression::frame_geometry& geometry,
                                     std::size_t bad_index) {
    std::vector<bytes> compressed;
    for (std::size_t i = 0; i < frames.size(); ++i) {
        if (i == bad_index) {
            compressed.push_back(bytes(10, 0xEE));
            continue;
        }
        auto encoded = compression::rle_encode_frame(frames[i], geometry);
        REQUIRE(encoded.is_ok());
        compressed.push_back(std::move(encoded.value()));
    }
    auto encapsulated = encapsulation::encapsulate(compressed);
    REQUIRE(encapsulated.is_ok());
    return encapsulated.value();
}

struct thread_adapter_guard {
    ~thread_adapter_guard() {
        integration::thread_adapter::shutdown(true);
        std::this_thread::sleep_for(50ms);
    }
};

}  // namespace

TEST_CASE("pixel_data_pipeline round trip", "[encoding][pipeline]") {
    const auto geometry = make_geometry(3);
    const auto frames = create_frames(geometry);

    SECTION("one fragment per frame with a Basic Offset Table") {
        pixel_data_pipeline pipeline;
        auto encoded = pipeline.encode_frames(frames, geometry);
        REQUIRE(encoded.is_ok());

        auto decoded = pipeline.decode_frames(encoded.value(), geometry);
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded.value().size() == 3);
        CHECK(decoded.value() == frames);
    }

    SECTION("two fragments per frame without a Basic Offset Table") {
        pipeline_config config;
        config.fragments_per_frame = 2;
        config.include_offset_table = false;
        config.read_options.heuristic =
            encapsulation::frame_boundary_heuristic::equal_fragment_count;
        pixel_data_pipeline pipeline(config);

        auto encoded = pipeline.encode_frames(frames, geometry);
        REQUIRE(encoded.is_ok());

        auto decoded = pipeline.decode_frames(encoded.value(), geometry);
        REQUIRE(decoded.is_ok());
        CHECK(decoded.value() == frames);
    }

    SECTION("multi-frame data without offsets needs a heuristic") {
        pipeline_config config;
        config.include_offset_table = false;
        pixel_data_pipeline pipeline(config);

        auto encoded = pipeline.encode_frames(frames, geometry);
        REQUIRE(encoded.is_ok());

        auto decoded = pipeline.decode_frames(encoded.value(), geometry);
        REQUIRE(decoded.is_err());
        CHECK(decoded.error().code == error_codes::frame_boundary_error);
    }

    SECTION("frame of the wrong size") {
        pixel_data_pipeline pipeline;
        auto bad = frames;
        bad[2].pop_back();

        auto encoded = pipeline.encode_frames(bad, geometry);
        REQUIRE(encoded.is_err());
        CHECK(encoded.error().code == error_codes::invalid_parameter);
        CHECK_THAT(encoded.error().message, StartsWith("Frame 2: "));
    }
}

TEST_CASE("pixel_data_pipeline isolates frame failures", "[encoding][pipeline]") {
    const auto geometry = make_geometry(3);
    const auto frames = create_frames(geometry);
    const auto encapsulated = encapsulate_with_corrupt_frame(frames, geometry, 1);

    pixel_data_pipeline pipeline;

    SECTION("decode_frames stops at the first failure") {
        auto decoded = pipeline.decode_frames(encapsulated, geometry);
        REQUIRE(decoded.is_err());
        CHECK(decoded.error().code == error_codes::invalid_rle_header);
        CHECK_THAT(decoded.error().message, StartsWith("Frame 1: "));
    }

    SECTION("decode_frames_independently keeps the other frames") {
        auto results = pipeline.decode_frames_independently(encapsulated, geometry);
        REQUIRE(results.size() == 3);

        REQUIRE(results[0].is_ok());
        CHECK(results[0].value() == frames[0]);

        REQUIRE(results[1].is_err());
        CHECK(results[1].error().code == error_codes::invalid_rle_header);

        REQUIRE(results[2].is_ok());
        CHECK(results[2].value() == frames[2]);
    }

    SECTION("a broken container yields a single error") {
        const bytes broken = {0xE0, 0x7F, 0x10, 0x00, 0x00, 0x00, 0x00, 0x00};
        auto results = pipeline.decode_frames_independently(broken, geometry);
        REQUIRE(results.size() == 1);
        REQUIRE(results[0].is_err());
        CHECK(results[0].error().code == error_codes::malformed_container);
    }
}

TEST_CASE("pixel_data_pipeline on the thread pool", "[encoding][pipeline]") {
    thread_adapter_guard guard;

    const auto geometry = make_geometry(8);
    const auto frames = create_frames(geometry);

    pipeline_config config;
    config.parallel = true;
    pixel_data_pipeline pipeline(config);

    auto encoded = pipeline.encode_frames(frames, geometry);
    REQUIRE(encoded.is_ok());

    auto decoded = pipeline.decode_frames(encoded.value(), geometry);
    REQUIRE(decoded.is_ok());
    CHECK(decoded.value() == frames);

    auto independent = pipeline.decode_frames_independently(encoded.value(), geometry);
    REQUIRE(independent.size() == frames.size());
    for (std::size_t i = 0; i < independent.size(); ++i) {
        REQUIRE(independent[i].is_ok());
        CHECK(independent[i].value() == frames[i]);
    }
}

TEST_CASE("pixel_data_pipeline codec selection", "[encoding][pipeline]") {
    const auto geometry = make_geometry(1);
    const auto frames = create_frames(geometry);

    SECTION("unsupported transfer syntax") {
        pipeline_config config;
        config.transfer_syntax_uid = "1.2.840.10008.1.2.4.50";
        pixel_data_pipeline pipeline(config);

        auto encoded = pipeline.encode_frames(frames, geometry);
        REQUIRE(encoded.is_err());
        CHECK(encoded.error().code == error_codes::codec_not_supported);

        auto container = encapsulation::encapsulate(frames);
        REQUIRE(container.is_ok());
        auto decoded = pipeline.decode_frames(container.value(), geometry);
        REQUIRE(decoded.is_err());
        CHECK(decoded.error().code == error_codes::codec_not_supported);
    }

    SECTION("little endian segment order") {
        pipeline_config config;
        config.segment_order = compression::rle_segment_order::little_endian;
        pixel_data_pipeline pipeline(config);
        CHECK(pipeline.config().segment_order ==
              compression::rle_segment_order::little_endian);

        auto encoded = pixel_data_pipeline{}.encode_frames(frames, geometry);
        REQUIRE(encoded.is_ok());

        // Big endian data read as little endian swaps every sample's bytes
        auto decoded = pipeline.decode_frames(encoded.value(), geometry);
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded.value().size() == 1);

        auto expected = frames[0];
        for (std::size_t i = 0; i + 1 < expected.size(); i += 2) {
            std::swap(expected[i], expected[i + 1]);
        }
        CHECK(decoded.value()[0] == expected);
    }
}
