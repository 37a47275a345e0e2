/**
 * @file logger_adapter_test.cpp
 * @brief Unit tests for logger_adapter
 */

#include <dcmpix/integration/logger_adapter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>

using namespace dcmpix::integration;

// =============================================================================
// Test Helpers
// =============================================================================

namespace {

/**
 * @brief Create a temporary directory for test logs
 */
auto create_temp_log_directory() -> std::filesystem::path {
    auto temp_dir = std::filesystem::temp_directory_path() / "dcmpix_logger_test";
    std::filesystem::create_directories(temp_dir);
    return temp_dir;
}

/**
 * @brief Clean up temporary log directory
 */
void cleanup_temp_directory(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
}

/**
 * @brief Read file contents as string
 */
auto read_file_contents(const std::filesystem::path& path) -> std::string {
    std::ifstream file(path);
    if (!file) {
        return "";
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

/**
 * @brief Concatenated contents of every log file in a directory
 */
auto read_directory_logs(const std::filesystem::path& dir) -> std::string {
    std::string contents;
    if (!std::filesystem::exists(dir)) {
        return contents;
    }
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.is_regular_file()) {
            contents += read_file_contents(entry.path());
        }
    }
    return contents;
}

/**
 * @brief File-only configuration writing into dir
 */
auto file_config(const std::filesystem::path& dir, log_level level = log_level::info)
    -> logger_config {
    logger_config config;
    config.log_directory = dir;
    config.enable_console = false;
    config.enable_file = true;
    config.min_level = level;
    return config;
}

/**
 * @brief Flush and give the writers time to reach the file
 */
void settle() {
    logger_adapter::flush();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
}

/**
 * @brief RAII wrapper for logger initialization/shutdown
 */
class logger_test_fixture {
public:
    explicit logger_test_fixture(const logger_config& config) : log_dir_(config.log_directory) {
        logger_adapter::initialize(config);
    }

    ~logger_test_fixture() {
        logger_adapter::shutdown();
        cleanup_temp_directory(log_dir_);
    }

    logger_test_fixture(const logger_test_fixture&) = delete;
    logger_test_fixture& operator=(const logger_test_fixture&) = delete;

private:
    std::filesystem::path log_dir_;
};

}  // namespace

// =============================================================================
// Initialization Tests
// =============================================================================

TEST_CASE("logger_adapter initialization and shutdown", "[logger_adapter][init]") {
    auto temp_dir = create_temp_log_directory();

    SECTION("Basic initialization") {
        logger_adapter::initialize(file_config(temp_dir));
        REQUIRE(logger_adapter::is_initialized());

        logger_adapter::shutdown();
        REQUIRE_FALSE(logger_adapter::is_initialized());
    }

    SECTION("Multiple initialization calls are safe") {
        logger_adapter::initialize(file_config(temp_dir));
        logger_adapter::initialize(file_config(temp_dir, log_level::trace));
        REQUIRE(logger_adapter::is_initialized());
        CHECK(logger_adapter::get_min_level() == log_level::info);

        logger_adapter::shutdown();
    }

    SECTION("Shutdown without initialization is safe") {
        logger_adapter::shutdown();
        REQUIRE_FALSE(logger_adapter::is_initialized());
    }

    SECTION("Messages are dropped before initialization") {
        REQUIRE_FALSE(logger_adapter::is_initialized());
        REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::fatal));
        logger_adapter::warn("Dropped message {}", 1);
    }

    cleanup_temp_directory(temp_dir);
}

// =============================================================================
// Standard Logging Tests
// =============================================================================

TEST_CASE("logger_adapter standard logging", "[logger_adapter][logging]") {
    auto temp_dir = create_temp_log_directory();
    logger_test_fixture fixture(file_config(temp_dir, log_level::trace));

    SECTION("Log at different levels") {
        logger_adapter::trace("Trace message: {}", 1);
        logger_adapter::debug("Debug message: {}", 2);
        logger_adapter::info("Info message: {}", 3);
        logger_adapter::warn("Warn message: {}", 4);
        logger_adapter::error("Error message: {}", 5);

        settle();

        auto content = read_directory_logs(temp_dir);
        CHECK(content.find("Warn message: 4") != std::string::npos);
    }

    SECTION("Log level filtering") {
        logger_adapter::set_min_level(log_level::warn);
        REQUIRE(logger_adapter::get_min_level() == log_level::warn);

        REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::trace));
        REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::debug));
        REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::info));
        REQUIRE(logger_adapter::is_level_enabled(log_level::warn));
        REQUIRE(logger_adapter::is_level_enabled(log_level::error));
        REQUIRE(logger_adapter::is_level_enabled(log_level::fatal));
        REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::off));
    }

    SECTION("Filtered messages are not written") {
        logger_adapter::set_min_level(log_level::error);
        logger_adapter::info("Filtered info {}", 42);
        logger_adapter::error("Kept error {}", 43);

        settle();

        auto content = read_directory_logs(temp_dir);
        CHECK(content.find("Filtered info 42") == std::string::npos);
        CHECK(content.find("Kept error 43") != std::string::npos);
    }
}

// =============================================================================
// Configuration Tests
// =============================================================================

TEST_CASE("logger_adapter configuration", "[logger_adapter][config]") {
    auto temp_dir = create_temp_log_directory();

    SECTION("Get configuration after initialization") {
        auto config = file_config(temp_dir, log_level::debug);
        config.max_file_size_mb = 50;
        config.max_files = 3;

        logger_test_fixture fixture(config);

        auto retrieved_config = logger_adapter::get_config();
        REQUIRE(retrieved_config.min_level == log_level::debug);
        REQUIRE(retrieved_config.enable_file == true);
        REQUIRE(retrieved_config.file_name == "dcmpix.log");
        REQUIRE(retrieved_config.max_file_size_mb == 50);
        REQUIRE(retrieved_config.max_files == 3);
    }

    SECTION("Set and get minimum log level") {
        logger_test_fixture fixture(file_config(temp_dir));

        REQUIRE(logger_adapter::get_min_level() == log_level::info);

        logger_adapter::set_min_level(log_level::error);
        REQUIRE(logger_adapter::get_min_level() == log_level::error);

        logger_adapter::set_min_level(log_level::trace);
        REQUIRE(logger_adapter::get_min_level() == log_level::trace);
    }

    cleanup_temp_directory(temp_dir);
}

TEST_CASE("logger_adapter parses level names", "[logger_adapter][config]") {
    CHECK(logger_adapter::parse_level("trace") == log_level::trace);
    CHECK(logger_adapter::parse_level("debug") == log_level::debug);
    CHECK(logger_adapter::parse_level("info") == log_level::info);
    CHECK(logger_adapter::parse_level("warn") == log_level::warn);
    CHECK(logger_adapter::parse_level("warning") == log_level::warn);
    CHECK(logger_adapter::parse_level("error") == log_level::error);
    CHECK(logger_adapter::parse_level("fatal") == log_level::fatal);
    CHECK(logger_adapter::parse_level("off") == log_level::off);
    CHECK(logger_adapter::parse_level("verbose") == log_level::info);
    CHECK(logger_adapter::parse_level("verbose", log_level::warn) == log_level::warn);
}

TEST_CASE("logger_adapter names levels and events", "[logger_adapter][config]") {
    CHECK(logger_adapter::to_string(log_level::warn) == "warn");
    CHECK(logger_adapter::to_string(log_level::off) == "off");
    CHECK(logger_adapter::to_string(nonconformance::rle_segment_overrun) ==
          "rle_segment_overrun");
    CHECK(logger_adapter::to_string(nonconformance::delimiter_length) == "delimiter_length");
    CHECK(logger_adapter::to_string(frame_operation::encode) == "encode");

    for (auto level : {log_level::trace, log_level::debug, log_level::info, log_level::warn,
                       log_level::error, log_level::fatal, log_level::off}) {
        CHECK(logger_adapter::parse_level(logger_adapter::to_string(level)) == level);
    }
}

// =============================================================================
// Pixel Data Event Tests
// =============================================================================

TEST_CASE("logger_adapter pixel data events", "[logger_adapter][events]") {
    auto temp_dir = create_temp_log_directory();
    logger_test_fixture fixture(file_config(temp_dir));

    SECTION("Non-conformances are written as warnings") {
        logger_adapter::log_nonconformance(nonconformance::offset_table_mismatch,
                                           "3 offsets for 2 frames");
        settle();

        auto content = read_directory_logs(temp_dir);
        CHECK(content.find("Non-conformant pixel data (offset_table_mismatch): "
                           "3 offsets for 2 frames") != std::string::npos);
    }

    SECTION("Frame failures and summaries") {
        logger_adapter::log_frame_failure(frame_operation::decode, 4, "bad header");
        logger_adapter::log_frames_completed(frame_operation::decode, 5, 6, 1200);
        logger_adapter::log_frames_completed(frame_operation::encode, 2, 2, 64);
        settle();

        auto content = read_directory_logs(temp_dir);
        CHECK(content.find("Failed to decode frame 4: bad header") != std::string::npos);
        CHECK(content.find("Decoded 5 of 6 frames (1200 bytes)") != std::string::npos);
        CHECK(content.find("Encoded 2 frames (64 bytes)") != std::string::npos);
    }

    SECTION("Events respect the minimum level") {
        logger_adapter::set_min_level(log_level::error);
        logger_adapter::log_nonconformance(nonconformance::missing_end_marker, "frame 1");
        settle();

        auto content = read_directory_logs(temp_dir);
        CHECK(content.find("missing_end_marker") == std::string::npos);
    }
}

// =============================================================================
// Thread Safety Tests
// =============================================================================

TEST_CASE("logger_adapter thread safety", "[logger_adapter][thread]") {
    auto temp_dir = create_temp_log_directory();
    auto config = file_config(temp_dir);
    config.async_mode = true;

    logger_test_fixture fixture(config);

    constexpr int num_threads = 4;
    constexpr int messages_per_thread = 50;

    std::vector<std::thread> threads;
    threads.reserve(num_threads);
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([t]() {
            for (int i = 0; i < messages_per_thread; ++i) {
                logger_adapter::info("Thread {} frame {}", t, i);
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    logger_adapter::flush();
    REQUIRE(logger_adapter::is_initialized());
}
