/**
 * @file logger_adapter.cpp
 * @brief Implementation of the logger_system adapter
 */

#include <dcmpix/integration/logger_adapter.hpp>

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/interfaces/logger_types.h>
#include <kcenon/logger/writers/console_writer.h>
#include <kcenon/logger/writers/rotating_file_writer.h>

#include <array>
#include <atomic>
#include <memory>
#include <mutex>
#include <utility>

namespace dcmpix::integration {

namespace {

struct level_entry {
    std::string_view name;
    log_level level;
    kcenon::logger::log_level backend;
};

// Indexed by log_level; aliases follow
constexpr std::array<level_entry, 9> kLevels{{
    {"trace", log_level::trace, kcenon::logger::log_level::trace},
    {"debug", log_level::debug, kcenon::logger::log_level::debug},
    {"info", log_level::info, kcenon::logger::log_level::info},
    {"warn", log_level::warn, kcenon::logger::log_level::warn},
    {"error", log_level::error, kcenon::logger::log_level::error},
    {"fatal", log_level::fatal, kcenon::logger::log_level::fatal},
    {"off", log_level::off, kcenon::logger::log_level::off},
    {"warning", log_level::warn, kcenon::logger::log_level::warn},
    {"critical", log_level::fatal, kcenon::logger::log_level::fatal},
}};

constexpr std::size_t kCanonicalLevels = 7;

auto backend_level(log_level level) -> kcenon::logger::log_level {
    const auto index = static_cast<std::size_t>(level);
    return index < kCanonicalLevels ? kLevels[index].backend
                                    : kcenon::logger::log_level::off;
}

/**
 * @brief Process-wide logger state
 *
 * The backend logger is guarded by mutex; the level and the initialized flag
 * are atomics so that disabled levels cost no lock.
 */
struct logger_state {
    std::mutex mutex;
    std::atomic<bool> initialized{false};
    std::atomic<log_level> min_level{log_level::info};
    logger_config config;
    std::unique_ptr<kcenon::logger::logger> backend;

    ~logger_state() { release(); }

    void release() {
        std::lock_guard lock(mutex);
        initialized.store(false);
        if (backend) {
            backend->flush();
            backend->stop();
            backend.reset();
        }
    }
};

logger_state& state() {
    static logger_state instance;
    return instance;
}

auto make_backend(const logger_config& config) -> std::unique_ptr<kcenon::logger::logger> {
    auto backend = std::make_unique<kcenon::logger::logger>(config.async_mode,
                                                            config.buffer_size);
    backend->set_min_level(backend_level(config.min_level));

    if (config.enable_console) {
        backend->add_writer(std::make_unique<kcenon::logger::console_writer>());
    }

    if (config.enable_file) {
        std::filesystem::create_directories(config.log_directory);
        constexpr std::size_t kBytesPerMegabyte = 1024 * 1024;
        backend->add_writer(std::make_unique<kcenon::logger::rotating_file_writer>(
            (config.log_directory / config.file_name).string(),
            config.max_file_size_mb * kBytesPerMegabyte, config.max_files));
    }

    backend->start();
    return backend;
}

}  // namespace

// =============================================================================
// Lifecycle
// =============================================================================

void logger_adapter::initialize(const logger_config& config) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (s.initialized.load()) {
        return;
    }

    s.backend = make_backend(config);
    s.config = config;
    s.min_level.store(config.min_level);
    s.initialized.store(true);
}

void logger_adapter::shutdown() { state().release(); }

auto logger_adapter::is_initialized() noexcept -> bool {
    return state().initialized.load();
}

// =============================================================================
// Logging
// =============================================================================

void logger_adapter::log(log_level level, const std::string& message) {
    if (!is_level_enabled(level)) {
        return;
    }

    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (s.backend) {
        s.backend->log(backend_level(level), message);
    }
}

auto logger_adapter::is_level_enabled(log_level level) noexcept -> bool {
    const auto& s = state();
    return s.initialized.load() && level != log_level::off &&
           static_cast<int>(level) >= static_cast<int>(s.min_level.load());
}

void logger_adapter::flush() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (s.backend) {
        s.backend->flush();
    }
}

// =============================================================================
// Pixel Data Events
// =============================================================================

void logger_adapter::log_nonconformance(nonconformance kind, const std::string& detail) {
    warn("Non-conformant pixel data ({}): {}", to_string(kind), detail);
}

void logger_adapter::log_frame_failure(frame_operation operation,
                                       std::size_t frame_index,
                                       const std::string& reason) {
    warn("Failed to {} frame {}: {}", to_string(operation), frame_index, reason);
}

void logger_adapter::log_frames_completed(frame_operation operation,
                                          std::size_t succeeded,
                                          std::size_t total,
                                          std::size_t output_bytes) {
    const std::string_view verb =
        operation == frame_operation::decode ? "Decoded" : "Encoded";
    if (succeeded == total) {
        info("{} {} frames ({} bytes)", verb, total, output_bytes);
    } else {
        info("{} {} of {} frames ({} bytes)", verb, succeeded, total, output_bytes);
    }
}

// =============================================================================
// Configuration
// =============================================================================

void logger_adapter::set_min_level(log_level level) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    s.min_level.store(level);
    s.config.min_level = level;
    if (s.backend) {
        s.backend->set_min_level(backend_level(level));
    }
}

auto logger_adapter::get_min_level() noexcept -> log_level {
    return state().min_level.load();
}

auto logger_adapter::get_config() -> logger_config {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    return s.config;
}

auto logger_adapter::parse_level(std::string_view name, log_level fallback) -> log_level {
    for (const auto& entry : kLevels) {
        if (entry.name == name) {
            return entry.level;
        }
    }
    return fallback;
}

auto logger_adapter::to_string(log_level level) -> std::string_view {
    const auto index = static_cast<std::size_t>(level);
    return index < kCanonicalLevels ? kLevels[index].name : "unknown";
}

auto logger_adapter::to_string(nonconformance kind) -> std::string_view {
    switch (kind) {
        case nonconformance::delimiter_length:
            return "delimiter_length";
        case nonconformance::offset_table_mismatch:
            return "offset_table_mismatch";
        case nonconformance::missing_end_marker:
            return "missing_end_marker";
        case nonconformance::marker_frame_count:
            return "marker_frame_count";
        case nonconformance::rle_segment_overrun:
            return "rle_segment_overrun";
    }
    return "unknown";
}

auto logger_adapter::to_string(frame_operation operation) -> std::string_view {
    return operation == frame_operation::decode ? "decode" : "encode";
}

}  // namespace dcmpix::integration
