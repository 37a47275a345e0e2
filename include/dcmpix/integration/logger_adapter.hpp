/**
 * @file logger_adapter.hpp
 * @brief Adapter for diagnostic logging using logger_system
 *
 * Routes dcmpix diagnostics to logger_system: tolerated non-conformant
 * encodings, frame boundary decisions and per-frame codec outcomes. Until
 * initialize() is called every message is dropped, so the library stays
 * silent when embedded in a host application.
 */

#pragma once

#include <dcmpix/compat/format.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace dcmpix::integration {

/**
 * @enum log_level
 * @brief Log severity levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

/**
 * @enum nonconformance
 * @brief Encoding defects that are tolerated while reading
 */
enum class nonconformance {
    delimiter_length,       ///< Sequence Delimiter with a non-zero length
    offset_table_mismatch,  ///< Offset table and Number of Frames disagree
    missing_end_marker,     ///< Last fragment has no JPEG EOI/EOC marker
    marker_frame_count,     ///< Marker split found a different frame count
    rle_segment_overrun     ///< RLE segment decodes to more bytes than needed
};

/**
 * @enum frame_operation
 * @brief Direction of a per-frame codec call
 */
enum class frame_operation { decode, encode };

/**
 * @struct logger_config
 * @brief Configuration options for the logger adapter
 */
struct logger_config {
    /// Directory for log files
    std::filesystem::path log_directory{"logs"};

    /// Log file name inside log_directory
    std::string file_name{"dcmpix.log"};

    /// Minimum log level to output
    log_level min_level{log_level::info};

    /// Enable console output
    bool enable_console{true};

    /// Enable file output
    bool enable_file{false};

    /// Maximum log file size in megabytes before rotation
    std::size_t max_file_size_mb{10};

    /// Maximum number of rotated log files to keep
    std::size_t max_files{5};

    /// Use asynchronous logging
    bool async_mode{false};

    /// Buffer size for async logging
    std::size_t buffer_size{8192};
};

/**
 * @class logger_adapter
 * @brief Static logging facade over logger_system
 *
 * Thread Safety: All methods are thread-safe.
 *
 * @example
 * @code
 * logger_config config;
 * config.min_level = log_level::debug;
 * logger_adapter::initialize(config);
 *
 * logger_adapter::log_nonconformance(nonconformance::rle_segment_overrun,
 *                                    "segment 2 is 1 byte too long");
 *
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    /**
     * @brief Initialize the logger with configuration
     *
     * Sets up console and file writers and configures the log level.
     * Calling initialize() on an initialized logger has no effect.
     */
    static void initialize(const logger_config& config);

    /**
     * @brief Flush pending messages and release the logger
     */
    static void shutdown();

    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    template <typename... Args>
    static void trace(dcmpix::compat::format_string<Args...> fmt, Args&&... args) {
        emit(log_level::trace, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void debug(dcmpix::compat::format_string<Args...> fmt, Args&&... args) {
        emit(log_level::debug, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void info(dcmpix::compat::format_string<Args...> fmt, Args&&... args) {
        emit(log_level::info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void warn(dcmpix::compat::format_string<Args...> fmt, Args&&... args) {
        emit(log_level::warn, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void error(dcmpix::compat::format_string<Args...> fmt, Args&&... args) {
        emit(log_level::error, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void fatal(dcmpix::compat::format_string<Args...> fmt, Args&&... args) {
        emit(log_level::fatal, fmt, std::forward<Args>(args)...);
    }

    /**
     * @brief Log a preformatted message at the specified level
     */
    static void log(log_level level, const std::string& message);

    /**
     * @brief Check if a log level is enabled
     *
     * Always false while the logger is not initialized.
     */
    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    static void flush();

    // =========================================================================
    // Pixel Data Events
    // =========================================================================

    /**
     * @brief Record a non-conformant encoding that was accepted (warn)
     * @param kind Category of the defect
     * @param detail Where it was found and how it was handled
     */
    static void log_nonconformance(nonconformance kind, const std::string& detail);

    /**
     * @brief Record a frame that could not be decoded or encoded (warn)
     */
    static void log_frame_failure(frame_operation operation,
                                  std::size_t frame_index,
                                  const std::string& reason);

    /**
     * @brief Record the outcome of a multi-frame call (info)
     * @param operation Decode or encode
     * @param succeeded Frames that completed
     * @param total Frames attempted
     * @param output_bytes Bytes produced
     */
    static void log_frames_completed(frame_operation operation,
                                     std::size_t succeeded,
                                     std::size_t total,
                                     std::size_t output_bytes);

    // =========================================================================
    // Configuration
    // =========================================================================

    static void set_min_level(log_level level);

    [[nodiscard]] static auto get_min_level() noexcept -> log_level;

    [[nodiscard]] static auto get_config() -> logger_config;

    /**
     * @brief Parse a level name ("trace" .. "fatal", "off")
     *
     * "warning" and "critical" are accepted as aliases of warn and fatal.
     *
     * @param name Level name
     * @param fallback Level returned for unknown names
     */
    [[nodiscard]] static auto parse_level(std::string_view name,
                                          log_level fallback = log_level::info) -> log_level;

    [[nodiscard]] static auto to_string(log_level level) -> std::string_view;
    [[nodiscard]] static auto to_string(nonconformance kind) -> std::string_view;
    [[nodiscard]] static auto to_string(frame_operation operation) -> std::string_view;

private:
    template <typename... Args>
    static void emit(log_level level, dcmpix::compat::format_string<Args...> fmt,
                     Args&&... args) {
        if (is_level_enabled(level)) {
            log(level, dcmpix::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    logger_adapter() = delete;
};

}  // namespace dcmpix::integration
