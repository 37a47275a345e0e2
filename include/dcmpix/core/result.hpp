/**
 * @file result.hpp
 * @brief Result<T> type aliases and helpers for dcmpix
 *
 * This file provides standardized Result<T> types and error handling
 * utilities for the encapsulation and RLE codec layers, integrating with
 * common_system's Result pattern.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>

namespace dcmpix {

/**
 * @brief Result type alias for dcmpix operations
 * @tparam T The success value type
 */
template <typename T>
using Result = kcenon::common::Result<T>;

/**
 * @brief Result type for void operations
 */
using VoidResult = kcenon::common::VoidResult;

/**
 * @brief Error information type
 */
using error_info = kcenon::common::error_info;

/**
 * @namespace error_codes
 * @brief dcmpix-specific error codes
 *
 * Error code range: -700 to -719
 * Provides access to both common error codes and dcmpix-specific codes.
 */
namespace error_codes {
    // Import common error codes
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int dcmpix_base = -700;

    // Encapsulated container errors (-700 to -704)
    constexpr int malformed_container = dcmpix_base - 0;
    constexpr int frame_boundary_error = dcmpix_base - 1;
    constexpr int fragmentation_limit_exceeded = dcmpix_base - 2;
    constexpr int offset_table_overflow = dcmpix_base - 3;
    constexpr int frame_index_out_of_range = dcmpix_base - 4;

    // RLE codec errors (-705 to -709)
    constexpr int unsupported_encoding = dcmpix_base - 5;
    constexpr int segment_count_mismatch = dcmpix_base - 6;
    constexpr int segment_length_mismatch = dcmpix_base - 7;
    constexpr int invalid_rle_header = dcmpix_base - 8;

    // General errors (-710 to -719)
    constexpr int invalid_parameter = dcmpix_base - 10;
    constexpr int codec_not_supported = dcmpix_base - 11;
    constexpr int read_error = dcmpix_base - 12;
} // namespace error_codes

// Re-export common utility functions
using kcenon::common::ok;
using kcenon::common::make_error;
using kcenon::common::is_ok;
using kcenon::common::is_error;
using kcenon::common::get_value;
using kcenon::common::get_error;

/**
 * @brief Create a dcmpix error result with module context
 * @tparam T The result value type
 * @param code Error code from dcmpix::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return Result<T> containing the error
 */
template <typename T>
inline Result<T> dcmpix_error(int code, const std::string& message,
                              const std::string& details = "") {
    if (details.empty()) {
        return kcenon::common::make_error<T>(code, message, "dcmpix");
    }
    return kcenon::common::make_error<T>(code, message, "dcmpix", details);
}

/**
 * @brief Create a dcmpix void error result
 * @param code Error code from dcmpix::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return VoidResult containing the error
 */
inline VoidResult dcmpix_void_error(int code, const std::string& message,
                                    const std::string& details = "") {
    if (details.empty()) {
        return VoidResult(error_info{code, message, "dcmpix"});
    }
    return VoidResult(error_info{code, message, "dcmpix", details});
}

/**
 * @brief Re-wrap the error of one result as a Result of another type
 * @param source A result holding an error
 * @return Result<T> carrying the same code and message
 */
template <typename T, typename U>
inline Result<T> forward_error(const Result<U>& source) {
    const auto& err = get_error(source);
    return dcmpix_error<T>(err.code, err.message);
}

} // namespace dcmpix

// Convenience macros for dcmpix Result pattern usage

/**
 * @brief Return early if expression is an error (dcmpix version)
 */
#define DCMPIX_RETURN_IF_ERROR(expr) COMMON_RETURN_IF_ERROR(expr)

/**
 * @brief Assign value or return error (dcmpix version)
 */
#define DCMPIX_ASSIGN_OR_RETURN(decl, expr) COMMON_ASSIGN_OR_RETURN(decl, expr)
