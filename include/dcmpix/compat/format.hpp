/**
 * @file format.hpp
 * @brief std::format, or fmt::format where the standard library lacks it
 *
 * Usage:
 *   #include <dcmpix/compat/format.hpp>
 *   auto s = dcmpix::compat::format("Frame {} of {}", index, count);
 */

#pragma once

#include <version>

#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
#define DCMPIX_HAS_STD_FORMAT 1
#include <format>
#else
#define DCMPIX_HAS_STD_FORMAT 0
#include <fmt/format.h>
#endif

namespace dcmpix::compat {

#if DCMPIX_HAS_STD_FORMAT
using std::format;
template <typename... Args>
using format_string = std::format_string<Args...>;
#else
using fmt::format;
template <typename... Args>
using format_string = fmt::format_string<Args...>;
#endif

}  // namespace dcmpix::compat
