#pragma once
/**
 * @file debug_info.hpp
 * @brief Fatal-error and debug-print helpers that bypass the Logger.
 *
 * `LGTV_PANIC` is reserved for broken internal invariants; recoverable failures are
 * reported through `Result`. `LGTV_DEBUG` compiles to nothing unless
 * `LGTV_ENABLE_DEBUG_MESSAGES` is defined.
 */
#include <cstdio>
#include <cstdlib>
#include <source_location>
#include <string>

#include <fmt/format.h>

#include "lgtv_core_export.h"
#include "utils/format_tools.hpp"

inline std::string SRCLOC_TO_STR(std::source_location loc)
{
    return fmt::format("{}:{}:{}", lgtv::format_tools::filename_only(loc.file_name()), loc.line(),
                       loc.function_name());
}

namespace lgtv::debug
{

/// @brief Prints the current call stack to stderr (best effort).
LGTV_CORE_EXPORT void print_stack_trace() noexcept;

template <typename... Args>
[[noreturn]] inline void panic(std::source_location loc, fmt::format_string<Args...> fmt_str,
                               Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[PANIC] {} -- {}\n", SRCLOC_TO_STR(loc), body);
    }
    catch (const fmt::format_error &e)
    {
        fmt::print(stderr, "[PANIC] {} -- FATAL FORMAT ERROR WHEN PANIC: '{}'\n",
                   SRCLOC_TO_STR(loc), e.what());
    }
    std::fflush(stderr);
    print_stack_trace();
    std::abort();
}

template <typename... Args>
inline void debug_msg(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        fmt::print(stderr, "[DBG]  {}\n", fmt::format(fmt_str, std::forward<Args>(args)...));
    }
    catch (const fmt::format_error &e)
    {
        fmt::print(stderr, "[DBG]  FATAL FORMAT ERROR DURING DEBUG_MSG: '{}'\n", e.what());
        std::fflush(stderr);
    }
}

} // namespace lgtv::debug

#ifndef LGTV_PANIC
#define LGTV_PANIC(fmt, ...)                                                                       \
    ::lgtv::debug::panic(std::source_location::current(), FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#endif

#ifndef LGTV_DEBUG
#if defined(LGTV_ENABLE_DEBUG_MESSAGES)
#define LGTV_DEBUG(fmt, ...) ::lgtv::debug::debug_msg(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#else
#define LGTV_DEBUG(fmt, ...)                                                                       \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif
