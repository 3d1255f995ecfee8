// Tools for formatting and small string helpers shared by the logger and the protocol parsers.
#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "lgtv_core_export.h"

namespace lgtv::format_tools
{

/// @brief Local time as "YYYY-MM-DD HH:MM:SS.uuuuuu".
LGTV_CORE_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/// @brief Strips leading/trailing spaces, tabs, CR and LF.
LGTV_CORE_EXPORT std::string_view trim_whitespace(std::string_view s) noexcept;

/// @brief ASCII case-insensitive equality.
LGTV_CORE_EXPORT bool iequals(std::string_view a, std::string_view b) noexcept;

/// @brief ASCII case-insensitive substring search.
LGTV_CORE_EXPORT bool icontains(std::string_view haystack, std::string_view needle) noexcept;

template <typename... Args>
fmt::memory_buffer make_buffer(fmt::format_string<Args...> fmt_str, Args &&...args)
{
    fmt::memory_buffer mb;
    mb.reserve(128);
    fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
    return mb;
}

constexpr std::string_view filename_only(std::string_view file_path) noexcept
{
    const auto pos = file_path.find_last_of("/\\");
    if (pos == std::string_view::npos)
    {
        return file_path;
    }
    return file_path.substr(pos + 1);
}

} // namespace lgtv::format_tools
