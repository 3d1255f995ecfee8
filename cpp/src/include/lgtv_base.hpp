#pragma once
/**
 * @file lgtv_base.hpp
 * @brief Base umbrella header: platform, standard headers, fmt and the small utilities
 *        every translation unit uses.
 */
#include "lgtv_platform.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "utils/debug_info.hpp"
#include "utils/format_tools.hpp"
#include "utils/module_def.hpp"
#include "utils/result.hpp"
#include "utils/scope_guard.hpp"
