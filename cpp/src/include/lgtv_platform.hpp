#pragma once
/**
 * @file lgtv_platform.hpp
 * @brief Platform detection macros and small OS helpers (process/thread ids).
 *
 * Define one of PLATFORM_LINUX / PLATFORM_APPLE / PLATFORM_FREEBSD / PLATFORM_WIN64 from the
 * build system to force a platform; otherwise it is detected from compiler macros.
 */
#include <cstddef>
#include <cstdint>
#include <string>

#if defined(PLATFORM_WIN64)
#define LGTV_PLATFORM_WIN64 1
#elif defined(PLATFORM_APPLE)
#define LGTV_PLATFORM_APPLE 1
#elif defined(PLATFORM_FREEBSD)
#define LGTV_PLATFORM_FREEBSD 1
#elif defined(PLATFORM_LINUX)
#define LGTV_PLATFORM_LINUX 1
#else
// Fallback detection
#if defined(_WIN64)
#define LGTV_PLATFORM_WIN64 1
#elif defined(__APPLE__) && defined(__MACH__)
#define LGTV_PLATFORM_APPLE 1
#elif defined(__FreeBSD__)
#define LGTV_PLATFORM_FREEBSD 1
#elif defined(__linux__)
#define LGTV_PLATFORM_LINUX 1
#else
#define LGTV_PLATFORM_UNKNOWN 1
#endif
#endif

#if defined(LGTV_PLATFORM_WIN64)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#define LGTV_IS_WINDOWS 1
#elif defined(LGTV_PLATFORM_APPLE) || defined(LGTV_PLATFORM_FREEBSD) ||                            \
    defined(LGTV_PLATFORM_LINUX)
#define LGTV_IS_POSIX 1
#endif

// --- Require C++20 or later --------------------------------------------------
#if defined(_MSC_VER)
#if !defined(_MSVC_LANG) || (_MSVC_LANG < 202002L)
#error "This project requires C++20 or later. Please compile with /std:c++20 or newer (MSVC)."
#endif
#else
#if __cplusplus < 202002L
#error "This project requires C++20 or later. Please compile with -std=c++20 or newer."
#endif
#endif

#include "lgtv_core_export.h"

namespace lgtv::platform
{

/// @brief Current process id.
LGTV_CORE_EXPORT uint64_t get_pid();

/// @brief OS-level id of the calling thread (gettid on Linux).
LGTV_CORE_EXPORT uint64_t get_native_thread_id() noexcept;

} // namespace lgtv::platform
