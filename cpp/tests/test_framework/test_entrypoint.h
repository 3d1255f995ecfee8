// tests/test_framework/test_entrypoint.h
#pragma once

#include "lgtv_base.hpp"
#include <gtest/gtest.h>
/**
 * @file test_entrypoint.h
 * @brief Shared entry point of `lgtv_tests`.
 *
 * `main()` owns one LifecycleGuard with the Logger module for the whole run, so every
 * test may log through the `LOGGER_*` macros and exercise code that does.
 */

// Path of the running test binary.
extern std::string g_self_exe_path;
