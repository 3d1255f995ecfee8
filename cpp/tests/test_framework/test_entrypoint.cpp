// tests/test_framework/test_entrypoint.cpp
/**
 * @file test_entrypoint.cpp
 * @brief Main entry point for the test executable.
 *
 * Starts the Logger through a LifecycleGuard before GoogleTest runs and finalizes it
 * after the last test. The log goes to stderr at WARNING unless `LGTV_TEST_LOG_LEVEL`
 * names another level (e.g. `LGTV_TEST_LOG_LEVEL=debug ./lgtv_tests`).
 */
#include "test_entrypoint.h"
#include "lgtv_service.hpp"

#include <cstdlib>

std::string g_self_exe_path;

using namespace lgtv::utils;

int main(int argc, char **argv)
{
    g_self_exe_path = (argc >= 1) ? argv[0] : "";
    ::testing::InitGoogleTest(&argc, argv);

    LifecycleGuard test_lifecycle(MakeModDefList(Logger::GetLifecycleModule()));

    Logger::Level level = Logger::Level::L_WARNING;
    if (const char *env = std::getenv("LGTV_TEST_LOG_LEVEL"); env != nullptr)
    {
        if (!Logger::parse_level(env, level))
        {
            fmt::print(stderr, "LGTV_TEST_LOG_LEVEL: unknown level '{}'\n", env);
        }
    }
    Logger::instance().set_level(level);

    const int rc = RUN_ALL_TESTS();
    Logger::instance().flush();
    return rc;
}
