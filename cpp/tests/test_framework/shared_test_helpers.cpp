// tests/test_framework/shared_test_helpers.cpp
/**
 * @file shared_test_helpers.cpp
 * @brief Implements common helper functions and utilities for test cases.
 */

#include "lgtv_base.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

#include "shared_test_helpers.h"

namespace lgtv::tests::helper
{

TempDir::TempDir(const std::string &tag)
{
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = fs::temp_directory_path() /
            fmt::format("lgtv_test_{}_{}_{}", tag, lgtv::platform::get_pid(), stamp);
    fs::create_directories(path_);
}

TempDir::~TempDir()
{
    std::error_code ec;
    fs::remove_all(path_, ec); // best-effort cleanup
}

ScopedEnv::ScopedEnv(std::string name, const std::optional<std::string> &value)
    : name_(std::move(name))
{
    if (const char *old = std::getenv(name_.c_str()); old != nullptr)
    {
        previous_ = old;
    }
    if (value)
    {
        ::setenv(name_.c_str(), value->c_str(), 1);
    }
    else
    {
        ::unsetenv(name_.c_str());
    }
}

ScopedEnv::~ScopedEnv()
{
    if (previous_)
    {
        ::setenv(name_.c_str(), previous_->c_str(), 1);
    }
    else
    {
        ::unsetenv(name_.c_str());
    }
}

bool read_file_contents(const std::string &path, std::string &out)
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
        return false;
    std::ostringstream ss;
    ss << ifs.rdbuf();
    out = ss.str();
    return true;
}

void write_file_contents(const fs::path &path, const std::string &contents)
{
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs << contents;
}

bool wait_for_string_in_file(const fs::path &path, const std::string &expected,
                             std::chrono::milliseconds timeout)
{
    return wait_until(
        [&]
        {
            std::string contents;
            return read_file_contents(path.string(), contents) &&
                   contents.find(expected) != std::string::npos;
        },
        timeout);
}

bool wait_until(const std::function<bool()> &predicate, std::chrono::milliseconds timeout)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (predicate())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

} // namespace lgtv::tests::helper
