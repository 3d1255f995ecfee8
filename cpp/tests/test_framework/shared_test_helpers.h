// tests/test_framework/shared_test_helpers.h
#pragma once

#include "lgtv_platform.hpp"

#include <filesystem>
namespace fs = std::filesystem;

/**
 * @file shared_test_helpers.h
 * @brief Helpers shared by the test layers: temporary directories, environment
 *        overrides, file polling and a thread racer for concurrency tests.
 */

#include "gtest/gtest.h"

#include "lgtv_service.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace lgtv::tests::helper
{

/**
 * @class TempDir
 * @brief Unique directory under the system temp path, removed with its contents on
 *        destruction.
 */
class TempDir
{
  public:
    explicit TempDir(const std::string &tag);
    ~TempDir();

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const fs::path &path() const noexcept { return path_; }
    fs::path operator/(const std::string &name) const { return path_ / name; }

  private:
    fs::path path_;
};

/**
 * @class ScopedEnv
 * @brief Sets (or unsets, for std::nullopt) an environment variable and restores the
 *        previous value on destruction.
 */
class ScopedEnv
{
  public:
    ScopedEnv(std::string name, const std::optional<std::string> &value);
    ~ScopedEnv();

    ScopedEnv(const ScopedEnv &) = delete;
    ScopedEnv &operator=(const ScopedEnv &) = delete;

  private:
    std::string name_;
    std::optional<std::string> previous_;
};

/**
 * @brief Reads the entire contents of a file into a string.
 * @return True if the file was read successfully, false otherwise.
 */
bool read_file_contents(const std::string &path, std::string &out);

/// @brief Writes `contents` to `path`, replacing the file.
void write_file_contents(const fs::path &path, const std::string &contents);

/**
 * @brief Polls a file until the expected string is found or the timeout is reached.
 * @return True if the string was found.
 */
bool wait_for_string_in_file(const fs::path &path, const std::string &expected,
                             std::chrono::milliseconds timeout = std::chrono::seconds(5));

/// @brief Polls `predicate` every 5ms; true as soon as it holds.
bool wait_until(const std::function<bool()> &predicate,
                std::chrono::milliseconds timeout = std::chrono::seconds(5));

// ============================================================================
// ThreadRacer
// ============================================================================

/**
 * @brief Runs N threads simultaneously to test concurrent behavior.
 *
 * All threads start at the same time. Any exception thrown by a thread is captured
 * and reported through exceptions().
 */
class ThreadRacer
{
  public:
    explicit ThreadRacer(int n_threads) : n_threads_(n_threads) {}

    /// @return true if all threads completed without throwing.
    template <typename F> bool race(F fn)
    {
        exceptions_.clear();
        exceptions_.resize(static_cast<size_t>(n_threads_));

        std::atomic<int> ready_count{0};
        std::atomic<bool> start_flag{false};

        std::vector<std::thread> threads;
        threads.reserve(static_cast<size_t>(n_threads_));

        for (int i = 0; i < n_threads_; ++i)
        {
            threads.emplace_back(
                [&, i]()
                {
                    ready_count.fetch_add(1, std::memory_order_release);
                    while (!start_flag.load(std::memory_order_acquire))
                        std::this_thread::yield();
                    try
                    {
                        fn(i);
                    }
                    catch (...)
                    {
                        exceptions_[static_cast<size_t>(i)] = std::current_exception();
                    }
                });
        }

        while (ready_count.load(std::memory_order_acquire) < n_threads_)
            std::this_thread::yield();
        start_flag.store(true, std::memory_order_release);

        for (auto &t : threads)
            t.join();

        return std::all_of(exceptions_.begin(), exceptions_.end(),
                           [](const std::exception_ptr &p) { return p == nullptr; });
    }

    const std::vector<std::exception_ptr> &exceptions() const { return exceptions_; }

  private:
    int n_threads_;
    std::vector<std::exception_ptr> exceptions_;
};

} // namespace lgtv::tests::helper
