/*******************************************************************************
 * @file logger.hpp
 * @brief Asynchronous, thread-safe logging utility.
 *
 * **Command-Queue Pattern**
 * `LOGGER_INFO(...)` formats on the calling thread and queues the message. One worker
 * thread owns the active sink (console or file): it writes queued messages and runs
 * control commands (sink switch, flush) in the order they were queued, so protocol
 * threads (the WebSocket I/O thread, the session reader) never block on console or
 * file I/O.
 *
 * Above `kQueueSoftLimit` queued entries new messages are dropped; control commands
 * are refused only at twice that. Drops are summarized in the log.
 *
 * **Lifecycle**
 * The worker is started by the module returned from `GetLifecycleModule()`. Before
 * that, and after shutdown, the `LOGGER_*` macros are silent no-ops.
 *
 * **Usage**
 * ```cpp
 * LOGGER_INFO("Session: connected to {}:{}", host, port);
 * Logger::instance().set_logfile("/tmp/lgtv.log");
 * Logger::instance().set_level(Logger::Level::L_DEBUG);
 * ```
 ******************************************************************************/

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "lgtv_core_export.h"
#include "utils/module_def.hpp"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace lgtv::utils
{

class LGTV_CORE_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5, ///< Logger's own notices (sink switches, drops); never filtered.
    };

    static constexpr size_t kQueueSoftLimit = 10000;

    static Logger &instance();

    /// @brief Lifecycle module that starts/stops the worker thread.
    static ModuleDef GetLifecycleModule();

    /// @brief True once the lifecycle module has started the logger.
    static bool lifecycle_initialized() noexcept;

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;

    ~Logger();

    // Sink switches run on the worker; these calls block until it has done so.

    /// @brief Switch logging to stderr.
    bool set_console();

    /**
     * @brief Switch logging to a file (appending).
     * @return false if the file could not be opened; the previous sink stays active and
     *         records why.
     */
    bool set_logfile(const std::string &utf8_path);

    /// @brief Blocks until all messages queued before the call are written and flushed.
    void flush();

    void set_level(Level lvl);
    Level level() const;

    /// @brief Parses "trace", "debug", "info", "warn"/"warning", "error", "system".
    static bool parse_level(std::string_view name, Level &out) noexcept;

    template <Level lvl, typename... Args>
    void log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept;

  private:
    Logger();

    struct Impl;
    std::unique_ptr<Impl> pImpl;

    friend void do_logger_startup(const char *);
    friend void do_logger_shutdown(const char *);

    bool should_log(Level lvl) const noexcept;
    void enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept;
};

// --- Compile-Time Log Level ---
#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0 // 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error
#endif

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) >= LOGGER_COMPILE_LEVEL)
    {
        if (!should_log(lvl))
            return;

        fmt::memory_buffer mb;
        try
        {
            fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
        }
        catch (const std::exception &ex)
        {
            mb.clear();
            fmt::format_to(std::back_inserter(mb), "[FORMAT ERROR] {}", ex.what());
        }
        enqueue_log(lvl, std::move(mb));
    }
}

} // namespace lgtv::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

#define LOGGER_DEBUG(fmt, ...)                                                                     \
    ::lgtv::utils::Logger::instance().log_fmt<::lgtv::utils::Logger::Level::L_DEBUG>(              \
        FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...)                                                                      \
    ::lgtv::utils::Logger::instance().log_fmt<::lgtv::utils::Logger::Level::L_INFO>(               \
        FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...)                                                                      \
    ::lgtv::utils::Logger::instance().log_fmt<::lgtv::utils::Logger::Level::L_WARNING>(            \
        FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...)                                                                     \
    ::lgtv::utils::Logger::instance().log_fmt<::lgtv::utils::Logger::Level::L_ERROR>(              \
        FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
