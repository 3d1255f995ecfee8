/*******************************************************************************
 * @file logger.cpp
 * @brief Logger worker: queue, sink ownership and lifecycle hooks.
 ******************************************************************************/

#include <atomic>
#include <condition_variable>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

#include "lgtv_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"

#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
#include "utils/logger_sinks/sink.hpp"

namespace lgtv::utils
{

namespace
{

enum class LoggerState
{
    Uninitialized,
    Running,
    Stopping,
    Stopped
};

std::atomic<LoggerState> g_logger_state{LoggerState::Uninitialized};

constexpr size_t kQueueHardLimit = 2 * Logger::kQueueSoftLimit;

LogMessage stamp(Logger::Level lvl, fmt::memory_buffer &&body)
{
    return LogMessage{.timestamp = std::chrono::system_clock::now(),
                      .process_id = lgtv::platform::get_pid(),
                      .thread_id = lgtv::platform::get_native_thread_id(),
                      .level = static_cast<int>(lvl),
                      .body = std::move(body)};
}

struct SwitchSink
{
    std::unique_ptr<Sink> sink;
    std::promise<bool> done;
};

struct FlushSink
{
    std::promise<void> done;
};

using Command = std::variant<LogMessage, SwitchSink, FlushSink>;

// Wakes whoever waits on a control command that will not run (queue full, stopping,
// or the worker failed half way). Setting an already satisfied promise is harmless.
void release(Command &cmd) noexcept
{
    try
    {
        if (auto *sw = std::get_if<SwitchSink>(&cmd))
        {
            sw->done.set_value(false);
        }
        else if (auto *fl = std::get_if<FlushSink>(&cmd))
        {
            fl->done.set_value();
        }
    }
    catch (const std::future_error &)
    {
    }
}

} // namespace

struct Logger::Impl
{
    std::atomic<Level> level{Level::L_INFO};

    std::mutex mutex;
    std::condition_variable cv;
    std::vector<Command> queue; // guarded by mutex
    size_t dropped{0};          // guarded by mutex
    bool stop_requested{false}; // guarded by mutex

    std::unique_ptr<Sink> sink{std::make_unique<ConsoleSink>()}; // worker-owned while running
    std::thread worker;

    bool push(Command &&cmd);
    void run();
    void execute(Command &cmd);
    void notice(Level lvl, fmt::memory_buffer &&body);
    void stop();
};

bool Logger::Impl::push(Command &&cmd)
{
    {
        std::lock_guard<std::mutex> lock(mutex);
        const bool is_message = std::holds_alternative<LogMessage>(cmd);
        const size_t limit = is_message ? kQueueSoftLimit : kQueueHardLimit;
        if (stop_requested || queue.size() >= limit)
        {
            if (!stop_requested)
            {
                ++dropped;
            }
            release(cmd);
            return false;
        }
        queue.push_back(std::move(cmd));
    }
    cv.notify_one();
    return true;
}

void Logger::Impl::notice(Level lvl, fmt::memory_buffer &&body)
{
    if (sink)
    {
        sink->write(stamp(lvl, std::move(body)));
    }
}

void Logger::Impl::execute(Command &cmd)
{
    if (auto *msg = std::get_if<LogMessage>(&cmd))
    {
        // The level may have been raised after the message was queued.
        if (msg->level >= static_cast<int>(level.load(std::memory_order_relaxed)))
        {
            sink->write(*msg);
        }
    }
    else if (auto *sw = std::get_if<SwitchSink>(&cmd))
    {
        const std::string from = sink->description();
        notice(Level::L_SYSTEM, format_tools::make_buffer("Switching log sink to: {}",
                                                          sw->sink->description()));
        sink->flush();
        sink = std::move(sw->sink);
        notice(Level::L_SYSTEM, format_tools::make_buffer("Log sink switched from: {}", from));
        sw->done.set_value(true);
    }
    else if (auto *fl = std::get_if<FlushSink>(&cmd))
    {
        sink->flush();
        fl->done.set_value();
    }
}

void Logger::Impl::run()
{
    std::vector<Command> batch;
    for (;;)
    {
        size_t dropped_now = 0;
        bool last_batch = false;
        {
            std::unique_lock<std::mutex> lock(mutex);
            cv.wait(lock, [this] { return !queue.empty() || stop_requested; });
            batch.swap(queue);
            dropped_now = std::exchange(dropped, 0);
            // Nothing is queued once stop_requested is set, so this batch is the last.
            last_batch = stop_requested;
        }

        for (auto &cmd : batch)
        {
            try
            {
                execute(cmd);
            }
            catch (const std::exception &e)
            {
                LGTV_DEBUG("Logger: sink failure: {}", e.what());
                release(cmd);
            }
        }
        batch.clear();

        try
        {
            if (dropped_now > 0)
            {
                notice(Level::L_WARNING,
                       format_tools::make_buffer("Logger queue overflow: {} messages dropped.",
                                                 dropped_now));
            }
            if (last_batch)
            {
                notice(Level::L_SYSTEM, format_tools::make_buffer("Logger is shutting down."));
                sink->flush();
            }
        }
        catch (const std::exception &e)
        {
            LGTV_DEBUG("Logger: sink failure: {}", e.what());
        }
        if (last_batch)
        {
            return;
        }
    }
}

void Logger::Impl::stop()
{
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (stop_requested)
        {
            return;
        }
        stop_requested = true;
    }
    cv.notify_one();
    if (worker.joinable())
    {
        worker.join();
    }
}

// ============================================================================
// Public API
// ============================================================================

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}
Logger::~Logger() = default;

Logger &Logger::instance()
{
    static Logger instance;
    return instance;
}

bool Logger::lifecycle_initialized() noexcept
{
    return g_logger_state.load(std::memory_order_acquire) == LoggerState::Running;
}

bool Logger::parse_level(std::string_view name, Level &out) noexcept
{
    struct Entry
    {
        std::string_view name;
        Level level;
    };
    static constexpr Entry kLevels[] = {
        {"trace", Level::L_TRACE},     {"debug", Level::L_DEBUG}, {"info", Level::L_INFO},
        {"warn", Level::L_WARNING},    {"warning", Level::L_WARNING},
        {"error", Level::L_ERROR},     {"system", Level::L_SYSTEM},
    };
    for (const auto &e : kLevels)
    {
        if (format_tools::iequals(name, e.name))
        {
            out = e.level;
            return true;
        }
    }
    return false;
}

bool Logger::set_console()
{
    if (!lifecycle_initialized())
        return false;
    SwitchSink cmd{std::make_unique<ConsoleSink>(), {}};
    auto done = cmd.done.get_future();
    pImpl->push(std::move(cmd));
    return done.get();
}

bool Logger::set_logfile(const std::string &utf8_path)
{
    if (!lifecycle_initialized())
        return false;
    std::unique_ptr<Sink> file;
    try
    {
        file = std::make_unique<FileSink>(utf8_path);
    }
    catch (const std::exception &e)
    {
        log_fmt<Level::L_SYSTEM>("Logger: cannot log to '{}': {}", utf8_path, e.what());
        return false;
    }
    SwitchSink cmd{std::move(file), {}};
    auto done = cmd.done.get_future();
    pImpl->push(std::move(cmd));
    return done.get();
}

void Logger::flush()
{
    if (!lifecycle_initialized())
        return;
    FlushSink cmd;
    auto done = cmd.done.get_future();
    pImpl->push(std::move(cmd));
    done.get();
}

void Logger::set_level(Level lvl)
{
    pImpl->level.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    return pImpl->level.load(std::memory_order_relaxed);
}

bool Logger::should_log(Level lvl) const noexcept
{
    return lifecycle_initialized() &&
           static_cast<int>(lvl) >= static_cast<int>(pImpl->level.load(std::memory_order_relaxed));
}

void Logger::enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept
{
    if (!lifecycle_initialized())
        return;
    try
    {
        pImpl->push(stamp(lvl, std::move(body)));
    }
    catch (const std::exception &)
    {
        // Out of memory while queueing; the message is lost.
    }
}

// ── Lifecycle callbacks ──

void do_logger_startup(const char *)
{
    auto &impl = *Logger::instance().pImpl;
    if (!impl.worker.joinable())
    {
        impl.worker = std::thread([&impl] { impl.run(); });
    }
    g_logger_state.store(LoggerState::Running, std::memory_order_release);
}

void do_logger_shutdown(const char *)
{
    LoggerState expected = LoggerState::Running;
    if (g_logger_state.compare_exchange_strong(expected, LoggerState::Stopping,
                                               std::memory_order_acq_rel))
    {
        Logger::instance().pImpl->stop();
        g_logger_state.store(LoggerState::Stopped, std::memory_order_release);
    }
}

ModuleDef Logger::GetLifecycleModule()
{
    ModuleDef module("lgtv::utils::Logger");
    module.set_startup(&do_logger_startup);
    module.set_shutdown(&do_logger_shutdown, std::chrono::milliseconds(5000));
    return module;
}

} // namespace lgtv::utils
