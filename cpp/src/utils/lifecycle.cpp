/*******************************************************************************
 * @file lifecycle.cpp
 * @brief Implementation of the LifecycleManager and ModuleDef.
 *
 * Modules start in registration order. Shutdown callbacks run on a helper thread with
 * a real deadline: on timeout the thread is detached and finalization continues with
 * the next module.
 ******************************************************************************/
#include "lgtv_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/module_def.hpp"

#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace
{

void validate_name(std::string_view name, const char *param_name)
{
    if (name.empty())
    {
        throw std::invalid_argument(fmt::format("ModuleDef: {} must not be empty", param_name));
    }
    if (name.size() > lgtv::utils::ModuleDef::MAX_MODULE_NAME_LEN)
    {
        throw std::length_error(fmt::format("ModuleDef: {} exceeds {} characters", param_name,
                                            lgtv::utils::ModuleDef::MAX_MODULE_NAME_LEN));
    }
}

void validate_arg(std::string_view arg)
{
    if (arg.size() > lgtv::utils::ModuleDef::MAX_CALLBACK_PARAM_STRLEN)
    {
        throw std::length_error(fmt::format("ModuleDef: callback argument exceeds {} characters",
                                            lgtv::utils::ModuleDef::MAX_CALLBACK_PARAM_STRLEN));
    }
}

struct ShutdownOutcome
{
    bool success;
    bool timed_out;
    std::string exception_msg;
};

ShutdownOutcome timed_shutdown(const std::function<void()> &func,
                               std::chrono::milliseconds timeout)
{
    if (!func)
    {
        return {true, false, {}};
    }

    // Shared so a detached thread never touches a dead stack frame.
    struct State
    {
        std::atomic<bool> completed{false};
        std::string error;
    };
    auto state = std::make_shared<State>();
    std::thread thread(
        [func, state]()
        {
            try
            {
                func();
            }
            catch (const std::exception &e)
            {
                state->error = e.what();
            }
            catch (...)
            {
                state->error = "unknown exception";
            }
            state->completed.store(true, std::memory_order_release);
        });

    if (timeout.count() > 0)
    {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!state->completed.load(std::memory_order_acquire))
        {
            if (std::chrono::steady_clock::now() >= deadline)
            {
                thread.detach();
                return {false, true, {}};
            }
            constexpr std::chrono::milliseconds kPollInterval(10);
            std::this_thread::sleep_for(kPollInterval);
        }
    }
    thread.join();
    if (!state->error.empty())
    {
        return {false, false, state->error};
    }
    return {true, false, {}};
}

} // namespace

namespace lgtv::utils
{

struct CallbackDef
{
    LifecycleCallback func{nullptr};
    std::string arg;
    bool has_arg{false};
    std::chrono::milliseconds timeout{0};

    void invoke() const
    {
        if (func)
        {
            func(has_arg ? arg.c_str() : nullptr);
        }
    }
};

class ModuleDefImpl
{
  public:
    std::string name;
    CallbackDef startup;
    CallbackDef shutdown;
};

// ============================================================================
// ModuleDef
// ============================================================================

ModuleDef::ModuleDef(std::string_view name) : pImpl(std::make_unique<ModuleDefImpl>())
{
    validate_name(name, "module name");
    pImpl->name = std::string(name);
}

ModuleDef::~ModuleDef() = default;
ModuleDef::ModuleDef(ModuleDef &&other) noexcept = default;
ModuleDef &ModuleDef::operator=(ModuleDef &&other) noexcept = default;

void ModuleDef::set_startup(LifecycleCallback startup_func)
{
    pImpl->startup = CallbackDef{startup_func, {}, false, {}};
}

void ModuleDef::set_startup(LifecycleCallback startup_func, std::string_view arg)
{
    validate_arg(arg);
    pImpl->startup = CallbackDef{startup_func, std::string(arg), true, {}};
}

void ModuleDef::set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout)
{
    pImpl->shutdown = CallbackDef{shutdown_func, {}, false, timeout};
}

void ModuleDef::set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout,
                             std::string_view arg)
{
    validate_arg(arg);
    pImpl->shutdown = CallbackDef{shutdown_func, std::string(arg), true, timeout};
}

// ============================================================================
// LifecycleManagerImpl
// ============================================================================

class LifecycleManagerImpl
{
  public:
    std::vector<ModuleDefImpl> registered;
    std::vector<ModuleDefImpl> started; // startup order
    std::mutex mutex;
    std::atomic<bool> initialized{false};
    std::atomic<bool> finalized{false};
};

// ============================================================================
// LifecycleManager
// ============================================================================

LifecycleManager::LifecycleManager() : pImpl(std::make_unique<LifecycleManagerImpl>()) {}
LifecycleManager::~LifecycleManager() = default;

LifecycleManager &LifecycleManager::instance()
{
    static LifecycleManager instance;
    return instance;
}

void LifecycleManager::register_module(ModuleDef &&module_def)
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (pImpl->initialized.load(std::memory_order_acquire))
    {
        throw std::logic_error("LifecycleManager: cannot register module '" +
                               module_def.pImpl->name + "' after initialization");
    }
    for (const auto &existing : pImpl->registered)
    {
        if (existing.name == module_def.pImpl->name)
        {
            throw std::runtime_error("Duplicate module name: " + existing.name);
        }
    }
    pImpl->registered.push_back(std::move(*module_def.pImpl));
}

void LifecycleManager::initialize(std::source_location loc)
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (pImpl->initialized.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }
    LGTV_DEBUG("[LGTV_LifeCycle] Initializing application from {} ({}:{}).", loc.function_name(),
               format_tools::filename_only(loc.file_name()), loc.line());

    auto ordered = std::move(pImpl->registered);
    pImpl->registered.clear();
    for (auto &mod : ordered)
    {
        LGTV_DEBUG("[LGTV_LifeCycle] Starting module '{}'", mod.name);
        mod.startup.invoke();
        pImpl->started.push_back(std::move(mod));
    }
}

void LifecycleManager::finalize(std::source_location loc)
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (!pImpl->initialized.load(std::memory_order_acquire) ||
        pImpl->finalized.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }
    LGTV_DEBUG("[LGTV_LifeCycle] Finalizing application from {} ({}:{}).", loc.function_name(),
               format_tools::filename_only(loc.file_name()), loc.line());
    (void)loc;

    for (auto it = pImpl->started.rbegin(); it != pImpl->started.rend(); ++it)
    {
        const CallbackDef shutdown = it->shutdown;
        auto outcome = timed_shutdown([shutdown]() { shutdown.invoke(); }, shutdown.timeout);
        if (outcome.timed_out)
        {
            fmt::print(stderr, "[LGTV_LifeCycle] Module '{}' shutdown TIMEOUT ({}ms)! Thread detached.\n",
                       it->name, shutdown.timeout.count());
        }
        else if (!outcome.success)
        {
            fmt::print(stderr, "[LGTV_LifeCycle] Module '{}' shutdown failed: {}\n", it->name,
                       outcome.exception_msg);
        }
    }
    pImpl->started.clear();
}

bool LifecycleManager::is_initialized() const noexcept
{
    return pImpl->initialized.load(std::memory_order_acquire);
}

bool LifecycleManager::is_finalized() const noexcept
{
    return pImpl->finalized.load(std::memory_order_acquire);
}

} // namespace lgtv::utils
