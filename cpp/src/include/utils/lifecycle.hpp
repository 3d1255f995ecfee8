/*******************************************************************************
 * @file lifecycle.hpp
 * @brief Ordered startup and shutdown of process-wide services.
 *
 * Modules (e.g. the Logger) are registered as `ModuleDef`s, started in registration
 * order by `InitializeApp()` and shut down in reverse order by `FinalizeApp()`, each
 * shutdown bounded by its own timeout. `LifecycleGuard` ties both calls to a scope:
 *
 * ```cpp
 * int main()
 * {
 *     lgtv::utils::LifecycleGuard guard(
 *         lgtv::utils::MakeModDefList(lgtv::utils::Logger::GetLifecycleModule()));
 *     ...
 * }
 * ```
 ******************************************************************************/
#pragma once

#include <atomic>
#include <memory>
#include <source_location>
#include <type_traits>
#include <vector>

#include "lgtv_core_export.h"
#include "utils/debug_info.hpp"
#include "utils/module_def.hpp"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace lgtv::utils
{

class LifecycleManagerImpl;

// Call-site: MakeModDefList(std::move(a), std::move(b)) or MakeModDefList(MyFactory(), ...)
template <typename... Mods> inline std::vector<ModuleDef> MakeModDefList(Mods &&...mods)
{
    static_assert((std::is_same_v<std::decay_t<Mods>, ModuleDef> && ...),
                  "MakeModDefList: all arguments must be ModuleDef (rvalues or prvalues)");
    std::vector<ModuleDef> modules;
    modules.reserve(sizeof...(mods));
    (modules.emplace_back(std::forward<Mods>(mods)), ...);
    return modules;
}

class LGTV_CORE_EXPORT LifecycleManager
{
  public:
    static LifecycleManager &instance();

    /**
     * @brief Registers a module. Must happen before initialize().
     * @throws std::logic_error if the application is already initialized.
     * @throws std::runtime_error if a module with the same name is already registered.
     */
    void register_module(ModuleDef &&module_def);

    /**
     * @brief Starts all registered modules in registration order.
     */
    void initialize(std::source_location loc);

    /// @brief Shuts modules down in reverse startup order. Idempotent.
    void finalize(std::source_location loc);

    bool is_initialized() const noexcept;
    bool is_finalized() const noexcept;

    LifecycleManager(const LifecycleManager &) = delete;
    LifecycleManager &operator=(const LifecycleManager &) = delete;

  private:
    LifecycleManager();
    ~LifecycleManager();
    std::unique_ptr<LifecycleManagerImpl> pImpl;
};

inline void RegisterModule(ModuleDef &&module_def)
{
    ::lgtv::utils::LifecycleManager::instance().register_module(std::move(module_def));
}

inline bool IsAppInitialized()
{
    return LifecycleManager::instance().is_initialized();
}

inline void InitializeApp(std::source_location loc = std::source_location::current())
{
    LifecycleManager::instance().initialize(loc);
}

inline void FinalizeApp(std::source_location loc = std::source_location::current())
{
    LifecycleManager::instance().finalize(loc);
}

class LifecycleGuard
{
  public:
    explicit LifecycleGuard(std::vector<ModuleDef> &&modules,
                            std::source_location loc = std::source_location::current())
        : m_loc(loc)
    {
        LGTV_DEBUG("[LGTV_LifeCycle] LifecycleGuard constructed in function {}. ({}:{})",
                   m_loc.function_name(), lgtv::format_tools::filename_only(m_loc.file_name()),
                   m_loc.line());
        init_owner_if_first(std::move(modules));
    }

    LifecycleGuard(const LifecycleGuard &) = delete;
    LifecycleGuard &operator=(const LifecycleGuard &) = delete;
    LifecycleGuard(LifecycleGuard &&) = delete;
    LifecycleGuard &operator=(LifecycleGuard &&) = delete;

    /**
     * @brief Finalizes the application if this guard is the owner.
     *
     * Objects that log from their destructors must be destroyed before the guard.
     */
    ~LifecycleGuard() noexcept
    {
        if (m_is_owner)
        {
            try
            {
                ::lgtv::utils::FinalizeApp(m_loc);
            }
            catch (const std::exception &e)
            {
                fmt::print(stderr, "[LGTV_LifeCycle] FinalizeApp failed: {}\n", e.what());
            }
        }
    }

    bool is_owner() const noexcept { return m_is_owner; }

  private:
    static std::atomic_bool &owner_flag()
    {
        static std::atomic_bool flag{false};
        return flag;
    }

    void init_owner_if_first(std::vector<ModuleDef> &&modules)
    {
        bool expected = false;
        if (owner_flag().compare_exchange_strong(expected, true, std::memory_order_acq_rel))
        {
            m_is_owner = true;
            for (auto &m : modules)
            {
                ::lgtv::utils::RegisterModule(std::move(m));
            }
            ::lgtv::utils::InitializeApp(m_loc);
        }
        else
        {
            LGTV_DEBUG("[LGTV_LifeCycle] WARNING: LifecycleGuard constructed but an owner already "
                       "exists. Supplied modules were ignored. ({}:{})",
                       lgtv::format_tools::filename_only(m_loc.file_name()), m_loc.line());
        }
    }

    std::source_location m_loc;
    bool m_is_owner{false};
};

} // namespace lgtv::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
