#pragma once
/**
 * @file module_def.hpp
 * @brief Module definition for LifecycleManager registration.
 */
#include "lgtv_core_export.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string_view>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace lgtv::utils
{

class ModuleDefImpl;
class LifecycleManager;

/**
 * @brief Startup/shutdown callback. `arg` is the string given at registration, or
 *        nullptr when none was supplied.
 */
using LifecycleCallback = void (*)(const char *arg);

/**
 * @class ModuleDef
 * @brief Builder for a lifecycle module: a name and the startup/shutdown callbacks.
 *
 * Movable, not copyable. Ownership passes to the LifecycleManager on registration.
 */
class LGTV_CORE_EXPORT ModuleDef
{
  public:
    static constexpr size_t MAX_MODULE_NAME_LEN = 256;
    static constexpr size_t MAX_CALLBACK_PARAM_STRLEN = 1024;

    /**
     * @throws std::invalid_argument if `name` is empty.
     * @throws std::length_error     if `name.size() > MAX_MODULE_NAME_LEN`.
     */
    explicit ModuleDef(std::string_view name);
    ~ModuleDef();

    ModuleDef(ModuleDef &&other) noexcept;
    ModuleDef &operator=(ModuleDef &&other) noexcept;
    ModuleDef(const ModuleDef &) = delete;
    ModuleDef &operator=(const ModuleDef &) = delete;

    void set_startup(LifecycleCallback startup_func);
    void set_startup(LifecycleCallback startup_func, std::string_view arg);

    /**
     * @param timeout Maximum time allowed for the callback. Zero waits forever.
     */
    void set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout);
    void set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout,
                      std::string_view arg);

  private:
    friend class LifecycleManager;
    std::unique_ptr<ModuleDefImpl> pImpl;
};

} // namespace lgtv::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
