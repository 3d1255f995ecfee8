#pragma once

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

namespace lgtv::basics
{

/**
 * @brief Runs a callable when the scope ends unless dismissed.
 *
 * The callable must not throw; the guard is usually the cleanup half of a
 * "register, then roll back on early return" sequence.
 */
template <typename Callable>
    requires std::invocable<Callable &>
class ScopeGuard
{
  public:
    static_assert(!std::is_reference_v<Callable>, "ScopeGuard cannot hold a reference to a callable.");

    explicit ScopeGuard(Callable fn) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(fn))
    {
    }

    ScopeGuard(ScopeGuard &&other) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(other.m_func)), m_active(other.m_active)
    {
        other.dismiss();
    }

    ~ScopeGuard() noexcept
    {
        if (m_active)
        {
            std::invoke(m_func);
        }
    }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    constexpr void dismiss() noexcept { m_active = false; }

  private:
    Callable m_func;
    bool m_active{true};
};

template <typename F> auto make_scope_guard(F &&f) -> ScopeGuard<std::decay_t<F>>
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(f));
}

} // namespace lgtv::basics
