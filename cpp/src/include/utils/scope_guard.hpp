#pragma once

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

namespace nodebus::basics
{

/**
 * @class ScopeGuard
 * @brief An RAII-style guard that executes a callable on scope exit.
 *
 * The cleanup runs whether the scope is left normally or by an exception. The guard is
 * movable but not copyable.
 *
 * The callable must be `noexcept`: a cleanup action that can fail has nowhere to report
 * the failure from a destructor, so such actions must handle their own errors.
 *
 * @code
 *  instance.m_locked = true;
 *  auto unlock = nodebus::basics::make_scope_guard([&]() noexcept { instance.m_locked = false; });
 *  pump_until_resolved();   // may throw; the lock is still released
 * @endcode
 */
template <typename Callable>
requires std::invocable<Callable &>
class ScopeGuard
{
  public:
    static_assert(!std::is_reference_v<Callable>,
                  "ScopeGuard cannot hold a reference to a callable.");
    static_assert(std::is_nothrow_invocable_v<Callable &>,
                  "ScopeGuard's callable must be noexcept.");

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

    [[nodiscard]] explicit operator bool() const noexcept { return m_active; }

    constexpr void dismiss() noexcept { m_active = false; }

    /// Runs the cleanup now (at most once).
    void invoke() noexcept
    {
        if (m_active)
        {
            m_active = false;
            std::invoke(m_func);
        }
    }

  private:
    Callable m_func;
    bool m_active{true};
};

template <typename Callable>
[[nodiscard]] auto make_scope_guard(Callable &&fn) noexcept(
    std::is_nothrow_constructible_v<std::decay_t<Callable>, Callable &&>)
{
    return ScopeGuard<std::decay_t<Callable>>(std::forward<Callable>(fn));
}

} // namespace nodebus::basics
