#pragma once

#include <concepts>
#include <utility>

namespace lum
{
    // calls `on_exit` when the guard goes out of scope, whether the scope is
    // left normally or by stack unwinding
    template<std::invocable Callback>
    class [[nodiscard]] ScopeExit final {
    public:
        explicit ScopeExit(Callback on_exit) :
            on_exit_{std::move(on_exit)}
        {}
        ScopeExit(const ScopeExit&) = delete;
        ScopeExit(ScopeExit&&) noexcept = delete;
        ScopeExit& operator=(const ScopeExit&) = delete;
        ScopeExit& operator=(ScopeExit&&) noexcept = delete;
        ~ScopeExit() noexcept { on_exit_(); }

    private:
        Callback on_exit_;
    };
}
