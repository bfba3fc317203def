#pragma once

#include "fd.hpp"

#include <array>
#include <coroutine>
#include <cstddef>
#include <cstdint>
#include <ext/coroutine>
#include <memory>
#include <sys/epoll.h>

namespace localsock {
    class runtime {
        static constexpr auto batch = 64;

        const fd epoll;
        std::array<epoll_event, batch> ready;
        std::size_t waiting = 0;
    public:
        class watch;

        class readiness {
            watch& target;
            readiness*& slot;
            std::coroutine_handle<> coroutine;
            bool canceled = false;

            friend class watch;

            auto wake(bool cancel) -> void;
        public:
            readiness(watch& target, readiness*& slot) noexcept;

            readiness(const readiness&) = delete;

            ~readiness();

            auto operator=(const readiness&) -> readiness& = delete;

            auto await_ready() const noexcept -> bool { return false; }

            auto await_suspend(std::coroutine_handle<> coroutine) -> void;

            [[nodiscard]]
            auto await_resume() const noexcept -> bool { return !canceled; }
        };

        class watch : public std::enable_shared_from_this<watch> {
            runtime& owner;
            const int descriptor;
            readiness* reader = nullptr;
            readiness* writer = nullptr;

            friend class readiness;
            friend class runtime;

            auto notify(std::uint32_t events) -> void;
        public:
            watch(runtime& owner, int descriptor);

            watch(const watch&) = delete;

            ~watch();

            auto operator=(const watch&) -> watch& = delete;

            // Wakes the current waiters with a canceled result. Later waits are
            // unaffected.
            auto cancel() -> void;

            auto readable() noexcept -> readiness;

            auto writable() noexcept -> readiness;
        };

        static auto active() noexcept -> bool;

        static auto current() -> runtime&;

        runtime();

        runtime(const runtime&) = delete;

        ~runtime();

        auto operator=(const runtime&) -> runtime& = delete;

        auto fd() const noexcept -> int;

        auto run() -> void;

        auto watch_fd(int descriptor) -> std::shared_ptr<watch>;
    };

    template <typename R>
    auto run(ext::task<R>&& task) -> R {
        const auto start = [&task]() -> ext::jtask<R> {
            co_return co_await std::move(task);
        };

        if (runtime::active()) {
            auto outer = start();
            runtime::current().run();
            return std::move(outer).result();
        }

        auto temporary = runtime();
        auto outer = start();
        temporary.run();
        return std::move(outer).result();
    }
}

template <>
struct fmt::formatter<localsock::runtime> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext& ctx) {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const localsock::runtime& runtime, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "runtime ({})", runtime.fd());
    }
};
