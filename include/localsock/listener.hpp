#pragma once

#ifdef _WIN32
#error "localsock: the named pipe transport backend is not available"
#endif

#include "accept_result.hpp"
#include "listener_options.hpp"
#include "stream.hpp"
#include "uds/listener.hpp"

#include <variant>

namespace localsock {
    using accept_result = basic_accept_result<stream>;

    class listener;

    class incoming {
        listener* owner;
    public:
        explicit incoming(listener& owner) noexcept;

        auto next() -> ext::task<accept_result>;

        constexpr auto terminated() const noexcept -> bool { return false; }
    };

    class listener {
    public:
        using variant_type = std::variant<uds::listener>;
    private:
        variant_type inner;
    public:
        static auto from_options(const listener_options& options) -> listener;

        listener(uds::listener&& backend) noexcept;

        auto accept() -> ext::task<stream>;

        // Resumes a suspended accept with 'task_canceled'. Does nothing if no
        // accept is waiting.
        auto cancel() -> void;

        auto do_not_reclaim_name_on_drop() noexcept -> void;

        auto fd() const noexcept -> int;

        auto get() const noexcept -> const variant_type&;

        auto incoming() noexcept -> localsock::incoming;

        auto name() const noexcept -> const localsock::name&;
    };
}

template <>
struct fmt::formatter<localsock::listener> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext& ctx) {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const localsock::listener& listener, FormatContext& ctx) const {
        return std::visit([&ctx](const auto& backend) {
            return fmt::format_to(ctx.out(), "{}", backend);
        }, listener.get());
    }
};
