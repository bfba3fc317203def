#pragma once

#include "address.hpp"
#include "stream.hpp"

#include <localsock/listener_options.hpp>
#include <localsock/runtime.hpp>

namespace localsock::uds {
    class listener {
        localsock::fd descriptor;
        std::shared_ptr<runtime::watch> watch;
        bound_name bound;

        explicit listener(bound_socket&& socket);
    public:
        explicit listener(const listener_options& options);

        auto accept() -> ext::task<stream>;

        auto cancel() -> void;

        auto do_not_reclaim_name_on_drop() noexcept -> void;

        auto fd() const noexcept -> int;

        auto name() const noexcept -> const localsock::name&;
    };
}

template <>
struct fmt::formatter<localsock::uds::listener> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext& ctx) {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(
        const localsock::uds::listener& listener,
        FormatContext& ctx
    ) const {
        return fmt::format_to(
            ctx.out(),
            "listener ({}) on {}",
            listener.fd(),
            listener.name()
        );
    }
};
