#pragma once

#include "address.hpp"

#include <cstddef>

namespace localsock::uds::blocking {
    class stream {
        localsock::fd descriptor;
    public:
        stream() = default;

        explicit stream(localsock::fd&& descriptor) noexcept;

        static auto connect(const localsock::name& name) -> stream;

        auto end() const -> void;

        auto fd() const noexcept -> int;

        auto read(void* dest, std::size_t len) -> std::size_t;

        auto valid() const noexcept -> bool;

        auto write(const void* src, std::size_t len) -> std::size_t;
    };

    class listener {
        localsock::fd descriptor;
        bound_name bound;

        explicit listener(bound_socket&& socket) noexcept;
    public:
        explicit listener(const listener_options& options);

        auto accept() -> stream;

        auto do_not_reclaim_name_on_drop() noexcept -> void;

        auto fd() const noexcept -> int;

        auto name() const noexcept -> const localsock::name&;
    };
}

template <>
struct fmt::formatter<localsock::uds::blocking::stream> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext& ctx) {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(
        const localsock::uds::blocking::stream& stream,
        FormatContext& ctx
    ) const {
        return fmt::format_to(ctx.out(), "blocking stream ({})", stream.fd());
    }
};

template <>
struct fmt::formatter<localsock::uds::blocking::listener> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext& ctx) {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(
        const localsock::uds::blocking::listener& listener,
        FormatContext& ctx
    ) const {
        return fmt::format_to(
            ctx.out(),
            "blocking listener ({}) on {}",
            listener.fd(),
            listener.name()
        );
    }
};
