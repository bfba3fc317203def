#pragma once

#include <fmt/format.h>

namespace localsock {
    class fd {
        int descriptor;
    public:
        fd() noexcept;
        explicit fd(int descriptor) noexcept;

        fd(const fd&) = delete;
        fd(fd&& other) noexcept;

        ~fd();

        operator int() const noexcept;

        auto operator=(const fd&) -> fd& = delete;
        auto operator=(fd&& other) noexcept -> fd&;

        auto close() noexcept -> void;

        auto get() const noexcept -> int;

        auto valid() const noexcept -> bool;
    };

    auto close(int fd) noexcept -> void;
}

template <>
struct fmt::formatter<localsock::fd> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext& ctx) {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const localsock::fd& descriptor, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "fd ({})", descriptor.get());
    }
};
