#pragma once

#include <localsock/fd.hpp>
#include <localsock/name.hpp>
#include <localsock/runtime.hpp>

#include <cstddef>
#include <ext/coroutine>
#include <memory>

namespace localsock::uds {
    class stream {
        localsock::fd descriptor;
        std::shared_ptr<runtime::watch> watch;
    public:
        stream() = default;

        explicit stream(localsock::fd&& descriptor);

        static auto connect(const localsock::name& name) -> ext::task<stream>;

        auto cancel() noexcept -> void;

        auto end() const -> void;

        auto fd() const noexcept -> int;

        auto read(void* dest, std::size_t len) -> ext::task<std::size_t>;

        auto try_read(void* dest, std::size_t len) -> long;

        auto try_write(const void* src, std::size_t len) -> long;

        auto valid() const noexcept -> bool;

        auto write(const void* src, std::size_t len) -> ext::task<std::size_t>;
    };
}

template <>
struct fmt::formatter<localsock::uds::stream> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext& ctx) {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const localsock::uds::stream& stream, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "stream ({})", stream.fd());
    }
};
