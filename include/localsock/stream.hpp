#pragma once

#ifdef _WIN32
#error "localsock: the named pipe transport backend is not available"
#endif

#include "uds/stream.hpp"

#include <variant>

namespace localsock {
    class stream {
    public:
        using variant_type = std::variant<uds::stream>;
    private:
        variant_type inner;
    public:
        stream() = default;

        stream(uds::stream&& backend) noexcept;

        auto cancel() noexcept -> void;

        auto end() const -> void;

        auto fd() const noexcept -> int;

        auto get() const noexcept -> const variant_type&;

        auto read(void* dest, std::size_t len) -> ext::task<std::size_t>;

        auto try_read(void* dest, std::size_t len) -> long;

        auto try_write(const void* src, std::size_t len) -> long;

        auto valid() const noexcept -> bool;

        auto write(const void* src, std::size_t len) -> ext::task<std::size_t>;
    };

    auto connect(const name& name) -> ext::task<stream>;
}
