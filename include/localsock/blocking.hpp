#pragma once

#ifdef _WIN32
#error "localsock: the named pipe transport backend is not available"
#endif

#include "accept_result.hpp"
#include "listener_options.hpp"
#include "uds/blocking.hpp"

#include <iterator>
#include <optional>
#include <variant>

namespace localsock::blocking {
    class stream {
    public:
        using variant_type = std::variant<uds::blocking::stream>;
    private:
        variant_type inner;
    public:
        stream() = default;

        stream(uds::blocking::stream&& backend) noexcept;

        auto end() const -> void;

        auto fd() const noexcept -> int;

        auto get() const noexcept -> const variant_type&;

        auto read(void* dest, std::size_t len) -> std::size_t;

        auto valid() const noexcept -> bool;

        auto write(const void* src, std::size_t len) -> std::size_t;
    };

    using accept_result = basic_accept_result<stream>;

    auto connect(const name& name) -> stream;

    class listener;

    class incoming {
        listener* owner;
    public:
        class iterator {
            listener* owner = nullptr;
            mutable std::optional<accept_result> current;
        public:
            using iterator_concept = std::input_iterator_tag;
            using difference_type = std::ptrdiff_t;
            using value_type = accept_result;

            iterator() = default;

            explicit iterator(listener& owner) noexcept;

            auto operator*() const -> accept_result&;

            auto operator++() -> iterator&;

            auto operator++(int) -> void;

            friend constexpr auto operator==(
                const iterator&,
                std::unreachable_sentinel_t
            ) noexcept -> bool {
                return false;
            }
        };

        explicit incoming(listener& owner) noexcept;

        auto begin() const noexcept -> iterator;

        constexpr auto end() const noexcept -> std::unreachable_sentinel_t {
            return std::unreachable_sentinel;
        }
    };

    class listener {
    public:
        using variant_type = std::variant<uds::blocking::listener>;
    private:
        variant_type inner;
    public:
        static auto from_options(const listener_options& options) -> listener;

        listener(uds::blocking::listener&& backend) noexcept;

        auto accept() -> stream;

        auto do_not_reclaim_name_on_drop() noexcept -> void;

        auto fd() const noexcept -> int;

        auto get() const noexcept -> const variant_type&;

        auto incoming() noexcept -> blocking::incoming;

        auto name() const noexcept -> const localsock::name&;
    };
}
