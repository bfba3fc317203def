#pragma once

#include <cstddef>
#include <iterator>
#include <optional>
#include <span>
#include <sys/socket.h>
#include <sys/types.h>

namespace localsock {
    enum class credentials_layout {
        cmsgcred,

        sockcred,

        ucred
    };

    // Views the payload of the credentials it came from.
    class groups {
        const std::byte* cur = nullptr;
        const std::byte* last = nullptr;
    public:
        class iterator {
            const std::byte* pos = nullptr;
        public:
            using difference_type = std::ptrdiff_t;
            using iterator_category = std::forward_iterator_tag;
            using value_type = gid_t;

            iterator() = default;

            explicit iterator(const std::byte* pos) noexcept;

            auto operator*() const noexcept -> gid_t;

            auto operator++() noexcept -> iterator&;

            auto operator++(int) noexcept -> iterator;

            auto operator==(const iterator&) const -> bool = default;
        };

        groups() = default;

        groups(const std::byte* first, std::size_t count) noexcept;

        auto begin() const noexcept -> iterator;

        auto empty() const noexcept -> bool;

        auto end() const noexcept -> iterator;

        auto next() noexcept -> std::optional<gid_t>;

        auto size() const noexcept -> std::size_t;
    };

    // Views the payload it was decoded from and copies nothing.
    // The payload buffer must outlive it.
    class credentials {
        credentials_layout layout_;
        const std::byte* data;
    public:
        credentials(
            credentials_layout layout,
            std::span<const std::byte> payload
        );

        static auto from_control_message(
            const cmsghdr& message
        ) -> std::optional<credentials>;

        auto egid() const noexcept -> std::optional<gid_t>;

        auto euid() const noexcept -> std::optional<uid_t>;

        auto groups() const noexcept -> localsock::groups;

        auto layout() const noexcept -> credentials_layout;

        auto pid() const noexcept -> std::optional<pid_t>;

        auto rgid() const noexcept -> std::optional<gid_t>;

        auto ruid() const noexcept -> std::optional<uid_t>;
    };
}
