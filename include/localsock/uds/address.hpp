#pragma once

#include <localsock/fd.hpp>
#include <localsock/listener_options.hpp>
#include <localsock/name.hpp>

#include <sys/socket.h>
#include <sys/un.h>

namespace localsock::uds {
    class socket_address {
        sockaddr_un address;
        socklen_t length;
    public:
        explicit socket_address(const localsock::name& name);

        auto data() const noexcept -> const sockaddr*;

        auto size() const noexcept -> socklen_t;
    };

    class bound_name {
        localsock::name name_;
        bool reclaim;
    public:
        bound_name(localsock::name&& name, bool reclaim) noexcept;

        bound_name(const bound_name&) = delete;

        bound_name(bound_name&& other) noexcept;

        ~bound_name();

        auto operator=(const bound_name&) -> bound_name& = delete;

        auto operator=(bound_name&& other) noexcept -> bound_name&;

        auto do_not_reclaim() noexcept -> void;

        auto name() const noexcept -> const localsock::name&;
    };

    struct bound_socket {
        localsock::fd descriptor;
        bound_name name;
    };

    auto listen(const listener_options& options, int flags) -> bound_socket;

    auto open_stream(int flags) -> localsock::fd;
}
