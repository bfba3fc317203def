#include <localsock/except.hpp>
#include <localsock/uds/address.hpp>

#include <cstddef>
#include <ext/except.h>
#include <memory>
#include <timber/timber>
#include <utility>

namespace fs = std::filesystem;

namespace localsock::uds {
    socket_address::socket_address(const localsock::name& name) :
        address(),
        length(0)
    {
        const auto bytes = name.bytes();
        const auto capacity = sizeof(address.sun_path) - 1;

        if (bytes.size() > capacity) {
            throw invalid_name(fmt::format(
                "socket name {} does not fit in a socket address",
                name
            ));
        }

        address.sun_family = AF_UNIX;

        if (name.kind() == name_kind::namespaced) {
            // Abstract names start with a null byte and are not terminated.
            bytes.copy(address.sun_path + 1, bytes.size());
            length = offsetof(sockaddr_un, sun_path) + 1 + bytes.size();
        }
        else {
            bytes.copy(address.sun_path, bytes.size());
            length = offsetof(sockaddr_un, sun_path) + bytes.size() + 1;
        }
    }

    auto socket_address::data() const noexcept -> const sockaddr* {
        return reinterpret_cast<const sockaddr*>(&address);
    }

    auto socket_address::size() const noexcept -> socklen_t { return length; }

    bound_name::bound_name(localsock::name&& name, bool reclaim) noexcept :
        name_(std::move(name).into_owned()),
        reclaim(reclaim && !name_.is_namespaced())
    {}

    bound_name::bound_name(bound_name&& other) noexcept :
        name_(std::move(other.name_)),
        reclaim(std::exchange(other.reclaim, false))
    {}

    bound_name::~bound_name() {
        if (!reclaim) return;

        const auto path = fs::path(name_.bytes());
        auto error = std::error_code();
        const auto removed = fs::remove(path, error);

        if (error) {
            TIMBER_ERROR(
                R"(Failed to remove socket file "{}": {})",
                path.native(),
                error.message()
            );
        }
        else if (removed) {
            TIMBER_DEBUG(R"(Removed socket file "{}")", path.native());
        }
    }

    auto bound_name::operator=(bound_name&& other) noexcept -> bound_name& {
        if (this != &other) {
            std::destroy_at(this);
            std::construct_at(this, std::move(other));
        }

        return *this;
    }

    auto bound_name::do_not_reclaim() noexcept -> void { reclaim = false; }

    auto bound_name::name() const noexcept -> const localsock::name& {
        return name_;
    }

    auto listen(const listener_options& options, int flags) -> bound_socket {
        const auto address = socket_address(options.name);

        auto descriptor = localsock::fd(
            ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC | flags, 0)
        );

        if (!descriptor.valid()) {
            throw ext::system_error("Failed to create listening socket");
        }

        if (::bind(descriptor, address.data(), address.size()) == -1) {
            throw ext::system_error(fmt::format(
                "Failed to bind socket to {}",
                options.name
            ));
        }

        // From here on the socket file, if any, is ours to clean up.
        auto result = bound_socket {
            .descriptor = std::move(descriptor),
            .name = bound_name(options.name.into_owned(), options.reclaim_name)
        };

        TIMBER_DEBUG(
            "{} bound to {} {}",
            result.descriptor,
            options.name.kind(),
            options.name
        );

        if (options.mode && !options.name.is_namespaced()) {
            fs::permissions(fs::path(options.name.bytes()), *options.mode);
        }

        if (::listen(result.descriptor, options.backlog) == -1) {
            throw ext::system_error(fmt::format(
                "Failed to listen for connections on {}",
                options.name
            ));
        }

        TIMBER_DEBUG(
            "{} listening for connections with a backlog size of {:L}",
            result.descriptor,
            options.backlog
        );

        return result;
    }

    auto open_stream(int flags) -> localsock::fd {
        auto descriptor = localsock::fd(
            ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC | flags, 0)
        );

        if (!descriptor.valid()) {
            throw ext::system_error("Failed to create socket");
        }

        return descriptor;
    }
}
