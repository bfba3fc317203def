#include <localsock/uds/blocking.hpp>

#include <cerrno>
#include <ext/except.h>
#include <sys/socket.h>
#include <timber/timber>

namespace localsock::uds::blocking {
    stream::stream(localsock::fd&& descriptor) noexcept :
        descriptor(std::move(descriptor))
    {}

    auto stream::connect(const localsock::name& name) -> stream {
        const auto address = socket_address(name);
        auto result = stream(open_stream(0));

        while (::connect(result.fd(), address.data(), address.size()) == -1) {
            if (errno == EINTR) continue;

            throw ext::system_error(
                fmt::format("Failed to connect to {}", name)
            );
        }

        TIMBER_DEBUG("{} connected to {}", result, name);
        return result;
    }

    auto stream::end() const -> void {
        if (::shutdown(descriptor, SHUT_WR) == -1) {
            throw ext::system_error("failed to shutdown further transmissions");
        }

        TIMBER_DEBUG("{} shutdown transmissions", *this);
    }

    auto stream::fd() const noexcept -> int { return descriptor; }

    auto stream::read(void* dest, std::size_t len) -> std::size_t {
        auto bytes_read = ::recv(descriptor, dest, len, 0);

        while (bytes_read == -1) {
            if (errno != EINTR) {
                throw ext::system_error(
                    fmt::format("{} failed to receive data", *this)
                );
            }

            bytes_read = ::recv(descriptor, dest, len, 0);
        }

        TIMBER_TRACE(
            "{} recv {:L} byte{}",
            *this,
            bytes_read,
            bytes_read == 1 ? "" : "s"
        );

        return static_cast<std::size_t>(bytes_read);
    }

    auto stream::valid() const noexcept -> bool { return descriptor.valid(); }

    auto stream::write(const void* src, std::size_t len) -> std::size_t {
        auto bytes_written = ::send(descriptor, src, len, MSG_NOSIGNAL);

        while (bytes_written == -1) {
            if (errno != EINTR) {
                throw ext::system_error(
                    fmt::format("{} failed to send data", *this)
                );
            }

            bytes_written = ::send(descriptor, src, len, MSG_NOSIGNAL);
        }

        TIMBER_TRACE(
            "{} send {:L} byte{}",
            *this,
            bytes_written,
            bytes_written == 1 ? "" : "s"
        );

        return static_cast<std::size_t>(bytes_written);
    }

    listener::listener(bound_socket&& socket) noexcept :
        descriptor(std::move(socket.descriptor)),
        bound(std::move(socket.name))
    {}

    listener::listener(const listener_options& options) :
        listener(uds::listen(options, 0))
    {}

    auto listener::accept() -> stream {
        auto client = ::accept4(descriptor, nullptr, nullptr, SOCK_CLOEXEC);

        while (client == -1) {
            if (errno != EINTR) {
                throw ext::system_error(fmt::format(
                    "Failed to accept client connection on {}",
                    name()
                ));
            }

            client = ::accept4(descriptor, nullptr, nullptr, SOCK_CLOEXEC);
        }

        TIMBER_DEBUG("{} accepted client ({})", *this, client);
        return stream(localsock::fd(client));
    }

    auto listener::do_not_reclaim_name_on_drop() noexcept -> void {
        bound.do_not_reclaim();
    }

    auto listener::fd() const noexcept -> int { return descriptor; }

    auto listener::name() const noexcept -> const localsock::name& {
        return bound.name();
    }
}
