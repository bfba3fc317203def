#include <localsock/except.hpp>
#include <localsock/uds/address.hpp>
#include <localsock/uds/stream.hpp>

#include <cerrno>
#include <ext/except.h>
#include <sys/socket.h>
#include <timber/timber>

namespace localsock::uds {
    stream::stream(localsock::fd&& descriptor) :
        descriptor(std::move(descriptor)),
        watch(runtime::current().watch_fd(this->descriptor))
    {
        TIMBER_TRACE("{} created", *this);
    }

    auto stream::connect(const localsock::name& name) -> ext::task<stream> {
        const auto address = socket_address(name);
        auto result = stream(open_stream(SOCK_NONBLOCK));

        while (true) {
            if (::connect(result.fd(), address.data(), address.size()) == 0) {
                break;
            }

            if (errno == EINTR) continue;

            if (errno != EINPROGRESS) {
                throw ext::system_error(
                    fmt::format("Failed to connect to {}", name)
                );
            }

            if (!co_await result.watch->writable()) throw task_canceled();

            auto error = 0;
            auto len = static_cast<socklen_t>(sizeof(error));

            if (::getsockopt(
                result.fd(),
                SOL_SOCKET,
                SO_ERROR,
                &error,
                &len
            ) == -1) {
                throw ext::system_error("Failed to read socket error");
            }

            if (error != 0) {
                errno = error;
                throw ext::system_error(
                    fmt::format("Failed to connect to {}", name)
                );
            }

            break;
        }

        TIMBER_DEBUG("{} connected to {}", result, name);
        co_return result;
    }

    auto stream::cancel() noexcept -> void {
        if (watch) watch->cancel();
    }

    auto stream::end() const -> void {
        if (::shutdown(descriptor, SHUT_WR) == -1) {
            throw ext::system_error("failed to shutdown further transmissions");
        }

        TIMBER_DEBUG("{} shutdown transmissions", *this);
    }

    auto stream::fd() const noexcept -> int { return descriptor; }

    auto stream::read(void* dest, std::size_t len) -> ext::task<std::size_t> {
        auto bytes_read = try_read(dest, len);

        while (bytes_read == -1) {
            if (!co_await watch->readable()) throw task_canceled();
            bytes_read = try_read(dest, len);
        }

        co_return static_cast<std::size_t>(bytes_read);
    }

    auto stream::try_read(void* dest, std::size_t len) -> long {
        const auto bytes_read = ::recv(descriptor, dest, len, 0);

        if (bytes_read >= 0) {
            TIMBER_TRACE(
                "{} recv {:L} byte{}",
                *this,
                bytes_read,
                bytes_read == 1 ? "" : "s"
            );
        }
        else if (errno != EAGAIN && errno != EWOULDBLOCK) {
            throw ext::system_error(
                fmt::format("{} failed to receive data", *this)
            );
        }

        return bytes_read;
    }

    auto stream::try_write(const void* src, std::size_t len) -> long {
        const auto bytes_written = ::send(descriptor, src, len, MSG_NOSIGNAL);

        if (bytes_written >= 0) {
            TIMBER_TRACE(
                "{} send {:L} byte{}",
                *this,
                bytes_written,
                bytes_written == 1 ? "" : "s"
            );
        }
        else if (errno != EAGAIN && errno != EWOULDBLOCK) {
            throw ext::system_error(
                fmt::format("{} failed to send data", *this)
            );
        }

        return bytes_written;
    }

    auto stream::valid() const noexcept -> bool { return descriptor.valid(); }

    auto stream::write(
        const void* src,
        std::size_t len
    ) -> ext::task<std::size_t> {
        auto bytes_written = try_write(src, len);

        while (bytes_written == -1) {
            if (!co_await watch->writable()) throw task_canceled();
            bytes_written = try_write(src, len);
        }

        co_return static_cast<std::size_t>(bytes_written);
    }
}
