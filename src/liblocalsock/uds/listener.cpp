#include <localsock/except.hpp>
#include <localsock/uds/listener.hpp>

#include <cerrno>
#include <ext/except.h>
#include <sys/socket.h>
#include <timber/timber>

namespace localsock::uds {
    listener::listener(bound_socket&& socket) :
        descriptor(std::move(socket.descriptor)),
        watch(runtime::current().watch_fd(descriptor)),
        bound(std::move(socket.name))
    {}

    listener::listener(const listener_options& options) :
        listener(uds::listen(options, SOCK_NONBLOCK))
    {}

    auto listener::accept() -> ext::task<stream> {
        while (true) {
            const auto client = ::accept4(
                descriptor,
                nullptr,
                nullptr,
                SOCK_NONBLOCK | SOCK_CLOEXEC
            );

            if (client != -1) {
                TIMBER_DEBUG("{} accepted client ({})", *this, client);
                co_return stream(localsock::fd(client));
            }

            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                if (!co_await watch->readable()) throw task_canceled();
            }
            else if (errno != EINTR) {
                throw ext::system_error(fmt::format(
                    "Failed to accept client connection on {}",
                    name()
                ));
            }
        }
    }

    auto listener::cancel() -> void { watch->cancel(); }

    auto listener::do_not_reclaim_name_on_drop() noexcept -> void {
        bound.do_not_reclaim();
    }

    auto listener::fd() const noexcept -> int { return descriptor; }

    auto listener::name() const noexcept -> const localsock::name& {
        return bound.name();
    }
}
