#include <localsock/signal_set.hpp>

#include <cerrno>
#include <csignal>
#include <ext/except.h>
#include <sys/signalfd.h>
#include <timber/timber>
#include <unistd.h>

namespace localsock {
    signal_set::signal_set(localsock::fd&& descriptor) :
        descriptor(std::move(descriptor)),
        watch(runtime::current().watch_fd(this->descriptor))
    {
        TIMBER_TRACE("signal set ({}) created", this->descriptor.get());
    }

    auto signal_set::create(std::initializer_list<int> signals) -> signal_set {
        auto mask = sigset_t();
        sigemptyset(&mask);

        for (const auto signal : signals) sigaddset(&mask, signal);

        if (sigprocmask(SIG_BLOCK, &mask, nullptr) == -1) {
            throw ext::system_error("Failed to block signals");
        }

        auto descriptor = localsock::fd(
            ::signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC)
        );

        if (!descriptor.valid()) {
            throw ext::system_error("Failed to create signalfd");
        }

        return signal_set(std::move(descriptor));
    }

    auto signal_set::cancel() -> void { watch->cancel(); }

    auto signal_set::fd() const noexcept -> int { return descriptor; }

    auto signal_set::wait() -> ext::task<int> {
        while (true) {
            auto info = signalfd_siginfo();
            const auto bytes = ::read(descriptor, &info, sizeof(info));

            if (bytes == sizeof(info)) {
                TIMBER_DEBUG(
                    "signal set ({}) received signal {}",
                    descriptor.get(),
                    info.ssi_signo
                );

                co_return static_cast<int>(info.ssi_signo);
            }

            if (bytes == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                if (!co_await watch->readable()) co_return 0;
            }
            else if (bytes != -1 || errno != EINTR) {
                throw ext::system_error("Failed to read signal info");
            }
        }
    }
}
