#include <localsock/runtime.hpp>

#include <cerrno>
#include <cstring>
#include <ext/except.h>
#include <stdexcept>
#include <timber/timber>
#include <utility>

namespace {
    constexpr std::uint32_t readable_events =
        EPOLLIN | EPOLLRDHUP | EPOLLHUP | EPOLLERR;
    constexpr std::uint32_t writable_events = EPOLLOUT | EPOLLHUP | EPOLLERR;

    thread_local localsock::runtime* current_runtime = nullptr;
}

namespace localsock {
    auto runtime::active() noexcept -> bool {
        return current_runtime != nullptr;
    }

    auto runtime::current() -> runtime& {
        if (!current_runtime) {
            throw std::logic_error("no active runtime in current thread");
        }

        return *current_runtime;
    }

    runtime::runtime() : epoll(epoll_create1(EPOLL_CLOEXEC)) {
        if (!epoll.valid()) {
            throw ext::system_error("Failed to create epoll instance");
        }

        if (current_runtime) {
            throw std::runtime_error("thread already has a runtime");
        }

        current_runtime = this;
        TIMBER_TRACE("{} created", *this);
    }

    runtime::~runtime() {
        if (current_runtime == this) current_runtime = nullptr;
        TIMBER_TRACE("{} destroyed", *this);
    }

    auto runtime::fd() const noexcept -> int {
        return epoll.get();
    }

    auto runtime::run() -> void {
        while (waiting > 0) {
            TIMBER_TRACE("{} waiting on {:L} descriptors", *this, waiting);

            const auto count = epoll_wait(epoll, ready.data(), batch, -1);

            if (count == -1) {
                if (errno == EINTR) continue;
                throw ext::system_error("epoll wait failure");
            }

            for (auto i = 0; i < count; ++i) {
                static_cast<watch*>(ready[i].data.ptr)->notify(
                    ready[i].events
                );
            }
        }

        TIMBER_TRACE("{} has no waiters", *this);
    }

    auto runtime::watch_fd(int descriptor) -> std::shared_ptr<watch> {
        return std::make_shared<watch>(*this, descriptor);
    }

    runtime::watch::watch(runtime& owner, int descriptor) :
        owner(owner),
        descriptor(descriptor)
    {
        auto registration = epoll_event();
        registration.events = EPOLLIN | EPOLLOUT | EPOLLRDHUP | EPOLLET;
        registration.data.ptr = this;

        if (epoll_ctl(owner.epoll, EPOLL_CTL_ADD, descriptor, &registration)) {
            throw ext::system_error(fmt::format(
                "Failed to watch fd ({}) on {}",
                descriptor,
                owner
            ));
        }

        TIMBER_TRACE("{} watching fd ({})", owner, descriptor);
    }

    runtime::watch::~watch() {
        // A runtime that ended first took its interest list with it.
        if (current_runtime != &owner) return;

        if (epoll_ctl(owner.epoll, EPOLL_CTL_DEL, descriptor, nullptr)) {
            TIMBER_DEBUG(
                "{} failed to unwatch fd ({}): {}",
                owner,
                descriptor,
                std::strerror(errno)
            );
        }
    }

    auto runtime::watch::cancel() -> void {
        if (!reader && !writer) return;

        const auto keep = shared_from_this();

        TIMBER_TRACE("fd ({}) canceling waiters", descriptor);

        if (reader) reader->wake(true);
        if (writer) writer->wake(true);
    }

    auto runtime::watch::notify(std::uint32_t events) -> void {
        const auto keep = shared_from_this();

        if ((events & readable_events) && reader) reader->wake(false);
        if ((events & writable_events) && writer) writer->wake(false);
    }

    auto runtime::watch::readable() noexcept -> readiness {
        return readiness(*this, reader);
    }

    auto runtime::watch::writable() noexcept -> readiness {
        return readiness(*this, writer);
    }

    runtime::readiness::readiness(watch& target, readiness*& slot) noexcept :
        target(target),
        slot(slot)
    {}

    runtime::readiness::~readiness() {
        // The waiting coroutine was destroyed while suspended.
        if (!coroutine) return;

        slot = nullptr;
        --target.owner.waiting;
    }

    auto runtime::readiness::await_suspend(
        std::coroutine_handle<> coroutine
    ) -> void {
        if (slot) {
            throw std::logic_error(fmt::format(
                "fd ({}) already has a waiter in this direction",
                target.descriptor
            ));
        }

        slot = this;
        this->coroutine = coroutine;
        ++target.owner.waiting;
    }

    auto runtime::readiness::wake(bool cancel) -> void {
        slot = nullptr;
        --target.owner.waiting;
        canceled = cancel;

        // The frame holding this object may be gone once resumed.
        std::exchange(coroutine, nullptr).resume();
    }
}
