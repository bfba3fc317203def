#include <localsock/fd.hpp>

#include <cerrno>
#include <cstring>
#include <timber/timber>
#include <unistd.h>
#include <utility>

namespace {
    constexpr auto invalid = -1;
}

namespace localsock {
    fd::fd() noexcept : descriptor(invalid) {}

    fd::fd(int descriptor) noexcept : descriptor(descriptor) {}

    fd::fd(fd&& other) noexcept :
        descriptor(std::exchange(other.descriptor, invalid)) {}

    fd::~fd() {
        if (descriptor == invalid) return;
        close();
    }

    fd::operator int() const noexcept { return descriptor; }

    auto fd::operator=(fd&& other) noexcept -> fd& {
        if (this != &other) {
            if (descriptor != invalid) close();
            descriptor = std::exchange(other.descriptor, invalid);
        }

        return *this;
    }

    auto fd::close() noexcept -> void {
        localsock::close(std::exchange(descriptor, invalid));
    }

    auto fd::get() const noexcept -> int { return descriptor; }

    auto fd::valid() const noexcept -> bool { return descriptor != invalid; }

    auto close(int fd) noexcept -> void {
        if (::close(fd) == -1) {
            TIMBER_ERROR(
                "Failed to close file descriptor ({}): {}",
                fd,
                std::strerror(errno)
            );
        }
        else { TIMBER_TRACE("fd ({}) closed", fd); }
    }
}
