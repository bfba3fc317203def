#pragma once

#include <cerrno>
#include <fcntl.h>
#include <gtest/gtest.h>
#include <sys/resource.h>
#include <system_error>
#include <unistd.h>

namespace localsock::test {
    // Lowers the soft descriptor limit to the lowest free descriptor, so
    // that opening anything fails with EMFILE, until destroyed.
    class descriptor_limit {
        rlimit original;
    public:
        descriptor_limit() {
            if (::getrlimit(RLIMIT_NOFILE, &original) == -1) {
                throw std::system_error(
                    errno,
                    std::generic_category(),
                    "failed to read descriptor limit"
                );
            }

            const auto lowest = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
            if (lowest == -1) {
                throw std::system_error(
                    errno,
                    std::generic_category(),
                    "failed to open /dev/null"
                );
            }

            ::close(lowest);

            auto lowered = original;
            lowered.rlim_cur = static_cast<rlim_t>(lowest);

            if (::setrlimit(RLIMIT_NOFILE, &lowered) == -1) {
                throw std::system_error(
                    errno,
                    std::generic_category(),
                    "failed to lower descriptor limit"
                );
            }
        }

        descriptor_limit(const descriptor_limit&) = delete;

        ~descriptor_limit() {
            if (::setrlimit(RLIMIT_NOFILE, &original) == -1) {
                ADD_FAILURE() << "failed to restore descriptor limit";
            }
        }

        auto operator=(const descriptor_limit&) -> descriptor_limit& = delete;
    };
}
