#include <localsock/runtime.hpp>

#include <array>
#include <gtest/gtest.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

namespace {
    struct socket_pair {
        localsock::fd first;
        localsock::fd second;

        socket_pair() {
            auto fds = std::array<int, 2>();

            if (::socketpair(
                AF_UNIX,
                SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC,
                0,
                fds.data()
            ) == -1) {
                throw std::system_error(errno, std::generic_category());
            }

            first = localsock::fd(fds[0]);
            second = localsock::fd(fds[1]);
        }
    };

    auto wait_readable(
        localsock::runtime::watch& watch,
        int& result
    ) -> ext::detached_task {
        result = (co_await watch.readable()) ? 1 : 0;
    }
}

TEST(Runtime, Result) {
    const auto result = localsock::run([]() -> ext::task<int> {
        co_return 42;
    }());

    EXPECT_EQ(42, result);
}

TEST(Runtime, OnePerThread) {
    EXPECT_TRUE(localsock::runtime::active());
    EXPECT_THROW(localsock::runtime(), std::runtime_error);
}

TEST(Runtime, TemporaryRuntime) {
    auto active = true;
    auto during = false;
    auto after = true;

    auto thread = std::thread([&]() {
        active = localsock::runtime::active();

        during = localsock::run([]() -> ext::task<bool> {
            co_return localsock::runtime::active();
        }());

        after = localsock::runtime::active();
    });

    thread.join();

    EXPECT_FALSE(active);
    EXPECT_TRUE(during);
    EXPECT_FALSE(after);
}

TEST(Runtime, NoCurrentRuntime) {
    auto thrown = false;

    auto thread = std::thread([&thrown]() {
        try {
            localsock::runtime::current();
        }
        catch (const std::logic_error&) {
            thrown = true;
        }
    });

    thread.join();

    EXPECT_TRUE(thrown);
}

TEST(Runtime, ReadableWakesOnData) {
    const auto pair = socket_pair();
    const auto watch = localsock::runtime::current().watch_fd(pair.first);
    auto result = -1;

    localsock::run([&]() -> ext::task<> {
        wait_readable(*watch, result);
        EXPECT_EQ(-1, result);

        constexpr auto byte = 'x';
        EXPECT_EQ(1, ::write(pair.second, &byte, sizeof(byte)));

        co_return;
    }());

    EXPECT_EQ(1, result);
}

TEST(Runtime, CancelWakesWaiter) {
    const auto pair = socket_pair();
    const auto watch = localsock::runtime::current().watch_fd(pair.first);
    auto result = -1;

    localsock::run([&]() -> ext::task<> {
        wait_readable(*watch, result);
        watch->cancel();
        EXPECT_EQ(0, result);

        // A cancel without waiters does not affect the next wait.
        result = -1;
        watch->cancel();
        wait_readable(*watch, result);
        EXPECT_EQ(-1, result);

        constexpr auto byte = 'x';
        EXPECT_EQ(1, ::write(pair.second, &byte, sizeof(byte)));

        co_return;
    }());

    EXPECT_EQ(1, result);
}

TEST(Runtime, SecondWaiterRejected) {
    auto pair = socket_pair();

    localsock::run([&]() -> ext::task<> {
        auto watch = localsock::runtime::current().watch_fd(pair.first);
        auto first = -1;

        wait_readable(*watch, first);

        auto rejected = false;

        try {
            static_cast<void>(co_await watch->readable());
        }
        catch (const std::logic_error&) {
            rejected = true;
        }

        EXPECT_TRUE(rejected);

        watch->cancel();
        EXPECT_EQ(0, first);
    }());
}
