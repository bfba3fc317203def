#include "descriptor_limit.h"

#include <localsock/blocking.hpp>

#include <array>
#include <gtest/gtest.h>
#include <ranges>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

using testing::Test;

static_assert(std::input_iterator<localsock::blocking::incoming::iterator>);
static_assert(std::ranges::input_range<localsock::blocking::incoming>);

namespace {
    const auto socket_path =
        fs::temp_directory_path() / "localsock.blocking.test.sock";

    auto echo_once(localsock::blocking::listener& listener) -> void {
        auto client = listener.accept();

        auto buffer = std::array<char, 64>();
        const auto bytes = client.read(buffer.data(), buffer.size());

        client.write(buffer.data(), bytes);
    }

    auto round_trip(
        const localsock::name& name,
        std::string_view message
    ) -> std::string {
        auto client = localsock::blocking::connect(name);

        client.write(message.data(), message.size());

        auto result = std::string(message.size(), '\0');
        const auto bytes = client.read(result.data(), result.size());
        result.resize(bytes);

        return result;
    }
}

class BlockingTest : public Test {
protected:
    const localsock::name name = localsock::name::path(socket_path.native());

    auto SetUp() -> void override {
        fs::remove(socket_path);
    }

    auto TearDown() -> void override {
        fs::remove(socket_path);
    }
};

TEST_F(BlockingTest, RoundTrip) {
    auto listener =
        localsock::listener_options {.name = name}.create_blocking();

    auto server = std::thread(echo_once, std::ref(listener));

    EXPECT_EQ("hello", round_trip(name, "hello"));

    server.join();
}

#ifdef LOCALSOCK_ABSTRACT_NAMESPACE
TEST_F(BlockingTest, RoundTripNamespaced) {
    const auto namespaced =
        localsock::name::namespaced("localsock.blocking.test");

    auto listener =
        localsock::listener_options {.name = namespaced}.create_blocking();

    auto server = std::thread(echo_once, std::ref(listener));

    EXPECT_EQ("abstract", round_trip(namespaced, "abstract"));

    server.join();

    EXPECT_EQ(namespaced, listener.name());
}
#endif

TEST_F(BlockingTest, ReclaimName) {
    {
        const auto listener =
            localsock::listener_options {.name = name}.create_blocking();

        EXPECT_TRUE(fs::is_socket(socket_path));
    }

    EXPECT_FALSE(fs::exists(socket_path));
}

TEST_F(BlockingTest, DoNotReclaimName) {
    {
        auto listener =
            localsock::listener_options {.name = name}.create_blocking();

        listener.do_not_reclaim_name_on_drop();
    }

    EXPECT_TRUE(fs::is_socket(socket_path));
}

TEST_F(BlockingTest, AddressInUse) {
    const auto listener =
        localsock::listener_options {.name = name}.create_blocking();

    try {
        localsock::blocking::listener::from_options({.name = name});
        FAIL() << "second listener was created on a name in use";
    }
    catch (const std::system_error& ex) {
        EXPECT_EQ(EADDRINUSE, ex.code().value());
    }

    EXPECT_TRUE(fs::is_socket(socket_path));
}

TEST_F(BlockingTest, Incoming) {
    constexpr auto count = std::size_t(3);

    auto listener =
        localsock::listener_options {.name = name}.create_blocking();

    // Pending connections wait in the listen backlog.
    auto clients = std::vector<localsock::blocking::stream>();
    for (auto i = std::size_t(0); i < count; ++i) {
        clients.push_back(localsock::blocking::connect(name));

        const auto byte = static_cast<char>('a' + i);
        clients.back().write(&byte, sizeof(byte));
    }

    auto received = std::string();

    for (auto& result : listener.incoming()) {
        ASSERT_TRUE(result);

        auto& stream = result.get();
        auto byte = '\0';

        EXPECT_EQ(1u, stream.read(&byte, sizeof(byte)));
        received.push_back(byte);

        if (received.size() == count) break;
    }

    EXPECT_EQ("abc", received);
}

TEST_F(BlockingTest, IncomingIteratorCachesResult) {
    auto listener =
        localsock::listener_options {.name = name}.create_blocking();

    const auto client = localsock::blocking::connect(name);

    auto incoming = listener.incoming();
    auto it = incoming.begin();

    const auto first = (*it).get().fd();
    const auto second = (*it).get().fd();

    EXPECT_EQ(first, second);
    EXPECT_FALSE(it == incoming.end());
}

TEST_F(BlockingTest, IncomingContinuesAfterError) {
    auto listener =
        localsock::listener_options {.name = name}.create_blocking();

    const auto client = localsock::blocking::connect(name);

    auto incoming = listener.incoming();
    auto it = incoming.begin();

    {
        const auto limit = localsock::test::descriptor_limit();
        const auto& result = *it;

        EXPECT_FALSE(result);
        EXPECT_EQ(std::errc::too_many_files_open, result.error());
    }

    ++it;

    auto& result = *it;
    EXPECT_TRUE(result);
    EXPECT_TRUE(result.get().valid());
}

TEST_F(BlockingTest, EndOfStream) {
    auto listener =
        localsock::listener_options {.name = name}.create_blocking();

    const auto client = localsock::blocking::connect(name);
    auto server = listener.accept();

    client.end();

    auto buffer = std::array<char, 8>();
    EXPECT_EQ(0u, server.read(buffer.data(), buffer.size()));
}

TEST_F(BlockingTest, ConnectWithoutListener) {
    EXPECT_THROW(localsock::blocking::connect(name), std::system_error);
}
