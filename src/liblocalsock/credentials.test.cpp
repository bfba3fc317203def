#include <localsock/credentials.hpp>
#include <localsock/detail/credential_layouts.hpp>
#include <localsock/except.hpp>

#include <array>
#include <cstring>
#include <gtest/gtest.h>
#include <limits>
#include <vector>

using localsock::credentials;
using localsock::credentials_layout;

namespace {
    template <typename T>
    auto bytes_of(const T& value) -> std::vector<std::byte> {
        auto result = std::vector<std::byte>(sizeof(T));
        std::memcpy(result.data(), &value, sizeof(T));
        return result;
    }

    auto append_groups(
        std::vector<std::byte>& bytes,
        std::initializer_list<gid_t> groups
    ) -> void {
        for (const auto gid : groups) {
            const auto offset = bytes.size();
            bytes.resize(offset + sizeof(gid_t));
            std::memcpy(bytes.data() + offset, &gid, sizeof(gid_t));
        }
    }

    auto cmsgcred(short ngroups) -> localsock::detail::cmsgcred_layout {
        auto cred = localsock::detail::cmsgcred_layout();

        cred.cmcred_pid = 4242;
        cred.cmcred_uid = 1000;
        cred.cmcred_euid = 1001;
        cred.cmcred_gid = 100;
        cred.cmcred_ngroups = ngroups;

        for (auto i = 0; i < localsock::detail::cmgroup_max; ++i) {
            cred.cmcred_groups[i] = static_cast<gid_t>(100 * (i + 1));
        }

        return cred;
    }

    auto sockcred(
        int ngroups,
        std::initializer_list<gid_t> groups
    ) -> std::vector<std::byte> {
        auto header = localsock::detail::sockcred_layout();

        header.sc_uid = 1000;
        header.sc_euid = 1001;
        header.sc_gid = 100;
        header.sc_egid = 101;
        header.sc_ngroups = ngroups;

        auto bytes = bytes_of(header);
        bytes.resize(offsetof(localsock::detail::sockcred_layout, sc_groups));
        append_groups(bytes, groups);

        return bytes;
    }

    auto collect(localsock::groups groups) -> std::vector<gid_t> {
        auto result = std::vector<gid_t>();
        while (const auto gid = groups.next()) result.push_back(*gid);
        return result;
    }
}

TEST(Credentials, CmsgcredFields) {
    const auto bytes = bytes_of(cmsgcred(0));
    const auto cred = credentials(credentials_layout::cmsgcred, bytes);

    EXPECT_EQ(credentials_layout::cmsgcred, cred.layout());
    EXPECT_EQ(4242, cred.pid());
    EXPECT_EQ(1000u, cred.ruid());
    EXPECT_EQ(1001u, cred.euid());
    EXPECT_EQ(100u, cred.rgid());
    EXPECT_FALSE(cred.egid());
}

TEST(Credentials, SockcredFields) {
    const auto bytes = sockcred(0, {});
    const auto cred = credentials(credentials_layout::sockcred, bytes);

    EXPECT_FALSE(cred.pid());
    EXPECT_EQ(1000u, cred.ruid());
    EXPECT_EQ(1001u, cred.euid());
    EXPECT_EQ(100u, cred.rgid());
    EXPECT_EQ(101u, cred.egid());
}

TEST(Credentials, UcredFields) {
    const auto bytes = bytes_of(localsock::detail::ucred_layout {
        .pid = 77,
        .uid = 1000,
        .gid = 100
    });
    const auto cred = credentials(credentials_layout::ucred, bytes);

    EXPECT_EQ(77, cred.pid());
    EXPECT_EQ(1000u, cred.ruid());
    EXPECT_EQ(100u, cred.rgid());
    EXPECT_FALSE(cred.euid());
    EXPECT_FALSE(cred.egid());
    EXPECT_TRUE(cred.groups().empty());
}

TEST(Credentials, CmsgcredGroups) {
    const auto bytes = bytes_of(cmsgcred(3));
    const auto cred = credentials(credentials_layout::cmsgcred, bytes);

    auto groups = cred.groups();

    EXPECT_EQ(3u, groups.size());
    EXPECT_EQ(100u, groups.next());
    EXPECT_EQ(2u, groups.size());
    EXPECT_EQ(200u, groups.next());
    EXPECT_EQ(1u, groups.size());
    EXPECT_EQ(300u, groups.next());
    EXPECT_EQ(0u, groups.size());

    EXPECT_FALSE(groups.next());
    EXPECT_FALSE(groups.next());
    EXPECT_EQ(0u, groups.size());
}

TEST(Credentials, CmsgcredGroupCountClamped) {
    const auto bytes = bytes_of(cmsgcred(40));
    const auto cred = credentials(credentials_layout::cmsgcred, bytes);

    const auto groups = collect(cred.groups());

    ASSERT_EQ(std::size_t(localsock::detail::cmgroup_max), groups.size());
    EXPECT_EQ(100u, groups.front());
    EXPECT_EQ(1600u, groups.back());
}

TEST(Credentials, CmsgcredNegativeGroupCount) {
    const auto bytes = bytes_of(cmsgcred(-5));
    const auto cred = credentials(credentials_layout::cmsgcred, bytes);

    EXPECT_TRUE(cred.groups().empty());
    EXPECT_EQ(0u, cred.groups().size());
}

TEST(Credentials, SockcredGroups) {
    const auto bytes = sockcred(4, {7, 8, 9, 10});
    const auto cred = credentials(credentials_layout::sockcred, bytes);

    EXPECT_EQ(
        (std::vector<gid_t> {7, 8, 9, 10}),
        collect(cred.groups())
    );
}

TEST(Credentials, SockcredNegativeGroupCount) {
    const auto bytes = sockcred(-1, {});
    const auto cred = credentials(credentials_layout::sockcred, bytes);

    EXPECT_TRUE(cred.groups().empty());
}

TEST(Credentials, GroupsRange) {
    const auto bytes = sockcred(3, {5, 6, 7});
    const auto cred = credentials(credentials_layout::sockcred, bytes);

    auto result = std::vector<gid_t>();
    for (const auto gid : cred.groups()) result.push_back(gid);

    EXPECT_EQ((std::vector<gid_t> {5, 6, 7}), result);
}

TEST(Credentials, UnalignedPayload) {
    const auto source = sockcred(2, {11, 12});

    auto buffer = std::vector<std::byte>(source.size() + 1);
    std::memcpy(buffer.data() + 1, source.data(), source.size());

    const auto cred = credentials(
        credentials_layout::sockcred,
        std::span<const std::byte>(buffer).subspan(1)
    );

    EXPECT_EQ(1000u, cred.ruid());
    EXPECT_EQ((std::vector<gid_t> {11, 12}), collect(cred.groups()));
}

TEST(Credentials, TruncatedPayload) {
    const auto cmsg = bytes_of(cmsgcred(0));
    const auto ucred = bytes_of(localsock::detail::ucred_layout());

    EXPECT_THROW(
        credentials(
            credentials_layout::cmsgcred,
            std::span(cmsg).first(cmsg.size() - 1)
        ),
        localsock::invalid_credentials
    );

    EXPECT_THROW(
        credentials(
            credentials_layout::ucred,
            std::span(ucred).first(ucred.size() - 1)
        ),
        localsock::invalid_credentials
    );
}

TEST(Credentials, TruncatedGroupArray) {
    const auto bytes = sockcred(3, {1, 2});

    EXPECT_THROW(
        credentials(credentials_layout::sockcred, bytes),
        localsock::invalid_credentials
    );
}

#ifdef SCM_CREDENTIALS
TEST(Credentials, HugeGroupCount) {
    const auto bytes = sockcred(std::numeric_limits<int>::max(), {1, 2});

    EXPECT_THROW(
        credentials(credentials_layout::sockcred, bytes),
        localsock::invalid_credentials
    );
}

TEST(Credentials, FromControlMessage) {
    alignas(cmsghdr) std::array<std::byte, CMSG_SPACE(sizeof(ucred))> buffer;
    buffer.fill(std::byte());

    auto* const message = reinterpret_cast<cmsghdr*>(buffer.data());
    message->cmsg_level = SOL_SOCKET;
    message->cmsg_type = SCM_CREDENTIALS;
    message->cmsg_len = CMSG_LEN(sizeof(ucred));

    const auto sent = ucred {.pid = 31, .uid = 500, .gid = 600};
    std::memcpy(CMSG_DATA(message), &sent, sizeof(sent));

    const auto cred = credentials::from_control_message(*message);

    ASSERT_TRUE(cred);
    EXPECT_EQ(credentials_layout::ucred, cred->layout());
    EXPECT_EQ(31, cred->pid());
    EXPECT_EQ(500u, cred->ruid());
    EXPECT_EQ(600u, cred->rgid());
}

TEST(Credentials, FromUnrelatedControlMessage) {
    alignas(cmsghdr) std::array<std::byte, CMSG_SPACE(sizeof(int))> buffer;
    buffer.fill(std::byte());

    auto* const message = reinterpret_cast<cmsghdr*>(buffer.data());
    message->cmsg_level = SOL_SOCKET;
    message->cmsg_type = SCM_RIGHTS;
    message->cmsg_len = CMSG_LEN(sizeof(int));

    EXPECT_FALSE(credentials::from_control_message(*message));
}
#endif
