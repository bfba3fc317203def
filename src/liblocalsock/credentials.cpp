#include <localsock/credentials.hpp>
#include <localsock/detail/credential_layouts.hpp>
#include <localsock/except.hpp>

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <fmt/format.h>
#include <string_view>

using localsock::detail::cmsgcred_layout;
using localsock::detail::sockcred_layout;
using localsock::detail::ucred_layout;

namespace {
    constexpr auto sockcred_header = offsetof(sockcred_layout, sc_groups);

    // Every access to the payload goes through these casts. The layouts are
    // packed, so any byte address is suitably aligned for them.

    auto as_cmsgcred(const std::byte* data) noexcept -> const cmsgcred_layout& {
        return *reinterpret_cast<const cmsgcred_layout*>(data);
    }

    auto as_sockcred(const std::byte* data) noexcept -> const sockcred_layout& {
        return *reinterpret_cast<const sockcred_layout*>(data);
    }

    auto as_ucred(const std::byte* data) noexcept -> const ucred_layout& {
        return *reinterpret_cast<const ucred_layout*>(data);
    }

    auto require(
        std::string_view layout,
        std::size_t required,
        std::size_t actual
    ) -> void {
        if (actual >= required) return;

        throw localsock::invalid_credentials(fmt::format(
            "{} payload is {} bytes long; expected at least {}",
            layout,
            actual,
            required
        ));
    }

    auto sockcred_groups(const sockcred_layout& cred) noexcept -> std::size_t {
        return static_cast<std::size_t>(std::max(int(cred.sc_ngroups), 0));
    }
}

namespace localsock {
    groups::iterator::iterator(const std::byte* pos) noexcept : pos(pos) {}

    auto groups::iterator::operator*() const noexcept -> gid_t {
        auto gid = gid_t();
        std::memcpy(&gid, pos, sizeof(gid_t));
        return gid;
    }

    auto groups::iterator::operator++() noexcept -> iterator& {
        pos += sizeof(gid_t);
        return *this;
    }

    auto groups::iterator::operator++(int) noexcept -> iterator {
        auto previous = *this;
        ++*this;
        return previous;
    }

    groups::groups(const std::byte* first, std::size_t count) noexcept :
        cur(first),
        last(first + count * sizeof(gid_t))
    {}

    auto groups::begin() const noexcept -> iterator { return iterator(cur); }

    auto groups::empty() const noexcept -> bool { return cur >= last; }

    auto groups::end() const noexcept -> iterator { return iterator(last); }

    auto groups::next() noexcept -> std::optional<gid_t> {
        if (cur >= last) return std::nullopt;

        auto gid = gid_t();
        std::memcpy(&gid, cur, sizeof(gid_t));
        cur += sizeof(gid_t);

        return gid;
    }

    auto groups::size() const noexcept -> std::size_t {
        if (cur >= last) return 0;
        return static_cast<std::size_t>(last - cur) / sizeof(gid_t);
    }

    credentials::credentials(
        credentials_layout layout,
        std::span<const std::byte> payload
    ) :
        layout_(layout),
        data(payload.data())
    {
        switch (layout) {
            case credentials_layout::cmsgcred:
                require("cmsgcred", sizeof(cmsgcred_layout), payload.size());
                break;
            case credentials_layout::sockcred: {
                require("sockcred", sockcred_header, payload.size());

                const auto count = sockcred_groups(as_sockcred(data));
                const auto room =
                    (payload.size() - sockcred_header) / sizeof(gid_t);

                if (count > room) {
                    throw invalid_credentials(fmt::format(
                        "sockcred payload holds {} groups; header claims {}",
                        room,
                        count
                    ));
                }

                break;
            }
            case credentials_layout::ucred:
                require("ucred", sizeof(ucred_layout), payload.size());
                break;
        }
    }

    auto credentials::from_control_message(
        const cmsghdr& message
    ) -> std::optional<credentials> {
        if (message.cmsg_level != SOL_SOCKET) return std::nullopt;

        auto& header = const_cast<cmsghdr&>(message);
        const auto* const data =
            reinterpret_cast<const std::byte*>(CMSG_DATA(&header));
        const auto length = message.cmsg_len > CMSG_LEN(0) ?
            message.cmsg_len - CMSG_LEN(0) :
            0;
        const auto payload = std::span<const std::byte>(data, length);

#ifdef SCM_CREDENTIALS
        if (message.cmsg_type == SCM_CREDENTIALS) {
            return credentials(credentials_layout::ucred, payload);
        }
#endif

#ifdef SCM_CREDS
        if (message.cmsg_type == SCM_CREDS) {
            return credentials(credentials_layout::cmsgcred, payload);
        }
#endif

        return std::nullopt;
    }

    auto credentials::egid() const noexcept -> std::optional<gid_t> {
        switch (layout_) {
            case credentials_layout::sockcred:
                return gid_t(as_sockcred(data).sc_egid);
            case credentials_layout::cmsgcred:
            case credentials_layout::ucred: break;
        }

        return std::nullopt;
    }

    auto credentials::euid() const noexcept -> std::optional<uid_t> {
        switch (layout_) {
            case credentials_layout::cmsgcred:
                return uid_t(as_cmsgcred(data).cmcred_euid);
            case credentials_layout::sockcred:
                return uid_t(as_sockcred(data).sc_euid);
            case credentials_layout::ucred: break;
        }

        return std::nullopt;
    }

    auto credentials::groups() const noexcept -> localsock::groups {
        switch (layout_) {
            case credentials_layout::cmsgcred: {
                const auto& cred = as_cmsgcred(data);
                const auto count = std::clamp(
                    int(cred.cmcred_ngroups),
                    0,
                    detail::cmgroup_max
                );

                return localsock::groups(
                    data + offsetof(cmsgcred_layout, cmcred_groups),
                    static_cast<std::size_t>(count)
                );
            }
            case credentials_layout::sockcred:
                return localsock::groups(
                    data + sockcred_header,
                    sockcred_groups(as_sockcred(data))
                );
            case credentials_layout::ucred: break;
        }

        return {};
    }

    auto credentials::layout() const noexcept -> credentials_layout {
        return layout_;
    }

    auto credentials::pid() const noexcept -> std::optional<pid_t> {
        switch (layout_) {
            case credentials_layout::cmsgcred:
                return pid_t(as_cmsgcred(data).cmcred_pid);
            case credentials_layout::ucred: return pid_t(as_ucred(data).pid);
            case credentials_layout::sockcred: break;
        }

        return std::nullopt;
    }

    auto credentials::rgid() const noexcept -> std::optional<gid_t> {
        switch (layout_) {
            case credentials_layout::cmsgcred:
                return gid_t(as_cmsgcred(data).cmcred_gid);
            case credentials_layout::sockcred:
                return gid_t(as_sockcred(data).sc_gid);
            case credentials_layout::ucred: return gid_t(as_ucred(data).gid);
        }

        return std::nullopt;
    }

    auto credentials::ruid() const noexcept -> std::optional<uid_t> {
        switch (layout_) {
            case credentials_layout::cmsgcred:
                return uid_t(as_cmsgcred(data).cmcred_uid);
            case credentials_layout::sockcred:
                return uid_t(as_sockcred(data).sc_uid);
            case credentials_layout::ucred: return uid_t(as_ucred(data).uid);
        }

        return std::nullopt;
    }
}
