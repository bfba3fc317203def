#pragma once

#include <sys/socket.h>
#include <sys/types.h>

namespace localsock::detail {
    constexpr auto cmgroup_max = 16;

#ifdef CMGROUP_MAX
    static_assert(cmgroup_max == CMGROUP_MAX);
#endif

    // The layouts below mirror kernel structures byte for byte. They are
    // packed so that they can be laid over a control message payload that
    // carries no alignment guarantee.

    struct [[gnu::packed]] cmsgcred_layout {
        pid_t cmcred_pid;
        uid_t cmcred_uid;
        uid_t cmcred_euid;
        gid_t cmcred_gid;
        short cmcred_ngroups;
        short pad;
        gid_t cmcred_groups[cmgroup_max];
    };

    struct [[gnu::packed]] sockcred_layout {
        uid_t sc_uid;
        uid_t sc_euid;
        gid_t sc_gid;
        gid_t sc_egid;
        int sc_ngroups;
        gid_t sc_groups[1];
    };

    struct [[gnu::packed]] ucred_layout {
        pid_t pid;
        uid_t uid;
        gid_t gid;
    };

    static_assert(
        sizeof(cmsgcred_layout) ==
            sizeof(pid_t) + 2 * sizeof(uid_t) + sizeof(gid_t) +
            2 * sizeof(short) + cmgroup_max * sizeof(gid_t),
        "cmsgcred layout contains padding"
    );

    static_assert(
        sizeof(sockcred_layout) ==
            2 * sizeof(uid_t) + 3 * sizeof(gid_t) + sizeof(int),
        "sockcred layout contains padding"
    );

    static_assert(
        sizeof(ucred_layout) == sizeof(pid_t) + sizeof(uid_t) + sizeof(gid_t),
        "ucred layout contains padding"
    );

#if defined(__FreeBSD__) || defined(__DragonFly__) || defined(__NetBSD__)
    static_assert(
        sizeof(cmsgcred_layout) == sizeof(::cmsgcred),
        "size of cmsgcred layout does not match the system's cmsgcred"
    );
#endif

#ifdef __FreeBSD__
    static_assert(
        sizeof(sockcred_layout) == sizeof(::sockcred),
        "size of sockcred layout does not match the system's sockcred"
    );
#endif

#if defined(__linux__) && defined(SCM_CREDENTIALS)
    static_assert(
        sizeof(ucred_layout) == sizeof(::ucred),
        "size of ucred layout does not match the system's ucred"
    );
#endif
}
