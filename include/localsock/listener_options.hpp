#pragma once

#include "name.hpp"

#include <filesystem>
#include <optional>
#include <sys/socket.h>

namespace localsock {
    class listener;

    namespace blocking {
        class listener;
    }

    struct listener_options {
        localsock::name name;

        bool reclaim_name = true;

        int backlog = SOMAXCONN;

        std::optional<std::filesystem::perms> mode;

        auto create() const -> listener;

        auto create_blocking() const -> blocking::listener;
    };
}
