#pragma once

#include <commline/commline>

namespace localsock::cli {
    auto connect() -> std::unique_ptr<commline::command_node>;

    auto listen() -> std::unique_ptr<commline::command_node>;
}
