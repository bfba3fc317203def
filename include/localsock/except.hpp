#pragma once

#include <stdexcept>

namespace localsock {
    struct task_canceled : std::runtime_error {
        task_canceled();
    };

    struct invalid_name : std::invalid_argument {
        using std::invalid_argument::invalid_argument;
    };

    struct invalid_credentials : std::invalid_argument {
        using std::invalid_argument::invalid_argument;
    };
}
