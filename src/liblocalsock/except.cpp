#include <localsock/except.hpp>

namespace localsock {
    task_canceled::task_canceled() : std::runtime_error("task canceled") {}
}
