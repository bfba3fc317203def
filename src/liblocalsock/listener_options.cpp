#include <localsock/blocking.hpp>
#include <localsock/listener.hpp>

namespace localsock {
    auto listener_options::create() const -> listener {
        return listener::from_options(*this);
    }

    auto listener_options::create_blocking() const -> blocking::listener {
        return blocking::listener::from_options(*this);
    }
}
