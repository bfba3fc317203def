#include <localsock/listener.hpp>

#include <timber/timber>

namespace localsock {
    incoming::incoming(listener& owner) noexcept : owner(&owner) {}

    auto incoming::next() -> ext::task<accept_result> {
        try {
            co_return accept_result(co_await owner->accept());
        }
        catch (const std::system_error& ex) {
            TIMBER_DEBUG("{}", ex.what());
            co_return accept_result(ex.code());
        }
    }

    auto listener::from_options(const listener_options& options) -> listener {
        return listener(uds::listener(options));
    }

    listener::listener(uds::listener&& backend) noexcept :
        inner(std::move(backend))
    {}

    auto listener::accept() -> ext::task<stream> {
        co_return stream(co_await std::visit(
            [](auto& backend) { return backend.accept(); },
            inner
        ));
    }

    auto listener::cancel() -> void {
        std::visit([](auto& backend) { backend.cancel(); }, inner);
    }

    auto listener::do_not_reclaim_name_on_drop() noexcept -> void {
        std::visit(
            [](auto& backend) { backend.do_not_reclaim_name_on_drop(); },
            inner
        );
    }

    auto listener::fd() const noexcept -> int {
        return std::visit(
            [](const auto& backend) { return backend.fd(); },
            inner
        );
    }

    auto listener::get() const noexcept -> const variant_type& { return inner; }

    auto listener::incoming() noexcept -> localsock::incoming {
        return localsock::incoming(*this);
    }

    auto listener::name() const noexcept -> const localsock::name& {
        return std::visit(
            [](const auto& backend) -> const localsock::name& {
                return backend.name();
            },
            inner
        );
    }
}
