#include <localsock/blocking.hpp>

#include <timber/timber>

namespace localsock::blocking {
    stream::stream(uds::blocking::stream&& backend) noexcept :
        inner(std::move(backend))
    {}

    auto stream::end() const -> void {
        std::visit([](const auto& backend) { backend.end(); }, inner);
    }

    auto stream::fd() const noexcept -> int {
        return std::visit(
            [](const auto& backend) { return backend.fd(); },
            inner
        );
    }

    auto stream::get() const noexcept -> const variant_type& { return inner; }

    auto stream::read(void* dest, std::size_t len) -> std::size_t {
        return std::visit(
            [dest, len](auto& backend) { return backend.read(dest, len); },
            inner
        );
    }

    auto stream::valid() const noexcept -> bool {
        return std::visit(
            [](const auto& backend) { return backend.valid(); },
            inner
        );
    }

    auto stream::write(const void* src, std::size_t len) -> std::size_t {
        return std::visit(
            [src, len](auto& backend) { return backend.write(src, len); },
            inner
        );
    }

    auto connect(const name& name) -> stream {
        return stream(uds::blocking::stream::connect(name));
    }

    incoming::iterator::iterator(listener& owner) noexcept : owner(&owner) {}

    auto incoming::iterator::operator*() const -> accept_result& {
        if (!current) {
            try {
                current.emplace(owner->accept());
            }
            catch (const std::system_error& ex) {
                TIMBER_DEBUG("{}", ex.what());
                current.emplace(ex.code());
            }
        }

        return *current;
    }

    auto incoming::iterator::operator++() -> iterator& {
        current.reset();
        return *this;
    }

    auto incoming::iterator::operator++(int) -> void { ++*this; }

    incoming::incoming(listener& owner) noexcept : owner(&owner) {}

    auto incoming::begin() const noexcept -> iterator {
        return iterator(*owner);
    }

    auto listener::from_options(const listener_options& options) -> listener {
        return listener(uds::blocking::listener(options));
    }

    listener::listener(uds::blocking::listener&& backend) noexcept :
        inner(std::move(backend))
    {}

    auto listener::accept() -> stream {
        return std::visit(
            [](auto& backend) { return stream(backend.accept()); },
            inner
        );
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

    auto listener::incoming() noexcept -> blocking::incoming {
        return blocking::incoming(*this);
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
