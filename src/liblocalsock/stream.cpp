#include <localsock/stream.hpp>

namespace localsock {
    stream::stream(uds::stream&& backend) noexcept :
        inner(std::move(backend))
    {}

    auto stream::cancel() noexcept -> void {
        std::visit([](auto& backend) { backend.cancel(); }, inner);
    }

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

    auto stream::read(
        void* dest,
        std::size_t len
    ) -> ext::task<std::size_t> {
        co_return co_await std::visit(
            [dest, len](auto& backend) { return backend.read(dest, len); },
            inner
        );
    }

    auto stream::try_read(void* dest, std::size_t len) -> long {
        return std::visit(
            [dest, len](auto& backend) { return backend.try_read(dest, len); },
            inner
        );
    }

    auto stream::try_write(const void* src, std::size_t len) -> long {
        return std::visit(
            [src, len](auto& backend) { return backend.try_write(src, len); },
            inner
        );
    }

    auto stream::valid() const noexcept -> bool {
        return std::visit(
            [](const auto& backend) { return backend.valid(); },
            inner
        );
    }

    auto stream::write(
        const void* src,
        std::size_t len
    ) -> ext::task<std::size_t> {
        co_return co_await std::visit(
            [src, len](auto& backend) { return backend.write(src, len); },
            inner
        );
    }

    auto connect(const name& name) -> ext::task<stream> {
        co_return stream(co_await uds::stream::connect(name));
    }
}
