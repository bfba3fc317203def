#pragma once

#include "fd.hpp"
#include "runtime.hpp"

#include <initializer_list>

namespace localsock {
    class signal_set {
        localsock::fd descriptor;
        std::shared_ptr<runtime::watch> watch;

        explicit signal_set(localsock::fd&& descriptor);
    public:
        static auto create(std::initializer_list<int> signals) -> signal_set;

        auto cancel() -> void;

        auto fd() const noexcept -> int;

        auto wait() -> ext::task<int>;
    };
}
