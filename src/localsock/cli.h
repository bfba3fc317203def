#pragma once

#include <commline/commline>
#include <localsock/name.hpp>
#include <timber/timber>

namespace commline {
    template <>
    auto parse(std::string_view argument) -> timber::level;

    template <>
    auto parse(std::string_view argument) -> localsock::name_kind;
}

namespace localsock::cli {
    auto make_name(name_kind kind, std::string_view text) -> name;

    auto start_logging(timber::level level) -> void;
}
