#include "cli.h"

#include <localsock/except.hpp>

namespace commline {
    template <>
    auto parse(std::string_view argument) -> timber::level {
        auto level = timber::parse_level(argument);

        if (!level) throw commline::cli_error(
            "unknown log level: " + std::string(argument)
        );

        return *level;
    }

    template <>
    auto parse(std::string_view argument) -> localsock::name_kind {
        using localsock::name_kind;

        if (argument == "path") return name_kind::path;
        if (argument == "pseudo") return name_kind::pseudo_namespaced;
        if (argument == "namespaced") return name_kind::namespaced;

        throw commline::cli_error(
            "unknown name kind: " + std::string(argument)
        );
    }
}

namespace localsock::cli {
    auto make_name(name_kind kind, std::string_view text) -> name {
        switch (kind) {
            case name_kind::path:
                return name::path(text);
            case name_kind::pseudo_namespaced:
                return name::pseudo_namespaced(text);
            case name_kind::namespaced:
                return to_ns_name(text);
            case name_kind::named_pipe:
                break;
        }

        throw invalid_name(fmt::format(
            "{} names are not supported on this platform",
            kind
        ));
    }
}
