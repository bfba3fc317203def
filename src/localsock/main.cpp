#include "commands.h"

#include <iostream>

constexpr auto description = std::string_view(
    "Exchange messages over local sockets."
);

static auto $main(
    const commline::app& app,
    const commline::argv& argv
) -> void {
    std::cout
        << app.name << " " << "v" << app.version << '\n'
        << app.description << std::endl;
}

auto main(int argc, const char** argv) -> int {
    auto app = commline::application(
        NAME,
        VERSION,
        description,
        $main
    );

    app.subcommand(localsock::cli::listen());
    app.subcommand(localsock::cli::connect());

    return app.run(argc, argv);
}
