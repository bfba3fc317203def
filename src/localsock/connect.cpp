#include "cli.h"
#include "commands.h"

#include <array>
#include <iostream>
#include <localsock/blocking.hpp>

static auto $connect(
    const commline::app& app,
    const commline::argv& argv,
    localsock::name_kind kind,
    timber::level log_level
) -> void {
    localsock::cli::start_logging(log_level);

    if (argv.size() != 2) {
        throw commline::cli_error("expected a socket name and a message");
    }

    const auto name =
        localsock::cli::make_name(kind, std::string_view(argv[0]));
    const auto message = std::string_view(argv[1]);

    auto client = localsock::blocking::connect(name);

    auto written = std::size_t(0);
    while (written < message.size()) {
        written += client.write(
            message.data() + written,
            message.size() - written
        );
    }

    client.end();

    auto buffer = std::array<char, 4096>();
    auto received = std::size_t(0);

    while (const auto bytes = client.read(buffer.data(), buffer.size())) {
        std::cout.write(buffer.data(), static_cast<std::streamsize>(bytes));
        received += bytes;
    }

    std::cout << std::endl;

    TIMBER_DEBUG("{} received {:L} bytes from {}", app.name, received, name);
}

namespace localsock::cli {
    using namespace commline;

    auto connect() -> std::unique_ptr<command_node> {
        return command(
            "connect",
            "Send a message and print the reply.",
            options(
                option<localsock::name_kind>(
                    {"kind", "k"},
                    "Kind of socket name: path, pseudo or namespaced.",
                    "kind",
                    localsock::name_kind::path
                ),
                option<timber::level>(
                    {"log-level", "l"},
                    "Minimum log level to display.",
                    "level",
                    timber::level::info
                )
            ),
            $connect
        );
    }
}
