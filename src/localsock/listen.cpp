#include "cli.h"
#include "commands.h"

#include <array>
#include <csignal>
#include <cstring>
#include <localsock/localsock>
#include <unistd.h>
#include <unordered_set>
#include <vector>

namespace {
    using client_set = std::unordered_set<localsock::stream*>;

    auto echo(
        localsock::stream client,
        client_set& clients
    ) -> ext::detached_task {
        auto buffer = std::array<char, 4096>();

        clients.insert(&client);

        try {
            while (const auto bytes =
                co_await client.read(buffer.data(), buffer.size())
            ) {
                auto written = std::size_t(0);

                while (written < bytes) {
                    written += co_await client.write(
                        buffer.data() + written,
                        bytes - written
                    );
                }

                TIMBER_INFO("{} echoed {:L} bytes", client.fd(), bytes);
            }
        }
        catch (const localsock::task_canceled&) {
            TIMBER_DEBUG("client ({}) closed by shutdown", client.fd());
        }
        catch (const std::exception& ex) {
            TIMBER_ERROR("client ({}) failed: {}", client.fd(), ex.what());
        }

        clients.erase(&client);

        TIMBER_DEBUG("client ({}) disconnected", client.fd());
    }

    auto stop_on_signal(
        localsock::signal_set& signals,
        localsock::listener& listener,
        client_set& clients
    ) -> ext::detached_task {
        const auto signal = co_await signals.wait();
        if (signal == 0) co_return;

        TIMBER_INFO("Received signal: {}", strsignal(signal));

        for (auto* const client : std::vector(clients.begin(), clients.end())) {
            client->cancel();
        }

        // Resumes serve(), which returns and frees everything referenced
        // here.
        listener.cancel();
    }

    auto serve(localsock::listener_options options) -> ext::task<> {
        auto signals = localsock::signal_set::create({SIGINT, SIGTERM});
        auto clients = client_set();
        auto listener = options.create();
        auto incoming = listener.incoming();

        stop_on_signal(signals, listener, clients);

        TIMBER_INFO(
            "Listening for connections on {} ({})",
            listener.name(),
            listener.name().kind()
        );

        try {
            while (!incoming.terminated()) {
                auto result = co_await incoming.next();

                if (!result) {
                    TIMBER_ERROR(
                        "Failed to accept connection: {}",
                        result.error().message()
                    );
                    continue;
                }

                echo(std::move(result).take(), clients);
            }
        }
        catch (const localsock::task_canceled&) {
            TIMBER_INFO("Shutting down {}", listener);
        }
    }
}

static auto $listen(
    const commline::app& app,
    const commline::argv& argv,
    localsock::name_kind kind,
    timber::level log_level
) -> void {
    localsock::cli::start_logging(log_level);

    if (argv.size() != 1) {
        throw commline::cli_error("expected exactly one socket name");
    }

    TIMBER_INFO(
        "{} version {} starting: [PID {}]",
        app.name,
        app.version,
        getpid()
    );

    localsock::run(serve({
        .name = localsock::cli::make_name(kind, std::string_view(argv[0]))
    }));
}

namespace localsock::cli {
    using namespace commline;

    auto listen() -> std::unique_ptr<command_node> {
        return command(
            "listen",
            "Echo data sent by clients.",
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
            $listen
        );
    }
}
