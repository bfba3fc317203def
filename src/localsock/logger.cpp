#include "cli.h"

#include <fmt/format.h>
#include <cstdio>

namespace {
    auto console_logger(const timber::log& log) noexcept -> void {
        fmt::print(stderr, "[{}] {}\n", log.log_level, log.message);
    }
}

namespace localsock::cli {
    auto start_logging(timber::level level) -> void {
        timber::thread_name = std::string("main");
        timber::log_handler = &console_logger;
        timber::reporting_level() = level;
    }
}
