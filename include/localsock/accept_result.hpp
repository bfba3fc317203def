#pragma once

#include <system_error>
#include <variant>

namespace localsock {
    template <typename Stream>
    class basic_accept_result {
        std::variant<Stream, std::error_code> value;
    public:
        basic_accept_result() = default;

        basic_accept_result(Stream&& stream) : value(std::move(stream)) {}

        basic_accept_result(std::error_code error) : value(error) {}

        explicit operator bool() const noexcept {
            return std::holds_alternative<Stream>(value);
        }

        auto error() const noexcept -> std::error_code {
            if (const auto* error = std::get_if<std::error_code>(&value)) {
                return *error;
            }

            return {};
        }

        auto get() & -> Stream& {
            if (auto* error = std::get_if<std::error_code>(&value)) {
                throw std::system_error(*error, "Failed to accept connection");
            }

            return std::get<Stream>(value);
        }

        auto take() && -> Stream {
            return std::move(get());
        }
    };
}
