#pragma once

#include <fmt/format.h>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#if defined(__linux__) || defined(__ANDROID__)
#define LOCALSOCK_ABSTRACT_NAMESPACE 1
#endif

namespace localsock {
    template <typename Char>
    class cow_string {
    public:
        using string_type = std::basic_string<Char>;
        using view_type = std::basic_string_view<Char>;
    private:
        std::variant<view_type, string_type> storage;

        explicit cow_string(view_type view) noexcept : storage(view) {}

        explicit cow_string(string_type&& string) noexcept :
            storage(std::in_place_type<string_type>, std::move(string))
        {}
    public:
        cow_string() : storage(std::in_place_type<string_type>) {}

        static auto borrowed(view_type view) noexcept -> cow_string {
            return cow_string(view);
        }

        static auto owned(string_type string) noexcept -> cow_string {
            return cow_string(std::move(string));
        }

        auto borrow() const noexcept -> cow_string {
            return cow_string(view());
        }

        auto into_owned() const& -> cow_string {
            return cow_string(string_type(view()));
        }

        auto into_owned() && -> cow_string {
            if (auto* const string = std::get_if<string_type>(&storage)) {
                return cow_string(std::move(*string));
            }

            return cow_string(string_type(view()));
        }

        auto is_borrowed() const noexcept -> bool {
            return std::holds_alternative<view_type>(storage);
        }

        auto view() const noexcept -> view_type {
            return std::visit(
                [](const auto& value) -> view_type { return value; },
                storage
            );
        }

        friend auto operator==(
            const cow_string& lhs,
            const cow_string& rhs
        ) noexcept -> bool {
            return lhs.view() == rhs.view();
        }
    };

    enum class name_kind {
        named_pipe,
        path,
        pseudo_namespaced,
        namespaced
    };

#ifdef _WIN32
    struct named_pipe_name {
        cow_string<wchar_t> value;

        auto operator==(const named_pipe_name&) const -> bool = default;
    };
#else
    struct path_name {
        cow_string<char> value;

        auto operator==(const path_name&) const -> bool = default;
    };

    struct pseudo_namespaced_name {
        cow_string<char> value;

        auto operator==(const pseudo_namespaced_name&) const -> bool = default;
    };
#endif

#ifdef LOCALSOCK_ABSTRACT_NAMESPACE
    struct namespaced_name {
        cow_string<char> value;

        auto operator==(const namespaced_name&) const -> bool = default;
    };
#endif

    class name {
    public:
        using variant_type = std::variant<
#ifdef _WIN32
            named_pipe_name
#else
            path_name,
            pseudo_namespaced_name
#endif
#ifdef LOCALSOCK_ABSTRACT_NAMESPACE
            , namespaced_name
#endif
        >;
    private:
        variant_type inner;
    public:
        static const std::size_t max_length;

        name() = default;

        explicit name(variant_type inner) noexcept;

#ifdef _WIN32
        static auto named_pipe(std::wstring_view pipe) -> name;
#else
        static auto path(std::string_view path) -> name;

        static auto borrowed_path(std::string_view path) -> name;

        static auto pseudo_namespaced(std::string_view text) -> name;
#endif

#ifdef LOCALSOCK_ABSTRACT_NAMESPACE
        static auto namespaced(std::string_view text) -> name;

        static auto borrowed_namespaced(std::string_view text) -> name;
#endif

        auto operator==(const name&) const -> bool = default;

        // The result views this name's characters and must not outlive it.
        auto borrow() const noexcept -> name;

        auto get() const noexcept -> const variant_type&;

        auto into_owned() const& -> name;

        auto into_owned() && -> name;

        auto is_borrowed() const noexcept -> bool;

        auto is_namespaced() const noexcept -> bool;

        auto is_path() const noexcept -> bool;

        auto kind() const noexcept -> name_kind;

#ifndef _WIN32
        auto bytes() const noexcept -> std::string_view;
#endif
    };

#ifndef _WIN32
    auto to_fs_name(std::string_view path) -> name;

    auto to_ns_name(std::string_view text) -> name;
#endif
}

template <>
struct fmt::formatter<localsock::name_kind> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(localsock::name_kind kind, FormatContext& ctx) const {
        auto string = std::string_view();

        switch (kind) {
            case localsock::name_kind::named_pipe:
                string = "named pipe";
                break;
            case localsock::name_kind::path:
                string = "path";
                break;
            case localsock::name_kind::pseudo_namespaced:
                string = "pseudo-namespaced";
                break;
            case localsock::name_kind::namespaced:
                string = "namespaced";
                break;
        }

        return formatter<std::string_view>::format(string, ctx);
    }
};

#ifndef _WIN32
template <>
struct fmt::formatter<localsock::name> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext& ctx) {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const localsock::name& name, FormatContext& ctx) const {
        if (name.is_namespaced()) {
            return fmt::format_to(ctx.out(), "@{}", name.bytes());
        }

        return fmt::format_to(ctx.out(), R"("{}")", name.bytes());
    }
};
#endif
