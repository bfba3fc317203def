#include <localsock/except.hpp>
#include <localsock/name.hpp>

#include <cstdlib>
#include <fmt/format.h>
#include <type_traits>

#ifndef _WIN32
#include <sys/un.h>
#endif

namespace {
#ifndef _WIN32
    // One byte of 'sun_path' is reserved for the path's null terminator,
    // or for the leading null byte of an abstract name.
    constexpr auto sun_path_capacity = sizeof(sockaddr_un::sun_path) - 1;

    constexpr auto fallback_runtime_dir = std::string_view("/tmp");

    auto check_length(std::string_view kind, std::string_view text) -> void {
        if (text.size() > sun_path_capacity) {
            throw localsock::invalid_name(fmt::format(
                "{} name is {} bytes long; at most {} bytes are allowed",
                kind,
                text.size(),
                sun_path_capacity
            ));
        }
    }

    auto check_path(std::string_view path) -> void {
        if (path.empty()) {
            throw localsock::invalid_name("socket path is empty");
        }

        if (path.find('\0') != std::string_view::npos) {
            throw localsock::invalid_name(
                "socket path contains an interior null byte"
            );
        }

        check_length("path", path);
    }

#ifdef LOCALSOCK_ABSTRACT_NAMESPACE
    auto check_namespaced(std::string_view text) -> void {
        if (text.empty()) {
            throw localsock::invalid_name("namespaced name is empty");
        }

        check_length("namespaced", text);
    }
#endif

    auto runtime_dir() -> std::string_view {
        const auto* const dir = std::getenv("XDG_RUNTIME_DIR");

        if (dir && dir[0] == '/') return dir;
        return fallback_runtime_dir;
    }
#endif
}

namespace localsock {
#ifdef _WIN32
    const std::size_t name::max_length = 256;
#else
    const std::size_t name::max_length = sun_path_capacity;
#endif

    name::name(variant_type inner) noexcept : inner(std::move(inner)) {}

#ifdef _WIN32
    auto name::named_pipe(std::wstring_view pipe) -> name {
        constexpr auto prefix = std::wstring_view(LR"(\\.\pipe\)");

        if (pipe.find(L'\0') != std::wstring_view::npos) {
            throw invalid_name("pipe name contains an interior null byte");
        }

        if (pipe.size() + prefix.size() > max_length) {
            throw invalid_name("pipe name is too long");
        }

        auto full = pipe.starts_with(prefix) ?
            std::wstring() :
            std::wstring(prefix);
        full += pipe;

        return name(named_pipe_name {cow_string<wchar_t>::owned(full)});
    }
#else
    auto name::path(std::string_view path) -> name {
        check_path(path);
        return name(path_name {cow_string<char>::owned(std::string(path))});
    }

    auto name::borrowed_path(std::string_view path) -> name {
        check_path(path);
        return name(path_name {cow_string<char>::borrowed(path)});
    }

    auto name::pseudo_namespaced(std::string_view text) -> name {
        if (text.empty()) {
            throw invalid_name("pseudo-namespaced name is empty");
        }

        if (text.find_first_of(std::string_view("/\0", 2)) !=
            std::string_view::npos) {
            throw invalid_name(fmt::format(
                "pseudo-namespaced name '{}' contains a slash or null byte",
                text
            ));
        }

        auto path = fmt::format("{}/{}", runtime_dir(), text);
        check_length("pseudo-namespaced", path);

        return name(pseudo_namespaced_name {
            cow_string<char>::owned(std::move(path))
        });
    }
#endif

#ifdef LOCALSOCK_ABSTRACT_NAMESPACE
    auto name::namespaced(std::string_view text) -> name {
        check_namespaced(text);
        return name(namespaced_name {
            cow_string<char>::owned(std::string(text))
        });
    }

    auto name::borrowed_namespaced(std::string_view text) -> name {
        check_namespaced(text);
        return name(namespaced_name {cow_string<char>::borrowed(text)});
    }
#endif

    auto name::borrow() const noexcept -> name {
        return name(std::visit([](const auto& variant) -> variant_type {
            using T = std::decay_t<decltype(variant)>;
            return T { variant.value.borrow() };
        }, inner));
    }

    auto name::get() const noexcept -> const variant_type& { return inner; }

    auto name::into_owned() const& -> name {
        return name(std::visit([](const auto& variant) -> variant_type {
            using T = std::decay_t<decltype(variant)>;
            return T { variant.value.into_owned() };
        }, inner));
    }

    auto name::into_owned() && -> name {
        return name(std::visit([](auto&& variant) -> variant_type {
            using T = std::decay_t<decltype(variant)>;
            return T { std::move(variant.value).into_owned() };
        }, std::move(inner)));
    }

    auto name::is_borrowed() const noexcept -> bool {
        return std::visit(
            [](const auto& variant) { return variant.value.is_borrowed(); },
            inner
        );
    }

    auto name::is_namespaced() const noexcept -> bool {
        switch (kind()) {
            case name_kind::named_pipe: return true;
            case name_kind::path: return false;
            case name_kind::pseudo_namespaced: return false;
            case name_kind::namespaced: return true;
        }

        return false;
    }

    auto name::is_path() const noexcept -> bool {
        switch (kind()) {
            case name_kind::named_pipe: return true;
            case name_kind::path: return true;
            case name_kind::pseudo_namespaced: return false;
            case name_kind::namespaced: return false;
        }

        return false;
    }

    auto name::kind() const noexcept -> name_kind {
        return std::visit([](const auto& variant) {
            using T = std::decay_t<decltype(variant)>;

#ifdef _WIN32
            if constexpr (std::is_same_v<T, named_pipe_name>) {
                return name_kind::named_pipe;
            }
#else
            if constexpr (std::is_same_v<T, path_name>) {
                return name_kind::path;
            }
            else if constexpr (std::is_same_v<T, pseudo_namespaced_name>) {
                return name_kind::pseudo_namespaced;
            }
#endif
#ifdef LOCALSOCK_ABSTRACT_NAMESPACE
            else if constexpr (std::is_same_v<T, namespaced_name>) {
                return name_kind::namespaced;
            }
#endif
        }, inner);
    }

#ifndef _WIN32
    auto name::bytes() const noexcept -> std::string_view {
        return std::visit(
            [](const auto& variant) { return variant.value.view(); },
            inner
        );
    }

    auto to_fs_name(std::string_view path) -> name { return name::path(path); }

    auto to_ns_name(std::string_view text) -> name {
#ifdef LOCALSOCK_ABSTRACT_NAMESPACE
        return name::namespaced(text);
#else
        return name::pseudo_namespaced(text);
#endif
    }
#endif
}
