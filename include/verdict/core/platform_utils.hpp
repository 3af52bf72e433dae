#pragma once

#include <charconv>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

namespace verdict::core {

// Cross-platform safe getenv wrapper.
// - Windows: uses _dupenv_s and frees the allocated buffer
// - POSIX/others: uses std::getenv (read-only)
// Returns std::nullopt if the variable is not set. If set but empty, returns an
// engaged optional with an empty string.
inline std::optional<std::string> safe_getenv(const char* name) noexcept {
    if (name == nullptr || *name == '\0') return std::nullopt;
#if defined(_WIN32)
    char* buf = nullptr;
    size_t len = 0;
    const errno_t err = _dupenv_s(&buf, &len, name);
    if (err != 0 || buf == nullptr) {
        if (buf) std::free(buf);
        return std::nullopt;
    }
    std::string value(buf);
    std::free(buf);
    return value;
#else
    const char* v = std::getenv(name);
    if (!v) return std::nullopt;
    return std::string(v);
#endif
}

// Debug switches: set and non-empty, and not starting with '0'.
inline bool env_flag(const char* name) noexcept {
    auto v = safe_getenv(name);
    return v && !v->empty() && (*v)[0] != '0';
}

// Parses a non-negative decimal integer. Returns std::nullopt when the
// variable is unset; an engaged optional holding std::nullopt when it is set
// but not a valid number.
inline std::optional<std::optional<std::size_t>> env_size(const char* name) {
    auto v = safe_getenv(name);
    if (!v) return std::nullopt;
    std::string_view s{*v};
    std::size_t out = 0;
    const auto* first = s.data();
    const auto* last = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (s.empty() || ec != std::errc{} || ptr != last) {
        return std::optional<std::size_t>{};
    }
    return std::optional<std::size_t>{out};
}

} // namespace verdict::core
