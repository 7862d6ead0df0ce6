#pragma once

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <system_error>

namespace vigil::core {

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

// Parsed numeric/boolean views over safe_getenv. An unset variable yields
// std::nullopt; a set but unparsable one yields std::nullopt as well, and the
// caller decides whether that is a configuration error.
inline std::optional<double> env_double(const char* name) {
    auto v = safe_getenv(name);
    if (!v || v->empty()) return std::nullopt;
    try {
        std::size_t pos = 0;
        const double d = std::stod(*v, &pos);
        if (pos != v->size()) return std::nullopt;
        return d;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

inline std::optional<std::uint64_t> env_uint(const char* name) {
    auto v = safe_getenv(name);
    if (!v || v->empty()) return std::nullopt;
    std::uint64_t out = 0;
    const auto* first = v->data();
    const auto* last = v->data() + v->size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (ec != std::errc{} || ptr != last) return std::nullopt;
    return out;
}

inline std::optional<bool> env_bool(const char* name) {
    auto v = safe_getenv(name);
    if (!v || v->empty()) return std::nullopt;
    const char c = (*v)[0];
    if (c == '1' || c == 't' || c == 'T' || c == 'y' || c == 'Y') return true;
    if (c == '0' || c == 'f' || c == 'F' || c == 'n' || c == 'N') return false;
    return std::nullopt;
}

} // namespace vigil::core
