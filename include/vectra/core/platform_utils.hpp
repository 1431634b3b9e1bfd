#pragma once

/** \file platform_utils.hpp
 *  \brief Environment access and typed parsing of environment overrides.
 */

#include <cstdint>
#include <cstdlib>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include "vectra/error.hpp"

namespace vectra::core {

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

/** \brief Parse "1/0/true/false/on/off/yes/no" (case-sensitive lowercase). */
auto parse_bool(std::string_view text) -> std::expected<bool, error>;

/** \brief Parse a non-negative decimal integer; rejects trailing characters. */
auto parse_uint(std::string_view text) -> std::expected<std::uint64_t, error>;

/** \brief Parse a finite float; rejects trailing characters. */
auto parse_float(std::string_view text) -> std::expected<float, error>;

} // namespace vectra::core
