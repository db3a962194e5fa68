#pragma once

/** \file env.hpp
 *  \brief Environment lookups backing the TWEETSET_* configuration overrides.
 */

#include <charconv>
#include <cstddef>
#include <cstdlib>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "tweetset/error.hpp"

namespace tweetset::core {

/**
 * \brief Value of environment variable `name`.
 *
 * Unset (or a null/empty name) gives std::nullopt; a variable set to "" gives an
 * engaged empty string where the platform keeps such variables.
 */
inline std::optional<std::string> safe_getenv(const char* name) noexcept {
    if (name == nullptr || name[0] == '\0') return std::nullopt;
#if defined(_WIN32)
    char* raw = nullptr;
    std::size_t len = 0;
    const errno_t rc = _dupenv_s(&raw, &len, name);
    std::unique_ptr<char, decltype(&std::free)> owned(raw, &std::free);
    if (rc != 0 || !owned) return std::nullopt;
    return std::string(owned.get());
#else
    if (const char* v = std::getenv(name)) return std::string(v);
    return std::nullopt;
#endif
}

// On when set, non-empty and not starting with '0'.
inline bool env_flag(const char* name) noexcept {
    auto v = safe_getenv(name);
    return v && !v->empty() && ((*v)[0] != '0');
}

/**
 * \brief Strict base-10 size: digits only, no sign or whitespace, no trailing
 * characters, no overflow. Shared by the environment and command-line parsers.
 */
inline std::optional<std::size_t> parse_size(std::string_view s) noexcept {
    if (s.empty()) return std::nullopt;
    std::size_t n = 0;
    const char* end = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(s.data(), end, n, 10);
    if (ec != std::errc() || ptr != end) return std::nullopt;
    return n;
}

// Unsigned decimal variable: nullopt when unset, config_invalid when malformed.
inline auto env_size(const char* name) -> std::expected<std::optional<std::size_t>, error> {
    auto v = safe_getenv(name);
    if (!v) return std::optional<std::size_t>{};
    if (auto n = parse_size(*v)) return n;
    return std::unexpected(error{error_code::config_invalid,
                                 std::string("invalid ") + name + "=\"" + *v + "\"", "tweetset.env"});
}

} // namespace tweetset::core
