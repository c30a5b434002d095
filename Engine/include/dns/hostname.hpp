/**
 * @file hostname.hpp
 * @brief Hostname normalization and the DNS alphabet
 */

#pragma once

#include <export.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace Regulator {

// Characters a normalized hostname may contain.
inline constexpr char k_dns_alphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789._-";
inline constexpr size_t k_dns_alphabet_size = sizeof(k_dns_alphabet) - 1;

// RFC 1035 upper bound on the textual length of a hostname.
inline constexpr size_t k_max_hostname_length = 253;

REGULATOR_API bool is_dns_char(char c) noexcept;

/**
 * @brief Canonical form of one input line.
 *
 * Trims whitespace, lower-cases, drops a leading "*." wildcard label and a
 * trailing root dot. Returns std::nullopt when the result is empty, longer
 * than k_max_hostname_length, or contains characters outside k_dns_alphabet.
 */
REGULATOR_API std::optional<std::string> normalize_hostname(std::string_view raw);

/**
 * @brief Replace every run of two or more dots with a single dot.
 */
REGULATOR_API std::string collapse_dot_runs(std::string_view name);

} // namespace Regulator
