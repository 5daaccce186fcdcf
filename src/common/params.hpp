#pragma once

/**
 * @file params.hpp
 * @brief Lenient parsing of request and environment parameters
 */

#include <cstdint>
#include <optional>
#include <string_view>

namespace bulkstream {

/**
 * @brief Parse a decimal unsigned integer
 *
 * Surrounding whitespace is ignored. Returns nullopt for empty, signed,
 * non-numeric or out-of-range input.
 */
std::optional<uint64_t> try_parse_uint(std::string_view text) noexcept;

/**
 * @brief Parse a decimal unsigned integer, or return fallback
 */
uint64_t parse_uint(std::string_view text, uint64_t fallback) noexcept;

/**
 * @brief Parse a boolean flag
 *
 * "", "0", "no", "false", "off", "null", "undefined" and "nan" (any case,
 * trimmed) are false; everything else is true.
 */
bool parse_bool(std::string_view text) noexcept;

}  // namespace bulkstream
