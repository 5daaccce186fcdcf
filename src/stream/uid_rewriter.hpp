#pragma once

/**
 * @file uid_rewriter.hpp
 * @brief Prefixing of UUID-shaped tokens inside stored documents
 *
 * A token is a canonical 8-4-4-4-12 group of hex digits standing alone as
 * a word: neither neighbour is a letter, digit or underscore. Rewriting
 * turns each token T into "<prefix>-T", so stripping the prefix recovers
 * the original.
 */

#include <cstddef>
#include <string>
#include <string_view>

namespace bulkstream {

/// Length of a canonical UUID (36)
constexpr size_t kUidLength = 36;

/**
 * @brief Check whether a standalone UUID token starts at pos
 */
[[nodiscard]] bool is_uid_at(std::string_view text, size_t pos) noexcept;

/**
 * @brief Prepend "<prefix>-" to every UUID token in document
 *
 * An empty prefix returns the document unchanged.
 */
[[nodiscard]] std::string rewrite_uids(std::string_view document,
                                       std::string_view prefix);

/**
 * @brief Count the UUID tokens in a document
 */
[[nodiscard]] size_t count_uids(std::string_view document) noexcept;

/**
 * @brief Recover the original UUID from a rewritten token
 *
 * Drops the leading "p<n>-" and/or "o<n>-" segments; a token without them
 * is returned as is.
 */
[[nodiscard]] std::string_view strip_uid_prefix(std::string_view token) noexcept;

}  // namespace bulkstream
