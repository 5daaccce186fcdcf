#pragma once

/**
 * @file types.hpp
 * @brief Common type definitions for bulkstream
 */

#include <cstdint>

namespace bulkstream {

// ─────────────────────────────────────────────────────────────────────────────
// Basic Type Aliases
// ─────────────────────────────────────────────────────────────────────────────

/// Count of physical rows or logical records
using row_count_t = uint64_t;

/// Logical position of a record within one stream (0-based)
using row_index_t = uint64_t;

/// 1-based page number
using page_no_t = uint64_t;

/// Number of completed replay rounds
using round_t = uint64_t;

// ─────────────────────────────────────────────────────────────────────────────
// Sentinel Values
// ─────────────────────────────────────────────────────────────────────────────

/// First page number
constexpr page_no_t FIRST_PAGE = 1;

/// Round number before any replay
constexpr round_t NO_OVERFLOW = 0;

}  // namespace bulkstream
