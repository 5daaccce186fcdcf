#pragma once

/**
 * @file config.hpp
 * @brief Configuration constants for bulkstream
 */

#include <cstddef>
#include <cstdint>

namespace bulkstream {
namespace config {

// ─────────────────────────────────────────────────────────────────────────────
// Stream Configuration
// ─────────────────────────────────────────────────────────────────────────────

/// Default number of logical rows per request when no limit is given
constexpr uint64_t kDefaultPageSize = 10000;

/// Default maximum number of rows held in memory per fetch
constexpr uint64_t kDefaultRowsPerChunk = 500;

/// Default delay before each pull in milliseconds (0 = next tick)
constexpr uint32_t kDefaultThrottleMs = 0;

/// Default multiplier applied to the physical row count
constexpr uint64_t kDefaultMultiplier = 1;

// ─────────────────────────────────────────────────────────────────────────────
// Environment Variables
// ─────────────────────────────────────────────────────────────────────────────

constexpr const char* kPageSizeEnv = "BULKSTREAM_PAGE_SIZE";
constexpr const char* kRowsPerChunkEnv = "BULKSTREAM_ROWS_PER_CHUNK";
constexpr const char* kThrottleEnv = "BULKSTREAM_THROTTLE_MS";

// ─────────────────────────────────────────────────────────────────────────────
// Data Table
// ─────────────────────────────────────────────────────────────────────────────

/// Table holding one stored document per row
constexpr const char* kDataTable = "data";

constexpr const char* kIdColumn = "id";
constexpr const char* kTypeColumn = "fhir_type";
constexpr const char* kDocumentColumn = "resource_json";
constexpr const char* kModifiedColumn = "modified_date";
constexpr const char* kGroupColumn = "group_id";

/// Alias of the per-type row count in count queries
constexpr const char* kCountAlias = "totalRows";

/// Field injected into documents in extended mode
constexpr const char* kModifiedDateField = "__modified_date";

// ─────────────────────────────────────────────────────────────────────────────
// Bound Parameter Names
// ─────────────────────────────────────────────────────────────────────────────

constexpr const char* kLimitParam = "$_limit";
constexpr const char* kOffsetParam = "$_offset";
constexpr const char* kGroupParam = "$_group";
constexpr const char* kStartParam = "$_start";
constexpr const char* kTypeParamPrefix = "$_type";

}  // namespace config
}  // namespace bulkstream
