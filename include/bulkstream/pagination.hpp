#pragma once

/**
 * @file pagination.hpp
 * @brief Page and overflow bookkeeping of one stream
 */

#include <cstdint>

namespace bulkstream {

/**
 * @brief Pagination of a stream over its physical result set
 *
 * page and overflow never decrease during the lifetime of one stream.
 */
struct PaginationState {
    /// Logical rows requested
    uint64_t limit = 0;

    /// Logical position of the first requested row
    uint64_t offset = 0;

    /// Copies of the physical result set the request may span
    uint64_t multiplier = 1;

    /// Rows physically matching the filter (ignores multiplier)
    uint64_t total = 0;

    /// 1-based page of the most recently emitted row
    uint64_t page = 1;

    /// ceil(total * multiplier / limit)
    uint64_t total_pages = 0;

    /// Completed replay rounds of the physical result set
    uint64_t overflow = 0;

    /**
     * @brief Initialize from a row count: page and total_pages are derived
     */
    void reset(uint64_t counted_total);

    /**
     * @brief total * multiplier, saturated at UINT64_MAX
     */
    [[nodiscard]] uint64_t amplified_total() const noexcept;

    /**
     * @brief Page holding the record at a logical row index
     *
     * floor((offset + row_index) / limit) + 1; page 1 when limit is zero.
     * The sum saturates rather than wrapping.
     */
    [[nodiscard]] uint64_t page_at(uint64_t row_index) const noexcept;
};

}  // namespace bulkstream
