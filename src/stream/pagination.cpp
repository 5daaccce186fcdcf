/**
 * @file pagination.cpp
 * @brief PaginationState implementation
 */

#include "bulkstream/pagination.hpp"

#include <limits>

#include "common/types.hpp"

namespace bulkstream {

void PaginationState::reset(uint64_t counted_total) {
  total = counted_total;
  overflow = NO_OVERFLOW;
  page = page_at(0);

  // A zero limit never emits, so it spans no pages
  if (limit == 0) {
    total_pages = 0;
    return;
  }
  const uint64_t logical = amplified_total();
  total_pages = logical / limit + (logical % limit != 0 ? 1 : 0);
}

uint64_t PaginationState::amplified_total() const noexcept {
  constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();
  if (multiplier != 0 && total > kMax / multiplier) {
    return kMax;
  }
  return total * multiplier;
}

uint64_t PaginationState::page_at(uint64_t row_index) const noexcept {
  if (limit == 0) {
    return FIRST_PAGE;
  }
  constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();
  const uint64_t position =
      row_index > kMax - offset ? kMax : offset + row_index;
  return position / limit + FIRST_PAGE;
}

} // namespace bulkstream
