#pragma once

/**
 * @file row_counter.hpp
 * @brief Counts the rows a stream's filter matches
 */

#include <functional>

#include "bulkstream/storage.hpp"
#include "common/lifetime_guard.hpp"
#include "common/status.hpp"
#include "common/types.hpp"
#include "query/query_builder.hpp"

namespace bulkstream {

/**
 * @brief Issues the grouped count query and sums it over resource types
 *
 * The multiplier is not applied here; the total is the physical count.
 */
class RowCounter {
public:
  using CountCallback = std::function<void(Status, row_count_t)>;

  RowCounter(Storage &storage, const QueryBuilder &builder);

  /**
   * @brief Count matching rows
   * @param done Receives the total, or the storage error (not retried)
   */
  void count(CountCallback done);

private:
  Storage &storage_;
  const QueryBuilder &builder_;
  LifetimeGuard guard_;
};

} // namespace bulkstream
