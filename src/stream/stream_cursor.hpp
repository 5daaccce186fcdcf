#pragma once

/**
 * @file stream_cursor.hpp
 * @brief Mutable position of one stream and its in-memory row chunk
 */

#include <deque>
#include <optional>
#include <vector>

#include "bulkstream/pagination.hpp"
#include "bulkstream/result.hpp"
#include "common/types.hpp"

namespace bulkstream {

/**
 * @brief Everything a stream advances while it emits
 *
 * Owned by exactly one stream and handed by reference to the fetch,
 * replay and emit steps; never shared.
 */
struct StreamCursor {
  PaginationState pagination;

  /// Logical records emitted so far
  row_index_t row_index = 0;

  /// Physical row the next fetch starts at ($_offset)
  row_count_t fetch_offset = 0;

  /// Set when a replay round rewound the fetch offset and no row has
  /// arrived since
  bool rewound = false;
};

/**
 * @brief Bounded FIFO of fetched rows, replaced wholesale per fetch
 */
class RowChunk {
public:
  /// Replace the contents with a fresh fetch of at most requested rows
  void replace(std::vector<Row> rows, row_count_t requested) {
    rows_.clear();
    for (auto &row : rows) {
      rows_.push_back(std::move(row));
    }
    requested_ = requested;
    received_ = rows_.size();
  }

  /// Pop the head row, if any
  std::optional<Row> pop() {
    if (rows_.empty()) {
      return std::nullopt;
    }
    Row row = std::move(rows_.front());
    rows_.pop_front();
    return row;
  }

  [[nodiscard]] bool empty() const noexcept { return rows_.empty(); }
  [[nodiscard]] size_t size() const noexcept { return rows_.size(); }

  /// Rows delivered by the last fetch
  [[nodiscard]] row_count_t received() const noexcept { return received_; }

  /// Whether the last fetch filled its window (more rows may follow)
  [[nodiscard]] bool was_full() const noexcept {
    return requested_ > 0 && received_ == requested_;
  }

private:
  std::deque<Row> rows_;
  row_count_t requested_ = 0;
  row_count_t received_ = 0;
};

} // namespace bulkstream
