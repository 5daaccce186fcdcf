#pragma once

/**
 * @file chunk_fetcher.hpp
 * @brief Bounded, cursor-driven fetches of the select statement
 *
 * The fetcher owns the prepared statement and its parameter set. Each
 * fetch binds $_limit to the chunk size and $_offset to the cursor's
 * fetch offset, replaces the chunk with what came back and advances the
 * offset by the number of rows received. An empty result means the source
 * is exhausted at that offset; it is not an error.
 */

#include <functional>
#include <memory>

#include "bulkstream/storage.hpp"
#include "common/lifetime_guard.hpp"
#include "common/status.hpp"
#include "common/types.hpp"
#include "query/query_builder.hpp"
#include "stream/stream_cursor.hpp"

namespace bulkstream {

class ChunkFetcher {
public:
  using DoneCallback = std::function<void(Status)>;

  /**
   * @param storage Storage that prepares and runs the statement
   * @param chunk_size Rows per fetch, already capped at the request limit
   */
  ChunkFetcher(Storage &storage, row_count_t chunk_size);

  /**
   * @brief Prepare the select statement; must complete before fetch()
   */
  void prepare(CompiledQuery query, DoneCallback done);

  /**
   * @brief Fetch the next chunk starting at cursor.fetch_offset
   *
   * On success chunk holds the new rows and cursor.fetch_offset has moved
   * past them. cursor and chunk must outlive the fetcher.
   */
  void fetch(StreamCursor &cursor, RowChunk &chunk, DoneCallback done);

  [[nodiscard]] bool prepared() const noexcept { return statement_ != nullptr; }
  [[nodiscard]] row_count_t chunk_size() const noexcept { return chunk_size_; }

  /// Number of fetches completed successfully
  [[nodiscard]] uint64_t fetch_count() const noexcept { return fetch_count_; }

private:
  Storage &storage_;
  row_count_t chunk_size_;
  std::unique_ptr<PreparedStatement> statement_;
  QueryParams params_;
  uint64_t fetch_count_ = 0;
  LifetimeGuard guard_;
};

} // namespace bulkstream
