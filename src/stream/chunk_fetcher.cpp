/**
 * @file chunk_fetcher.cpp
 * @brief Chunk fetcher implementation
 */

#include "stream/chunk_fetcher.hpp"

#include "common/config.hpp"
#include "common/logger.hpp"

namespace bulkstream {

ChunkFetcher::ChunkFetcher(Storage &storage, row_count_t chunk_size)
    : storage_(storage), chunk_size_(chunk_size) {}

void ChunkFetcher::prepare(CompiledQuery query, DoneCallback done) {
  params_ = query.params;
  LOG_TRACE("Select query: {}", query.sql);

  storage_.prepare(
      std::move(query.sql), std::move(query.params),
      guard_.bind([this, done = std::move(done)](
                      Status status,
                      std::unique_ptr<PreparedStatement> statement) {
        if (status.ok() && statement == nullptr) {
          status = Status::Internal("storage returned no statement");
        }
        if (status.ok()) {
          statement_ = std::move(statement);
        }
        done(std::move(status));
      }));
}

void ChunkFetcher::fetch(StreamCursor &cursor, RowChunk &chunk,
                         DoneCallback done) {
  if (statement_ == nullptr) {
    done(Status::Internal("fetch before prepare"));
    return;
  }

  params_[config::kLimitParam] = Value(chunk_size_);
  params_[config::kOffsetParam] = Value(cursor.fetch_offset);

  const row_count_t requested = chunk_size_;
  const row_count_t from = cursor.fetch_offset;
  statement_->all(
      params_, guard_.bind([this, &cursor, &chunk, requested, from,
                            done = std::move(done)](Result result) {
        if (!result.ok()) {
          LOG_ERROR("Fetch at offset {} failed: {}", from,
                    result.status().to_string());
          done(result.status());
          return;
        }

        std::vector<Row> rows = result.take_rows();
        const row_count_t received = rows.size();
        chunk.replace(std::move(rows), requested);
        cursor.fetch_offset += received;
        if (received > 0) {
          cursor.rewound = false;
        }
        ++fetch_count_;

        LOG_DEBUG("Fetched {} of {} rows at offset {}", received, requested,
                  from);
        done(Status::Ok());
      }));
}

} // namespace bulkstream
