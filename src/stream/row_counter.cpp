/**
 * @file row_counter.cpp
 * @brief Row counter implementation
 */

#include "stream/row_counter.hpp"

#include "common/config.hpp"
#include "common/logger.hpp"

namespace bulkstream {

RowCounter::RowCounter(Storage &storage, const QueryBuilder &builder)
    : storage_(storage), builder_(builder) {}

void RowCounter::count(CountCallback done) {
  CompiledQuery query;
  Status status = builder_.compile_count(config::kCountAlias, &query);
  if (!status.ok()) {
    done(std::move(status), 0);
    return;
  }

  LOG_TRACE("Count query: {}", query.sql);
  storage_.all(
      std::move(query.sql), std::move(query.params),
      guard_.bind([done = std::move(done)](Result result) {
        if (!result.ok()) {
          done(result.status(), 0);
          return;
        }

        row_count_t total = 0;
        for (const auto &row : result) {
          if (!row.has_column(config::kCountAlias)) {
            done(Status::Internal("count query returned no count column"), 0);
            return;
          }
          auto count = row[config::kCountAlias].try_int64();
          if (count.has_value() && *count > 0) {
            total += static_cast<row_count_t>(*count);
          }
        }
        done(Status::Ok(), total);
      }));
}

} // namespace bulkstream
