#pragma once

/**
 * @file emitter.hpp
 * @brief One production step of a stream
 *
 * Streaming LIMIT over the chunk:
 * - pops at most one row per step, never looks ahead
 * - asks for a refill when the chunk runs dry and more rows can follow
 * - stops at the logical limit or when the source and replays are spent
 */

#include <string>

#include "bulkstream/stream_request.hpp"
#include "common/status.hpp"
#include "stream/stream_cursor.hpp"

namespace bulkstream {

/**
 * @brief Outcome of one production step
 */
struct EmitStep {
  enum class Kind {
    kRecord, // text holds the next record
    kRefill, // fetch into the chunk at cursor.fetch_offset, then step again
    kEnd,    // end of sequence
  };

  Kind kind = Kind::kEnd;
  std::string text;
};

class Emitter {
public:
  /**
   * @param request Request being served
   * @param cursor Stream position, advanced by next()
   * @param chunk Rows fetched so far, consumed head-first
   */
  Emitter(const StreamRequest &request, StreamCursor &cursor, RowChunk &chunk);

  /**
   * @brief Produce the next step
   * @return kCorruption when a row cannot be turned into a record
   */
  [[nodiscard]] Status next(EmitStep *step);

private:
  /// Serialize one row at the current cursor position
  [[nodiscard]] Status format(const Row &row, std::string *out) const;

  const StreamRequest &request_;
  StreamCursor &cursor_;
  RowChunk &chunk_;
};

} // namespace bulkstream
