/**
 * @file amplifier.cpp
 * @brief Amplifier implementation
 */

#include "stream/amplifier.hpp"

#include "common/logger.hpp"
#include "common/types.hpp"
#include "stream/uid_rewriter.hpp"

namespace bulkstream {

bool Amplifier::can_replay(const StreamCursor &cursor) noexcept {
  const auto &state = cursor.pagination;

  // No demand when the offset lies past the amplified total
  const uint64_t amplified = state.amplified_total();
  if (amplified <= state.offset) {
    return false;
  }

  return cursor.row_index < amplified - state.offset &&
         state.page <= state.total_pages;
}

void Amplifier::rewind(StreamCursor &cursor) noexcept {
  cursor.pagination.overflow += 1;
  cursor.fetch_offset = 0;
  cursor.rewound = true;
  LOG_DEBUG("Replay round {} starting at logical row {}",
            cursor.pagination.overflow, cursor.row_index);
}

std::string Amplifier::prefix(const PaginationState &state) {
  std::string out;
  if (state.page > FIRST_PAGE) {
    out += "p" + std::to_string(state.page);
  }
  if (state.overflow > NO_OVERFLOW) {
    if (!out.empty()) {
      out += "-";
    }
    out += "o" + std::to_string(state.overflow);
  }
  return out;
}

std::string Amplifier::rewrite(std::string_view document,
                               const PaginationState &state) {
  return rewrite_uids(document, prefix(state));
}

} // namespace bulkstream
