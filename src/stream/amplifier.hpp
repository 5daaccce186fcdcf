#pragma once

/**
 * @file amplifier.hpp
 * @brief Replay of the physical result set for multiplied requests
 *
 * A request may ask for more logical rows than physically match
 * (multiplier > 1). Once the fetch cursor runs dry the amplifier rewinds
 * it to the first physical row and counts one more overflow round. Rows of
 * later pages or rounds get their UUIDs prefixed so replayed copies stay
 * distinct.
 */

#include <string>
#include <string_view>

#include "bulkstream/pagination.hpp"
#include "stream/stream_cursor.hpp"

namespace bulkstream {

class Amplifier {
public:
  /**
   * @brief Whether rewinding can still satisfy outstanding demand
   *
   * row_index < total * multiplier - offset, and the last emitted page has
   * not gone past total_pages.
   */
  [[nodiscard]] static bool can_replay(const StreamCursor &cursor) noexcept;

  /**
   * @brief Start the next replay round: overflow + 1, fetch offset 0
   */
  static void rewind(StreamCursor &cursor) noexcept;

  /**
   * @brief Rewrite prefix for a page and round
   *
   * "p<page>" when page > 1 and "o<overflow>" when overflow > 0, joined by
   * '-'; empty on page 1 of round 0.
   */
  [[nodiscard]] static std::string prefix(const PaginationState &state);

  /**
   * @brief Apply the prefix for state to every UUID in document
   */
  [[nodiscard]] static std::string rewrite(std::string_view document,
                                           const PaginationState &state);
};

} // namespace bulkstream
