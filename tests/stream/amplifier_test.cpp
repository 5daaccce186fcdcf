/**
 * @file amplifier_test.cpp
 * @brief Unit tests for Amplifier
 */

#include <gtest/gtest.h>

#include <limits>
#include <string>

#include "stream/amplifier.hpp"
#include "test_utils.hpp"

namespace bulkstream {
namespace {

StreamCursor make_cursor(uint64_t limit, uint64_t offset, uint64_t m,
                         uint64_t total) {
  StreamCursor cursor;
  cursor.pagination.limit = limit;
  cursor.pagination.offset = offset;
  cursor.pagination.multiplier = m;
  cursor.pagination.reset(total);
  cursor.fetch_offset = offset;
  return cursor;
}

TEST(AmplifierTest, ReplayWhileDemandRemains) {
  auto cursor = make_cursor(10, 0, 3, 4);

  cursor.row_index = 4;
  EXPECT_TRUE(Amplifier::can_replay(cursor));

  cursor.row_index = 11;
  EXPECT_TRUE(Amplifier::can_replay(cursor));

  cursor.row_index = 12;
  EXPECT_FALSE(Amplifier::can_replay(cursor));
}

TEST(AmplifierTest, NoReplayWithoutMultiplier) {
  auto cursor = make_cursor(10, 0, 1, 4);
  cursor.row_index = 4;
  EXPECT_FALSE(Amplifier::can_replay(cursor));
}

TEST(AmplifierTest, OffsetPastAmplifiedTotal) {
  auto cursor = make_cursor(2, 40, 2, 5);
  cursor.row_index = 0;
  EXPECT_FALSE(Amplifier::can_replay(cursor));
}

TEST(AmplifierTest, PageBeyondTotalPagesStopsReplay) {
  auto cursor = make_cursor(2, 0, 3, 3);
  cursor.row_index = 3;
  EXPECT_TRUE(Amplifier::can_replay(cursor));

  cursor.pagination.page = cursor.pagination.total_pages + 1;
  EXPECT_FALSE(Amplifier::can_replay(cursor));
}

TEST(AmplifierTest, HugeMultiplierKeepsReplaying) {
  auto cursor = make_cursor(10000, 0, uint64_t{1} << 40, uint64_t{1} << 30);
  EXPECT_GT(cursor.pagination.total_pages, 1u);

  cursor.row_index = uint64_t{1} << 30;
  EXPECT_TRUE(Amplifier::can_replay(cursor));
}

TEST(AmplifierTest, HugeOffsetWithHugeMultiplier) {
  auto cursor = make_cursor(10, std::numeric_limits<uint64_t>::max(),
                            uint64_t{1} << 40, uint64_t{1} << 30);
  EXPECT_FALSE(Amplifier::can_replay(cursor));
}

TEST(AmplifierTest, Rewind) {
  auto cursor = make_cursor(10, 0, 3, 4);
  cursor.fetch_offset = 4;

  Amplifier::rewind(cursor);
  EXPECT_EQ(cursor.pagination.overflow, 1u);
  EXPECT_EQ(cursor.fetch_offset, 0u);
  EXPECT_TRUE(cursor.rewound);

  Amplifier::rewind(cursor);
  EXPECT_EQ(cursor.pagination.overflow, 2u);
}

TEST(AmplifierTest, Prefix) {
  PaginationState state;
  EXPECT_EQ(Amplifier::prefix(state), "");

  state.page = 3;
  EXPECT_EQ(Amplifier::prefix(state), "p3");

  state.overflow = 2;
  EXPECT_EQ(Amplifier::prefix(state), "p3-o2");

  state.page = 1;
  EXPECT_EQ(Amplifier::prefix(state), "o2");
}

TEST(AmplifierTest, RewriteAppliesPrefix) {
  PaginationState state;
  state.page = 2;
  state.overflow = 1;

  auto document = test::make_document("Patient", test::kUid1);
  EXPECT_EQ(Amplifier::rewrite(document, state),
            test::make_document("Patient",
                                "p2-o1-" + std::string(test::kUid1)));
}

} // namespace
} // namespace bulkstream
