/**
 * @file emitter_test.cpp
 * @brief Unit tests for Emitter
 */

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "stream/emitter.hpp"
#include "test_utils.hpp"

namespace bulkstream {
namespace {

class EmitterTest : public ::testing::Test {
protected:
    void configure(uint64_t limit, uint64_t offset, uint64_t m, uint64_t total) {
        request_.types = {"Patient"};
        request_.limit = limit;
        request_.offset = offset;
        request_.multiplier = m;

        cursor_ = StreamCursor();
        cursor_.pagination.limit = limit;
        cursor_.pagination.offset = offset;
        cursor_.pagination.multiplier = m;
        cursor_.pagination.reset(total);
        cursor_.fetch_offset = offset;
    }

    static Row make_row(const std::string& json, Value modified = Value()) {
        return Row({Value(json), std::move(modified)},
                   {"resource_json", "modified_date"});
    }

    void load(std::vector<Row> rows, row_count_t requested) {
        chunk_.replace(std::move(rows), requested);
    }

    EmitStep step() {
        Emitter emitter(request_, cursor_, chunk_);
        EmitStep out;
        status_ = emitter.next(&out);
        return out;
    }

    StreamRequest request_;
    StreamCursor cursor_;
    RowChunk chunk_;
    Status status_;
};

TEST_F(EmitterTest, RecordsAreSeparatedNotTerminated) {
    configure(10, 0, 1, 2);
    load({make_row("{\"a\":1}"), make_row("{\"a\":2}")}, 10);

    auto first = step();
    ASSERT_TRUE(status_.ok());
    EXPECT_EQ(first.kind, EmitStep::Kind::kRecord);
    EXPECT_EQ(first.text, "{\"a\":1}");

    auto second = step();
    EXPECT_EQ(second.kind, EmitStep::Kind::kRecord);
    EXPECT_EQ(second.text, "\n{\"a\":2}");
    EXPECT_EQ(cursor_.row_index, 2u);

    auto end = step();
    EXPECT_EQ(end.kind, EmitStep::Kind::kEnd);
    EXPECT_TRUE(end.text.empty());
}

TEST_F(EmitterTest, StopsAtLimit) {
    configure(1, 0, 1, 2);
    load({make_row("{}"), make_row("{}")}, 1);

    EXPECT_EQ(step().kind, EmitStep::Kind::kRecord);
    EXPECT_EQ(step().kind, EmitStep::Kind::kEnd);
    EXPECT_EQ(chunk_.size(), 1u);
}

TEST_F(EmitterTest, ZeroLimitEndsImmediately) {
    configure(0, 0, 1, 2);
    load({make_row("{}")}, 0);
    EXPECT_EQ(step().kind, EmitStep::Kind::kEnd);
}

TEST_F(EmitterTest, FullChunkAsksForContinuation) {
    configure(10, 0, 1, 5);
    load({make_row("{}"), make_row("{}")}, 2);
    cursor_.fetch_offset = 2;

    step();
    step();
    auto refill = step();
    EXPECT_EQ(refill.kind, EmitStep::Kind::kRefill);
    EXPECT_EQ(cursor_.pagination.overflow, 0u);
    EXPECT_EQ(cursor_.fetch_offset, 2u);
}

TEST_F(EmitterTest, ShortChunkStartsReplay) {
    configure(10, 0, 3, 2);
    load({make_row("{}"), make_row("{}")}, 10);
    cursor_.fetch_offset = 2;

    step();
    step();
    auto refill = step();
    EXPECT_EQ(refill.kind, EmitStep::Kind::kRefill);
    EXPECT_EQ(cursor_.pagination.overflow, 1u);
    EXPECT_EQ(cursor_.fetch_offset, 0u);
    EXPECT_TRUE(cursor_.rewound);
}

TEST_F(EmitterTest, EmptyReplayEnds) {
    configure(10, 0, 3, 2);
    cursor_.rewound = true;
    load({}, 10);
    EXPECT_EQ(step().kind, EmitStep::Kind::kEnd);
}

TEST_F(EmitterTest, PrefixFollowsPageAndRound) {
    configure(2, 2, 1, 5);
    const std::string uid(test::kUid1);
    load({make_row(test::make_document("Patient", uid))}, 2);

    auto record = step();
    ASSERT_EQ(record.kind, EmitStep::Kind::kRecord);
    EXPECT_EQ(record.text, test::make_document("Patient", "p2-" + uid));
    EXPECT_EQ(cursor_.pagination.page, 2u);
}

TEST_F(EmitterTest, ExtendedInjectsModifiedDate) {
    configure(10, 0, 1, 1);
    request_.extended = true;
    load({make_row("{\"resourceType\":\"Patient\",\"id\":\"x\"}",
                   Value("2020-05-01T00:00:00Z"))},
         10);

    auto record = step();
    ASSERT_TRUE(status_.ok()) << status_.to_string();
    EXPECT_EQ(record.text,
              "{\"resourceType\":\"Patient\",\"id\":\"x\","
              "\"__modified_date\":\"2020-05-01T00:00:00Z\"}");
}

TEST_F(EmitterTest, ExtendedNullModifiedDate) {
    configure(10, 0, 1, 1);
    request_.extended = true;
    load({make_row("{\"id\":\"x\"}")}, 10);

    auto record = step();
    ASSERT_TRUE(status_.ok());
    auto parsed = nlohmann::json::parse(record.text);
    EXPECT_TRUE(parsed["__modified_date"].is_null());
}

TEST_F(EmitterTest, ExtendedMalformedDocument) {
    configure(10, 0, 1, 1);
    request_.extended = true;
    load({make_row("{not json", Value("2020"))}, 10);

    step();
    EXPECT_TRUE(status_.is_corruption());
    EXPECT_EQ(cursor_.row_index, 0u);
}

TEST_F(EmitterTest, ExtendedRejectsNonObject) {
    configure(10, 0, 1, 1);
    request_.extended = true;
    load({make_row("[1,2]", Value("2020"))}, 10);

    step();
    EXPECT_TRUE(status_.is_corruption());
}

TEST_F(EmitterTest, MissingDocumentColumn) {
    configure(10, 0, 1, 1);
    chunk_.replace({Row({Value("x")}, {"other"})}, 10);

    step();
    EXPECT_TRUE(status_.is_corruption());
}

}  // namespace
}  // namespace bulkstream
