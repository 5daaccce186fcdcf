/**
 * @file resource_stream_test.cpp
 * @brief Integration tests for ResourceStream over SQLite
 */

#include <gtest/gtest.h>

#include <chrono>
#include <random>

#include <nlohmann/json.hpp>

#include "bulkstream/bulkstream.hpp"
#include "fake_storage.hpp"
#include "storage/resource_seeder.hpp"
#include "stream/uid_rewriter.hpp"
#include "test_utils.hpp"

namespace bulkstream {
namespace {

class ResourceStreamTest : public ::testing::Test {
protected:
  void SetUp() override {
    temp_file_ = std::make_unique<test::TempFile>("stream_test_");
    storage_ = std::make_unique<SqliteStorage>(io_);
    ASSERT_TRUE(storage_->open(temp_file_->string()).ok());
    ASSERT_TRUE(storage_->create_schema().ok());

    config_.rows_per_chunk = 500;
    config_.throttle_ms = 0;
  }

  void TearDown() override {
    storage_.reset();
    temp_file_.reset();
  }

  /// Insert count patients; remembers their ids in insertion order
  void add_patients(int count, const std::string &group = "") {
    std::mt19937_64 rng(7 + uids_.size());
    for (int i = 0; i < count; ++i) {
      std::string uid = make_uid(rng);
      std::string modified =
          "2020-01-" + std::string(i < 9 ? "0" : "") + std::to_string(i + 1);
      ASSERT_TRUE(storage_
                      ->insert_resource({"Patient",
                                         test::make_document("Patient", uid),
                                         modified, group})
                      .ok());
      uids_.push_back(uid);
    }
  }

  StreamRequest request(uint64_t limit, uint64_t offset = 0,
                        uint64_t m = 1) const {
    StreamRequest request;
    request.types = {"Patient"};
    request.limit = limit;
    request.offset = offset;
    request.multiplier = m;
    return request;
  }

  test::StreamCapture run(const StreamRequest &req) {
    ResourceStream stream(io_, *storage_, req, config_);
    test::StreamCapture capture;
    capture.attach(stream);
    stream.resume();
    test::run_for(io_);
    last_state_ = stream.state();
    last_pagination_ = stream.pagination();
    return capture;
  }

  std::string doc(size_t index, const std::string &prefix = "") const {
    return test::make_document(
        "Patient", prefix.empty() ? uids_[index] : prefix + "-" + uids_[index]);
  }

  boost::asio::io_context io_;
  std::unique_ptr<test::TempFile> temp_file_;
  std::unique_ptr<SqliteStorage> storage_;
  StreamConfig config_;
  std::vector<std::string> uids_;
  StreamState last_state_ = StreamState::kUninitialized;
  PaginationState last_pagination_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Paging
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(ResourceStreamTest, FirstPageIsNotRewritten) {
  add_patients(5);

  auto capture = run(request(2));
  ASSERT_FALSE(capture.failed()) << capture.errors[0].to_string();
  EXPECT_EQ(capture.end_calls, 1);
  EXPECT_EQ(capture.documents(),
            (std::vector<std::string>{doc(0), doc(1)}));
  EXPECT_EQ(capture.output, doc(0) + "\n" + doc(1));
  EXPECT_EQ(last_state_, StreamState::kDone);
  EXPECT_EQ(last_pagination_.page, 1u);
  EXPECT_EQ(last_pagination_.total, 5u);
}

TEST_F(ResourceStreamTest, LastPartialPage) {
  add_patients(5);

  auto capture = run(request(2, 4));
  ASSERT_FALSE(capture.failed());
  EXPECT_EQ(capture.documents(), std::vector<std::string>{doc(4, "p3")});
  EXPECT_EQ(last_pagination_.page, 3u);
  EXPECT_EQ(last_pagination_.total_pages, 3u);
}

TEST_F(ResourceStreamTest, ShortResultWithoutMultiplier) {
  add_patients(5);

  auto capture = run(request(10, 2));
  ASSERT_FALSE(capture.failed());
  ASSERT_EQ(capture.records.size(), 3u);
  EXPECT_EQ(capture.documents()[0], doc(2));
  EXPECT_EQ(capture.documents()[2], doc(4));
  EXPECT_EQ(last_pagination_.overflow, 0u);
}

TEST_F(ResourceStreamTest, OffsetPastTotal) {
  add_patients(3);

  auto capture = run(request(2, 10));
  ASSERT_FALSE(capture.failed());
  EXPECT_TRUE(capture.records.empty());
  EXPECT_EQ(capture.end_calls, 1);
}

TEST_F(ResourceStreamTest, PageChangesWithinOneStream) {
  add_patients(10);

  auto capture = run(request(3, 2));
  ASSERT_FALSE(capture.failed());
  // offset 2, limit 3: positions 2 | 3 4 fall on pages 1 | 2
  EXPECT_EQ(capture.documents(),
            (std::vector<std::string>{doc(2), doc(3, "p2"), doc(4, "p2")}));
}

TEST_F(ResourceStreamTest, ZeroLimitIsEmpty) {
  add_patients(3);

  auto capture = run(request(0));
  ASSERT_FALSE(capture.failed());
  EXPECT_TRUE(capture.output.empty());
  EXPECT_EQ(capture.end_calls, 1);
  EXPECT_EQ(last_pagination_.total_pages, 0u);
}

TEST_F(ResourceStreamTest, EmptyTable) {
  auto capture = run(request(10, 0, 3));
  ASSERT_FALSE(capture.failed());
  EXPECT_TRUE(capture.records.empty());
  EXPECT_EQ(capture.end_calls, 1);
}

// ─────────────────────────────────────────────────────────────────────────────
// Replay rounds
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(ResourceStreamTest, MultiplierReplaysRounds) {
  add_patients(4);

  auto capture = run(request(10, 0, 3));
  ASSERT_FALSE(capture.failed());
  EXPECT_EQ(capture.documents(),
            (std::vector<std::string>{doc(0), doc(1), doc(2), doc(3),
                                      doc(0, "o1"), doc(1, "o1"), doc(2, "o1"),
                                      doc(3, "o1"), doc(0, "o2"),
                                      doc(1, "o2")}));
  EXPECT_EQ(last_pagination_.overflow, 2u);
}

TEST_F(ResourceStreamTest, MultiplierCapsAtAmplifiedTotal) {
  add_patients(3);

  auto capture = run(request(100, 0, 2));
  ASSERT_FALSE(capture.failed());
  EXPECT_EQ(capture.records.size(), 6u);
}

TEST_F(ResourceStreamTest, RewrittenIdsRecoverOriginals) {
  add_patients(4);

  auto capture = run(request(4, 4, 3));
  ASSERT_FALSE(capture.failed());
  ASSERT_EQ(capture.records.size(), 4u);

  for (size_t i = 0; i < capture.records.size(); ++i) {
    auto parsed = nlohmann::json::parse(capture.documents()[i]);
    auto id = parsed["id"].get<std::string>();
    EXPECT_NE(id, uids_[i]);
    EXPECT_EQ(strip_uid_prefix(id), uids_[i]);
  }
}

TEST_F(ResourceStreamTest, SmallChunksContinueBeforeReplay) {
  add_patients(5);
  config_.rows_per_chunk = 2;

  auto capture = run(request(10));
  ASSERT_FALSE(capture.failed());
  EXPECT_EQ(capture.documents(),
            (std::vector<std::string>{doc(0), doc(1), doc(2), doc(3),
                                      doc(4)}));
  EXPECT_EQ(last_pagination_.overflow, 0u);
}

TEST_F(ResourceStreamTest, SmallChunksWithReplay) {
  add_patients(4);
  config_.rows_per_chunk = 2;

  auto capture = run(request(8, 0, 2));
  ASSERT_FALSE(capture.failed());
  EXPECT_EQ(capture.documents(),
            (std::vector<std::string>{doc(0), doc(1), doc(2), doc(3),
                                      doc(0, "o1"), doc(1, "o1"), doc(2, "o1"),
                                      doc(3, "o1")}));
}

// ─────────────────────────────────────────────────────────────────────────────
// Filters and output variants
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(ResourceStreamTest, GroupFilter) {
  add_patients(2, "g1");
  add_patients(3, "g2");

  auto req = request(10);
  req.group = "g2";
  auto capture = run(req);
  ASSERT_FALSE(capture.failed());
  EXPECT_EQ(capture.documents(),
            (std::vector<std::string>{doc(2), doc(3), doc(4)}));

  req.system_level = true;
  capture = run(req);
  EXPECT_EQ(capture.records.size(), 5u);
}

TEST_F(ResourceStreamTest, SinceFilter) {
  add_patients(5);

  auto req = request(10);
  req.start = "2020-01-04";
  auto capture = run(req);
  ASSERT_FALSE(capture.failed());
  EXPECT_EQ(capture.documents(), (std::vector<std::string>{doc(3), doc(4)}));
}

TEST_F(ResourceStreamTest, OtherTypesExcluded) {
  add_patients(2);
  ASSERT_TRUE(storage_
                  ->insert_resource({"Observation",
                                     test::make_document("Observation",
                                                         test::kUid3),
                                     "", ""})
                  .ok());

  auto capture = run(request(10));
  EXPECT_EQ(capture.records.size(), 2u);
  EXPECT_EQ(last_pagination_.total, 2u);
}

TEST_F(ResourceStreamTest, ExtendedCarriesModifiedDate) {
  add_patients(3);

  auto req = request(10);
  req.extended = true;
  auto capture = run(req);
  ASSERT_FALSE(capture.failed());
  ASSERT_EQ(capture.records.size(), 3u);

  for (size_t i = 0; i < 3; ++i) {
    auto parsed = nlohmann::json::parse(capture.documents()[i]);
    EXPECT_EQ(parsed["id"], uids_[i]);
    EXPECT_EQ(parsed["__modified_date"], "2020-01-0" + std::to_string(i + 1));
  }
}

TEST_F(ResourceStreamTest, Idempotent) {
  add_patients(6);

  auto first = run(request(5, 3, 2));
  auto second = run(request(5, 3, 2));
  ASSERT_FALSE(first.failed());
  EXPECT_FALSE(first.output.empty());
  EXPECT_EQ(first.output, second.output);
}

// ─────────────────────────────────────────────────────────────────────────────
// Pull scheduling and lifecycle
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(ResourceStreamTest, InitThenPullOneAtATime) {
  add_patients(3);

  ResourceStream stream(io_, *storage_, request(10), config_);
  test::StreamCapture capture;
  capture.attach(stream);
  EXPECT_EQ(stream.state(), StreamState::kUninitialized);

  bool ready = false;
  stream.init([&ready]() { ready = true; });
  EXPECT_EQ(stream.state(), StreamState::kCounting);
  test::run_for(io_);
  EXPECT_TRUE(ready);
  EXPECT_EQ(stream.state(), StreamState::kReady);
  EXPECT_TRUE(capture.records.empty());

  stream.read();
  stream.read(); // ignored while a pull is pending
  test::run_for(io_);
  EXPECT_EQ(capture.records.size(), 1u);
  EXPECT_EQ(stream.rows_emitted(), 1u);

  stream.read();
  test::run_for(io_);
  stream.read();
  test::run_for(io_);
  EXPECT_EQ(capture.records.size(), 3u);
  EXPECT_FALSE(capture.ended());

  stream.read();
  test::run_for(io_);
  EXPECT_TRUE(capture.ended());
  EXPECT_EQ(stream.state(), StreamState::kDone);

  stream.read();
  test::run_for(io_);
  EXPECT_EQ(capture.end_calls, 1);
}

TEST_F(ResourceStreamTest, ReadBeforeInitStartsStream) {
  add_patients(2);

  ResourceStream stream(io_, *storage_, request(10), config_);
  test::StreamCapture capture;
  capture.attach(stream);

  stream.read();
  test::run_for(io_);
  EXPECT_EQ(capture.records.size(), 1u);
}

TEST_F(ResourceStreamTest, PauseStopsFlowing) {
  add_patients(5);

  ResourceStream stream(io_, *storage_, request(10), config_);
  test::StreamCapture capture;
  stream.on_data([&](std::string_view text) {
    capture.records.emplace_back(text);
    if (capture.records.size() == 2) {
      stream.pause();
    }
  });
  stream.resume();
  test::run_for(io_);
  EXPECT_EQ(capture.records.size(), 2u);
  EXPECT_EQ(stream.state(), StreamState::kReady);

  stream.resume();
  test::run_for(io_);
  EXPECT_EQ(capture.records.size(), 5u);
}

TEST_F(ResourceStreamTest, DestroyCancelsPendingPull) {
  add_patients(3);

  auto stream =
      std::make_unique<ResourceStream>(io_, *storage_, request(10), config_);
  test::StreamCapture capture;
  capture.attach(*stream);
  stream->init();
  test::run_for(io_);

  stream->read();
  stream.reset();
  test::run_for(io_);

  EXPECT_TRUE(capture.records.empty());
  EXPECT_FALSE(capture.ended());
  EXPECT_FALSE(capture.failed());
}

TEST_F(ResourceStreamTest, DestroyFromDataHandler) {
  add_patients(5);

  auto stream =
      std::make_unique<ResourceStream>(io_, *storage_, request(10), config_);
  int records = 0;
  bool ended = false;
  stream->on_data([&](std::string_view) {
    ++records;
    stream.reset();
  });
  stream->on_end([&ended]() { ended = true; });
  stream->resume();
  test::run_for(io_);

  EXPECT_EQ(records, 1);
  EXPECT_FALSE(ended);
}

TEST_F(ResourceStreamTest, DestroyDuringInitialization) {
  add_patients(2);

  bool called = false;
  {
    ResourceStream stream(io_, *storage_, request(10), config_);
    stream.on_data([&called](std::string_view) { called = true; });
    stream.on_error([&called](const Status &) { called = true; });
    stream.resume();
  }
  test::run_for(io_);
  EXPECT_FALSE(called);
}

TEST_F(ResourceStreamTest, ThrottleDelaysEachRecord) {
  add_patients(3);
  config_.throttle_ms = 20;

  auto start = std::chrono::steady_clock::now();
  auto capture = run(request(3));
  auto elapsed = std::chrono::steady_clock::now() - start;

  ASSERT_FALSE(capture.failed());
  EXPECT_EQ(capture.records.size(), 3u);
  EXPECT_GE(elapsed, std::chrono::milliseconds(60));
}

// ─────────────────────────────────────────────────────────────────────────────
// Failures
// ─────────────────────────────────────────────────────────────────────────────

class ResourceStreamFailureTest : public ::testing::Test {
protected:
  ResourceStreamFailureTest() : storage_(io_) {
    config_.rows_per_chunk = 2;
    for (int i = 0; i < 5; ++i) {
      storage_.add("Patient", "{\"n\":" + std::to_string(i) + "}");
    }
  }

  StreamRequest request() const {
    StreamRequest request;
    request.types = {"Patient"};
    request.limit = 10;
    return request;
  }

  boost::asio::io_context io_;
  test::FakeStorage storage_;
  StreamConfig config_;
};

TEST_F(ResourceStreamFailureTest, CountErrorIsDeferred) {
  storage_.fail_count(Status::Busy("locked"));

  ResourceStream stream(io_, storage_, request(), config_);
  stream.init();

  // Attached after the failing call was issued
  test::StreamCapture capture;
  capture.attach(stream);
  test::run_for(io_);

  ASSERT_EQ(capture.errors.size(), 1u);
  EXPECT_EQ(capture.errors[0].code(), StatusCode::kBusy);
  EXPECT_EQ(stream.state(), StreamState::kFailed);
  EXPECT_TRUE(capture.records.empty());
  EXPECT_FALSE(capture.ended());
  EXPECT_EQ(storage_.prepare_calls(), 0);
}

TEST_F(ResourceStreamFailureTest, PrepareError) {
  storage_.fail_prepare(Status::InvalidArgument("no such column"));

  ResourceStream stream(io_, storage_, request(), config_);
  test::StreamCapture capture;
  capture.attach(stream);
  stream.resume();
  test::run_for(io_);

  ASSERT_EQ(capture.errors.size(), 1u);
  EXPECT_TRUE(capture.errors[0].is_invalid_argument());
  EXPECT_TRUE(storage_.fetches().empty());
}

TEST_F(ResourceStreamFailureTest, FetchErrorMidStream) {
  storage_.fail_fetch(2, Status::IOError("disk"));

  ResourceStream stream(io_, storage_, request(), config_);
  test::StreamCapture capture;
  capture.attach(stream);
  stream.resume();
  test::run_for(io_);

  EXPECT_EQ(capture.records.size(), 2u);
  ASSERT_EQ(capture.errors.size(), 1u);
  EXPECT_EQ(capture.errors[0].code(), StatusCode::kIOError);
  EXPECT_FALSE(capture.ended());

  stream.read();
  test::run_for(io_);
  EXPECT_EQ(capture.records.size(), 2u);
  EXPECT_EQ(capture.errors.size(), 1u);
}

TEST_F(ResourceStreamFailureTest, MalformedExtendedDocument) {
  storage_.add("Patient", "not json");

  auto req = request();
  req.extended = true;
  req.offset = 5;
  ResourceStream stream(io_, storage_, req, config_);
  test::StreamCapture capture;
  capture.attach(stream);
  stream.resume();
  test::run_for(io_);

  ASSERT_EQ(capture.errors.size(), 1u);
  EXPECT_TRUE(capture.errors[0].is_corruption());
  EXPECT_TRUE(capture.records.empty());
}

TEST_F(ResourceStreamFailureTest, InvalidConfig) {
  config_.rows_per_chunk = 0;

  ResourceStream stream(io_, storage_, request(), config_);
  test::StreamCapture capture;
  capture.attach(stream);
  stream.resume();
  test::run_for(io_);

  ASSERT_EQ(capture.errors.size(), 1u);
  EXPECT_TRUE(capture.errors[0].is_invalid_argument());
  EXPECT_EQ(storage_.count_calls(), 0);
}

TEST_F(ResourceStreamFailureTest, StateNames) {
  EXPECT_STREQ(state_to_string(StreamState::kReady), "Ready");
  EXPECT_STREQ(state_to_string(StreamState::kDraining), "Draining");
  EXPECT_STREQ(state_to_string(StreamState::kFailed), "Failed");
}

TEST_F(ResourceStreamFailureTest, Version) {
  EXPECT_STREQ(version(), "0.1.0");
  EXPECT_EQ(version_major(), 0);
  EXPECT_EQ(version_minor(), 1);
  EXPECT_EQ(version_patch(), 0);
}

} // namespace
} // namespace bulkstream
