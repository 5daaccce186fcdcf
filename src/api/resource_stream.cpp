/**
 * @file resource_stream.cpp
 * @brief ResourceStream implementation: count, prepare, fetch and emit
 */

#include "bulkstream/resource_stream.hpp"

#include <algorithm>
#include <chrono>
#include <utility>
#include <vector>

#include <boost/asio/post.hpp>

#include "common/lifetime_guard.hpp"
#include "common/logger.hpp"
#include "query/query_builder.hpp"
#include "stream/chunk_fetcher.hpp"
#include "stream/emitter.hpp"
#include "stream/pull_scheduler.hpp"
#include "stream/row_counter.hpp"
#include "stream/stream_cursor.hpp"

namespace bulkstream {

const char *state_to_string(StreamState state) noexcept {
  switch (state) {
  case StreamState::kUninitialized:
    return "Uninitialized";
  case StreamState::kCounting:
    return "Counting";
  case StreamState::kPreparing:
    return "Preparing";
  case StreamState::kFetching:
    return "Fetching";
  case StreamState::kReady:
    return "Ready";
  case StreamState::kEmitting:
    return "Emitting";
  case StreamState::kDraining:
    return "Draining";
  case StreamState::kFailed:
    return "Failed";
  case StreamState::kDone:
    return "Done";
  }
  return "Unknown";
}

namespace {

QueryOptions make_query_options(const StreamRequest &request) {
  QueryOptions options;
  options.limit = request.limit;
  options.offset = request.offset;
  options.group = request.group;
  options.start = request.start;
  options.types = request.types;
  options.system_level = request.system_level;
  options.columns = request.columns();
  return options;
}

std::string join_types(const std::vector<std::string> &types) {
  std::string joined;
  for (const auto &type : types) {
    if (!joined.empty()) {
      joined += ",";
    }
    joined += type;
  }
  return joined;
}

} // namespace

class ResourceStreamImpl {
public:
  ResourceStreamImpl(boost::asio::io_context &io, Storage &storage,
                     StreamRequest request, const StreamConfig &config)
      : io_(io), request_(std::move(request)), config_(config),
        builder_(make_query_options(request_)), counter_(storage, builder_),
        fetcher_(storage, std::min<row_count_t>(config_.rows_per_chunk,
                                                request_.limit)),
        emitter_(request_, cursor_, chunk_),
        scheduler_(io, std::chrono::milliseconds(config_.throttle_ms)) {
    Logger::init();

    auto &pagination = cursor_.pagination;
    pagination.limit = request_.limit;
    pagination.offset = request_.offset;
    pagination.multiplier = request_.multiplier;
    cursor_.fetch_offset = request_.offset;
  }

  ~ResourceStreamImpl() {
    if (state_ != StreamState::kDone && state_ != StreamState::kFailed &&
        state_ != StreamState::kUninitialized) {
      LOG_DEBUG("Stream destroyed while {} after {} records",
                state_to_string(state_), cursor_.row_index);
    }
    scheduler_.cancel();
  }

  void on_data(ResourceStream::DataHandler handler) {
    on_data_ = std::move(handler);
  }
  void on_end(ResourceStream::EndHandler handler) {
    on_end_ = std::move(handler);
  }
  void on_error(ResourceStream::ErrorHandler handler) {
    on_error_ = std::move(handler);
  }

  void init(ResourceStream::ReadyHandler ready) {
    if (ready) {
      ready_waiters_.push_back(std::move(ready));
    }

    if (state_ != StreamState::kUninitialized) {
      if (initialized_ && !terminal()) {
        notify_ready();
      }
      return;
    }

    Status status = config_.validate();
    if (!status.ok()) {
      fail(std::move(status));
      return;
    }

    LOG_INFO("Streaming {} (limit {}, offset {}, m {}, extended {})",
             join_types(request_.types), request_.limit, request_.offset,
             request_.multiplier, request_.extended);

    set_state(StreamState::kCounting);
    counter_.count(guard_.bind([this](Status status, row_count_t total) {
      on_counted(std::move(status), total);
    }));
  }

  void read() {
    switch (state_) {
    case StreamState::kUninitialized:
      pull_requested_ = true;
      init({});
      return;
    case StreamState::kCounting:
    case StreamState::kPreparing:
      pull_requested_ = true;
      return;
    case StreamState::kFetching:
      // Before the first chunk the pull waits for Ready; afterwards a
      // refill is already serving the outstanding pull
      if (!initialized_) {
        pull_requested_ = true;
      }
      return;
    case StreamState::kReady:
      break;
    case StreamState::kEmitting:
    case StreamState::kDraining:
    case StreamState::kFailed:
    case StreamState::kDone:
      return;
    }

    set_state(StreamState::kEmitting);
    scheduler_.schedule([this]() { produce(); });
  }

  void resume() {
    flowing_ = true;
    read();
  }

  void pause() { flowing_ = false; }

  StreamState state() const noexcept { return state_; }
  const PaginationState &pagination() const noexcept {
    return cursor_.pagination;
  }
  uint64_t rows_emitted() const noexcept { return cursor_.row_index; }
  const StreamRequest &request() const noexcept { return request_; }

private:
  // ─────────────────────────────────────────────────────────────────────────
  // Initialization
  // ─────────────────────────────────────────────────────────────────────────

  void on_counted(Status status, row_count_t total) {
    if (!status.ok()) {
      fail(std::move(status));
      return;
    }

    auto &pagination = cursor_.pagination;
    pagination.reset(total);
    LOG_DEBUG("Counted {} rows: page {} of {}", total, pagination.page,
              pagination.total_pages);

    CompiledQuery query;
    status = builder_.compile(&query);
    if (!status.ok()) {
      fail(std::move(status));
      return;
    }

    set_state(StreamState::kPreparing);
    fetcher_.prepare(std::move(query), guard_.bind([this](Status status) {
      on_prepared(std::move(status));
    }));
  }

  void on_prepared(Status status) {
    if (!status.ok()) {
      fail(std::move(status));
      return;
    }

    set_state(StreamState::kFetching);
    fetcher_.fetch(cursor_, chunk_, guard_.bind([this](Status status) {
      on_first_chunk(std::move(status));
    }));
  }

  void on_first_chunk(Status status) {
    if (!status.ok()) {
      fail(std::move(status));
      return;
    }

    initialized_ = true;
    set_state(StreamState::kReady);

    auto alive = guard_.watch();
    notify_ready();
    if (alive.expired()) {
      return;
    }

    if (pull_requested_ || flowing_) {
      pull_requested_ = false;
      read();
    }
  }

  void notify_ready() {
    auto waiters = std::move(ready_waiters_);
    ready_waiters_.clear();

    auto alive = guard_.watch();
    for (auto &ready : waiters) {
      ready();
      if (alive.expired()) {
        return;
      }
    }
  }

  // ─────────────────────────────────────────────────────────────────────────
  // Emission
  // ─────────────────────────────────────────────────────────────────────────

  /// Serve the outstanding pull
  void produce() {
    if (state_ != StreamState::kEmitting) {
      return;
    }

    EmitStep step;
    Status status = emitter_.next(&step);
    if (!status.ok()) {
      fail(std::move(status));
      return;
    }

    switch (step.kind) {
    case EmitStep::Kind::kRecord:
      emit(std::move(step.text));
      return;
    case EmitStep::Kind::kRefill:
      refill();
      return;
    case EmitStep::Kind::kEnd:
      finish();
      return;
    }
  }

  void refill() {
    set_state(StreamState::kFetching);
    fetcher_.fetch(cursor_, chunk_, guard_.bind([this](Status status) {
      if (!status.ok()) {
        fail(std::move(status));
        return;
      }
      set_state(StreamState::kEmitting);
      produce();
    }));
  }

  void emit(std::string text) {
    set_state(StreamState::kReady);

    // The handler may destroy the stream; call a copy
    auto alive = guard_.watch();
    if (auto handler = on_data_) {
      handler(text);
    }
    if (alive.expired()) {
      return;
    }

    if (flowing_) {
      read();
    }
  }

  void finish() {
    set_state(StreamState::kDraining);
    const auto &pagination = cursor_.pagination;
    LOG_INFO("Stream finished: {} records, page {}, overflow {}, {} fetches",
             cursor_.row_index, pagination.page, pagination.overflow,
             fetcher_.fetch_count());

    boost::asio::post(io_, guard_.bind([this]() {
      set_state(StreamState::kDone);
      if (auto handler = on_end_) {
        handler();
      }
    }));
  }

  // ─────────────────────────────────────────────────────────────────────────
  // Failure
  // ─────────────────────────────────────────────────────────────────────────

  /// Enter Failed and report status on the next scheduler turn
  void fail(Status status) {
    if (terminal()) {
      return;
    }

    LOG_ERROR("Stream failed while {}: {}", state_to_string(state_),
              status.to_string());
    set_state(StreamState::kFailed);
    scheduler_.cancel();
    ready_waiters_.clear();

    boost::asio::post(io_, guard_.bind([this, status = std::move(status)]() {
      if (auto handler = on_error_) {
        handler(status);
      }
    }));
  }

  bool terminal() const noexcept {
    return state_ == StreamState::kFailed || state_ == StreamState::kDone ||
           state_ == StreamState::kDraining;
  }

  void set_state(StreamState state) {
    if (state_ != state) {
      LOG_TRACE("Stream state {} -> {}", state_to_string(state_),
                state_to_string(state));
      state_ = state;
    }
  }

  boost::asio::io_context &io_;
  StreamRequest request_;
  StreamConfig config_;

  QueryBuilder builder_;
  StreamCursor cursor_;
  RowChunk chunk_;

  RowCounter counter_;
  ChunkFetcher fetcher_;
  Emitter emitter_;
  PullScheduler scheduler_;

  StreamState state_ = StreamState::kUninitialized;
  bool initialized_ = false;
  bool pull_requested_ = false;
  bool flowing_ = false;

  ResourceStream::DataHandler on_data_;
  ResourceStream::EndHandler on_end_;
  ResourceStream::ErrorHandler on_error_;
  std::vector<ResourceStream::ReadyHandler> ready_waiters_;

  LifetimeGuard guard_;
};

ResourceStream::ResourceStream(boost::asio::io_context &io, Storage &storage,
                               StreamRequest request)
    : ResourceStream(io, storage, std::move(request), process_config()) {}

ResourceStream::ResourceStream(boost::asio::io_context &io, Storage &storage,
                               StreamRequest request,
                               const StreamConfig &config)
    : impl_(std::make_unique<ResourceStreamImpl>(io, storage,
                                                 std::move(request), config)) {}

ResourceStream::~ResourceStream() = default;

void ResourceStream::on_data(DataHandler handler) {
  impl_->on_data(std::move(handler));
}

void ResourceStream::on_end(EndHandler handler) {
  impl_->on_end(std::move(handler));
}

void ResourceStream::on_error(ErrorHandler handler) {
  impl_->on_error(std::move(handler));
}

void ResourceStream::init(ReadyHandler ready) { impl_->init(std::move(ready)); }

void ResourceStream::read() { impl_->read(); }

void ResourceStream::resume() { impl_->resume(); }

void ResourceStream::pause() { impl_->pause(); }

StreamState ResourceStream::state() const noexcept { return impl_->state(); }

const PaginationState &ResourceStream::pagination() const noexcept {
  return impl_->pagination();
}

uint64_t ResourceStream::rows_emitted() const noexcept {
  return impl_->rows_emitted();
}

const StreamRequest &ResourceStream::request() const noexcept {
  return impl_->request();
}

} // namespace bulkstream
