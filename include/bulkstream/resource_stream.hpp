#pragma once

/**
 * @file resource_stream.hpp
 * @brief Pull-scheduled NDJSON stream over stored documents
 */

#include <cstdint>
#include <functional>
#include <memory>
#include <string_view>

#include <boost/asio/io_context.hpp>

#include "bulkstream/pagination.hpp"
#include "bulkstream/status.hpp"
#include "bulkstream/storage.hpp"
#include "bulkstream/stream_config.hpp"
#include "bulkstream/stream_request.hpp"

namespace bulkstream {

// Forward declarations
class ResourceStreamImpl;

/**
 * @brief Lifecycle of a stream
 */
enum class StreamState {
    kUninitialized,  // constructed, nothing issued yet
    kCounting,       // count query in flight
    kPreparing,      // select statement being prepared
    kFetching,       // chunk fetch in flight
    kReady,          // idle, waiting for the consumer to pull
    kEmitting,       // a pull is scheduled or being produced
    kDraining,       // end of sequence reached, end not yet delivered
    kFailed,         // terminal: an error was reported
    kDone,           // terminal: end of sequence delivered
};

/**
 * @brief Get the name of a state ("Ready", ...)
 */
const char* state_to_string(StreamState state) noexcept;

/**
 * @brief Streams the documents matching a request as newline-delimited JSON
 *
 * The stream counts the matching rows, prepares the select statement and
 * fetches a first chunk, then hands out one record per consumer pull. Each
 * pull waits for the configured throttle (or the next scheduler turn)
 * before it is served. Records after the first are preceded by "\n"; no
 * separator follows the last one.
 *
 * All callbacks run on the thread driving the io_context. Errors are
 * delivered one scheduler turn after they occur, so handlers attached
 * after a failing call still see them. Destroying the stream cancels any
 * pending tick and silences every outstanding callback.
 *
 * Example usage:
 * @code
 * bulkstream::ResourceStream stream(io, storage, request);
 * stream.on_data([&](std::string_view text) { out << text; });
 * stream.on_end([&] { out.flush(); });
 * stream.on_error([&](const bulkstream::Status& s) { ... });
 * stream.resume();
 * io.run();
 * @endcode
 */
class ResourceStream {
public:
    using DataHandler = std::function<void(std::string_view)>;
    using EndHandler = std::function<void()>;
    using ErrorHandler = std::function<void(const Status&)>;
    using ReadyHandler = std::function<void()>;

    /**
     * @brief Create a stream using the process-wide configuration
     * @param io Scheduler that drives the stream
     * @param storage Storage serving count and select queries; must outlive
     *                the stream
     * @param request What to stream
     */
    ResourceStream(boost::asio::io_context& io, Storage& storage,
                   StreamRequest request);

    /**
     * @brief Create a stream with an explicit configuration
     */
    ResourceStream(boost::asio::io_context& io, Storage& storage,
                   StreamRequest request, const StreamConfig& config);

    /**
     * @brief Destructor - cancels pending work
     */
    ~ResourceStream();

    // Non-copyable, non-movable (callbacks refer to the instance)
    ResourceStream(const ResourceStream&) = delete;
    ResourceStream& operator=(const ResourceStream&) = delete;
    ResourceStream(ResourceStream&&) = delete;
    ResourceStream& operator=(ResourceStream&&) = delete;

    /// Receives each record
    void on_data(DataHandler handler);

    /// Called once after the last record
    void on_end(EndHandler handler);

    /// Called once if the stream fails
    void on_error(ErrorHandler handler);

    /**
     * @brief Count, prepare and fetch the first chunk
     * @param ready Invoked once the stream is Ready; not invoked on failure
     */
    void init(ReadyHandler ready = {});

    /**
     * @brief Request one record
     *
     * Starts initialization if needed. At most one pull is outstanding;
     * further calls while one is pending are ignored.
     */
    void read();

    /**
     * @brief Pull continuously until the stream ends or fails
     */
    void resume();

    /**
     * @brief Stop pulling after the record in flight
     */
    void pause();

    [[nodiscard]] StreamState state() const noexcept;

    /// Pagination of the most recently emitted record
    [[nodiscard]] const PaginationState& pagination() const noexcept;

    /// Records emitted so far
    [[nodiscard]] uint64_t rows_emitted() const noexcept;

    [[nodiscard]] const StreamRequest& request() const noexcept;

private:
    std::unique_ptr<ResourceStreamImpl> impl_;
};

}  // namespace bulkstream
