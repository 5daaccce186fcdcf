#pragma once

/**
 * @file storage.hpp
 * @brief Asynchronous storage interface consumed by streams
 */

#include <functional>
#include <memory>
#include <string>

#include "bulkstream/result.hpp"
#include "bulkstream/status.hpp"

namespace bulkstream {

/// Completion of a row-returning query
using ResultCallback = std::function<void(Result)>;

/**
 * @brief A statement prepared once and executed many times
 *
 * The statement is owned by a single stream; parameters are supplied on
 * every execution so the caller can move its page window between calls.
 */
class PreparedStatement {
public:
    virtual ~PreparedStatement() = default;

    /**
     * @brief Execute with the given bound parameters and collect all rows
     * @param params Named parameters; names not used by the SQL are ignored
     * @param callback Invoked asynchronously with the rows or an error
     */
    virtual void all(const QueryParams& params, ResultCallback callback) = 0;
};

/// Completion of a prepare call
using PrepareCallback =
    std::function<void(Status, std::unique_ptr<PreparedStatement>)>;

/**
 * @brief Storage layer backing document streams
 *
 * Implementations must never invoke a callback before the initiating call
 * returns. Every accepted call completes exactly once: work queued before the
 * storage is closed or destroyed completes with an Aborted status.
 */
class Storage {
public:
    virtual ~Storage() = default;

    /**
     * @brief Prepare a statement for repeated execution
     */
    virtual void prepare(std::string sql, QueryParams params,
                         PrepareCallback callback) = 0;

    /**
     * @brief Run a one-shot query and collect all rows
     */
    virtual void all(std::string sql, QueryParams params,
                     ResultCallback callback) = 0;
};

}  // namespace bulkstream
