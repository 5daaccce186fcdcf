#pragma once

/**
 * @file status.hpp
 * @brief Public status and error codes for bulkstream
 */

#include <string>
#include <string_view>

namespace bulkstream {

/**
 * @brief Status codes for stream and storage operations
 */
enum class StatusCode {
    kOk = 0,
    kError,
    kNotFound,
    kInvalidArgument,
    kIOError,
    kCorruption,
    kNotSupported,
    kBusy,
    kTimeout,
    kAborted,
    kCancelled,
    kInternal,
};

/**
 * @brief Status class for operation results
 *
 * Status encapsulates the result of an operation. It can indicate success
 * or failure, and in case of failure, provides an error code and message.
 * Asynchronous operations hand a Status to their completion callback.
 */
class Status {
public:
    /**
     * @brief Create a success status
     */
    Status() noexcept : code_(StatusCode::kOk) {}

    /**
     * @brief Create a status with the given code
     */
    explicit Status(StatusCode code) noexcept : code_(code) {}

    /**
     * @brief Create a status with code and message
     */
    Status(StatusCode code, std::string message) noexcept
        : code_(code), message_(std::move(message)) {}

    // Factory methods for common statuses
    [[nodiscard]] static Status Ok() noexcept { return Status(); }
    [[nodiscard]] static Status Error(std::string msg = "") { return Status(StatusCode::kError, std::move(msg)); }
    [[nodiscard]] static Status NotFound(std::string msg = "") { return Status(StatusCode::kNotFound, std::move(msg)); }
    [[nodiscard]] static Status InvalidArgument(std::string msg = "") { return Status(StatusCode::kInvalidArgument, std::move(msg)); }
    [[nodiscard]] static Status IOError(std::string msg = "") { return Status(StatusCode::kIOError, std::move(msg)); }
    [[nodiscard]] static Status Corruption(std::string msg = "") { return Status(StatusCode::kCorruption, std::move(msg)); }
    [[nodiscard]] static Status NotSupported(std::string msg = "") { return Status(StatusCode::kNotSupported, std::move(msg)); }
    [[nodiscard]] static Status Busy(std::string msg = "") { return Status(StatusCode::kBusy, std::move(msg)); }
    [[nodiscard]] static Status Timeout(std::string msg = "") { return Status(StatusCode::kTimeout, std::move(msg)); }
    [[nodiscard]] static Status Aborted(std::string msg = "") { return Status(StatusCode::kAborted, std::move(msg)); }
    [[nodiscard]] static Status Cancelled(std::string msg = "") { return Status(StatusCode::kCancelled, std::move(msg)); }
    [[nodiscard]] static Status Internal(std::string msg = "") { return Status(StatusCode::kInternal, std::move(msg)); }

    // Query methods
    [[nodiscard]] bool ok() const noexcept { return code_ == StatusCode::kOk; }
    [[nodiscard]] bool is_error() const noexcept { return code_ != StatusCode::kOk; }
    [[nodiscard]] bool is_invalid_argument() const noexcept { return code_ == StatusCode::kInvalidArgument; }
    [[nodiscard]] bool is_corruption() const noexcept { return code_ == StatusCode::kCorruption; }

    [[nodiscard]] StatusCode code() const noexcept { return code_; }
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /**
     * @brief Get a human-readable string representation
     */
    [[nodiscard]] std::string to_string() const;

    // Implicit conversion to bool for convenience
    explicit operator bool() const noexcept { return ok(); }

private:
    StatusCode code_;
    std::string message_;
};

}  // namespace bulkstream
