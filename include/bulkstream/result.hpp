#pragma once

/**
 * @file result.hpp
 * @brief Storage row and query result types for bulkstream
 */

#include <algorithm>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "bulkstream/status.hpp"

namespace bulkstream {

/**
 * @brief Represents a value stored in, or bound to, a database column
 */
class Value {
public:
    using ValueType = std::variant<
        std::monostate,  // NULL
        bool,
        int64_t,
        double,
        std::string
    >;

    /// Construct a NULL value
    Value() : value_(std::monostate{}) {}

    /// Construct from various types
    explicit Value(bool v) : value_(v) {}
    explicit Value(int64_t v) : value_(v) {}
    /// Clamped to INT64_MAX, the largest integer SQLite stores
    explicit Value(uint64_t v)
        : value_(static_cast<int64_t>(
              std::min<uint64_t>(v, std::numeric_limits<int64_t>::max()))) {}
    explicit Value(int v) : value_(static_cast<int64_t>(v)) {}
    explicit Value(double v) : value_(v) {}
    explicit Value(std::string v) : value_(std::move(v)) {}
    explicit Value(const char* v) : value_(std::string(v)) {}

    /// Check if the value is NULL
    [[nodiscard]] bool is_null() const noexcept {
        return std::holds_alternative<std::monostate>(value_);
    }

    /// Type checking methods
    [[nodiscard]] bool is_bool() const noexcept { return std::holds_alternative<bool>(value_); }
    [[nodiscard]] bool is_int64() const noexcept { return std::holds_alternative<int64_t>(value_); }
    [[nodiscard]] bool is_double() const noexcept { return std::holds_alternative<double>(value_); }
    [[nodiscard]] bool is_string() const noexcept { return std::holds_alternative<std::string>(value_); }

    /// Value retrieval methods (throw if wrong type)
    [[nodiscard]] int64_t as_int64() const;
    [[nodiscard]] double as_double() const;
    [[nodiscard]] const std::string& as_string() const;

    /// Safe value retrieval (returns nullopt if wrong type or NULL)
    [[nodiscard]] std::optional<int64_t> try_int64() const noexcept;

    /// Access the underlying variant
    [[nodiscard]] const ValueType& variant() const noexcept { return value_; }

    /// Convert to string representation
    [[nodiscard]] std::string to_string() const;

    bool operator==(const Value& other) const noexcept { return value_ == other.value_; }

private:
    ValueType value_;
};

/// Named parameters bound to a statement ("$_limit" -> 500)
using QueryParams = std::map<std::string, Value>;

/**
 * @brief Represents a single row returned by storage
 */
class Row {
public:
    Row() = default;
    explicit Row(std::vector<Value> values, std::vector<std::string> column_names);

    /// Get value by column index
    [[nodiscard]] const Value& operator[](size_t index) const;

    /// Get value by column name
    [[nodiscard]] const Value& operator[](std::string_view name) const;

    /// Check whether the row carries a column
    [[nodiscard]] bool has_column(std::string_view name) const noexcept;

    /// Get number of columns
    [[nodiscard]] size_t size() const noexcept { return values_.size(); }

    /// Check if row is empty
    [[nodiscard]] bool empty() const noexcept { return values_.empty(); }

    /// Iterator support
    [[nodiscard]] auto begin() const noexcept { return values_.begin(); }
    [[nodiscard]] auto end() const noexcept { return values_.end(); }

private:
    std::vector<Value> values_;
    std::vector<std::string> column_names_;
};

/**
 * @brief Result of a storage query
 *
 * Result represents either a success with (possibly zero) rows, or an error.
 */
class Result {
public:
    /// Create an error result
    explicit Result(Status status);

    /// Create a success result with rows
    Result(std::vector<Row> rows, std::vector<std::string> column_names);

    /// Check if the query succeeded
    [[nodiscard]] bool ok() const noexcept { return status_.ok(); }

    /// Get the status
    [[nodiscard]] const Status& status() const noexcept { return status_; }

    /// Get the rows
    [[nodiscard]] const std::vector<Row>& rows() const noexcept { return rows_; }

    /// Take ownership of the rows
    [[nodiscard]] std::vector<Row> take_rows() noexcept { return std::move(rows_); }

    /// Get the column names
    [[nodiscard]] const std::vector<std::string>& column_names() const noexcept { return column_names_; }

    /// Get the number of rows returned
    [[nodiscard]] size_t row_count() const noexcept { return rows_.size(); }

    /// Iterator support for range-based for loops
    [[nodiscard]] auto begin() const noexcept { return rows_.begin(); }
    [[nodiscard]] auto end() const noexcept { return rows_.end(); }

private:
    Status status_;
    std::vector<Row> rows_;
    std::vector<std::string> column_names_;
};

}  // namespace bulkstream
