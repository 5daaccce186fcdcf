#pragma once

/**
 * @file query_builder.hpp
 * @brief Translates a document filter into parameterized SQL
 *
 * Two statement forms are produced from the same filter:
 * - compile(): the paged "select" used by the chunk fetcher; its window is
 *   bound through $_limit / $_offset so it can be moved between fetches
 * - compile_count(): per-type row counts used to size the stream
 */

#include <cstdint>
#include <string>
#include <vector>

#include "bulkstream/result.hpp"
#include "common/status.hpp"

namespace bulkstream {

/**
 * @brief Filter and projection of a document query
 */
struct QueryOptions {
  uint64_t limit = 0;
  uint64_t offset = 0;
  std::string group;
  std::string start;
  std::vector<std::string> types;
  bool system_level = false;
  std::vector<std::string> columns;
};

/**
 * @brief SQL text plus the named parameters it expects
 */
struct CompiledQuery {
  std::string sql;
  QueryParams params;
};

class QueryBuilder {
public:
  explicit QueryBuilder(QueryOptions options);

  /**
   * @brief Compile the paged select statement
   * @param out Receives SQL and parameters ($_limit, $_offset preset)
   * @return kInvalidArgument for unknown columns or an empty projection
   */
  [[nodiscard]] Status compile(CompiledQuery *out) const;

  /**
   * @brief Compile the count statement grouped by resource type
   * @param alias Name of the count column
   */
  [[nodiscard]] Status compile_count(const std::string &alias,
                                     CompiledQuery *out) const;

  [[nodiscard]] const QueryOptions &options() const noexcept {
    return options_;
  }

private:
  /// Append the WHERE clause (if any) and bind its parameters
  void append_filters(std::string *sql, QueryParams *params) const;

  QueryOptions options_;
};

/**
 * @brief Check whether a name is a column of the data table
 */
bool is_known_column(const std::string &name) noexcept;

} // namespace bulkstream
