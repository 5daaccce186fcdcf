/**
 * @file query_builder.cpp
 * @brief Query builder implementation
 */

#include "query/query_builder.hpp"

#include <array>
#include <utility>

#include "common/config.hpp"

namespace bulkstream {

namespace {

std::string quote(const std::string &identifier) {
  return "\"" + identifier + "\"";
}

constexpr std::array<const char *, 5> kKnownColumns = {
    config::kIdColumn,       config::kTypeColumn,  config::kDocumentColumn,
    config::kModifiedColumn, config::kGroupColumn,
};

} // namespace

bool is_known_column(const std::string &name) noexcept {
  for (const char *column : kKnownColumns) {
    if (name == column) {
      return true;
    }
  }
  return false;
}

QueryBuilder::QueryBuilder(QueryOptions options)
    : options_(std::move(options)) {}

void QueryBuilder::append_filters(std::string *sql, QueryParams *params) const {
  std::vector<std::string> where;

  if (!options_.types.empty()) {
    std::string in = quote(config::kTypeColumn) + " IN(";
    for (size_t i = 0; i < options_.types.size(); ++i) {
      std::string name = config::kTypeParamPrefix + std::to_string(i);
      if (i > 0) {
        in += ", ";
      }
      in += name;
      (*params)[name] = Value(options_.types[i]);
    }
    in += ")";
    where.push_back(std::move(in));
  }

  // A system-level export spans every group
  if (!options_.group.empty() && !options_.system_level) {
    where.push_back(quote(config::kGroupColumn) + " = " + config::kGroupParam);
    (*params)[config::kGroupParam] = Value(options_.group);
  }

  if (!options_.start.empty()) {
    where.push_back(quote(config::kModifiedColumn) + " >= " +
                    config::kStartParam);
    (*params)[config::kStartParam] = Value(options_.start);
  }

  for (size_t i = 0; i < where.size(); ++i) {
    *sql += i == 0 ? " WHERE " : " AND ";
    *sql += where[i];
  }
}

Status QueryBuilder::compile(CompiledQuery *out) const {
  if (options_.columns.empty()) {
    return Status::InvalidArgument("no columns selected");
  }

  std::string sql = "SELECT ";
  for (size_t i = 0; i < options_.columns.size(); ++i) {
    const auto &column = options_.columns[i];
    if (!is_known_column(column)) {
      return Status::InvalidArgument("unknown column: " + column);
    }
    if (i > 0) {
      sql += ", ";
    }
    sql += quote(column);
  }
  sql += " FROM " + quote(config::kDataTable);

  QueryParams params;
  append_filters(&sql, &params);

  sql += " ORDER BY " + quote(config::kIdColumn);
  sql += std::string(" LIMIT ") + config::kLimitParam + " OFFSET " +
         config::kOffsetParam;
  params[config::kLimitParam] = Value(options_.limit);
  params[config::kOffsetParam] = Value(options_.offset);

  out->sql = std::move(sql);
  out->params = std::move(params);
  return Status::Ok();
}

Status QueryBuilder::compile_count(const std::string &alias,
                                   CompiledQuery *out) const {
  if (alias.empty() || alias.find('"') != std::string::npos) {
    return Status::InvalidArgument("invalid count alias: " + alias);
  }

  std::string sql = "SELECT " + quote(config::kTypeColumn) + ", COUNT(*) AS " +
                    quote(alias) + " FROM " + quote(config::kDataTable);
  QueryParams params;
  append_filters(&sql, &params);
  sql += " GROUP BY " + quote(config::kTypeColumn);

  out->sql = std::move(sql);
  out->params = std::move(params);
  return Status::Ok();
}

} // namespace bulkstream
