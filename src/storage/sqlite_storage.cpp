/**
 * @file sqlite_storage.cpp
 * @brief SQLite storage implementation
 */

#include "bulkstream/sqlite_storage.hpp"

#include <sqlite3.h>

#include <boost/asio/post.hpp>

#include <type_traits>
#include <utility>
#include <variant>

#include "common/config.hpp"
#include "common/logger.hpp"
#include "common/status.hpp"

namespace bulkstream {

namespace {

// ─────────────────────────────────────────────────────────────────────────────
// Error mapping
// ─────────────────────────────────────────────────────────────────────────────

Status status_from_sqlite(int rc, sqlite3 *db, bool preparing) {
  std::string message = db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
  switch (rc & 0xff) {
  case SQLITE_OK:
  case SQLITE_ROW:
  case SQLITE_DONE:
    return Status::Ok();
  case SQLITE_BUSY:
  case SQLITE_LOCKED:
    return Status::Busy(std::move(message));
  case SQLITE_CONSTRAINT:
    return Status::Aborted(std::move(message));
  case SQLITE_CORRUPT:
  case SQLITE_NOTADB:
    return Status::Corruption(std::move(message));
  case SQLITE_IOERR:
  case SQLITE_CANTOPEN:
  case SQLITE_FULL:
    return Status::IOError(std::move(message));
  case SQLITE_INTERRUPT:
    return Status::Cancelled(std::move(message));
  default:
    return preparing ? Status::InvalidArgument(std::move(message))
                     : Status::Error(std::move(message));
  }
}

// ─────────────────────────────────────────────────────────────────────────────
// Binding and row decoding
// ─────────────────────────────────────────────────────────────────────────────

int bind_value(sqlite3_stmt *stmt, int index, const Value &value) {
  return std::visit(
      [&](const auto &v) -> int {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return sqlite3_bind_null(stmt, index);
        } else if constexpr (std::is_same_v<T, bool>) {
          return sqlite3_bind_int(stmt, index, v ? 1 : 0);
        } else if constexpr (std::is_same_v<T, int64_t>) {
          return sqlite3_bind_int64(stmt, index, v);
        } else if constexpr (std::is_same_v<T, double>) {
          return sqlite3_bind_double(stmt, index, v);
        } else {
          return sqlite3_bind_text(stmt, index, v.data(),
                                   static_cast<int>(v.size()),
                                   SQLITE_TRANSIENT);
        }
      },
      value.variant());
}

/// Bind parameters by name; names the statement does not use are skipped
int bind_params(sqlite3_stmt *stmt, const QueryParams &params) {
  sqlite3_reset(stmt);
  sqlite3_clear_bindings(stmt);
  for (const auto &[name, value] : params) {
    int index = sqlite3_bind_parameter_index(stmt, name.c_str());
    if (index == 0) {
      continue;
    }
    int rc = bind_value(stmt, index, value);
    if (rc != SQLITE_OK) {
      return rc;
    }
  }
  return SQLITE_OK;
}

Value read_column(sqlite3_stmt *stmt, int column) {
  switch (sqlite3_column_type(stmt, column)) {
  case SQLITE_INTEGER:
    return Value(static_cast<int64_t>(sqlite3_column_int64(stmt, column)));
  case SQLITE_FLOAT:
    return Value(sqlite3_column_double(stmt, column));
  case SQLITE_TEXT:
  case SQLITE_BLOB: {
    const auto *data =
        static_cast<const char *>(sqlite3_column_blob(stmt, column));
    int size = sqlite3_column_bytes(stmt, column);
    return Value(std::string(data != nullptr ? data : "", size));
  }
  default:
    return Value();
  }
}

/// Step a bound statement to completion, collecting every row
Result collect_rows(sqlite3 *db, sqlite3_stmt *stmt) {
  std::vector<std::string> column_names;
  int columns = sqlite3_column_count(stmt);
  column_names.reserve(columns);
  for (int i = 0; i < columns; ++i) {
    const char *name = sqlite3_column_name(stmt, i);
    column_names.emplace_back(name != nullptr ? name : "");
  }

  std::vector<Row> rows;
  while (true) {
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_DONE) {
      break;
    }
    if (rc != SQLITE_ROW) {
      Status status = status_from_sqlite(rc, db, false);
      sqlite3_reset(stmt);
      return Result(std::move(status));
    }
    std::vector<Value> values;
    values.reserve(columns);
    for (int i = 0; i < columns; ++i) {
      values.push_back(read_column(stmt, i));
    }
    rows.emplace_back(std::move(values), column_names);
  }
  sqlite3_reset(stmt);
  return Result(std::move(rows), std::move(column_names));
}

/**
 * @brief Owns a sqlite3_stmt; shared with queued handlers so a statement
 * dropped mid-query is finalized only after its last handler ran
 */
struct StatementHandle {
  sqlite3_stmt *stmt = nullptr;

  ~StatementHandle() {
    if (stmt != nullptr) {
      sqlite3_finalize(stmt);
    }
  }
};

Status storage_closed() { return Status::Aborted("storage is closed"); }

// ─────────────────────────────────────────────────────────────────────────────
// SqliteStatement
// ─────────────────────────────────────────────────────────────────────────────

class SqliteStatement : public PreparedStatement {
public:
  SqliteStatement(boost::asio::io_context &io,
                  std::weak_ptr<sqlite3 *> connection,
                  std::shared_ptr<StatementHandle> handle)
      : io_(io), connection_(std::move(connection)),
        handle_(std::move(handle)) {}

  void all(const QueryParams &params, ResultCallback callback) override {
    boost::asio::post(io_, [connection = connection_, handle = handle_,
                            params, callback = std::move(callback)]() {
      auto db = connection.lock();
      if (!db || *db == nullptr) {
        callback(Result(storage_closed()));
        return;
      }
      int rc = bind_params(handle->stmt, params);
      if (rc != SQLITE_OK) {
        callback(Result(status_from_sqlite(rc, *db, false)));
        return;
      }
      callback(collect_rows(*db, handle->stmt));
    });
  }

private:
  boost::asio::io_context &io_;
  std::weak_ptr<sqlite3 *> connection_;
  std::shared_ptr<StatementHandle> handle_;
};

} // namespace

// ─────────────────────────────────────────────────────────────────────────────
// SqliteStorage
// ─────────────────────────────────────────────────────────────────────────────

SqliteStorage::SqliteStorage(boost::asio::io_context &io)
    : io_(io), alive_(std::make_shared<sqlite3 *>(nullptr)) {}

SqliteStorage::~SqliteStorage() { close(); }

Status SqliteStorage::open(const std::string &path) {
  if (db_ != nullptr) {
    return Status::InvalidArgument("storage is already open");
  }
  int rc = sqlite3_open_v2(path.c_str(), &db_,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
  if (rc != SQLITE_OK) {
    Status status = status_from_sqlite(rc, db_, false);
    LOG_ERROR("Failed to open {}: {}", path, status.to_string());
    sqlite3_close_v2(db_);
    db_ = nullptr;
    return status;
  }
  *alive_ = db_;
  LOG_DEBUG("Opened storage: {}", path);
  return Status::Ok();
}

void SqliteStorage::close() {
  if (db_ == nullptr) {
    return;
  }
  *alive_ = nullptr;
  // close_v2 defers until outstanding statements are finalized
  sqlite3_close_v2(db_);
  db_ = nullptr;
}

Status SqliteStorage::execute(std::string_view sql) {
  if (db_ == nullptr) {
    return storage_closed();
  }
  char *errmsg = nullptr;
  std::string script(sql);
  int rc = sqlite3_exec(db_, script.c_str(), nullptr, nullptr, &errmsg);
  if (rc != SQLITE_OK) {
    Status status = status_from_sqlite(rc, db_, false);
    if (errmsg != nullptr) {
      status = Status(status.code(), errmsg);
      sqlite3_free(errmsg);
    }
    return status;
  }
  return Status::Ok();
}

Status SqliteStorage::create_schema() {
  std::string table = config::kDataTable;
  return execute("CREATE TABLE IF NOT EXISTS \"" + table +
                 "\" ("
                 "\"id\" INTEGER PRIMARY KEY AUTOINCREMENT, "
                 "\"fhir_type\" TEXT NOT NULL, "
                 "\"resource_json\" TEXT NOT NULL, "
                 "\"modified_date\" TEXT, "
                 "\"group_id\" TEXT);"
                 "CREATE INDEX IF NOT EXISTS \"" + table + "_fhir_type\" ON \"" +
                 table + "\" (\"fhir_type\");"
                 "CREATE INDEX IF NOT EXISTS \"" + table + "_group_id\" ON \"" +
                 table + "\" (\"group_id\");");
}

Status SqliteStorage::insert_resource(const StoredResource &resource) {
  QueryParams params;
  params["$type"] = Value(resource.fhir_type);
  params["$json"] = Value(resource.resource_json);
  params["$modified"] = resource.modified_date.empty()
                            ? Value()
                            : Value(resource.modified_date);
  params["$group"] =
      resource.group_id.empty() ? Value() : Value(resource.group_id);

  auto result = query_now(
      std::string("INSERT INTO \"") + config::kDataTable +
          "\" (\"fhir_type\", \"resource_json\", \"modified_date\", "
          "\"group_id\") VALUES ($type, $json, $modified, $group)",
      params);
  return result.status();
}

Status SqliteStorage::count_resources(uint64_t *count) {
  auto result = query_now(
      std::string("SELECT COUNT(*) FROM \"") + config::kDataTable + "\"", {});
  BULKSTREAM_RETURN_IF_ERROR(result.status());
  *count = static_cast<uint64_t>(result.rows().at(0)[0].as_int64());
  return Status::Ok();
}

void SqliteStorage::prepare(std::string sql, QueryParams params,
                            PrepareCallback callback) {
  boost::asio::post(io_, [this, connection = std::weak_ptr<sqlite3 *>(alive_),
                          sql = std::move(sql), params = std::move(params),
                          callback = std::move(callback)]() {
    auto db = connection.lock();
    if (!db || *db == nullptr) {
      callback(storage_closed(), nullptr);
      return;
    }

    auto handle = std::make_shared<StatementHandle>();
    int rc = sqlite3_prepare_v2(*db, sql.c_str(), -1, &handle->stmt, nullptr);
    if (rc != SQLITE_OK) {
      Status status = status_from_sqlite(rc, *db, true);
      LOG_ERROR("Prepare failed: {}", status.to_string());
      callback(std::move(status), nullptr);
      return;
    }
    rc = bind_params(handle->stmt, params);
    if (rc != SQLITE_OK) {
      callback(status_from_sqlite(rc, *db, true), nullptr);
      return;
    }
    callback(Status::Ok(),
             std::make_unique<SqliteStatement>(io_, connection, handle));
  });
}

void SqliteStorage::all(std::string sql, QueryParams params,
                        ResultCallback callback) {
  boost::asio::post(io_, [this, connection = std::weak_ptr<sqlite3 *>(alive_),
                          sql = std::move(sql), params = std::move(params),
                          callback = std::move(callback)]() {
    auto db = connection.lock();
    if (!db || *db == nullptr) {
      callback(Result(storage_closed()));
      return;
    }
    callback(query_now(sql, params));
  });
}

Result SqliteStorage::query_now(const std::string &sql,
                                const QueryParams &params) {
  if (db_ == nullptr) {
    return Result(storage_closed());
  }
  StatementHandle handle;
  int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &handle.stmt, nullptr);
  if (rc != SQLITE_OK) {
    return Result(status_from_sqlite(rc, db_, true));
  }
  rc = bind_params(handle.stmt, params);
  if (rc != SQLITE_OK) {
    return Result(status_from_sqlite(rc, db_, false));
  }
  return collect_rows(db_, handle.stmt);
}

} // namespace bulkstream
