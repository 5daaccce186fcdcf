#pragma once

/**
 * @file sqlite_storage.hpp
 * @brief SQLite-backed implementation of the Storage interface
 */

#include <memory>
#include <string>
#include <string_view>

#include <boost/asio/io_context.hpp>

#include "bulkstream/result.hpp"
#include "bulkstream/status.hpp"
#include "bulkstream/storage.hpp"

struct sqlite3;

namespace bulkstream {

/**
 * @brief One stored document as written to the data table
 */
struct StoredResource {
    std::string fhir_type;
    std::string resource_json;
    std::string modified_date;
    std::string group_id;
};

/**
 * @brief Storage over a single SQLite connection
 *
 * Queries run on the thread driving the io_context: each call posts its
 * work to the context and the completion callback is invoked from that
 * posted handler, never from inside the initiating call.
 *
 * Example usage:
 * @code
 * boost::asio::io_context io;
 * bulkstream::SqliteStorage storage(io);
 * auto status = storage.open("bulk.db");
 * storage.all("SELECT 1", {}, [](bulkstream::Result r) { ... });
 * io.run();
 * @endcode
 */
class SqliteStorage : public Storage {
public:
    explicit SqliteStorage(boost::asio::io_context& io);

    /**
     * @brief Destructor - closes the connection
     *
     * Queries still queued on the io_context complete with kAborted.
     */
    ~SqliteStorage() override;

    SqliteStorage(const SqliteStorage&) = delete;
    SqliteStorage& operator=(const SqliteStorage&) = delete;

    /**
     * @brief Open or create a database file (":memory:" for a private one)
     */
    [[nodiscard]] Status open(const std::string& path);

    /**
     * @brief Close the connection
     */
    void close();

    [[nodiscard]] bool is_open() const noexcept { return db_ != nullptr; }

    /**
     * @brief Run one or more statements synchronously (schema, seed data)
     */
    [[nodiscard]] Status execute(std::string_view sql);

    /**
     * @brief Create the data table and its indexes if missing
     */
    [[nodiscard]] Status create_schema();

    /**
     * @brief Insert one document synchronously
     */
    [[nodiscard]] Status insert_resource(const StoredResource& resource);

    /**
     * @brief Count all rows in the data table synchronously
     */
    [[nodiscard]] Status count_resources(uint64_t* count);

    void prepare(std::string sql, QueryParams params,
                 PrepareCallback callback) override;

    void all(std::string sql, QueryParams params,
             ResultCallback callback) override;

private:
    [[nodiscard]] Result query_now(const std::string& sql,
                                   const QueryParams& params);

    boost::asio::io_context& io_;
    sqlite3* db_ = nullptr;

    // Expires on destruction; handlers still queued check it before use
    std::shared_ptr<sqlite3*> alive_;
};

}  // namespace bulkstream
