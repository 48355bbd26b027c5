#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <sqlite3.h>
#include <chrono>
#include <string>

namespace sqlsandbox {

/**
 * @brief SQLite connection implementing IDbConnection
 *
 * Wraps sqlite3* and provides the engine-agnostic interface. All SQLite
 * calls are encapsulated here. Every connection is hardened on construction:
 * defensive mode, double-quoted string literals off, ATTACH limit zero,
 * an authorizer that admits only reads once the read-only guard is on, and
 * a progress handler enforcing the query deadline.
 */
class SqliteConnection : public IDbConnection {
public:
    /**
     * @brief Construct from an open sqlite3* (takes ownership)
     */
    explicit SqliteConnection(sqlite3* db);

    ~SqliteConnection() override;

    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;

    DbResultSet execute(const std::string& sql, size_t max_rows) override;
    DbResultSet execute_command(const std::string& sql) override;
    DbResultSet insert_rows(const std::string& insert_sql, const std::vector<Row>& rows) override;
    bool set_query_timeout(uint32_t timeout_ms) override;
    void set_read_only(bool read_only) override;
    bool is_connected() const override;
    void close() override;

private:
    static int progress_callback(void* self);
    static int authorizer_callback(void* self, int action, const char* arg1,
                                   const char* arg2, const char* db_name,
                                   const char* trigger_name);

    /**
     * @brief Map a failed result code (with the current errmsg) to ErrorKind
     */
    DbResultSet classify_error(int rc) const;

    void arm_deadline();
    void disarm_deadline();

    sqlite3* db_;
    uint32_t timeout_ms_ = 0;
    std::chrono::steady_clock::time_point deadline_{};
    bool deadline_armed_ = false;
    bool deadline_hit_ = false;
    bool read_only_ = false;
};

/**
 * @brief SQLite connection factory
 *
 * Creates hardened SqliteConnection instances using sqlite3_open_v2.
 * Every ":memory:" connection is a private database.
 */
class SqliteConnectionFactory : public IConnectionFactory {
public:
    std::unique_ptr<IDbConnection> create(const std::string& connection_string) override;
};

} // namespace sqlsandbox
