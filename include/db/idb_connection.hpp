#pragma once

#include "core/column_type.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace sqlsandbox {

/**
 * @brief Result set from a statement execution
 *
 * Returned by IDbConnection. Owns the result data (copied out of native
 * statement handles).
 */
struct DbResultSet {
    bool success = false;
    ErrorKind error_kind = ErrorKind::NONE;
    std::string error_message;

    // For queries
    std::vector<std::string> column_names;
    std::vector<ColumnTypeInfo> column_types;
    std::vector<Row> rows;
    bool truncated = false;         // More rows existed beyond max_rows

    // For bulk inserts
    uint64_t affected_rows = 0;
    std::vector<std::string> rejected_rows;    // One message per skipped row

    [[nodiscard]] static DbResultSet error(ErrorKind kind, std::string message) {
        DbResultSet result;
        result.success = false;
        result.error_kind = kind;
        result.error_message = std::move(message);
        return result;
    }
};

/**
 * @brief Abstract engine connection owned by exactly one session
 *
 * Implementations are not thread-safe; the owning session serializes access.
 * Does NOT expose native handles to prevent leaking engine types.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute a single read-only statement
     * @param sql SQL text
     * @param max_rows Rows kept; further rows set DbResultSet::truncated
     *
     * Engine errors map to ENGINE_ERROR, a fired deadline to TIMEOUT,
     * a statement the engine considers writing to MUTATION_ATTEMPT, and
     * resource or I/O failures to INTERNAL.
     */
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql, size_t max_rows) = 0;

    /**
     * @brief Execute DDL during provisioning (CREATE / DROP)
     *
     * Fails while the read-only guard is on.
     */
    [[nodiscard]] virtual DbResultSet execute_command(const std::string& sql) = 0;

    /**
     * @brief Insert rows with one prepared statement inside one transaction
     * @param insert_sql Parameterized INSERT, one placeholder per column
     * @return affected_rows = rows inserted; rejected_rows lists skipped rows
     */
    [[nodiscard]] virtual DbResultSet insert_rows(
        const std::string& insert_sql, const std::vector<Row>& rows) = 0;

    /**
     * @brief Set wall-clock timeout for subsequent execute() calls
     * @param timeout_ms Timeout in milliseconds (0 = no timeout)
     * @return true if timeout was set successfully
     */
    virtual bool set_query_timeout(uint32_t timeout_ms) = 0;

    /**
     * @brief Toggle the read-only guard (on once provisioning completes)
     */
    virtual void set_read_only(bool read_only) = 0;

    /**
     * @brief Check if connection is in a valid state (open)
     */
    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Close the connection and release resources
     */
    virtual void close() = 0;
};

} // namespace sqlsandbox
