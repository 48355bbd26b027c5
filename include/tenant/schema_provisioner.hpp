#pragma once

#include "catalog/icatalog.hpp"
#include "core/error.hpp"
#include "core/json.hpp"
#include "core/types.hpp"
#include "db/idb_connection.hpp"
#include "tenant/tenant_namespace.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sqlsandbox {

/**
 * @brief Everything a session needs after a successful provisioning run
 */
struct ProvisionedSchema {
    std::vector<TableSchema> tables;
    TenantNamespace ns;
    ProvisionReport report;
};

/**
 * @brief Loads a problem's catalog tables into a session's engine database
 *
 * Each logical table becomes one physical table "<name>_<problem_id>".
 * The whole schema is validated before the engine is touched. Rows that do
 * not fit the declared column types are skipped and counted, never fatal.
 * Running it again on the same connection drops and recreates the tables.
 */
class SchemaProvisioner {
public:
    explicit SchemaProvisioner(std::shared_ptr<const ICatalog> catalog);

    /**
     * @brief Provision problem_id into conn
     * @param existing_physical Physical tables already present (dropped first)
     * @return Provisioned schema, or PROVISION_ERROR
     *
     * The connection's read-only guard is on when this returns, on success
     * or failure.
     */
    [[nodiscard]] Result<ProvisionedSchema> provision(
        int64_t problem_id,
        IDbConnection& conn,
        const std::vector<std::string>& existing_physical) const;

    /**
     * @brief Parse a catalog schema document
     */
    [[nodiscard]] static Result<TableSchema> parse_table_schema(
        const std::string& table_name, const std::string& schema_json);

    /**
     * @brief Coerce one row document (array or object) into the declared schema
     */
    [[nodiscard]] static Result<Row> coerce_row(const std::string& row_json, const TableSchema& schema);

    /**
     * @brief Coerce one JSON value into a declared type
     */
    [[nodiscard]] static std::optional<Value> coerce_value(const JsonValue& value, DeclaredType type);

    [[nodiscard]] static std::string create_table_sql(const TableSchema& schema, const std::string& physical);
    [[nodiscard]] static std::string insert_sql(const TableSchema& schema, const std::string& physical);

    [[nodiscard]] static bool is_valid_identifier(std::string_view name);

    /**
     * @brief Strict YYYY-MM-DD naming a real calendar date
     */
    [[nodiscard]] static bool is_valid_date(std::string_view text);

private:
    struct LoadedTable {
        TableSchema schema;
        std::string physical;
        std::vector<Row> rows;
        uint64_t rows_skipped = 0;
    };

    [[nodiscard]] Result<std::vector<LoadedTable>> load_from_catalog(int64_t problem_id) const;

    static void drop_tables(IDbConnection& conn, const std::vector<std::string>& physical);

    std::shared_ptr<const ICatalog> catalog_;
};

} // namespace sqlsandbox
