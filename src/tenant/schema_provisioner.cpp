#include "tenant/schema_provisioner.hpp"
#include "db/sqlite/sqlite_type_map.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <chrono>
#include <cmath>
#include <format>
#include <unordered_map>
#include <unordered_set>

namespace sqlsandbox {

namespace {

constexpr double kInt64Min = -9223372036854775808.0;
constexpr double kInt64Limit = 9223372036854775808.0;

std::string quote_ident(const std::string& name) {
    return std::format("\"{}\"", name);
}

} // anonymous namespace

SchemaProvisioner::SchemaProvisioner(std::shared_ptr<const ICatalog> catalog)
    : catalog_(std::move(catalog)) {}

// ============================================================================
// Validation helpers
// ============================================================================

bool SchemaProvisioner::is_valid_identifier(std::string_view name) {
    if (name.empty() || name.size() > 128) return false;
    const auto first = static_cast<unsigned char>(name[0]);
    if (!(std::isalpha(first) || first == '_')) return false;
    for (const char c : name) {
        const auto uc = static_cast<unsigned char>(c);
        if (!(std::isalnum(uc) || uc == '_')) return false;
    }
    return true;
}

bool SchemaProvisioner::is_valid_date(std::string_view text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') return false;

    const auto y = utils::try_parse_int<int>(text.substr(0, 4));
    const auto m = utils::try_parse_int<unsigned>(text.substr(5, 2));
    const auto d = utils::try_parse_int<unsigned>(text.substr(8, 2));
    if (!y || !m || !d || *y < 1) return false;

    const std::chrono::year_month_day ymd{
        std::chrono::year{*y}, std::chrono::month{*m}, std::chrono::day{*d}};
    return ymd.ok();
}

// ============================================================================
// Schema parsing
// ============================================================================

Result<TableSchema> SchemaProvisioner::parse_table_schema(
    const std::string& table_name, const std::string& schema_json) {

    if (!is_valid_identifier(table_name)) {
        return Result<TableSchema>::error(ErrorKind::PROVISION_ERROR,
            std::format("Invalid table name '{}'", table_name));
    }

    JsonValue doc;
    try {
        doc = JsonValue::parse(schema_json);
    } catch (const JsonValue::parse_error& e) {
        return Result<TableSchema>::error(ErrorKind::PROVISION_ERROR,
            std::format("Malformed schema for table '{}': {}", table_name, e.what()));
    }

    if (!doc.is_array() || doc.size() == 0) {
        return Result<TableSchema>::error(ErrorKind::PROVISION_ERROR,
            std::format("Malformed schema for table '{}': expected a non-empty array of columns",
                        table_name));
    }

    TableSchema schema;
    schema.name = table_name;
    std::unordered_set<std::string> seen;
    std::string error;

    doc.for_each_element([&](const JsonValue& col) {
        if (!error.empty()) return;

        const auto name = col["name"];
        const auto type = col["type"];
        if (!col.is_object() || !name.is_string() || !type.is_string()) {
            error = "every column needs string \"name\" and \"type\"";
            return;
        }

        ColumnDecl decl;
        decl.name = name.get<std::string>();
        if (!is_valid_identifier(decl.name)) {
            error = std::format("invalid column name '{}'", decl.name);
            return;
        }
        if (!seen.insert(utils::to_lower(decl.name)).second) {
            error = std::format("duplicate column '{}'", decl.name);
            return;
        }

        const auto type_name = type.get<std::string>();
        const auto declared = parse_declared_type(type_name);
        if (!declared) {
            error = std::format("unknown type '{}' for column '{}'", type_name, decl.name);
            return;
        }
        decl.type = *declared;
        schema.columns.push_back(std::move(decl));
    });

    if (!error.empty()) {
        return Result<TableSchema>::error(ErrorKind::PROVISION_ERROR,
            std::format("Malformed schema for table '{}': {}", table_name, error));
    }
    return Result<TableSchema>::ok(std::move(schema));
}

// ============================================================================
// Row coercion
// ============================================================================

std::optional<Value> SchemaProvisioner::coerce_value(const JsonValue& value, DeclaredType type) {
    if (value.is_null()) return Value::null();

    switch (type) {
        case DeclaredType::INTEGER: {
            if (value.is_boolean()) return Value::integer(value.get<bool>() ? 1 : 0);
            if (value.is_number()) {
                if (!value.is_number_integer()) return std::nullopt;
                const double d = value.get<double>();
                if (d < kInt64Min || d >= kInt64Limit) return std::nullopt;
                return Value::integer(static_cast<int64_t>(d));
            }
            if (value.is_string()) {
                const auto parsed = utils::try_parse_int<int64_t>(utils::trim(value.get<std::string>()));
                if (parsed) return Value::integer(*parsed);
            }
            return std::nullopt;
        }

        case DeclaredType::REAL: {
            if (value.is_number()) {
                const double d = value.get<double>();
                if (!std::isfinite(d)) return std::nullopt;
                return Value::real(d);
            }
            if (value.is_string()) {
                const auto parsed = utils::try_parse_double(utils::trim(value.get<std::string>()));
                if (parsed && std::isfinite(*parsed)) return Value::real(*parsed);
            }
            return std::nullopt;
        }

        case DeclaredType::TEXT: {
            if (value.is_string()) return Value::text_value(value.get<std::string>());
            if (value.is_boolean()) return Value::text_value(utils::booltostr(value.get<bool>()));
            if (value.is_number()) {
                if (value.is_number_integer()) {
                    const double d = value.get<double>();
                    if (d >= kInt64Min && d < kInt64Limit) {
                        return Value::text_value(std::to_string(static_cast<int64_t>(d)));
                    }
                }
                return Value::text_value(std::format("{}", value.get<double>()));
            }
            return std::nullopt;
        }

        case DeclaredType::DATE: {
            if (!value.is_string()) return std::nullopt;
            auto text = utils::trim(value.get<std::string>());
            if (!is_valid_date(text)) return std::nullopt;
            return Value::text_value(std::move(text));
        }
    }
    return std::nullopt;
}

Result<Row> SchemaProvisioner::coerce_row(const std::string& row_json, const TableSchema& schema) {
    JsonValue doc;
    try {
        doc = JsonValue::parse(row_json);
    } catch (const JsonValue::parse_error& e) {
        return Result<Row>::error(ErrorKind::PROVISION_ERROR, e.what());
    }

    std::vector<JsonValue> cells;
    cells.reserve(schema.columns.size());

    if (doc.is_array()) {
        if (doc.size() != schema.columns.size()) {
            return Result<Row>::error(ErrorKind::PROVISION_ERROR, std::format(
                "expected {} values, got {}", schema.columns.size(), doc.size()));
        }
        doc.for_each_element([&](const JsonValue& v) { cells.push_back(v); });
    } else if (doc.is_object()) {
        std::unordered_map<std::string, JsonValue> by_name;
        doc.for_each_member([&](const std::string& key, const JsonValue& v) {
            by_name.emplace(utils::to_lower(key), v);
        });
        for (const auto& col : schema.columns) {
            const auto it = by_name.find(utils::to_lower(col.name));
            cells.push_back(it != by_name.end() ? it->second : JsonValue{});
        }
    } else {
        return Result<Row>::error(ErrorKind::PROVISION_ERROR,
            "row must be a JSON array or object");
    }

    Row row;
    row.reserve(cells.size());
    for (size_t i = 0; i < cells.size(); ++i) {
        const auto& col = schema.columns[i];
        auto coerced = coerce_value(cells[i], col.type);
        if (!coerced) {
            return Result<Row>::error(ErrorKind::PROVISION_ERROR, std::format(
                "value for column '{}' is not a valid {}", col.name,
                declared_type_to_string(col.type)));
        }
        row.push_back(std::move(*coerced));
    }
    return Result<Row>::ok(std::move(row));
}

// ============================================================================
// DDL
// ============================================================================

std::string SchemaProvisioner::create_table_sql(const TableSchema& schema, const std::string& physical) {
    std::string sql = std::format("CREATE TABLE {} (", quote_ident(physical));
    for (size_t i = 0; i < schema.columns.size(); ++i) {
        const auto& col = schema.columns[i];
        if (i > 0) sql += ", ";
        sql += std::format("{} {}", quote_ident(col.name), SqliteTypeMap::native_type(col.type));
        if (col.type == DeclaredType::DATE) {
            // Only real calendar dates in canonical form survive date() unchanged
            sql += std::format(" CHECK ({0} IS NULL OR date({0}) IS {0})", quote_ident(col.name));
        }
    }
    sql += ")";
    return sql;
}

std::string SchemaProvisioner::insert_sql(const TableSchema& schema, const std::string& physical) {
    std::string columns;
    std::string placeholders;
    for (size_t i = 0; i < schema.columns.size(); ++i) {
        if (i > 0) {
            columns += ", ";
            placeholders += ", ";
        }
        columns += quote_ident(schema.columns[i].name);
        placeholders += "?";
    }
    return std::format("INSERT INTO {} ({}) VALUES ({})", quote_ident(physical), columns, placeholders);
}

void SchemaProvisioner::drop_tables(IDbConnection& conn, const std::vector<std::string>& physical) {
    for (const auto& name : physical) {
        const auto result = conn.execute_command(std::format("DROP TABLE IF EXISTS {}", quote_ident(name)));
        if (!result.success) {
            utils::log::warn(std::format("Failed to drop {}: {}", name, result.error_message));
        }
    }
}

// ============================================================================
// Provisioning
// ============================================================================

Result<std::vector<SchemaProvisioner::LoadedTable>> SchemaProvisioner::load_from_catalog(
    int64_t problem_id) const {

    using LoadResult = Result<std::vector<LoadedTable>>;

    std::vector<CatalogTable> catalog_tables;
    try {
        catalog_tables = catalog_->get_tables(problem_id);
    } catch (const CatalogError& e) {
        return LoadResult::error(ErrorKind::PROVISION_ERROR,
            std::format("Catalog unavailable for problem {}: {}", problem_id, e.what()));
    }

    if (catalog_tables.empty()) {
        return LoadResult::error(ErrorKind::PROVISION_ERROR,
            std::format("No tables found for problem {}", problem_id));
    }

    std::vector<LoadedTable> loaded;
    loaded.reserve(catalog_tables.size());
    std::unordered_set<std::string> seen;

    for (const auto& ct : catalog_tables) {
        auto parsed = parse_table_schema(ct.table_name, ct.schema_json);
        if (parsed.is_error()) {
            return LoadResult::error(ErrorKind::PROVISION_ERROR, parsed.error_message());
        }
        if (!seen.insert(utils::to_lower(ct.table_name)).second) {
            return LoadResult::error(ErrorKind::PROVISION_ERROR,
                std::format("Duplicate table '{}' for problem {}", ct.table_name, problem_id));
        }

        LoadedTable table;
        table.schema = std::move(parsed.value());
        table.physical = TenantNamespace::physical_name(table.schema.name, problem_id);

        std::vector<std::string> row_docs;
        try {
            row_docs = catalog_->get_rows(problem_id, ct.table_name);
        } catch (const CatalogError& e) {
            return LoadResult::error(ErrorKind::PROVISION_ERROR,
                std::format("Catalog unavailable for table '{}': {}", ct.table_name, e.what()));
        }

        table.rows.reserve(row_docs.size());
        for (size_t i = 0; i < row_docs.size(); ++i) {
            auto row = coerce_row(row_docs[i], table.schema);
            if (row.is_error()) {
                ++table.rows_skipped;
                utils::log::warn(std::format("Problem {}: skipping row {} of '{}': {}",
                    problem_id, i + 1, ct.table_name, row.error_message()));
                continue;
            }
            table.rows.push_back(std::move(row.value()));
        }

        loaded.push_back(std::move(table));
    }

    return LoadResult::ok(std::move(loaded));
}

Result<ProvisionedSchema> SchemaProvisioner::provision(
    int64_t problem_id,
    IDbConnection& conn,
    const std::vector<std::string>& existing_physical) const {

    auto loaded = load_from_catalog(problem_id);
    if (loaded.is_error()) {
        return Result<ProvisionedSchema>::error(loaded.error_kind(), loaded.error_message());
    }
    auto& tables = loaded.value();

    conn.set_read_only(false);

    std::vector<std::string> stale = existing_physical;
    for (const auto& t : tables) stale.push_back(t.physical);
    drop_tables(conn, stale);

    ProvisionedSchema out;
    out.report.problem_id = problem_id;
    std::vector<std::string> created;

    auto fail = [&](std::string message) {
        drop_tables(conn, created);
        conn.set_read_only(true);
        utils::log::error(std::format("Provisioning problem {} failed: {}", problem_id, message));
        return Result<ProvisionedSchema>::error(ErrorKind::PROVISION_ERROR, std::move(message));
    };

    for (auto& table : tables) {
        const auto ddl = conn.execute_command(create_table_sql(table.schema, table.physical));
        if (!ddl.success) {
            return fail(std::format("Cannot create table '{}': {}", table.schema.name, ddl.error_message));
        }
        created.push_back(table.physical);

        const auto inserted = conn.insert_rows(insert_sql(table.schema, table.physical), table.rows);
        if (!inserted.success) {
            return fail(std::format("Cannot load table '{}': {}", table.schema.name, inserted.error_message));
        }
        for (const auto& reason : inserted.rejected_rows) {
            utils::log::warn(std::format("Problem {}: engine rejected a row of '{}': {}",
                problem_id, table.schema.name, reason));
        }

        TableLoadStats stats;
        stats.logical_name = table.schema.name;
        stats.physical_name = table.physical;
        stats.rows_loaded = inserted.affected_rows;
        stats.rows_skipped = table.rows_skipped + inserted.rejected_rows.size();
        out.report.tables.push_back(stats);

        utils::log::info(std::format("Loaded table {} -> {} ({} rows, {} skipped)",
            stats.logical_name, stats.physical_name, stats.rows_loaded, stats.rows_skipped));

        out.ns.add(table.schema.name, table.physical);
        out.tables.push_back(std::move(table.schema));
    }

    conn.set_read_only(true);
    return Result<ProvisionedSchema>::ok(std::move(out));
}

} // namespace sqlsandbox
