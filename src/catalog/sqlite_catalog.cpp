#include "catalog/sqlite_catalog.hpp"
#include <sqlite3.h>
#include <format>
#include <memory>

namespace sqlsandbox {

// RAII wrappers for SQLite resources
struct SqliteDbDeleter {
    void operator()(sqlite3* db) const noexcept {
        if (db) {
            sqlite3_close_v2(db);
        }
    }
};
using SqliteDbPtr = std::unique_ptr<sqlite3, SqliteDbDeleter>;

struct SqliteStmtDeleter {
    void operator()(sqlite3_stmt* stmt) const noexcept {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }
};
using SqliteStmtPtr = std::unique_ptr<sqlite3_stmt, SqliteStmtDeleter>;

namespace {

SqliteDbPtr open_read_only(const std::string& path) {
    sqlite3* raw = nullptr;
    const int rc = sqlite3_open_v2(path.c_str(), &raw, SQLITE_OPEN_READONLY, nullptr);
    SqliteDbPtr db(raw);
    if (rc != SQLITE_OK) {
        throw CatalogError(std::format("Cannot open catalog '{}': {}",
            path, db ? sqlite3_errmsg(db.get()) : sqlite3_errstr(rc)));
    }
    sqlite3_busy_timeout(db.get(), 5000);
    return db;
}

SqliteStmtPtr prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* raw = nullptr;
    const int rc = sqlite3_prepare_v2(db, sql, -1, &raw, nullptr);
    SqliteStmtPtr stmt(raw);
    if (rc != SQLITE_OK) {
        throw CatalogError(std::format("Catalog query failed: {}", sqlite3_errmsg(db)));
    }
    return stmt;
}

std::string column_text(sqlite3_stmt* stmt, int col) {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt, col))) : std::string{};
}

// Steps until done, invoking on_row for each row
template<typename Fn>
void for_each_row(sqlite3* db, sqlite3_stmt* stmt, Fn&& on_row) {
    while (true) {
        const int rc = sqlite3_step(stmt);
        if (rc == SQLITE_DONE) return;
        if (rc != SQLITE_ROW) {
            throw CatalogError(std::format("Catalog read failed: {}", sqlite3_errmsg(db)));
        }
        on_row(stmt);
    }
}

} // anonymous namespace

SqliteCatalog::SqliteCatalog(std::string db_path)
    : db_path_(std::move(db_path)) {}

std::vector<CatalogTable> SqliteCatalog::get_tables(int64_t problem_id) const {
    auto db = open_read_only(db_path_);
    auto stmt = prepare(db.get(),
        "SELECT table_name, schema_json FROM problem_tables "
        "WHERE problem_id = ? ORDER BY rowid");
    sqlite3_bind_int64(stmt.get(), 1, problem_id);

    std::vector<CatalogTable> tables;
    for_each_row(db.get(), stmt.get(), [&](sqlite3_stmt* s) {
        tables.push_back({column_text(s, 0), column_text(s, 1)});
    });
    return tables;
}

std::vector<std::string> SqliteCatalog::get_rows(
    int64_t problem_id, const std::string& table_name) const {

    auto db = open_read_only(db_path_);
    auto stmt = prepare(db.get(),
        "SELECT row_json FROM table_data "
        "WHERE problem_id = ? AND table_name = ? ORDER BY rowid");
    sqlite3_bind_int64(stmt.get(), 1, problem_id);
    sqlite3_bind_text(stmt.get(), 2, table_name.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<std::string> rows;
    for_each_row(db.get(), stmt.get(), [&](sqlite3_stmt* s) {
        rows.push_back(column_text(s, 0));
    });
    return rows;
}

} // namespace sqlsandbox
