#include "db/sqlite/sqlite_connection.hpp"
#include "db/sqlite/sqlite_type_map.hpp"
#include "parser/sql_tokenizer.hpp"
#include "core/utils.hpp"
#include <format>
#include <memory>

namespace sqlsandbox {

namespace {

// VM instructions between deadline checks
constexpr int kProgressInterval = 1000;

// RAII wrapper for prepared statements
struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const noexcept {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }
};
using StmtPtr = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

bool has_trailing_statement(const char* tail) {
    if (!tail || !*tail) return false;
    const auto tokens = SqlTokenizer::tokenize(tail);
    for (const size_t idx : tokens.significant()) {
        if (!tokens[idx].is_punct(';')) return true;
    }
    return false;
}

Value read_column(sqlite3_stmt* stmt, int col) {
    switch (sqlite3_column_type(stmt, col)) {
        case SQLITE_INTEGER:
            return Value::integer(sqlite3_column_int64(stmt, col));
        case SQLITE_FLOAT:
            return Value::real(sqlite3_column_double(stmt, col));
        case SQLITE_TEXT: {
            const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
            const int bytes = sqlite3_column_bytes(stmt, col);
            return Value::text_value(text ? std::string(text, static_cast<size_t>(bytes)) : std::string{});
        }
        case SQLITE_BLOB: {
            const auto* data = static_cast<const char*>(sqlite3_column_blob(stmt, col));
            const int bytes = sqlite3_column_bytes(stmt, col);
            return Value::blob(data ? std::string(data, static_cast<size_t>(bytes)) : std::string{});
        }
        case SQLITE_NULL:
        default:
            return Value::null();
    }
}

int bind_value(sqlite3_stmt* stmt, int idx, const Value& value) {
    switch (value.kind) {
        case Value::Kind::NULL_VALUE:
            return sqlite3_bind_null(stmt, idx);
        case Value::Kind::BOOLEAN:
            return sqlite3_bind_int(stmt, idx, value.bool_value ? 1 : 0);
        case Value::Kind::INTEGER:
            return sqlite3_bind_int64(stmt, idx, value.int_value);
        case Value::Kind::REAL:
            return sqlite3_bind_double(stmt, idx, value.real_value);
        case Value::Kind::TEXT:
            return sqlite3_bind_text64(stmt, idx, value.text.data(), value.text.size(),
                                       SQLITE_TRANSIENT, SQLITE_UTF8);
        case Value::Kind::BLOB:
            return sqlite3_bind_blob64(stmt, idx, value.text.data(), value.text.size(),
                                       SQLITE_TRANSIENT);
    }
    return SQLITE_MISUSE;
}

} // anonymous namespace

// ============================================================================
// SqliteConnection
// ============================================================================

SqliteConnection::SqliteConnection(sqlite3* db)
    : db_(db) {
    if (!db_) return;

    sqlite3_db_config(db_, SQLITE_DBCONFIG_DEFENSIVE, 1, nullptr);
    sqlite3_db_config(db_, SQLITE_DBCONFIG_DQS_DML, 0, nullptr);
    sqlite3_db_config(db_, SQLITE_DBCONFIG_DQS_DDL, 0, nullptr);
    sqlite3_db_config(db_, SQLITE_DBCONFIG_ENABLE_LOAD_EXTENSION, 0, nullptr);
    sqlite3_db_config(db_, SQLITE_DBCONFIG_ENABLE_TRIGGER, 0, nullptr);
    sqlite3_db_config(db_, SQLITE_DBCONFIG_ENABLE_VIEW, 0, nullptr);
    sqlite3_limit(db_, SQLITE_LIMIT_ATTACHED, 0);

    sqlite3_set_authorizer(db_, &SqliteConnection::authorizer_callback, this);
    sqlite3_progress_handler(db_, kProgressInterval, &SqliteConnection::progress_callback, this);
}

SqliteConnection::~SqliteConnection() {
    close();
}

DbResultSet SqliteConnection::execute(const std::string& sql, size_t max_rows) {
    if (!db_) {
        return DbResultSet::error(ErrorKind::INTERNAL, "Connection is closed");
    }

    arm_deadline();

    sqlite3_stmt* raw = nullptr;
    const char* tail = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, &tail);
    StmtPtr stmt(raw);

    if (rc != SQLITE_OK) {
        auto result = classify_error(rc);
        disarm_deadline();
        return result;
    }

    if (!stmt) {
        disarm_deadline();
        return DbResultSet::error(ErrorKind::ENGINE_ERROR, "Query is empty");
    }

    if (has_trailing_statement(tail)) {
        disarm_deadline();
        return DbResultSet::error(ErrorKind::ENGINE_ERROR,
            "Only one statement can be executed at a time");
    }

    if (!sqlite3_stmt_readonly(stmt.get())) {
        disarm_deadline();
        return DbResultSet::error(ErrorKind::MUTATION_ATTEMPT,
            "Only read-only SELECT queries are allowed.");
    }

    DbResultSet result;
    const int ncols = sqlite3_column_count(stmt.get());
    result.column_names.reserve(ncols);
    result.column_types.reserve(ncols);
    for (int i = 0; i < ncols; ++i) {
        const char* name = sqlite3_column_name(stmt.get(), i);
        result.column_names.emplace_back(name ? name : "");
        result.column_types.push_back(
            SqliteTypeMap::build_type_info(sqlite3_column_decltype(stmt.get(), i)));
    }

    while (true) {
        rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE) break;

        if (rc != SQLITE_ROW) {
            auto error = classify_error(rc);
            disarm_deadline();
            return error;
        }

        if (max_rows > 0 && result.rows.size() >= max_rows) {
            result.truncated = true;
            break;
        }

        Row row;
        row.reserve(ncols);
        for (int i = 0; i < ncols; ++i) {
            row.push_back(read_column(stmt.get(), i));
        }
        result.rows.push_back(std::move(row));
    }

    disarm_deadline();
    result.success = true;
    return result;
}

DbResultSet SqliteConnection::execute_command(const std::string& sql) {
    if (!db_) {
        return DbResultSet::error(ErrorKind::INTERNAL, "Connection is closed");
    }
    if (read_only_) {
        return DbResultSet::error(ErrorKind::MUTATION_ATTEMPT,
            "Connection is read-only");
    }

    char* err = nullptr;
    const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        auto result = classify_error(rc);
        if (err) {
            result.error_message = err;
            sqlite3_free(err);
        }
        return result;
    }

    DbResultSet result;
    result.success = true;
    result.affected_rows = static_cast<uint64_t>(sqlite3_changes64(db_));
    return result;
}

DbResultSet SqliteConnection::insert_rows(const std::string& insert_sql, const std::vector<Row>& rows) {
    if (!db_) {
        return DbResultSet::error(ErrorKind::INTERNAL, "Connection is closed");
    }
    if (read_only_) {
        return DbResultSet::error(ErrorKind::MUTATION_ATTEMPT,
            "Connection is read-only");
    }

    auto begin = execute_command("BEGIN");
    if (!begin.success) return begin;

    auto rollback = [this]() {
        char* err = nullptr;
        if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, &err) != SQLITE_OK) {
            utils::log::warn(std::format("Rollback failed: {}", err ? err : sqlite3_errmsg(db_)));
        }
        sqlite3_free(err);
    };

    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(db_, insert_sql.c_str(), -1, &raw, nullptr);
    StmtPtr stmt(raw);
    if (rc != SQLITE_OK || !stmt) {
        auto error = rc != SQLITE_OK
            ? classify_error(rc)
            : DbResultSet::error(ErrorKind::INTERNAL, "Insert statement is empty");
        rollback();
        return error;
    }

    DbResultSet result;
    const int params = sqlite3_bind_parameter_count(stmt.get());

    for (size_t i = 0; i < rows.size(); ++i) {
        const auto& row = rows[i];
        sqlite3_reset(stmt.get());
        sqlite3_clear_bindings(stmt.get());

        if (static_cast<int>(row.size()) != params) {
            result.rejected_rows.push_back(std::format(
                "row {}: expected {} values, got {}", i + 1, params, row.size()));
            continue;
        }

        bool bound = true;
        for (size_t c = 0; c < row.size(); ++c) {
            if (bind_value(stmt.get(), static_cast<int>(c) + 1, row[c]) != SQLITE_OK) {
                result.rejected_rows.push_back(std::format(
                    "row {}: {}", i + 1, sqlite3_errmsg(db_)));
                bound = false;
                break;
            }
        }
        if (!bound) continue;

        rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE) {
            ++result.affected_rows;
        } else {
            result.rejected_rows.push_back(std::format(
                "row {}: {}", i + 1, sqlite3_errmsg(db_)));
        }
    }
    stmt.reset();

    auto commit = execute_command("COMMIT");
    if (!commit.success) {
        rollback();
        return commit;
    }

    result.success = true;
    return result;
}

bool SqliteConnection::set_query_timeout(uint32_t timeout_ms) {
    if (!db_) {
        return false;
    }
    timeout_ms_ = timeout_ms;
    return true;
}

void SqliteConnection::set_read_only(bool read_only) {
    read_only_ = read_only;
}

bool SqliteConnection::is_connected() const {
    return db_ != nullptr;
}

void SqliteConnection::close() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

int SqliteConnection::progress_callback(void* self) {
    auto* conn = static_cast<SqliteConnection*>(self);
    if (!conn->deadline_armed_) return 0;
    if (std::chrono::steady_clock::now() >= conn->deadline_) {
        conn->deadline_hit_ = true;
        return 1;   // Interrupts the running statement with SQLITE_INTERRUPT
    }
    return 0;
}

int SqliteConnection::authorizer_callback(void* self, int action, const char* arg1,
                                          const char* /*arg2*/, const char* /*db_name*/,
                                          const char* /*trigger_name*/) {
    const auto* conn = static_cast<const SqliteConnection*>(self);

    if (action == SQLITE_ATTACH || action == SQLITE_DETACH) {
        return SQLITE_DENY;
    }
    if (!conn->read_only_) {
        return SQLITE_OK;
    }

    switch (action) {
        case SQLITE_SELECT:
        case SQLITE_FUNCTION:
        case SQLITE_RECURSIVE:
            return SQLITE_OK;
        case SQLITE_READ:
            // Engine catalog tables would reveal physical identifiers
            if (arg1 && std::string_view(arg1).starts_with("sqlite_")) return SQLITE_DENY;
            return SQLITE_OK;
        default:
            return SQLITE_DENY;
    }
}

DbResultSet SqliteConnection::classify_error(int rc) const {
    const std::string message = db_ ? sqlite3_errmsg(db_) : "Connection is closed";

    switch (rc & 0xFF) {
        case SQLITE_INTERRUPT:
            if (deadline_hit_) {
                return DbResultSet::error(ErrorKind::TIMEOUT, std::format(
                    "Query exceeded the {} ms time limit", timeout_ms_));
            }
            return DbResultSet::error(ErrorKind::INTERNAL, message);

        case SQLITE_AUTH:
        case SQLITE_READONLY:
            return DbResultSet::error(ErrorKind::MUTATION_ATTEMPT,
                "Statement not permitted: only read-only SELECT queries are allowed.");

        case SQLITE_ERROR:
        case SQLITE_MISMATCH:
        case SQLITE_CONSTRAINT:
        case SQLITE_RANGE:
        case SQLITE_TOOBIG:
            return DbResultSet::error(ErrorKind::ENGINE_ERROR, message);

        default:
            return DbResultSet::error(ErrorKind::INTERNAL, std::format(
                "{} ({})", message, sqlite3_errstr(rc)));
    }
}

void SqliteConnection::arm_deadline() {
    deadline_hit_ = false;
    deadline_armed_ = timeout_ms_ > 0;
    if (deadline_armed_) {
        deadline_ = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms_);
    }
}

void SqliteConnection::disarm_deadline() {
    deadline_armed_ = false;
}

// ============================================================================
// SqliteConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> SqliteConnectionFactory::create(
    const std::string& connection_string) {

    sqlite3* db = nullptr;
    const int rc = sqlite3_open_v2(
        connection_string.c_str(), &db,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_PRIVATECACHE,
        nullptr);

    if (rc != SQLITE_OK) {
        utils::log::error(std::format("Failed to open engine database '{}': {}",
            connection_string, db ? sqlite3_errmsg(db) : sqlite3_errstr(rc)));
        if (db) {
            sqlite3_close_v2(db);
        }
        return nullptr;
    }

    return std::make_unique<SqliteConnection>(db);
}

} // namespace sqlsandbox
