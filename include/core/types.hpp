#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sqlsandbox {

// ============================================================================
// Error Kinds
// ============================================================================

/**
 * @brief Classification of every failure a session or query can produce
 *
 * MUTATION_ATTEMPT, OUT_OF_SCOPE_TABLE and ENGINE_ERROR messages are shown
 * to the candidate verbatim. INTERNAL messages are never shown.
 */
enum class ErrorKind : uint8_t {
    NONE,
    PROVISION_ERROR,
    MUTATION_ATTEMPT,
    OUT_OF_SCOPE_TABLE,
    ENGINE_ERROR,
    TIMEOUT,
    BUSY,
    SESSION_NOT_FOUND,
    INTERNAL
};

[[nodiscard]] inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "NONE";
        case ErrorKind::PROVISION_ERROR: return "PROVISION_ERROR";
        case ErrorKind::MUTATION_ATTEMPT: return "MUTATION_ATTEMPT";
        case ErrorKind::OUT_OF_SCOPE_TABLE: return "OUT_OF_SCOPE_TABLE";
        case ErrorKind::ENGINE_ERROR: return "ENGINE_ERROR";
        case ErrorKind::TIMEOUT: return "TIMEOUT";
        case ErrorKind::BUSY: return "BUSY";
        case ErrorKind::SESSION_NOT_FOUND: return "SESSION_NOT_FOUND";
        case ErrorKind::INTERNAL: return "INTERNAL";
        default: return "UNKNOWN";
    }
}

// ============================================================================
// Catalog Schema
// ============================================================================

enum class DeclaredType : uint8_t {
    INTEGER,
    REAL,
    TEXT,
    DATE
};

[[nodiscard]] inline const char* declared_type_to_string(DeclaredType type) {
    switch (type) {
        case DeclaredType::INTEGER: return "INTEGER";
        case DeclaredType::REAL: return "REAL";
        case DeclaredType::TEXT: return "TEXT";
        case DeclaredType::DATE: return "DATE";
        default: return "TEXT";
    }
}

/**
 * @brief Parse a catalog type name (case-insensitive, common aliases accepted)
 * @return std::nullopt for names outside the supported set
 */
[[nodiscard]] std::optional<DeclaredType> parse_declared_type(std::string_view name);

struct ColumnDecl {
    std::string name;
    DeclaredType type = DeclaredType::TEXT;

    bool operator==(const ColumnDecl&) const = default;
};

struct TableSchema {
    std::string name;                   // Logical name as declared by the catalog
    std::vector<ColumnDecl> columns;    // Catalog order

    bool operator==(const TableSchema&) const = default;
};

// ============================================================================
// Values
// ============================================================================

/**
 * @brief A single cell value
 *
 * Engine rows may hold any kind. Rows leaving the ResultNormalizer never
 * hold BLOB: those are converted to base64 TEXT.
 */
struct Value {
    enum class Kind : uint8_t { NULL_VALUE, BOOLEAN, INTEGER, REAL, TEXT, BLOB };

    Kind kind = Kind::NULL_VALUE;
    bool bool_value = false;
    int64_t int_value = 0;
    double real_value = 0.0;
    std::string text;                   // TEXT payload, or raw bytes for BLOB

    [[nodiscard]] static Value null() { return {}; }

    [[nodiscard]] static Value boolean(bool v) {
        Value val;
        val.kind = Kind::BOOLEAN;
        val.bool_value = v;
        return val;
    }

    [[nodiscard]] static Value integer(int64_t v) {
        Value val;
        val.kind = Kind::INTEGER;
        val.int_value = v;
        return val;
    }

    [[nodiscard]] static Value real(double v) {
        Value val;
        val.kind = Kind::REAL;
        val.real_value = v;
        return val;
    }

    [[nodiscard]] static Value text_value(std::string v) {
        Value val;
        val.kind = Kind::TEXT;
        val.text = std::move(v);
        return val;
    }

    [[nodiscard]] static Value blob(std::string bytes) {
        Value val;
        val.kind = Kind::BLOB;
        val.text = std::move(bytes);
        return val;
    }

    [[nodiscard]] bool is_null() const { return kind == Kind::NULL_VALUE; }

    bool operator==(const Value& other) const {
        if (kind != other.kind) return false;
        switch (kind) {
            case Kind::NULL_VALUE: return true;
            case Kind::BOOLEAN: return bool_value == other.bool_value;
            case Kind::INTEGER: return int_value == other.int_value;
            case Kind::REAL: return real_value == other.real_value;
            case Kind::TEXT:
            case Kind::BLOB: return text == other.text;
        }
        return false;
    }
};

using Row = std::vector<Value>;

// ============================================================================
// Query Outcome
// ============================================================================

/**
 * @brief Result of running one candidate query
 *
 * rows[i][j] belongs to columns[j]; duplicate column names are kept as the
 * engine returned them.
 */
struct QueryOutcome {
    bool success = false;
    ErrorKind error_kind = ErrorKind::NONE;
    std::string error_message;

    std::vector<std::string> columns;
    std::vector<Row> rows;
    bool truncated = false;

    std::chrono::microseconds elapsed{0};

    [[nodiscard]] static QueryOutcome failure(ErrorKind kind, std::string message) {
        QueryOutcome outcome;
        outcome.success = false;
        outcome.error_kind = kind;
        outcome.error_message = std::move(message);
        return outcome;
    }
};

// ============================================================================
// Provision Report (operator-facing only)
// ============================================================================

struct TableLoadStats {
    std::string logical_name;
    std::string physical_name;
    uint64_t rows_loaded = 0;
    uint64_t rows_skipped = 0;
};

struct ProvisionReport {
    int64_t problem_id = 0;
    std::vector<TableLoadStats> tables;

    [[nodiscard]] uint64_t total_loaded() const {
        uint64_t total = 0;
        for (const auto& t : tables) total += t.rows_loaded;
        return total;
    }

    [[nodiscard]] uint64_t total_skipped() const {
        uint64_t total = 0;
        for (const auto& t : tables) total += t.rows_skipped;
        return total;
    }
};

} // namespace sqlsandbox
