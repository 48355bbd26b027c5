#pragma once

#include <cstdint>
#include <string>

namespace sqlsandbox {

/**
 * @brief Engine-agnostic column type classification
 *
 * Derived from the engine's declared column type. Drives temporal and
 * boolean conversion in the ResultNormalizer.
 */
enum class GenericColumnType : uint16_t {
    UNKNOWN = 0,

    INTEGER,
    REAL,
    NUMERIC,
    TEXT,
    BOOLEAN,

    // Date/Time
    DATE,
    TIMESTAMP,

    BLOB,
};

/**
 * @brief Column type info carrying both generic and engine-specific data
 */
struct ColumnTypeInfo {
    GenericColumnType generic_type = GenericColumnType::UNKNOWN;
    std::string vendor_type_name;      // Declared type as written, e.g. "DATE"

    ColumnTypeInfo() = default;
    ColumnTypeInfo(GenericColumnType gt, std::string vname)
        : generic_type(gt), vendor_type_name(std::move(vname)) {}

    [[nodiscard]] bool is_temporal() const {
        return generic_type == GenericColumnType::DATE ||
               generic_type == GenericColumnType::TIMESTAMP;
    }
};

[[nodiscard]] inline const char* generic_column_type_to_string(GenericColumnType type) {
    switch (type) {
        case GenericColumnType::UNKNOWN: return "UNKNOWN";
        case GenericColumnType::INTEGER: return "INTEGER";
        case GenericColumnType::REAL: return "REAL";
        case GenericColumnType::NUMERIC: return "NUMERIC";
        case GenericColumnType::TEXT: return "TEXT";
        case GenericColumnType::BOOLEAN: return "BOOLEAN";
        case GenericColumnType::DATE: return "DATE";
        case GenericColumnType::TIMESTAMP: return "TIMESTAMP";
        case GenericColumnType::BLOB: return "BLOB";
        default: return "UNKNOWN";
    }
}

} // namespace sqlsandbox
