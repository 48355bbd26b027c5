#pragma once

#include "core/column_type.hpp"
#include "core/types.hpp"
#include <string>

namespace sqlsandbox {

/**
 * @brief SQLite type mapping utilities
 *
 * SQLite reports the declared type of a result column only when the column
 * is a direct table reference; expressions report nothing (UNKNOWN).
 */
class SqliteTypeMap {
public:
    /**
     * @brief Map a declared column type to GenericColumnType
     * @param decltype_name Declared type as written, may be null
     */
    [[nodiscard]] static GenericColumnType decltype_to_generic(const char* decltype_name);

    /**
     * @brief Build a full ColumnTypeInfo from a declared column type
     */
    [[nodiscard]] static ColumnTypeInfo build_type_info(const char* decltype_name);

    /**
     * @brief Native column type used when provisioning a catalog column
     */
    [[nodiscard]] static const char* native_type(DeclaredType type);
};

} // namespace sqlsandbox
