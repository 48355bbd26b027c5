#pragma once

#include "core/column_type.hpp"
#include "core/types.hpp"
#include "db/idb_connection.hpp"
#include "tenant/tenant_namespace.hpp"

#include <optional>
#include <string>

namespace sqlsandbox {

/**
 * @brief Converts engine-native results into JSON-safe rows
 *
 * - Column order is preserved; duplicate names are kept as-is
 * - Column names are mapped back to logical table names
 * - Temporal columns: integers are Unix seconds, reals are Julian days,
 *   both rendered as ISO-8601; text passes through
 * - BOOLEAN columns: 0/1 become booleans
 * - Blobs become base64 text; NaN/Inf become null
 */
class ResultNormalizer {
public:
    [[nodiscard]] static QueryOutcome normalize(DbResultSet result, const TenantNamespace& ns);

    [[nodiscard]] static Value normalize_value(Value value, const ColumnTypeInfo& type);

    /**
     * @brief ISO-8601 for a Unix timestamp (date only for DATE columns)
     * @return std::nullopt if outside years 0001-9999
     */
    [[nodiscard]] static std::optional<std::string> format_unix_seconds(int64_t seconds, bool date_only);
};

} // namespace sqlsandbox
