#include "db/sqlite/sqlite_type_map.hpp"
#include "core/utils.hpp"

#include <unordered_map>

namespace sqlsandbox {

GenericColumnType SqliteTypeMap::decltype_to_generic(const char* decltype_name) {
    if (!decltype_name || !*decltype_name) return GenericColumnType::UNKNOWN;

    static const std::unordered_map<std::string, GenericColumnType> EXACT = {
        {"date", GenericColumnType::DATE},
        {"datetime", GenericColumnType::TIMESTAMP},
        {"timestamp", GenericColumnType::TIMESTAMP},
        {"boolean", GenericColumnType::BOOLEAN},
        {"bool", GenericColumnType::BOOLEAN},
    };

    const std::string lower = utils::to_lower(decltype_name);
    if (const auto it = EXACT.find(lower); it != EXACT.end()) {
        return it->second;
    }

    // SQLite column affinity rules, in precedence order
    if (lower.contains("int")) return GenericColumnType::INTEGER;
    if (lower.contains("char") || lower.contains("clob") || lower.contains("text")) {
        return GenericColumnType::TEXT;
    }
    if (lower.contains("blob")) return GenericColumnType::BLOB;
    if (lower.contains("real") || lower.contains("floa") || lower.contains("doub")) {
        return GenericColumnType::REAL;
    }
    return GenericColumnType::NUMERIC;
}

ColumnTypeInfo SqliteTypeMap::build_type_info(const char* decltype_name) {
    return ColumnTypeInfo(decltype_to_generic(decltype_name),
                          decltype_name ? std::string(decltype_name) : std::string{});
}

const char* SqliteTypeMap::native_type(DeclaredType type) {
    switch (type) {
        case DeclaredType::INTEGER: return "INTEGER";
        case DeclaredType::REAL: return "REAL";
        case DeclaredType::TEXT: return "TEXT";
        case DeclaredType::DATE: return "DATE";
        default: return "TEXT";
    }
}

} // namespace sqlsandbox
