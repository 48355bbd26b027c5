#include "core/types.hpp"
#include "core/utils.hpp"

#include <unordered_map>

namespace sqlsandbox {

std::optional<DeclaredType> parse_declared_type(std::string_view name) {
    static const std::unordered_map<std::string, DeclaredType> lookup = {
        {"integer",  DeclaredType::INTEGER},
        {"int",      DeclaredType::INTEGER},
        {"bigint",   DeclaredType::INTEGER},
        {"smallint", DeclaredType::INTEGER},
        {"real",     DeclaredType::REAL},
        {"float",    DeclaredType::REAL},
        {"double",   DeclaredType::REAL},
        {"decimal",  DeclaredType::REAL},
        {"numeric",  DeclaredType::REAL},
        {"text",     DeclaredType::TEXT},
        {"varchar",  DeclaredType::TEXT},
        {"string",   DeclaredType::TEXT},
        {"char",     DeclaredType::TEXT},
        {"date",     DeclaredType::DATE},
    };

    const auto it = lookup.find(utils::to_lower(utils::trim(std::string(name))));
    if (it == lookup.end()) return std::nullopt;
    return it->second;
}

} // namespace sqlsandbox
