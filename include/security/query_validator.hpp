#pragma once

#include "core/types.hpp"
#include "parser/sql_tokenizer.hpp"
#include "parser/statement_scanner.hpp"

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace sqlsandbox {

/**
 * @brief Outcome of validating one candidate query
 */
struct ValidationResult {
    bool allowed = true;
    ErrorKind error_kind = ErrorKind::NONE;
    std::string message;

    [[nodiscard]] static ValidationResult ok() { return {}; }

    [[nodiscard]] static ValidationResult reject(ErrorKind kind, std::string msg) {
        return {false, kind, std::move(msg)};
    }
};

/**
 * @brief Read-only and tenant-scope gate for candidate SQL
 *
 * Two independent checks, both mandatory:
 * 1. Mutation check: any bare word matching the denylist is rejected. Words
 *    inside string literals, comments and quoted identifiers never match.
 * 2. Scope check: every table reference must be an allowed table or a CTE
 *    declared by the same query. Only the "main" schema qualifier is accepted.
 *
 * Bind parameters are rejected between the two; nothing is ever bound.
 *
 * The mutation check runs first.
 */
class QueryValidator {
public:
    /**
     * @brief Validate raw SQL against a set of logical table names
     * @param allowed_tables Logical names, any case
     */
    [[nodiscard]] static ValidationResult validate(
        const std::string& sql,
        const std::vector<std::string>& allowed_tables);

    /**
     * @brief Validate an already tokenized and scanned statement
     * @param allowed_lower Lowercased logical names
     */
    [[nodiscard]] static ValidationResult validate(
        const TokenStream& tokens,
        const StatementScan& scan,
        const std::unordered_set<std::string>& allowed_lower);

    /**
     * @brief First denylisted keyword in the statement, uppercased
     */
    [[nodiscard]] static std::optional<std::string> find_blocked_keyword(const TokenStream& tokens);

    [[nodiscard]] static const std::vector<std::string>& blocked_keywords();
};

} // namespace sqlsandbox
