#pragma once

#include "parser/sql_tokenizer.hpp"
#include "parser/statement_scanner.hpp"
#include "tenant/tenant_namespace.hpp"

#include <cstdint>
#include <string>

namespace sqlsandbox {

/**
 * @brief Query rewriter: tenant identifier mapping + enforce_limit
 *
 * Applies query transformations between validation and execution:
 * 1. Identifier mapping: logical table names in table and qualifier
 *    positions become the session's physical identifiers
 * 2. Enforce Limit: appends LIMIT N to read queries without a top-level LIMIT
 *
 * Stateless; safe to call from any thread.
 */
class QueryRewriter {
public:
    /**
     * @brief Map logical table names to physical identifiers
     *
     * Names declared as CTEs are left alone; qualifiers that name an alias
     * or a CTE are left alone. Quoted identifiers stay quoted. All other
     * text is copied byte-for-byte.
     */
    [[nodiscard]] static std::string rewrite(
        const TokenStream& tokens,
        const StatementScan& scan,
        const TenantNamespace& ns);

    [[nodiscard]] static std::string rewrite(const std::string& sql, const TenantNamespace& ns);

    /**
     * @brief Append LIMIT after the last significant token
     * @return Rewritten SQL (empty if no change is needed)
     */
    [[nodiscard]] static std::string enforce_limit(const std::string& sql, uint32_t limit_value);

private:
    static std::string requote(std::string_view original, const std::string& name);
};

} // namespace sqlsandbox
