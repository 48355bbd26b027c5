#pragma once

#include "parser/sql_tokenizer.hpp"

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

namespace sqlsandbox {

/**
 * @brief An identifier found in a table position (FROM, JOIN, comma list, ...)
 */
struct TableReference {
    size_t token_index = 0;     // Index into TokenStream::tokens() of the name
    std::string name;           // Lowercased, unquoted
    std::string qualifier;      // Lowercased schema qualifier, empty if none
    bool is_function = false;   // Table-valued function call: FROM f(...)
};

/**
 * @brief Structural facts about a statement, derived from its significant tokens
 *
 * Shared by the validator, the identifier rewriter and limit enforcement so
 * that all three agree on what counts as a table position.
 */
struct StatementScan {
    std::vector<TableReference> table_refs;
    std::vector<size_t> qualifier_tokens;       // Identifiers directly followed by '.'
    std::unordered_set<std::string> cte_names;
    std::unordered_set<std::string> aliases;
    bool has_top_level_limit = false;
    bool is_read_query = false;
    size_t statement_count = 0;

    [[nodiscard]] bool is_cte(const std::string& lower_name) const {
        return cte_names.contains(lower_name);
    }

    [[nodiscard]] bool is_alias(const std::string& lower_name) const {
        return aliases.contains(lower_name);
    }
};

class StatementScanner {
public:
    [[nodiscard]] static StatementScan scan(const TokenStream& tokens);
};

} // namespace sqlsandbox
