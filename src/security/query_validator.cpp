#include "security/query_validator.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace sqlsandbox {

namespace {

std::string join_sorted(const std::unordered_set<std::string>& names) {
    std::vector<std::string> sorted(names.begin(), names.end());
    std::sort(sorted.begin(), sorted.end());
    std::string out;
    for (size_t i = 0; i < sorted.size(); ++i) {
        if (i > 0) out += ", ";
        out += sorted[i];
    }
    return out;
}

} // anonymous namespace

const std::vector<std::string>& QueryValidator::blocked_keywords() {
    // PRAGMA and VACUUM reconfigure the engine or write files
    static const std::vector<std::string> keywords = {
        "drop", "delete", "update", "insert", "alter", "create", "truncate",
        "replace", "attach", "detach", "pragma", "vacuum"
    };
    return keywords;
}

std::optional<std::string> QueryValidator::find_blocked_keyword(const TokenStream& tokens) {
    const auto& keywords = blocked_keywords();
    for (const size_t idx : tokens.significant()) {
        const Token& tok = tokens[idx];
        if (tok.kind != TokenKind::WORD) continue;
        if (std::find(keywords.begin(), keywords.end(), tok.normalized) != keywords.end()) {
            return utils::to_upper(tok.normalized);
        }
    }
    return std::nullopt;
}

ValidationResult QueryValidator::validate(
    const std::string& sql,
    const std::vector<std::string>& allowed_tables) {

    std::unordered_set<std::string> allowed_lower;
    allowed_lower.reserve(allowed_tables.size());
    for (const auto& name : allowed_tables) {
        allowed_lower.insert(utils::to_lower(name));
    }

    const auto tokens = SqlTokenizer::tokenize(sql);
    const auto scan = StatementScanner::scan(tokens);
    return validate(tokens, scan, allowed_lower);
}

ValidationResult QueryValidator::validate(
    const TokenStream& tokens,
    const StatementScan& scan,
    const std::unordered_set<std::string>& allowed_lower) {

    if (const auto keyword = find_blocked_keyword(tokens)) {
        return ValidationResult::reject(ErrorKind::MUTATION_ATTEMPT, std::format(
            "Blocked keyword detected: {}. Only read-only SELECT queries are allowed.",
            *keyword));
    }

    // Nothing is ever bound, and a variable token can span text that would
    // otherwise be checked
    for (const size_t idx : tokens.significant()) {
        if (tokens[idx].kind == TokenKind::PARAMETER) {
            return ValidationResult::reject(ErrorKind::ENGINE_ERROR, std::format(
                "Query parameters are not supported: {}", tokens.text(idx)));
        }
    }

    for (const auto& ref : scan.table_refs) {
        const std::string shown(tokens.text(ref.token_index));

        if (!ref.qualifier.empty() && ref.qualifier != "main") {
            return ValidationResult::reject(ErrorKind::OUT_OF_SCOPE_TABLE, std::format(
                "Table '{}.{}' is not available for this problem. Available tables: {}",
                ref.qualifier, shown, join_sorted(allowed_lower)));
        }

        if (ref.is_function) {
            return ValidationResult::reject(ErrorKind::OUT_OF_SCOPE_TABLE, std::format(
                "Table-valued function '{}' is not available for this problem. Available tables: {}",
                shown, join_sorted(allowed_lower)));
        }

        if (scan.is_cte(ref.name) || allowed_lower.contains(ref.name)) continue;

        return ValidationResult::reject(ErrorKind::OUT_OF_SCOPE_TABLE, std::format(
            "Table '{}' is not available for this problem. Available tables: {}",
            shown, join_sorted(allowed_lower)));
    }

    return ValidationResult::ok();
}

} // namespace sqlsandbox
