#include "core/query_rewriter.hpp"

#include <algorithm>
#include <format>
#include <unordered_map>

namespace sqlsandbox {

std::string QueryRewriter::rewrite(
    const TokenStream& tokens,
    const StatementScan& scan,
    const TenantNamespace& ns) {

    // token index -> replacement text
    std::unordered_map<size_t, std::string> replacements;

    for (const auto& ref : scan.table_refs) {
        if (ref.is_function || scan.is_cte(ref.name)) continue;
        const auto physical = ns.physical_for(ref.name);
        if (!physical) continue;
        replacements[ref.token_index] = requote(tokens.text(ref.token_index), *physical);
    }

    for (const size_t idx : scan.qualifier_tokens) {
        const auto& name = tokens[idx].normalized;
        if (scan.is_alias(name) || scan.is_cte(name)) continue;
        const auto physical = ns.physical_for(name);
        if (!physical) continue;
        replacements[idx] = requote(tokens.text(idx), *physical);
    }

    if (replacements.empty()) return tokens.sql();

    std::string result;
    result.reserve(tokens.sql().size() + replacements.size() * 8);
    for (size_t i = 0; i < tokens.size(); ++i) {
        const auto it = replacements.find(i);
        if (it != replacements.end()) {
            result += it->second;
        } else {
            result += tokens.text(i);
        }
    }
    return result;
}

std::string QueryRewriter::rewrite(const std::string& sql, const TenantNamespace& ns) {
    const auto tokens = SqlTokenizer::tokenize(sql);
    const auto scan = StatementScanner::scan(tokens);
    return rewrite(tokens, scan, ns);
}

std::string QueryRewriter::enforce_limit(const std::string& sql, uint32_t limit_value) {
    const auto tokens = SqlTokenizer::tokenize(sql);
    const auto scan = StatementScanner::scan(tokens);

    if (!scan.is_read_query || scan.has_top_level_limit || scan.statement_count != 1) {
        return {};
    }

    // Insertion point: right after the last significant token that is not ';',
    // so trailing semicolons and comments cannot swallow the clause
    const auto& sig = tokens.significant();
    const auto last = std::find_if(sig.rbegin(), sig.rend(),
        [&](size_t idx) { return !tokens[idx].is_punct(';'); });
    if (last == sig.rend()) return {};

    const Token& anchor = tokens[*last];
    const size_t insert_pos = anchor.offset + anchor.length;

    std::string result = sql.substr(0, insert_pos);
    result += std::format(" LIMIT {}", limit_value);
    result += sql.substr(insert_pos);
    return result;
}

std::string QueryRewriter::requote(std::string_view original, const std::string& name) {
    if (original.empty()) return name;
    switch (original.front()) {
        case '"': return std::format("\"{}\"", name);
        case '`': return std::format("`{}`", name);
        case '[': return std::format("[{}]", name);
        default:  return name;
    }
}

} // namespace sqlsandbox
