#include "parser/statement_scanner.hpp"

#include <algorithm>
#include <string_view>
#include <unordered_set>

namespace sqlsandbox {

namespace {

constexpr size_t kNone = static_cast<size_t>(-1);

// Keywords that end a comma-separated FROM list at the current depth
const std::unordered_set<std::string_view> kFromListTerminators = {
    "where", "group", "order", "having", "union", "intersect", "except",
    "window", "values", "set", "returning", "select"
};

// Words that can follow a table name without being its alias
const std::unordered_set<std::string_view> kNotAlias = {
    "where", "group", "order", "having", "limit", "offset", "union", "intersect",
    "except", "window", "join", "inner", "left", "right", "full", "outer", "cross",
    "natural", "on", "using", "as", "indexed", "not", "set", "values", "select",
    "returning", "from", "default"
};

bool starts_subquery(const Token* tok) {
    return tok && (tok->is_word("select") || tok->is_word("with") || tok->is_word("values"));
}

class Cursor {
public:
    explicit Cursor(const TokenStream& ts) : ts_(ts), sig_(ts.significant()) {}

    [[nodiscard]] size_t size() const { return sig_.size(); }
    [[nodiscard]] size_t token_index(size_t k) const { return sig_[k]; }

    [[nodiscard]] const Token* at(size_t k) const {
        return k < sig_.size() ? &ts_[sig_[k]] : nullptr;
    }

    // Position of the ')' matching the '(' at k, or the last position if unbalanced
    [[nodiscard]] size_t matching_paren(size_t k) const {
        int depth = 0;
        for (size_t j = k; j < sig_.size(); ++j) {
            const Token& t = ts_[sig_[j]];
            if (t.is_punct('(')) ++depth;
            else if (t.is_punct(')') && --depth == 0) return j;
        }
        return sig_.empty() ? 0 : sig_.size() - 1;
    }

private:
    const TokenStream& ts_;
    const std::vector<size_t>& sig_;
};

void count_statements(const Cursor& cur, StatementScan& scan) {
    bool in_statement = false;
    bool first_seen = false;
    for (size_t k = 0; k < cur.size(); ++k) {
        const Token* t = cur.at(k);
        if (t->is_punct(';')) {
            if (in_statement) ++scan.statement_count;
            in_statement = false;
            continue;
        }
        if (!first_seen) {
            first_seen = true;
            scan.is_read_query = starts_subquery(t);
        }
        in_statement = true;
    }
    if (in_statement) ++scan.statement_count;
}

// WITH [RECURSIVE] name [(cols)] AS [[NOT] MATERIALIZED] (body) [, ...]
void collect_ctes(const Cursor& cur, StatementScan& scan) {
    for (size_t k = 0; k < cur.size(); ++k) {
        if (!cur.at(k)->is_word("with")) continue;

        size_t j = k + 1;
        if (cur.at(j) && cur.at(j)->is_word("recursive")) ++j;

        while (true) {
            const Token* name = cur.at(j);
            if (!name || !name->is_identifier()) break;
            ++j;
            if (cur.at(j) && cur.at(j)->is_punct('(')) j = cur.matching_paren(j) + 1;
            if (!cur.at(j) || !cur.at(j)->is_word("as")) break;
            ++j;
            if (cur.at(j) && cur.at(j)->is_word("not")) ++j;
            if (cur.at(j) && cur.at(j)->is_word("materialized")) ++j;
            if (!cur.at(j) || !cur.at(j)->is_punct('(')) break;
            j = cur.matching_paren(j) + 1;
            scan.cte_names.insert(name->normalized);
            if (cur.at(j) && cur.at(j)->is_punct(',')) {
                ++j;
                continue;
            }
            break;
        }
    }
}

// Reads [schema.]name [AS alias | alias] starting at k. Returns the last
// position consumed.
size_t read_table_reference(const Cursor& cur, size_t k, StatementScan& scan,
                            bool allow_alias = true) {
    size_t name_k = k;
    std::string qualifier;

    const Token* dot = cur.at(k + 1);
    const Token* after_dot = cur.at(k + 2);
    if (dot && dot->is_punct('.') && after_dot && after_dot->is_identifier()) {
        qualifier = cur.at(k)->normalized;
        name_k = k + 2;
    }

    TableReference ref;
    ref.token_index = cur.token_index(name_k);
    ref.name = cur.at(name_k)->normalized;
    ref.qualifier = std::move(qualifier);

    const Token* after = cur.at(name_k + 1);
    if (after && after->is_punct('(')) {
        // Arguments are walked by the caller
        ref.is_function = true;
        scan.table_refs.push_back(std::move(ref));
        return name_k;
    }
    scan.table_refs.push_back(std::move(ref));
    if (!allow_alias) return name_k;

    if (after && after->is_word("as")) {
        const Token* alias = cur.at(name_k + 2);
        if (alias && alias->is_identifier()) {
            scan.aliases.insert(alias->normalized);
            return name_k + 2;
        }
        return name_k + 1;
    }

    if (after && (after->kind == TokenKind::QUOTED_IDENTIFIER ||
                  (after->kind == TokenKind::WORD && !kNotAlias.contains(after->normalized)))) {
        scan.aliases.insert(after->normalized);
        return name_k + 1;
    }
    return name_k;
}

} // anonymous namespace

StatementScan StatementScanner::scan(const TokenStream& tokens) {
    StatementScan scan;
    const Cursor cur(tokens);

    count_statements(cur, scan);
    collect_ctes(cur, scan);

    // from_list[d]: a comma at depth d introduces another table
    std::vector<bool> from_list(1, false);
    size_t depth = 0;
    size_t expect_table = kNone;

    for (size_t k = 0; k < cur.size(); ++k) {
        const Token& t = *cur.at(k);

        if (t.is_punct('(')) {
            ++depth;
            if (from_list.size() <= depth) from_list.resize(depth + 1, false);
            from_list[depth] = false;
            // Parenthesized join list: FROM (a JOIN b ON ...)
            if (k == expect_table && !starts_subquery(cur.at(k + 1))) {
                from_list[depth] = true;
                expect_table = k + 1;
            }
            continue;
        }
        if (t.is_punct(')')) {
            from_list[depth] = false;
            if (depth > 0) --depth;
            continue;
        }
        if (t.is_punct(';')) {
            depth = 0;
            std::fill(from_list.begin(), from_list.end(), false);
            continue;
        }
        if (t.is_punct(',')) {
            if (from_list[depth]) expect_table = k + 1;
            continue;
        }

        if (k == expect_table && t.is_identifier()) {
            k = read_table_reference(cur, k, scan);
            continue;
        }

        if (t.kind == TokenKind::WORD) {
            const std::string& w = t.normalized;
            if (w == "from") {
                // IS [NOT] DISTINCT FROM <expr>
                const Token* prev = k > 0 ? cur.at(k - 1) : nullptr;
                if (!(prev && prev->is_word("distinct"))) {
                    from_list[depth] = true;
                    expect_table = k + 1;
                }
            } else if (w == "join") {
                from_list[depth] = true;
                expect_table = k + 1;
            } else if (w == "into" || w == "update" || w == "table") {
                expect_table = k + 1;
            } else if (w == "in") {
                // expr [NOT] IN [schema.]table
                const Token* next = cur.at(k + 1);
                if (next && next->is_identifier()) {
                    k = read_table_reference(cur, k + 1, scan, false);
                    continue;
                }
            } else if (w == "limit") {
                if (depth == 0) scan.has_top_level_limit = true;
                from_list[depth] = false;
            } else if (kFromListTerminators.contains(w)) {
                from_list[depth] = false;
            }
        }

        if (t.is_identifier()) {
            const Token* next = cur.at(k + 1);
            const Token* member = cur.at(k + 2);
            if (next && next->is_punct('.') && member &&
                (member->is_identifier() ||
                 (member->kind == TokenKind::OPERATOR && member->normalized == "*"))) {
                scan.qualifier_tokens.push_back(cur.token_index(k));
            }
        }
    }

    return scan;
}

} // namespace sqlsandbox
