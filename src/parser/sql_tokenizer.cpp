#include "parser/sql_tokenizer.hpp"

namespace sqlsandbox {

// ============================================================================
// Lookup table for character classification. Locale-independent, and a single
// load gives both the class and the lowercase form.
// ============================================================================
namespace {

enum CharClass : uint8_t {
    CC_OTHER   = 0,
    CC_SPACE   = 1,
    CC_DIGIT   = 2,
    CC_ALPHA   = 4,
    CC_IDENT   = 8,   // _ and $ (identifier continuation), bytes >= 0x80
    CC_PUNCT   = 16,  // ( ) , ; .
};

struct CharTable {
    uint8_t cls[256];
    char    lower[256];

    constexpr CharTable() : cls{}, lower{} {
        for (int i = 0; i < 256; ++i) {
            lower[i] = static_cast<char>(i);
            cls[i] = CC_OTHER;
        }
        cls[' '] = CC_SPACE; cls['\t'] = CC_SPACE;
        cls['\n'] = CC_SPACE; cls['\r'] = CC_SPACE;
        cls['\f'] = CC_SPACE; cls['\v'] = CC_SPACE;
        for (int i = '0'; i <= '9'; ++i) cls[i] = CC_DIGIT;
        for (int i = 'a'; i <= 'z'; ++i) cls[i] = CC_ALPHA;
        for (int i = 'A'; i <= 'Z'; ++i) {
            cls[i] = CC_ALPHA;
            lower[i] = static_cast<char>(i + 32);
        }
        for (int i = 0x80; i < 256; ++i) cls[i] = CC_IDENT;
        cls['_'] = CC_IDENT;
        cls['$'] = CC_IDENT;
        cls['('] = CC_PUNCT; cls[')'] = CC_PUNCT; cls[','] = CC_PUNCT;
        cls[';'] = CC_PUNCT; cls['.'] = CC_PUNCT;
    }
};

static constexpr CharTable CT{};

inline bool ct_space(unsigned char c)       { return CT.cls[c] == CC_SPACE; }
inline bool ct_digit(unsigned char c)       { return CT.cls[c] == CC_DIGIT; }
inline bool ct_ident_start(unsigned char c) {
    auto v = CT.cls[c];
    return v == CC_ALPHA || (v == CC_IDENT && c != '$');
}
inline bool ct_ident_cont(unsigned char c)  { auto v = CT.cls[c]; return v == CC_ALPHA || v == CC_DIGIT || v == CC_IDENT; }
inline bool ct_punct(unsigned char c)       { return CT.cls[c] == CC_PUNCT; }
inline char ct_lower(unsigned char c)       { return CT.lower[c]; }

inline bool ct_hex(unsigned char c) {
    return ct_digit(c) || (ct_lower(c) >= 'a' && ct_lower(c) <= 'f');
}

std::string lowercase(std::string_view sv) {
    std::string out;
    out.reserve(sv.size());
    for (const char c : sv) out += ct_lower(static_cast<unsigned char>(c));
    return out;
}

// Scan a quoted run starting at pos (the opening quote). A doubled closing
// quote is an escaped quote. Returns the position just past the closing quote.
size_t scan_quoted(std::string_view sql, size_t pos, char close, bool doubled_escape) {
    const size_t len = sql.size();
    size_t i = pos + 1;
    while (i < len) {
        if (sql[i] == close) {
            if (doubled_escape && i + 1 < len && sql[i + 1] == close) {
                i += 2;
                continue;
            }
            return i + 1;
        }
        ++i;
    }
    return len;
}

std::string unquote(std::string_view raw, char close, bool doubled_escape) {
    std::string out;
    if (raw.size() < 2) return lowercase(raw.substr(raw.empty() ? 0 : 1));
    const bool terminated = raw.back() == close;
    std::string_view body = raw.substr(1, raw.size() - (terminated ? 2 : 1));
    out.reserve(body.size());
    for (size_t i = 0; i < body.size(); ++i) {
        if (doubled_escape && body[i] == close && i + 1 < body.size() && body[i + 1] == close) {
            ++i;
        }
        out += ct_lower(static_cast<unsigned char>(body[i]));
    }
    return out;
}

size_t scan_number(std::string_view sql, size_t pos) {
    const size_t len = sql.size();
    size_t i = pos;

    if (sql[i] == '0' && i + 1 < len && (sql[i + 1] == 'x' || sql[i + 1] == 'X') &&
        i + 2 < len && ct_hex(static_cast<unsigned char>(sql[i + 2]))) {
        i += 2;
        while (i < len && ct_hex(static_cast<unsigned char>(sql[i]))) ++i;
        return i;
    }

    while (i < len && (ct_digit(static_cast<unsigned char>(sql[i])) || sql[i] == '_')) ++i;
    if (i < len && sql[i] == '.') {
        ++i;
        while (i < len && ct_digit(static_cast<unsigned char>(sql[i]))) ++i;
    }
    if (i < len && (sql[i] == 'e' || sql[i] == 'E')) {
        size_t j = i + 1;
        if (j < len && (sql[j] == '+' || sql[j] == '-')) ++j;
        if (j < len && ct_digit(static_cast<unsigned char>(sql[j]))) {
            while (j < len && ct_digit(static_cast<unsigned char>(sql[j]))) ++j;
            i = j;
        }
    }
    return i;
}

size_t scan_operator(std::string_view sql, size_t pos) {
    static constexpr std::string_view kThreeChar[] = {"->>"};
    static constexpr std::string_view kTwoChar[] = {
        "||", "<=", ">=", "<>", "!=", "==", "<<", ">>", "->"
    };
    const std::string_view rest = sql.substr(pos);
    for (const auto op : kThreeChar) {
        if (rest.starts_with(op)) return pos + op.size();
    }
    for (const auto op : kTwoChar) {
        if (rest.starts_with(op)) return pos + op.size();
    }
    return pos + 1;
}

} // anonymous namespace

// ============================================================================
// TokenStream
// ============================================================================

TokenStream::TokenStream(std::string sql, std::vector<Token> tokens)
    : sql_(std::move(sql)), tokens_(std::move(tokens)) {
    significant_.reserve(tokens_.size());
    for (size_t i = 0; i < tokens_.size(); ++i) {
        if (tokens_[i].is_significant()) significant_.push_back(i);
    }
}

// ============================================================================
// SqlTokenizer
// ============================================================================

TokenStream SqlTokenizer::tokenize(std::string_view sql) {
    std::vector<Token> tokens;
    tokens.reserve(sql.size() / 3 + 1);

    const size_t len = sql.size();
    size_t i = 0;

    auto emit = [&](TokenKind kind, size_t start, size_t end, std::string normalized = {}) {
        Token tok;
        tok.kind = kind;
        tok.offset = start;
        tok.length = end - start;
        tok.normalized = std::move(normalized);
        tokens.push_back(std::move(tok));
    };

    while (i < len) {
        const auto c = static_cast<unsigned char>(sql[i]);
        const size_t start = i;
        const char next = (i + 1 < len) ? sql[i + 1] : '\0';

        if (ct_space(c)) {
            while (i < len && ct_space(static_cast<unsigned char>(sql[i]))) ++i;
            emit(TokenKind::WHITESPACE, start, i);
            continue;
        }

        if (c == '-' && next == '-') {
            const size_t nl = sql.find('\n', i);
            i = (nl == std::string_view::npos) ? len : nl;
            emit(TokenKind::COMMENT, start, i);
            continue;
        }

        if (c == '/' && next == '*') {
            const size_t close = sql.find("*/", i + 2);
            i = (close == std::string_view::npos) ? len : close + 2;
            emit(TokenKind::COMMENT, start, i);
            continue;
        }

        if ((c == 'x' || c == 'X') && next == '\'') {
            i = scan_quoted(sql, i + 1, '\'', true);
            emit(TokenKind::STRING, start, i);
            continue;
        }

        if (c == '\'') {
            i = scan_quoted(sql, i, '\'', true);
            emit(TokenKind::STRING, start, i);
            continue;
        }

        if (c == '"' || c == '`') {
            const char q = static_cast<char>(c);
            i = scan_quoted(sql, i, q, true);
            emit(TokenKind::QUOTED_IDENTIFIER, start, i, unquote(sql.substr(start, i - start), q, true));
            continue;
        }

        if (c == '[') {
            i = scan_quoted(sql, i, ']', false);
            emit(TokenKind::QUOTED_IDENTIFIER, start, i, unquote(sql.substr(start, i - start), ']', false));
            continue;
        }

        if (ct_digit(c) || (c == '.' && ct_digit(static_cast<unsigned char>(next)))) {
            i = scan_number(sql, i);
            emit(TokenKind::NUMBER, start, i);
            continue;
        }

        if (ct_ident_start(c)) {
            while (i < len && ct_ident_cont(static_cast<unsigned char>(sql[i]))) ++i;
            emit(TokenKind::WORD, start, i, lowercase(sql.substr(start, i - start)));
            continue;
        }

        if (c == '?') {
            ++i;
            while (i < len && ct_digit(static_cast<unsigned char>(sql[i]))) ++i;
            emit(TokenKind::PARAMETER, start, i);
            continue;
        }

        // Named variable: $name, @name, :name, #name. SQLite also takes "::"
        // separators and a "(...)" suffix that runs to ')' or whitespace as
        // part of the same token.
        if (c == ':' || c == '@' || c == '$' || c == '#') {
            ++i;
            size_t name_chars = 0;
            while (i < len) {
                const auto ch = static_cast<unsigned char>(sql[i]);
                if (ct_ident_cont(ch)) {
                    ++name_chars;
                    ++i;
                } else if (ch == '(' && name_chars > 0) {
                    ++i;
                    while (i < len && sql[i] != ')' && !ct_space(static_cast<unsigned char>(sql[i]))) ++i;
                    if (i < len && sql[i] == ')') ++i;
                    break;
                } else if (ch == ':' && i + 1 < len && sql[i + 1] == ':') {
                    i += 2;
                } else {
                    break;
                }
            }
            emit(TokenKind::PARAMETER, start, i);
            continue;
        }

        if (ct_punct(c)) {
            ++i;
            emit(TokenKind::PUNCTUATION, start, i, std::string(1, static_cast<char>(c)));
            continue;
        }

        i = scan_operator(sql, i);
        emit(TokenKind::OPERATOR, start, i, std::string(sql.substr(start, i - start)));
    }

    return TokenStream(std::string(sql), std::move(tokens));
}

} // namespace sqlsandbox
