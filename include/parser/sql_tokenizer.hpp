#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sqlsandbox {

enum class TokenKind : uint8_t {
    WHITESPACE,
    COMMENT,              // -- line, /* block */
    WORD,                 // Bare identifier or keyword
    QUOTED_IDENTIFIER,    // "x", `x`, [x]
    STRING,               // 'x', X'00ff'
    NUMBER,
    PARAMETER,            // ?, ?1, :x, @x, $x
    PUNCTUATION,          // ( ) , ; .
    OPERATOR
};

/**
 * @brief One lexical token, addressed by its byte range in the source
 *
 * normalized holds the lowercased word for WORD, the unquoted lowercased
 * name for QUOTED_IDENTIFIER, and the literal text for PUNCTUATION/OPERATOR.
 */
struct Token {
    TokenKind kind = TokenKind::WHITESPACE;
    size_t offset = 0;
    size_t length = 0;
    std::string normalized;

    [[nodiscard]] bool is_significant() const {
        return kind != TokenKind::WHITESPACE && kind != TokenKind::COMMENT;
    }

    [[nodiscard]] bool is_identifier() const {
        return kind == TokenKind::WORD || kind == TokenKind::QUOTED_IDENTIFIER;
    }

    [[nodiscard]] bool is_word(std::string_view lower_keyword) const {
        return kind == TokenKind::WORD && normalized == lower_keyword;
    }

    [[nodiscard]] bool is_punct(char c) const {
        return kind == TokenKind::PUNCTUATION && normalized.size() == 1 && normalized[0] == c;
    }
};

/**
 * @brief Source text plus its complete token sequence
 *
 * Concatenating the text of every token reproduces the source exactly.
 */
class TokenStream {
public:
    TokenStream(std::string sql, std::vector<Token> tokens);

    [[nodiscard]] const std::string& sql() const { return sql_; }
    [[nodiscard]] const std::vector<Token>& tokens() const { return tokens_; }
    [[nodiscard]] const Token& operator[](size_t idx) const { return tokens_[idx]; }
    [[nodiscard]] size_t size() const { return tokens_.size(); }

    /**
     * @brief Indices (into tokens()) of every non-whitespace, non-comment token
     */
    [[nodiscard]] const std::vector<size_t>& significant() const { return significant_; }

    [[nodiscard]] std::string_view text(const Token& token) const {
        return std::string_view(sql_).substr(token.offset, token.length);
    }

    [[nodiscard]] std::string_view text(size_t idx) const { return text(tokens_[idx]); }

private:
    std::string sql_;
    std::vector<Token> tokens_;
    std::vector<size_t> significant_;
};

/**
 * @brief Single-pass lexer for the engine's SQL dialect
 *
 * Never fails: unterminated literals, identifiers and comments extend to the
 * end of the input.
 */
class SqlTokenizer {
public:
    [[nodiscard]] static TokenStream tokenize(std::string_view sql);
};

} // namespace sqlsandbox
