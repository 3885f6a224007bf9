//===----------------------------------------------------------------------===//
//                         SQLGate
//
// gateway/statement_validator.hpp
//
// Accept/reject decision for caller-supplied SQL text. Pure, no I/O.
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <unordered_set>

namespace sqlgate {

//===----------------------------------------------------------------------===//
// Lexer
//===----------------------------------------------------------------------===//

enum class TokenType : uint8_t {
    WORD,               // bare word: keyword or unquoted identifier
    QUOTED_IDENTIFIER,  // "..."
    STRING,             // '...', E'...', $tag$...$tag$
    NUMBER,
    PARAMETER,          // $1, ?
    SEMICOLON,
    OPEN_PAREN,
    CLOSE_PAREN,
    COMMA,
    OTHER               // operators and remaining punctuation
};

struct SqlToken {
    TokenType type;
    std::string text;   // verbatim slice of the input
    size_t offset;
};

// Splits SQL text into tokens. Comments and whitespace are dropped.
class SqlLexer {
public:
    explicit SqlLexer(const std::string& text) : text_(text) {}

    // Returns false on an unterminated string, quoted identifier or comment
    bool Tokenize(std::vector<SqlToken>& tokens, std::string& error);

private:
    bool SkipBlockComment(size_t& pos, std::string& error) const;
    bool ReadQuoted(size_t& pos, char quote, bool backslash_escapes,
                    const char* what, std::string& error) const;
    bool ReadDollarQuoted(size_t& pos, bool& is_string, std::string& error) const;
    void ReadNumber(size_t& pos) const;

    static bool IsWordStart(unsigned char c);
    static bool IsWordChar(unsigned char c);

    const std::string& text_;
};

//===----------------------------------------------------------------------===//
// Validation Verdict
//===----------------------------------------------------------------------===//

enum class ValidationRule : uint8_t {
    NONE = 0,
    EMPTY_QUERY,
    MALFORMED_TEXT,       // unterminated literal or comment
    FORBIDDEN_KEYWORD,
    MULTIPLE_STATEMENTS,
    NOT_READ_ONLY         // does not begin with SELECT / WITH ... SELECT
};

const char* ValidationRuleToString(ValidationRule rule);

struct ValidationVerdict {
    bool accepted = false;
    ValidationRule rule = ValidationRule::NONE;
    std::string reason;
    std::string offending_token;

    static ValidationVerdict Accept() {
        ValidationVerdict v;
        v.accepted = true;
        return v;
    }

    static ValidationVerdict Reject(ValidationRule rule_p, std::string reason_p,
                                    std::string token = "") {
        ValidationVerdict v;
        v.rule = rule_p;
        v.reason = std::move(reason_p);
        v.offending_token = std::move(token);
        return v;
    }
};

//===----------------------------------------------------------------------===//
// Statement Validator
//===----------------------------------------------------------------------===//

class StatementValidator {
public:
    StatementValidator();
    explicit StatementValidator(const std::vector<std::string>& extra_keywords);

    // Rules are checked in order: lexing, empty text, forbidden keyword,
    // statement stacking, read-only prefix. The text itself is never modified.
    ValidationVerdict Validate(const std::string& sql) const;

    bool IsForbidden(const std::string& word) const;

    static const std::vector<std::string>& DefaultForbiddenKeywords();

private:
    static bool IsWord(const SqlToken& token, const char* upper);
    static bool SkipParenGroup(const std::vector<SqlToken>& tokens, size_t& pos);
    static bool WithClauseEndsInSelect(const std::vector<SqlToken>& tokens);

    std::unordered_set<std::string> forbidden_;
};

} // namespace sqlgate
