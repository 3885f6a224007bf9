//===----------------------------------------------------------------------===//
//                         SQLGate
//
// gateway/statement_validator.cpp
//
// Statement validator implementation
//===----------------------------------------------------------------------===//

#include "gateway/statement_validator.hpp"
#include <algorithm>
#include <cctype>

namespace sqlgate {

namespace {

std::string ToUpper(const std::string& s) {
    std::string upper = s;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return upper;
}

} // anonymous namespace

//===----------------------------------------------------------------------===//
// SqlLexer
//===----------------------------------------------------------------------===//

bool SqlLexer::IsWordStart(unsigned char c) {
    return std::isalpha(c) || c == '_' || c >= 0x80;
}

bool SqlLexer::IsWordChar(unsigned char c) {
    return std::isalnum(c) || c == '_' || c == '$' || c >= 0x80;
}

bool SqlLexer::Tokenize(std::vector<SqlToken>& tokens, std::string& error) {
    tokens.clear();
    const size_t n = text_.size();
    size_t pos = 0;

    while (pos < n) {
        unsigned char c = static_cast<unsigned char>(text_[pos]);
        size_t start = pos;

        if (std::isspace(c)) {
            pos++;
            continue;
        }

        // -- line comment
        if (c == '-' && pos + 1 < n && text_[pos + 1] == '-') {
            size_t eol = text_.find('\n', pos);
            pos = (eol == std::string::npos) ? n : eol + 1;
            continue;
        }

        // /* block comment */
        if (c == '/' && pos + 1 < n && text_[pos + 1] == '*') {
            if (!SkipBlockComment(pos, error)) {
                return false;
            }
            continue;
        }

        if (c == '\'') {
            if (!ReadQuoted(pos, '\'', false, "string literal", error)) {
                return false;
            }
            tokens.push_back({TokenType::STRING, text_.substr(start, pos - start), start});
            continue;
        }

        // E'...' escape string
        if ((c == 'E' || c == 'e') && pos + 1 < n && text_[pos + 1] == '\'') {
            pos++;
            if (!ReadQuoted(pos, '\'', true, "string literal", error)) {
                return false;
            }
            tokens.push_back({TokenType::STRING, text_.substr(start, pos - start), start});
            continue;
        }

        if (c == '"') {
            if (!ReadQuoted(pos, '"', false, "quoted identifier", error)) {
                return false;
            }
            tokens.push_back({TokenType::QUOTED_IDENTIFIER, text_.substr(start, pos - start), start});
            continue;
        }

        if (c == '$') {
            bool is_string = false;
            if (!ReadDollarQuoted(pos, is_string, error)) {
                return false;
            }
            tokens.push_back({is_string ? TokenType::STRING : TokenType::PARAMETER,
                              text_.substr(start, pos - start), start});
            continue;
        }

        if (IsWordStart(c)) {
            while (pos < n && IsWordChar(static_cast<unsigned char>(text_[pos]))) {
                pos++;
            }
            tokens.push_back({TokenType::WORD, text_.substr(start, pos - start), start});
            continue;
        }

        if (std::isdigit(c) ||
            (c == '.' && pos + 1 < n && std::isdigit(static_cast<unsigned char>(text_[pos + 1])))) {
            ReadNumber(pos);
            tokens.push_back({TokenType::NUMBER, text_.substr(start, pos - start), start});
            continue;
        }

        TokenType type;
        switch (c) {
            case ';': type = TokenType::SEMICOLON; break;
            case '(': type = TokenType::OPEN_PAREN; break;
            case ')': type = TokenType::CLOSE_PAREN; break;
            case ',': type = TokenType::COMMA; break;
            case '?': type = TokenType::PARAMETER; break;
            default:  type = TokenType::OTHER; break;
        }
        pos++;
        tokens.push_back({type, text_.substr(start, 1), start});
    }

    return true;
}

bool SqlLexer::SkipBlockComment(size_t& pos, std::string& error) const {
    // Block comments nest, as in the engine's parser
    const size_t n = text_.size();
    size_t start = pos;
    int depth = 0;

    while (pos < n) {
        if (text_[pos] == '/' && pos + 1 < n && text_[pos + 1] == '*') {
            depth++;
            pos += 2;
        } else if (text_[pos] == '*' && pos + 1 < n && text_[pos + 1] == '/') {
            depth--;
            pos += 2;
            if (depth == 0) {
                return true;
            }
        } else {
            pos++;
        }
    }

    error = "Unterminated block comment starting at offset " + std::to_string(start);
    return false;
}

bool SqlLexer::ReadQuoted(size_t& pos, char quote, bool backslash_escapes,
                          const char* what, std::string& error) const {
    const size_t n = text_.size();
    size_t start = pos;
    pos++;  // opening quote

    while (pos < n) {
        char c = text_[pos];
        if (backslash_escapes && c == '\\') {
            pos += 2;
            continue;
        }
        if (c == quote) {
            if (pos + 1 < n && text_[pos + 1] == quote) {
                pos += 2;  // doubled quote
                continue;
            }
            pos++;
            return true;
        }
        pos++;
    }

    error = std::string("Unterminated ") + what + " starting at offset " + std::to_string(start);
    return false;
}

bool SqlLexer::ReadDollarQuoted(size_t& pos, bool& is_string, std::string& error) const {
    const size_t n = text_.size();
    size_t start = pos;
    size_t j = pos + 1;

    // $1, $2 ... positional parameters
    if (j < n && std::isdigit(static_cast<unsigned char>(text_[j]))) {
        while (j < n && std::isdigit(static_cast<unsigned char>(text_[j]))) {
            j++;
        }
        pos = j;
        is_string = false;
        return true;
    }

    // $tag$ or $$ opener; the tag cannot contain '$'
    if (j < n && IsWordStart(static_cast<unsigned char>(text_[j]))) {
        while (j < n && (std::isalnum(static_cast<unsigned char>(text_[j])) ||
                         text_[j] == '_' || static_cast<unsigned char>(text_[j]) >= 0x80)) {
            j++;
        }
    }

    if (j >= n || text_[j] != '$') {
        // $name (prepared-statement parameter) or a lone '$'
        pos = j;
        is_string = false;
        return true;
    }

    std::string tag = text_.substr(start, j - start + 1);
    size_t close = text_.find(tag, j + 1);
    if (close == std::string::npos) {
        error = "Unterminated dollar-quoted string starting at offset " + std::to_string(start);
        return false;
    }

    pos = close + tag.size();
    is_string = true;
    return true;
}

void SqlLexer::ReadNumber(size_t& pos) const {
    const size_t n = text_.size();

    if (text_[pos] == '0' && pos + 1 < n && (text_[pos + 1] == 'x' || text_[pos + 1] == 'X')) {
        pos += 2;
        while (pos < n && std::isxdigit(static_cast<unsigned char>(text_[pos]))) {
            pos++;
        }
        return;
    }

    while (pos < n && (std::isdigit(static_cast<unsigned char>(text_[pos])) ||
                       text_[pos] == '.' || text_[pos] == '_')) {
        pos++;
    }

    // Exponent: 1e10, 2.5E-3
    if (pos < n && (text_[pos] == 'e' || text_[pos] == 'E')) {
        size_t j = pos + 1;
        if (j < n && (text_[j] == '+' || text_[j] == '-')) {
            j++;
        }
        if (j < n && std::isdigit(static_cast<unsigned char>(text_[j]))) {
            while (j < n && std::isdigit(static_cast<unsigned char>(text_[j]))) {
                j++;
            }
            pos = j;
        }
    }
}

//===----------------------------------------------------------------------===//
// ValidationRule
//===----------------------------------------------------------------------===//

const char* ValidationRuleToString(ValidationRule rule) {
    switch (rule) {
        case ValidationRule::NONE:                return "none";
        case ValidationRule::EMPTY_QUERY:         return "empty_query";
        case ValidationRule::MALFORMED_TEXT:      return "malformed_text";
        case ValidationRule::FORBIDDEN_KEYWORD:   return "forbidden_keyword";
        case ValidationRule::MULTIPLE_STATEMENTS: return "multiple_statements";
        case ValidationRule::NOT_READ_ONLY:       return "not_read_only";
        default:                                  return "unknown";
    }
}

//===----------------------------------------------------------------------===//
// StatementValidator
//===----------------------------------------------------------------------===//

const std::vector<std::string>& StatementValidator::DefaultForbiddenKeywords() {
    static const std::vector<std::string> keywords = {
        "DROP", "DELETE", "UPDATE", "INSERT", "ALTER", "CREATE",
        "ATTACH", "DETACH", "COPY", "PRAGMA", "EXPORT", "IMPORT",
        "CALL", "GRANT", "REVOKE", "VACUUM",
        // DuckDB statements that write, load code or change session state
        "TRUNCATE", "INSTALL", "LOAD", "CHECKPOINT", "SET", "RESET",
        "MERGE", "USE", "PREPARE", "EXECUTE", "DEALLOCATE"
    };
    return keywords;
}

StatementValidator::StatementValidator()
    : StatementValidator(std::vector<std::string>{}) {
}

StatementValidator::StatementValidator(const std::vector<std::string>& extra_keywords) {
    for (const auto& kw : DefaultForbiddenKeywords()) {
        forbidden_.insert(kw);
    }
    for (const auto& kw : extra_keywords) {
        if (!kw.empty()) {
            forbidden_.insert(ToUpper(kw));
        }
    }
}

bool StatementValidator::IsForbidden(const std::string& word) const {
    return forbidden_.count(ToUpper(word)) > 0;
}

bool StatementValidator::IsWord(const SqlToken& token, const char* upper) {
    return token.type == TokenType::WORD && ToUpper(token.text) == upper;
}

bool StatementValidator::SkipParenGroup(const std::vector<SqlToken>& tokens, size_t& pos) {
    if (pos >= tokens.size() || tokens[pos].type != TokenType::OPEN_PAREN) {
        return false;
    }
    int depth = 0;
    while (pos < tokens.size()) {
        if (tokens[pos].type == TokenType::OPEN_PAREN) {
            depth++;
        } else if (tokens[pos].type == TokenType::CLOSE_PAREN) {
            depth--;
            if (depth == 0) {
                pos++;
                return true;
            }
        }
        pos++;
    }
    return false;
}

// WITH [RECURSIVE] name [(cols)] [USING KEY (cols)] AS [[NOT] MATERIALIZED] (...) [, ...] SELECT
bool StatementValidator::WithClauseEndsInSelect(const std::vector<SqlToken>& tokens) {
    size_t pos = 1;
    if (pos < tokens.size() && IsWord(tokens[pos], "RECURSIVE")) {
        pos++;
    }

    while (true) {
        if (pos >= tokens.size() ||
            (tokens[pos].type != TokenType::WORD && tokens[pos].type != TokenType::QUOTED_IDENTIFIER)) {
            return false;
        }
        pos++;

        if (pos < tokens.size() && tokens[pos].type == TokenType::OPEN_PAREN) {
            if (!SkipParenGroup(tokens, pos)) return false;
        }
        if (pos + 1 < tokens.size() && IsWord(tokens[pos], "USING") && IsWord(tokens[pos + 1], "KEY")) {
            pos += 2;
            if (!SkipParenGroup(tokens, pos)) return false;
        }

        if (pos >= tokens.size() || !IsWord(tokens[pos], "AS")) {
            return false;
        }
        pos++;

        if (pos < tokens.size() && IsWord(tokens[pos], "NOT")) {
            pos++;
            if (pos >= tokens.size() || !IsWord(tokens[pos], "MATERIALIZED")) return false;
        }
        if (pos < tokens.size() && IsWord(tokens[pos], "MATERIALIZED")) {
            pos++;
        }

        if (!SkipParenGroup(tokens, pos)) {
            return false;
        }

        if (pos < tokens.size() && tokens[pos].type == TokenType::COMMA) {
            pos++;
            continue;
        }
        break;
    }

    return pos < tokens.size() && IsWord(tokens[pos], "SELECT");
}

ValidationVerdict StatementValidator::Validate(const std::string& sql) const {
    std::vector<SqlToken> tokens;
    std::string lex_error;

    SqlLexer lexer(sql);
    if (!lexer.Tokenize(tokens, lex_error)) {
        return ValidationVerdict::Reject(ValidationRule::MALFORMED_TEXT, lex_error);
    }

    if (tokens.empty()) {
        return ValidationVerdict::Reject(ValidationRule::EMPTY_QUERY, "Query cannot be empty");
    }

    // (c) forbidden keywords anywhere, including subqueries and CTE bodies
    for (const auto& token : tokens) {
        if (token.type != TokenType::WORD) {
            continue;
        }
        std::string upper = ToUpper(token.text);
        if (forbidden_.count(upper) > 0) {
            return ValidationVerdict::Reject(
                ValidationRule::FORBIDDEN_KEYWORD,
                "Query contains forbidden keyword: " + upper, upper);
        }
    }

    // (b) exactly one statement; trailing semicolons are allowed
    bool terminated = false;
    for (const auto& token : tokens) {
        if (token.type == TokenType::SEMICOLON) {
            terminated = true;
        } else if (terminated) {
            return ValidationVerdict::Reject(
                ValidationRule::MULTIPLE_STATEMENTS,
                "Multiple statements are not allowed; found '" + token.text +
                "' after ';' at offset " + std::to_string(token.offset),
                token.text);
        }
    }

    // (a) read-only prefix
    const SqlToken& first = tokens.front();
    if (IsWord(first, "SELECT")) {
        return ValidationVerdict::Accept();
    }
    if (IsWord(first, "WITH")) {
        if (WithClauseEndsInSelect(tokens)) {
            return ValidationVerdict::Accept();
        }
        return ValidationVerdict::Reject(
            ValidationRule::NOT_READ_ONLY,
            "WITH clause must list common table expressions followed by a SELECT statement",
            "WITH");
    }

    return ValidationVerdict::Reject(
        ValidationRule::NOT_READ_ONLY,
        "Only SELECT queries are allowed (optionally prefixed by WITH); statement begins with '" +
        first.text + "'",
        first.text);
}

} // namespace sqlgate
