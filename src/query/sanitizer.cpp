#include "query/sanitizer.h"
#include "utils/errors.h"
#include <algorithm>
#include <cctype>
#include <regex>

namespace strata {
namespace query {

namespace {

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

[[noreturn]] void raiseRestricted() {
    throw DataError("Use of sub-query or function is restricted");
}

[[noreturn]] void raiseIllegal() {
    throw DataError("Illegal SQL Query");
}

const std::regex& isQueryPattern() {
    static const std::regex re(R"(^(select|delete|update|drop|create)\s)", std::regex::icase);
    return re;
}

const std::regex& isQueryPredicatePattern() {
    static const std::regex re(R"(^\s*[0-9A-Za-z_`]*\s*( from | group by | order by | where | join ))",
                               std::regex::icase);
    return re;
}

const std::regex& fieldQuotePattern() {
    static const std::regex re(R"(^[0-9a-zA-Z]+\s*')");
    return re;
}

const std::regex& fieldCommaPattern() {
    static const std::regex re(R"(^[0-9a-zA-Z]+\s*,)");
    return re;
}

const std::regex& strictUnionPattern() {
    static const std::regex re(R"(\s(union)[\s\S]*\s)");
    return re;
}

const std::regex& orderGroupPattern() {
    static const std::regex re(R"([^a-z0-9\-_ ,`'"\.\(\)])");
    return re;
}

bool isIdentStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

} // namespace

const std::vector<std::string>& Sanitizer::blacklistedKeywords() {
    static const std::vector<std::string> keywords = {
        "select", "create", "insert", "delete", "drop", "update", "case", "show"
    };
    return keywords;
}

const std::vector<std::string>& Sanitizer::blacklistedFunctions() {
    static const std::vector<std::string> functions = {
        "concat", "concat_ws", "if", "ifnull", "nullif", "coalesce", "connection_id",
        "current_user", "database", "last_insert_id", "session_user", "system_user",
        "user", "version", "global", "sleep", "benchmark", "load_file"
    };
    return functions;
}

std::vector<SqlToken> Sanitizer::tokenize(std::string_view expr) {
    std::vector<SqlToken> tokens;
    size_t i = 0;
    const size_t n = expr.size();

    auto readQuoted = [&](char quote, SqlToken::Kind kind) {
        size_t start = i++;
        while (i < n) {
            if (expr[i] == '\\' && quote != '`' && i + 1 < n) {
                i += 2;
                continue;
            }
            if (expr[i] == quote) {
                if (i + 1 < n && expr[i + 1] == quote) {  // doubled quote
                    i += 2;
                    continue;
                }
                ++i;
                tokens.push_back({kind, std::string(expr.substr(start, i - start))});
                return;
            }
            ++i;
        }
        throw DataError("Unterminated quote in expression: " + std::string(expr));
    };

    while (i < n) {
        char c = expr[i];
        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
        } else if (c == '`' || c == '"') {
            readQuoted(c, SqlToken::Kind::QuotedIdentifier);
        } else if (c == '\'') {
            readQuoted(c, SqlToken::Kind::String);
        } else if (c == '-' && i + 1 < n && expr[i + 1] == '-') {
            auto end = expr.find('\n', i);
            end = end == std::string_view::npos ? n : end;
            tokens.push_back({SqlToken::Kind::Comment, std::string(expr.substr(i, end - i))});
            i = end;
        } else if (c == '#') {
            auto end = expr.find('\n', i);
            end = end == std::string_view::npos ? n : end;
            tokens.push_back({SqlToken::Kind::Comment, std::string(expr.substr(i, end - i))});
            i = end;
        } else if (c == '/' && i + 1 < n && expr[i + 1] == '*') {
            auto end = expr.find("*/", i + 2);
            if (end == std::string_view::npos) {
                throw DataError("Unterminated comment in expression: " + std::string(expr));
            }
            tokens.push_back({SqlToken::Kind::Comment, std::string(expr.substr(i, end + 2 - i))});
            i = end + 2;
        } else if (isIdentStart(c)) {
            size_t start = i;
            while (i < n && isIdentChar(expr[i])) ++i;
            tokens.push_back({SqlToken::Kind::Identifier, std::string(expr.substr(start, i - start))});
        } else if (std::isdigit(static_cast<unsigned char>(c))) {
            size_t start = i;
            while (i < n && (std::isalnum(static_cast<unsigned char>(expr[i])) || expr[i] == '.')) ++i;
            tokens.push_back({SqlToken::Kind::Number, std::string(expr.substr(start, i - start))});
        } else {
            tokens.push_back({SqlToken::Kind::Punct, std::string(1, c)});
            ++i;
        }
    }
    return tokens;
}

void Sanitizer::checkTokens(const std::string& field) const {
    auto tokens = tokenize(field);
    const auto& keywords = blacklistedKeywords();
    const auto& functions = blacklistedFunctions();

    for (size_t i = 0; i < tokens.size(); ++i) {
        const auto& tok = tokens[i];
        if (tok.kind == SqlToken::Kind::Comment) {
            if (strict_) raiseIllegal();
            continue;
        }
        if (tok.kind == SqlToken::Kind::Punct) {
            if (tok.text == "@") raiseRestricted();
            if (tok.text == ";" && strict_) raiseIllegal();
            continue;
        }
        if (tok.kind != SqlToken::Kind::Identifier) continue;

        auto word = toLower(tok.text);
        bool call = i + 1 < tokens.size() && tokens[i + 1].kind == SqlToken::Kind::Punct &&
                    tokens[i + 1].text == "(";
        if (call && std::find(functions.begin(), functions.end(), word) != functions.end()) {
            raiseRestricted();
        }
        bool after_paren = i > 0 && tokens[i - 1].kind == SqlToken::Kind::Punct && tokens[i - 1].text == "(";
        if (after_paren && std::find(keywords.begin(), keywords.end(), word) != keywords.end()) {
            raiseRestricted();
        }
        if (strict_ && word == "union") {
            raiseIllegal();
        }
    }
}

void Sanitizer::checkField(const std::string& field) const {
    const std::string lower = toLower(field);

    if (field.find_first_of(",();@") != std::string::npos) {
        for (const auto& keyword : blacklistedKeywords()) {
            if (lower.find("(" + keyword) != std::string::npos) raiseRestricted();
        }
        for (const auto& function : blacklistedFunctions()) {
            auto pos = lower.find(function + "(");
            // only whole words: "count(" must not trip over "if("
            while (pos != std::string::npos) {
                if (pos == 0 || !isIdentChar(lower[pos - 1])) raiseRestricted();
                pos = lower.find(function + "(", pos + 1);
            }
        }
        if (lower.find('@') != std::string::npos) {
            // prevent access to global variables
            raiseRestricted();
        }
    }

    if (std::regex_search(field, fieldQuotePattern())) raiseRestricted();
    if (std::regex_search(field, fieldCommaPattern())) raiseRestricted();

    if (std::regex_search(field, isQueryPattern())) raiseRestricted();
    if (std::regex_search(field, isQueryPredicatePattern())) raiseRestricted();

    if (strict_) {
        if (field.find("/*") != std::string::npos) raiseIllegal();
        if (std::regex_search(lower, strictUnionPattern())) raiseIllegal();
    }

    checkTokens(field);
}

void Sanitizer::checkFields(const std::vector<std::string>& fields) const {
    for (const auto& field : fields) {
        checkField(field);
    }
}

void Sanitizer::checkOrderOrGroup(const std::string& clause, const std::vector<std::string>& tables) const {
    if (clause.empty()) return;

    const std::string lower = toLower(clause);
    if (lower.find("select") != std::string::npos && lower.find("from") != std::string::npos) {
        throw DataError("Cannot use sub-query in order by");
    }
    if (std::regex_search(lower, orderGroupPattern())) {
        raiseIllegal();
    }

    size_t start = 0;
    while (start <= clause.size()) {
        auto comma = clause.find(',', start);
        std::string part = trim(clause.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
        if (part.find('.') != std::string::npos && part.rfind("`tab", 0) == 0) {
            std::string tbl = part.substr(0, part.find('.'));
            if (std::find(tables.begin(), tables.end(), tbl) == tables.end()) {
                std::string doctype = tbl.size() > 5 ? tbl.substr(4, tbl.size() - 5) : tbl;
                throw DataError("Please select atleast 1 column from " + doctype + " to sort/group");
            }
        }
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
}

} // namespace query
} // namespace strata
