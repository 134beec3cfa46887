#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace strata {
namespace query {

/// Lexical token of a field/order/group expression
struct SqlToken {
    enum class Kind { Identifier, QuotedIdentifier, String, Number, Punct, Comment };
    Kind kind;
    std::string text;
};

/**
 * Defense-in-depth validator for caller supplied SQL fragments.
 *
 * Field expressions are checked against the pattern rules (sub-queries,
 * banned functions, global variables, statement-looking input, injection
 * shapes) and then tokenized: in strict mode comments, statement separators
 * and unbalanced quotes are rejected. ORDER BY / GROUP BY expressions are
 * checked against a conservative character allowlist and must only
 * reference tables that take part in the query.
 *
 * All checks throw DataError; nothing is rewritten.
 */
class Sanitizer {
public:
    explicit Sanitizer(bool strict = true) : strict_(strict) {}

    void checkField(const std::string& field) const;
    void checkFields(const std::vector<std::string>& fields) const;

    /// `tables` are the backtick-quoted tables of the join set
    void checkOrderOrGroup(const std::string& clause, const std::vector<std::string>& tables) const;

    /// Splits an expression into tokens; throws DataError on unterminated
    /// quotes or block comments
    static std::vector<SqlToken> tokenize(std::string_view expr);

    static const std::vector<std::string>& blacklistedKeywords();
    static const std::vector<std::string>& blacklistedFunctions();

private:
    bool strict_;

    void checkTokens(const std::string& field) const;
};

} // namespace query
} // namespace strata
