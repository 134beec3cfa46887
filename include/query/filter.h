#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace strata {
namespace query {

enum class Operator {
    Equal,
    NotEqual,
    Greater,
    Less,
    GreaterOrEqual,
    LessOrEqual,
    Like,
    NotLike,
    In,
    NotIn,
    Between,
    Is,
    AncestorsOf,
    DescendantsOf,
    NotAncestorsOf,
    NotDescendantsOf,
    Previous,
    Next,
    Timespan
};

/// Case-insensitive; throws ValidationError listing the allowed operators
Operator parseOperator(std::string_view text);
/// SQL spelling (lower case) of an operator
const char* operatorToString(Operator op);

/// One normalized (doctype, fieldname, operator, value) filter.
/// When `column` is set the filter compares against that column of the same
/// table instead of the literal `value`.
struct Filter {
    std::string doctype;
    std::string fieldname;
    Operator op = Operator::Equal;
    nlohmann::json value;
    std::optional<std::string> column;
};

/// A predicate passed through verbatim (legacy calling convention)
struct RawCondition {
    std::string sql;
};

using FilterEntry = std::variant<Filter, RawCondition>;
using FilterList = std::vector<FilterEntry>;

/// Field names must be plain identifiers; throws DataError otherwise
void validateFieldname(std::string_view fieldname);

/// Normalizes the loosely typed filter shapes accepted at the API boundary
class FilterParser {
public:
    explicit FilterParser(std::string doctype) : doctype_(std::move(doctype)) {}

    /// Accepts an object ({field: value} / {field: [op, value]}), an array of
    /// filters (each [field, op, value], [doctype, field, op, value], an
    /// object, or a raw string), or a JSON-encoded string of either.
    FilterList parse(const nlohmann::json& filters) const;

    /// {key: value} form
    Filter makeFilter(const std::string& key, const nlohmann::json& value) const;

    /// [field, op, value] or [doctype, field, op, value]
    Filter fromArray(const nlohmann::json& f) const;

private:
    std::string doctype_;

    Filter normalize(std::string doctype, std::string fieldname,
                     std::string_view op, nlohmann::json value) const;
};

} // namespace query
} // namespace strata
