#include "query/condition_builder.h"
#include "utils/errors.h"
#include "utils/logger.h"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace strata {
namespace query {

namespace {

bool isTruthy(const nlohmann::json& v) {
    if (v.is_null()) return false;
    if (v.is_boolean()) return v.get<bool>();
    if (v.is_number()) return v.get<double>() != 0.0;
    if (v.is_string()) return !v.get_ref<const std::string&>().empty();
    return !v.empty();
}

std::string toText(const nlohmann::json& v) {
    if (v.is_null()) return "";
    if (v.is_string()) return v.get<std::string>();
    if (v.is_boolean()) return v.get<bool>() ? "1" : "0";
    return v.dump();
}

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool hasCoalesce(const std::string& column) {
    auto lower = toLower(column);
    return lower.find("ifnull(") != std::string::npos || lower.find("coalesce(") != std::string::npos;
}

// Python-style float coercion with 0 fallback
double toNumber(const nlohmann::json& v) {
    if (v.is_number()) return v.get<double>();
    if (v.is_boolean()) return v.get<bool>() ? 1.0 : 0.0;
    if (v.is_string()) {
        auto text = trim(v.get<std::string>());
        text.erase(std::remove(text.begin(), text.end(), ','), text.end());
        if (text.empty()) return 0.0;
        char* end = nullptr;
        double d = std::strtod(text.c_str(), &end);
        if (end == text.c_str() || *end != '\0') return 0.0;
        return d;
    }
    return 0.0;
}

std::string formatNumber(double d) {
    return fmt::format("{}", d);
}

// Backslash and percent are escaped so user input is matched literally
std::string escapeLikePattern(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == '\\') {
            out += "\\\\";
        } else if (c == '%') {
            out += "\\%";
        } else {
            out += c;
        }
    }
    return out;
}

bool isAuditColumn(const std::string& fieldname) {
    return fieldname == kCreationColumn || fieldname == kModifiedColumn;
}

std::string quoted(const char* literal) {
    return std::string("'") + literal + "'";
}

} // namespace

ConditionBuilder::ConditionBuilder(const MetadataProvider& metadata,
                                   const SqlDialect& dialect,
                                   const HierarchyProvider* hierarchy,
                                   utils::TodayProvider today)
    : metadata_(metadata), dialect_(dialect), hierarchy_(hierarchy), today_(std::move(today)) {
    if (!today_) {
        today_ = utils::todayUtc;
    }
}

std::string ConditionBuilder::quoteColumn(const std::string& table, const std::string& column) const {
    return table + ".`" + column + "`";
}

std::string ConditionBuilder::hierarchyValues(const Filter& f, const FieldMeta* df) const {
    if (!hierarchy_) {
        throw ValidationError("Hierarchy lookups are not available for operator '" +
                              std::string(operatorToString(f.op)) + "'");
    }

    std::string ref_doctype = (df && !df->options.empty()) ? df->options : f.doctype;
    std::vector<std::string> names;
    if (isTruthy(f.value)) {
        auto bounds = hierarchy_->getBounds(ref_doctype, trim(toText(f.value)));
        if (bounds) {
            bool descendants = f.op == Operator::DescendantsOf || f.op == Operator::NotDescendantsOf;
            names = descendants
                ? hierarchy_->getDescendants(ref_doctype, bounds->first, bounds->second)
                : hierarchy_->getAncestors(ref_doctype, bounds->first, bounds->second);
        } else {
            STRATA_DEBUG("No tree bounds for {} '{}'", ref_doctype, toText(f.value));
        }
    }

    if (names.empty()) {
        return "('')";
    }
    std::string out = "(";
    for (size_t i = 0; i < names.size(); ++i) {
        if (i) out += ", ";
        out += dialect_.escape(trim(names[i]), false);
    }
    out += ")";
    return out;
}

std::string ConditionBuilder::inValues(const nlohmann::json& value) const {
    std::vector<std::string> items;
    if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        if (!text.empty()) {
            size_t start = 0;
            while (true) {
                auto comma = text.find(',', start);
                items.push_back(text.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
                if (comma == std::string::npos) break;
                start = comma + 1;
            }
        }
    } else if (value.is_array()) {
        for (const auto& v : value) items.push_back(toText(v));
    } else if (!value.is_null()) {
        items.push_back(toText(value));
    }

    if (items.empty()) {
        return "('')";
    }
    std::string out = "(";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) out += ", ";
        out += dialect_.escape(trim(items[i]), false);
    }
    out += ")";
    return out;
}

std::string ConditionBuilder::betweenCondition(const std::string& column, const nlohmann::json& value,
                                               const FieldMeta* df, bool date_like, bool datetime,
                                               bool can_be_null) const {
    auto wrap = [&](const std::string& fallback) {
        if (ignore_ifnull_ || !can_be_null || hasCoalesce(column)) return column;
        return "coalesce(" + column + ", " + fallback + ")";
    };

    if (!date_like) {
        if (!value.is_array() || value.size() != 2) {
            throw DataError("Between filter on " + column + " requires two values");
        }
        bool numeric = df && isNumericType(df->fieldtype);
        auto literal = [&](const nlohmann::json& v) {
            return numeric ? formatNumber(toNumber(v)) : dialect_.escape(toText(v), false);
        };
        std::string lhs = wrap(numeric ? "0" : "''");
        return lhs + " between " + literal(value[0]) + " and " + literal(value[1]);
    }

    // Date ranges are half-open [from, to + 1 day) so the whole end day matches
    std::string from_text;
    std::string to_text;
    if (value.is_array()) {
        if (value.size() >= 1) from_text = toText(value[0]);
        if (value.size() >= 2) to_text = toText(value[1]);
    }
    auto today = utils::formatDate(today_());
    if (from_text.empty()) from_text = today;
    if (to_text.empty()) to_text = today;

    std::string lower;
    std::string upper;
    std::string fallback;
    if (datetime) {
        auto from = utils::parseDatetime(from_text);
        auto to = utils::parseDatetime(to_text);
        if (!from || !to) {
            throw DataError("Invalid datetime range [" + from_text + ", " + to_text + "]");
        }
        lower = dialect_.escape(utils::formatDatetime(*from), false);
        upper = dialect_.escape(utils::formatDatetime(*to + std::chrono::days{1}), false);
        fallback = quoted(utils::kFallbackDatetime);
    } else {
        auto from = utils::parseDate(from_text);
        auto to = utils::parseDate(to_text);
        if (!from || !to) {
            throw DataError("Invalid date range [" + from_text + ", " + to_text + "]");
        }
        lower = dialect_.escape(utils::formatDate(*from), false);
        upper = dialect_.escape(utils::formatDate(utils::addDays(*to, 1)), false);
        fallback = quoted(utils::kFallbackDate);
    }

    std::string lhs = wrap(fallback);
    return "(" + lhs + " >= " + lower + " and " + lhs + " < " + upper + ")";
}

std::string ConditionBuilder::build(const Filter& f) const {
    const std::string tname = tableName(f.doctype);
    std::string column = dialect_.castName(quoteColumn(tname, f.fieldname));

    const DocTypeMeta& meta = metadata_.getMeta(f.doctype);
    const FieldMeta* df = meta.getField(f.fieldname);

    Operator op = f.op;
    nlohmann::json value = f.value;
    std::string literal;
    std::string fallback = "''";
    bool can_be_null = true;

    if (f.column) {
        switch (op) {
            case Operator::Equal: case Operator::NotEqual:
            case Operator::Greater: case Operator::Less:
            case Operator::GreaterOrEqual: case Operator::LessOrEqual:
            case Operator::Like: case Operator::NotLike:
                break;
            default:
                throw DataError(std::string("Column comparison is not supported for operator '") +
                                operatorToString(op) + "'");
        }
        // column-to-column comparisons are never coalesced
        std::string other = dialect_.castName(quoteColumn(tname, *f.column));
        std::string sql_op = (op == Operator::Like || op == Operator::NotLike)
            ? dialect_.likeOperator(op == Operator::NotLike)
            : operatorToString(op);
        return column + " " + sql_op + " " + other;
    }

    switch (op) {
        case Operator::AncestorsOf:
        case Operator::DescendantsOf:
        case Operator::NotAncestorsOf:
        case Operator::NotDescendantsOf:
            literal = hierarchyValues(f, df);
            op = (op == Operator::NotAncestorsOf || op == Operator::NotDescendantsOf)
                ? Operator::NotIn : Operator::In;
            can_be_null = op == Operator::NotIn;
            break;

        case Operator::In:
        case Operator::NotIn:
            // `in` only needs coalescing when an empty value is listed; an empty
            // list must match nothing. `not in` must also see NULL rows
            if (op == Operator::In) {
                can_be_null = false;
                if (value.is_array()) {
                    for (const auto& v : value) {
                        if (v.is_null() || (v.is_string() && v.get_ref<const std::string&>().empty())) {
                            can_be_null = true;
                        }
                    }
                }
            }
            literal = inValues(value);
            break;

        default: {
            if (df && isNumericType(df->fieldtype)) {
                can_be_null = false;
            }

            bool date_range = false;
            if (op == Operator::Previous || op == Operator::Next || op == Operator::Timespan) {
                auto timespan = op == Operator::Timespan
                    ? toText(value)
                    : utils::relativeTimespan(operatorToString(op), toText(value));
                auto range = utils::timespanDateRange(timespan, today_());
                value = nlohmann::json::array({utils::formatDate(range.first), utils::formatDate(range.second)});
                op = Operator::Between;
                date_range = true;
            }

            if (op == Operator::Between) {
                bool date_like = date_range || isAuditColumn(f.fieldname) ||
                    (df && (df->fieldtype == FieldType::Date || df->fieldtype == FieldType::Datetime));
                bool datetime = (df && df->fieldtype == FieldType::Datetime) ||
                    (!df && isAuditColumn(f.fieldname));
                return betweenCondition(column, value, df, date_like, datetime, can_be_null);
            }

            if ((op == Operator::Greater || op == Operator::Less) && isAuditColumn(f.fieldname)) {
                literal = dialect_.escape(toText(value), false);
                fallback = quoted(utils::kFallbackDatetime);
            } else if (op == Operator::Is) {
                auto v = toLower(trim(toText(value)));
                if (v == "set") {
                    op = Operator::NotEqual;
                } else if (v == "not set") {
                    op = Operator::Equal;
                } else {
                    throw ValidationError("Operator 'is' accepts only 'set' or 'not set', got '" + toText(value) + "'");
                }
                literal = "''";
                fallback = "''";
                can_be_null = true;
                if (!hasCoalesce(column)) {
                    column = "coalesce(" + column + ", " + fallback + ")";
                }
            } else if (df && df->fieldtype == FieldType::Date) {
                fallback = quoted(utils::kFallbackDate);
                if (isTruthy(value)) {
                    auto d = utils::parseDate(toText(value));
                    if (!d) throw DataError("Invalid date value for " + f.fieldname + ": " + toText(value));
                    literal = dialect_.escape(utils::formatDate(*d), false);
                } else {
                    literal = fallback;
                }
            } else if (df && df->fieldtype == FieldType::Datetime) {
                fallback = quoted(utils::kFallbackDatetime);
                if (isTruthy(value)) {
                    auto dt = utils::parseDatetime(toText(value));
                    if (!dt) throw DataError("Invalid datetime value for " + f.fieldname + ": " + toText(value));
                    literal = dialect_.escape(utils::formatDatetime(*dt), false);
                } else {
                    literal = fallback;
                }
            } else if (df && df->fieldtype == FieldType::Time) {
                fallback = quoted(utils::kFallbackTime);
                if (isTruthy(value)) {
                    auto t = utils::parseTime(toText(value));
                    if (!t) throw DataError("Invalid time value for " + f.fieldname + ": " + toText(value));
                    literal = dialect_.escape(utils::formatTime(*t), false);
                } else {
                    literal = fallback;
                }
            } else if (op == Operator::Like || op == Operator::NotLike ||
                       (value.is_string() && (!df || !isNumericType(df->fieldtype)))) {
                std::string text = toText(value);
                if (op == Operator::Like || op == Operator::NotLike) {
                    text = escapeLikePattern(text);
                }
                literal = dialect_.escape(text, false);
                fallback = "''";
            } else if ((op == Operator::Equal && df &&
                        (df->fieldtype == FieldType::Link || df->fieldtype == FieldType::Data)) ||
                       f.fieldname == "name") {
                literal = dialect_.escape(toText(value), false);
                fallback = "''";
            } else {
                literal = formatNumber(toNumber(value));
                fallback = "0";
            }
            break;
        }
    }

    std::string sql_op = (op == Operator::Like || op == Operator::NotLike)
        ? dialect_.likeOperator(op == Operator::NotLike)
        : operatorToString(op);

    if (ignore_ifnull_ || !can_be_null ||
        (isTruthy(f.value) && (op == Operator::Equal || op == Operator::Like)) ||
        hasCoalesce(column)) {
        return column + " " + sql_op + " " + literal;
    }
    return "coalesce(" + column + ", " + fallback + ") " + sql_op + " " + literal;
}

} // namespace query
} // namespace strata
