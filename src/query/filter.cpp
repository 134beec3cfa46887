#include "query/filter.h"
#include "utils/errors.h"
#include <algorithm>
#include <array>
#include <cctype>
#include <regex>

namespace strata {
namespace query {

namespace {

struct OperatorName {
    std::string_view name;
    Operator op;
};

constexpr std::array<OperatorName, 19> kOperators = {{
    {"=", Operator::Equal},
    {"!=", Operator::NotEqual},
    {">", Operator::Greater},
    {"<", Operator::Less},
    {">=", Operator::GreaterOrEqual},
    {"<=", Operator::LessOrEqual},
    {"like", Operator::Like},
    {"not like", Operator::NotLike},
    {"in", Operator::In},
    {"not in", Operator::NotIn},
    {"between", Operator::Between},
    {"is", Operator::Is},
    {"ancestors of", Operator::AncestorsOf},
    {"descendants of", Operator::DescendantsOf},
    {"not ancestors of", Operator::NotAncestorsOf},
    {"not descendants of", Operator::NotDescendantsOf},
    {"previous", Operator::Previous},
    {"next", Operator::Next},
    {"timespan", Operator::Timespan},
}};

std::string normalizeOperatorText(std::string_view text) {
    std::string out;
    bool pending_space = false;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out += ' ';
            pending_space = false;
        }
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

} // namespace

Operator parseOperator(std::string_view text) {
    auto normalized = normalizeOperatorText(text);
    for (const auto& entry : kOperators) {
        if (entry.name == normalized) return entry.op;
    }

    std::string allowed;
    for (const auto& entry : kOperators) {
        if (!allowed.empty()) allowed += ", ";
        allowed += entry.name;
    }
    throw ValidationError("Operator must be one of " + allowed + " (got '" + std::string(text) + "')");
}

const char* operatorToString(Operator op) {
    for (const auto& entry : kOperators) {
        if (entry.op == op) return entry.name.data();
    }
    return "=";
}

void validateFieldname(std::string_view fieldname) {
    static const std::regex allowed(R"(^[A-Za-z0-9_][A-Za-z0-9_ \-]*$)");
    if (fieldname.empty() || !std::regex_match(fieldname.begin(), fieldname.end(), allowed)) {
        throw DataError("Invalid field name: " + std::string(fieldname));
    }
}

Filter FilterParser::normalize(std::string doctype, std::string fieldname,
                               std::string_view op, nlohmann::json value) const {
    // "Child DocType.fieldname" addresses a column of a child table
    auto dot = fieldname.find('.');
    if (dot != std::string::npos) {
        doctype = fieldname.substr(0, dot);
        fieldname = fieldname.substr(dot + 1);
    }
    validateFieldname(doctype);
    validateFieldname(fieldname);

    Filter f;
    f.doctype = std::move(doctype);
    f.fieldname = std::move(fieldname);
    f.op = parseOperator(op);

    if (value.is_object() && value.contains("column")) {
        const auto& col = value["column"];
        if (!col.is_string()) {
            throw DataError("Column reference for " + f.fieldname + " must be a string");
        }
        validateFieldname(col.get<std::string>());
        f.column = col.get<std::string>();
    } else {
        f.value = std::move(value);
    }
    return f;
}

Filter FilterParser::makeFilter(const std::string& key, const nlohmann::json& value) const {
    if (value.is_array() && !value.empty() && value[0].is_string()) {
        // {key: [op, value]}
        nlohmann::json operand = value.size() > 1 ? value[1] : nlohmann::json();
        return normalize(doctype_, key, value[0].get<std::string>(), std::move(operand));
    }
    return normalize(doctype_, key, "=", value);
}

Filter FilterParser::fromArray(const nlohmann::json& f) const {
    if (!f.is_array()) {
        throw DataError("Filter must be an array, got: " + f.dump());
    }
    for (size_t i = 0; i + 1 < std::min<size_t>(f.size(), 4); ++i) {
        if (!f[i].is_string()) {
            throw DataError("Filter must have string field and operator: " + f.dump());
        }
    }
    if (f.size() == 3) {
        return normalize(doctype_, f[0].get<std::string>(), f[1].get<std::string>(), f[2]);
    }
    if (f.size() >= 4) {
        std::string doctype = f[0].get<std::string>();
        if (doctype.empty()) doctype = doctype_;
        return normalize(std::move(doctype), f[1].get<std::string>(), f[2].get<std::string>(), f[3]);
    }
    throw DataError("Filter must have 4 values (doctype, fieldname, operator, value): " + f.dump());
}

FilterList FilterParser::parse(const nlohmann::json& filters) const {
    FilterList out;
    if (filters.is_null()) {
        return out;
    }

    if (filters.is_string()) {
        const auto& text = filters.get_ref<const std::string&>();
        if (text.empty()) return out;
        nlohmann::json decoded = nlohmann::json::parse(text, nullptr, false);
        if (decoded.is_discarded()) {
            throw DataError("Filters must be valid JSON: " + text);
        }
        return parse(decoded);
    }

    if (filters.is_object()) {
        for (auto it = filters.begin(); it != filters.end(); ++it) {
            out.emplace_back(makeFilter(it.key(), it.value()));
        }
        return out;
    }

    if (!filters.is_array()) {
        throw DataError("Filters must be an object or an array, got: " + filters.dump());
    }

    for (const auto& f : filters) {
        if (f.is_string()) {
            out.emplace_back(RawCondition{f.get<std::string>()});
        } else if (f.is_object()) {
            for (auto it = f.begin(); it != f.end(); ++it) {
                out.emplace_back(makeFilter(it.key(), it.value()));
            }
        } else {
            out.emplace_back(fromArray(f));
        }
    }
    return out;
}

} // namespace query
} // namespace strata
