#include "query/legacy_args.h"
#include "query/filter.h"
#include "utils/errors.h"
#include "utils/logger.h"
#include <cmath>
#include <cstdlib>
#include <limits>

namespace strata {
namespace query {

namespace {

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

int clampToInt(long long n) {
    if (n > std::numeric_limits<int>::max()) return std::numeric_limits<int>::max();
    if (n < std::numeric_limits<int>::min()) return std::numeric_limits<int>::min();
    return static_cast<int>(n);
}

// Integer coercion with 0 fallback, for numbers and numeric strings.
// Out-of-range values saturate.
int toInt(const nlohmann::json& v) {
    if (v.is_number_unsigned()) {
        auto n = v.get<unsigned long long>();
        return n > static_cast<unsigned long long>(std::numeric_limits<int>::max())
                   ? std::numeric_limits<int>::max()
                   : static_cast<int>(n);
    }
    if (v.is_number_integer()) return clampToInt(v.get<long long>());
    if (v.is_number()) {
        double d = v.get<double>();
        if (std::isnan(d)) return 0;
        if (d >= static_cast<double>(std::numeric_limits<int>::max())) return std::numeric_limits<int>::max();
        if (d <= static_cast<double>(std::numeric_limits<int>::min())) return std::numeric_limits<int>::min();
        return static_cast<int>(d);
    }
    if (v.is_string()) {
        const auto& text = v.get_ref<const std::string&>();
        char* end = nullptr;
        long long n = std::strtoll(text.c_str(), &end, 10);
        return end == text.c_str() ? 0 : clampToInt(n);
    }
    if (v.is_boolean()) return v.get<bool>() ? 1 : 0;
    return 0;
}

bool truthy(const nlohmann::json& v) {
    if (v.is_null()) return false;
    if (v.is_boolean()) return v.get<bool>();
    if (v.is_number()) return v.get<double>() != 0.0;
    if (v.is_string()) return !v.get_ref<const std::string&>().empty();
    return !v.empty();
}

bool flag(const nlohmann::json& args, const char* key, bool fallback) {
    if (!args.contains(key) || args[key].is_null()) return fallback;
    return truthy(args[key]);
}

std::string text(const nlohmann::json& args, const char* key) {
    if (!args.contains(key) || !args[key].is_string()) return "";
    return args[key].get<std::string>();
}

// Decodes JSON-encoded strings so shape checks see the real structure
nlohmann::json decoded(const nlohmann::json& v) {
    if (!v.is_string()) return v;
    const auto& s = v.get_ref<const std::string&>();
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos || (s[first] != '[' && s[first] != '{')) return v;
    auto parsed = nlohmann::json::parse(s, nullptr, false);
    return parsed.is_discarded() ? v : parsed;
}

} // namespace

std::vector<std::string> LegacyArgsAdapter::parseFields(const nlohmann::json& raw) {
    std::vector<std::string> fields;
    nlohmann::json value = decoded(raw);

    if (value.is_null()) return fields;
    if (value.is_string()) {
        const auto& s = value.get_ref<const std::string&>();
        if (trim(s) == "*") return {"*"};
        size_t start = 0;
        while (true) {
            auto comma = s.find(',', start);
            auto part = trim(s.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
            if (!part.empty()) fields.push_back(part);
            if (comma == std::string::npos) break;
            start = comma + 1;
        }
        return fields;
    }
    if (!value.is_array()) {
        throw DataError("Fields must be a list of strings");
    }
    for (const auto& f : value) {
        if (f.is_null()) continue;
        if (!f.is_string()) {
            throw DataError("Fields must be a list of strings, got " + f.dump());
        }
        if (!f.get_ref<const std::string&>().empty()) fields.push_back(f.get<std::string>());
    }
    return fields;
}

bool LegacyArgsAdapter::looksLikeFilters(const nlohmann::json& fields) {
    if (fields.is_object()) return true;
    return fields.is_array() && !fields.empty() && fields[0].is_array();
}

QueryOptions LegacyArgsAdapter::adapt(const nlohmann::json& args) const {
    if (!args.is_object()) {
        throw DataError("Query arguments must be an object");
    }

    nlohmann::json fields = decoded(args.value("fields", nlohmann::json()));
    nlohmann::json filters = decoded(args.value("filters", nlohmann::json()));

    if (looksLikeFilters(fields)) {
        STRATA_DEBUG("Swapping fields and filters for {}", doctype_);
        std::swap(fields, filters);
    } else if (truthy(fields) && filters.is_array() && filters.size() > 1 && filters[0].is_string()) {
        STRATA_DEBUG("Swapping filters and fields for {}", doctype_);
        std::swap(fields, filters);
    }

    FilterParser parser(doctype_);
    QueryOptions options;
    options.fields = parseFields(fields);
    if (truthy(filters)) options.filters = parser.parse(filters);
    if (args.contains("or_filters") && truthy(args["or_filters"])) {
        options.or_filters = parser.parse(args["or_filters"]);
    }

    if (args.contains("order_by") && args["order_by"].is_string() &&
        args["order_by"].get<std::string>() != "KEEP_DEFAULT_ORDERING") {
        options.order_by = args["order_by"].get<std::string>();
    }
    options.group_by = text(args, "group_by");

    options.limit_start = toInt(args.value("limit_start", nlohmann::json(0)));
    options.limit_page_length = toInt(args.value("limit_page_length", nlohmann::json(0)));
    if (args.contains("start") && truthy(args["start"])) options.limit_start = toInt(args["start"]);
    if (args.contains("page_length") && truthy(args["page_length"])) {
        options.limit_page_length = toInt(args["page_length"]);
    }
    if (args.contains("limit") && truthy(args["limit"])) options.limit_page_length = toInt(args["limit"]);

    options.as_list = flag(args, "as_list", false);
    options.distinct = flag(args, "distinct", false);
    options.ignore_permissions = flag(args, "ignore_permissions", false);
    options.strict = flag(args, "strict", true);
    options.ignore_ifnull = flag(args, "ignore_ifnull", false);
    options.with_childnames = flag(args, "with_childnames", false);
    options.with_comment_count = flag(args, "with_comment_count", false);
    options.ignore_ddl = flag(args, "ignore_ddl", false);
    options.run = flag(args, "run", true);
    options.debug = flag(args, "debug", false);

    if (auto join = text(args, "join"); !join.empty()) options.join = join;
    options.user = text(args, "user");
    options.reference_doctype = text(args, "reference_doctype");
    options.parent_doctype = text(args, "parent_doctype");
    options.pluck = text(args, "pluck");
    if (!options.pluck.empty()) validateFieldname(options.pluck);
    return options;
}

} // namespace query
} // namespace strata
