#include "query/field_resolver.h"
#include "utils/errors.h"
#include "utils/logger.h"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace strata {
namespace query {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

bool startsWith(const std::string& s, std::string_view prefix) {
    return s.rfind(prefix, 0) == 0;
}

std::vector<std::string> splitWhitespace(const std::string& s) {
    std::istringstream in(s);
    std::vector<std::string> parts;
    std::string part;
    while (in >> part) parts.push_back(part);
    return parts;
}

// Splits "expr as alias" on the first " as " (case-insensitive)
std::pair<std::string, std::string> splitAlias(const std::string& field) {
    auto lower = toLower(field);
    auto pos = lower.find(" as ");
    if (pos == std::string::npos) return {field, ""};
    return {trim(field.substr(0, pos)), trim(field.substr(pos + 4))};
}

// Functions whose arguments may contain `tab...`. references that are not
// child tables
const std::vector<std::string>& tableAgnosticFunctions() {
    static const std::vector<std::string> functions = {
        "dayofyear(", "extract(", "locate(", "strpos(", "count(", "sum(", "avg(",
    };
    return functions;
}

// Aggregates that stay unqualified when several tables take part
bool isStandardSqlMethod(const std::string& field) {
    static const std::vector<std::string> methods = {
        "count(", "avg(", "sum(", "extract(", "dayofyear(",
    };
    auto lower = toLower(field);
    return std::any_of(methods.begin(), methods.end(),
        [&](const std::string& m) { return startsWith(lower, m); });
}

} // namespace

const std::vector<std::string>& optionalFields() {
    static const std::vector<std::string> fields = {
        "_user_tags", "_comments", "_assign", "_liked_by", "_seen",
    };
    return fields;
}

FieldResolver::FieldResolver(std::string doctype, const MetadataProvider& metadata, ReadCheck read_check)
    : doctype_(std::move(doctype)), metadata_(metadata), read_check_(std::move(read_check)) {
    tables_.push_back(tableName(doctype_));
}

void FieldResolver::resolveDottedFields(std::vector<std::string>& fields) {
    for (auto& field : fields) {
        if (field.find('.') == std::string::npos || field.find('(') != std::string::npos ||
            field.find('`') != std::string::npos || field.find('"') != std::string::npos) {
            continue;
        }

        auto [expr, alias] = splitAlias(field);
        auto dot = expr.find('.');
        std::string left = trim(expr.substr(0, dot));
        std::string fieldname = trim(expr.substr(dot + 1));
        if (!alias.empty()) validateFieldname(alias);

        if (startsWith(left, "tab")) {
            // tabChild DocType.fieldname
            validateFieldname(left);
            if (fieldname != "*") validateFieldname(fieldname);
            std::string column = fieldname == "*" ? "*" : "`" + fieldname + "`";
            field = "`" + left + "`." + column + (alias.empty() ? "" : " as " + alias);
            continue;
        }

        validateFieldname(left);
        validateFieldname(fieldname);
        const DocTypeMeta& meta = metadata_.getMeta(doctype_);
        const FieldMeta* linked = meta.getField(left);
        if (!linked || linked->options.empty() ||
            (linked->fieldtype != FieldType::Link && linked->fieldtype != FieldType::Table)) {
            throw DataError("Field " + left + " of " + doctype_ + " is not a Link or Table field");
        }
        if (linked->fieldtype == FieldType::Link) {
            appendLinkTable(linked->options, left);
        }
        field = tableName(linked->options) + ".`" + fieldname + "`" + (alias.empty() ? "" : " as " + alias);
    }
}

void FieldResolver::extractTables(const std::vector<std::string>& fields) {
    const auto& functions = tableAgnosticFunctions();
    for (const auto& field : fields) {
        if (field.find("tab") == std::string::npos || field.find('.') == std::string::npos) continue;
        auto lower = toLower(field);
        if (std::any_of(functions.begin(), functions.end(),
                [&](const std::string& fn) { return lower.find(fn) != std::string::npos; })) {
            continue;
        }

        std::string table = trim(field.substr(0, field.find('.')));
        if (startsWith(toLower(table), "group_concat(")) {
            table = table.substr(13);
        }
        if (table.empty()) continue;
        if (table.front() != '`') {
            table = "`" + table + "`";
        }
        bool linked = std::any_of(link_tables_.begin(), link_tables_.end(),
            [&](const LinkTable& l) { return l.table_name == table; });
        if (!linked) {
            appendTable(table);
        }
    }
}

void FieldResolver::appendTable(const std::string& table_name) {
    if (hasTable(table_name)) return;
    if (table_name.size() < 6 || !startsWith(table_name, "`tab") || table_name.back() != '`') {
        throw DataError("Invalid table reference: " + table_name);
    }
    std::string doctype = table_name.substr(4, table_name.size() - 5);
    if (read_check_) read_check_(doctype);
    tables_.push_back(table_name);
    STRATA_DEBUG("Joined child table {} to {}", table_name, doctype_);
}

void FieldResolver::appendLinkTable(const std::string& doctype, const std::string& fieldname) {
    for (const auto& l : link_tables_) {
        if (l.doctype == doctype && l.fieldname == fieldname) return;
    }
    if (read_check_) read_check_(doctype);
    link_tables_.push_back({doctype, fieldname, tableName(doctype)});
    STRATA_DEBUG("Joined link table {} via {}.{}", tableName(doctype), doctype_, fieldname);
}

bool FieldResolver::hasTable(const std::string& table_name) const {
    return std::find(tables_.begin(), tables_.end(), table_name) != tables_.end();
}

std::vector<std::string> FieldResolver::allTables() const {
    std::vector<std::string> all = tables_;
    for (const auto& l : link_tables_) {
        if (std::find(all.begin(), all.end(), l.table_name) == all.end()) {
            all.push_back(l.table_name);
        }
    }
    return all;
}

void FieldResolver::removeOptionalColumns(std::vector<std::string>& fields, FilterList& filters,
                                          const std::vector<std::string>& columns) const {
    auto missing = [&](const std::string& optional) {
        return std::find(columns.begin(), columns.end(), optional) == columns.end();
    };

    fields.erase(std::remove_if(fields.begin(), fields.end(), [&](const std::string& field) {
        for (const auto& optional : optionalFields()) {
            if (field.find(optional) != std::string::npos && missing(optional)) {
                STRATA_DEBUG("Dropping optional field {} missing from {}", field, doctype_);
                return true;
            }
        }
        return false;
    }), fields.end());

    filters.erase(std::remove_if(filters.begin(), filters.end(), [&](const FilterEntry& entry) {
        const auto* f = std::get_if<Filter>(&entry);
        if (!f) return false;
        const auto& optional = optionalFields();
        return std::find(optional.begin(), optional.end(), f->fieldname) != optional.end() &&
               missing(f->fieldname);
    }), filters.end());
}

void FieldResolver::qualifyFields(std::vector<std::string>& fields) const {
    if (tables_.size() <= 1 && link_tables_.empty()) return;
    for (auto& field : fields) {
        if (field.find('.') == std::string::npos && !isStandardSqlMethod(field)) {
            field = tables_.front() + "." + field;
        }
    }
}

std::vector<std::string> FieldResolver::wrapFields(const std::vector<std::string>& fields) {
    std::vector<std::string> wrapped;
    wrapped.reserve(fields.size());
    for (const auto& field : fields) {
        std::string stripped = toLower(trim(field));
        bool skip = stripped.empty() || stripped[0] == '`' || stripped[0] == '*' ||
                    stripped[0] == '"' || stripped[0] == '\'' ||
                    stripped.find('(') != std::string::npos ||
                    stripped.find("distinct") != std::string::npos;
        if (skip) {
            wrapped.push_back(field);
            continue;
        }

        auto parts = splitWhitespace(field);
        if (parts.size() == 3 && toLower(parts[1]) == "as") {
            wrapped.push_back("`" + parts[0] + "` as " + parts[2]);
        } else if (std::find_if(parts.begin(), parts.end(),
                       [](const std::string& p) { return toLower(p) == "as"; }) != parts.end()) {
            throw DataError("Invalid field alias: " + field);
        } else {
            wrapped.push_back("`" + trim(field) + "`");
        }
    }
    return wrapped;
}

std::string FieldResolver::fromClause(const std::string& join, const SqlDialect& dialect) const {
    const std::string& primary = tables_.front();
    std::string out = primary;

    // child tables
    std::string parent_name = dialect.castName(primary + ".name");
    for (size_t i = 1; i < tables_.size(); ++i) {
        const auto& child = tables_[i];
        out += " " + join + " " + child + " on (" + child + ".parenttype = " +
               dialect.escape(doctype_, false) + " and " + child + ".parent = " + parent_name + ")";
    }

    for (const auto& link : link_tables_) {
        out += " " + join + " " + link.table_name + " on (" + link.table_name + ".`name` = " +
               primary + ".`" + link.fieldname + "`)";
    }
    return out;
}

} // namespace query
} // namespace strata
