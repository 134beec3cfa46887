#include "query/database_query.h"
#include "query/condition_builder.h"
#include "query/field_resolver.h"
#include "query/permission_clause_builder.h"
#include "query/sanitizer.h"
#include "utils/errors.h"
#include "utils/logger.h"
#include <fmt/format.h>
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

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        auto pos = s.find(sep, start);
        parts.push_back(s.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

bool isJoinType(const std::string& join) {
    static const std::vector<std::string> allowed = {"left join", "inner join", "right join", "join"};
    return std::find(allowed.begin(), allowed.end(), toLower(trim(join))) != allowed.end();
}

// count(*), min(x), max(x) as the only field: no default ordering
bool isGroupFunctionWithoutGroupBy(const std::vector<std::string>& fields, const std::string& group_by) {
    if (fields.size() != 1 || !group_by.empty()) return false;
    auto lower = toLower(fields.front());
    return lower.rfind("count(", 0) == 0 || lower.rfind("min(", 0) == 0 || lower.rfind("max(", 0) == 0;
}

// Strips a trailing asc/desc from an ORDER BY term
std::string orderColumn(const std::string& term) {
    std::string t = trim(term);
    auto lower = toLower(t);
    for (const char* dir : {" asc", " desc"}) {
        std::string suffix(dir);
        if (lower.size() > suffix.size() &&
            lower.compare(lower.size() - suffix.size(), suffix.size(), suffix) == 0) {
            return trim(t.substr(0, t.size() - suffix.size()));
        }
    }
    return t;
}

size_t commentCount(const nlohmann::json& comments) {
    if (comments.is_array()) return comments.size();
    if (!comments.is_string()) return 0;
    const auto& text = comments.get_ref<const std::string&>();
    if (text.empty()) return 0;
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    return parsed.is_array() ? parsed.size() : 0;
}

} // namespace

std::string QueryPlan::render() const {
    std::string sql = "select " + fields + " from " + from;
    if (!conditions.empty()) sql += " where " + conditions;
    if (!group_by.empty()) sql += " group by " + group_by;
    if (!order_by.empty()) sql += " order by " + order_by;
    if (!limit.empty()) sql += " " + limit;
    return sql;
}

std::string getOrderBy(const std::string& doctype, const DocTypeMeta& meta) {
    const std::string table = tableName(doctype);
    std::string order_by;

    if (meta.sort_field.find(',') != std::string::npos) {
        // "idx desc, modified desc"
        std::vector<std::string> terms;
        for (const auto& part : split(meta.sort_field, ',')) {
            std::istringstream in(part);
            std::string column;
            std::string direction;
            in >> column >> direction;
            if (column.empty()) continue;
            validateFieldname(column);
            direction = direction.empty() ? "desc" : toLower(direction);
            if (direction != "asc" && direction != "desc") {
                throw DataError("Invalid sort order '" + direction + "' for " + doctype);
            }
            terms.push_back(table + ".`" + column + "` " + direction);
        }
        order_by = join(terms, ", ");
    } else {
        std::string sort_field = meta.sort_field.empty() ? "modified" : meta.sort_field;
        std::string sort_order = (!meta.sort_field.empty() && !meta.sort_order.empty())
            ? toLower(meta.sort_order) : "desc";
        order_by = table + ".`" + sort_field + "` " + sort_order;
    }

    // drafts first
    if (meta.is_submittable) {
        order_by = table + ".docstatus asc, " + order_by;
    }
    return order_by;
}

DatabaseQuery::DatabaseQuery(std::string doctype, QueryServices services)
    : doctype_(std::move(doctype)), services_(std::move(services)) {
    if (!services_.metadata || !services_.permissions || !services_.dialect) {
        throw ValidationError("DatabaseQuery requires metadata, permission and dialect services");
    }
    if (!services_.today) {
        services_.today = utils::todayUtc;
    }
}

void DatabaseQuery::checkPermission(const QueryOptions& options) const {
    if (options.ignore_permissions) return;

    const auto& permissions = *services_.permissions;
    const DocTypeMeta& meta = services_.metadata->getMeta(doctype_);
    if (meta.istable && !options.parent_doctype.empty()) {
        checkParentPermission(permissions, options.parent_doctype, doctype_, options.user);
    }
    if (!permissions.hasPermission(doctype_, "select", options.user, options.parent_doctype) &&
        !permissions.hasPermission(doctype_, "read", options.user, options.parent_doctype)) {
        throw PermissionError(doctype_, "Insufficient Permission for " + doctype_);
    }
}

std::string DatabaseQuery::orderBy(const QueryOptions& options, const std::vector<std::string>& fields) const {
    if (options.order_by) {
        return trim(*options.order_by);
    }
    if (isGroupFunctionWithoutGroupBy(fields, options.group_by)) {
        return "";
    }
    return getOrderBy(doctype_, services_.metadata->getMeta(doctype_));
}

std::optional<QueryPlan> DatabaseQuery::prepare(QueryOptions& options) {
    checkPermission(options);

    if (!isJoinType(options.join)) {
        throw ValidationError("Join must be one of left join, inner join, right join, join; got '" +
                              options.join + "'");
    }
    const std::string join_type = toLower(trim(options.join));
    if (options.reference_doctype.empty()) {
        options.reference_doctype = doctype_;
    }

    std::vector<std::string> columns;
    try {
        columns = services_.metadata->getTableColumns(doctype_);
    } catch (const TableMissingError& e) {
        if (!options.ignore_ddl) throw;
        STRATA_DEBUG("{}; returning no rows", e.what());
        return std::nullopt;
    }

    const auto& dialect = *services_.dialect;
    const auto& permissions = *services_.permissions;

    std::vector<std::string> fields;
    for (const auto& f : options.fields) {
        if (!trim(f).empty()) fields.push_back(f);
    }
    if (fields.empty()) {
        fields.push_back(tableName(doctype_) + ".`" + (options.pluck.empty() ? "name" : options.pluck) + "`");
    }

    const bool check_reads = !options.ignore_permissions;
    const std::string user = options.user;
    FieldResolver resolver(doctype_, *services_.metadata,
        [&permissions, check_reads, user, this](const std::string& doctype) {
            if (!check_reads) return;
            std::string ptype = permissions.onlyHasSelectPermission(doctype, user) ? "select" : "read";
            if (!permissions.hasPermission(doctype, ptype, user, doctype_)) {
                throw PermissionError(doctype, "Insufficient Permission for " + doctype);
            }
        });

    resolver.resolveDottedFields(fields);
    Sanitizer sanitizer(options.strict);
    sanitizer.checkFields(fields);
    resolver.extractTables(fields);
    resolver.removeOptionalColumns(fields, options.filters, columns);
    resolver.removeOptionalColumns(fields, options.or_filters, columns);

    ConditionBuilder conditions_builder(*services_.metadata, dialect, services_.hierarchy, services_.today);
    conditions_builder.setIgnoreIfnull(options.ignore_ifnull);

    auto compile = [&](const FilterList& filters, std::vector<std::string>& out) {
        for (const auto& entry : filters) {
            if (const auto* raw = std::get_if<RawCondition>(&entry)) {
                out.push_back(raw->sql);
                continue;
            }
            const auto& filter = std::get<Filter>(entry);
            resolver.appendTable(tableName(filter.doctype));
            out.push_back(conditions_builder.build(filter));
        }
    };

    std::vector<std::string> conditions;
    std::vector<std::string> or_conditions;
    compile(options.filters, conditions);
    compile(options.or_filters, or_conditions);

    if (!options.ignore_permissions) {
        PermissionClauseBuilder permission_builder(*services_.metadata, permissions, dialect, services_.hooks);
        PermissionClauseBuilder::Options perm_options;
        perm_options.user = options.user;
        perm_options.reference_doctype = options.reference_doctype;
        perm_options.strict_user_permissions = services_.strict_user_permissions;

        bool share_only = false;
        auto match = permission_builder.build(doctype_, perm_options, &share_only);
        if (share_only) {
            conditions.push_back(match);
        } else if (!match.empty()) {
            conditions.push_back("(" + match + ")");
        }
    }

    if (!or_conditions.empty()) {
        conditions.push_back("(" + join(or_conditions, " or ") + ")");
    }

    if (options.with_childnames) {
        for (size_t i = 1; i < resolver.tables().size(); ++i) {
            const auto& t = resolver.tables()[i];
            fields.push_back(t + ".name as '" + t.substr(4, t.size() - 5) + ":name'");
        }
    }

    QueryPlan plan;
    plan.tables = resolver.allTables();
    plan.from = resolver.fromClause(join_type, dialect);
    plan.conditions = join(conditions, " and ");

    resolver.qualifyFields(fields);
    for (auto& f : fields) {
        f = dialect.castName(f);
    }
    plan.fields = join(FieldResolver::wrapFields(fields), ", ");

    plan.order_by = orderBy(options, fields);
    sanitizer.checkOrderOrGroup(plan.order_by, plan.tables);
    plan.group_by = trim(options.group_by);
    sanitizer.checkOrderOrGroup(plan.group_by, plan.tables);

    if (options.limit_page_length > 0) {
        plan.limit = fmt::format("limit {} offset {}", options.limit_page_length, std::max(0, options.limit_start));
    }
    return plan;
}

void DatabaseQuery::projectOrderColumns(QueryPlan& plan) const {
    // Postgres only orders grouped rows by selected or aggregated columns
    std::vector<std::string> terms;
    for (const auto& term : split(plan.order_by, ',')) {
        std::string column = orderColumn(term);
        std::string rewritten = trim(term);
        if (!column.empty() && plan.fields.find(column) == std::string::npos) {
            std::string alias = column;
            alias.erase(std::remove(alias.begin(), alias.end(), '`'), alias.end());
            plan.fields += ", MAX(" + column + ") as `" + alias + "`";
            rewritten.replace(0, column.size(), "`" + alias + "`");
        }
        terms.push_back(rewritten);
    }
    plan.order_by = join(terms, ", ");
}

std::string DatabaseQuery::render(QueryPlan plan, const QueryOptions& options) const {
    if (options.distinct) {
        plan.fields = "distinct " + plan.fields;
        plan.order_by.clear();
    }
    if (services_.dialect->type() == DbType::Postgres && !plan.order_by.empty() && !plan.group_by.empty()) {
        projectOrderColumns(plan);
    }
    return services_.dialect->finalize(plan.render());
}

std::string DatabaseQuery::build(QueryOptions options) {
    auto plan = prepare(options);
    if (!plan) return "";
    return render(std::move(*plan), options);
}

nlohmann::json DatabaseQuery::execute(QueryOptions options) {
    auto plan = prepare(options);
    if (!plan) {
        return nlohmann::json::array();
    }
    std::string sql = render(std::move(*plan), options);

    if (options.debug) {
        STRATA_INFO("Query on {}: {}", doctype_, sql);
    } else {
        STRATA_DEBUG("Query on {}: {}", doctype_, sql);
    }

    if (!options.run) {
        return sql;
    }
    if (!services_.executor) {
        throw ValidationError("No SQL executor configured for " + doctype_);
    }

    nlohmann::json rows = services_.executor->run(sql, options.as_list);
    if (!rows.is_array()) {
        throw DataError("SQL executor returned a non-list result for " + doctype_);
    }

    if (options.with_comment_count && !options.as_list) {
        for (auto& row : rows) {
            if (!row.is_object() || !row.contains("name") || row["name"].is_null()) continue;
            row["_comment_count"] = row.contains("_comments") ? commentCount(row["_comments"]) : 0;
        }
    }

    if (!options.pluck.empty()) {
        nlohmann::json values = nlohmann::json::array();
        for (const auto& row : rows) {
            if (row.is_object()) {
                values.push_back(row.contains(options.pluck) ? row[options.pluck] : nlohmann::json());
            } else if (row.is_array() && !row.empty()) {
                values.push_back(row[0]);
            }
        }
        return values;
    }
    return rows;
}

} // namespace query
} // namespace strata
