#pragma once

#include "query/doctype_meta.h"
#include "query/filter.h"
#include "query/permission_provider.h"
#include "query/sql_dialect.h"
#include "utils/date_utils.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace strata {
namespace query {

/// Arguments of one DatabaseQuery::execute call
struct QueryOptions {
    std::vector<std::string> fields;          // empty = `tab<Doc>`.`name` (or pluck)
    FilterList filters;                       // AND-ed
    FilterList or_filters;                    // OR-ed as one group
    std::optional<std::string> order_by;      // unset = doctype default, "" = none
    std::string group_by;
    int limit_start = 0;
    int limit_page_length = 0;                // 0 = no limit
    bool as_list = false;
    bool distinct = false;
    bool ignore_permissions = false;
    bool strict = true;
    bool ignore_ifnull = false;
    bool with_childnames = false;
    bool with_comment_count = false;
    bool ignore_ddl = false;
    std::string join = "left join";
    std::string user;
    std::string reference_doctype;
    std::string parent_doctype;
    std::string pluck;
    bool run = true;
    bool debug = false;
};

/// The assembled, not yet rendered statement parts (keywords excluded)
struct QueryPlan {
    std::vector<std::string> tables;          // backtick-quoted join set
    std::string from;                         // FROM clause incl. joins
    std::string fields;
    std::string conditions;
    std::string group_by;
    std::string order_by;
    std::string limit;

    std::string render() const;
};

/// Runs rendered statements; provided by the host
class SqlExecutor {
public:
    virtual ~SqlExecutor() = default;

    /// Rows as objects (column -> value), or as arrays when as_list is set
    virtual nlohmann::json run(const std::string& sql, bool as_list) = 0;
};

/// Collaborators of the compiler, all owned by the caller
struct QueryServices {
    const MetadataProvider* metadata = nullptr;
    const PermissionProvider* permissions = nullptr;
    const SqlDialect* dialect = nullptr;
    const HierarchyProvider* hierarchy = nullptr;
    const PermissionHookRegistry* hooks = nullptr;
    SqlExecutor* executor = nullptr;
    bool strict_user_permissions = false;
    utils::TodayProvider today = utils::todayUtc;
};

/// Default ORDER BY of a doctype ("`tabX`.`modified` desc" unless configured)
std::string getOrderBy(const std::string& doctype, const DocTypeMeta& meta);

/**
 * Permission aware SELECT compiler for one doctype.
 *
 * One instance serves one logical query: build() returns the final
 * statement, execute() additionally hands it to the SqlExecutor.
 */
class DatabaseQuery {
public:
    DatabaseQuery(std::string doctype, QueryServices services);

    /// Rows (JSON array), a flat list when `pluck` is set, or the statement
    /// itself when `run` is false
    nlohmann::json execute(QueryOptions options);

    /// Final statement; empty when the table is missing and ignore_ddl is set
    std::string build(QueryOptions options);

    /// Statement parts before distinct/limit/dialect rewrites
    std::optional<QueryPlan> prepare(QueryOptions& options);

    const std::string& doctype() const { return doctype_; }

private:
    std::string doctype_;
    QueryServices services_;

    void checkPermission(const QueryOptions& options) const;
    std::string orderBy(const QueryOptions& options, const std::vector<std::string>& fields) const;
    void projectOrderColumns(QueryPlan& plan) const;
    std::string render(QueryPlan plan, const QueryOptions& options) const;
};

} // namespace query
} // namespace strata
