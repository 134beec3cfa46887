#pragma once

#include "query/doctype_meta.h"
#include "query/filter.h"
#include "query/permission_provider.h"
#include "query/sql_dialect.h"
#include "utils/date_utils.h"
#include <string>

namespace strata {
namespace query {

/// Audit columns every doctype carries
inline constexpr const char* kCreationColumn = "creation";
inline constexpr const char* kModifiedColumn = "modified";

/**
 * Compiles one normalized Filter into a SQL predicate fragment.
 *
 * Literals are escaped through the dialect, NULL columns are coalesced to a
 * type specific fallback so that `= ''` and `in ('')` also match NULL rows,
 * and comparisons on the id column are cast for dialects without text ids.
 *
 * Example:
 *   {Task, status, in, ["Open", ""]}
 * compiles to
 *   coalesce(`tabTask`.`status`, '') in ('Open', '')
 */
class ConditionBuilder {
public:
    ConditionBuilder(const MetadataProvider& metadata,
                     const SqlDialect& dialect,
                     const HierarchyProvider* hierarchy = nullptr,
                     utils::TodayProvider today = utils::todayUtc);

    /// Never coalesce NULL columns
    void setIgnoreIfnull(bool ignore) { ignore_ifnull_ = ignore; }
    bool ignoreIfnull() const { return ignore_ifnull_; }

    std::string build(const Filter& filter) const;

private:
    const MetadataProvider& metadata_;
    const SqlDialect& dialect_;
    const HierarchyProvider* hierarchy_;
    utils::TodayProvider today_;
    bool ignore_ifnull_ = false;

    std::string hierarchyValues(const Filter& f, const FieldMeta* df) const;
    std::string inValues(const nlohmann::json& value) const;
    std::string betweenCondition(const std::string& column, const nlohmann::json& value,
                                 const FieldMeta* df, bool date_like, bool datetime,
                                 bool can_be_null) const;
    std::string quoteColumn(const std::string& table, const std::string& column) const;
};

} // namespace query
} // namespace strata
