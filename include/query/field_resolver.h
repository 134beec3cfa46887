#pragma once

#include "query/doctype_meta.h"
#include "query/filter.h"
#include "query/sql_dialect.h"
#include <functional>
#include <string>
#include <vector>

namespace strata {
namespace query {

/// Columns that only exist when the corresponding feature is enabled
const std::vector<std::string>& optionalFields();

/// Doctype joined through a Link field of the primary doctype
struct LinkTable {
    std::string doctype;
    std::string fieldname;
    std::string table_name;   // `tab<doctype>`
};

/**
 * Resolves the tables a query touches and normalizes its field list.
 *
 * `link.fieldname` references are rewritten to `tab<Target>`.`fieldname`
 * and register a join on the target table; fields that already name a
 * `tab...` table add that table as a child table. Every table except the
 * primary one passes the injected read check before it is added.
 */
class FieldResolver {
public:
    using ReadCheck = std::function<void(const std::string& doctype)>;

    FieldResolver(std::string doctype, const MetadataProvider& metadata, ReadCheck read_check);

    /// Rewrite `link.field [as alias]` and `tabX.field` references in place
    void resolveDottedFields(std::vector<std::string>& fields);

    /// Collect child tables named by `tab...`-qualified fields
    void extractTables(const std::vector<std::string>& fields);

    /// Add a child table (backtick-quoted); no-op if already joined
    void appendTable(const std::string& table_name);
    void appendLinkTable(const std::string& doctype, const std::string& fieldname);
    bool hasTable(const std::string& table_name) const;

    /// Drop optional columns that are missing from the live schema
    void removeOptionalColumns(std::vector<std::string>& fields, FilterList& filters,
                               const std::vector<std::string>& columns) const;

    /// Prefix unqualified fields with the primary table when joins exist
    void qualifyFields(std::vector<std::string>& fields) const;

    /// Quote bare identifiers so reserved words work as column names
    static std::vector<std::string> wrapFields(const std::vector<std::string>& fields);

    /// FROM clause: primary table followed by child and link joins
    std::string fromClause(const std::string& join, const SqlDialect& dialect) const;

    const std::string& doctype() const { return doctype_; }
    const std::vector<std::string>& tables() const { return tables_; }
    const std::vector<LinkTable>& linkTables() const { return link_tables_; }
    /// Child and primary tables plus link tables, all backtick-quoted
    std::vector<std::string> allTables() const;

private:
    std::string doctype_;
    const MetadataProvider& metadata_;
    ReadCheck read_check_;
    std::vector<std::string> tables_;
    std::vector<LinkTable> link_tables_;
};

} // namespace query
} // namespace strata
