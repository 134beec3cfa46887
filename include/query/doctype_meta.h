#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata {
namespace query {

enum class FieldType {
    Data,
    Link,
    DynamicLink,
    Select,
    Text,
    SmallText,
    LongText,
    Check,
    Int,
    Float,
    Currency,
    Percent,
    Date,
    Datetime,
    Time,
    Table,
    Other
};

FieldType fieldTypeFromString(std::string_view name);
const char* fieldTypeToString(FieldType type);

/// Check/Int/Float/Currency/Percent columns never hold NULL-vs-empty ambiguity
bool isNumericType(FieldType type);

/// Column metadata of one doctype field
struct FieldMeta {
    std::string fieldname;
    FieldType fieldtype = FieldType::Data;
    std::string options;                  // target doctype for Link/Table
    bool ignore_user_permissions = false;
};

/// Metadata of one entity type ("doctype"), backed by table `tab<name>`
struct DocTypeMeta {
    std::string name;
    std::vector<FieldMeta> fields;
    std::string sort_field;               // may hold "idx desc, modified desc"
    std::string sort_order;
    bool is_submittable = false;
    bool istable = false;                 // child table doctype

    const FieldMeta* getField(std::string_view fieldname) const;
    std::vector<FieldMeta> linkFields() const;
};

/// Schema introspection service provided by the host
class MetadataProvider {
public:
    virtual ~MetadataProvider() = default;

    /// Throws ValidationError for unknown doctypes
    virtual const DocTypeMeta& getMeta(const std::string& doctype) const = 0;

    /// Physical columns of `tab<doctype>`; throws TableMissingError
    virtual std::vector<std::string> getTableColumns(const std::string& doctype) const = 0;
};

/// Standard table name of a doctype, e.g. "Task" -> "`tabTask`"
std::string tableName(std::string_view doctype);

} // namespace query
} // namespace strata
