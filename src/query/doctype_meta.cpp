#include "query/doctype_meta.h"
#include <unordered_map>

namespace strata {
namespace query {

namespace {

const std::unordered_map<std::string_view, FieldType>& fieldTypeNames() {
    static const std::unordered_map<std::string_view, FieldType> names = {
        {"Data", FieldType::Data},
        {"Link", FieldType::Link},
        {"Dynamic Link", FieldType::DynamicLink},
        {"Select", FieldType::Select},
        {"Text", FieldType::Text},
        {"Small Text", FieldType::SmallText},
        {"Long Text", FieldType::LongText},
        {"Check", FieldType::Check},
        {"Int", FieldType::Int},
        {"Float", FieldType::Float},
        {"Currency", FieldType::Currency},
        {"Percent", FieldType::Percent},
        {"Date", FieldType::Date},
        {"Datetime", FieldType::Datetime},
        {"Time", FieldType::Time},
        {"Table", FieldType::Table},
    };
    return names;
}

} // namespace

FieldType fieldTypeFromString(std::string_view name) {
    const auto& names = fieldTypeNames();
    auto it = names.find(name);
    return it == names.end() ? FieldType::Other : it->second;
}

const char* fieldTypeToString(FieldType type) {
    switch (type) {
        case FieldType::Data: return "Data";
        case FieldType::Link: return "Link";
        case FieldType::DynamicLink: return "Dynamic Link";
        case FieldType::Select: return "Select";
        case FieldType::Text: return "Text";
        case FieldType::SmallText: return "Small Text";
        case FieldType::LongText: return "Long Text";
        case FieldType::Check: return "Check";
        case FieldType::Int: return "Int";
        case FieldType::Float: return "Float";
        case FieldType::Currency: return "Currency";
        case FieldType::Percent: return "Percent";
        case FieldType::Date: return "Date";
        case FieldType::Datetime: return "Datetime";
        case FieldType::Time: return "Time";
        case FieldType::Table: return "Table";
        default: return "Other";
    }
}

bool isNumericType(FieldType type) {
    switch (type) {
        case FieldType::Check:
        case FieldType::Int:
        case FieldType::Float:
        case FieldType::Currency:
        case FieldType::Percent:
            return true;
        default:
            return false;
    }
}

const FieldMeta* DocTypeMeta::getField(std::string_view fieldname) const {
    for (const auto& f : fields) {
        if (f.fieldname == fieldname) return &f;
    }
    return nullptr;
}

std::vector<FieldMeta> DocTypeMeta::linkFields() const {
    std::vector<FieldMeta> out;
    for (const auto& f : fields) {
        if (f.fieldtype == FieldType::Link && !f.options.empty()) {
            out.push_back(f);
        }
    }
    return out;
}

std::string tableName(std::string_view doctype) {
    std::string t = "`tab";
    t.append(doctype);
    t += '`';
    return t;
}

} // namespace query
} // namespace strata
