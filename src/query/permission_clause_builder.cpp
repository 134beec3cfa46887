#include "query/permission_clause_builder.h"
#include "utils/errors.h"
#include "utils/logger.h"

namespace strata {
namespace query {

bool requiresOwnerConstraint(const RolePermissions& perms) {
    if (!perms.has_if_owner_enabled || perms.if_owner.empty()) {
        return false;
    }
    // read or select granted without the owner condition
    if (perms.select && !perms.if_owner.count("select")) return false;
    if (perms.read && !perms.if_owner.count("read")) return false;
    return true;
}

bool hasAnyUserPermissionForDoctype(const PermissionProvider& permissions,
                                    const std::string& doctype,
                                    const std::string& user,
                                    const std::string& applicable_for) {
    auto all = permissions.getUserPermissions(user);
    auto it = all.find(doctype);
    if (it == all.end()) return false;
    for (const auto& perm : it->second) {
        if (perm.applicable_for.empty() || perm.applicable_for == applicable_for) {
            return true;
        }
    }
    return false;
}

void checkParentPermission(const PermissionProvider& permissions,
                           const std::string& parent,
                           const std::string& child_doctype,
                           const std::string& user) {
    if (parent.empty()) {
        throw PermissionError(child_doctype, "Parent doctype required to read " + child_doctype);
    }
    if (!child_doctype.empty() && !permissions.isChildOf(parent, child_doctype)) {
        throw PermissionError(child_doctype, child_doctype + " is not a child table of " + parent);
    }
    if (!permissions.hasPermission(parent, "read", user)) {
        throw PermissionError(parent, "No permission to read " + parent);
    }
}

PermissionClauseBuilder::PermissionClauseBuilder(const MetadataProvider& metadata,
                                                 const PermissionProvider& permissions,
                                                 const SqlDialect& dialect,
                                                 const PermissionHookRegistry* hooks)
    : metadata_(metadata), permissions_(permissions), dialect_(dialect), hooks_(hooks) {}

std::string PermissionClauseBuilder::shareCondition(const std::string& doctype,
                                                    const std::vector<std::string>& shared) const {
    std::string values;
    for (size_t i = 0; i < shared.size(); ++i) {
        if (i) values += ", ";
        values += dialect_.escape(shared[i], false);
    }
    return dialect_.castName(tableName(doctype) + ".name") + " in (" + values + ")";
}

std::string PermissionClauseBuilder::userPermissionConditions(const DocTypeMeta& meta,
                                                              const Options& options) const {
    auto user_permissions = permissions_.getUserPermissions(options.user);
    const std::string table = tableName(meta.name);
    const std::string& reference = options.reference_doctype.empty() ? meta.name : options.reference_doctype;

    auto link_fields = meta.linkFields();
    // the record itself behaves like a link to its own doctype
    FieldMeta self_link;
    self_link.fieldname = "name";
    self_link.fieldtype = FieldType::Link;
    self_link.options = meta.name;
    link_fields.push_back(self_link);

    std::vector<std::string> groups;
    for (const auto& df : link_fields) {
        if (df.ignore_user_permissions) continue;

        auto it = user_permissions.find(df.options);
        if (it == user_permissions.end() || it->second.empty()) continue;

        std::vector<std::string> docs;
        for (const auto& perm : it->second) {
            if (perm.applicable_for.empty()) {
                docs.push_back(perm.doc);
            } else if (df.fieldname == "name" && !options.reference_doctype.empty()) {
                if (perm.applicable_for == reference) docs.push_back(perm.doc);
            } else if (perm.applicable_for == meta.name) {
                docs.push_back(perm.doc);
            }
        }
        if (docs.empty()) continue;

        std::string column = table + ".`" + df.fieldname + "`";
        std::string condition;
        if (!options.strict_user_permissions) {
            condition = dialect_.castName("coalesce(" + column + ", '')=''") + " or ";
        }
        std::string values;
        for (size_t i = 0; i < docs.size(); ++i) {
            if (i) values += ", ";
            values += dialect_.escape(docs[i], false);
        }
        condition += dialect_.castName(column) + " in (" + values + ")";
        groups.push_back("(" + condition + ")");
    }

    std::string joined;
    for (size_t i = 0; i < groups.size(); ++i) {
        if (i) joined += " and ";
        joined += groups[i];
    }
    return joined;
}

std::string PermissionClauseBuilder::shareOnlyCondition(const std::string& doctype,
                                                        const std::string& user,
                                                        const std::vector<std::string>& shared,
                                                        const std::string& hook_conditions,
                                                        bool* share_only) const {
    if (shared.empty()) {
        throw PermissionError(doctype, "No permission to read " + doctype);
    }
    STRATA_DEBUG("{} can only see {} shared {} records", user, shared.size(), doctype);
    if (share_only) *share_only = true;
    std::string condition = shareCondition(doctype, shared);
    if (!hook_conditions.empty()) {
        condition += " and " + hook_conditions;
    }
    return condition;
}

std::string PermissionClauseBuilder::build(const std::string& doctype, const Options& options,
                                           bool* share_only) const {
    const DocTypeMeta& meta = metadata_.getMeta(doctype);
    RolePermissions role = permissions_.getRolePermissions(meta, options.user);
    std::vector<std::string> shared = permissions_.getShared(doctype, options.user);
    const std::string& reference = options.reference_doctype.empty() ? doctype : options.reference_doctype;

    if (share_only) *share_only = false;

    std::string hook_conditions;
    if (hooks_) {
        for (const auto& c : hooks_->conditionsFor(doctype, options.user)) {
            if (!hook_conditions.empty()) hook_conditions += " and ";
            hook_conditions += c;
        }
    }

    const bool role_read = role.select || role.read;
    if (!meta.istable && !role_read &&
        !hasAnyUserPermissionForDoctype(permissions_, doctype, options.user, reference)) {
        return shareOnlyCondition(doctype, options.user, shared, hook_conditions, share_only);
    }

    std::vector<std::string> match_conditions;
    if (requiresOwnerConstraint(role)) {
        match_conditions.push_back(tableName(doctype) + ".`owner` = " + dialect_.escape(options.user, false));
    } else {
        auto user_conditions = userPermissionConditions(meta, options);
        // without role read these grants are the only thing exposing rows
        if (!user_conditions.empty()) {
            match_conditions.push_back(user_conditions);
        }
    }

    std::string conditions;
    if (!match_conditions.empty()) {
        conditions = "((";
        for (size_t i = 0; i < match_conditions.size(); ++i) {
            if (i) conditions += ") or (";
            conditions += match_conditions[i];
        }
        conditions += "))";
    }

    if (!hook_conditions.empty()) {
        conditions += conditions.empty() ? hook_conditions : " and " + hook_conditions;
    }

    if (!shared.empty() && !conditions.empty()) {
        conditions = "(" + conditions + ") or (" + shareCondition(doctype, shared) + ")";
    }
    return conditions;
}

} // namespace query
} // namespace strata
