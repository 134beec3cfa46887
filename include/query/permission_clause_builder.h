#pragma once

#include "query/doctype_meta.h"
#include "query/permission_provider.h"
#include "query/sql_dialect.h"
#include <string>
#include <vector>

namespace strata {
namespace query {

/// True when read/select are only granted on records the user owns
bool requiresOwnerConstraint(const RolePermissions& perms);

/// True when the user holds a grant on `doctype` that applies everywhere or
/// to `applicable_for`
bool hasAnyUserPermissionForDoctype(const PermissionProvider& permissions,
                                    const std::string& doctype,
                                    const std::string& user,
                                    const std::string& applicable_for);

/// Child table reads must name a parent that really contains the child
/// doctype and that the user may read. Throws PermissionError otherwise.
void checkParentPermission(const PermissionProvider& permissions,
                           const std::string& parent,
                           const std::string& child_doctype,
                           const std::string& user);

/**
 * Row visibility predicate of one doctype for one user.
 *
 * - no role read/select and no applicable grants: only shared records are
 *   visible (PermissionError when nothing is shared)
 * - owner restricted roles: `owner` = user
 * - otherwise one group per link field carrying user permissions, all
 *   groups AND-ed; each group lets empty links through unless strict
 * - hook predicates are AND-ed, shares OR-ed on top
 */
class PermissionClauseBuilder {
public:
    struct Options {
        std::string user;
        std::string reference_doctype;     // defaults to the doctype itself
        bool strict_user_permissions = false;
    };

    PermissionClauseBuilder(const MetadataProvider& metadata,
                            const PermissionProvider& permissions,
                            const SqlDialect& dialect,
                            const PermissionHookRegistry* hooks = nullptr);

    /// Returns the predicate, an empty string when unrestricted. When the
    /// user can only see shared records `share_only` is set and the share
    /// predicate is returned, ANDed with any hook predicates.
    std::string build(const std::string& doctype, const Options& options, bool* share_only = nullptr) const;

    std::string shareCondition(const std::string& doctype, const std::vector<std::string>& shared) const;

private:
    const MetadataProvider& metadata_;
    const PermissionProvider& permissions_;
    const SqlDialect& dialect_;
    const PermissionHookRegistry* hooks_;

    std::string userPermissionConditions(const DocTypeMeta& meta, const Options& options) const;
    std::string shareOnlyCondition(const std::string& doctype, const std::string& user,
                                   const std::vector<std::string>& shared,
                                   const std::string& hook_conditions, bool* share_only) const;
};

} // namespace query
} // namespace strata
