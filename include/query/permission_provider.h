#pragma once

#include "query/doctype_meta.h"
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace strata {
namespace query {

/// Role-level rights of a user on one doctype
struct RolePermissions {
    bool select = false;
    bool read = false;
    bool has_if_owner_enabled = false;
    std::set<std::string> if_owner;       // ptypes granted only on own records
};

/// One per-record grant ("user may see <doc> of this doctype")
struct UserPermission {
    std::string doc;
    std::string applicable_for;           // empty = applies everywhere
};

/// doctype -> grants
using UserPermissionMap = std::map<std::string, std::vector<UserPermission>>;

/// Permission evaluation service provided by the host
class PermissionProvider {
public:
    virtual ~PermissionProvider() = default;

    virtual bool hasPermission(const std::string& doctype, const std::string& ptype,
                               const std::string& user,
                               const std::string& parent_doctype = "") const = 0;
    virtual bool onlyHasSelectPermission(const std::string& doctype, const std::string& user) const = 0;
    virtual RolePermissions getRolePermissions(const DocTypeMeta& meta, const std::string& user) const = 0;
    virtual UserPermissionMap getUserPermissions(const std::string& user) const = 0;
    /// Names of `doctype` records shared with the user
    virtual std::vector<std::string> getShared(const std::string& doctype, const std::string& user) const = 0;
    /// True when a child doctype is really a field of `parent`
    virtual bool isChildOf(const std::string& parent, const std::string& child_doctype) const = 0;
};

/// Nested-set bounds lookup for tree doctypes
class HierarchyProvider {
public:
    virtual ~HierarchyProvider() = default;

    virtual std::optional<std::pair<long long, long long>> getBounds(
        const std::string& doctype, const std::string& name) const = 0;
    /// Names with lft > lft and rgt < rgt, ordered by lft ascending
    virtual std::vector<std::string> getDescendants(
        const std::string& doctype, long long lft, long long rgt) const = 0;
    /// Names with lft < lft and rgt > rgt, ordered by lft descending
    virtual std::vector<std::string> getAncestors(
        const std::string& doctype, long long lft, long long rgt) const = 0;
};

/// Ordered, startup-registered permission query hooks. Each hook returns a
/// SQL predicate for the given user, or an empty string for "no restriction".
class PermissionHookRegistry {
public:
    using Hook = std::function<std::string(const std::string& user)>;

    void add(const std::string& doctype, Hook hook);
    /// Non-empty predicates of all hooks for a doctype, in registration order
    std::vector<std::string> conditionsFor(const std::string& doctype, const std::string& user) const;
    size_t size() const;

private:
    std::vector<std::pair<std::string, Hook>> hooks_;
};

} // namespace query
} // namespace strata
