#pragma once

#include "query/doctype_meta.h"
#include "query/permission_provider.h"
#include <nlohmann/json.hpp>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace strata {
namespace query {

/**
 * Metadata, permission and tree catalog read from one JSON document.
 *
 * Used by the CLI and the tests in place of a live metadata/permission
 * service:
 *
 *   {
 *     "doctypes": {
 *       "Task": {
 *         "fields": [{"fieldname": "project", "fieldtype": "Link", "options": "Project"}],
 *         "sort_field": "modified", "sort_order": "desc",
 *         "is_submittable": false, "istable": false,
 *         "columns": [...],            // optional, defaults to standard + fields
 *         "table_exists": true
 *       }
 *     },
 *     "roles": {"jane@example.com": {"Task": {"read": true, "if_owner": ["read"]}}},
 *     "user_permissions": {"jane@example.com": {"Project": [{"doc": "P1", "applicable_for": ""}]}},
 *     "shared": {"jane@example.com": {"Task": ["T-0001"]}},
 *     "tree": {"Territory": {"All": [1, 10], "Europe": [2, 5]}}
 *   }
 *
 * The user "Administrator" holds every right.
 */
class JsonCatalog : public MetadataProvider, public PermissionProvider, public HierarchyProvider {
public:
    static constexpr const char* kAdministrator = "Administrator";

    explicit JsonCatalog(const nlohmann::json& catalog);

    /// Throws std::runtime_error when the file cannot be read or parsed
    static JsonCatalog loadFromFile(const std::string& path);

    // MetadataProvider
    const DocTypeMeta& getMeta(const std::string& doctype) const override;
    std::vector<std::string> getTableColumns(const std::string& doctype) const override;

    // PermissionProvider
    bool hasPermission(const std::string& doctype, const std::string& ptype,
                       const std::string& user,
                       const std::string& parent_doctype = "") const override;
    bool onlyHasSelectPermission(const std::string& doctype, const std::string& user) const override;
    RolePermissions getRolePermissions(const DocTypeMeta& meta, const std::string& user) const override;
    UserPermissionMap getUserPermissions(const std::string& user) const override;
    std::vector<std::string> getShared(const std::string& doctype, const std::string& user) const override;
    bool isChildOf(const std::string& parent, const std::string& child_doctype) const override;

    // HierarchyProvider
    std::optional<std::pair<long long, long long>> getBounds(
        const std::string& doctype, const std::string& name) const override;
    std::vector<std::string> getDescendants(const std::string& doctype, long long lft, long long rgt) const override;
    std::vector<std::string> getAncestors(const std::string& doctype, long long lft, long long rgt) const override;

    /// Columns every table has
    static const std::vector<std::string>& standardColumns();
    static const std::vector<std::string>& childTableColumns();

private:
    struct TreeNode {
        std::string name;
        long long lft = 0;
        long long rgt = 0;
    };

    std::map<std::string, DocTypeMeta> doctypes_;
    std::map<std::string, std::vector<std::string>> columns_;
    std::map<std::string, bool> table_exists_;

    struct RoleEntry {
        RolePermissions perms;
        std::set<std::string> ptypes;      // every granted right incl. write, delete, ...
    };
    // user -> doctype -> role rights
    std::map<std::string, std::map<std::string, RoleEntry>> roles_;
    std::map<std::string, UserPermissionMap> user_permissions_;
    std::map<std::string, std::map<std::string, std::vector<std::string>>> shared_;
    std::map<std::string, std::vector<TreeNode>> trees_;

    const RoleEntry* findRole(const std::string& doctype, const std::string& user) const;
};

} // namespace query
} // namespace strata
