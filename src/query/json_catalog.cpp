#include "query/json_catalog.h"
#include "utils/errors.h"
#include "utils/logger.h"
#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace strata {
namespace query {

namespace {

bool isStructural(FieldType type) {
    return type == FieldType::Table;
}

} // namespace

const std::vector<std::string>& JsonCatalog::standardColumns() {
    static const std::vector<std::string> columns = {
        "name", "owner", "creation", "modified", "modified_by", "docstatus", "idx",
    };
    return columns;
}

const std::vector<std::string>& JsonCatalog::childTableColumns() {
    static const std::vector<std::string> columns = {"parent", "parentfield", "parenttype"};
    return columns;
}

JsonCatalog::JsonCatalog(const nlohmann::json& catalog) {
    if (!catalog.is_object()) {
        throw ValidationError("Catalog must be a JSON object");
    }

    const auto doctypes_spec = catalog.value("doctypes", nlohmann::json::object());
    const auto roles_spec = catalog.value("roles", nlohmann::json::object());
    const auto user_permissions_spec = catalog.value("user_permissions", nlohmann::json::object());
    const auto shared_spec = catalog.value("shared", nlohmann::json::object());
    const auto tree_spec = catalog.value("tree", nlohmann::json::object());

    for (const auto& [name, spec] : doctypes_spec.items()) {
        DocTypeMeta meta;
        meta.name = name;
        meta.sort_field = spec.value("sort_field", "");
        meta.sort_order = spec.value("sort_order", "");
        meta.is_submittable = spec.value("is_submittable", false);
        meta.istable = spec.value("istable", false);
        for (const auto& f : spec.value("fields", nlohmann::json::array())) {
            FieldMeta field;
            field.fieldname = f.at("fieldname").get<std::string>();
            field.fieldtype = fieldTypeFromString(f.value("fieldtype", "Data"));
            field.options = f.value("options", "");
            field.ignore_user_permissions = f.value("ignore_user_permissions", false);
            meta.fields.push_back(std::move(field));
        }

        std::vector<std::string> columns;
        if (spec.contains("columns")) {
            columns = spec["columns"].get<std::vector<std::string>>();
        } else {
            columns = standardColumns();
            if (meta.istable) {
                columns.insert(columns.end(), childTableColumns().begin(), childTableColumns().end());
            }
            for (const auto& f : meta.fields) {
                if (!isStructural(f.fieldtype)) columns.push_back(f.fieldname);
            }
        }
        columns_[name] = std::move(columns);
        table_exists_[name] = spec.value("table_exists", true);
        doctypes_[name] = std::move(meta);
    }

    for (const auto& [user, doctypes] : roles_spec.items()) {
        for (const auto& [doctype, rights] : doctypes.items()) {
            RoleEntry entry;
            for (const auto& [ptype, granted] : rights.items()) {
                if (ptype == "if_owner") continue;
                if (granted.is_boolean() && granted.get<bool>()) entry.ptypes.insert(ptype);
            }
            entry.perms.select = entry.ptypes.count("select") > 0;
            entry.perms.read = entry.ptypes.count("read") > 0;
            if (rights.contains("if_owner")) {
                for (const auto& p : rights["if_owner"]) entry.perms.if_owner.insert(p.get<std::string>());
            }
            entry.perms.has_if_owner_enabled = !entry.perms.if_owner.empty();
            roles_[user][doctype] = std::move(entry);
        }
    }

    for (const auto& [user, doctypes] : user_permissions_spec.items()) {
        auto& map = user_permissions_[user];
        for (const auto& [doctype, grants] : doctypes.items()) {
            for (const auto& g : grants) {
                UserPermission perm;
                if (g.is_string()) {
                    perm.doc = g.get<std::string>();
                } else {
                    perm.doc = g.at("doc").get<std::string>();
                    perm.applicable_for = g.value("applicable_for", "");
                }
                map[doctype].push_back(std::move(perm));
            }
        }
    }

    for (const auto& [user, doctypes] : shared_spec.items()) {
        for (const auto& [doctype, names] : doctypes.items()) {
            shared_[user][doctype] = names.get<std::vector<std::string>>();
        }
    }

    for (const auto& [doctype, nodes] : tree_spec.items()) {
        auto& tree = trees_[doctype];
        for (const auto& [name, bounds] : nodes.items()) {
            if (!bounds.is_array() || bounds.size() != 2) {
                throw ValidationError("Tree node " + doctype + "/" + name + " needs [lft, rgt]");
            }
            tree.push_back({name, bounds[0].get<long long>(), bounds[1].get<long long>()});
        }
        std::sort(tree.begin(), tree.end(), [](const TreeNode& a, const TreeNode& b) { return a.lft < b.lft; });
    }

    STRATA_DEBUG("Catalog loaded: {} doctypes, {} users with roles", doctypes_.size(), roles_.size());
}

JsonCatalog JsonCatalog::loadFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open catalog file: " + path);
    }
    try {
        return JsonCatalog(nlohmann::json::parse(in));
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid catalog file " + path + ": " + e.what());
    }
}

const DocTypeMeta& JsonCatalog::getMeta(const std::string& doctype) const {
    auto it = doctypes_.find(doctype);
    if (it == doctypes_.end()) {
        throw ValidationError("DocType " + doctype + " not found");
    }
    return it->second;
}

std::vector<std::string> JsonCatalog::getTableColumns(const std::string& doctype) const {
    getMeta(doctype);
    if (!table_exists_.at(doctype)) {
        throw TableMissingError(tableName(doctype));
    }
    return columns_.at(doctype);
}

const JsonCatalog::RoleEntry* JsonCatalog::findRole(const std::string& doctype, const std::string& user) const {
    auto u = roles_.find(user);
    if (u == roles_.end()) return nullptr;
    auto d = u->second.find(doctype);
    return d == u->second.end() ? nullptr : &d->second;
}

bool JsonCatalog::hasPermission(const std::string& doctype, const std::string& ptype,
                                const std::string& user, const std::string& parent_doctype) const {
    if (user == kAdministrator) return true;

    const DocTypeMeta& meta = getMeta(doctype);
    if (meta.istable && !parent_doctype.empty() && parent_doctype != doctype) {
        // child rows are readable through their parent
        return hasPermission(parent_doctype, ptype, user);
    }

    if (const auto* role = findRole(doctype, user); role && role->ptypes.count(ptype)) {
        return true;
    }
    if (ptype == "read" || ptype == "select") {
        return !getShared(doctype, user).empty();
    }
    return false;
}

bool JsonCatalog::onlyHasSelectPermission(const std::string& doctype, const std::string& user) const {
    if (user == kAdministrator) return false;
    const auto* role = findRole(doctype, user);
    return role && role->perms.select && !role->perms.read;
}

RolePermissions JsonCatalog::getRolePermissions(const DocTypeMeta& meta, const std::string& user) const {
    if (user == kAdministrator) {
        RolePermissions all;
        all.select = true;
        all.read = true;
        return all;
    }
    const auto* role = findRole(meta.name, user);
    return role ? role->perms : RolePermissions{};
}

UserPermissionMap JsonCatalog::getUserPermissions(const std::string& user) const {
    if (user == kAdministrator) return {};
    auto it = user_permissions_.find(user);
    return it == user_permissions_.end() ? UserPermissionMap{} : it->second;
}

std::vector<std::string> JsonCatalog::getShared(const std::string& doctype, const std::string& user) const {
    auto u = shared_.find(user);
    if (u == shared_.end()) return {};
    auto d = u->second.find(doctype);
    return d == u->second.end() ? std::vector<std::string>{} : d->second;
}

bool JsonCatalog::isChildOf(const std::string& parent, const std::string& child_doctype) const {
    auto it = doctypes_.find(parent);
    if (it == doctypes_.end()) return false;
    const auto& fields = it->second.fields;
    return std::any_of(fields.begin(), fields.end(), [&](const FieldMeta& f) {
        return f.fieldtype == FieldType::Table && f.options == child_doctype;
    });
}

std::optional<std::pair<long long, long long>> JsonCatalog::getBounds(
    const std::string& doctype, const std::string& name) const {
    auto it = trees_.find(doctype);
    if (it == trees_.end()) return std::nullopt;
    for (const auto& node : it->second) {
        if (node.name == name) return std::make_pair(node.lft, node.rgt);
    }
    return std::nullopt;
}

std::vector<std::string> JsonCatalog::getDescendants(const std::string& doctype, long long lft, long long rgt) const {
    std::vector<std::string> names;
    auto it = trees_.find(doctype);
    if (it == trees_.end()) return names;
    for (const auto& node : it->second) {
        if (node.lft > lft && node.rgt < rgt) names.push_back(node.name);
    }
    return names;
}

std::vector<std::string> JsonCatalog::getAncestors(const std::string& doctype, long long lft, long long rgt) const {
    std::vector<std::string> names;
    auto it = trees_.find(doctype);
    if (it == trees_.end()) return names;
    // nodes are sorted by lft; ancestors are reported nearest first
    for (auto node = it->second.rbegin(); node != it->second.rend(); ++node) {
        if (node->lft < lft && node->rgt > rgt) names.push_back(node->name);
    }
    return names;
}

} // namespace query
} // namespace strata
