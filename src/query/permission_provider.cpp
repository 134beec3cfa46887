#include "query/permission_provider.h"
#include "utils/logger.h"

namespace strata {
namespace query {

void PermissionHookRegistry::add(const std::string& doctype, Hook hook) {
    hooks_.emplace_back(doctype, std::move(hook));
    STRATA_DEBUG("Registered permission query hook #{} for {}", hooks_.size(), doctype);
}

std::vector<std::string> PermissionHookRegistry::conditionsFor(const std::string& doctype,
                                                               const std::string& user) const {
    std::vector<std::string> conditions;
    for (const auto& [dt, hook] : hooks_) {
        if (dt != doctype || !hook) continue;
        std::string c = hook(user);
        if (!c.empty()) {
            conditions.push_back(std::move(c));
        }
    }
    return conditions;
}

size_t PermissionHookRegistry::size() const {
    return hooks_.size();
}

} // namespace query
} // namespace strata
