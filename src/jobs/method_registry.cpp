#include "jobs/method_registry.h"
#include "utils/errors.h"
#include "utils/logger.h"

namespace strata {
namespace jobs {

void MethodRegistry::add(const std::string& name, Method method) {
    if (name.empty() || !method) {
        throw ValidationError("Job method needs a name and a callable");
    }
    methods_[name] = std::move(method);
    STRATA_DEBUG("Registered job method {}", name);
}

bool MethodRegistry::contains(const std::string& name) const {
    return methods_.count(name) > 0;
}

std::vector<std::string> MethodRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(methods_.size());
    for (const auto& [name, method] : methods_) out.push_back(name);
    return out;
}

nlohmann::json MethodRegistry::call(const std::string& name, const nlohmann::json& kwargs) const {
    auto it = methods_.find(name);
    if (it == methods_.end()) {
        throw JobNotFoundError("Job method not registered: " + name);
    }
    return it->second(kwargs);
}

void MethodRegistry::setDocumentService(std::shared_ptr<DocumentService> service) {
    documents_ = std::move(service);
    std::weak_ptr<DocumentService> weak = documents_;
    add(kRunDocMethod, [weak](const nlohmann::json& kwargs) -> nlohmann::json {
        auto documents = weak.lock();
        if (!documents) {
            throw JobNotFoundError("No document service registered");
        }
        nlohmann::json rest = kwargs;
        std::string doctype = rest.value("doctype", "");
        std::string name = rest.value("name", "");
        std::string method = rest.value("doc_method", "");
        if (doctype.empty() || method.empty()) {
            throw ValidationError("run_doc_method needs doctype and doc_method");
        }
        rest.erase("doctype");
        rest.erase("name");
        rest.erase("doc_method");
        return documents->runMethod(doctype, name, method, rest);
    });
}

} // namespace jobs
} // namespace strata
