#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace strata {
namespace jobs {

/// Runs a named method of a stored document; provided by the host
class DocumentService {
public:
    virtual ~DocumentService() = default;

    virtual nlohmann::json runMethod(const std::string& doctype, const std::string& name,
                                     const std::string& method, const nlohmann::json& kwargs) = 0;
};

/// Callables that may be enqueued, registered by name at startup
class MethodRegistry {
public:
    using Method = std::function<nlohmann::json(const nlohmann::json& kwargs)>;

    static constexpr const char* kRunDocMethod = "strata.jobs.run_doc_method";

    void add(const std::string& name, Method method);
    bool contains(const std::string& name) const;
    std::vector<std::string> names() const;

    /// Throws JobNotFoundError for unregistered names
    nlohmann::json call(const std::string& name, const nlohmann::json& kwargs) const;

    /// Registers kRunDocMethod; kwargs carry doctype, name and doc_method,
    /// every other key is passed to the document method
    void setDocumentService(std::shared_ptr<DocumentService> service);

private:
    std::map<std::string, Method> methods_;
    std::shared_ptr<DocumentService> documents_;
};

} // namespace jobs
} // namespace strata
