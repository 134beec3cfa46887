#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace strata {
namespace jobs {

enum class JobStatus { Queued, Started, Finished, Failed };

const char* jobStatusToString(JobStatus status);
/// Throws ValidationError for unknown names
JobStatus jobStatusFromString(std::string_view name);

/// Everything a worker needs to run one enqueued call
struct JobDescriptor {
    std::string id;
    std::string site;
    std::string user;
    std::string method;                       // registered method name
    nlohmann::json kwargs = nlohmann::json::object();
    std::string queue = "default";            // logical queue name
    int timeout = 300;                        // seconds
    bool is_async = true;
    std::string job_name;                     // defaults to method
    std::string event;
    bool at_front = false;
    int64_t enqueued_at = 0;                  // unix epoch milliseconds

    nlohmann::json toJson() const;
    static JobDescriptor fromJson(const nlohmann::json& j);
};

/// 32 hex characters, random
std::string generateJobId();

int64_t nowMillis();

} // namespace jobs
} // namespace strata
