#include "jobs/job_descriptor.h"
#include "utils/errors.h"
#include <chrono>
#include <fmt/format.h>
#include <random>

namespace strata {
namespace jobs {

const char* jobStatusToString(JobStatus status) {
    switch (status) {
        case JobStatus::Queued: return "queued";
        case JobStatus::Started: return "started";
        case JobStatus::Finished: return "finished";
        case JobStatus::Failed: return "failed";
    }
    return "queued";
}

JobStatus jobStatusFromString(std::string_view name) {
    if (name == "queued") return JobStatus::Queued;
    if (name == "started") return JobStatus::Started;
    if (name == "finished") return JobStatus::Finished;
    if (name == "failed") return JobStatus::Failed;
    throw ValidationError("Unknown job status: " + std::string(name));
}

nlohmann::json JobDescriptor::toJson() const {
    return {
        {"id", id},
        {"site", site},
        {"user", user},
        {"method", method},
        {"kwargs", kwargs},
        {"queue", queue},
        {"timeout", timeout},
        {"is_async", is_async},
        {"job_name", job_name},
        {"event", event},
        {"at_front", at_front},
        {"enqueued_at", enqueued_at}
    };
}

JobDescriptor JobDescriptor::fromJson(const nlohmann::json& j) {
    JobDescriptor job;
    job.id = j.value("id", "");
    job.site = j.value("site", "");
    job.user = j.value("user", "");
    job.method = j.value("method", "");
    job.kwargs = j.value("kwargs", nlohmann::json::object());
    job.queue = j.value("queue", "default");
    job.timeout = j.value("timeout", 300);
    job.is_async = j.value("is_async", true);
    job.job_name = j.value("job_name", job.method);
    job.event = j.value("event", "");
    job.at_front = j.value("at_front", false);
    job.enqueued_at = j.value("enqueued_at", int64_t{0});
    return job;
}

std::string generateJobId() {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dis;
    return fmt::format("{:016x}{:016x}", dis(gen), dis(gen));
}

int64_t nowMillis() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

} // namespace jobs
} // namespace strata
