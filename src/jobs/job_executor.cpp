#include "jobs/job_executor.h"
#include "utils/errors.h"
#include "utils/logger.h"
#include <stdexcept>
#include <thread>

namespace strata {
namespace jobs {

namespace {

// Releases document locks when an attempt ends, however it ends
class LockRelease {
public:
    LockRelease(JobSession& session, const JobDescriptor& job) : session_(session), job_(job) {}
    ~LockRelease() {
        try {
            session_.releaseLocks();
        } catch (const std::exception& e) {
            STRATA_ERROR("Failed to release locks of job {} ({}): {}", job_.id, job_.method, e.what());
        }
    }

    LockRelease(const LockRelease&) = delete;
    LockRelease& operator=(const LockRelease&) = delete;

private:
    JobSession& session_;
    const JobDescriptor& job_;
};

long long elapsedMs(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}

} // namespace

bool isRetryableJobError(const std::exception& e) {
    if (dynamic_cast<const RetryJobError*>(&e)) return true;
    if (const auto* storage = dynamic_cast<const TransientStorageError*>(&e)) {
        return storage->isRetryable();
    }
    return false;
}

JobExecutor::JobExecutor(const MethodRegistry& methods, SessionFactory& sessions, RetryPolicy policy)
    : methods_(methods), sessions_(sessions), policy_(std::move(policy)) {
    if (!policy_.sleeper) {
        policy_.sleeper = [](std::chrono::seconds d) { std::this_thread::sleep_for(d); };
    }
    if (policy_.max_retries < 0) {
        policy_.max_retries = 0;
    }
}

void JobExecutor::fail(JobSession& session, const JobDescriptor& job, const std::string& message) {
    session.rollback();
    session.logError(job.method, message);
    session.commit();
    STRATA_ERROR("Job {} ({}) failed: {}", job.id, job.method, message);
}

nlohmann::json JobExecutor::execute(const JobDescriptor& job) {
    utils::ScopedLogContext log_context(job.site, job.id);
    for (int attempt = 0; ; ++attempt) {
        {
            std::unique_ptr<JobSession> session = sessions_.open(job);
            if (!session) {
                throw std::runtime_error("Session factory returned no session for site " + job.site);
            }
            LockRelease locks(*session, job);

            const auto start = std::chrono::steady_clock::now();
            STRATA_INFO("Job {} ({}) started on {} (attempt {})", job.id, job.method, job.site, attempt + 1);
            try {
                nlohmann::json result = methods_.call(job.method, job.kwargs);
                session->commit();
                STRATA_INFO("Job {} ({}) finished in {} ms", job.id, job.method, elapsedMs(start));
                return result;
            } catch (const std::exception& e) {
                if (!isRetryableJobError(e) || attempt >= policy_.max_retries) {
                    fail(*session, job, e.what());
                    throw;
                }
                session->rollback();
                STRATA_WARN("Job {} ({}) hit {} after {} ms, retrying ({}/{})",
                            job.id, job.method, e.what(), elapsedMs(start), attempt + 1, policy_.max_retries);
            } catch (...) {
                fail(*session, job, "unknown exception");
                throw;
            }
        }
        // session is gone before the pause
        policy_.sleeper(policy_.backoff(attempt));
    }
}

} // namespace jobs
} // namespace strata
