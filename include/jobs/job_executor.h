#pragma once

#include "jobs/job_descriptor.h"
#include "jobs/method_registry.h"
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace strata {
namespace jobs {

/**
 * Datastore session of one job attempt, scoped to the job's site and user.
 * Destroying the session tears it down.
 */
class JobSession {
public:
    virtual ~JobSession() = default;

    virtual void commit() = 0;
    virtual void rollback() = 0;
    /// Durable error log entry, persisted by the next commit
    virtual void logError(const std::string& title, const std::string& message) = 0;
    /// Releases document locks still held by the job
    virtual void releaseLocks() = 0;
};

/// Opens sessions: connect to the job's site, impersonate its user
class SessionFactory {
public:
    virtual ~SessionFactory() = default;

    virtual std::unique_ptr<JobSession> open(const JobDescriptor& job) = 0;
};

struct RetryPolicy {
    using Sleeper = std::function<void(std::chrono::seconds)>;

    int max_retries = 5;
    Sleeper sleeper;                          // defaults to std::this_thread::sleep_for

    /// Pause before retry number attempt+1
    std::chrono::seconds backoff(int attempt) const { return std::chrono::seconds(attempt + 1); }
};

/// Lock contention and explicit retry requests are retried
bool isRetryableJobError(const std::exception& e);

/**
 * Runs one job to a terminal state.
 *
 * Each attempt gets a fresh session. Success commits; a retryable error
 * below the retry ceiling rolls back, tears the session down, sleeps
 * `attempt + 1` seconds and runs the job again; anything else rolls back,
 * logs the error under the method name, commits the log and rethrows.
 * Locks are released and the session is torn down on every path.
 */
class JobExecutor {
public:
    JobExecutor(const MethodRegistry& methods, SessionFactory& sessions, RetryPolicy policy = {});

    nlohmann::json execute(const JobDescriptor& job);

    const RetryPolicy& policy() const { return policy_; }

private:
    const MethodRegistry& methods_;
    SessionFactory& sessions_;
    RetryPolicy policy_;

    void fail(JobSession& session, const JobDescriptor& job, const std::string& message);
};

} // namespace jobs
} // namespace strata
