#pragma once

#include "jobs/broker.h"
#include "jobs/job_descriptor.h"
#include "jobs/job_executor.h"
#include "jobs/method_registry.h"
#include "jobs/queue_registry.h"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace strata {
namespace jobs {

struct EnqueueOptions {
    std::string queue = "default";
    int timeout = 0;                      // seconds; 0 takes the queue's timeout
    std::string event;
    bool is_async = true;
    std::string job_name;                 // defaults to the method name
    bool now = false;                     // call inline, skip the queue
    bool enqueue_after_commit = false;    // buffer until flushPending()
    bool at_front = false;
};

struct EnqueueResult {
    enum class Kind {
        Queued,     // handed to the broker, job_id is set
        Executed,   // ran in this process, result is set
        Deferred    // buffered until the transaction commits
    };

    Kind kind = Kind::Queued;
    std::string job_id;
    nlohmann::json result;
};

/// Tenant and identity the dispatcher enqueues for
struct DispatchContext {
    std::string site;
    std::string user;
    bool in_test = false;
};

/**
 * Turns calls into queued jobs.
 *
 * enqueue() resolves the method, picks the execution path (inline, queued,
 * deferred until commit) and degrades to an inline call when the broker
 * cannot be reached.
 */
class JobDispatcher {
public:
    JobDispatcher(const QueueRegistry& queues,
                  BrokerConnection& connection,
                  const MethodRegistry& methods,
                  DispatchContext context,
                  JobExecutor* executor = nullptr);

    EnqueueResult enqueue(const std::string& method,
                          const EnqueueOptions& options = {},
                          const nlohmann::json& kwargs = nlohmann::json::object());

    /// Enqueue `doc_method` of the stored document doctype/name
    EnqueueResult enqueueDoc(const std::string& doctype,
                             const std::string& name,
                             const std::string& doc_method,
                             const nlohmann::json& kwargs = nlohmann::json::object(),
                             EnqueueOptions options = docOptions());

    /// Push the jobs buffered by enqueue_after_commit; called by the commit hook
    std::vector<std::string> flushPending();
    /// Drop them; called by the rollback hook
    void discardPending();
    size_t pendingCount() const;

    /// site -> values of `key` ("method", "job_name" or "id") of queued and running jobs
    std::map<std::string, std::vector<std::string>> getJobs(
        const std::optional<std::string>& site = std::nullopt,
        const std::optional<std::string>& queue = std::nullopt,
        const std::string& key = "method") const;

    /// True when a job with this name is queued or running for the current site
    bool isJobQueued(const std::string& job_name) const;

    const DispatchContext& context() const { return context_; }

private:
    struct Pending {
        std::string queue;
        JobDescriptor job;
    };

    const QueueRegistry& queues_;
    BrokerConnection& connection_;
    const MethodRegistry& methods_;
    DispatchContext context_;
    JobExecutor* executor_;

    mutable std::mutex pending_mutex_;
    std::vector<Pending> pending_;

    static EnqueueOptions docOptions();

    JobDescriptor makeJob(const std::string& method, const EnqueueOptions& options,
                          const nlohmann::json& kwargs) const;
    EnqueueResult callInline(const std::string& method, const nlohmann::json& kwargs) const;
    void runPendingInline(const JobDescriptor& job) const;
};

} // namespace jobs
} // namespace strata
