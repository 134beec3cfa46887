#pragma once

#include "jobs/broker.h"
#include "jobs/job_executor.h"
#include "jobs/queue_registry.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace strata {
namespace jobs {

struct WorkerOptions {
    /// Called when the running job must die (stop request or timeout overrun).
    /// The default logs and calls std::quick_exit.
    using TerminateHandler = std::function<void(const JobDescriptor& job, const std::string& reason)>;

    std::optional<std::vector<std::string>> queues;   // logical names; all queues when empty
    bool burst = false;                                // return once the queues are drained
    std::chrono::milliseconds poll_interval{1000};
    std::chrono::milliseconds watchdog_interval{1000};
    TerminateHandler terminate;
    std::chrono::seconds result_ttl{600};
    std::chrono::seconds failure_ttl{7 * 24 * 3600};
};

/**
 * Pulls jobs from the bench's queues and runs them one at a time.
 *
 * While a job runs a watchdog polls the broker for a stop request and
 * checks the job's timeout; either one ends the job through the
 * terminate handler. Broker status is updated after every job.
 */
class Worker {
public:
    Worker(const QueueRegistry& queues, BrokerConnection& connection,
           JobExecutor& executor, WorkerOptions options = {});

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    /// "<uuid>.<hostname>.<pid>[.<queue>]"
    const std::string& name() const { return name_; }
    const std::vector<std::string>& physicalQueues() const { return physical_queues_; }

    /// Claim and run one job; false when every queue was empty
    bool processOne();

    /// Run until stop() (or until the queues are drained in burst mode);
    /// returns the number of jobs processed
    size_t work();

    void stop();
    bool isStopping() const { return stopping_.load(); }

private:
    const QueueRegistry& queues_;
    BrokerConnection& connection_;
    JobExecutor& executor_;
    WorkerOptions options_;
    std::string name_;
    std::vector<std::string> physical_queues_;

    std::atomic<bool> stopping_{false};
    std::mutex idle_mutex_;
    std::condition_variable idle_cv_;

    static std::string makeName(const std::optional<std::vector<std::string>>& queues);
    void purge(Broker& broker);
};

} // namespace jobs
} // namespace strata
