#pragma once

#include "jobs/job_descriptor.h"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace strata {
namespace jobs {

/// Durable job channel shared by dispatchers and workers.
/// Queue arguments are physical ("<bench>:<queue>") names.
class Broker {
public:
    virtual ~Broker() = default;

    /// Throws BrokerUnavailableError when the broker cannot serve requests
    virtual void ping() = 0;

    /// Stores the job and appends it to the queue (prepends with at_front);
    /// returns the job id
    virtual std::string push(const std::string& queue, const JobDescriptor& job, bool at_front) = 0;

    /// Claims the oldest job of the first non-empty queue for `worker`
    virtual std::optional<JobDescriptor> pop(const std::vector<std::string>& queues,
                                             const std::string& worker) = 0;

    virtual std::vector<JobDescriptor> queuedJobs(const std::string& queue) const = 0;
    virtual std::vector<JobDescriptor> runningJobs(const std::string& queue) const = 0;

    virtual void markFinished(const std::string& job_id, const nlohmann::json& result) = 0;
    virtual void markFailed(const std::string& job_id, const std::string& error) = 0;
    virtual std::optional<JobStatus> status(const std::string& job_id) const = 0;

    /// Asks the worker running the job to terminate it; throws JobNotFoundError
    virtual void requestStop(const std::string& job_id) = 0;
    virtual bool isStopRequested(const std::string& job_id) const = 0;

    /// Physical names of every queue that ever received a job
    virtual std::vector<std::string> queueNames() const = 0;

    /// Drops finished/failed job records older than their TTL; returns count
    virtual size_t purgeExpired(std::chrono::seconds result_ttl, std::chrono::seconds failure_ttl) = 0;
};

/**
 * Process wide, lazily opened broker handle.
 *
 * get() opens the broker through the factory on first use, retrying up to
 * `attempts` times with a fixed wait while the broker reports itself
 * unavailable, and rethrows the last BrokerUnavailableError after that.
 */
class BrokerConnection {
public:
    using Factory = std::function<std::shared_ptr<Broker>()>;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    BrokerConnection(Factory factory,
                     int attempts = 10,
                     std::chrono::milliseconds wait = std::chrono::milliseconds(1000),
                     Sleeper sleeper = nullptr);
    ~BrokerConnection();

    BrokerConnection(const BrokerConnection&) = delete;
    BrokerConnection& operator=(const BrokerConnection&) = delete;

    std::shared_ptr<Broker> get();
    bool isConnected() const;
    /// Releases the broker; the next get() reconnects
    void shutdown();

private:
    Factory factory_;
    int attempts_;
    std::chrono::milliseconds wait_;
    Sleeper sleeper_;
    mutable std::mutex mutex_;
    std::shared_ptr<Broker> broker_;
};

} // namespace jobs
} // namespace strata
