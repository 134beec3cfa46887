#include "jobs/worker.h"
#include "utils/errors.h"
#include "utils/logger.h"
#include <cstdlib>
#include <thread>
#include <unistd.h>

namespace strata {
namespace jobs {

namespace {

std::string hostName() {
    char buf[256] = {0};
    if (gethostname(buf, sizeof(buf) - 1) != 0) {
        return "localhost";
    }
    return buf;
}

// Watches one running job from a side thread; joins on destruction
class Watchdog {
public:
    Watchdog(Broker& broker, const JobDescriptor& job, std::chrono::milliseconds interval,
             const WorkerOptions::TerminateHandler& terminate)
        : broker_(broker), job_(job), interval_(interval), terminate_(terminate),
          started_(std::chrono::steady_clock::now()) {
        thread_ = std::thread([this] { run(); });
    }

    ~Watchdog() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            done_ = true;
        }
        cv_.notify_all();
        if (thread_.joinable()) thread_.join();
    }

    Watchdog(const Watchdog&) = delete;
    Watchdog& operator=(const Watchdog&) = delete;

private:
    Broker& broker_;
    const JobDescriptor& job_;
    std::chrono::milliseconds interval_;
    const WorkerOptions::TerminateHandler& terminate_;
    std::chrono::steady_clock::time_point started_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool done_ = false;
    std::thread thread_;

    void run() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!cv_.wait_for(lock, interval_, [this] { return done_; })) {
            std::string reason;
            try {
                if (broker_.isStopRequested(job_.id)) {
                    reason = "stop requested";
                }
            } catch (const std::exception& e) {
                STRATA_WARN("Watchdog could not poll stop flag of job {}: {}", job_.id, e.what());
            }
            if (reason.empty() && job_.timeout > 0 &&
                std::chrono::steady_clock::now() - started_ > std::chrono::seconds(job_.timeout)) {
                reason = "timeout of " + std::to_string(job_.timeout) + "s exceeded";
            }
            if (!reason.empty()) {
                lock.unlock();
                terminate_(job_, reason);
                return;
            }
        }
    }
};

} // namespace

Worker::Worker(const QueueRegistry& queues, BrokerConnection& connection,
               JobExecutor& executor, WorkerOptions options)
    : queues_(queues),
      connection_(connection),
      executor_(executor),
      options_(std::move(options)) {
    if (options_.queues && options_.queues->empty()) {
        options_.queues.reset();
    }
    physical_queues_ = queues_.queueList(options_.queues, true);
    if (!options_.terminate) {
        options_.terminate = [](const JobDescriptor& job, const std::string& reason) {
            STRATA_CRITICAL("Terminating worker running job {} ({}): {}", job.id, job.method, reason);
            utils::Logger::shutdown();
            std::quick_exit(1);
        };
    }
    name_ = makeName(options_.queues);
}

std::string Worker::makeName(const std::optional<std::vector<std::string>>& queues) {
    std::string name = generateJobId() + "." + hostName() + "." + std::to_string(::getpid());
    if (queues && queues->size() == 1) {
        name += "." + queues->front();
    }
    return name;
}

bool Worker::processOne() {
    auto broker = connection_.get();
    std::optional<JobDescriptor> job = broker->pop(physical_queues_, name_);
    if (!job) return false;

    STRATA_DEBUG("Worker {} claimed job {} ({})", name_, job->id, job->method);
    nlohmann::json result;
    bool ok = false;
    std::string error;
    {
        Watchdog watchdog(*broker, *job, options_.watchdog_interval, options_.terminate);
        try {
            result = executor_.execute(*job);
            ok = true;
        } catch (const std::exception& e) {
            error = e.what();
        }
    }

    if (ok) {
        broker->markFinished(job->id, result);
    } else {
        broker->markFailed(job->id, error);
    }
    return true;
}

size_t Worker::work() {
    STRATA_INFO("Worker {} listening on {} queues{}", name_, physical_queues_.size(),
                options_.burst ? " (burst)" : "");
    size_t processed = 0;
    purge(*connection_.get());

    while (!stopping_.load()) {
        if (processOne()) {
            ++processed;
            continue;
        }
        if (options_.burst) break;

        purge(*connection_.get());
        std::unique_lock<std::mutex> lock(idle_mutex_);
        idle_cv_.wait_for(lock, options_.poll_interval, [this] { return stopping_.load(); });
    }

    STRATA_INFO("Worker {} stopped after {} jobs", name_, processed);
    return processed;
}

void Worker::stop() {
    stopping_.store(true);
    idle_cv_.notify_all();
}

void Worker::purge(Broker& broker) {
    size_t removed = broker.purgeExpired(options_.result_ttl, options_.failure_ttl);
    if (removed > 0) {
        STRATA_DEBUG("Purged {} expired job records", removed);
    }
}

} // namespace jobs
} // namespace strata
