#pragma once

#include "jobs/broker.h"
#include "jobs/job_executor.h"
#include "utils/errors.h"
#include <algorithm>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace strata {
namespace test {

/// Broker kept in memory; `available` = false makes every call fail
class InMemoryBroker : public jobs::Broker {
public:
    struct Record {
        jobs::JobDescriptor job;
        std::string queue;
        jobs::JobStatus status = jobs::JobStatus::Queued;
        std::string worker;
        nlohmann::json result;
        std::string error;
    };

    bool available = true;
    bool stop_everything = false;

    void ping() override { check(); }

    std::string push(const std::string& queue, const jobs::JobDescriptor& job, bool at_front) override {
        std::lock_guard<std::mutex> lock(mutex_);
        check();
        Record r;
        r.job = job;
        r.job.at_front = at_front;
        r.queue = queue;
        records_[job.id] = r;
        auto& q = queues_[queue];
        if (at_front) {
            q.push_front(job.id);
        } else {
            q.push_back(job.id);
        }
        return job.id;
    }

    std::optional<jobs::JobDescriptor> pop(const std::vector<std::string>& queues,
                                           const std::string& worker) override {
        std::lock_guard<std::mutex> lock(mutex_);
        check();
        for (const auto& name : queues) {
            auto& q = queues_[name];
            if (q.empty()) continue;
            auto id = q.front();
            q.pop_front();
            auto& r = records_.at(id);
            r.status = jobs::JobStatus::Started;
            r.worker = worker;
            return r.job;
        }
        return std::nullopt;
    }

    std::vector<jobs::JobDescriptor> queuedJobs(const std::string& queue) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        check();
        std::vector<jobs::JobDescriptor> out;
        auto it = queues_.find(queue);
        if (it == queues_.end()) return out;
        for (const auto& id : it->second) out.push_back(records_.at(id).job);
        return out;
    }

    std::vector<jobs::JobDescriptor> runningJobs(const std::string& queue) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        check();
        std::vector<jobs::JobDescriptor> out;
        for (const auto& [id, r] : records_) {
            if (r.queue == queue && r.status == jobs::JobStatus::Started) out.push_back(r.job);
        }
        return out;
    }

    void markFinished(const std::string& job_id, const nlohmann::json& result) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& r = find(job_id);
        r.status = jobs::JobStatus::Finished;
        r.result = result;
    }

    void markFailed(const std::string& job_id, const std::string& error) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& r = find(job_id);
        r.status = jobs::JobStatus::Failed;
        r.error = error;
    }

    std::optional<jobs::JobStatus> status(const std::string& job_id) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(job_id);
        if (it == records_.end()) return std::nullopt;
        return it->second.status;
    }

    void requestStop(const std::string& job_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        find(job_id);
        stops_.push_back(job_id);
    }

    bool isStopRequested(const std::string& job_id) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return stop_everything || std::find(stops_.begin(), stops_.end(), job_id) != stops_.end();
    }

    std::vector<std::string> queueNames() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> names;
        for (const auto& [name, q] : queues_) names.push_back(name);
        return names;
    }

    size_t purgeExpired(std::chrono::seconds, std::chrono::seconds) override {
        ++purges;
        return 0;
    }

    Record record(const std::string& job_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.at(job_id);
    }

    size_t purges = 0;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::deque<std::string>> queues_;
    std::map<std::string, Record> records_;
    std::vector<std::string> stops_;

    void check() const {
        if (!available) throw BrokerUnavailableError("connection refused");
    }

    Record& find(const std::string& job_id) {
        auto it = records_.find(job_id);
        if (it == records_.end()) throw JobNotFoundError("No such job: " + job_id);
        return it->second;
    }
};

/// Records what every job session was asked to do
struct SessionLog {
    int opened = 0;
    int commits = 0;
    int rollbacks = 0;
    int lock_releases = 0;
    int closed = 0;
    std::vector<std::pair<std::string, std::string>> errors;   // title, message
};

class RecordingSession : public jobs::JobSession {
public:
    explicit RecordingSession(SessionLog& log) : log_(log) { ++log_.opened; }
    ~RecordingSession() override { ++log_.closed; }

    void commit() override { ++log_.commits; }
    void rollback() override { ++log_.rollbacks; }
    void logError(const std::string& title, const std::string& message) override {
        log_.errors.emplace_back(title, message);
    }
    void releaseLocks() override { ++log_.lock_releases; }

private:
    SessionLog& log_;
};

class RecordingSessionFactory : public jobs::SessionFactory {
public:
    SessionLog log;
    std::vector<std::string> sites;

    std::unique_ptr<jobs::JobSession> open(const jobs::JobDescriptor& job) override {
        sites.push_back(job.site);
        return std::make_unique<RecordingSession>(log);
    }
};

} // namespace test
} // namespace strata
