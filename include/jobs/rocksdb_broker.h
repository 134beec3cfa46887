#pragma once

#include "jobs/broker.h"
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace rocksdb {
    class DB;
    class Options;
    class ReadOptions;
    class WriteOptions;
}

namespace strata {
namespace jobs {

/**
 * Broker persisted in a local RocksDB database.
 *
 * Key layout:
 *   n:<queue>                 queue name marker
 *   q:<queue>:<A|B><seq>      queue entry -> job id (A = pushed to the front)
 *   j:<id>                    job record (descriptor, status, worker, result)
 *   s:<id>                    stop request
 *   meta:seq                  last used sequence number
 *
 * Claims are atomic WriteBatch updates; within one process all operations
 * are serialized.
 */
class RocksDBBroker : public Broker {
public:
    struct Config {
        std::string db_path = "./data/queue";
        bool create_if_missing = true;
    };

    explicit RocksDBBroker(Config config);
    ~RocksDBBroker() override;

    RocksDBBroker(const RocksDBBroker&) = delete;
    RocksDBBroker& operator=(const RocksDBBroker&) = delete;

    /// Open the database; false (and logged) on failure
    bool open();
    void close();
    bool isOpen() const;

    /// Opened broker or BrokerUnavailableError
    static std::shared_ptr<RocksDBBroker> connect(const std::string& db_path);

    void ping() override;
    std::string push(const std::string& queue, const JobDescriptor& job, bool at_front) override;
    std::optional<JobDescriptor> pop(const std::vector<std::string>& queues,
                                     const std::string& worker) override;
    std::vector<JobDescriptor> queuedJobs(const std::string& queue) const override;
    std::vector<JobDescriptor> runningJobs(const std::string& queue) const override;
    void markFinished(const std::string& job_id, const nlohmann::json& result) override;
    void markFailed(const std::string& job_id, const std::string& error) override;
    std::optional<JobStatus> status(const std::string& job_id) const override;
    void requestStop(const std::string& job_id) override;
    bool isStopRequested(const std::string& job_id) const override;
    std::vector<std::string> queueNames() const override;
    size_t purgeExpired(std::chrono::seconds result_ttl, std::chrono::seconds failure_ttl) override;

    /// Stored record of a job (descriptor plus broker state)
    std::optional<nlohmann::json> record(const std::string& job_id) const;

private:
    Config config_;
    std::unique_ptr<rocksdb::DB> db_;
    std::unique_ptr<rocksdb::Options> options_;
    std::unique_ptr<rocksdb::ReadOptions> read_options_;
    std::unique_ptr<rocksdb::WriteOptions> write_options_;
    mutable std::mutex mutex_;
    uint64_t seq_ = 0;

    void requireOpen() const;
    std::optional<std::string> getRaw(std::string_view key) const;
    void putRaw(std::string_view key, std::string_view value);
    std::optional<nlohmann::json> loadRecord(const std::string& job_id) const;
    void finish(const std::string& job_id, JobStatus status, const nlohmann::json& payload);
};

} // namespace jobs
} // namespace strata
