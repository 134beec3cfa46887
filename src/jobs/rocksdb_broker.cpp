#include "jobs/rocksdb_broker.h"
#include "utils/errors.h"
#include "utils/logger.h"

#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/write_batch.h>

#include <filesystem>
#include <fmt/format.h>
#include <limits>

namespace strata {
namespace jobs {

namespace {

constexpr std::string_view kSeqKey = "meta:seq";

std::string queueMarkerKey(const std::string& queue) { return "n:" + queue; }
std::string queuePrefix(const std::string& queue) { return "q:" + queue + ":"; }
std::string jobKey(const std::string& id) { return "j:" + id; }
std::string stopKey(const std::string& id) { return "s:" + id; }

// Front entries sort before back entries; later front pushes sort first
std::string entryKey(const std::string& queue, uint64_t seq, bool at_front) {
    if (at_front) {
        return fmt::format("{}A{:020}", queuePrefix(queue), std::numeric_limits<uint64_t>::max() - seq);
    }
    return fmt::format("{}B{:020}", queuePrefix(queue), seq);
}

// Guards against queues whose name extends another queue's name
bool isEntryOf(std::string_view key, std::string_view prefix) {
    if (key.size() != prefix.size() + 21) return false;
    char marker = key[prefix.size()];
    return marker == 'A' || marker == 'B';
}

} // namespace

RocksDBBroker::RocksDBBroker(Config config)
    : config_(std::move(config)),
      options_(std::make_unique<rocksdb::Options>()),
      read_options_(std::make_unique<rocksdb::ReadOptions>()),
      write_options_(std::make_unique<rocksdb::WriteOptions>()) {
    options_->create_if_missing = config_.create_if_missing;
    write_options_->sync = false;
}

RocksDBBroker::~RocksDBBroker() {
    close();
}

bool RocksDBBroker::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) return true;

    std::error_code ec;
    std::filesystem::create_directories(config_.db_path, ec);
    if (ec) {
        STRATA_ERROR("Failed to create broker directory '{}': {}", config_.db_path, ec.message());
        return false;
    }

    rocksdb::DB* raw = nullptr;
    rocksdb::Status status = rocksdb::DB::Open(*options_, config_.db_path, &raw);
    if (!status.ok()) {
        STRATA_ERROR("Failed to open broker database at {}: {}", config_.db_path, status.ToString());
        return false;
    }
    db_.reset(raw);

    std::string seq;
    status = db_->Get(*read_options_, rocksdb::Slice(kSeqKey.data(), kSeqKey.size()), &seq);
    if (status.ok()) {
        seq_ = std::stoull(seq);
    } else if (!status.IsNotFound()) {
        STRATA_ERROR("Failed to read broker sequence: {}", status.ToString());
        db_.reset();
        return false;
    }

    STRATA_INFO("Opened broker database at {} (seq {})", config_.db_path, seq_);
    return true;
}

void RocksDBBroker::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        STRATA_DEBUG("Closing broker database at {}", config_.db_path);
        db_.reset();
    }
}

bool RocksDBBroker::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

std::shared_ptr<RocksDBBroker> RocksDBBroker::connect(const std::string& db_path) {
    Config config;
    config.db_path = db_path;
    auto broker = std::make_shared<RocksDBBroker>(config);
    if (!broker->open()) {
        throw BrokerUnavailableError("Cannot open broker database at " + db_path);
    }
    return broker;
}

void RocksDBBroker::requireOpen() const {
    if (!db_) {
        throw BrokerUnavailableError("Broker database is not open: " + config_.db_path);
    }
}

std::optional<std::string> RocksDBBroker::getRaw(std::string_view key) const {
    std::string value;
    rocksdb::Status status = db_->Get(*read_options_, rocksdb::Slice(key.data(), key.size()), &value);
    if (status.IsNotFound()) return std::nullopt;
    if (!status.ok()) {
        throw BrokerUnavailableError("Broker read failed: " + status.ToString());
    }
    return value;
}

void RocksDBBroker::putRaw(std::string_view key, std::string_view value) {
    rocksdb::Status status = db_->Put(*write_options_,
                                      rocksdb::Slice(key.data(), key.size()),
                                      rocksdb::Slice(value.data(), value.size()));
    if (!status.ok()) {
        throw BrokerUnavailableError("Broker write failed: " + status.ToString());
    }
}

std::optional<nlohmann::json> RocksDBBroker::loadRecord(const std::string& job_id) const {
    auto raw = getRaw(jobKey(job_id));
    if (!raw) return std::nullopt;
    auto parsed = nlohmann::json::parse(*raw, nullptr, false);
    if (parsed.is_discarded()) {
        STRATA_ERROR("Corrupt broker record for job {}", job_id);
        return std::nullopt;
    }
    return parsed;
}

void RocksDBBroker::ping() {
    std::lock_guard<std::mutex> lock(mutex_);
    requireOpen();
}

std::string RocksDBBroker::push(const std::string& queue, const JobDescriptor& job, bool at_front) {
    std::lock_guard<std::mutex> lock(mutex_);
    requireOpen();

    JobDescriptor stored = job;
    if (stored.id.empty()) stored.id = generateJobId();
    if (stored.enqueued_at == 0) stored.enqueued_at = nowMillis();
    stored.at_front = at_front;

    nlohmann::json record = {
        {"job", stored.toJson()},
        {"queue", queue},
        {"status", jobStatusToString(JobStatus::Queued)},
        {"worker", ""},
        {"ended_at", 0}
    };

    uint64_t seq = seq_ + 1;
    std::string seq_text = std::to_string(seq);

    rocksdb::WriteBatch batch;
    batch.Put(jobKey(stored.id), record.dump());
    batch.Put(entryKey(queue, seq, at_front), stored.id);
    batch.Put(queueMarkerKey(queue), "");
    batch.Put(rocksdb::Slice(kSeqKey.data(), kSeqKey.size()), seq_text);
    rocksdb::Status status = db_->Write(*write_options_, &batch);
    if (!status.ok()) {
        throw BrokerUnavailableError("Failed to enqueue job on " + queue + ": " + status.ToString());
    }
    seq_ = seq;

    STRATA_DEBUG("Queued job {} ({}) on {}", stored.id, stored.method, queue);
    return stored.id;
}

std::optional<JobDescriptor> RocksDBBroker::pop(const std::vector<std::string>& queues,
                                                const std::string& worker) {
    std::lock_guard<std::mutex> lock(mutex_);
    requireOpen();

    for (const auto& queue : queues) {
        const std::string prefix = queuePrefix(queue);
        std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(*read_options_));
        for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next()) {
            std::string_view key(it->key().data(), it->key().size());
            if (!isEntryOf(key, prefix)) continue;

            std::string entry(key);
            std::string job_id = it->value().ToString();
            auto record = loadRecord(job_id);

            rocksdb::WriteBatch batch;
            batch.Delete(entry);
            if (!record) {
                // record purged while still queued
                rocksdb::Status status = db_->Write(*write_options_, &batch);
                if (!status.ok()) {
                    throw BrokerUnavailableError("Failed to drop stale entry " + entry + ": " + status.ToString());
                }
                continue;
            }

            (*record)["status"] = jobStatusToString(JobStatus::Started);
            (*record)["worker"] = worker;
            (*record)["started_at"] = nowMillis();
            batch.Put(jobKey(job_id), record->dump());
            rocksdb::Status status = db_->Write(*write_options_, &batch);
            if (!status.ok()) {
                throw BrokerUnavailableError("Failed to claim job " + job_id + ": " + status.ToString());
            }
            return JobDescriptor::fromJson((*record)["job"]);
        }
        if (!it->status().ok()) {
            throw BrokerUnavailableError("Broker scan failed: " + it->status().ToString());
        }
    }
    return std::nullopt;
}

std::vector<JobDescriptor> RocksDBBroker::queuedJobs(const std::string& queue) const {
    std::lock_guard<std::mutex> lock(mutex_);
    requireOpen();

    std::vector<JobDescriptor> jobs;
    const std::string prefix = queuePrefix(queue);
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(*read_options_));
    for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next()) {
        std::string_view key(it->key().data(), it->key().size());
        if (!isEntryOf(key, prefix)) continue;
        if (auto record = loadRecord(it->value().ToString())) {
            jobs.push_back(JobDescriptor::fromJson((*record)["job"]));
        }
    }
    return jobs;
}

std::vector<JobDescriptor> RocksDBBroker::runningJobs(const std::string& queue) const {
    std::lock_guard<std::mutex> lock(mutex_);
    requireOpen();

    std::vector<JobDescriptor> jobs;
    const std::string prefix = "j:";
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(*read_options_));
    for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next()) {
        auto record = nlohmann::json::parse(it->value().ToString(), nullptr, false);
        if (record.is_discarded()) continue;
        if (record.value("queue", "") == queue &&
            record.value("status", "") == jobStatusToString(JobStatus::Started)) {
            jobs.push_back(JobDescriptor::fromJson(record["job"]));
        }
    }
    return jobs;
}

void RocksDBBroker::finish(const std::string& job_id, JobStatus status, const nlohmann::json& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    requireOpen();

    auto record = loadRecord(job_id);
    if (!record) {
        throw JobNotFoundError("No such job: " + job_id);
    }
    (*record)["status"] = jobStatusToString(status);
    (*record)["ended_at"] = nowMillis();
    if (status == JobStatus::Finished) {
        (*record)["result"] = payload;
    } else {
        (*record)["error"] = payload;
    }

    rocksdb::WriteBatch batch;
    batch.Put(jobKey(job_id), record->dump());
    batch.Delete(stopKey(job_id));
    rocksdb::Status s = db_->Write(*write_options_, &batch);
    if (!s.ok()) {
        throw BrokerUnavailableError("Failed to update job " + job_id + ": " + s.ToString());
    }
}

void RocksDBBroker::markFinished(const std::string& job_id, const nlohmann::json& result) {
    finish(job_id, JobStatus::Finished, result);
}

void RocksDBBroker::markFailed(const std::string& job_id, const std::string& error) {
    finish(job_id, JobStatus::Failed, error);
}

std::optional<JobStatus> RocksDBBroker::status(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    requireOpen();
    auto record = loadRecord(job_id);
    if (!record) return std::nullopt;
    return jobStatusFromString(record->value("status", "queued"));
}

std::optional<nlohmann::json> RocksDBBroker::record(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    requireOpen();
    return loadRecord(job_id);
}

void RocksDBBroker::requestStop(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    requireOpen();
    if (!getRaw(jobKey(job_id))) {
        throw JobNotFoundError("No such job: " + job_id);
    }
    putRaw(stopKey(job_id), "1");
    STRATA_INFO("Stop requested for job {}", job_id);
}

bool RocksDBBroker::isStopRequested(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    requireOpen();
    return getRaw(stopKey(job_id)).has_value();
}

std::vector<std::string> RocksDBBroker::queueNames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    requireOpen();

    std::vector<std::string> names;
    const std::string prefix = "n:";
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(*read_options_));
    for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next()) {
        names.push_back(it->key().ToString().substr(prefix.size()));
    }
    return names;
}

size_t RocksDBBroker::purgeExpired(std::chrono::seconds result_ttl, std::chrono::seconds failure_ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    requireOpen();

    const int64_t now = nowMillis();
    rocksdb::WriteBatch batch;
    size_t purged = 0;

    const std::string prefix = "j:";
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(*read_options_));
    for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next()) {
        auto record = nlohmann::json::parse(it->value().ToString(), nullptr, false);
        if (record.is_discarded()) continue;
        auto status = record.value("status", "");
        int64_t ended_at = record.value("ended_at", int64_t{0});
        if (ended_at == 0) continue;

        int64_t ttl_ms = 0;
        if (status == jobStatusToString(JobStatus::Finished)) {
            ttl_ms = std::chrono::duration_cast<std::chrono::milliseconds>(result_ttl).count();
        } else if (status == jobStatusToString(JobStatus::Failed)) {
            ttl_ms = std::chrono::duration_cast<std::chrono::milliseconds>(failure_ttl).count();
        } else {
            continue;
        }
        if (ended_at + ttl_ms <= now) {
            std::string id = it->key().ToString().substr(prefix.size());
            batch.Delete(jobKey(id));
            batch.Delete(stopKey(id));
            ++purged;
        }
    }

    if (purged > 0) {
        rocksdb::Status s = db_->Write(*write_options_, &batch);
        if (!s.ok()) {
            throw BrokerUnavailableError("Failed to purge expired jobs: " + s.ToString());
        }
        STRATA_DEBUG("Purged {} expired job records", purged);
    }
    return purged;
}

} // namespace jobs
} // namespace strata
