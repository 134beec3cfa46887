#include "jobs/job_dispatcher.h"
#include "utils/errors.h"
#include "utils/logger.h"
#include <algorithm>

namespace strata {
namespace jobs {

namespace {

std::string jobValue(const JobDescriptor& job, const std::string& key) {
    if (key == "method") return job.method;
    if (key == "job_name") return job.job_name;
    if (key == "id") return job.id;
    if (key == "queue") return job.queue;
    throw ValidationError("Unknown job key: " + key);
}

} // namespace

JobDispatcher::JobDispatcher(const QueueRegistry& queues,
                             BrokerConnection& connection,
                             const MethodRegistry& methods,
                             DispatchContext context,
                             JobExecutor* executor)
    : queues_(queues),
      connection_(connection),
      methods_(methods),
      context_(std::move(context)),
      executor_(executor) {}

EnqueueOptions JobDispatcher::docOptions() {
    EnqueueOptions options;
    options.timeout = QueueRegistry::kDefaultTimeout;
    return options;
}

JobDescriptor JobDispatcher::makeJob(const std::string& method, const EnqueueOptions& options,
                                     const nlohmann::json& kwargs) const {
    JobDescriptor job;
    job.id = generateJobId();
    job.site = context_.site;
    job.user = context_.user;
    job.method = method;
    job.kwargs = kwargs.is_null() ? nlohmann::json::object() : kwargs;
    job.queue = options.queue;
    job.timeout = options.timeout > 0 ? options.timeout : queues_.timeoutFor(options.queue);
    job.is_async = options.is_async;
    job.job_name = options.job_name.empty() ? method : options.job_name;
    job.event = options.event;
    job.at_front = options.at_front;
    job.enqueued_at = nowMillis();
    return job;
}

EnqueueResult JobDispatcher::callInline(const std::string& method, const nlohmann::json& kwargs) const {
    EnqueueResult out;
    out.kind = EnqueueResult::Kind::Executed;
    out.result = methods_.call(method, kwargs.is_null() ? nlohmann::json::object() : kwargs);
    return out;
}

EnqueueResult JobDispatcher::enqueue(const std::string& method,
                                     const EnqueueOptions& options,
                                     const nlohmann::json& kwargs) {
    if (!methods_.contains(method)) {
        throw JobNotFoundError("Job method not registered: " + method);
    }

    if (!options.is_async && !context_.in_test) {
        STRATA_WARN("Using enqueue with is_async=false outside of tests is not recommended, "
                    "use now=true instead ({})", method);
    }

    if (options.now || (!options.is_async && !context_.in_test)) {
        return callInline(method, kwargs);
    }

    queues_.validate(options.queue);
    JobDescriptor job = makeJob(method, options, kwargs);

    if (options.enqueue_after_commit) {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_.push_back({queues_.qualifiedName(options.queue), job});
        EnqueueResult out;
        out.kind = EnqueueResult::Kind::Deferred;
        out.job_id = job.id;
        return out;
    }

    if (!options.is_async) {
        // tests: run through the executor the way a worker would
        if (!executor_) {
            return callInline(method, job.kwargs);
        }
        EnqueueResult out;
        out.kind = EnqueueResult::Kind::Executed;
        out.job_id = job.id;
        out.result = executor_->execute(job);
        return out;
    }

    try {
        auto broker = connection_.get();
        EnqueueResult out;
        out.kind = EnqueueResult::Kind::Queued;
        out.job_id = broker->push(queues_.qualifiedName(options.queue), job, options.at_front);
        STRATA_DEBUG("Enqueued {} as {} on {}", method, out.job_id, options.queue);
        return out;
    } catch (const BrokerUnavailableError& e) {
        STRATA_WARN("Broker unavailable ({}), executing {} synchronously", e.what(), method);
    }
    return callInline(method, job.kwargs);
}

EnqueueResult JobDispatcher::enqueueDoc(const std::string& doctype,
                                        const std::string& name,
                                        const std::string& doc_method,
                                        const nlohmann::json& kwargs,
                                        EnqueueOptions options) {
    nlohmann::json args = kwargs.is_object() ? kwargs : nlohmann::json::object();
    args["doctype"] = doctype;
    args["name"] = name;
    args["doc_method"] = doc_method;
    return enqueue(MethodRegistry::kRunDocMethod, options, args);
}

void JobDispatcher::runPendingInline(const JobDescriptor& job) const {
    // one failing job must not drop the rest of the batch
    try {
        methods_.call(job.method, job.kwargs);
    } catch (const std::exception& e) {
        STRATA_ERROR("Deferred job {} ({}) failed: {}", job.id, job.method, e.what());
    }
}

std::vector<std::string> JobDispatcher::flushPending() {
    std::vector<Pending> batch;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        batch.swap(pending_);
    }

    std::vector<std::string> ids;
    ids.reserve(batch.size());
    for (const auto& entry : batch) {
        try {
            auto broker = connection_.get();
            ids.push_back(broker->push(entry.queue, entry.job, entry.job.at_front));
        } catch (const BrokerUnavailableError& e) {
            STRATA_WARN("Broker unavailable ({}), executing {} synchronously", e.what(), entry.job.method);
            runPendingInline(entry.job);
        }
    }
    return ids;
}

void JobDispatcher::discardPending() {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    if (!pending_.empty()) {
        STRATA_DEBUG("Discarding {} jobs waiting for commit", pending_.size());
    }
    pending_.clear();
}

size_t JobDispatcher::pendingCount() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.size();
}

std::map<std::string, std::vector<std::string>> JobDispatcher::getJobs(
    const std::optional<std::string>& site,
    const std::optional<std::string>& queue,
    const std::string& key) const {

    std::vector<std::string> names;
    if (queue) {
        queues_.validate(*queue);
        names.push_back(queues_.qualifiedName(*queue));
    } else {
        names = queues_.queueList(std::nullopt, true);
    }

    auto broker = connection_.get();
    std::map<std::string, std::vector<std::string>> jobs;

    auto collect = [&](const std::vector<JobDescriptor>& list) {
        for (const auto& job : list) {
            if (job.site.empty()) {
                STRATA_WARN("Job {} ({}) has no site", job.id, job.method);
                continue;
            }
            if (site && job.site != *site) continue;
            jobs[job.site].push_back(jobValue(job, key));
        }
    };

    for (const auto& name : names) {
        collect(broker->queuedJobs(name));
        collect(broker->runningJobs(name));
    }
    return jobs;
}

bool JobDispatcher::isJobQueued(const std::string& job_name) const {
    auto jobs = getJobs(context_.site, std::nullopt, "job_name");
    auto it = jobs.find(context_.site);
    if (it == jobs.end()) return false;
    return std::find(it->second.begin(), it->second.end(), job_name) != it->second.end();
}

} // namespace jobs
} // namespace strata
