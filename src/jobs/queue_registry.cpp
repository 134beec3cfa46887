#include "jobs/queue_registry.h"
#include "utils/errors.h"
#include "utils/logger.h"
#include <algorithm>

namespace strata {
namespace jobs {

QueueRegistry::QueueRegistry(const config::StrataConfig& config)
    : bench_id_(config.bench_id) {
    timeouts_.emplace_back("default", config.queue.default_timeout);
    timeouts_.emplace_back("short", config.queue.default_timeout);
    timeouts_.emplace_back("long", config.queue.long_timeout);

    for (const auto& [name, worker] : config.workers) {
        auto it = std::find_if(timeouts_.begin(), timeouts_.end(),
                               [&](const auto& q) { return q.first == name; });
        int timeout = worker.timeout > 0 ? worker.timeout : kDefaultTimeout;
        if (it != timeouts_.end()) {
            it->second = timeout;
        } else {
            timeouts_.emplace_back(name, timeout);
        }
    }
    STRATA_DEBUG("Queue registry for bench {}: {} queues", bench_id_, timeouts_.size());
}

std::vector<std::string> QueueRegistry::queueNames() const {
    std::vector<std::string> names;
    names.reserve(timeouts_.size());
    for (const auto& q : timeouts_) names.push_back(q.first);
    return names;
}

bool QueueRegistry::contains(const std::string& queue) const {
    return std::any_of(timeouts_.begin(), timeouts_.end(),
                       [&](const auto& q) { return q.first == queue; });
}

int QueueRegistry::timeoutFor(const std::string& queue) const {
    for (const auto& q : timeouts_) {
        if (q.first == queue) return q.second > 0 ? q.second : kDefaultTimeout;
    }
    validate(queue);
    return kDefaultTimeout;
}

void QueueRegistry::validate(const std::string& queue) const {
    if (contains(queue)) return;
    std::string names;
    for (const auto& q : timeouts_) {
        if (!names.empty()) names += ", ";
        names += q.first;
    }
    throw ValidationError("Queue should be one of " + names);
}

std::string QueueRegistry::qualifiedName(const std::string& queue) const {
    return bench_id_ + ":" + queue;
}

std::vector<std::string> QueueRegistry::queueList(const std::optional<std::vector<std::string>>& queues,
                                                  bool build_names) const {
    std::vector<std::string> list;
    if (queues && !queues->empty()) {
        for (const auto& q : *queues) validate(q);
        list = *queues;
    } else {
        list = queueNames();
    }
    if (build_names) {
        for (auto& q : list) q = qualifiedName(q);
    }
    return list;
}

bool QueueRegistry::isAccessible(const std::string& physical_name) const {
    return std::any_of(timeouts_.begin(), timeouts_.end(),
                       [&](const auto& q) { return qualifiedName(q.first) == physical_name; });
}

} // namespace jobs
} // namespace strata
