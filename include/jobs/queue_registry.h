#pragma once

#include "config/strata_config.h"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace strata {
namespace jobs {

/**
 * Logical queue names, their timeouts and their bench scoped physical names.
 *
 * Built once from configuration: `default`, `short` and `long` always
 * exist, operator defined worker queues follow in configuration order.
 */
class QueueRegistry {
public:
    static constexpr int kDefaultTimeout = 300;

    explicit QueueRegistry(const config::StrataConfig& config);

    /// (queue, timeout seconds) in registration order
    const std::vector<std::pair<std::string, int>>& timeouts() const { return timeouts_; }
    std::vector<std::string> queueNames() const;

    bool contains(const std::string& queue) const;
    /// Throws ValidationError for unknown queues
    int timeoutFor(const std::string& queue) const;
    void validate(const std::string& queue) const;

    /// "<bench_id>:<queue>"
    std::string qualifiedName(const std::string& queue) const;

    /// Validated subset (or all queues), optionally as physical names
    std::vector<std::string> queueList(const std::optional<std::vector<std::string>>& queues = std::nullopt,
                                       bool build_names = false) const;

    /// True when a physical queue belongs to this bench
    bool isAccessible(const std::string& physical_name) const;

    const std::string& benchId() const { return bench_id_; }

private:
    std::string bench_id_;
    std::vector<std::pair<std::string, int>> timeouts_;
};

} // namespace jobs
} // namespace strata
