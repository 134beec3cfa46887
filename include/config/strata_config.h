#pragma once

#include <chrono>
#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace strata {
namespace config {

using json = nlohmann::json;

/**
 * @brief Process wide settings of the query compiler and the job layer
 */
struct StrataConfig {
    std::string site = "default";                   // current tenant
    std::string bench_id = "bench";                 // prefix of physical queue names

    struct DatabaseConfig {
        std::string type = "mariadb";               // mariadb | postgres
    } database;

    struct PermissionsConfig {
        bool apply_strict_user_permissions = false; // no empty-link bypass
    } permissions;

    struct LoggingConfig {
        std::string level = "info";
        std::string file = "strata.log";
    } logging;

    struct QueueConfig {
        std::string broker_path = "./data/queue";   // RocksDB directory of the broker
        int connect_attempts = 10;
        std::chrono::milliseconds connect_wait{1000};
        int default_timeout = 300;                  // seconds, default/short queues
        int long_timeout = 1500;                    // seconds, long queue
        int failure_ttl_seconds = 7 * 24 * 3600;
        int result_ttl_seconds = 600;
    } queue;

    struct JobsConfig {
        int max_retries = 5;
    } jobs;

    struct WorkerQueueConfig {
        int timeout = 300;
    };
    std::map<std::string, WorkerQueueConfig> workers;   // operator defined queues

    /**
     * @brief Load configuration from YAML file; defaults on any failure
     */
    static StrataConfig loadFromYaml(const std::string& yaml_path);

    /**
     * @brief Load configuration from JSON
     */
    static StrataConfig fromJson(const json& j);

    /**
     * @brief Convert to JSON
     */
    json toJson() const;
};

} // namespace config
} // namespace strata
