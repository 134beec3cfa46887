#include "config/strata_config.h"
#include "utils/logger.h"
#include <yaml-cpp/yaml.h>

namespace strata {
namespace config {

StrataConfig StrataConfig::loadFromYaml(const std::string& yaml_path) {
    try {
        YAML::Node config = YAML::LoadFile(yaml_path);
        StrataConfig result;

        result.site = config["site"].as<std::string>(result.site);
        result.bench_id = config["bench_id"].as<std::string>(result.bench_id);

        if (config["database"]) {
            result.database.type = config["database"]["type"].as<std::string>("mariadb");
        }

        if (config["permissions"]) {
            result.permissions.apply_strict_user_permissions =
                config["permissions"]["apply_strict_user_permissions"].as<bool>(false);
        }

        if (config["logging"]) {
            auto logging = config["logging"];
            result.logging.level = logging["level"].as<std::string>("info");
            result.logging.file = logging["file"].as<std::string>("strata.log");
        }

        if (config["queue"]) {
            auto queue = config["queue"];
            result.queue.broker_path = queue["broker_path"].as<std::string>("./data/queue");
            result.queue.connect_attempts = queue["connect_attempts"].as<int>(10);
            result.queue.connect_wait = std::chrono::milliseconds(queue["connect_wait_ms"].as<int>(1000));
            result.queue.default_timeout = queue["default_timeout"].as<int>(300);
            result.queue.long_timeout = queue["long_timeout"].as<int>(1500);
            result.queue.failure_ttl_seconds = queue["failure_ttl_seconds"].as<int>(7 * 24 * 3600);
            result.queue.result_ttl_seconds = queue["result_ttl_seconds"].as<int>(600);
        }

        if (config["jobs"]) {
            result.jobs.max_retries = config["jobs"]["max_retries"].as<int>(5);
        }

        if (config["workers"]) {
            for (const auto& worker : config["workers"]) {
                WorkerQueueConfig queue;
                queue.timeout = worker.second["timeout"].as<int>(300);
                result.workers[worker.first.as<std::string>()] = queue;
            }
        }

        STRATA_INFO("Loaded strata configuration from {}", yaml_path);
        return result;
    } catch (const std::exception& e) {
        STRATA_ERROR("Failed to load strata configuration from {}: {}", yaml_path, e.what());
        return StrataConfig();
    }
}

StrataConfig StrataConfig::fromJson(const json& j) {
    StrataConfig result;

    try {
        result.site = j.value("site", result.site);
        result.bench_id = j.value("bench_id", result.bench_id);

        if (j.contains("database")) {
            result.database.type = j["database"].value("type", "mariadb");
        }
        if (j.contains("permissions")) {
            result.permissions.apply_strict_user_permissions =
                j["permissions"].value("apply_strict_user_permissions", false);
        }
        if (j.contains("logging")) {
            auto logging = j["logging"];
            result.logging.level = logging.value("level", "info");
            result.logging.file = logging.value("file", "strata.log");
        }
        if (j.contains("queue")) {
            auto queue = j["queue"];
            result.queue.broker_path = queue.value("broker_path", "./data/queue");
            result.queue.connect_attempts = queue.value("connect_attempts", 10);
            result.queue.connect_wait = std::chrono::milliseconds(queue.value("connect_wait_ms", 1000));
            result.queue.default_timeout = queue.value("default_timeout", 300);
            result.queue.long_timeout = queue.value("long_timeout", 1500);
            result.queue.failure_ttl_seconds = queue.value("failure_ttl_seconds", 7 * 24 * 3600);
            result.queue.result_ttl_seconds = queue.value("result_ttl_seconds", 600);
        }
        if (j.contains("jobs")) {
            result.jobs.max_retries = j["jobs"].value("max_retries", 5);
        }
        if (j.contains("workers")) {
            for (auto it = j["workers"].begin(); it != j["workers"].end(); ++it) {
                WorkerQueueConfig queue;
                queue.timeout = it.value().value("timeout", 300);
                result.workers[it.key()] = queue;
            }
        }
    } catch (const std::exception& e) {
        STRATA_ERROR("Failed to parse strata configuration from JSON: {}", e.what());
    }

    return result;
}

json StrataConfig::toJson() const {
    json workers_json = json::object();
    for (const auto& [name, queue] : workers) {
        workers_json[name] = {{"timeout", queue.timeout}};
    }

    return {
        {"site", site},
        {"bench_id", bench_id},
        {"database", {{"type", database.type}}},
        {"permissions", {{"apply_strict_user_permissions", permissions.apply_strict_user_permissions}}},
        {"logging", {{"level", logging.level}, {"file", logging.file}}},
        {"queue", {
            {"broker_path", queue.broker_path},
            {"connect_attempts", queue.connect_attempts},
            {"connect_wait_ms", queue.connect_wait.count()},
            {"default_timeout", queue.default_timeout},
            {"long_timeout", queue.long_timeout},
            {"failure_ttl_seconds", queue.failure_ttl_seconds},
            {"result_ttl_seconds", queue.result_ttl_seconds}
        }},
        {"jobs", {{"max_retries", jobs.max_retries}}},
        {"workers", workers_json}
    };
}

} // namespace config
} // namespace strata
