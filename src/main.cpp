#include "config/strata_config.h"
#include "query/database_query.h"
#include "query/json_catalog.h"
#include "query/legacy_args.h"
#include "query/sql_dialect.h"
#include "utils/errors.h"
#include "utils/logger.h"
#include <fstream>
#include <iostream>
#include <string>

using namespace strata;

namespace {

void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " --catalog FILE --request FILE [options]\n"
              << "Options:\n"
              << "  --catalog FILE   Doctype/permission catalog (JSON)\n"
              << "  --request FILE   Query request: {\"doctype\": ..., \"fields\": ..., \"filters\": ...}\n"
              << "  --config FILE    Strata configuration (YAML)\n"
              << "  --dialect NAME   mariadb or postgres (overrides config)\n"
              << "  --user NAME      Acting user (overrides the request)\n"
              << "  --help, -h       Show this help message\n";
}

int run(const std::string& catalog_path, const std::string& request_path,
        const std::string& dialect_name, const std::string& user,
        const config::StrataConfig& cfg) {
    query::JsonCatalog catalog = query::JsonCatalog::loadFromFile(catalog_path);

    std::ifstream in(request_path);
    if (!in) {
        STRATA_ERROR("Cannot open request file {}", request_path);
        return 1;
    }
    nlohmann::json request = nlohmann::json::parse(in);
    std::string doctype = request.value("doctype", "");
    if (doctype.empty()) {
        STRATA_ERROR("Request has no doctype");
        return 1;
    }

    auto dialect = query::SqlDialect::create(
        query::dbTypeFromString(dialect_name.empty() ? cfg.database.type : dialect_name));

    query::QueryOptions options = query::LegacyArgsAdapter(doctype).adapt(request);
    if (!user.empty()) {
        options.user = user;
    }
    if (options.user.empty()) {
        options.user = query::JsonCatalog::kAdministrator;
    }

    query::QueryServices services;
    services.metadata = &catalog;
    services.permissions = &catalog;
    services.hierarchy = &catalog;
    services.dialect = dialect.get();
    services.strict_user_permissions = cfg.permissions.apply_strict_user_permissions;

    query::DatabaseQuery db_query(doctype, services);
    std::string sql = db_query.build(options);
    if (sql.empty()) {
        STRATA_WARN("Table of {} is missing, nothing to query", doctype);
        return 0;
    }
    std::cout << sql << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string catalog_path;
    std::string request_path;
    std::string config_path;
    std::string dialect_name;
    std::string user;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--catalog" && i + 1 < argc) {
            catalog_path = argv[++i];
        } else if (arg == "--request" && i + 1 < argc) {
            request_path = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--dialect" && i + 1 < argc) {
            dialect_name = argv[++i];
        } else if (arg == "--user" && i + 1 < argc) {
            user = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    if (catalog_path.empty() || request_path.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    config::StrataConfig cfg;
    try {
        if (!config_path.empty()) {
            cfg = config::StrataConfig::loadFromYaml(config_path);
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config " << config_path << ": " << e.what() << "\n";
        return 1;
    }
    utils::Logger::init(cfg.logging.file, utils::Logger::levelFromString(cfg.logging.level));

    int exit_code = 0;
    try {
        exit_code = run(catalog_path, request_path, dialect_name, user, cfg);
    } catch (const PermissionError& e) {
        STRATA_ERROR("Permission denied on {}: {}", e.doctype(), e.what());
        exit_code = 3;
    } catch (const std::exception& e) {
        STRATA_ERROR("{}", e.what());
        exit_code = 1;
    }

    utils::Logger::shutdown();
    return exit_code;
}
