#include "query/sql_dialect.h"
#include "utils/errors.h"
#include <algorithm>
#include <cctype>
#include <regex>

namespace strata {
namespace query {

namespace {

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

const std::regex& locatePattern() {
    static const std::regex re(R"re(locate\(([^,]+),\s*([`"]?name[`"]?)\s*\))re", std::regex::icase);
    return re;
}

const std::regex& funcFirstArgPattern() {
    static const std::regex re(R"re((strpos|ifnull|coalesce)\(\s*([`"]?name[`"]?)\s*,)re", std::regex::icase);
    return re;
}

const std::regex& qualifiedNamePattern() {
    static const std::regex re(R"re(([`"]?tab[\w`" -]+\.[`"]?name[`"]?)(?!\w))re", std::regex::icase);
    return re;
}

} // namespace

DbType dbTypeFromString(std::string_view name) {
    auto lower = toLower(name);
    if (lower == "mariadb" || lower == "mysql") return DbType::MariaDB;
    if (lower == "postgres" || lower == "postgresql") return DbType::Postgres;
    throw ValidationError("Unsupported database type: " + std::string(name));
}

const char* dbTypeToString(DbType type) {
    return type == DbType::Postgres ? "postgres" : "mariadb";
}

std::unique_ptr<SqlDialect> SqlDialect::create(DbType type) {
    if (type == DbType::Postgres) {
        return std::make_unique<PostgresDialect>();
    }
    return std::make_unique<MariaDBDialect>();
}

// ============================================================================
// MariaDB
// ============================================================================

std::string MariaDBDialect::escape(std::string_view value, bool percent) const {
    std::string out;
    out.reserve(value.size() + 2);
    out += '\'';
    for (char c : value) {
        switch (c) {
            case '\0': out += "\\0"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\x1a': out += "\\Z"; break;
            case '\'': out += "\\'"; break;
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '%':
                out += percent ? "%%" : "%";
                break;
            default: out += c;
        }
    }
    out += '\'';
    return out;
}

// ============================================================================
// Postgres
// ============================================================================

std::string PostgresDialect::escape(std::string_view value, bool percent) const {
    std::string out;
    out.reserve(value.size() + 2);
    out += '\'';
    for (char c : value) {
        if (c == '\0') continue;  // not representable in text
        if (c == '\'') {
            out += "''";
        } else if (c == '%' && percent) {
            out += "%%";
        } else {
            out += c;
        }
    }
    out += '\'';
    return out;
}

std::string PostgresDialect::castName(const std::string& column) const {
    auto lower = toLower(column);
    if (lower.find("cast(") != std::string::npos || column.find("::") != std::string::npos) {
        return column;
    }

    if (std::regex_search(column, locatePattern())) {
        return std::regex_replace(column, locatePattern(), "locate($1, cast($2 as varchar))");
    }

    if (std::regex_search(column, funcFirstArgPattern())) {
        return std::regex_replace(column, funcFirstArgPattern(), "$1(cast($2 as varchar),");
    }

    return std::regex_replace(column, qualifiedNamePattern(), "cast($1 as varchar)");
}

std::string PostgresDialect::finalize(const std::string& statement) const {
    std::string out;
    out.reserve(statement.size());
    bool in_literal = false;
    for (char c : statement) {
        if (c == '\'') {
            in_literal = !in_literal;
        }
        out += (c == '`' && !in_literal) ? '"' : c;
    }
    return out;
}

} // namespace query
} // namespace strata
