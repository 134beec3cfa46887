#pragma once

#include <memory>
#include <string>
#include <string_view>

namespace strata {
namespace query {

enum class DbType { MariaDB, Postgres };

DbType dbTypeFromString(std::string_view name);
const char* dbTypeToString(DbType type);

/// SQL flavour specific formatting. Statements are assembled with backtick
/// identifiers; finalize() adapts them to the target dialect.
class SqlDialect {
public:
    virtual ~SqlDialect() = default;

    virtual DbType type() const = 0;

    /// Quote a string literal for embedding. With percent=true every '%' is
    /// doubled for drivers that interpolate with printf-style placeholders.
    virtual std::string escape(std::string_view value, bool percent = true) const = 0;

    /// Cast the id ("name") column to text where ids are not stored as text
    virtual std::string castName(const std::string& column) const = 0;

    /// Last rewrite before a statement leaves the compiler
    virtual std::string finalize(const std::string& statement) const = 0;

    /// Column-reference quote character
    virtual char identifierQuote() const = 0;

    /// Case-insensitive LIKE keyword
    virtual std::string likeOperator(bool negated) const = 0;

    static std::unique_ptr<SqlDialect> create(DbType type);
};

class MariaDBDialect : public SqlDialect {
public:
    DbType type() const override { return DbType::MariaDB; }
    std::string escape(std::string_view value, bool percent = true) const override;
    std::string castName(const std::string& column) const override { return column; }
    std::string finalize(const std::string& statement) const override { return statement; }
    char identifierQuote() const override { return '`'; }
    std::string likeOperator(bool negated) const override { return negated ? "not like" : "like"; }
};

class PostgresDialect : public SqlDialect {
public:
    DbType type() const override { return DbType::Postgres; }
    std::string escape(std::string_view value, bool percent = true) const override;
    std::string castName(const std::string& column) const override;
    std::string finalize(const std::string& statement) const override;
    char identifierQuote() const override { return '"'; }
    std::string likeOperator(bool negated) const override { return negated ? "not ilike" : "ilike"; }
};

} // namespace query
} // namespace strata
