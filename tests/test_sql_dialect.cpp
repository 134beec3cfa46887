#include <gtest/gtest.h>
#include "query/sql_dialect.h"
#include "utils/errors.h"

using namespace strata::query;

TEST(SqlDialectTest, ParsesDatabaseTypes) {
    EXPECT_EQ(dbTypeFromString("MariaDB"), DbType::MariaDB);
    EXPECT_EQ(dbTypeFromString("mysql"), DbType::MariaDB);
    EXPECT_EQ(dbTypeFromString("PostgreSQL"), DbType::Postgres);
    EXPECT_STREQ(dbTypeToString(DbType::Postgres), "postgres");
    EXPECT_THROW(dbTypeFromString("oracle"), strata::ValidationError);
}

TEST(SqlDialectTest, FactoryReturnsRequestedDialect) {
    EXPECT_EQ(SqlDialect::create(DbType::MariaDB)->type(), DbType::MariaDB);
    EXPECT_EQ(SqlDialect::create(DbType::Postgres)->type(), DbType::Postgres);
}

TEST(SqlDialectTest, MariaDBEscapesLiterals) {
    MariaDBDialect d;
    EXPECT_EQ(d.escape("plain"), "'plain'");
    EXPECT_EQ(d.escape("it's 50%"), "'it\\'s 50%%'");
    EXPECT_EQ(d.escape("it's 50%", false), "'it\\'s 50%'");
    EXPECT_EQ(d.escape("a\\b"), "'a\\\\b'");
    EXPECT_EQ(d.escape("line\nbreak"), "'line\\nbreak'");
}

TEST(SqlDialectTest, PostgresEscapesLiterals) {
    PostgresDialect d;
    EXPECT_EQ(d.escape("it's"), "'it''s'");
    EXPECT_EQ(d.escape("100%"), "'100%%'");
    EXPECT_EQ(d.escape("100%", false), "'100%'");
}

TEST(SqlDialectTest, MariaDBLeavesIdsAlone) {
    MariaDBDialect d;
    EXPECT_EQ(d.castName("`tabTask`.`name`"), "`tabTask`.`name`");
    EXPECT_EQ(d.finalize("select `name` from `tabTask`"), "select `name` from `tabTask`");
    EXPECT_EQ(d.likeOperator(false), "like");
}

TEST(SqlDialectTest, PostgresCastsQualifiedName) {
    PostgresDialect d;
    EXPECT_EQ(d.castName("`tabTask`.`name`"), "cast(`tabTask`.`name` as varchar)");
    EXPECT_EQ(d.castName("ifnull(`tabTask`.`name`, '')"),
              "ifnull(cast(`tabTask`.`name` as varchar), '')");
}

TEST(SqlDialectTest, PostgresCastsFunctionArguments) {
    PostgresDialect d;
    EXPECT_EQ(d.castName("locate('abc', name)"), "locate('abc', cast(name as varchar))");
    EXPECT_EQ(d.castName("ifnull(name, '')"), "ifnull(cast(name as varchar), '')");
    EXPECT_EQ(d.castName("coalesce(`name`, '')"), "coalesce(cast(`name` as varchar), '')");
}

TEST(SqlDialectTest, PostgresNeverCastsTwice) {
    PostgresDialect d;
    EXPECT_EQ(d.castName("cast(`tabTask`.`name` as varchar)"), "cast(`tabTask`.`name` as varchar)");
    EXPECT_EQ(d.castName("`tabTask`.`name`::varchar"), "`tabTask`.`name`::varchar");
    // other columns are untouched
    EXPECT_EQ(d.castName("`tabTask`.`owner`"), "`tabTask`.`owner`");
}

TEST(SqlDialectTest, PostgresFinalizeQuotesIdentifiersOutsideLiterals) {
    PostgresDialect d;
    EXPECT_EQ(d.finalize("select `tabTask`.`name` from `tabTask` where `subject` = 'a`b'"),
              "select \"tabTask\".\"name\" from \"tabTask\" where \"subject\" = 'a`b'");
    EXPECT_EQ(d.likeOperator(true), "not ilike");
}
