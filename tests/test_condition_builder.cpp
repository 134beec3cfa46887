#include <gtest/gtest.h>
#include "query/condition_builder.h"
#include "query/json_catalog.h"
#include "utils/errors.h"
#include "test_catalog.h"

using namespace strata::query;
using nlohmann::json;

class ConditionBuilderTest : public ::testing::Test {
protected:
    JsonCatalog catalog{strata::test::sampleCatalog()};
    MariaDBDialect mariadb;
    PostgresDialect postgres;
    ConditionBuilder builder{catalog, mariadb, &catalog, strata::test::fixedToday};

    std::string build(const std::string& field, const std::string& op, const json& value,
                      const std::string& doctype = "Task") {
        return builder.build(FilterParser(doctype).fromArray(json::array({field, op, value})));
    }
};

TEST_F(ConditionBuilderTest, EqualityWithValueIsNotCoalesced) {
    EXPECT_EQ(build("status", "=", "Open"), "`tabTask`.`status` = 'Open'");
}

TEST_F(ConditionBuilderTest, EmptyValueMatchesNullRows) {
    EXPECT_EQ(build("status", "=", ""), "coalesce(`tabTask`.`status`, '') = ''");
    EXPECT_EQ(build("project", "=", ""), "coalesce(`tabTask`.`project`, '') = ''");
    EXPECT_EQ(build("status", "!=", "Closed"), "coalesce(`tabTask`.`status`, '') != 'Closed'");
}

TEST_F(ConditionBuilderTest, IgnoreIfnullDisablesCoalescing) {
    builder.setIgnoreIfnull(true);
    EXPECT_EQ(build("status", "!=", "Closed"), "`tabTask`.`status` != 'Closed'");
}

TEST_F(ConditionBuilderTest, InListCoalescesOnlyForEmptyMembers) {
    EXPECT_EQ(build("status", "in", json::array({"Open", "Working"})),
              "`tabTask`.`status` in ('Open', 'Working')");
    EXPECT_EQ(build("status", "in", json::array({"Open", ""})),
              "coalesce(`tabTask`.`status`, '') in ('Open', '')");
    EXPECT_EQ(build("status", "in", "Open, Working"),
              "`tabTask`.`status` in ('Open', 'Working')");
}

TEST_F(ConditionBuilderTest, EmptyInListMatchesNothing) {
    EXPECT_EQ(build("status", "in", json::array()), "`tabTask`.`status` in ('')");
    EXPECT_EQ(build("status", "in", ""), "`tabTask`.`status` in ('')");
    EXPECT_EQ(build("status", "not in", json::array()), "coalesce(`tabTask`.`status`, '') not in ('')");
}

TEST_F(ConditionBuilderTest, NumericColumnsAreNeverCoalesced) {
    EXPECT_EQ(build("priority", ">", 2), "`tabTask`.`priority` > 2");
    EXPECT_EQ(build("progress", ">=", "1,500.5"), "`tabTask`.`progress` >= 1500.5");
    EXPECT_EQ(build("priority", "=", "abc"), "`tabTask`.`priority` = 0");
    EXPECT_EQ(build("qty", ">", 3, "Task Item"), "`tabTask Item`.`qty` > 3");
}

TEST_F(ConditionBuilderTest, DateBetweenIsHalfOpen) {
    const std::string col = "coalesce(`tabTask`.`due_date`, '0001-01-01')";
    EXPECT_EQ(build("due_date", "between", json::array({"2024-01-01", "2024-01-31"})),
              "(" + col + " >= '2024-01-01' and " + col + " < '2024-02-01')");
}

TEST_F(ConditionBuilderTest, AuditColumnBetweenUsesDatetimes) {
    const std::string col = "coalesce(`tabTask`.`creation`, '0001-01-01 00:00:00.000000')";
    EXPECT_EQ(build("creation", "between", json::array({"2024-01-01", "2024-01-31"})),
              "(" + col + " >= '2024-01-01 00:00:00.000000' and " + col + " < '2024-02-01 00:00:00.000000')");
}

TEST_F(ConditionBuilderTest, BetweenDefaultsMissingBoundsToToday) {
    const std::string col = "coalesce(`tabTask`.`due_date`, '0001-01-01')";
    EXPECT_EQ(build("due_date", "between", json::array({"2024-05-01"})),
              "(" + col + " >= '2024-05-01' and " + col + " < '2024-05-16')");
}

TEST_F(ConditionBuilderTest, NumericBetween) {
    EXPECT_EQ(build("priority", "between", json::array({1, 5})), "`tabTask`.`priority` between 1 and 5");
    EXPECT_THROW(build("priority", "between", json::array({1})), strata::DataError);
}

TEST_F(ConditionBuilderTest, TimespanResolvesAgainstInjectedClock) {
    const std::string col = "coalesce(`tabTask`.`due_date`, '0001-01-01')";
    EXPECT_EQ(build("due_date", "timespan", "this month"),
              "(" + col + " >= '2024-05-01' and " + col + " < '2024-06-01')");
}

TEST_F(ConditionBuilderTest, PreviousWeekOnDatetime) {
    const std::string col = "coalesce(`tabTask`.`started_at`, '0001-01-01 00:00:00.000000')";
    EXPECT_EQ(build("started_at", "previous", "1 week"),
              "(" + col + " >= '2024-05-06 00:00:00.000000' and " + col + " < '2024-05-13 00:00:00.000000')");
    EXPECT_THROW(build("started_at", "next", "2 weeks"), strata::ValidationError);
}

TEST_F(ConditionBuilderTest, DateAndTimeValuesAreNormalized) {
    EXPECT_EQ(build("due_date", "=", "2024-05-15 10:00"), "`tabTask`.`due_date` = '2024-05-15'");
    EXPECT_EQ(build("due_date", "=", ""),
              "coalesce(`tabTask`.`due_date`, '0001-01-01') = '0001-01-01'");
    EXPECT_EQ(build("start_time", "=", "09:30"), "`tabTask`.`start_time` = '09:30:00.000000'");
    EXPECT_THROW(build("due_date", "=", "not a date"), strata::DataError);
    EXPECT_THROW(build("start_time", "=", "9:00"), strata::DataError);
}

TEST_F(ConditionBuilderTest, AuditColumnComparisonUsesSentinel) {
    EXPECT_EQ(build("modified", ">", "2024-05-01"),
              "coalesce(`tabTask`.`modified`, '0001-01-01 00:00:00.000000') > '2024-05-01'");
}

TEST_F(ConditionBuilderTest, LikeEscapesWildcardsLiterally) {
    EXPECT_EQ(build("subject", "like", "50%"), "`tabTask`.`subject` like '50\\\\%'");
    EXPECT_EQ(build("subject", "not like", "x"), "coalesce(`tabTask`.`subject`, '') not like 'x'");
}

TEST_F(ConditionBuilderTest, IsSetAndNotSet) {
    EXPECT_EQ(build("subject", "is", "set"), "coalesce(`tabTask`.`subject`, '') != ''");
    EXPECT_EQ(build("subject", "is", "Not Set"), "coalesce(`tabTask`.`subject`, '') = ''");
    EXPECT_THROW(build("subject", "is", "maybe"), strata::ValidationError);
}

TEST_F(ConditionBuilderTest, ColumnReference) {
    EXPECT_EQ(build("modified", ">", json{{"column", "creation"}}),
              "`tabTask`.`modified` > `tabTask`.`creation`");
    EXPECT_THROW(build("modified", "between", json{{"column", "creation"}}), strata::DataError);
}

TEST_F(ConditionBuilderTest, DescendantsAndAncestors) {
    EXPECT_EQ(build("territory", "descendants of", "Europe"), "`tabTask`.`territory` in ('Germany')");
    EXPECT_EQ(build("territory", "not descendants of", "All"),
              "coalesce(`tabTask`.`territory`, '') not in ('Europe', 'Germany', 'Asia', 'Japan')");
    EXPECT_EQ(build("territory", "ancestors of", "Germany"), "`tabTask`.`territory` in ('Europe', 'All')");
}

TEST_F(ConditionBuilderTest, AnchorWithoutAncestorsMatchesNothing) {
    EXPECT_EQ(build("territory", "ancestors of", "All"), "`tabTask`.`territory` in ('')");
    EXPECT_EQ(build("territory", "descendants of", "Atlantis"), "`tabTask`.`territory` in ('')");
}

TEST_F(ConditionBuilderTest, HierarchyNeedsProvider) {
    ConditionBuilder flat(catalog, mariadb);
    auto f = FilterParser("Task").fromArray(json::array({"territory", "descendants of", "Europe"}));
    EXPECT_THROW(flat.build(f), strata::ValidationError);
}

TEST_F(ConditionBuilderTest, PostgresCastsIdAndUsesIlike) {
    ConditionBuilder pg(catalog, postgres, &catalog, strata::test::fixedToday);
    auto parser = FilterParser("Task");
    EXPECT_EQ(pg.build(parser.fromArray(json::array({"name", "=", "T-1"}))),
              "cast(`tabTask`.`name` as varchar) = 'T-1'");
    EXPECT_EQ(pg.build(parser.fromArray(json::array({"subject", "like", "50%"}))),
              "`tabTask`.`subject` ilike '50\\%'");
    EXPECT_EQ(pg.build(parser.fromArray(json::array({"name", "in", json::array()}))),
              "cast(`tabTask`.`name` as varchar) in ('')");
}

TEST_F(ConditionBuilderTest, UnknownDoctypeIsRejected) {
    EXPECT_THROW(build("x", "=", 1, "Nope"), strata::ValidationError);
}
