#include <gtest/gtest.h>
#include "query/field_resolver.h"
#include "query/json_catalog.h"
#include "utils/errors.h"
#include "test_catalog.h"

using namespace strata::query;
using nlohmann::json;

class FieldResolverTest : public ::testing::Test {
protected:
    JsonCatalog catalog{strata::test::sampleCatalog()};
    std::vector<std::string> checked;

    FieldResolver makeResolver() {
        return FieldResolver("Task", catalog, [this](const std::string& doctype) { checked.push_back(doctype); });
    }
};

TEST_F(FieldResolverTest, RewritesDottedFields) {
    auto resolver = makeResolver();
    std::vector<std::string> fields = {
        "project.title as project_title",
        "items.qty",
        "tabTask Item.item_code",
        "status",
        "count(name)",
    };
    resolver.resolveDottedFields(fields);

    EXPECT_EQ(fields[0], "`tabProject`.`title` as project_title");
    EXPECT_EQ(fields[1], "`tabTask Item`.`qty`");
    EXPECT_EQ(fields[2], "`tabTask Item`.`item_code`");
    EXPECT_EQ(fields[3], "status");
    EXPECT_EQ(fields[4], "count(name)");

    ASSERT_EQ(resolver.linkTables().size(), 1u);
    EXPECT_EQ(resolver.linkTables()[0].doctype, "Project");
    EXPECT_EQ(resolver.linkTables()[0].fieldname, "project");
    EXPECT_EQ(checked, std::vector<std::string>{"Project"});
}

TEST_F(FieldResolverTest, DottedFieldMustFollowALink) {
    auto resolver = makeResolver();
    std::vector<std::string> fields = {"status.title"};
    EXPECT_THROW(resolver.resolveDottedFields(fields), strata::DataError);

    std::vector<std::string> bad_alias = {"project.title as x; drop"};
    EXPECT_THROW(resolver.resolveDottedFields(bad_alias), strata::DataError);
}

TEST_F(FieldResolverTest, ExtractsChildTables) {
    auto resolver = makeResolver();
    std::vector<std::string> fields = {"project.title", "items.qty", "`tabTask`.`status`", "count(`tabFoo`.name)"};
    resolver.resolveDottedFields(fields);
    resolver.extractTables(fields);

    EXPECT_EQ(resolver.tables(), (std::vector<std::string>{"`tabTask`", "`tabTask Item`"}));
    EXPECT_EQ(resolver.allTables(), (std::vector<std::string>{"`tabTask`", "`tabTask Item`", "`tabProject`"}));
    EXPECT_EQ(checked, (std::vector<std::string>{"Project", "Task Item"}));
}

TEST_F(FieldResolverTest, AppendTableValidatesAndDeduplicates) {
    auto resolver = makeResolver();
    resolver.appendTable("`tabTask Item`");
    resolver.appendTable("`tabTask Item`");
    EXPECT_EQ(resolver.tables().size(), 2u);
    EXPECT_EQ(checked.size(), 1u);

    EXPECT_THROW(resolver.appendTable("tabTask Item"), strata::DataError);
    EXPECT_THROW(resolver.appendTable("`users`"), strata::DataError);
}

TEST_F(FieldResolverTest, ReadCheckFailurePropagates) {
    FieldResolver resolver("Task", catalog, [](const std::string& doctype) {
        throw strata::PermissionError(doctype, "No permission to read " + doctype);
    });
    std::vector<std::string> fields = {"project.title"};
    EXPECT_THROW(resolver.resolveDottedFields(fields), strata::PermissionError);
}

TEST_F(FieldResolverTest, RemovesMissingOptionalColumns) {
    auto resolver = makeResolver();
    std::vector<std::string> fields = {"name", "_user_tags", "_comments"};
    FilterList filters = FilterParser("Task").parse(json::array({
        json::array({"_seen", "like", "%jane%"}),
        json::array({"status", "=", "Open"}),
    }));

    resolver.removeOptionalColumns(fields, filters, catalog.getTableColumns("Task"));

    EXPECT_EQ(fields, (std::vector<std::string>{"name", "_comments"}));
    ASSERT_EQ(filters.size(), 1u);
    EXPECT_EQ(std::get<Filter>(filters[0]).fieldname, "status");
}

TEST_F(FieldResolverTest, QualifiesOnlyWhenJoined) {
    auto resolver = makeResolver();
    std::vector<std::string> fields = {"status", "count(*)"};
    resolver.qualifyFields(fields);
    EXPECT_EQ(fields[0], "status");

    resolver.appendTable("`tabTask Item`");
    fields = {"status", "count(*)", "`tabTask Item`.`qty`"};
    resolver.qualifyFields(fields);
    EXPECT_EQ(fields, (std::vector<std::string>{"`tabTask`.status", "count(*)", "`tabTask Item`.`qty`"}));
}

TEST_F(FieldResolverTest, WrapsBareIdentifiers) {
    auto wrapped = FieldResolver::wrapFields(
        {"name", "status as s", "`tabTask`.`subject`", "count(*)", "*", "distinct name"});
    EXPECT_EQ(wrapped, (std::vector<std::string>{
        "`name`", "`status` as s", "`tabTask`.`subject`", "count(*)", "*", "distinct name"}));

    EXPECT_THROW(FieldResolver::wrapFields({"status as s as t"}), strata::DataError);
}

TEST_F(FieldResolverTest, FromClauseJoinsChildAndLinkTables) {
    auto resolver = makeResolver();
    resolver.appendTable("`tabTask Item`");
    resolver.appendLinkTable("Project", "project");

    MariaDBDialect mariadb;
    EXPECT_EQ(resolver.fromClause("left join", mariadb),
              "`tabTask` left join `tabTask Item` on (`tabTask Item`.parenttype = 'Task' and "
              "`tabTask Item`.parent = `tabTask`.name) "
              "left join `tabProject` on (`tabProject`.`name` = `tabTask`.`project`)");

    PostgresDialect postgres;
    EXPECT_EQ(resolver.fromClause("inner join", postgres),
              "`tabTask` inner join `tabTask Item` on (`tabTask Item`.parenttype = 'Task' and "
              "`tabTask Item`.parent = cast(`tabTask`.name as varchar)) "
              "inner join `tabProject` on (`tabProject`.`name` = `tabTask`.`project`)");
}

TEST(OptionalFieldsTest, KnownOptionalColumns) {
    EXPECT_EQ(optionalFields(),
              (std::vector<std::string>{"_user_tags", "_comments", "_assign", "_liked_by", "_seen"}));
}
