#include <gtest/gtest.h>
#include "query/json_catalog.h"
#include "query/permission_clause_builder.h"
#include "utils/errors.h"
#include "test_catalog.h"

using namespace strata::query;

class PermissionClauseTest : public ::testing::Test {
protected:
    JsonCatalog catalog{strata::test::sampleCatalog()};
    MariaDBDialect dialect;
    PermissionHookRegistry hooks;

    std::string build(const std::string& doctype, const std::string& user,
                      bool strict = false, const std::string& reference = "",
                      bool* share_only = nullptr) {
        PermissionClauseBuilder builder(catalog, catalog, dialect, &hooks);
        PermissionClauseBuilder::Options options;
        options.user = user;
        options.reference_doctype = reference;
        options.strict_user_permissions = strict;
        return builder.build(doctype, options, share_only);
    }
};

TEST_F(PermissionClauseTest, FullReadIsUnrestricted) {
    EXPECT_EQ(build("Task", "jane@example.com"), "");
    EXPECT_EQ(build("Task", JsonCatalog::kAdministrator), "");
}

TEST_F(PermissionClauseTest, OwnerRestrictedRole) {
    EXPECT_EQ(build("Task", "owen@example.com"), "((`tabTask`.`owner` = 'owen@example.com'))");
}

TEST_F(PermissionClauseTest, HookConditionsAreAnded) {
    hooks.add("Task", [](const std::string&) { return std::string("`tabTask`.`status` != 'Cancelled'"); });
    hooks.add("Task", [](const std::string&) { return std::string(); });
    hooks.add("Project", [](const std::string&) { return std::string("1=0"); });

    EXPECT_EQ(build("Task", "owen@example.com"),
              "((`tabTask`.`owner` = 'owen@example.com')) and `tabTask`.`status` != 'Cancelled'");
    EXPECT_EQ(build("Task", "jane@example.com"), "`tabTask`.`status` != 'Cancelled'");
}

TEST_F(PermissionClauseTest, UserPermissionGroupsAreAnded) {
    EXPECT_EQ(build("Task", "pat@example.com"),
              "(((coalesce(`tabTask`.`project`, '')='' or `tabTask`.`project` in ('P-1', 'P-2')) and "
              "(coalesce(`tabTask`.`territory`, '')='' or `tabTask`.`territory` in ('Europe'))))");
}

TEST_F(PermissionClauseTest, StrictModeDropsEmptyLinkBypass) {
    EXPECT_EQ(build("Task", "pat@example.com", true),
              "(((`tabTask`.`project` in ('P-1', 'P-2')) and (`tabTask`.`territory` in ('Europe'))))");
}

TEST_F(PermissionClauseTest, ReferenceDoctypeSelectsApplicableGrants) {
    EXPECT_EQ(build("Project", "pat@example.com", true),
              "(((`tabProject`.`territory` in ('Europe')) and (`tabProject`.`name` in ('P-1'))))");
    EXPECT_EQ(build("Project", "pat@example.com", true, "Invoice"),
              "(((`tabProject`.`territory` in ('Europe')) and (`tabProject`.`name` in ('P-1', 'P-3'))))");
}

TEST_F(PermissionClauseTest, ShareOnlyAccess) {
    bool share_only = false;
    EXPECT_EQ(build("Task", "guest@example.com", false, "", &share_only),
              "`tabTask`.name in ('T-0001', 'T-0002')");
    EXPECT_TRUE(share_only);
}

TEST_F(PermissionClauseTest, ShareOnlyAccessKeepsHookConditions) {
    hooks.add("Task", [](const std::string&) { return std::string("`tabTask`.`status` != 'Cancelled'"); });
    bool share_only = false;
    EXPECT_EQ(build("Task", "guest@example.com", false, "", &share_only),
              "`tabTask`.name in ('T-0001', 'T-0002') and `tabTask`.`status` != 'Cancelled'");
    EXPECT_TRUE(share_only);
}

TEST_F(PermissionClauseTest, RecordGrantsWithoutRoleRead) {
    auto data = strata::test::sampleCatalog();
    data["user_permissions"]["kim@example.com"]["Task"] = nlohmann::json::array({"T-0001"});
    data["shared"]["kim@example.com"]["Task"] = nlohmann::json::array({"T-0009"});
    JsonCatalog with_kim(data);

    PermissionClauseBuilder builder(with_kim, with_kim, dialect, &hooks);
    PermissionClauseBuilder::Options options;
    options.user = "kim@example.com";
    bool share_only = true;
    EXPECT_EQ(builder.build("Task", options, &share_only),
              "((((coalesce(`tabTask`.`name`, '')='' or `tabTask`.`name` in ('T-0001'))))) or "
              "(`tabTask`.name in ('T-0009'))");
    EXPECT_FALSE(share_only);

    options.strict_user_permissions = true;
    EXPECT_EQ(builder.build("Task", options),
              "((((`tabTask`.`name` in ('T-0001'))))) or (`tabTask`.name in ('T-0009'))");
}

TEST_F(PermissionClauseTest, SharesAreOredOnTop) {
    hooks.add("Task", [](const std::string& user) {
        return user == "sue@example.com" ? std::string("`tabTask`.`status` != 'Cancelled'") : std::string();
    });
    bool share_only = true;
    EXPECT_EQ(build("Task", "sue@example.com", false, "", &share_only),
              "(`tabTask`.`status` != 'Cancelled') or (`tabTask`.name in ('T-0009'))");
    EXPECT_FALSE(share_only);
}

TEST_F(PermissionClauseTest, NoAccessAtAllRaises) {
    try {
        build("Task", "nora@example.com");
        FAIL() << "expected PermissionError";
    } catch (const strata::PermissionError& e) {
        EXPECT_EQ(e.doctype(), "Task");
        EXPECT_STREQ(e.what(), "No permission to read Task");
    }
}

TEST_F(PermissionClauseTest, ChildTablesSkipShareOnlyPath) {
    EXPECT_EQ(build("Task Item", "nora@example.com"), "");
}

TEST_F(PermissionClauseTest, PostgresCastsShareCondition) {
    PostgresDialect pg;
    PermissionClauseBuilder builder(catalog, catalog, pg);
    PermissionClauseBuilder::Options options;
    options.user = "guest@example.com";
    EXPECT_EQ(builder.build("Task", options), "cast(`tabTask`.name as varchar) in ('T-0001', 'T-0002')");
}

TEST(PermissionHelpersTest, OwnerConstraint) {
    RolePermissions perms;
    perms.read = true;
    EXPECT_FALSE(requiresOwnerConstraint(perms));

    perms.has_if_owner_enabled = true;
    perms.if_owner = {"read"};
    EXPECT_TRUE(requiresOwnerConstraint(perms));

    perms.select = true;
    EXPECT_FALSE(requiresOwnerConstraint(perms));
}

TEST(PermissionHelpersTest, AnyUserPermission) {
    JsonCatalog catalog(strata::test::sampleCatalog());
    EXPECT_TRUE(hasAnyUserPermissionForDoctype(catalog, "Project", "pat@example.com", "Task"));
    EXPECT_TRUE(hasAnyUserPermissionForDoctype(catalog, "Territory", "pat@example.com", "Invoice"));
    EXPECT_FALSE(hasAnyUserPermissionForDoctype(catalog, "User", "pat@example.com", "Task"));
    EXPECT_FALSE(hasAnyUserPermissionForDoctype(catalog, "Project", "jane@example.com", "Task"));
}

TEST(PermissionHelpersTest, ParentPermission) {
    JsonCatalog catalog(strata::test::sampleCatalog());
    EXPECT_NO_THROW(checkParentPermission(catalog, "Task", "Task Item", "jane@example.com"));
    EXPECT_THROW(checkParentPermission(catalog, "", "Task Item", "jane@example.com"), strata::PermissionError);
    EXPECT_THROW(checkParentPermission(catalog, "Project", "Task Item", "jane@example.com"), strata::PermissionError);
    EXPECT_THROW(checkParentPermission(catalog, "Task", "Task Item", "nora@example.com"), strata::PermissionError);
}
