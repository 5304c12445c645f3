#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "PolicyManager.hpp"

using namespace schemaforge;
using ::testing::HasSubstr;
using ::testing::Not;

class PolicyManagerTest : public ::testing::Test {
protected:
    PolicyManager postgres_{Dialect::PostgreSQL};
    PolicyManager mysql_{Dialect::MySQL};

    static PolicySpec readPolicy() {
        return PolicySpec("user_read", "users")
            .withCommand(PolicyCommand::Select)
            .withUsing("user_id = current_user_id()");
    }
};

// CREATE POLICY
TEST_F(PolicyManagerTest, SelectPolicyForPublic) {
    auto result = postgres_.buildCreatePolicy(readPolicy());

    ASSERT_TRUE(result.ok()) << result.error().message();
    const auto& sql = result.value();
    EXPECT_THAT(sql, HasSubstr("CREATE POLICY user_read ON users"));
    EXPECT_THAT(sql, HasSubstr("FOR SELECT"));
    EXPECT_THAT(sql, HasSubstr("TO PUBLIC"));
    EXPECT_THAT(sql, HasSubstr("USING (user_id = current_user_id())"));
    EXPECT_THAT(sql, Not(HasSubstr("WITH CHECK")));
}

TEST_F(PolicyManagerTest, FullPolicyStatement) {
    auto spec = PolicySpec("tenant_isolation", "orders")
                    .withSchema("app")
                    .withType(PolicyType::Restrictive)
                    .withRoles({"app_user", "public"})
                    .withUsing("tenant_id = current_setting('app.tenant')::int")
                    .withCheck("tenant_id = current_setting('app.tenant')::int");

    auto result = postgres_.buildCreatePolicy(spec);

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value(),
              "CREATE POLICY tenant_isolation ON app.orders AS RESTRICTIVE TO app_user, PUBLIC"
              " USING (tenant_id = current_setting('app.tenant')::int)"
              " WITH CHECK (tenant_id = current_setting('app.tenant')::int)");
}

TEST_F(PolicyManagerTest, AllCommandOmitsForClause) {
    auto spec = PolicySpec("owner_all", "documents").withUsing("owner = current_user");

    auto result = postgres_.buildCreatePolicy(spec);

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value(),
              "CREATE POLICY owner_all ON documents TO PUBLIC USING (owner = current_user)");
}

TEST_F(PolicyManagerTest, ReservedNamesAreQuoted) {
    auto spec = PolicySpec("select", "user")
                    .withCommand(PolicyCommand::Select)
                    .withRole("reader")
                    .withUsing("true");

    auto result = postgres_.buildCreatePolicy(spec);

    ASSERT_TRUE(result.ok());
    EXPECT_THAT(result.value(), HasSubstr("CREATE POLICY \"select\" ON \"user\" FOR SELECT TO reader"));
}

// Validation
TEST_F(PolicyManagerTest, InsertWithoutCheckRejected) {
    auto spec = PolicySpec("p", "t").withCommand(PolicyCommand::Insert).withUsing("true");

    auto result = postgres_.validate(spec);

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, PolicyError::Code::InsertRequiresCheck);
}

TEST_F(PolicyManagerTest, InsertWithCheckAccepted) {
    auto spec = PolicySpec("p", "t").withCommand(PolicyCommand::Insert).withCheck("owner = current_user");

    auto result = postgres_.buildCreatePolicy(spec);

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value(), "CREATE POLICY p ON t FOR INSERT TO PUBLIC WITH CHECK (owner = current_user)");
}

TEST_F(PolicyManagerTest, EmptyNameRejected) {
    auto result = postgres_.validate(PolicySpec("  ", "t").withUsing("true"));

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, PolicyError::Code::EmptyName);
}

TEST_F(PolicyManagerTest, EmptyTableRejected) {
    auto result = postgres_.validate(PolicySpec("p", "").withUsing("true"));

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, PolicyError::Code::EmptyTable);
}

TEST_F(PolicyManagerTest, MissingExpressionRejected) {
    EXPECT_EQ(postgres_.validate(PolicySpec("p", "t")).error().code, PolicyError::Code::NoExpression);
    EXPECT_EQ(postgres_.validate(PolicySpec("p", "t").withCommand(PolicyCommand::Select)).error().code,
              PolicyError::Code::NoExpression);
    EXPECT_EQ(postgres_.validate(PolicySpec("p", "t").withCommand(PolicyCommand::Update)).error().code,
              PolicyError::Code::NoExpression);
}

TEST_F(PolicyManagerTest, BlankExpressionRejected) {
    auto result = postgres_.validate(PolicySpec("p", "t").withUsing("   "));

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, PolicyError::Code::EmptyExpression);
}

TEST_F(PolicyManagerTest, SelectAndDeleteRejectCheck) {
    auto select = PolicySpec("p", "t").withCommand(PolicyCommand::Select).withUsing("true").withCheck("true");
    auto remove = PolicySpec("p", "t").withCommand(PolicyCommand::Delete).withUsing("true").withCheck("true");

    EXPECT_EQ(postgres_.validate(select).error().code, PolicyError::Code::SelectDeleteNoCheck);
    EXPECT_EQ(postgres_.validate(remove).error().code, PolicyError::Code::SelectDeleteNoCheck);
}

TEST_F(PolicyManagerTest, UpdateAcceptsEitherExpression) {
    EXPECT_TRUE(postgres_.validate(PolicySpec("p", "t").withCommand(PolicyCommand::Update).withUsing("true")).ok());
    EXPECT_TRUE(postgres_.validate(PolicySpec("p", "t").withCommand(PolicyCommand::Update).withCheck("true")).ok());
}

TEST_F(PolicyManagerTest, NonPostgreSQLDialectsRejectPolicies) {
    auto result = mysql_.buildCreatePolicy(readPolicy());

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, PolicyError::Code::NotSupported);
    EXPECT_THAT(result.error().message(), HasSubstr("MySQL"));

    EXPECT_FALSE(PolicyManager(Dialect::SQLite).validate(readPolicy()).ok());
    EXPECT_FALSE(PolicyManager(Dialect::MsSql).validate(readPolicy()).ok());
}

TEST_F(PolicyManagerTest, ErrorMessages) {
    EXPECT_EQ(PolicyError(PolicyError::Code::InsertRequiresCheck).message(),
              "INSERT policies require a WITH CHECK expression");
    EXPECT_EQ(PolicyError(PolicyError::Code::NotSupported, "Row-level security policies on MySQL").message(),
              "Row-level security policies on MySQL is not supported");
}

// Row-level security switches
TEST_F(PolicyManagerTest, RowSecuritySwitches) {
    EXPECT_EQ(postgres_.buildEnableRls("users").value(), "ALTER TABLE users ENABLE ROW LEVEL SECURITY");
    EXPECT_EQ(postgres_.buildDisableRls("users", std::string("app")).value(),
              "ALTER TABLE app.users DISABLE ROW LEVEL SECURITY");
    EXPECT_EQ(postgres_.buildForceRls("users").value(), "ALTER TABLE users FORCE ROW LEVEL SECURITY");
    EXPECT_EQ(postgres_.buildNoForceRls("users").value(), "ALTER TABLE users NO FORCE ROW LEVEL SECURITY");
}

TEST_F(PolicyManagerTest, RowSecurityRejectsEmptyTableAndOtherDialects) {
    EXPECT_EQ(postgres_.buildEnableRls("").error().code, PolicyError::Code::EmptyTable);
    EXPECT_EQ(mysql_.buildEnableRls("users").error().code, PolicyError::Code::NotSupported);
}

// Policy maintenance
TEST_F(PolicyManagerTest, DropPolicy) {
    EXPECT_EQ(postgres_.buildDropPolicy("user_read", "users", std::nullopt, true).value(),
              "DROP POLICY IF EXISTS user_read ON users");
    EXPECT_EQ(postgres_.buildDropPolicy("user_read", "users", std::string("app"), false).value(),
              "DROP POLICY user_read ON app.users");
    EXPECT_EQ(postgres_.buildDropPolicy("", "users", std::nullopt, true).error().code,
              PolicyError::Code::EmptyName);
}

TEST_F(PolicyManagerTest, RenamePolicy) {
    EXPECT_EQ(postgres_.buildRenamePolicy("old_policy", "new_policy", "users").value(),
              "ALTER POLICY old_policy ON users RENAME TO new_policy");
    EXPECT_EQ(postgres_.buildRenamePolicy("old_policy", " ", "users").error().code,
              PolicyError::Code::EmptyName);
}

TEST_F(PolicyManagerTest, AlterPolicyRoles) {
    EXPECT_EQ(postgres_.buildAlterPolicyRoles("p", "users", std::nullopt, {"admin", "auditor"}).value(),
              "ALTER POLICY p ON users TO admin, auditor");
    EXPECT_EQ(postgres_.buildAlterPolicyRoles("p", "users", std::nullopt, {}).value(),
              "ALTER POLICY p ON users TO PUBLIC");
}

TEST_F(PolicyManagerTest, AlterPolicyExpressions) {
    EXPECT_EQ(postgres_.buildAlterPolicyUsing("p", "users", std::nullopt, std::string("id > 0")).value(),
              "ALTER POLICY p ON users USING (id > 0)");
    EXPECT_EQ(postgres_.buildAlterPolicyCheck("p", "users", std::nullopt, std::nullopt).value(),
              "ALTER POLICY p ON users WITH CHECK (true)");
    EXPECT_EQ(postgres_.buildAlterPolicyUsing("p", "users", std::nullopt, std::string("")).error().code,
              PolicyError::Code::EmptyExpression);
}

TEST_F(PolicyManagerTest, ParsePolicyEnums) {
    EXPECT_EQ(parsePolicyCommand("select"), PolicyCommand::Select);
    EXPECT_EQ(parsePolicyType("Restrictive"), PolicyType::Restrictive);
    EXPECT_THROW(parsePolicyCommand("merge"), std::invalid_argument);
}
