#include <gtest/gtest.h>
#include "CapabilityMatrix.hpp"

using namespace schemaforge;

class CapabilityMatrixTest : public ::testing::Test {};

TEST_F(CapabilityMatrixTest, PostgreSQLSupportsEverything) {
    const auto& caps = capabilitiesFor(Dialect::PostgreSQL);

    EXPECT_EQ(caps.dialect, Dialect::PostgreSQL);
    EXPECT_TRUE(caps.supportsBeforeTrigger);
    EXPECT_TRUE(caps.supportsInsteadOfTrigger);
    EXPECT_TRUE(caps.requiresFunctionForTrigger);
    EXPECT_TRUE(caps.supportsStatementLevel);
    EXPECT_TRUE(caps.supportsTruncateTrigger);
    EXPECT_TRUE(caps.supportsRowSecurity);
    EXPECT_TRUE(caps.supportsReturnsTable);
    EXPECT_TRUE(caps.supportsParallel);
    EXPECT_EQ(caps.identifierQuoteChar, '"');
    EXPECT_EQ(caps.autoIncrementStyle, AutoIncrementStyle::TypeName);
    EXPECT_EQ(caps.autoIncrementKeyword, "SERIAL");
}

TEST_F(CapabilityMatrixTest, MySQLRestrictions) {
    const auto& caps = capabilitiesFor(Dialect::MySQL);

    EXPECT_TRUE(caps.supportsBeforeTrigger);
    EXPECT_FALSE(caps.supportsInsteadOfTrigger);
    EXPECT_FALSE(caps.supportsStatementLevel);
    EXPECT_FALSE(caps.supportsMultipleTriggerEvents);
    EXPECT_FALSE(caps.supportsRowSecurity);
    EXPECT_FALSE(caps.supportsCreateOrReplaceFunction);
    EXPECT_TRUE(caps.supportsFunctions);
    EXPECT_FALSE(caps.supportsOutParameters);
    EXPECT_EQ(caps.identifierQuoteChar, '`');
    EXPECT_EQ(caps.identifierCloseChar, '`');
    EXPECT_EQ(caps.autoIncrementKeyword, "AUTO_INCREMENT");
}

TEST_F(CapabilityMatrixTest, SQLiteHasNoFunctionsOrAlterColumn) {
    const auto& caps = capabilitiesFor(Dialect::SQLite);

    EXPECT_FALSE(caps.supportsFunctions);
    EXPECT_FALSE(caps.supportsAlterColumn);
    EXPECT_TRUE(caps.supportsWhenCondition);
    EXPECT_TRUE(caps.supportsInsteadOfTrigger);
    EXPECT_EQ(caps.autoIncrementStyle, AutoIncrementStyle::Suffix);
    EXPECT_EQ(caps.autoIncrementKeyword, "AUTOINCREMENT");
}

TEST_F(CapabilityMatrixTest, MsSqlHasNoBeforeTriggers) {
    const auto& caps = capabilitiesFor(Dialect::MsSql);

    EXPECT_FALSE(caps.supportsBeforeTrigger);
    EXPECT_TRUE(caps.supportsInsteadOfTrigger);
    EXPECT_TRUE(caps.supportsMultipleTriggerEvents);
    EXPECT_TRUE(caps.supportsCreateOrReplaceFunction);
    EXPECT_EQ(caps.identifierQuoteChar, '[');
    EXPECT_EQ(caps.identifierCloseChar, ']');
    EXPECT_EQ(caps.autoIncrementKeyword, "IDENTITY(1,1)");
}

// Only PostgreSQL has row-level security
TEST_F(CapabilityMatrixTest, RowSecurityIsPostgreSQLOnly) {
    for (auto dialect : {Dialect::MySQL, Dialect::SQLite, Dialect::MsSql}) {
        EXPECT_FALSE(capabilitiesFor(dialect).supportsRowSecurity) << dialectToString(dialect);
    }
}

TEST_F(CapabilityMatrixTest, RowsAreStable) {
    EXPECT_EQ(&capabilitiesFor(Dialect::MySQL), &capabilitiesFor(Dialect::MySQL));
}
