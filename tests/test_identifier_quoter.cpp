#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "IdentifierQuoter.hpp"

using namespace schemaforge;

class IdentifierQuoterTest : public ::testing::Test {
protected:
    IdentifierQuoter postgres_{Dialect::PostgreSQL};
    IdentifierQuoter mysql_{Dialect::MySQL};
    IdentifierQuoter sqlite_{Dialect::SQLite};
    IdentifierQuoter mssql_{Dialect::MsSql};
};

// Plain identifiers pass through untouched
TEST_F(IdentifierQuoterTest, PlainIdentifierUnchanged) {
    EXPECT_EQ(postgres_.quote("users"), "users");
    EXPECT_EQ(mysql_.quote("user_id"), "user_id");
    EXPECT_EQ(sqlite_.quote("_private"), "_private");
    EXPECT_EQ(mssql_.quote("Orders2024"), "Orders2024");
}

TEST_F(IdentifierQuoterTest, ReservedWordQuotedPerDialect) {
    EXPECT_EQ(postgres_.quote("select"), "\"select\"");
    EXPECT_EQ(sqlite_.quote("select"), "\"select\"");
    EXPECT_EQ(mysql_.quote("select"), "`select`");
    EXPECT_EQ(mssql_.quote("select"), "[select]");
}

TEST_F(IdentifierQuoterTest, ReservedWordMatchIsCaseInsensitive) {
    EXPECT_EQ(postgres_.quote("Order"), "\"Order\"");
    EXPECT_EQ(postgres_.quote("USER"), "\"USER\"");
    EXPECT_TRUE(IdentifierQuoter::isReservedKeyword("policy"));
    EXPECT_FALSE(IdentifierQuoter::isReservedKeyword("customers"));
}

TEST_F(IdentifierQuoterTest, SpecialCharactersForceQuoting) {
    EXPECT_EQ(postgres_.quote("my table"), "\"my table\"");
    EXPECT_EQ(postgres_.quote("1st_column"), "\"1st_column\"");
    EXPECT_EQ(mysql_.quote("price-usd"), "`price-usd`");
    EXPECT_EQ(postgres_.quoteSegment(""), "\"\"");
}

TEST_F(IdentifierQuoterTest, EmbeddedQuoteCharactersDoubled) {
    EXPECT_EQ(postgres_.quote("say\"hi"), "\"say\"\"hi\"");
    EXPECT_EQ(mysql_.quote("back`tick"), "`back``tick`");
    EXPECT_EQ(mssql_.quote("odd]name"), "[odd]]name]");
}

// Dotted names are quoted one segment at a time
TEST_F(IdentifierQuoterTest, DottedNameQuotedPerSegment) {
    EXPECT_EQ(postgres_.quote("app.users"), "app.users");
    EXPECT_EQ(postgres_.quote("app.user"), "app.\"user\"");
    EXPECT_EQ(mssql_.quote("dbo.table"), "dbo.[table]");
}

TEST_F(IdentifierQuoterTest, QualifyWithAndWithoutSchema) {
    EXPECT_EQ(postgres_.qualify(std::string("public"), "orders"), "\"public\".orders");
    EXPECT_EQ(postgres_.qualify(std::nullopt, "orders"), "orders");
    EXPECT_EQ(postgres_.qualify(std::string(""), "orders"), "orders");
}

TEST_F(IdentifierQuoterTest, QuoteAlwaysWrapsEverySegment) {
    EXPECT_EQ(postgres_.quoteAlways("users"), "\"users\"");
    EXPECT_EQ(mysql_.quoteAlways("users"), "`users`");
    EXPECT_EQ(mssql_.quoteAlways("users"), "[users]");
}

TEST_F(IdentifierQuoterTest, QuotingIsIdempotentAfterUnquote) {
    for (const std::string name : {"users", "select", "my table", "say\"hi", "app.user"}) {
        std::string quoted = postgres_.quote(name);
        EXPECT_EQ(postgres_.quote(postgres_.unquote(quoted)), quoted) << name;
    }
}

TEST_F(IdentifierQuoterTest, UnquoteReversesQuote) {
    EXPECT_EQ(postgres_.unquote("\"select\""), "select");
    EXPECT_EQ(mysql_.unquote("`back``tick`"), "back`tick");
    EXPECT_EQ(mssql_.unquote("dbo.[odd]]name]"), "dbo.odd]name");
    EXPECT_EQ(postgres_.unquote("plain"), "plain");
}

TEST_F(IdentifierQuoterTest, UnquoteKeepsDotsInsideQuotedSegment) {
    EXPECT_EQ(postgres_.unquote("\"a.b\".c"), "a.b.c");
}

TEST_F(IdentifierQuoterTest, EscapeStringLiteralDoublesSingleQuotes) {
    EXPECT_EQ(escapeStringLiteral("O'Brien"), "O''Brien");
    EXPECT_EQ(escapeStringLiteral("plain"), "plain");
}
