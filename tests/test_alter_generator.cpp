#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "AlterGenerator.hpp"
#include <stdexcept>

using namespace schemaforge;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::StartsWith;

class AlterGeneratorTest : public ::testing::Test {
protected:
    static TableDesign users(Dialect dialect) {
        return TableDesign("users", dialect)
            .withColumn(ColumnDesign("id", "INTEGER").primaryKey())
            .withColumn(ColumnDesign("email", "VARCHAR").withLength(255));
    }

    static ColumnDesign& column(TableDesign& design, const std::string& name) {
        for (auto& c : design.columns) {
            if (c.name == name) return c;
        }
        throw std::out_of_range(name);
    }

    static TableDesign orders(Dialect dialect) {
        return TableDesign("orders", dialect)
            .withColumn(ColumnDesign("id", "INTEGER").primaryKey())
            .withColumn(ColumnDesign("user_id", "INTEGER"));
    }

    static ForeignKeyDesign userFk() {
        return ForeignKeyDesign().withName("fk_user").column("user_id").references("users").referencedColumn("id");
    }
};

TEST_F(AlterGeneratorTest, IdenticalDesignsProduceNothing) {
    for (auto dialect : {Dialect::PostgreSQL, Dialect::MySQL, Dialect::SQLite, Dialect::MsSql}) {
        auto design = users(dialect).withIndex(IndexDesign("idx_email", {"email"}));
        EXPECT_TRUE(AlterGenerator::generateAlterTable(design, design).empty()) << dialectToString(dialect);
    }
}

TEST_F(AlterGeneratorTest, DropColumn) {
    auto original = users(Dialect::PostgreSQL);
    auto modified = TableDesign("users", Dialect::PostgreSQL).withColumn(ColumnDesign("id", "INTEGER").primaryKey());

    auto statements = AlterGenerator::generateAlterTable(original, modified);

    ASSERT_EQ(statements.size(), 1u);
    EXPECT_THAT(statements[0], HasSubstr("DROP COLUMN"));
    EXPECT_THAT(statements[0], HasSubstr("\"email\""));
    EXPECT_EQ(statements[0], "ALTER TABLE \"users\" DROP COLUMN \"email\";");
}

TEST_F(AlterGeneratorTest, AddColumnPerDialect) {
    auto original = users(Dialect::PostgreSQL);
    auto modified = users(Dialect::PostgreSQL).withColumn(ColumnDesign("age", "INTEGER").withDefault("0"));

    EXPECT_THAT(AlterGenerator::generateAlterTable(original, modified),
                ElementsAre("ALTER TABLE \"users\" ADD COLUMN \"age\" INTEGER DEFAULT 0;"));

    auto msOriginal = users(Dialect::MsSql);
    auto msModified = users(Dialect::MsSql).withColumn(ColumnDesign("age", "INTEGER"));

    EXPECT_THAT(AlterGenerator::generateAlterTable(msOriginal, msModified),
                ElementsAre("ALTER TABLE [users] ADD [age] INTEGER;"));
}

TEST_F(AlterGeneratorTest, MsSqlAddedColumnNamesItsDefault) {
    auto original = users(Dialect::MsSql);
    auto modified = users(Dialect::MsSql).withColumn(ColumnDesign("age", "INTEGER").withDefault("0"));

    EXPECT_THAT(AlterGenerator::generateAlterTable(original, modified),
                ElementsAre("ALTER TABLE [users] ADD [age] INTEGER CONSTRAINT [DF_users_age] DEFAULT 0;"));
}

TEST_F(AlterGeneratorTest, PostgreSQLColumnChanges) {
    auto original = users(Dialect::PostgreSQL);
    auto modified = users(Dialect::PostgreSQL);
    column(modified, "email").withLength(320).notNull().withDefault("''");

    auto statements = AlterGenerator::generateAlterTable(original, modified);

    EXPECT_THAT(statements,
                ElementsAre("ALTER TABLE \"users\" ALTER COLUMN \"email\" TYPE VARCHAR(320);",
                            "ALTER TABLE \"users\" ALTER COLUMN \"email\" SET NOT NULL;",
                            "ALTER TABLE \"users\" ALTER COLUMN \"email\" SET DEFAULT '';"));

    auto reverse = AlterGenerator::generateAlterTable(modified, original);
    EXPECT_THAT(reverse,
                ElementsAre("ALTER TABLE \"users\" ALTER COLUMN \"email\" TYPE VARCHAR(255);",
                            "ALTER TABLE \"users\" ALTER COLUMN \"email\" DROP NOT NULL;",
                            "ALTER TABLE \"users\" ALTER COLUMN \"email\" DROP DEFAULT;"));
}

TEST_F(AlterGeneratorTest, MySQLModifiesWholeColumn) {
    auto original = users(Dialect::MySQL);
    auto modified = users(Dialect::MySQL);
    column(modified, "email").withLength(320).notNull();

    EXPECT_THAT(AlterGenerator::generateAlterTable(original, modified),
                ElementsAre("ALTER TABLE `users` MODIFY COLUMN `email` VARCHAR(320) NOT NULL;"));
}

TEST_F(AlterGeneratorTest, MySQLModifyKeepsExistingKeys) {
    auto original = TableDesign("users", Dialect::MySQL)
                        .withColumn(ColumnDesign("id", "INT").primaryKey().autoIncrement())
                        .withColumn(ColumnDesign("email", "VARCHAR").withLength(255).unique());
    auto modified = TableDesign("users", Dialect::MySQL)
                        .withColumn(ColumnDesign("id", "BIGINT").primaryKey().autoIncrement())
                        .withColumn(ColumnDesign("email", "VARCHAR").withLength(200).unique());

    EXPECT_THAT(AlterGenerator::generateAlterTable(original, modified),
                ElementsAre("ALTER TABLE `users` MODIFY COLUMN `id` BIGINT NOT NULL AUTO_INCREMENT;",
                            "ALTER TABLE `users` MODIFY COLUMN `email` VARCHAR(200);"));
}

TEST_F(AlterGeneratorTest, SQLiteEmitsCommentsForColumnChanges) {
    auto original = users(Dialect::SQLite);
    auto modified = users(Dialect::SQLite);
    column(modified, "email").notNull();

    auto statements = AlterGenerator::generateAlterTable(original, modified);

    ASSERT_EQ(statements.size(), 2u);
    EXPECT_THAT(statements[0], StartsWith("-- SQLite does not support ALTER COLUMN"));
    EXPECT_THAT(statements[0], HasSubstr("\"email\""));
    EXPECT_THAT(statements[1], StartsWith("-- Consider recreating the table"));
}

TEST_F(AlterGeneratorTest, MsSqlColumnAndDefaultChanges) {
    auto original = users(Dialect::MsSql);
    auto modified = users(Dialect::MsSql);
    column(modified, "email").notNull().withDefault("'none'");

    EXPECT_THAT(AlterGenerator::generateAlterTable(original, modified),
                ElementsAre("ALTER TABLE [users] ALTER COLUMN [email] VARCHAR(255) NOT NULL;",
                            "ALTER TABLE [users] DROP CONSTRAINT IF EXISTS [DF_users_email];",
                            "ALTER TABLE [users] ADD CONSTRAINT [DF_users_email] DEFAULT 'none' FOR [email];"));
}

TEST_F(AlterGeneratorTest, UniqueFlagPerDialect) {
    auto original = users(Dialect::PostgreSQL);
    auto modified = users(Dialect::PostgreSQL);
    column(modified, "email").unique();

    EXPECT_THAT(AlterGenerator::generateAlterTable(original, modified),
                ElementsAre("ALTER TABLE \"users\" ADD CONSTRAINT \"users_email_unique\" UNIQUE (\"email\");"));
    EXPECT_THAT(AlterGenerator::generateAlterTable(modified, original),
                ElementsAre("ALTER TABLE \"users\" DROP CONSTRAINT IF EXISTS \"users_email_unique\";"));

    auto myOriginal = users(Dialect::MySQL);
    auto myModified = users(Dialect::MySQL);
    column(myModified, "email").unique();

    EXPECT_THAT(AlterGenerator::generateAlterTable(myOriginal, myModified),
                ElementsAre("CREATE UNIQUE INDEX `users_email_unique` ON `users` (`email`);"));
    EXPECT_THAT(AlterGenerator::generateAlterTable(myModified, myOriginal),
                ElementsAre("DROP INDEX `users_email_unique` ON `users`;"));

    auto liteOriginal = users(Dialect::SQLite);
    auto liteModified = users(Dialect::SQLite);
    column(liteModified, "email").unique();
    EXPECT_TRUE(AlterGenerator::generateAlterTable(liteOriginal, liteModified).empty());
}

TEST_F(AlterGeneratorTest, RenameTable) {
    auto original = users(Dialect::PostgreSQL);
    auto modified = users(Dialect::PostgreSQL);
    modified.tableName = "accounts";

    EXPECT_THAT(AlterGenerator::generateAlterTable(original, modified),
                ElementsAre("ALTER TABLE \"users\" RENAME TO \"accounts\";"));

    auto msOriginal = users(Dialect::MsSql).withSchema("dbo");
    auto msModified = users(Dialect::MsSql).withSchema("dbo");
    msModified.tableName = "accounts";

    EXPECT_THAT(AlterGenerator::generateAlterTable(msOriginal, msModified),
                ElementsAre("EXEC sp_rename 'dbo.users', 'accounts';"));
}

TEST_F(AlterGeneratorTest, RenameComesBeforeColumnChanges) {
    auto original = users(Dialect::PostgreSQL);
    auto modified = TableDesign("accounts", Dialect::PostgreSQL)
                        .withColumn(ColumnDesign("id", "INTEGER").primaryKey())
                        .withColumn(ColumnDesign("login", "TEXT"));

    EXPECT_THAT(AlterGenerator::generateAlterTable(original, modified),
                ElementsAre("ALTER TABLE \"users\" RENAME TO \"accounts\";",
                            "ALTER TABLE \"accounts\" DROP COLUMN \"email\";",
                            "ALTER TABLE \"accounts\" ADD COLUMN \"login\" TEXT;"));
}

TEST_F(AlterGeneratorTest, ForeignKeyAddedAndChanged) {
    auto original = orders(Dialect::PostgreSQL);
    auto withFk = orders(Dialect::PostgreSQL).withForeignKey(userFk());

    EXPECT_THAT(AlterGenerator::generateAlterTable(original, withFk),
                ElementsAre("ALTER TABLE \"orders\" ADD CONSTRAINT \"fk_user\" FOREIGN KEY (\"user_id\") "
                            "REFERENCES \"users\" (\"id\");"));

    auto cascading = orders(Dialect::PostgreSQL).withForeignKey(userFk().withOnDelete(ForeignKeyAction::Cascade));

    EXPECT_THAT(AlterGenerator::generateAlterTable(withFk, cascading),
                ElementsAre("ALTER TABLE \"orders\" DROP CONSTRAINT \"fk_user\";",
                            "ALTER TABLE \"orders\" ADD CONSTRAINT \"fk_user\" FOREIGN KEY (\"user_id\") "
                            "REFERENCES \"users\" (\"id\") ON DELETE CASCADE;"));
}

TEST_F(AlterGeneratorTest, MySQLDropsForeignKeyByName) {
    auto original = orders(Dialect::MySQL).withForeignKey(userFk());
    auto modified = orders(Dialect::MySQL);

    EXPECT_THAT(AlterGenerator::generateAlterTable(original, modified),
                ElementsAre("ALTER TABLE `orders` DROP FOREIGN KEY `fk_user`;"));
}

TEST_F(AlterGeneratorTest, UnnamedForeignKeyCannotBeDropped) {
    auto unnamed = ForeignKeyDesign().column("user_id").references("users").referencedColumn("id");
    auto original = orders(Dialect::PostgreSQL).withForeignKey(unnamed);
    auto modified = orders(Dialect::PostgreSQL);

    EXPECT_TRUE(AlterGenerator::generateAlterTable(original, modified).empty());
    EXPECT_TRUE(AlterGenerator::generateAlterTable(original, original).empty());
}

TEST_F(AlterGeneratorTest, IndexChanges) {
    auto original = users(Dialect::PostgreSQL).withIndex(IndexDesign("idx_email", {"email"}));
    auto modified = users(Dialect::PostgreSQL)
                        .withIndex(IndexDesign("idx_email", {"email"}).unique())
                        .withIndex(IndexDesign("users_pkey", {"id"}).primary());

    EXPECT_THAT(AlterGenerator::generateAlterTable(original, modified),
                ElementsAre("DROP INDEX IF EXISTS \"idx_email\";",
                            "CREATE UNIQUE INDEX \"idx_email\" ON \"users\" (\"email\");"));

    auto myOriginal = users(Dialect::MySQL).withIndex(IndexDesign("idx_email", {"email"}));
    auto myModified = users(Dialect::MySQL);
    EXPECT_THAT(AlterGenerator::generateAlterTable(myOriginal, myModified),
                ElementsAre("DROP INDEX `idx_email` ON `users`;"));
}

TEST_F(AlterGeneratorTest, IndexDropUsesTableSchema) {
    for (auto dialect : {Dialect::PostgreSQL, Dialect::SQLite}) {
        auto original = users(dialect).withSchema("app").withIndex(IndexDesign("idx_email", {"email"}));
        auto modified = users(dialect).withSchema("app").withIndex(IndexDesign("idx_email", {"email"}).unique());

        EXPECT_THAT(AlterGenerator::generateAlterTable(original, modified),
                    ElementsAre("DROP INDEX IF EXISTS \"app\".\"idx_email\";",
                                "CREATE UNIQUE INDEX \"idx_email\" ON \"app\".\"users\" (\"email\");"))
            << dialectToString(dialect);
    }

    auto msOriginal = users(Dialect::MsSql).withSchema("dbo").withIndex(IndexDesign("idx_email", {"email"}));
    auto msModified = users(Dialect::MsSql).withSchema("dbo");
    EXPECT_THAT(AlterGenerator::generateAlterTable(msOriginal, msModified),
                ElementsAre("DROP INDEX [idx_email] ON [dbo].[users];"));
}

TEST_F(AlterGeneratorTest, StatementOrder) {
    auto original = orders(Dialect::PostgreSQL)
                        .withColumn(ColumnDesign("note", "TEXT"))
                        .withIndex(IndexDesign("idx_note", {"note"}));
    auto modified = orders(Dialect::PostgreSQL)
                        .withColumn(ColumnDesign("status", "TEXT"))
                        .withForeignKey(userFk())
                        .withIndex(IndexDesign("idx_status", {"status"}));
    column(modified, "user_id").notNull();

    auto statements = AlterGenerator::generateAlterTable(original, modified);

    ASSERT_EQ(statements.size(), 6u);
    EXPECT_THAT(statements[0], HasSubstr("DROP COLUMN \"note\""));
    EXPECT_THAT(statements[1], HasSubstr("ADD COLUMN \"status\""));
    EXPECT_THAT(statements[2], HasSubstr("ALTER COLUMN \"user_id\" SET NOT NULL"));
    EXPECT_THAT(statements[3], HasSubstr("ADD CONSTRAINT \"fk_user\""));
    EXPECT_THAT(statements[4], HasSubstr("DROP INDEX IF EXISTS \"idx_note\""));
    EXPECT_THAT(statements[5], HasSubstr("CREATE INDEX \"idx_status\""));
}
