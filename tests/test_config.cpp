#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "Config.hpp"
#include <fstream>
#include <filesystem>
#include <stdexcept>

using namespace schemaforge;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create temp directory for test files
        tempDir_ = std::filesystem::temp_directory_path() / "schemaforge_config_test";
        std::filesystem::create_directories(tempDir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir_);
    }

    std::filesystem::path tempDir_;

    std::filesystem::path writeConfigFile(const std::string& filename, const std::string& content) {
        std::ofstream file(tempDir_ / filename);
        file << content;
        return tempDir_ / filename;
    }

    Config parse(std::vector<std::string> args) {
        args.insert(args.begin(), "schemaforge");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return Config::parseArgs(static_cast<int>(argv.size()), argv.data());
    }
};

// Default configuration tests
TEST_F(ConfigTest, DefaultGeneratorConfig) {
    GeneratorConfig config;

    EXPECT_EQ(config.dialect, "postgresql");
}

TEST_F(ConfigTest, DefaultCompareOptions) {
    CompareOptions options;

    EXPECT_TRUE(options.case_sensitive);
    EXPECT_TRUE(options.compare_comments);
    EXPECT_TRUE(options.compare_indexes);
    EXPECT_TRUE(options.compare_foreign_keys);
    EXPECT_TRUE(options.compare_constraints);
    EXPECT_TRUE(options.compare_triggers);
    EXPECT_FALSE(options.ignore_column_order);
}

TEST_F(ConfigTest, DefaultOutputConfig) {
    OutputConfig config;

    EXPECT_TRUE(config.pretty_json);
    EXPECT_EQ(config.json_indent, 2);
    EXPECT_EQ(config.statement_separator, "\n\n");
}

// Config file loading tests
TEST_F(ConfigTest, LoadFromFile) {
    auto path = writeConfigFile("schemaforge.conf", R"(
# Generator settings
[generator]
dialect = mssql

[compare]
case_sensitive = off
compare_comments = yes
compare_indexes = 0
ignore_column_order = TRUE

; Output settings
[output]
pretty_json = false
json_indent = 4
statement_separator = ";\n"
)");

    auto config = Config::loadFromFile(path);

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->generator.dialect, "mssql");
    EXPECT_FALSE(config->compare.case_sensitive);
    EXPECT_FALSE(config->compare.compare_indexes);
    EXPECT_TRUE(config->compare.compare_foreign_keys);
    EXPECT_TRUE(config->compare.ignore_column_order);
    EXPECT_FALSE(config->output.pretty_json);
    EXPECT_EQ(config->output.json_indent, 4);
    EXPECT_EQ(config->output.statement_separator, ";\n");
    EXPECT_EQ(config->dialect(), Dialect::MsSql);
}

TEST_F(ConfigTest, LoadFromFileNotFound) {
    auto config = Config::loadFromFile(tempDir_ / "nonexistent.conf");
    EXPECT_FALSE(config.has_value());
}

TEST_F(ConfigTest, InvalidIndentIsSkipped) {
    auto path = writeConfigFile("bad_indent.conf", R"(
[output]
json_indent = wide
pretty_json = true
)");

    auto config = Config::loadFromFile(path);

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->output.json_indent, 2);
    EXPECT_TRUE(config->output.pretty_json);
}

TEST_F(ConfigTest, UnknownKeysAndSectionsAreIgnored) {
    auto path = writeConfigFile("extra.conf", R"(
[database]
host = localhost

[generator]
dialect = 'sqlite'
colour = blue
)");

    auto config = Config::loadFromFile(path);

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->generator.dialect, "sqlite");
    EXPECT_EQ(config->dialect(), Dialect::SQLite);
}

// Compare options
TEST_F(ConfigTest, ToCompareConfig) {
    CompareOptions options;
    options.case_sensitive = false;
    options.compare_comments = false;
    options.compare_triggers = false;

    auto compare = options.toCompareConfig();

    EXPECT_FALSE(compare.caseSensitive);
    EXPECT_FALSE(compare.compareComments);
    EXPECT_TRUE(compare.compareIndexes);
    EXPECT_TRUE(compare.compareForeignKeys);
    EXPECT_TRUE(compare.compareConstraints);
    EXPECT_FALSE(compare.compareTriggers);
    EXPECT_FALSE(compare.ignoreColumnOrder);
}

// Command line tests
TEST_F(ConfigTest, ParseCompareCommand) {
    auto config = parse({"--case-insensitive", "--compact", "compare", "desired.json", "current.json"});

    EXPECT_EQ(config.command, "compare");
    EXPECT_EQ(config.inputs, (std::vector<std::string>{"desired.json", "current.json"}));
    EXPECT_FALSE(config.compare.case_sensitive);
    EXPECT_FALSE(config.output.pretty_json);
}

TEST_F(ConfigTest, CommandLineOverridesConfigFile) {
    auto path = writeConfigFile("override.conf", R"(
[generator]
dialect = mysql

[compare]
compare_comments = true
)");

    auto config = parse({"-c", path.string(), "-t", "sqlite", "--no-comments", "create", "table", "t.json"});

    EXPECT_EQ(config.generator.dialect, "sqlite");
    EXPECT_FALSE(config.compare.compare_comments);
    EXPECT_EQ(config.command, "create");
    EXPECT_EQ(config.kind, "table");
    EXPECT_EQ(config.inputs, std::vector<std::string>{"t.json"});
}

// Validation tests
TEST_F(ConfigTest, ValidateAcceptsExistingInputs) {
    auto original = writeConfigFile("original.json", "{}");
    auto modified = writeConfigFile("modified.json", "{}");

    Config config;
    config.command = "alter";
    config.inputs = {original.string(), modified.string()};

    EXPECT_TRUE(config.validate());
}

TEST_F(ConfigTest, ValidateFailures) {
    auto spec = writeConfigFile("spec.json", "{}");

    Config config;
    config.command = "create";
    config.kind = "policy";
    config.inputs = {spec.string()};
    ASSERT_TRUE(config.validate());

    Config badDialect = config;
    badDialect.generator.dialect = "oracle";
    EXPECT_FALSE(badDialect.validate());

    Config badCommand = config;
    badCommand.command = "migrate";
    EXPECT_FALSE(badCommand.validate());

    Config badKind = config;
    badKind.kind = "view";
    EXPECT_FALSE(badKind.validate());

    Config wrongCount = config;
    wrongCount.command = "compare";
    EXPECT_FALSE(wrongCount.validate());

    Config missingFile = config;
    missingFile.inputs = {(tempDir_ / "missing.json").string()};
    EXPECT_FALSE(missingFile.validate());

    Config negativeIndent = config;
    negativeIndent.output.json_indent = -1;
    EXPECT_FALSE(negativeIndent.validate());
}

TEST_F(ConfigTest, DialectAccessorRejectsUnknownName) {
    Config config;
    EXPECT_EQ(config.dialect(), Dialect::PostgreSQL);

    config.generator.dialect = "db2";
    EXPECT_THROW(config.dialect(), std::invalid_argument);
}
