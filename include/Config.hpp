#pragma once

#include "Dialect.hpp"
#include "SchemaComparator.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace schemaforge {

struct GeneratorConfig {
    std::string dialect = "postgresql";
};

struct CompareOptions {
    bool case_sensitive = true;
    bool compare_comments = true;
    bool compare_indexes = true;
    bool compare_foreign_keys = true;
    bool compare_constraints = true;
    bool compare_triggers = true;
    bool ignore_column_order = false;

    CompareConfig toCompareConfig() const;
};

struct OutputConfig {
    bool pretty_json = true;
    int json_indent = 2;
    std::string statement_separator = "\n\n";
};

struct Config {
    GeneratorConfig generator;
    CompareOptions compare;
    OutputConfig output;

    std::string command;              // create, alter, compare
    std::string kind;                 // object kind for create
    std::vector<std::string> inputs;  // JSON documents, in command order
    std::string log_file;
    bool debug = false;

    // Load from file
    static std::optional<Config> loadFromFile(const std::filesystem::path& path);

    // Parse command line arguments; values given on the command line win over the config file
    static Config parseArgs(int argc, char* argv[]);

    // Validate configuration
    bool validate() const;

    // Throws std::invalid_argument for an unknown dialect name
    Dialect dialect() const { return parseDialect(generator.dialect); }
};

}  // namespace schemaforge
