#include "Config.hpp"
#include "StringUtils.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace schemaforge {

namespace {

bool parseBool(const std::string& value) {
    std::string lower = toLower(value);
    return lower == "true" || lower == "1" || lower == "yes" || lower == "on";
}

// Unescape \n and \t so separators can be written on one line
std::string unescape(const std::string& value) {
    std::string result;
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '\\' && i + 1 < value.size()) {
            char next = value[i + 1];
            if (next == 'n') { result += '\n'; ++i; continue; }
            if (next == 't') { result += '\t'; ++i; continue; }
        }
        result += value[i];
    }
    return result;
}

size_t expectedInputs(const std::string& command) {
    return command == "create" ? 1 : 2;
}

}  // namespace

CompareConfig CompareOptions::toCompareConfig() const {
    CompareConfig config;
    config.caseSensitive = case_sensitive;
    config.compareComments = compare_comments;
    config.compareIndexes = compare_indexes;
    config.compareForeignKeys = compare_foreign_keys;
    config.compareConstraints = compare_constraints;
    config.compareTriggers = compare_triggers;
    config.ignoreColumnOrder = ignore_column_order;
    return config;
}

std::optional<Config> Config::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;
    std::string current_section;

    while (std::getline(file, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = toLower(trim(line.substr(1, line.size() - 2)));
            continue;
        }

        // Key-value pair
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes if present
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        // Apply to appropriate section
        if (current_section == "generator") {
            if (key == "dialect") config.generator.dialect = value;
        }
        else if (current_section == "compare") {
            if (key == "case_sensitive") config.compare.case_sensitive = parseBool(value);
            else if (key == "compare_comments") config.compare.compare_comments = parseBool(value);
            else if (key == "compare_indexes") config.compare.compare_indexes = parseBool(value);
            else if (key == "compare_foreign_keys") config.compare.compare_foreign_keys = parseBool(value);
            else if (key == "compare_constraints") config.compare.compare_constraints = parseBool(value);
            else if (key == "compare_triggers") config.compare.compare_triggers = parseBool(value);
            else if (key == "ignore_column_order") config.compare.ignore_column_order = parseBool(value);
        }
        else if (current_section == "output") {
            if (key == "pretty_json") {
                config.output.pretty_json = parseBool(value);
            } else if (key == "json_indent") {
                try {
                    config.output.json_indent = std::stoi(value);
                } catch (const std::exception&) {
                    spdlog::warn("Ignoring invalid json_indent '{}' in {}", value, path.string());
                }
            } else if (key == "statement_separator") {
                config.output.statement_separator = unescape(value);
            }
        }
    }

    return config;
}

Config Config::parseArgs(int argc, char* argv[]) {
    CLI::App app{"schemaforge - dialect-aware DDL synthesis and schema diff"};

    std::string dialect;
    auto* dialect_opt = app.add_option("-t,--dialect", dialect,
                                       "Target dialect (postgresql, mysql, sqlite, mssql)");

    std::string config_file;
    app.add_option("-c,--config", config_file, "Path to configuration file");

    bool case_insensitive = false;
    app.add_flag("--case-insensitive", case_insensitive, "Compare object names ignoring case");
    bool no_comments = false;
    app.add_flag("--no-comments", no_comments, "Ignore column comments when comparing");
    bool no_triggers = false;
    app.add_flag("--no-triggers", no_triggers, "Skip trigger comparison");
    bool compact = false;
    app.add_flag("--compact", compact, "Print JSON on a single line");

    std::string log_file;
    app.add_option("--log-file", log_file, "Also write log output to this file");
    bool debug = false;
    app.add_flag("-d,--debug", debug, "Enable debug output");

    std::string kind;
    std::string spec_file;
    auto* create = app.add_subcommand("create", "Print the CREATE statement for a specification");
    create->add_option("kind", kind, "Object kind: policy, trigger, function or table")
        ->required()
        ->check(CLI::IsMember({"policy", "trigger", "function", "table"}));
    create->add_option("spec", spec_file, "JSON specification file")->required();

    std::string original_file;
    std::string modified_file;
    auto* alter = app.add_subcommand("alter", "Print ALTER statements turning one table design into another");
    alter->add_option("original", original_file, "Original table design (JSON)")->required();
    alter->add_option("modified", modified_file, "Modified table design (JSON)")->required();

    std::string desired_file;
    std::string current_file;
    auto* compare = app.add_subcommand("compare", "Print the differences between two schema snapshots");
    compare->add_option("desired", desired_file, "Desired schema snapshot (JSON)")->required();
    compare->add_option("current", current_file, "Current schema snapshot (JSON)")->required();

    app.require_subcommand(1);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    Config config;

    // Load config file if specified
    if (!config_file.empty()) {
        auto file_config = loadFromFile(config_file);
        if (file_config) {
            config = *file_config;
        } else {
            spdlog::warn("Could not load config file: {}", config_file);
        }
    }

    // Command line args override file config
    if (dialect_opt->count() > 0) config.generator.dialect = dialect;
    if (case_insensitive) config.compare.case_sensitive = false;
    if (no_comments) config.compare.compare_comments = false;
    if (no_triggers) config.compare.compare_triggers = false;
    if (compact) config.output.pretty_json = false;
    config.log_file = log_file;
    config.debug = debug;

    if (create->parsed()) {
        config.command = "create";
        config.kind = kind;
        config.inputs = {spec_file};
    } else if (alter->parsed()) {
        config.command = "alter";
        config.inputs = {original_file, modified_file};
    } else if (compare->parsed()) {
        config.command = "compare";
        config.inputs = {desired_file, current_file};
    }

    return config;
}

bool Config::validate() const {
    try {
        parseDialect(generator.dialect);
    } catch (const std::invalid_argument& e) {
        spdlog::error("{}", e.what());
        return false;
    }

    if (command != "create" && command != "alter" && command != "compare") {
        spdlog::error("Unknown command: '{}'", command);
        return false;
    }

    if (command == "create" && kind != "policy" && kind != "trigger" && kind != "function" &&
        kind != "table") {
        spdlog::error("Unknown object kind: '{}'", kind);
        return false;
    }

    if (inputs.size() != expectedInputs(command)) {
        spdlog::error("'{}' expects {} input file(s), got {}", command, expectedInputs(command),
                      inputs.size());
        return false;
    }

    for (const auto& input : inputs) {
        if (!std::filesystem::exists(input)) {
            spdlog::error("Input file not found: {}", input);
            return false;
        }
    }

    if (output.json_indent < 0) {
        spdlog::error("json_indent must not be negative: {}", output.json_indent);
        return false;
    }

    return true;
}

}  // namespace schemaforge
