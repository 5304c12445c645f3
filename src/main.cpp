#include "Config.hpp"
#include "FunctionManager.hpp"
#include "JsonCodec.hpp"
#include "PolicyManager.hpp"
#include "SchemaComparator.hpp"
#include "StringUtils.hpp"
#include "TableManager.hpp"
#include "TriggerManager.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <iostream>
#include <vector>

using namespace schemaforge;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFailure = 2;

void setupLogging(bool debug, const std::string& logFile) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Diagnostics go to stderr so generated SQL on stdout stays clean
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(debug ? spdlog::level::debug : spdlog::level::warn);
        sinks.push_back(console_sink);

        if (!logFile.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, false);
            file_sink->set_level(debug ? spdlog::level::debug : spdlog::level::info);
            sinks.push_back(file_sink);
        }

        auto logger = std::make_shared<spdlog::logger>("schemaforge", sinks.begin(), sinks.end());
        logger->set_level(debug ? spdlog::level::debug : spdlog::level::info);

        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

// Prints the SQL or reports the error; returns the exit code
template <typename E>
int emit(const Result<std::string, E>& result) {
    if (!result) {
        spdlog::error("{}", result.error().message());
        return kExitFailure;
    }
    std::cout << result.value() << ";" << std::endl;
    return kExitOk;
}

int runCreate(const Config& config) {
    const Dialect dialect = config.dialect();
    const json doc = JsonCodec::loadFile(config.inputs[0]);
    spdlog::info("Generating {} for {}", config.kind, dialectDisplayName(dialect));

    if (config.kind == "policy") {
        return emit(PolicyManager(dialect).buildCreatePolicy(JsonCodec::policyFromJson(doc)));
    }
    if (config.kind == "trigger") {
        return emit(TriggerManager(dialect).buildCreateTrigger(JsonCodec::triggerFromJson(doc)));
    }
    if (config.kind == "function") {
        return emit(FunctionManager(dialect).buildCreateFunction(JsonCodec::functionFromJson(doc)));
    }

    // CREATE TABLE output already ends with ';'
    auto result = TableManager(dialect).buildCreateTable(JsonCodec::tableFromJson(doc, dialect));
    if (!result) {
        spdlog::error("{}", result.error().message());
        return kExitFailure;
    }
    std::cout << result.value() << std::endl;
    return kExitOk;
}

int runAlter(const Config& config) {
    const Dialect dialect = config.dialect();
    TableDesign original = JsonCodec::tableFromJson(JsonCodec::loadFile(config.inputs[0]), dialect);
    TableDesign modified = JsonCodec::tableFromJson(JsonCodec::loadFile(config.inputs[1]), dialect);
    spdlog::info("Generating ALTER statements for {} ({})", modified.tableName,
                 dialectDisplayName(modified.dialect));

    auto result = TableManager(dialect).buildAlterTable(original, modified);
    if (!result) {
        spdlog::error("{}", result.error().message());
        return kExitFailure;
    }
    if (!result.value().empty()) {
        std::cout << join(result.value(), config.output.statement_separator) << std::endl;
    }
    return kExitOk;
}

int runCompare(const Config& config) {
    SchemaSnapshot desired = JsonCodec::snapshotFromJson(JsonCodec::loadFile(config.inputs[0]));
    SchemaSnapshot current = JsonCodec::snapshotFromJson(JsonCodec::loadFile(config.inputs[1]));

    SchemaComparator comparator(config.compare.toCompareConfig());
    SchemaDiff diff = comparator.compareSnapshots(desired, current);
    spdlog::info("Comparison found {} change(s)", diff.changeCount());

    JsonOutputOptions options;
    options.pretty = config.output.pretty_json;
    options.indent = config.output.json_indent;
    std::cout << JsonCodec::dumpDiff(diff, options) << std::endl;
    return kExitOk;
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse configuration
    Config config;
    try {
        config = Config::parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitUsage;
    }

    // Setup logging
    setupLogging(config.debug, config.log_file);

    // Validate configuration
    if (!config.validate()) {
        return kExitUsage;
    }

    try {
        if (config.command == "create") {
            return runCreate(config);
        }
        if (config.command == "alter") {
            return runAlter(config);
        }
        return runCompare(config);
    } catch (const SpecFormatError& e) {
        spdlog::error("{}", e.what());
    } catch (const std::exception& e) {
        spdlog::error("schemaforge failed: {}", e.what());
    }
    return kExitFailure;
}
