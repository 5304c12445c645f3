#pragma once

/**
 * @file JsonCodec.hpp
 * @brief JSON input and output for the schemaforge tool.
 *
 * Decodes object specifications and schema snapshots from JSON documents and
 * encodes SchemaDiff reports. Keys are snake_case; enum values use their SQL
 * spelling (case-insensitive on input). Every decoding failure is reported as
 * SpecFormatError.
 */

#include "Dialect.hpp"
#include "FunctionSpec.hpp"
#include "PolicySpec.hpp"
#include "SchemaDiff.hpp"
#include "SchemaModel.hpp"
#include "TableDesign.hpp"
#include "TriggerSpec.hpp"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace schemaforge {

using json = nlohmann::json;

class SpecFormatError : public std::runtime_error {
public:
    explicit SpecFormatError(const std::string& message) : std::runtime_error(message) {}
};

struct JsonOutputOptions {
    bool pretty = true;
    int indent = 2;
};

class JsonCodec {
public:
    // Parse a document; malformed JSON throws SpecFormatError
    static json parse(const std::string& text);
    static json loadFile(const std::filesystem::path& path);

    static PolicySpec policyFromJson(const json& doc);
    static TriggerSpec triggerFromJson(const json& doc);
    static FunctionSpec functionFromJson(const json& doc);

    // The document's "dialect" key wins over fallbackDialect
    static TableDesign tableFromJson(const json& doc, Dialect fallbackDialect);

    static SchemaSnapshot snapshotFromJson(const json& doc);

    static json diffToJson(const SchemaDiff& diff);
    static std::string dumpDiff(const SchemaDiff& diff, const JsonOutputOptions& options = {});
};

}  // namespace schemaforge
