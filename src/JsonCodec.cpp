#include "JsonCodec.hpp"
#include <fstream>
#include <sstream>

namespace schemaforge {

namespace {

std::string requireString(const json& doc, const char* key) {
    if (!doc.contains(key) || !doc.at(key).is_string()) {
        throw SpecFormatError(std::string("missing string field '") + key + "'");
    }
    return doc.at(key).get<std::string>();
}

template <typename T>
std::optional<T> optionalField(const json& doc, const char* key) {
    if (!doc.contains(key) || doc.at(key).is_null()) {
        return std::nullopt;
    }
    return doc.at(key).get<T>();
}

std::vector<std::string> stringList(const json& doc, const char* key) {
    if (!doc.contains(key) || doc.at(key).is_null()) {
        return {};
    }
    return doc.at(key).get<std::vector<std::string>>();
}

void requireObject(const json& doc, const std::string& what) {
    if (!doc.is_object()) {
        throw SpecFormatError(what + " must be a JSON object");
    }
}

// Runs a decoder, turning library and enum parsing errors into SpecFormatError
template <typename Fn>
auto decode(const std::string& what, Fn fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const SpecFormatError& e) {
        throw SpecFormatError("Invalid " + what + ": " + e.what());
    } catch (const json::exception& e) {
        throw SpecFormatError("Invalid " + what + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw SpecFormatError("Invalid " + what + ": " + e.what());
    }
}

template <typename T>
json jsonValue(const T& value) {
    return json(value);
}

json jsonValue(ForeignKeyAction action) {
    return foreignKeyActionToSql(action);
}

template <typename T>
json jsonValue(const std::optional<T>& value) {
    return value ? jsonValue(*value) : json(nullptr);
}

template <typename T>
void putOptional(json& out, const char* key, const std::optional<T>& value) {
    out[key] = jsonValue(value);
}

// Adds {"desired": ..., "current": ...} under key when the change is present
template <typename T>
void putChange(json& out, const char* key, const std::optional<Change<T>>& change) {
    if (change) {
        out[key] = json{{"desired", jsonValue(change->desired)},
                        {"current", jsonValue(change->current)}};
    }
}

FunctionParam paramFromJson(const json& doc) {
    requireObject(doc, "parameter");
    FunctionParam param;
    param.name = doc.value("name", std::string());
    param.dataType = doc.contains("data_type") ? doc.value("data_type", std::string())
                                               : doc.value("type", std::string());
    param.mode = parseParameterMode(doc.value("mode", std::string("IN")));
    param.defaultValue = optionalField<std::string>(doc, "default");
    return param;
}

std::vector<FunctionParam> paramListFromJson(const json& doc, const char* key) {
    std::vector<FunctionParam> params;
    if (doc.contains(key) && !doc.at(key).is_null()) {
        for (const auto& item : doc.at(key)) {
            params.push_back(paramFromJson(item));
        }
    }
    return params;
}

ColumnDesign columnDesignFromJson(const json& doc) {
    requireObject(doc, "column");
    ColumnDesign column(requireString(doc, "name"),
                        doc.contains("data_type") ? doc.value("data_type", std::string())
                                                  : doc.value("type", std::string()));
    column.length = optionalField<uint32_t>(doc, "length");
    column.scale = optionalField<uint32_t>(doc, "scale");
    column.isPrimaryKey = doc.value("primary_key", false);
    column.nullable = doc.value("nullable", !column.isPrimaryKey);
    column.isAutoIncrement = doc.value("auto_increment", false);
    column.isUnique = doc.value("unique", false);
    column.defaultValue = optionalField<std::string>(doc, "default");
    column.comment = optionalField<std::string>(doc, "comment");
    if (doc.contains("generated") && doc.at("generated").is_object()) {
        const auto& generated = doc.at("generated");
        column.generatedAs(requireString(generated, "expression"), generated.value("stored", false));
    }
    return column;
}

IndexDesign indexDesignFromJson(const json& doc) {
    requireObject(doc, "index");
    IndexDesign index(requireString(doc, "name"), stringList(doc, "columns"));
    index.isUnique = doc.value("unique", false);
    index.isPrimary = doc.value("primary", false);
    index.indexType = optionalField<std::string>(doc, "type");
    return index;
}

ForeignKeyDesign foreignKeyDesignFromJson(const json& doc) {
    requireObject(doc, "foreign key");
    ForeignKeyDesign fk;
    fk.name = optionalField<std::string>(doc, "name");
    fk.columns = stringList(doc, "columns");
    fk.referencedTable = doc.value("referenced_table", std::string());
    fk.referencedSchema = optionalField<std::string>(doc, "referenced_schema");
    fk.referencedColumns = stringList(doc, "referenced_columns");
    fk.onUpdate = parseForeignKeyAction(doc.value("on_update", std::string("NO ACTION")));
    fk.onDelete = parseForeignKeyAction(doc.value("on_delete", std::string("NO ACTION")));
    return fk;
}

TableOptions tableOptionsFromJson(const json& doc) {
    requireObject(doc, "table options");
    TableOptions options;
    options.engine = optionalField<std::string>(doc, "engine");
    options.charset = optionalField<std::string>(doc, "charset");
    options.collation = optionalField<std::string>(doc, "collation");
    options.autoIncrementStart = optionalField<uint64_t>(doc, "auto_increment_start");
    options.rowFormat = optionalField<std::string>(doc, "row_format");
    options.withoutRowid = doc.value("without_rowid", false);
    options.strict = doc.value("strict", false);
    return options;
}

}  // namespace

// ============================================================================
// Snapshot types (found by nlohmann through argument-dependent lookup)
// ============================================================================

void from_json(const json& j, ColumnInfo& c) {
    c.name = requireString(j, "name");
    c.ordinal = j.value("ordinal", static_cast<size_t>(0));
    c.dataType = requireString(j, "data_type");
    c.nullable = j.value("nullable", true);
    c.defaultValue = optionalField<std::string>(j, "default");
    c.maxLength = optionalField<int64_t>(j, "max_length");
    c.precision = optionalField<int32_t>(j, "precision");
    c.scale = optionalField<int32_t>(j, "scale");
    c.isPrimaryKey = j.value("primary_key", false);
    c.isAutoIncrement = j.value("auto_increment", false);
    c.isUnique = j.value("unique", false);
    c.comment = optionalField<std::string>(j, "comment");
}

void to_json(json& j, const ColumnInfo& c) {
    j = json{{"name", c.name},
             {"ordinal", c.ordinal},
             {"data_type", c.dataType},
             {"nullable", c.nullable},
             {"primary_key", c.isPrimaryKey},
             {"auto_increment", c.isAutoIncrement},
             {"unique", c.isUnique}};
    putOptional(j, "default", c.defaultValue);
    putOptional(j, "max_length", c.maxLength);
    putOptional(j, "precision", c.precision);
    putOptional(j, "scale", c.scale);
    putOptional(j, "comment", c.comment);
}

void from_json(const json& j, IndexInfo& i) {
    i.name = requireString(j, "name");
    i.columns = stringList(j, "columns");
    i.isUnique = j.value("unique", false);
    i.isPrimary = j.value("primary", false);
    i.indexType = j.value("type", std::string());
    i.comment = optionalField<std::string>(j, "comment");
}

void to_json(json& j, const IndexInfo& i) {
    j = json{{"name", i.name},
             {"columns", i.columns},
             {"unique", i.isUnique},
             {"primary", i.isPrimary},
             {"type", i.indexType}};
    putOptional(j, "comment", i.comment);
}

void from_json(const json& j, ForeignKeyInfo& fk) {
    fk.name = requireString(j, "name");
    fk.columns = stringList(j, "columns");
    fk.referencedTable = requireString(j, "referenced_table");
    fk.referencedSchema = optionalField<std::string>(j, "referenced_schema");
    fk.referencedColumns = stringList(j, "referenced_columns");
    fk.onUpdate = parseForeignKeyAction(j.value("on_update", std::string("NO ACTION")));
    fk.onDelete = parseForeignKeyAction(j.value("on_delete", std::string("NO ACTION")));
}

void to_json(json& j, const ForeignKeyInfo& fk) {
    j = json{{"name", fk.name},
             {"columns", fk.columns},
             {"referenced_table", fk.referencedTable},
             {"referenced_columns", fk.referencedColumns},
             {"on_update", foreignKeyActionToSql(fk.onUpdate)},
             {"on_delete", foreignKeyActionToSql(fk.onDelete)}};
    putOptional(j, "referenced_schema", fk.referencedSchema);
}

void from_json(const json& j, PrimaryKeyInfo& pk) {
    pk.name = optionalField<std::string>(j, "name");
    pk.columns = stringList(j, "columns");
}

void to_json(json& j, const PrimaryKeyInfo& pk) {
    j = json{{"columns", pk.columns}};
    putOptional(j, "name", pk.name);
}

void from_json(const json& j, ConstraintInfo& c) {
    c.name = requireString(j, "name");
    c.constraintType = parseConstraintType(j.value("type", std::string("check")));
    c.columns = stringList(j, "columns");
    c.definition = optionalField<std::string>(j, "definition");
}

void to_json(json& j, const ConstraintInfo& c) {
    j = json{{"name", c.name},
             {"type", constraintTypeToString(c.constraintType)},
             {"columns", c.columns}};
    putOptional(j, "definition", c.definition);
}

void from_json(const json& j, TriggerInfo& t) {
    t.schema = optionalField<std::string>(j, "schema");
    t.name = requireString(j, "name");
    t.tableName = j.value("table", std::string());
    t.timing = parseTriggerTiming(j.value("timing", std::string("AFTER")));
    t.events.clear();
    for (const auto& event : stringList(j, "events")) {
        t.events.push_back(parseTriggerEvent(event));
    }
    t.forEach = parseTriggerLevel(j.value("level", std::string("ROW")));
    t.definition = optionalField<std::string>(j, "definition");
    t.enabled = j.value("enabled", true);
    t.comment = optionalField<std::string>(j, "comment");
}

void to_json(json& j, const TriggerInfo& t) {
    json events = json::array();
    for (auto event : t.events) {
        events.push_back(triggerEventToSql(event));
    }
    j = json{{"name", t.name},
             {"table", t.tableName},
             {"timing", triggerTimingToSql(t.timing)},
             {"events", events},
             {"level", t.forEach == TriggerLevel::Statement ? "STATEMENT" : "ROW"},
             {"enabled", t.enabled}};
    putOptional(j, "schema", t.schema);
    putOptional(j, "definition", t.definition);
    putOptional(j, "comment", t.comment);
}

void from_json(const json& j, TableInfo& t) {
    t.schema = optionalField<std::string>(j, "schema");
    t.name = requireString(j, "name");
    t.tableType = parseTableType(j.value("table_type", std::string("table")));
    t.owner = optionalField<std::string>(j, "owner");
    t.rowCount = optionalField<int64_t>(j, "row_count");
    t.sizeBytes = optionalField<int64_t>(j, "size_bytes");
    t.comment = optionalField<std::string>(j, "comment");
}

void to_json(json& j, const TableInfo& t) {
    j = json{{"name", t.name}, {"table_type", tableTypeToString(t.tableType)}};
    putOptional(j, "schema", t.schema);
    putOptional(j, "owner", t.owner);
    putOptional(j, "row_count", t.rowCount);
    putOptional(j, "size_bytes", t.sizeBytes);
    putOptional(j, "comment", t.comment);
}

void from_json(const json& j, TableDetails& d) {
    d.info = j.get<TableInfo>();
    d.columns = j.value("columns", json::array()).get<std::vector<ColumnInfo>>();
    d.primaryKey = optionalField<PrimaryKeyInfo>(j, "primary_key");
    d.foreignKeys = j.value("foreign_keys", json::array()).get<std::vector<ForeignKeyInfo>>();
    d.indexes = j.value("indexes", json::array()).get<std::vector<IndexInfo>>();
    d.constraints = j.value("constraints", json::array()).get<std::vector<ConstraintInfo>>();
    d.triggers = j.value("triggers", json::array()).get<std::vector<TriggerInfo>>();
}

void from_json(const json& j, ViewInfo& v) {
    v.schema = optionalField<std::string>(j, "schema");
    v.name = requireString(j, "name");
    v.isMaterialized = j.value("materialized", false);
    v.definition = optionalField<std::string>(j, "definition");
    v.owner = optionalField<std::string>(j, "owner");
    v.comment = optionalField<std::string>(j, "comment");
}

void to_json(json& j, const ViewInfo& v) {
    j = json{{"name", v.name}, {"materialized", v.isMaterialized}};
    putOptional(j, "schema", v.schema);
    putOptional(j, "definition", v.definition);
    putOptional(j, "owner", v.owner);
    putOptional(j, "comment", v.comment);
}

void from_json(const json& j, ParameterInfo& p) {
    p.name = optionalField<std::string>(j, "name");
    p.dataType = requireString(j, "data_type");
    p.mode = parseParameterMode(j.value("mode", std::string("IN")));
    p.defaultValue = optionalField<std::string>(j, "default");
    p.ordinal = j.value("ordinal", static_cast<size_t>(0));
}

void to_json(json& j, const ParameterInfo& p) {
    j = json{{"data_type", p.dataType},
             {"mode", parameterModeToSql(p.mode)},
             {"ordinal", p.ordinal}};
    putOptional(j, "name", p.name);
    putOptional(j, "default", p.defaultValue);
}

void from_json(const json& j, FunctionInfo& f) {
    f.schema = optionalField<std::string>(j, "schema");
    f.name = requireString(j, "name");
    f.language = j.value("language", std::string("sql"));
    f.returnType = j.value("return_type", std::string());
    f.parameters = j.value("parameters", json::array()).get<std::vector<ParameterInfo>>();
    f.definition = optionalField<std::string>(j, "definition");
    f.owner = optionalField<std::string>(j, "owner");
    f.comment = optionalField<std::string>(j, "comment");
}

void to_json(json& j, const FunctionInfo& f) {
    j = json{{"name", f.name},
             {"language", f.language},
             {"return_type", f.returnType},
             {"parameters", f.parameters}};
    putOptional(j, "schema", f.schema);
    putOptional(j, "definition", f.definition);
    putOptional(j, "owner", f.owner);
    putOptional(j, "comment", f.comment);
}

void from_json(const json& j, ProcedureInfo& p) {
    p.schema = optionalField<std::string>(j, "schema");
    p.name = requireString(j, "name");
    p.language = j.value("language", std::string("sql"));
    p.parameters = j.value("parameters", json::array()).get<std::vector<ParameterInfo>>();
    p.definition = optionalField<std::string>(j, "definition");
    p.owner = optionalField<std::string>(j, "owner");
    p.comment = optionalField<std::string>(j, "comment");
}

void to_json(json& j, const ProcedureInfo& p) {
    j = json{{"name", p.name}, {"language", p.language}, {"parameters", p.parameters}};
    putOptional(j, "schema", p.schema);
    putOptional(j, "definition", p.definition);
    putOptional(j, "owner", p.owner);
    putOptional(j, "comment", p.comment);
}

void from_json(const json& j, SequenceInfo& s) {
    s.schema = optionalField<std::string>(j, "schema");
    s.name = requireString(j, "name");
    s.dataType = j.value("data_type", std::string("bigint"));
    s.startValue = j.value("start_value", static_cast<int64_t>(1));
    s.minValue = j.value("min_value", static_cast<int64_t>(1));
    s.maxValue = j.value("max_value", static_cast<int64_t>(INT64_MAX));
    s.incrementBy = j.value("increment_by", static_cast<int64_t>(1));
    s.currentValue = optionalField<int64_t>(j, "current_value");
    s.owner = optionalField<std::string>(j, "owner");
    s.comment = optionalField<std::string>(j, "comment");
}

void to_json(json& j, const SequenceInfo& s) {
    j = json{{"name", s.name},
             {"data_type", s.dataType},
             {"start_value", s.startValue},
             {"min_value", s.minValue},
             {"max_value", s.maxValue},
             {"increment_by", s.incrementBy}};
    putOptional(j, "schema", s.schema);
    putOptional(j, "current_value", s.currentValue);
    putOptional(j, "owner", s.owner);
    putOptional(j, "comment", s.comment);
}

void from_json(const json& j, TypeInfo& t) {
    t.schema = optionalField<std::string>(j, "schema");
    t.name = requireString(j, "name");
    t.typeKind = parseTypeKind(j.value("kind", std::string("base")));
    t.values = optionalField<std::vector<std::string>>(j, "values");
    t.definition = optionalField<std::string>(j, "definition");
    t.owner = optionalField<std::string>(j, "owner");
    t.comment = optionalField<std::string>(j, "comment");
}

void to_json(json& j, const TypeInfo& t) {
    j = json{{"name", t.name}, {"kind", typeKindToString(t.typeKind)}};
    putOptional(j, "schema", t.schema);
    putOptional(j, "values", t.values);
    putOptional(j, "definition", t.definition);
    putOptional(j, "owner", t.owner);
    putOptional(j, "comment", t.comment);
}

// ============================================================================
// Diff types
// ============================================================================

void to_json(json& j, const ColumnDiff& d) {
    j = json{{"column", d.columnName}};
    putChange(j, "type", d.typeChange);
    putChange(j, "nullable", d.nullableChange);
    putChange(j, "default", d.defaultChange);
    putChange(j, "max_length", d.maxLengthChange);
    putChange(j, "precision", d.precisionChange);
    putChange(j, "scale", d.scaleChange);
    putChange(j, "comment", d.commentChange);
}

void to_json(json& j, const IndexDiff& d) {
    j = json{{"index", d.indexName}, {"current", d.current}, {"desired", d.desired}};
}

void to_json(json& j, const ConstraintDiff& d) {
    j = json{{"constraint", d.constraintName}, {"current", d.current}, {"desired", d.desired}};
}

void to_json(json& j, const ForeignKeyDiff& d) {
    j = json{{"foreign_key", d.foreignKeyName}};
    putChange(j, "on_update", d.onUpdateChange);
    putChange(j, "on_delete", d.onDeleteChange);
    putChange(j, "referenced_table", d.referencedTableChange);
    putChange(j, "columns", d.columnsChange);
}

void to_json(json& j, const PrimaryKeyChange& c) {
    j = json{{"kind", primaryKeyChangeKindToString(c.kind)}};
    putOptional(j, "current", c.current);
    putOptional(j, "desired", c.desired);
}

void to_json(json& j, const TableDiff& d) {
    j = json{{"table", d.qualifiedName()},
             {"safe", d.isSafe()},
             {"columns", {{"added", d.addedColumns},
                          {"removed", d.removedColumns},
                          {"modified", d.modifiedColumns}}},
             {"indexes", {{"added", d.addedIndexes},
                          {"removed", d.removedIndexes},
                          {"modified", d.modifiedIndexes}}},
             {"foreign_keys", {{"added", d.addedForeignKeys},
                               {"removed", d.removedForeignKeys},
                               {"modified", d.modifiedForeignKeys}}},
             {"constraints", {{"added", d.addedConstraints},
                              {"removed", d.removedConstraints},
                              {"modified", d.modifiedConstraints}}}};
    putOptional(j, "primary_key", d.primaryKeyChange);
}

void to_json(json& j, const ViewDiff& d) {
    j = json{{"view", d.qualifiedName()}};
    putChange(j, "definition", d.definitionChange);
    putChange(j, "materialized", d.materializedChange);
}

void to_json(json& j, const FunctionDiff& d) {
    j = json{{"function", d.qualifiedName()}};
    putChange(j, "return_type", d.returnTypeChange);
    putChange(j, "language", d.languageChange);
    putChange(j, "definition", d.definitionChange);
}

void to_json(json& j, const ProcedureDiff& d) {
    j = json{{"procedure", d.qualifiedName()}};
    putChange(j, "language", d.languageChange);
    putChange(j, "definition", d.definitionChange);
}

void to_json(json& j, const TriggerDiff& d) {
    j = json{{"trigger", d.qualifiedName()}, {"table", d.tableName}};
    putChange(j, "definition", d.definitionChange);
    putChange(j, "enabled", d.enabledChange);
}

void to_json(json& j, const SequenceDiff& d) {
    j = json{{"sequence", d.qualifiedName()}};
    putChange(j, "start_value", d.startValueChange);
    putChange(j, "increment_by", d.incrementChange);
    putChange(j, "min_value", d.minValueChange);
    putChange(j, "max_value", d.maxValueChange);
}

void to_json(json& j, const TypeDiff& d) {
    j = json{{"type", d.qualifiedName()}};
    putChange(j, "values", d.valuesChange);
    putChange(j, "definition", d.definitionChange);
}

// ============================================================================
// JsonCodec
// ============================================================================

json JsonCodec::parse(const std::string& text) {
    try {
        return json::parse(text);
    } catch (const json::exception& e) {
        throw SpecFormatError("JSON parse error: " + std::string(e.what()));
    }
}

json JsonCodec::loadFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw SpecFormatError("Cannot open " + path.string());
    }
    std::ostringstream content;
    content << file.rdbuf();
    return parse(content.str());
}

PolicySpec JsonCodec::policyFromJson(const json& doc) {
    return decode("policy", [&] {
        requireObject(doc, "policy");
        PolicySpec spec(requireString(doc, "name"), requireString(doc, "table"));
        spec.schema = optionalField<std::string>(doc, "schema");
        spec.command = parsePolicyCommand(doc.value("command", std::string("ALL")));
        spec.policyType = parsePolicyType(doc.value("type", std::string("PERMISSIVE")));
        spec.roles = stringList(doc, "roles");
        spec.usingExpr = optionalField<std::string>(doc, "using");
        spec.checkExpr = optionalField<std::string>(doc, "check");
        return spec;
    });
}

TriggerSpec JsonCodec::triggerFromJson(const json& doc) {
    return decode("trigger", [&] {
        requireObject(doc, "trigger");
        TriggerSpec spec(requireString(doc, "name"), requireString(doc, "table"));
        spec.schema = optionalField<std::string>(doc, "schema");
        spec.timing = parseTriggerTiming(doc.value("timing", std::string("AFTER")));
        if (doc.contains("events")) {
            spec.events.clear();
            for (const auto& event : stringList(doc, "events")) {
                spec.addEvent(parseTriggerEvent(event));
            }
        }
        spec.level = parseTriggerLevel(doc.value("level", std::string("ROW")));
        spec.whenCondition = optionalField<std::string>(doc, "when");
        spec.functionName = optionalField<std::string>(doc, "function");
        spec.body = optionalField<std::string>(doc, "body");
        spec.updateColumns = stringList(doc, "update_columns");
        spec.comment = optionalField<std::string>(doc, "comment");
        return spec;
    });
}

FunctionSpec JsonCodec::functionFromJson(const json& doc) {
    return decode("function", [&] {
        requireObject(doc, "function");
        FunctionSpec spec(requireString(doc, "name"), doc.value("return_type", std::string()));
        spec.schema = optionalField<std::string>(doc, "schema");
        spec.parameters = paramListFromJson(doc, "parameters");
        spec.body = optionalField<std::string>(doc, "body");
        if (doc.contains("language")) {
            spec.language = FunctionLanguage::parse(requireString(doc, "language"));
        }
        spec.volatility = parseVolatility(doc.value("volatility", std::string("VOLATILE")));
        spec.nullBehavior = parseNullBehavior(doc.value("null_behavior", std::string("CALLED ON NULL INPUT")));
        spec.security = parseSecurityMode(doc.value("security", std::string("INVOKER")));
        spec.parallelSafe = doc.value("parallel_safe", false);
        spec.cost = optionalField<uint32_t>(doc, "cost");
        spec.rows = optionalField<uint32_t>(doc, "rows");
        spec.isSetReturning = doc.value("returns_set", false);
        if (doc.contains("returns_table")) {
            spec.tableColumns = paramListFromJson(doc, "returns_table");
        }
        spec.comment = optionalField<std::string>(doc, "comment");
        return spec;
    });
}

TableDesign JsonCodec::tableFromJson(const json& doc, Dialect fallbackDialect) {
    return decode("table", [&] {
        requireObject(doc, "table");
        Dialect dialect = doc.contains("dialect") ? parseDialect(requireString(doc, "dialect"))
                                                  : fallbackDialect;
        TableDesign design(requireString(doc, "name"), dialect);
        design.schema = optionalField<std::string>(doc, "schema");
        design.comment = optionalField<std::string>(doc, "comment");

        for (const auto& item : doc.value("columns", json::array())) {
            design.columns.push_back(columnDesignFromJson(item));
        }
        if (design.primaryKeyColumns().size() > 1) {
            for (auto& column : design.columns) {
                column.isPartOfCompositePk = column.isPrimaryKey;
            }
        }
        for (const auto& item : doc.value("indexes", json::array())) {
            design.indexes.push_back(indexDesignFromJson(item));
        }
        for (const auto& item : doc.value("foreign_keys", json::array())) {
            design.foreignKeys.push_back(foreignKeyDesignFromJson(item));
        }
        if (doc.contains("options")) {
            design.options = tableOptionsFromJson(doc.at("options"));
        }
        return design;
    });
}

SchemaSnapshot JsonCodec::snapshotFromJson(const json& doc) {
    return decode("schema snapshot", [&] {
        requireObject(doc, "schema snapshot");
        SchemaSnapshot snapshot;
        snapshot.tables = doc.value("tables", json::array()).get<std::vector<TableDetails>>();
        snapshot.views = doc.value("views", json::array()).get<std::vector<ViewInfo>>();
        snapshot.functions = doc.value("functions", json::array()).get<std::vector<FunctionInfo>>();
        snapshot.procedures = doc.value("procedures", json::array()).get<std::vector<ProcedureInfo>>();
        snapshot.triggers = doc.value("triggers", json::array()).get<std::vector<TriggerInfo>>();
        snapshot.sequences = doc.value("sequences", json::array()).get<std::vector<SequenceInfo>>();
        snapshot.types = doc.value("types", json::array()).get<std::vector<TypeInfo>>();
        return snapshot;
    });
}

json JsonCodec::diffToJson(const SchemaDiff& diff) {
    json out = json::object();
    out["summary"] = json{{"change_count", diff.changeCount()},
                          {"empty", diff.isEmpty()},
                          {"breaking", diff.hasBreakingChanges()}};
    out["tables"] = json{{"added", diff.addedTables},
                         {"removed", diff.removedTables},
                         {"modified", diff.modifiedTables}};
    out["views"] = json{{"added", diff.addedViews},
                        {"removed", diff.removedViews},
                        {"modified", diff.modifiedViews}};
    out["functions"] = json{{"added", diff.addedFunctions},
                            {"removed", diff.removedFunctions},
                            {"modified", diff.modifiedFunctions}};
    out["procedures"] = json{{"added", diff.addedProcedures},
                             {"removed", diff.removedProcedures},
                             {"modified", diff.modifiedProcedures}};
    out["triggers"] = json{{"added", diff.addedTriggers},
                           {"removed", diff.removedTriggers},
                           {"modified", diff.modifiedTriggers}};
    out["sequences"] = json{{"added", diff.addedSequences},
                            {"removed", diff.removedSequences},
                            {"modified", diff.modifiedSequences}};
    out["types"] = json{{"added", diff.addedTypes},
                        {"removed", diff.removedTypes},
                        {"modified", diff.modifiedTypes}};
    return out;
}

std::string JsonCodec::dumpDiff(const SchemaDiff& diff, const JsonOutputOptions& options) {
    json out = diffToJson(diff);
    return options.pretty ? out.dump(options.indent) : out.dump();
}

}  // namespace schemaforge
