#pragma once

#include "FunctionSpec.hpp"
#include "TriggerSpec.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace schemaforge {

// Introspected schema objects, as produced by a catalog reader. These are the
// inputs of SchemaComparator.

enum class ForeignKeyAction {
    NoAction,
    Restrict,
    Cascade,
    SetNull,
    SetDefault
};

enum class TableType {
    Table,
    View,
    MaterializedView,
    ForeignTable,
    Temporary,
    System
};

enum class ConstraintType {
    PrimaryKey,
    ForeignKey,
    Unique,
    Check,
    Exclusion
};

enum class TypeKind {
    Enum,
    Composite,
    Domain,
    Range,
    Base
};

std::string foreignKeyActionToSql(ForeignKeyAction action);
ForeignKeyAction parseForeignKeyAction(const std::string& text);
std::string tableTypeToString(TableType type);
TableType parseTableType(const std::string& text);
std::string constraintTypeToString(ConstraintType type);
ConstraintType parseConstraintType(const std::string& text);
std::string typeKindToString(TypeKind kind);
TypeKind parseTypeKind(const std::string& text);

struct ColumnInfo {
    std::string name;
    size_t ordinal = 0;
    std::string dataType;
    bool nullable = true;
    std::optional<std::string> defaultValue;
    std::optional<int64_t> maxLength;
    std::optional<int32_t> precision;
    std::optional<int32_t> scale;
    bool isPrimaryKey = false;
    bool isAutoIncrement = false;
    bool isUnique = false;
    std::optional<std::string> comment;
};

struct IndexInfo {
    std::string name;
    std::vector<std::string> columns;
    bool isUnique = false;
    bool isPrimary = false;
    std::string indexType;  // btree, hash, gin, ...
    std::optional<std::string> comment;
};

struct ForeignKeyInfo {
    std::string name;
    std::vector<std::string> columns;
    std::string referencedTable;
    std::optional<std::string> referencedSchema;
    std::vector<std::string> referencedColumns;
    ForeignKeyAction onUpdate = ForeignKeyAction::NoAction;
    ForeignKeyAction onDelete = ForeignKeyAction::NoAction;
};

struct PrimaryKeyInfo {
    std::optional<std::string> name;
    std::vector<std::string> columns;
};

struct ConstraintInfo {
    std::string name;
    ConstraintType constraintType = ConstraintType::Check;
    std::vector<std::string> columns;
    std::optional<std::string> definition;
};

struct TriggerInfo {
    std::optional<std::string> schema;
    std::string name;
    std::string tableName;
    TriggerTiming timing = TriggerTiming::After;
    std::vector<TriggerEvent> events;
    TriggerLevel forEach = TriggerLevel::Row;
    std::optional<std::string> definition;
    bool enabled = true;
    std::optional<std::string> comment;
};

struct TableInfo {
    std::optional<std::string> schema;
    std::string name;
    TableType tableType = TableType::Table;
    std::optional<std::string> owner;
    std::optional<int64_t> rowCount;
    std::optional<int64_t> sizeBytes;
    std::optional<std::string> comment;
};

struct TableDetails {
    TableInfo info;
    std::vector<ColumnInfo> columns;
    std::optional<PrimaryKeyInfo> primaryKey;
    std::vector<ForeignKeyInfo> foreignKeys;
    std::vector<IndexInfo> indexes;
    std::vector<ConstraintInfo> constraints;
    std::vector<TriggerInfo> triggers;
};

struct ViewInfo {
    std::optional<std::string> schema;
    std::string name;
    bool isMaterialized = false;
    std::optional<std::string> definition;
    std::optional<std::string> owner;
    std::optional<std::string> comment;
};

struct ParameterInfo {
    std::optional<std::string> name;
    std::string dataType;
    ParameterMode mode = ParameterMode::In;
    std::optional<std::string> defaultValue;
    size_t ordinal = 0;
};

struct FunctionInfo {
    std::optional<std::string> schema;
    std::string name;
    std::string language;
    std::string returnType;
    std::vector<ParameterInfo> parameters;
    std::optional<std::string> definition;
    std::optional<std::string> owner;
    std::optional<std::string> comment;
};

struct ProcedureInfo {
    std::optional<std::string> schema;
    std::string name;
    std::string language;
    std::vector<ParameterInfo> parameters;
    std::optional<std::string> definition;
    std::optional<std::string> owner;
    std::optional<std::string> comment;
};

struct SequenceInfo {
    std::optional<std::string> schema;
    std::string name;
    std::string dataType = "bigint";
    int64_t startValue = 1;
    int64_t minValue = 1;
    int64_t maxValue = INT64_MAX;
    int64_t incrementBy = 1;
    std::optional<int64_t> currentValue;
    std::optional<std::string> owner;
    std::optional<std::string> comment;
};

struct TypeInfo {
    std::optional<std::string> schema;
    std::string name;
    TypeKind typeKind = TypeKind::Base;
    std::optional<std::vector<std::string>> values;  // enum labels
    std::optional<std::string> definition;
    std::optional<std::string> owner;
    std::optional<std::string> comment;
};

// Everything a catalog reader produced for one schema
struct SchemaSnapshot {
    std::vector<TableDetails> tables;
    std::vector<ViewInfo> views;
    std::vector<FunctionInfo> functions;
    std::vector<ProcedureInfo> procedures;
    std::vector<TriggerInfo> triggers;
    std::vector<SequenceInfo> sequences;
    std::vector<TypeInfo> types;
};

}  // namespace schemaforge
