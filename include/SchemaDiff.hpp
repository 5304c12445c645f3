#pragma once

/**
 * @file SchemaDiff.hpp
 * @brief Typed differences between two schema snapshots.
 *
 * Every comparison has a desired side (the state a migration should reach)
 * and a current side (the baseline). Field changes are stored as
 * Change<T>{desired, current}; whole-entity modifications keep both
 * versions under the same names.
 */

#include "SchemaModel.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace schemaforge {

template <typename T>
struct Change {
    T desired;
    T current;
};

struct ColumnDiff {
    std::string columnName;
    std::optional<Change<std::string>> typeChange;
    std::optional<Change<bool>> nullableChange;
    std::optional<Change<std::optional<std::string>>> defaultChange;
    std::optional<Change<std::optional<int64_t>>> maxLengthChange;
    std::optional<Change<std::optional<int32_t>>> precisionChange;
    std::optional<Change<std::optional<int32_t>>> scaleChange;
    std::optional<Change<std::optional<std::string>>> commentChange;

    ColumnDiff() = default;
    explicit ColumnDiff(std::string name) : columnName(std::move(name)) {}

    bool isEmpty() const;

    // False when a nullable column becomes NOT NULL
    bool isSafe() const;
};

struct IndexDiff {
    std::string indexName;
    IndexInfo current;
    IndexInfo desired;
};

struct ConstraintDiff {
    std::string constraintName;
    ConstraintInfo current;
    ConstraintInfo desired;
};

struct ForeignKeyDiff {
    std::string foreignKeyName;
    std::optional<Change<ForeignKeyAction>> onUpdateChange;
    std::optional<Change<ForeignKeyAction>> onDeleteChange;
    std::optional<Change<std::string>> referencedTableChange;
    std::optional<Change<std::vector<std::string>>> columnsChange;

    ForeignKeyDiff() = default;
    explicit ForeignKeyDiff(std::string name) : foreignKeyName(std::move(name)) {}

    bool isEmpty() const {
        return !onUpdateChange && !onDeleteChange && !referencedTableChange && !columnsChange;
    }
};

struct PrimaryKeyChange {
    enum class Kind {
        Added,
        Removed,
        Modified
    };

    Kind kind = Kind::Added;
    std::optional<PrimaryKeyInfo> current;  // set for Removed and Modified
    std::optional<PrimaryKeyInfo> desired;  // set for Added and Modified

    static PrimaryKeyChange added(PrimaryKeyInfo key);
    static PrimaryKeyChange removed(PrimaryKeyInfo key);
    static PrimaryKeyChange modified(PrimaryKeyInfo currentKey, PrimaryKeyInfo desiredKey);

    bool isSafe() const { return kind == Kind::Added; }
};

std::string primaryKeyChangeKindToString(PrimaryKeyChange::Kind kind);

struct TableDiff {
    std::string tableName;
    std::optional<std::string> schema;

    std::vector<ColumnInfo> addedColumns;
    std::vector<ColumnInfo> removedColumns;
    std::vector<ColumnDiff> modifiedColumns;

    std::vector<IndexInfo> addedIndexes;
    std::vector<IndexInfo> removedIndexes;
    std::vector<IndexDiff> modifiedIndexes;

    std::vector<ForeignKeyInfo> addedForeignKeys;
    std::vector<ForeignKeyInfo> removedForeignKeys;
    std::vector<ForeignKeyDiff> modifiedForeignKeys;

    std::vector<ConstraintInfo> addedConstraints;
    std::vector<ConstraintInfo> removedConstraints;
    std::vector<ConstraintDiff> modifiedConstraints;

    std::optional<PrimaryKeyChange> primaryKeyChange;

    TableDiff() = default;
    TableDiff(std::string name, std::optional<std::string> tableSchema)
        : tableName(std::move(name)), schema(std::move(tableSchema)) {}

    std::string qualifiedName() const;
    bool isEmpty() const;

    // No removals, no column becoming NOT NULL, no primary key removed or modified
    bool isSafe() const;
};

struct ViewDiff {
    std::string viewName;
    std::optional<std::string> schema;
    std::optional<Change<std::optional<std::string>>> definitionChange;
    std::optional<Change<bool>> materializedChange;

    std::string qualifiedName() const;
    bool isEmpty() const { return !definitionChange && !materializedChange; }
};

struct FunctionDiff {
    std::string functionName;
    std::optional<std::string> schema;
    std::optional<Change<std::string>> returnTypeChange;
    std::optional<Change<std::string>> languageChange;
    std::optional<Change<std::optional<std::string>>> definitionChange;

    std::string qualifiedName() const;
    bool isEmpty() const { return !returnTypeChange && !languageChange && !definitionChange; }
};

struct ProcedureDiff {
    std::string procedureName;
    std::optional<std::string> schema;
    std::optional<Change<std::string>> languageChange;
    std::optional<Change<std::optional<std::string>>> definitionChange;

    std::string qualifiedName() const;
    bool isEmpty() const { return !languageChange && !definitionChange; }
};

struct TriggerDiff {
    std::string triggerName;
    std::string tableName;
    std::optional<std::string> schema;
    std::optional<Change<std::optional<std::string>>> definitionChange;
    std::optional<Change<bool>> enabledChange;

    std::string qualifiedName() const;
    bool isEmpty() const { return !definitionChange && !enabledChange; }
};

struct SequenceDiff {
    std::string sequenceName;
    std::optional<std::string> schema;
    std::optional<Change<int64_t>> startValueChange;
    std::optional<Change<int64_t>> incrementChange;
    std::optional<Change<int64_t>> minValueChange;
    std::optional<Change<int64_t>> maxValueChange;

    std::string qualifiedName() const;
    bool isEmpty() const {
        return !startValueChange && !incrementChange && !minValueChange && !maxValueChange;
    }
};

struct TypeDiff {
    std::string typeName;
    std::optional<std::string> schema;
    std::optional<Change<std::optional<std::vector<std::string>>>> valuesChange;
    std::optional<Change<std::optional<std::string>>> definitionChange;

    std::string qualifiedName() const;
    bool isEmpty() const { return !valuesChange && !definitionChange; }
};

// Added, removed and modified objects of every kind
struct SchemaDiff {
    std::vector<TableInfo> addedTables;
    std::vector<TableInfo> removedTables;
    std::vector<TableDiff> modifiedTables;

    std::vector<ViewInfo> addedViews;
    std::vector<ViewInfo> removedViews;
    std::vector<ViewDiff> modifiedViews;

    std::vector<FunctionInfo> addedFunctions;
    std::vector<FunctionInfo> removedFunctions;
    std::vector<FunctionDiff> modifiedFunctions;

    std::vector<ProcedureInfo> addedProcedures;
    std::vector<ProcedureInfo> removedProcedures;
    std::vector<ProcedureDiff> modifiedProcedures;

    std::vector<TriggerInfo> addedTriggers;
    std::vector<TriggerInfo> removedTriggers;
    std::vector<TriggerDiff> modifiedTriggers;

    std::vector<SequenceInfo> addedSequences;
    std::vector<SequenceInfo> removedSequences;
    std::vector<SequenceDiff> modifiedSequences;

    std::vector<TypeInfo> addedTypes;
    std::vector<TypeInfo> removedTypes;
    std::vector<TypeDiff> modifiedTypes;

    bool isEmpty() const { return changeCount() == 0; }

    // Number of added, removed and modified objects across all kinds
    size_t changeCount() const;

    // Removals of any kind, or a modified table that is not safe
    bool hasBreakingChanges() const;
};

}  // namespace schemaforge
