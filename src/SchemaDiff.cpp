#include "SchemaDiff.hpp"
#include <algorithm>

namespace schemaforge {

namespace {

std::string qualify(const std::optional<std::string>& schema, const std::string& name) {
    return schema ? *schema + "." + name : name;
}

}  // namespace

// ============================================================================
// ColumnDiff
// ============================================================================

bool ColumnDiff::isEmpty() const {
    return !typeChange && !nullableChange && !defaultChange && !maxLengthChange &&
           !precisionChange && !scaleChange && !commentChange;
}

bool ColumnDiff::isSafe() const {
    return !(nullableChange && nullableChange->current && !nullableChange->desired);
}

// ============================================================================
// PrimaryKeyChange
// ============================================================================

PrimaryKeyChange PrimaryKeyChange::added(PrimaryKeyInfo key) {
    PrimaryKeyChange change;
    change.kind = Kind::Added;
    change.desired = std::move(key);
    return change;
}

PrimaryKeyChange PrimaryKeyChange::removed(PrimaryKeyInfo key) {
    PrimaryKeyChange change;
    change.kind = Kind::Removed;
    change.current = std::move(key);
    return change;
}

PrimaryKeyChange PrimaryKeyChange::modified(PrimaryKeyInfo currentKey, PrimaryKeyInfo desiredKey) {
    PrimaryKeyChange change;
    change.kind = Kind::Modified;
    change.current = std::move(currentKey);
    change.desired = std::move(desiredKey);
    return change;
}

std::string primaryKeyChangeKindToString(PrimaryKeyChange::Kind kind) {
    switch (kind) {
        case PrimaryKeyChange::Kind::Added:
            return "added";
        case PrimaryKeyChange::Kind::Removed:
            return "removed";
        case PrimaryKeyChange::Kind::Modified:
            return "modified";
    }
    return "modified";
}

// ============================================================================
// TableDiff
// ============================================================================

std::string TableDiff::qualifiedName() const {
    return qualify(schema, tableName);
}

bool TableDiff::isEmpty() const {
    return addedColumns.empty() && removedColumns.empty() && modifiedColumns.empty() &&
           addedIndexes.empty() && removedIndexes.empty() && modifiedIndexes.empty() &&
           addedForeignKeys.empty() && removedForeignKeys.empty() && modifiedForeignKeys.empty() &&
           addedConstraints.empty() && removedConstraints.empty() && modifiedConstraints.empty() &&
           !primaryKeyChange;
}

bool TableDiff::isSafe() const {
    bool columnsSafe = std::all_of(modifiedColumns.begin(), modifiedColumns.end(),
                                   [](const ColumnDiff& c) { return c.isSafe(); });
    return removedColumns.empty() && columnsSafe && removedIndexes.empty() &&
           removedForeignKeys.empty() && removedConstraints.empty() &&
           (!primaryKeyChange || primaryKeyChange->isSafe());
}

// ============================================================================
// Other object diffs
// ============================================================================

std::string ViewDiff::qualifiedName() const {
    return qualify(schema, viewName);
}

std::string FunctionDiff::qualifiedName() const {
    return qualify(schema, functionName);
}

std::string ProcedureDiff::qualifiedName() const {
    return qualify(schema, procedureName);
}

std::string TriggerDiff::qualifiedName() const {
    return qualify(schema, triggerName);
}

std::string SequenceDiff::qualifiedName() const {
    return qualify(schema, sequenceName);
}

std::string TypeDiff::qualifiedName() const {
    return qualify(schema, typeName);
}

// ============================================================================
// SchemaDiff
// ============================================================================

size_t SchemaDiff::changeCount() const {
    return addedTables.size() + removedTables.size() + modifiedTables.size() +
           addedViews.size() + removedViews.size() + modifiedViews.size() +
           addedFunctions.size() + removedFunctions.size() + modifiedFunctions.size() +
           addedProcedures.size() + removedProcedures.size() + modifiedProcedures.size() +
           addedTriggers.size() + removedTriggers.size() + modifiedTriggers.size() +
           addedSequences.size() + removedSequences.size() + modifiedSequences.size() +
           addedTypes.size() + removedTypes.size() + modifiedTypes.size();
}

bool SchemaDiff::hasBreakingChanges() const {
    bool tablesSafe = std::all_of(modifiedTables.begin(), modifiedTables.end(),
                                  [](const TableDiff& t) { return t.isSafe(); });
    return !removedTables.empty() || !tablesSafe || !removedViews.empty() ||
           !removedFunctions.empty() || !removedProcedures.empty() || !removedTriggers.empty() ||
           !removedSequences.empty() || !removedTypes.empty();
}

}  // namespace schemaforge
