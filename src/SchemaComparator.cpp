#include "SchemaComparator.hpp"
#include "StringUtils.hpp"
#include <spdlog/spdlog.h>
#include <unordered_map>
#include <unordered_set>

namespace schemaforge {

namespace {

/**
 * Match two object lists by normalized name. Objects only in desired are
 * added, objects only in current are removed, and objects on both sides are
 * handed to compare(desired, current), whose non-empty result is recorded.
 */
template <typename Info, typename Diff, typename Normalize, typename Compare>
void matchByName(const std::vector<Info>& desired, const std::vector<Info>& current,
                 Normalize normalize, std::vector<Info>& added, std::vector<Info>& removed,
                 std::vector<Diff>& modified, Compare compare) {
    std::unordered_map<std::string, const Info*> desiredByName;
    std::unordered_map<std::string, const Info*> currentByName;
    for (const auto& item : desired) desiredByName[normalize(item.name)] = &item;
    for (const auto& item : current) currentByName[normalize(item.name)] = &item;

    for (const auto& item : desired) {
        auto it = currentByName.find(normalize(item.name));
        if (it == currentByName.end()) {
            added.push_back(item);
        } else if (auto diff = compare(item, *it->second)) {
            modified.push_back(std::move(*diff));
        }
    }

    for (const auto& item : current) {
        if (desiredByName.find(normalize(item.name)) == desiredByName.end()) {
            removed.push_back(item);
        }
    }
}

template <typename T>
std::optional<Change<T>> changeOf(const T& desired, const T& current) {
    if (desired == current) {
        return std::nullopt;
    }
    return Change<T>{desired, current};
}

template <typename T>
void append(std::vector<T>& target, const std::vector<T>& source) {
    target.insert(target.end(), source.begin(), source.end());
}

}  // namespace

std::string SchemaComparator::normalizeName(const std::string& name) const {
    return m_config.caseSensitive ? name : toLower(name);
}

// ============================================================================
// Tables
// ============================================================================

SchemaDiff SchemaComparator::compareTables(const std::vector<TableInfo>& desiredTables,
                                           const std::vector<TableInfo>& currentTables,
                                           const std::map<std::string, TableDetails>& desiredDetails,
                                           const std::map<std::string, TableDetails>& currentDetails) const {
    std::unordered_map<std::string, const TableDetails*> desiredByName;
    std::unordered_map<std::string, const TableDetails*> currentByName;
    for (const auto& entry : desiredDetails) desiredByName[normalizeName(entry.first)] = &entry.second;
    for (const auto& entry : currentDetails) currentByName[normalizeName(entry.first)] = &entry.second;

    auto normalize = [this](const std::string& name) { return normalizeName(name); };

    SchemaDiff diff;
    matchByName(desiredTables, currentTables, normalize, diff.addedTables, diff.removedTables,
                diff.modifiedTables,
                [&](const TableInfo& desired, const TableInfo&) -> std::optional<TableDiff> {
                    const std::string key = normalizeName(desired.name);
                    auto d = desiredByName.find(key);
                    auto c = currentByName.find(key);
                    if (d == desiredByName.end() || c == currentByName.end()) {
                        spdlog::debug("No details for table '{}', skipping structural diff",
                                      desired.name);
                        return std::nullopt;
                    }
                    return compareTableDetails(*d->second, *c->second);
                });
    return diff;
}

std::optional<TableDiff> SchemaComparator::compareTableDetails(const TableDetails& desired,
                                                               const TableDetails& current) const {
    TableDiff diff(desired.info.name, desired.info.schema);

    compareColumns(desired.columns, current.columns, diff);
    if (m_config.compareIndexes) {
        compareIndexes(desired.indexes, current.indexes, diff);
    }
    if (m_config.compareForeignKeys) {
        compareForeignKeys(desired.foreignKeys, current.foreignKeys, diff);
    }
    if (m_config.compareConstraints) {
        compareConstraints(desired.constraints, current.constraints, diff);
    }
    comparePrimaryKeys(desired.primaryKey, current.primaryKey, diff);

    if (diff.isEmpty()) {
        return std::nullopt;
    }
    return diff;
}

void SchemaComparator::compareColumns(const std::vector<ColumnInfo>& desired,
                                      const std::vector<ColumnInfo>& current, TableDiff& diff) const {
    matchByName(desired, current, [this](const std::string& n) { return normalizeName(n); },
                diff.addedColumns, diff.removedColumns, diff.modifiedColumns,
                [this](const ColumnInfo& d, const ColumnInfo& c) { return compareColumn(d, c); });
}

std::optional<ColumnDiff> SchemaComparator::compareColumn(const ColumnInfo& desired,
                                                          const ColumnInfo& current) const {
    ColumnDiff diff(desired.name);
    if (normalizeName(desired.dataType) != normalizeName(current.dataType)) {
        diff.typeChange = Change<std::string>{desired.dataType, current.dataType};
    }
    diff.nullableChange = changeOf(desired.nullable, current.nullable);
    diff.defaultChange = changeOf(desired.defaultValue, current.defaultValue);
    diff.maxLengthChange = changeOf(desired.maxLength, current.maxLength);
    diff.precisionChange = changeOf(desired.precision, current.precision);
    diff.scaleChange = changeOf(desired.scale, current.scale);
    if (m_config.compareComments) {
        diff.commentChange = changeOf(desired.comment, current.comment);
    }

    if (diff.isEmpty()) {
        return std::nullopt;
    }
    return diff;
}

void SchemaComparator::compareIndexes(const std::vector<IndexInfo>& desired,
                                      const std::vector<IndexInfo>& current, TableDiff& diff) const {
    matchByName(desired, current, [this](const std::string& n) { return normalizeName(n); },
                diff.addedIndexes, diff.removedIndexes, diff.modifiedIndexes,
                [this](const IndexInfo& d, const IndexInfo& c) -> std::optional<IndexDiff> {
                    if (indexesEqual(d, c)) {
                        return std::nullopt;
                    }
                    return IndexDiff{d.name, c, d};
                });
}

bool SchemaComparator::indexesEqual(const IndexInfo& a, const IndexInfo& b) const {
    return a.columns == b.columns && a.isUnique == b.isUnique && a.isPrimary == b.isPrimary &&
           normalizeName(a.indexType) == normalizeName(b.indexType);
}

void SchemaComparator::compareForeignKeys(const std::vector<ForeignKeyInfo>& desired,
                                          const std::vector<ForeignKeyInfo>& current,
                                          TableDiff& diff) const {
    matchByName(desired, current, [this](const std::string& n) { return normalizeName(n); },
                diff.addedForeignKeys, diff.removedForeignKeys, diff.modifiedForeignKeys,
                [this](const ForeignKeyInfo& d, const ForeignKeyInfo& c) {
                    return compareForeignKey(d, c);
                });
}

std::optional<ForeignKeyDiff> SchemaComparator::compareForeignKey(const ForeignKeyInfo& desired,
                                                                  const ForeignKeyInfo& current) const {
    ForeignKeyDiff diff(desired.name);
    diff.onUpdateChange = changeOf(desired.onUpdate, current.onUpdate);
    diff.onDeleteChange = changeOf(desired.onDelete, current.onDelete);
    if (normalizeName(desired.referencedTable) != normalizeName(current.referencedTable)) {
        diff.referencedTableChange = Change<std::string>{desired.referencedTable, current.referencedTable};
    }
    diff.columnsChange = changeOf(desired.columns, current.columns);

    if (diff.isEmpty()) {
        return std::nullopt;
    }
    return diff;
}

void SchemaComparator::compareConstraints(const std::vector<ConstraintInfo>& desired,
                                          const std::vector<ConstraintInfo>& current,
                                          TableDiff& diff) const {
    matchByName(desired, current, [this](const std::string& n) { return normalizeName(n); },
                diff.addedConstraints, diff.removedConstraints, diff.modifiedConstraints,
                [](const ConstraintInfo& d, const ConstraintInfo& c) -> std::optional<ConstraintDiff> {
                    if (d.constraintType == c.constraintType && d.columns == c.columns &&
                        d.definition == c.definition) {
                        return std::nullopt;
                    }
                    return ConstraintDiff{d.name, c, d};
                });
}

void SchemaComparator::comparePrimaryKeys(const std::optional<PrimaryKeyInfo>& desired,
                                          const std::optional<PrimaryKeyInfo>& current,
                                          TableDiff& diff) const {
    if (desired && !current) {
        diff.primaryKeyChange = PrimaryKeyChange::added(*desired);
    } else if (!desired && current) {
        diff.primaryKeyChange = PrimaryKeyChange::removed(*current);
    } else if (desired && current && desired->columns != current->columns) {
        diff.primaryKeyChange = PrimaryKeyChange::modified(*current, *desired);
    }
}

// ============================================================================
// Other schema objects
// ============================================================================

SchemaDiff SchemaComparator::compareViews(const std::vector<ViewInfo>& desired,
                                          const std::vector<ViewInfo>& current) const {
    SchemaDiff diff;
    matchByName(desired, current, [this](const std::string& n) { return normalizeName(n); },
                diff.addedViews, diff.removedViews, diff.modifiedViews,
                [](const ViewInfo& d, const ViewInfo& c) -> std::optional<ViewDiff> {
                    ViewDiff view{d.name, d.schema, changeOf(d.definition, c.definition),
                                  changeOf(d.isMaterialized, c.isMaterialized)};
                    if (view.isEmpty()) {
                        return std::nullopt;
                    }
                    return view;
                });
    return diff;
}

SchemaDiff SchemaComparator::compareFunctions(const std::vector<FunctionInfo>& desired,
                                              const std::vector<FunctionInfo>& current) const {
    SchemaDiff diff;
    matchByName(desired, current, [this](const std::string& n) { return normalizeName(n); },
                diff.addedFunctions, diff.removedFunctions, diff.modifiedFunctions,
                [this](const FunctionInfo& d, const FunctionInfo& c) -> std::optional<FunctionDiff> {
                    FunctionDiff function{d.name, d.schema, std::nullopt, std::nullopt,
                                          changeOf(d.definition, c.definition)};
                    if (normalizeName(d.returnType) != normalizeName(c.returnType)) {
                        function.returnTypeChange = Change<std::string>{d.returnType, c.returnType};
                    }
                    if (normalizeName(d.language) != normalizeName(c.language)) {
                        function.languageChange = Change<std::string>{d.language, c.language};
                    }
                    if (function.isEmpty()) {
                        return std::nullopt;
                    }
                    return function;
                });
    return diff;
}

SchemaDiff SchemaComparator::compareProcedures(const std::vector<ProcedureInfo>& desired,
                                               const std::vector<ProcedureInfo>& current) const {
    SchemaDiff diff;
    matchByName(desired, current, [this](const std::string& n) { return normalizeName(n); },
                diff.addedProcedures, diff.removedProcedures, diff.modifiedProcedures,
                [this](const ProcedureInfo& d, const ProcedureInfo& c) -> std::optional<ProcedureDiff> {
                    ProcedureDiff procedure{d.name, d.schema, std::nullopt,
                                            changeOf(d.definition, c.definition)};
                    if (normalizeName(d.language) != normalizeName(c.language)) {
                        procedure.languageChange = Change<std::string>{d.language, c.language};
                    }
                    if (procedure.isEmpty()) {
                        return std::nullopt;
                    }
                    return procedure;
                });
    return diff;
}

SchemaDiff SchemaComparator::compareTriggers(const std::vector<TriggerInfo>& desired,
                                             const std::vector<TriggerInfo>& current) const {
    SchemaDiff diff;
    if (!m_config.compareTriggers) {
        return diff;
    }
    matchByName(desired, current, [this](const std::string& n) { return normalizeName(n); },
                diff.addedTriggers, diff.removedTriggers, diff.modifiedTriggers,
                [](const TriggerInfo& d, const TriggerInfo& c) -> std::optional<TriggerDiff> {
                    TriggerDiff trigger{d.name, d.tableName, d.schema,
                                        changeOf(d.definition, c.definition),
                                        changeOf(d.enabled, c.enabled)};
                    if (trigger.isEmpty()) {
                        return std::nullopt;
                    }
                    return trigger;
                });
    return diff;
}

SchemaDiff SchemaComparator::compareSequences(const std::vector<SequenceInfo>& desired,
                                              const std::vector<SequenceInfo>& current) const {
    SchemaDiff diff;
    matchByName(desired, current, [this](const std::string& n) { return normalizeName(n); },
                diff.addedSequences, diff.removedSequences, diff.modifiedSequences,
                [](const SequenceInfo& d, const SequenceInfo& c) -> std::optional<SequenceDiff> {
                    SequenceDiff sequence{d.name, d.schema,
                                          changeOf(d.startValue, c.startValue),
                                          changeOf(d.incrementBy, c.incrementBy),
                                          changeOf(d.minValue, c.minValue),
                                          changeOf(d.maxValue, c.maxValue)};
                    if (sequence.isEmpty()) {
                        return std::nullopt;
                    }
                    return sequence;
                });
    return diff;
}

SchemaDiff SchemaComparator::compareTypes(const std::vector<TypeInfo>& desired,
                                          const std::vector<TypeInfo>& current) const {
    SchemaDiff diff;
    matchByName(desired, current, [this](const std::string& n) { return normalizeName(n); },
                diff.addedTypes, diff.removedTypes, diff.modifiedTypes,
                [](const TypeInfo& d, const TypeInfo& c) -> std::optional<TypeDiff> {
                    TypeDiff type{d.name, d.schema, changeOf(d.values, c.values),
                                  changeOf(d.definition, c.definition)};
                    if (type.isEmpty()) {
                        return std::nullopt;
                    }
                    return type;
                });
    return diff;
}

// ============================================================================
// Aggregation
// ============================================================================

SchemaDiff SchemaComparator::mergeDiffs(const std::vector<SchemaDiff>& diffs) const {
    SchemaDiff merged;
    for (const auto& diff : diffs) {
        append(merged.addedTables, diff.addedTables);
        append(merged.removedTables, diff.removedTables);
        append(merged.modifiedTables, diff.modifiedTables);
        append(merged.addedViews, diff.addedViews);
        append(merged.removedViews, diff.removedViews);
        append(merged.modifiedViews, diff.modifiedViews);
        append(merged.addedFunctions, diff.addedFunctions);
        append(merged.removedFunctions, diff.removedFunctions);
        append(merged.modifiedFunctions, diff.modifiedFunctions);
        append(merged.addedProcedures, diff.addedProcedures);
        append(merged.removedProcedures, diff.removedProcedures);
        append(merged.modifiedProcedures, diff.modifiedProcedures);
        append(merged.addedTriggers, diff.addedTriggers);
        append(merged.removedTriggers, diff.removedTriggers);
        append(merged.modifiedTriggers, diff.modifiedTriggers);
        append(merged.addedSequences, diff.addedSequences);
        append(merged.removedSequences, diff.removedSequences);
        append(merged.modifiedSequences, diff.modifiedSequences);
        append(merged.addedTypes, diff.addedTypes);
        append(merged.removedTypes, diff.removedTypes);
        append(merged.modifiedTypes, diff.modifiedTypes);
    }
    return merged;
}

SchemaDiff SchemaComparator::compareSnapshots(const SchemaSnapshot& desired,
                                              const SchemaSnapshot& current) const {
    auto split = [](const SchemaSnapshot& snapshot, std::vector<TableInfo>& tables,
                    std::map<std::string, TableDetails>& details) {
        for (const auto& table : snapshot.tables) {
            tables.push_back(table.info);
            details[table.info.name] = table;
        }
    };

    std::vector<TableInfo> desiredTables;
    std::vector<TableInfo> currentTables;
    std::map<std::string, TableDetails> desiredDetails;
    std::map<std::string, TableDetails> currentDetails;
    split(desired, desiredTables, desiredDetails);
    split(current, currentTables, currentDetails);

    SchemaDiff diff = mergeDiffs({
        compareTables(desiredTables, currentTables, desiredDetails, currentDetails),
        compareViews(desired.views, current.views),
        compareFunctions(desired.functions, current.functions),
        compareProcedures(desired.procedures, current.procedures),
        compareTriggers(desired.triggers, current.triggers),
        compareSequences(desired.sequences, current.sequences),
        compareTypes(desired.types, current.types),
    });

    spdlog::debug("Schema comparison found {} change(s)", diff.changeCount());
    return diff;
}

}  // namespace schemaforge
