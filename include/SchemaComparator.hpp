#pragma once

/**
 * @file SchemaComparator.hpp
 * @brief Structural comparison of two schema snapshots.
 *
 * Objects are matched by name (folded to lower case unless the comparison is
 * case sensitive). An object present only on the desired side is added, one
 * present only on the current side is removed, and one present on both sides
 * is diffed and reported only when the diff is not empty.
 *
 * Every compare function fills only the fields of its own object kind, so
 * partial results can be combined with mergeDiffs().
 */

#include "SchemaDiff.hpp"
#include "SchemaModel.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace schemaforge {

struct CompareConfig {
    bool compareComments = true;
    bool compareIndexes = true;
    bool compareForeignKeys = true;
    bool compareConstraints = true;
    bool compareTriggers = true;
    bool ignoreColumnOrder = false;
    bool caseSensitive = true;

    CompareConfig& withoutComments() { compareComments = false; return *this; }
    CompareConfig& withoutIndexes() { compareIndexes = false; return *this; }
    CompareConfig& withoutForeignKeys() { compareForeignKeys = false; return *this; }
    CompareConfig& withoutConstraints() { compareConstraints = false; return *this; }
    CompareConfig& withoutTriggers() { compareTriggers = false; return *this; }
    CompareConfig& withIgnoreColumnOrder() { ignoreColumnOrder = true; return *this; }
    CompareConfig& caseInsensitive() { caseSensitive = false; return *this; }
};

class SchemaComparator {
public:
    SchemaComparator() = default;
    explicit SchemaComparator(CompareConfig config) : m_config(config) {}

    const CompareConfig& config() const { return m_config; }

    /**
     * @brief Compare table lists, descending into tables present on both sides.
     * @param desiredDetails Details of the desired tables keyed by table name.
     * @param currentDetails Details of the current tables keyed by table name.
     *
     * A table present on both sides is only diffed when both detail maps hold
     * an entry for it.
     */
    SchemaDiff compareTables(const std::vector<TableInfo>& desiredTables,
                             const std::vector<TableInfo>& currentTables,
                             const std::map<std::string, TableDetails>& desiredDetails,
                             const std::map<std::string, TableDetails>& currentDetails) const;

    // Empty optional when the two tables are structurally identical
    std::optional<TableDiff> compareTableDetails(const TableDetails& desired,
                                                 const TableDetails& current) const;

    SchemaDiff compareViews(const std::vector<ViewInfo>& desired,
                            const std::vector<ViewInfo>& current) const;
    SchemaDiff compareFunctions(const std::vector<FunctionInfo>& desired,
                                const std::vector<FunctionInfo>& current) const;
    SchemaDiff compareProcedures(const std::vector<ProcedureInfo>& desired,
                                 const std::vector<ProcedureInfo>& current) const;

    // Empty diff when trigger comparison is disabled
    SchemaDiff compareTriggers(const std::vector<TriggerInfo>& desired,
                               const std::vector<TriggerInfo>& current) const;

    SchemaDiff compareSequences(const std::vector<SequenceInfo>& desired,
                                const std::vector<SequenceInfo>& current) const;
    SchemaDiff compareTypes(const std::vector<TypeInfo>& desired,
                            const std::vector<TypeInfo>& current) const;

    // Concatenate partial diffs into one report
    SchemaDiff mergeDiffs(const std::vector<SchemaDiff>& diffs) const;

    // Run every comparison over two full snapshots and merge the results
    SchemaDiff compareSnapshots(const SchemaSnapshot& desired, const SchemaSnapshot& current) const;

private:
    std::string normalizeName(const std::string& name) const;

    void compareColumns(const std::vector<ColumnInfo>& desired,
                        const std::vector<ColumnInfo>& current, TableDiff& diff) const;
    std::optional<ColumnDiff> compareColumn(const ColumnInfo& desired, const ColumnInfo& current) const;

    void compareIndexes(const std::vector<IndexInfo>& desired,
                        const std::vector<IndexInfo>& current, TableDiff& diff) const;
    bool indexesEqual(const IndexInfo& a, const IndexInfo& b) const;

    void compareForeignKeys(const std::vector<ForeignKeyInfo>& desired,
                            const std::vector<ForeignKeyInfo>& current, TableDiff& diff) const;
    std::optional<ForeignKeyDiff> compareForeignKey(const ForeignKeyInfo& desired,
                                                    const ForeignKeyInfo& current) const;

    void compareConstraints(const std::vector<ConstraintInfo>& desired,
                            const std::vector<ConstraintInfo>& current, TableDiff& diff) const;

    void comparePrimaryKeys(const std::optional<PrimaryKeyInfo>& desired,
                            const std::optional<PrimaryKeyInfo>& current, TableDiff& diff) const;

    CompareConfig m_config;
};

}  // namespace schemaforge
