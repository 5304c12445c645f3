#include "AlterGenerator.hpp"
#include "DdlSynthesizer.hpp"
#include <spdlog/spdlog.h>

namespace schemaforge {

namespace {

bool sameColumnProperties(const ColumnDesign& a, const ColumnDesign& b) {
    return a.typeSpec() == b.typeSpec() && a.nullable == b.nullable &&
           a.defaultValue == b.defaultValue;
}

bool sameForeignKey(const ForeignKeyDesign& a, const ForeignKeyDesign& b) {
    return a.name == b.name && a.columns == b.columns && a.referencedTable == b.referencedTable &&
           a.referencedSchema == b.referencedSchema && a.referencedColumns == b.referencedColumns &&
           a.onUpdate == b.onUpdate && a.onDelete == b.onDelete;
}

bool sameIndex(const IndexDesign& a, const IndexDesign& b) {
    return a.columns == b.columns && a.isUnique == b.isUnique && a.indexType == b.indexType;
}

const ForeignKeyDesign* findForeignKey(const std::vector<ForeignKeyDesign>& keys,
                                       const ForeignKeyDesign& key) {
    for (const auto& candidate : keys) {
        if (key.name ? candidate.name == key.name : sameForeignKey(candidate, key)) {
            return &candidate;
        }
    }
    return nullptr;
}

const IndexDesign* findIndex(const std::vector<IndexDesign>& indexes, const std::string& name) {
    for (const auto& candidate : indexes) {
        if (!candidate.isPrimary && candidate.name == name) {
            return &candidate;
        }
    }
    return nullptr;
}

}  // namespace

std::vector<std::string> AlterGenerator::generateAlterTable(const TableDesign& original,
                                                            const TableDesign& modified) {
    const DdlSynthesizer& synth = DdlSynthesizer::forDialect(modified.dialect);
    const std::string table = synth.quoteTable(modified.schema, modified.tableName);
    std::vector<std::string> statements;

    if (original.tableName != modified.tableName) {
        statements.push_back(synth.renameTable(original, modified));
    }

    // ----- Columns -----

    for (const auto& column : original.columns) {
        if (!modified.findColumn(column.name)) {
            statements.push_back(synth.dropColumn(table, column.name));
        }
    }

    for (const auto& column : modified.columns) {
        if (!original.findColumn(column.name)) {
            statements.push_back(synth.addColumn(table, modified.tableName, column));
        }
    }

    for (const auto& after : modified.columns) {
        const ColumnDesign* before = original.findColumn(after.name);
        if (!before) {
            continue;
        }
        if (!sameColumnProperties(*before, after)) {
            auto altered = synth.alterColumn(table, modified.tableName, *before, after);
            if (!altered.empty() && !synth.capabilities().supportsAlterColumn) {
                spdlog::warn("{} cannot alter column {}.{}; emitting a comment instead",
                             dialectDisplayName(modified.dialect), modified.tableName, after.name);
            }
            statements.insert(statements.end(), altered.begin(), altered.end());
        }
        if (before->isUnique != after.isUnique && !after.isPrimaryKey) {
            auto unique = synth.alterUnique(table, modified.tableName, after);
            statements.insert(statements.end(), unique.begin(), unique.end());
        }
    }

    // ----- Foreign keys -----

    for (const auto& fk : original.foreignKeys) {
        const ForeignKeyDesign* kept = findForeignKey(modified.foreignKeys, fk);
        if (kept && sameForeignKey(*kept, fk)) {
            continue;
        }
        if (!fk.name) {
            spdlog::warn("Unnamed foreign key on {} ({}) cannot be dropped by name",
                         modified.tableName, fk.referencedTable);
            continue;
        }
        statements.push_back(synth.dropForeignKey(table, *fk.name));
    }

    for (const auto& fk : modified.foreignKeys) {
        const ForeignKeyDesign* existing = findForeignKey(original.foreignKeys, fk);
        if (!existing || !sameForeignKey(*existing, fk)) {
            statements.push_back(synth.addForeignKey(table, fk));
        }
    }

    // ----- Indexes -----

    for (const auto& index : original.indexes) {
        if (index.isPrimary) {
            continue;
        }
        const IndexDesign* kept = findIndex(modified.indexes, index.name);
        if (!kept || !sameIndex(*kept, index)) {
            statements.push_back(synth.dropIndex(table, original.schema, index.name));
        }
    }

    for (const auto& index : modified.indexes) {
        if (index.isPrimary) {
            continue;
        }
        const IndexDesign* existing = findIndex(original.indexes, index.name);
        if (!existing || !sameIndex(*existing, index)) {
            statements.push_back(synth.createIndex(table, index));
        }
    }

    spdlog::debug("Generated {} ALTER statement(s) for {}", statements.size(), modified.tableName);
    return statements;
}

}  // namespace schemaforge
