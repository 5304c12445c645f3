#pragma once

#include "Dialect.hpp"
#include "SchemaModel.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace schemaforge {

struct ColumnDesign {
    std::string name;
    std::string dataType;
    std::optional<uint32_t> length;
    std::optional<uint32_t> scale;
    bool nullable = true;
    bool isPrimaryKey = false;
    bool isPartOfCompositePk = false;
    bool isAutoIncrement = false;
    bool isUnique = false;
    std::optional<std::string> defaultValue;
    std::optional<std::string> generatedExpression;
    bool generatedStored = false;
    std::optional<std::string> comment;

    ColumnDesign() = default;
    ColumnDesign(std::string columnName, std::string type)
        : name(std::move(columnName)), dataType(std::move(type)) {}

    ColumnDesign& withLength(uint32_t value) { length = value; return *this; }
    ColumnDesign& withScale(uint32_t value) { scale = value; return *this; }
    ColumnDesign& notNull() { nullable = false; return *this; }
    ColumnDesign& primaryKey() { isPrimaryKey = true; nullable = false; return *this; }
    ColumnDesign& autoIncrement() { isAutoIncrement = true; return *this; }
    ColumnDesign& unique() { isUnique = true; return *this; }
    ColumnDesign& withDefault(std::string value) { defaultValue = std::move(value); return *this; }
    ColumnDesign& withComment(std::string value) { comment = std::move(value); return *this; }
    ColumnDesign& generatedAs(std::string expression, bool stored) {
        generatedExpression = std::move(expression);
        generatedStored = stored;
        return *this;
    }

    // Type with length and scale, e.g. VARCHAR(255) or DECIMAL(10, 2)
    std::string typeSpec() const;

    static ColumnDesign fromColumnInfo(const ColumnInfo& info);
};

struct ForeignKeyDesign {
    std::optional<std::string> name;
    std::vector<std::string> columns;
    std::string referencedTable;
    std::optional<std::string> referencedSchema;
    std::vector<std::string> referencedColumns;
    ForeignKeyAction onUpdate = ForeignKeyAction::NoAction;
    ForeignKeyAction onDelete = ForeignKeyAction::NoAction;

    ForeignKeyDesign& withName(std::string value) { name = std::move(value); return *this; }
    ForeignKeyDesign& column(std::string value) { columns.push_back(std::move(value)); return *this; }
    ForeignKeyDesign& references(std::string table) { referencedTable = std::move(table); return *this; }
    ForeignKeyDesign& referencedColumn(std::string value) {
        referencedColumns.push_back(std::move(value));
        return *this;
    }
    ForeignKeyDesign& withOnUpdate(ForeignKeyAction action) { onUpdate = action; return *this; }
    ForeignKeyDesign& withOnDelete(ForeignKeyAction action) { onDelete = action; return *this; }

    static ForeignKeyDesign fromForeignKeyInfo(const ForeignKeyInfo& info);
};

struct IndexDesign {
    std::string name;
    std::vector<std::string> columns;
    bool isUnique = false;
    bool isPrimary = false;
    std::optional<std::string> indexType;

    IndexDesign() = default;
    IndexDesign(std::string indexName, std::vector<std::string> indexColumns)
        : name(std::move(indexName)), columns(std::move(indexColumns)) {}

    IndexDesign& unique() { isUnique = true; return *this; }
    IndexDesign& primary() { isPrimary = true; return *this; }

    static IndexDesign fromIndexInfo(const IndexInfo& info);
};

struct TableOptions {
    // MySQL
    std::optional<std::string> engine;
    std::optional<std::string> charset;
    std::optional<std::string> collation;
    std::optional<uint64_t> autoIncrementStart;
    std::optional<std::string> rowFormat;

    // SQLite
    bool withoutRowid = false;
    bool strict = false;

    bool hasOptions() const {
        return engine || charset || collation || autoIncrementStart || rowFormat ||
               withoutRowid || strict;
    }
};

// Editable table definition, the input of CREATE TABLE and ALTER TABLE generation
struct TableDesign {
    std::string tableName;
    std::optional<std::string> schema;
    Dialect dialect = Dialect::PostgreSQL;
    std::vector<ColumnDesign> columns;
    std::vector<IndexDesign> indexes;
    std::vector<ForeignKeyDesign> foreignKeys;
    TableOptions options;
    std::optional<std::string> comment;

    TableDesign() = default;
    TableDesign(std::string name, Dialect tableDialect)
        : tableName(std::move(name)), dialect(tableDialect) {}

    TableDesign& withSchema(std::string value) { schema = std::move(value); return *this; }
    TableDesign& withColumn(ColumnDesign column) { columns.push_back(std::move(column)); return *this; }
    TableDesign& withIndex(IndexDesign index) { indexes.push_back(std::move(index)); return *this; }
    TableDesign& withForeignKey(ForeignKeyDesign fk) { foreignKeys.push_back(std::move(fk)); return *this; }
    TableDesign& withOptions(TableOptions value) { options = std::move(value); return *this; }
    TableDesign& withComment(std::string value) { comment = std::move(value); return *this; }

    // Columns flagged as primary key, in declaration order
    std::vector<std::string> primaryKeyColumns() const;

    const ColumnDesign* findColumn(const std::string& columnName) const;

    // Build a design from introspected table details
    static TableDesign fromTableDetails(const TableDetails& details, Dialect dialect);
};

}  // namespace schemaforge
