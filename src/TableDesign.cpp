#include "TableDesign.hpp"
#include <algorithm>

namespace schemaforge {

std::string ColumnDesign::typeSpec() const {
    std::string spec = dataType;
    if (length) {
        if (scale) {
            spec += "(" + std::to_string(*length) + ", " + std::to_string(*scale) + ")";
        } else {
            spec += "(" + std::to_string(*length) + ")";
        }
    }
    return spec;
}

ColumnDesign ColumnDesign::fromColumnInfo(const ColumnInfo& info) {
    ColumnDesign column(info.name, info.dataType);
    if (info.maxLength && *info.maxLength > 0) {
        column.length = static_cast<uint32_t>(*info.maxLength);
    } else if (info.precision && *info.precision > 0) {
        column.length = static_cast<uint32_t>(*info.precision);
    }
    if (info.scale && *info.scale >= 0 && column.length) {
        column.scale = static_cast<uint32_t>(*info.scale);
    }
    column.nullable = info.nullable;
    column.defaultValue = info.defaultValue;
    column.isPrimaryKey = info.isPrimaryKey;
    column.isAutoIncrement = info.isAutoIncrement;
    column.isUnique = info.isUnique;
    column.comment = info.comment;
    return column;
}

ForeignKeyDesign ForeignKeyDesign::fromForeignKeyInfo(const ForeignKeyInfo& info) {
    ForeignKeyDesign fk;
    if (!info.name.empty()) {
        fk.name = info.name;
    }
    fk.columns = info.columns;
    fk.referencedTable = info.referencedTable;
    fk.referencedSchema = info.referencedSchema;
    fk.referencedColumns = info.referencedColumns;
    fk.onUpdate = info.onUpdate;
    fk.onDelete = info.onDelete;
    return fk;
}

IndexDesign IndexDesign::fromIndexInfo(const IndexInfo& info) {
    IndexDesign index(info.name, info.columns);
    index.isUnique = info.isUnique;
    index.isPrimary = info.isPrimary;
    if (!info.indexType.empty()) {
        index.indexType = info.indexType;
    }
    return index;
}

std::vector<std::string> TableDesign::primaryKeyColumns() const {
    std::vector<std::string> result;
    for (const auto& column : columns) {
        if (column.isPrimaryKey) {
            result.push_back(column.name);
        }
    }
    return result;
}

const ColumnDesign* TableDesign::findColumn(const std::string& columnName) const {
    auto it = std::find_if(columns.begin(), columns.end(),
                           [&](const ColumnDesign& c) { return c.name == columnName; });
    return it == columns.end() ? nullptr : &*it;
}

TableDesign TableDesign::fromTableDetails(const TableDetails& details, Dialect dialect) {
    TableDesign design(details.info.name, dialect);
    design.schema = details.info.schema;
    design.comment = details.info.comment;

    for (const auto& info : details.columns) {
        design.columns.push_back(ColumnDesign::fromColumnInfo(info));
    }

    if (details.primaryKey) {
        const auto& pkColumns = details.primaryKey->columns;
        bool composite = pkColumns.size() > 1;
        for (auto& column : design.columns) {
            if (std::find(pkColumns.begin(), pkColumns.end(), column.name) != pkColumns.end()) {
                column.isPrimaryKey = true;
                column.isPartOfCompositePk = composite;
            }
        }
    }

    for (const auto& index : details.indexes) {
        design.indexes.push_back(IndexDesign::fromIndexInfo(index));
    }
    for (const auto& fk : details.foreignKeys) {
        design.foreignKeys.push_back(ForeignKeyDesign::fromForeignKeyInfo(fk));
    }
    return design;
}

}  // namespace schemaforge
