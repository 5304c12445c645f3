#include "SchemaModel.hpp"
#include "StringUtils.hpp"
#include <stdexcept>

namespace schemaforge {

std::string foreignKeyActionToSql(ForeignKeyAction action) {
    switch (action) {
        case ForeignKeyAction::NoAction: return "NO ACTION";
        case ForeignKeyAction::Restrict: return "RESTRICT";
        case ForeignKeyAction::Cascade: return "CASCADE";
        case ForeignKeyAction::SetNull: return "SET NULL";
        case ForeignKeyAction::SetDefault: return "SET DEFAULT";
    }
    return "NO ACTION";
}

ForeignKeyAction parseForeignKeyAction(const std::string& text) {
    std::string upper = toUpper(trim(text));
    for (auto& c : upper) {
        if (c == '_') c = ' ';
    }
    if (upper == "NO ACTION" || upper == "NOACTION") return ForeignKeyAction::NoAction;
    if (upper == "RESTRICT") return ForeignKeyAction::Restrict;
    if (upper == "CASCADE") return ForeignKeyAction::Cascade;
    if (upper == "SET NULL" || upper == "SETNULL") return ForeignKeyAction::SetNull;
    if (upper == "SET DEFAULT" || upper == "SETDEFAULT") return ForeignKeyAction::SetDefault;
    throw std::invalid_argument("Unknown foreign key action: " + text);
}

std::string tableTypeToString(TableType type) {
    switch (type) {
        case TableType::Table: return "table";
        case TableType::View: return "view";
        case TableType::MaterializedView: return "materialized_view";
        case TableType::ForeignTable: return "foreign_table";
        case TableType::Temporary: return "temporary";
        case TableType::System: return "system";
    }
    return "table";
}

TableType parseTableType(const std::string& text) {
    std::string lower = toLower(trim(text));
    if (lower == "table" || lower == "base table") return TableType::Table;
    if (lower == "view") return TableType::View;
    if (lower == "materialized_view" || lower == "materialized view") return TableType::MaterializedView;
    if (lower == "foreign_table" || lower == "foreign table") return TableType::ForeignTable;
    if (lower == "temporary") return TableType::Temporary;
    if (lower == "system") return TableType::System;
    throw std::invalid_argument("Unknown table type: " + text);
}

std::string constraintTypeToString(ConstraintType type) {
    switch (type) {
        case ConstraintType::PrimaryKey: return "primary_key";
        case ConstraintType::ForeignKey: return "foreign_key";
        case ConstraintType::Unique: return "unique";
        case ConstraintType::Check: return "check";
        case ConstraintType::Exclusion: return "exclusion";
    }
    return "check";
}

ConstraintType parseConstraintType(const std::string& text) {
    std::string lower = toLower(trim(text));
    if (lower == "primary_key" || lower == "primary key") return ConstraintType::PrimaryKey;
    if (lower == "foreign_key" || lower == "foreign key") return ConstraintType::ForeignKey;
    if (lower == "unique") return ConstraintType::Unique;
    if (lower == "check") return ConstraintType::Check;
    if (lower == "exclusion" || lower == "exclude") return ConstraintType::Exclusion;
    throw std::invalid_argument("Unknown constraint type: " + text);
}

std::string typeKindToString(TypeKind kind) {
    switch (kind) {
        case TypeKind::Enum: return "enum";
        case TypeKind::Composite: return "composite";
        case TypeKind::Domain: return "domain";
        case TypeKind::Range: return "range";
        case TypeKind::Base: return "base";
    }
    return "base";
}

TypeKind parseTypeKind(const std::string& text) {
    std::string lower = toLower(trim(text));
    if (lower == "enum") return TypeKind::Enum;
    if (lower == "composite") return TypeKind::Composite;
    if (lower == "domain") return TypeKind::Domain;
    if (lower == "range") return TypeKind::Range;
    if (lower == "base") return TypeKind::Base;
    throw std::invalid_argument("Unknown type kind: " + text);
}

}  // namespace schemaforge
