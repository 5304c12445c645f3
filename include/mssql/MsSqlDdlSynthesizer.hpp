#pragma once

/**
 * @file MsSqlDdlSynthesizer.hpp
 * @brief SQL Server (T-SQL) DDL generation: triggers, functions, ALTER TABLE.
 *
 * SQL Server triggers are AFTER or INSTEAD OF only, always statement scoped,
 * and may list several events. Functions use @-prefixed parameters and come
 * in three shapes: inline table-valued, multi-statement table-valued and
 * scalar. Table renames go through sp_rename and column defaults live in
 * named DF_<table>_<column> constraints.
 */

#include "DdlSynthesizer.hpp"

namespace schemaforge {

/**
 * @class MsSqlDdlSynthesizer
 * @brief DdlSynthesizer for Microsoft SQL Server.
 *
 * T-SQL Syntax Notes:
 * - Identifiers: square brackets ([order], embedded ] doubled)
 * - Triggers: CREATE TRIGGER n ON t AFTER|INSTEAD OF e1, e2 AS BEGIN ... END
 * - Functions: CREATE OR ALTER FUNCTION as the replace form
 * - Auto-increment: IDENTITY(1,1) column suffix
 */
class MsSqlDdlSynthesizer : public DdlSynthesizer {
public:
    MsSqlDdlSynthesizer() : DdlSynthesizer(Dialect::MsSql) {}

    // ----- Triggers -----

    std::string createTrigger(const TriggerSpec& spec) const override;
    std::string dropTrigger(const std::string& name, const std::optional<std::string>& table,
                            const std::optional<std::string>& schema,
                            bool ifExists) const override;
    std::optional<std::string> enableTrigger(const std::string& name,
                                             const std::optional<std::string>& table,
                                             const std::optional<std::string>& schema,
                                             bool enable) const override;

    // ----- Functions -----

    std::string createFunction(const FunctionSpec& spec) const override;
    std::optional<std::string> createOrReplaceFunction(const FunctionSpec& spec) const override;
    std::string dropFunction(const std::string& name, const std::optional<std::string>& paramTypes,
                             bool ifExists, bool cascade) const override;

    // ----- ALTER TABLE -----

    std::string renameTable(const TableDesign& original, const TableDesign& modified) const override;
    std::string addColumn(const std::string& quotedTable, const std::string& tableName,
                          const ColumnDesign& column) const override;
    std::vector<std::string> alterColumn(const std::string& quotedTable,
                                         const std::string& tableName,
                                         const ColumnDesign& before,
                                         const ColumnDesign& after) const override;
    std::vector<std::string> alterUnique(const std::string& quotedTable,
                                         const std::string& tableName,
                                         const ColumnDesign& column) const override;
    std::string dropIndex(const std::string& quotedTable, const std::optional<std::string>& schema,
                          const std::string& name) const override;

protected:
    // CONSTRAINT [DF_<table>_<column>] DEFAULT <expr>, so ALTER can drop it by name
    std::string defaultClause(const std::string& tableName, const ColumnDesign& column) const override;

private:
    // @name type[ = default][ OUTPUT]
    std::string tsqlParameterList(const std::vector<FunctionParam>& params) const;
};

}  // namespace schemaforge
