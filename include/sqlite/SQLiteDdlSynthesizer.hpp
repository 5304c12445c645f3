#pragma once

/**
 * @file SQLiteDdlSynthesizer.hpp
 * @brief SQLite DDL generation: inline-body triggers and table options.
 *
 * SQLite has no user-defined SQL functions and no row-level security; asking
 * for either throws std::logic_error. Its ALTER TABLE cannot change the type,
 * nullability or default of an existing column, so those changes come out as
 * SQL comments describing the manual step.
 */

#include "DdlSynthesizer.hpp"

namespace schemaforge {

/**
 * @class SQLiteDdlSynthesizer
 * @brief DdlSynthesizer for SQLite.
 *
 * SQLite Syntax Notes:
 * - Identifiers: double quotes ("order")
 * - Triggers: one event, FOR EACH ROW, optional unparenthesized WHEN, BEGIN ... END
 * - Table options: WITHOUT ROWID, STRICT
 * - Auto-increment: INTEGER PRIMARY KEY AUTOINCREMENT
 */
class SQLiteDdlSynthesizer : public DdlSynthesizer {
public:
    SQLiteDdlSynthesizer() : DdlSynthesizer(Dialect::SQLite) {}

    std::string createTrigger(const TriggerSpec& spec) const override;

    std::vector<std::string> alterColumn(const std::string& quotedTable,
                                         const std::string& tableName,
                                         const ColumnDesign& before,
                                         const ColumnDesign& after) const override;

protected:
    std::string tableOptions(const TableOptions& options) const override;
};

}  // namespace schemaforge
