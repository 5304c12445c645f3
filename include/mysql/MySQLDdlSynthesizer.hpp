#pragma once

/**
 * @file MySQLDdlSynthesizer.hpp
 * @brief MySQL DDL generation: inline-body triggers, functions, table options.
 *
 * MySQL triggers carry their body between BEGIN and END and fire on a single
 * event. Column changes re-specify the whole column with MODIFY COLUMN, and
 * constraint drops use the MySQL-specific DROP FOREIGN KEY / DROP INDEX ... ON
 * forms.
 */

#include "DdlSynthesizer.hpp"

namespace schemaforge {

/**
 * @class MySQLDdlSynthesizer
 * @brief DdlSynthesizer for MySQL and MariaDB.
 *
 * MySQL Syntax Notes:
 * - Identifiers: backticks (`order`)
 * - Triggers: one event, FOR EACH ROW only, BEGIN ... END body
 * - Functions: [NOT] DETERMINISTIC and SQL SECURITY characteristics
 * - Table options: ENGINE=, DEFAULT CHARSET=, COLLATE=, AUTO_INCREMENT=, ROW_FORMAT=
 * - Auto-increment: AUTO_INCREMENT column suffix
 */
class MySQLDdlSynthesizer : public DdlSynthesizer {
public:
    MySQLDdlSynthesizer() : DdlSynthesizer(Dialect::MySQL) {}

    std::string createTrigger(const TriggerSpec& spec) const override;
    std::string createFunction(const FunctionSpec& spec) const override;

    std::vector<std::string> alterColumn(const std::string& quotedTable,
                                         const std::string& tableName,
                                         const ColumnDesign& before,
                                         const ColumnDesign& after) const override;
    std::vector<std::string> alterUnique(const std::string& quotedTable,
                                         const std::string& tableName,
                                         const ColumnDesign& column) const override;
    std::string dropForeignKey(const std::string& quotedTable, const std::string& name) const override;
    std::string dropIndex(const std::string& quotedTable, const std::optional<std::string>& schema,
                          const std::string& name) const override;

protected:
    std::string tableOptions(const TableOptions& options) const override;
};

}  // namespace schemaforge
