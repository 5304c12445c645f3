#include "MySQLDdlSynthesizer.hpp"
#include "StringUtils.hpp"
#include <sstream>

namespace schemaforge {

std::string MySQLDdlSynthesizer::createTrigger(const TriggerSpec& spec) const {
    std::ostringstream sql;
    sql << "CREATE TRIGGER " << m_quoter.quoteSegment(spec.name) << "\n"
        << triggerTimingToSql(spec.timing) << " " << triggerEventToSql(spec.events.front())
        << " ON " << m_quoter.qualify(spec.schema, spec.table) << "\n"
        << "FOR EACH ROW\n"
        << "BEGIN\n"
        << spec.body.value_or("") << "\n"
        << "END";
    return sql.str();
}

std::string MySQLDdlSynthesizer::createFunction(const FunctionSpec& spec) const {
    std::ostringstream sql;
    sql << "CREATE FUNCTION " << m_quoter.qualify(spec.schema, spec.name)
        << "(" << parameterList(spec.parameters) << ")\n"
        << "RETURNS " << spec.returnType << "\n"
        << (spec.volatility == FunctionVolatility::Immutable ? "DETERMINISTIC" : "NOT DETERMINISTIC")
        << "\n"
        << (spec.security == SecurityMode::Definer ? "SQL SECURITY DEFINER" : "SQL SECURITY INVOKER")
        << "\n"
        << "BEGIN\n"
        << trim(spec.body.value_or("")) << "\n"
        << "END";
    return sql.str();
}

std::vector<std::string> MySQLDdlSynthesizer::alterColumn(const std::string& quotedTable,
                                                          const std::string& tableName,
                                                          const ColumnDesign& before,
                                                          const ColumnDesign& after) const {
    if (before.typeSpec() == after.typeSpec() && before.nullable == after.nullable &&
        before.defaultValue == after.defaultValue) {
        return {};
    }
    // The column's PRIMARY KEY and UNIQUE already exist and must not be declared again
    return {"ALTER TABLE " + quotedTable + " MODIFY COLUMN " +
            columnDefinition(tableName, after, ColumnKeys::Omitted) + ";"};
}

std::vector<std::string> MySQLDdlSynthesizer::alterUnique(const std::string& quotedTable,
                                                          const std::string& tableName,
                                                          const ColumnDesign& column) const {
    const std::string index = quoteName(uniqueConstraintName(tableName, column.name));
    if (column.isUnique) {
        return {"CREATE UNIQUE INDEX " + index + " ON " + quotedTable + " (" +
                quoteName(column.name) + ");"};
    }
    return {"DROP INDEX " + index + " ON " + quotedTable + ";"};
}

std::string MySQLDdlSynthesizer::dropForeignKey(const std::string& quotedTable,
                                                const std::string& name) const {
    return "ALTER TABLE " + quotedTable + " DROP FOREIGN KEY " + quoteName(name) + ";";
}

std::string MySQLDdlSynthesizer::dropIndex(const std::string& quotedTable,
                                           const std::optional<std::string>&,
                                           const std::string& name) const {
    return "DROP INDEX " + quoteName(name) + " ON " + quotedTable + ";";
}

std::string MySQLDdlSynthesizer::tableOptions(const TableOptions& options) const {
    std::vector<std::string> parts;
    if (options.engine) parts.push_back("ENGINE=" + *options.engine);
    if (options.charset) parts.push_back("DEFAULT CHARSET=" + *options.charset);
    if (options.collation) parts.push_back("COLLATE=" + *options.collation);
    if (options.autoIncrementStart) {
        parts.push_back("AUTO_INCREMENT=" + std::to_string(*options.autoIncrementStart));
    }
    if (options.rowFormat) parts.push_back("ROW_FORMAT=" + *options.rowFormat);

    if (parts.empty()) {
        return {};
    }
    return " " + join(parts, " ");
}

}  // namespace schemaforge
