#include "MsSqlDdlSynthesizer.hpp"
#include "StringUtils.hpp"
#include <sstream>

namespace schemaforge {

namespace {

std::string qualifiedName(const std::optional<std::string>& schema, const std::string& name) {
    return schema ? *schema + "." + name : name;
}

std::string defaultConstraintName(const std::string& tableName, const std::string& column) {
    return "DF_" + tableName + "_" + column;
}

}  // namespace

// ============================================================================
// Triggers
// ============================================================================

std::string MsSqlDdlSynthesizer::createTrigger(const TriggerSpec& spec) const {
    std::vector<std::string> events;
    for (auto event : spec.events) {
        events.push_back(triggerEventToSql(event));
    }

    std::ostringstream sql;
    sql << "CREATE TRIGGER " << m_quoter.quoteSegment(spec.name) << "\n"
        << "    ON " << m_quoter.qualify(spec.schema, spec.table) << "\n"
        << "    " << (spec.timing == TriggerTiming::InsteadOf ? "INSTEAD OF" : "AFTER") << " "
        << join(events, ", ") << "\n"
        << "AS\n"
        << "BEGIN\n"
        << spec.body.value_or("") << "\n"
        << "END";
    return sql.str();
}

std::string MsSqlDdlSynthesizer::dropTrigger(const std::string& name,
                                             const std::optional<std::string>&,
                                             const std::optional<std::string>& schema,
                                             bool ifExists) const {
    const std::string qualified = qualifiedName(schema, name);
    const std::string drop = "DROP TRIGGER " + m_quoter.quote(qualified);
    if (ifExists) {
        return "IF OBJECT_ID('" + escapeStringLiteral(qualified) + "', 'TR') IS NOT NULL " + drop;
    }
    return drop;
}

std::optional<std::string> MsSqlDdlSynthesizer::enableTrigger(const std::string& name,
                                                              const std::optional<std::string>& table,
                                                              const std::optional<std::string>& schema,
                                                              bool enable) const {
    if (!table) {
        return std::nullopt;
    }
    return std::string(enable ? "ENABLE" : "DISABLE") + " TRIGGER " +
           m_quoter.quote(qualifiedName(schema, name)) + " ON " +
           m_quoter.quote(qualifiedName(schema, *table));
}

// ============================================================================
// Functions
// ============================================================================

std::string MsSqlDdlSynthesizer::tsqlParameterList(const std::vector<FunctionParam>& params) const {
    std::vector<std::string> parts;
    for (const auto& param : params) {
        std::string part = "@" + param.name + " " + param.dataType;
        if (param.defaultValue) {
            part += " = " + *param.defaultValue;
        }
        if (isOutputMode(param.mode)) {
            part += " OUTPUT";
        }
        parts.push_back(part);
    }
    return join(parts, ", ");
}

std::string MsSqlDdlSynthesizer::createFunction(const FunctionSpec& spec) const {
    const std::string body = trim(spec.body.value_or(""));

    std::ostringstream sql;
    sql << "CREATE FUNCTION " << m_quoter.qualify(spec.schema, spec.name)
        << "(" << tsqlParameterList(spec.parameters) << ")\n";

    if (spec.tableColumns) {
        // Inline table-valued function
        std::vector<std::string> columns;
        for (const auto& column : *spec.tableColumns) {
            columns.push_back(m_quoter.quoteSegment(column.name) + " " + column.dataType);
        }
        sql << "RETURNS TABLE (" << join(columns, ", ") << ")\n"
            << "AS\n"
            << "RETURN (\n" << body << "\n)";
    } else if (spec.isSetReturning) {
        sql << "RETURNS @result TABLE (value " << spec.returnType << ")\n"
            << "AS\n"
            << "BEGIN\n" << body << "\nRETURN\nEND";
    } else {
        sql << "RETURNS " << spec.returnType << "\n"
            << "AS\n"
            << "BEGIN\n" << body << "\nEND";
    }
    return sql.str();
}

std::optional<std::string> MsSqlDdlSynthesizer::createOrReplaceFunction(const FunctionSpec& spec) const {
    std::string sql = createFunction(spec);
    sql.replace(0, std::string("CREATE FUNCTION").size(), "CREATE OR ALTER FUNCTION");
    return sql;
}

std::string MsSqlDdlSynthesizer::dropFunction(const std::string& name,
                                              const std::optional<std::string>&,
                                              bool ifExists, bool) const {
    const std::string drop = "DROP FUNCTION " + m_quoter.quote(name);
    if (ifExists) {
        return "IF OBJECT_ID('" + escapeStringLiteral(name) + "', 'FN') IS NOT NULL " + drop;
    }
    return drop;
}

// ============================================================================
// ALTER TABLE
// ============================================================================

std::string MsSqlDdlSynthesizer::renameTable(const TableDesign& original,
                                             const TableDesign& modified) const {
    return "EXEC sp_rename '" + escapeStringLiteral(qualifiedName(original.schema, original.tableName)) +
           "', '" + escapeStringLiteral(modified.tableName) + "';";
}

std::string MsSqlDdlSynthesizer::addColumn(const std::string& quotedTable, const std::string& tableName,
                                           const ColumnDesign& column) const {
    return "ALTER TABLE " + quotedTable + " ADD " + columnDefinition(tableName, column) + ";";
}

std::string MsSqlDdlSynthesizer::defaultClause(const std::string& tableName,
                                               const ColumnDesign& column) const {
    if (!column.defaultValue) {
        return {};
    }
    return " CONSTRAINT " + quoteName(defaultConstraintName(tableName, column.name)) + " DEFAULT " +
           *column.defaultValue;
}

std::vector<std::string> MsSqlDdlSynthesizer::alterColumn(const std::string& quotedTable,
                                                          const std::string& tableName,
                                                          const ColumnDesign& before,
                                                          const ColumnDesign& after) const {
    std::vector<std::string> statements;
    const std::string column = quoteName(after.name);

    if (before.typeSpec() != after.typeSpec() || before.nullable != after.nullable) {
        statements.push_back("ALTER TABLE " + quotedTable + " ALTER COLUMN " + column + " " +
                             after.typeSpec() + (after.nullable ? " NULL;" : " NOT NULL;"));
    }

    if (before.defaultValue != after.defaultValue) {
        const std::string constraint = quoteName(defaultConstraintName(tableName, after.name));
        statements.push_back("ALTER TABLE " + quotedTable + " DROP CONSTRAINT IF EXISTS " +
                             constraint + ";");
        if (after.defaultValue) {
            statements.push_back("ALTER TABLE " + quotedTable + " ADD CONSTRAINT " + constraint +
                                 " DEFAULT " + *after.defaultValue + " FOR " + column + ";");
        }
    }
    return statements;
}

std::vector<std::string> MsSqlDdlSynthesizer::alterUnique(const std::string& quotedTable,
                                                          const std::string& tableName,
                                                          const ColumnDesign& column) const {
    return uniqueConstraintChange(*this, quotedTable, tableName, column);
}

std::string MsSqlDdlSynthesizer::dropIndex(const std::string& quotedTable,
                                           const std::optional<std::string>&,
                                           const std::string& name) const {
    return "DROP INDEX " + quoteName(name) + " ON " + quotedTable + ";";
}

}  // namespace schemaforge
