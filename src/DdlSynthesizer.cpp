#include "DdlSynthesizer.hpp"
#include "MsSqlDdlSynthesizer.hpp"
#include "MySQLDdlSynthesizer.hpp"
#include "PostgreSQLDdlSynthesizer.hpp"
#include "SQLiteDdlSynthesizer.hpp"
#include "StringUtils.hpp"
#include <sstream>
#include <stdexcept>

namespace schemaforge {

namespace {

// Auto-increment integer types and their PostgreSQL serial counterparts
std::string serialTypeFor(const std::string& dataType) {
    std::string upper = toUpper(trim(dataType));
    if (upper == "INTEGER" || upper == "INT" || upper == "INT4") return "SERIAL";
    if (upper == "BIGINT" || upper == "INT8") return "BIGSERIAL";
    if (upper == "SMALLINT" || upper == "INT2") return "SMALLSERIAL";
    return {};
}

}  // namespace

// ============================================================================
// Construction and dispatch
// ============================================================================

DdlSynthesizer::DdlSynthesizer(Dialect dialect)
    : m_quoter(dialect), m_caps(capabilitiesFor(dialect)) {
}

const DdlSynthesizer& DdlSynthesizer::forDialect(Dialect dialect) {
    static const PostgreSQLDdlSynthesizer postgres;
    static const MySQLDdlSynthesizer mysql;
    static const SQLiteDdlSynthesizer sqlite;
    static const MsSqlDdlSynthesizer mssql;

    switch (dialect) {
        case Dialect::PostgreSQL:
            return postgres;
        case Dialect::MySQL:
            return mysql;
        case Dialect::SQLite:
            return sqlite;
        case Dialect::MsSql:
            return mssql;
    }
    throw std::invalid_argument("Unknown dialect");
}

void DdlSynthesizer::unsupported(const std::string& what) const {
    throw std::logic_error(what + " cannot be generated for " + dialectDisplayName(dialect()));
}

// ============================================================================
// Row-level security (PostgreSQL overrides these)
// ============================================================================

std::string DdlSynthesizer::createPolicy(const PolicySpec&) const {
    unsupported("CREATE POLICY");
}

std::string DdlSynthesizer::alterRowSecurity(const std::optional<std::string>&,
                                             const std::string&, const std::string&) const {
    unsupported("ROW LEVEL SECURITY");
}

std::string DdlSynthesizer::dropPolicy(const std::string&, const std::optional<std::string>&,
                                       const std::string&, bool) const {
    unsupported("DROP POLICY");
}

std::string DdlSynthesizer::renamePolicy(const std::string&, const std::string&,
                                         const std::optional<std::string>&,
                                         const std::string&) const {
    unsupported("ALTER POLICY");
}

std::string DdlSynthesizer::alterPolicyRoles(const std::string&, const std::optional<std::string>&,
                                             const std::string&,
                                             const std::vector<std::string>&) const {
    unsupported("ALTER POLICY");
}

std::string DdlSynthesizer::alterPolicyExpression(const std::string&,
                                                  const std::optional<std::string>&,
                                                  const std::string&, const std::string&,
                                                  const std::optional<std::string>&) const {
    unsupported("ALTER POLICY");
}

// ============================================================================
// Triggers (shared defaults)
// ============================================================================

std::string DdlSynthesizer::dropTrigger(const std::string& name,
                                        const std::optional<std::string>&,
                                        const std::optional<std::string>& schema,
                                        bool ifExists) const {
    std::string qualified = schema ? *schema + "." + name : name;
    return std::string("DROP TRIGGER ") + (ifExists ? "IF EXISTS " : "") + m_quoter.quote(qualified);
}

std::optional<std::string> DdlSynthesizer::enableTrigger(const std::string&,
                                                         const std::optional<std::string>&,
                                                         const std::optional<std::string>&,
                                                         bool) const {
    return std::nullopt;
}

std::optional<std::string> DdlSynthesizer::commentOnTrigger(const std::string&, const std::string&,
                                                            const std::optional<std::string>&) const {
    return std::nullopt;
}

// ============================================================================
// Functions (shared defaults)
// ============================================================================

std::string DdlSynthesizer::parameterList(const std::vector<FunctionParam>& params) const {
    std::vector<std::string> parts;
    for (const auto& param : params) {
        std::string part;
        if (param.mode != ParameterMode::In) {
            part = parameterModeToSql(param.mode) + " ";
        }
        part += m_quoter.quoteSegment(param.name) + " " + param.dataType;
        if (param.defaultValue) {
            part += " DEFAULT " + *param.defaultValue;
        }
        parts.push_back(part);
    }
    return join(parts, ", ");
}

std::string DdlSynthesizer::createFunction(const FunctionSpec&) const {
    unsupported("CREATE FUNCTION");
}

std::optional<std::string> DdlSynthesizer::createOrReplaceFunction(const FunctionSpec&) const {
    return std::nullopt;
}

std::string DdlSynthesizer::dropFunction(const std::string& name,
                                         const std::optional<std::string>&,
                                         bool ifExists, bool) const {
    return std::string("DROP FUNCTION ") + (ifExists ? "IF EXISTS " : "") + m_quoter.quote(name);
}

std::optional<std::string> DdlSynthesizer::commentOnFunction(const std::string&,
                                                             const std::optional<std::string>&,
                                                             const std::optional<std::string>&) const {
    return std::nullopt;
}

std::optional<std::string> DdlSynthesizer::alterFunctionOwner(const std::string&,
                                                              const std::optional<std::string>&,
                                                              const std::string&) const {
    return std::nullopt;
}

// ============================================================================
// Tables
// ============================================================================

std::string DdlSynthesizer::quoteTable(const std::optional<std::string>& schema,
                                       const std::string& name) const {
    if (schema && !schema->empty()) {
        return quoteName(*schema) + "." + quoteName(name);
    }
    return quoteName(name);
}

std::string DdlSynthesizer::columnDefinition(const std::string& tableName, const ColumnDesign& column,
                                             ColumnKeys keys) const {
    bool inlinePrimaryKey = keys == ColumnKeys::Inline && column.isPrimaryKey &&
                            !column.isPartOfCompositePk;
    bool autoIncrementKey = inlinePrimaryKey && column.isAutoIncrement;

    std::string type = column.typeSpec();
    if (autoIncrementKey && m_caps.autoIncrementStyle == AutoIncrementStyle::TypeName) {
        std::string serial = serialTypeFor(column.dataType);
        if (!serial.empty()) {
            type = serial;
        }
    }

    std::ostringstream def;
    def << quoteName(column.name) << " " << type;

    if (!column.nullable) {
        def << " NOT NULL";
    }

    if (inlinePrimaryKey) {
        def << " PRIMARY KEY";
        if (autoIncrementKey) {
            switch (m_caps.autoIncrementStyle) {
                case AutoIncrementStyle::Suffix:
                    def << " " << m_caps.autoIncrementKeyword;
                    break;
                case AutoIncrementStyle::Generated:
                    def << " GENERATED ALWAYS AS IDENTITY";
                    break;
                case AutoIncrementStyle::TypeName:
                    break;
            }
        }
    }

    // Outside an inline primary key only the suffix form is meaningful
    if (column.isAutoIncrement && (!column.isPrimaryKey || keys == ColumnKeys::Omitted) &&
        m_caps.autoIncrementStyle == AutoIncrementStyle::Suffix) {
        def << " " << m_caps.autoIncrementKeyword;
    }

    if (column.isUnique && !column.isPrimaryKey && keys != ColumnKeys::Omitted) {
        def << " UNIQUE";
    }

    def << defaultClause(tableName, column);

    if (column.generatedExpression) {
        def << " GENERATED ALWAYS AS (" << *column.generatedExpression << ") "
            << (column.generatedStored ? "STORED" : "VIRTUAL");
    }

    return def.str();
}

std::string DdlSynthesizer::foreignKeyClause(const ForeignKeyDesign& fk) const {
    std::vector<std::string> columns;
    for (const auto& c : fk.columns) columns.push_back(quoteName(c));
    std::vector<std::string> referenced;
    for (const auto& c : fk.referencedColumns) referenced.push_back(quoteName(c));

    std::ostringstream sql;
    if (fk.name) {
        sql << "CONSTRAINT " << quoteName(*fk.name) << " ";
    }
    sql << "FOREIGN KEY (" << join(columns, ", ") << ") REFERENCES "
        << quoteTable(fk.referencedSchema, fk.referencedTable)
        << " (" << join(referenced, ", ") << ")";

    if (fk.onUpdate != ForeignKeyAction::NoAction) {
        sql << " ON UPDATE " << foreignKeyActionToSql(fk.onUpdate);
    }
    if (fk.onDelete != ForeignKeyAction::NoAction) {
        sql << " ON DELETE " << foreignKeyActionToSql(fk.onDelete);
    }
    return sql.str();
}

std::string DdlSynthesizer::createIndex(const std::string& quotedTable,
                                        const IndexDesign& index) const {
    std::vector<std::string> columns;
    for (const auto& c : index.columns) columns.push_back(quoteName(c));

    return std::string("CREATE ") + (index.isUnique ? "UNIQUE " : "") + "INDEX " +
           quoteName(index.name) + " ON " + quotedTable + " (" + join(columns, ", ") + ");";
}

std::string DdlSynthesizer::tableOptions(const TableOptions&) const {
    return {};
}

std::string DdlSynthesizer::defaultClause(const std::string&, const ColumnDesign& column) const {
    return column.defaultValue ? " DEFAULT " + *column.defaultValue : std::string();
}

std::string DdlSynthesizer::createTable(const TableDesign& design) const {
    const std::string table = quoteTable(design.schema, design.tableName);
    const auto pkColumns = design.primaryKeyColumns();
    const bool compositeKey = pkColumns.size() > 1;

    std::vector<std::string> lines;
    for (const auto& column : design.columns) {
        lines.push_back("  " + columnDefinition(design.tableName, column,
                                                compositeKey ? ColumnKeys::Composite : ColumnKeys::Inline));
    }

    if (compositeKey) {
        std::vector<std::string> quoted;
        for (const auto& c : pkColumns) quoted.push_back(quoteName(c));
        lines.push_back("  PRIMARY KEY (" + join(quoted, ", ") + ")");
    }

    for (const auto& fk : design.foreignKeys) {
        lines.push_back("  " + foreignKeyClause(fk));
    }

    std::ostringstream ddl;
    ddl << "CREATE TABLE " << table << " (\n" << join(lines, ",\n") << "\n)";
    if (design.options.hasOptions()) {
        ddl << tableOptions(design.options);
    }
    ddl << ";";

    for (const auto& index : design.indexes) {
        if (!index.isPrimary) {
            ddl << "\n\n" << createIndex(table, index);
        }
    }

    return ddl.str();
}

std::string DdlSynthesizer::dropTable(const std::optional<std::string>& schema,
                                      const std::string& name) const {
    return "DROP TABLE IF EXISTS " + quoteTable(schema, name) + ";";
}

// ============================================================================
// ALTER TABLE building blocks
// ============================================================================

std::string DdlSynthesizer::renameTable(const TableDesign& original,
                                        const TableDesign& modified) const {
    return "ALTER TABLE " + quoteTable(original.schema, original.tableName) +
           " RENAME TO " + quoteName(modified.tableName) + ";";
}

std::string DdlSynthesizer::dropColumn(const std::string& quotedTable,
                                       const std::string& column) const {
    return "ALTER TABLE " + quotedTable + " DROP COLUMN " + quoteName(column) + ";";
}

std::string DdlSynthesizer::addColumn(const std::string& quotedTable, const std::string& tableName,
                                      const ColumnDesign& column) const {
    return "ALTER TABLE " + quotedTable + " ADD COLUMN " + columnDefinition(tableName, column) + ";";
}

std::vector<std::string> DdlSynthesizer::alterUnique(const std::string&, const std::string&,
                                                     const ColumnDesign&) const {
    return {};
}

std::string DdlSynthesizer::dropForeignKey(const std::string& quotedTable,
                                           const std::string& name) const {
    return "ALTER TABLE " + quotedTable + " DROP CONSTRAINT " + quoteName(name) + ";";
}

std::string DdlSynthesizer::addForeignKey(const std::string& quotedTable,
                                          const ForeignKeyDesign& fk) const {
    return "ALTER TABLE " + quotedTable + " ADD " + foreignKeyClause(fk) + ";";
}

std::string DdlSynthesizer::dropIndex(const std::string&, const std::optional<std::string>& schema,
                                      const std::string& name) const {
    return "DROP INDEX IF EXISTS " + quoteTable(schema, name) + ";";
}

// ============================================================================
// Helpers shared by several dialects
// ============================================================================

std::string uniqueConstraintName(const std::string& tableName, const std::string& column) {
    return tableName + "_" + column + "_unique";
}

std::vector<std::string> uniqueConstraintChange(const DdlSynthesizer& synth,
                                                const std::string& quotedTable,
                                                const std::string& tableName,
                                                const ColumnDesign& column) {
    const std::string constraint = synth.quoteName(uniqueConstraintName(tableName, column.name));
    if (column.isUnique) {
        return {"ALTER TABLE " + quotedTable + " ADD CONSTRAINT " + constraint + " UNIQUE (" +
                synth.quoteName(column.name) + ");"};
    }
    return {"ALTER TABLE " + quotedTable + " DROP CONSTRAINT IF EXISTS " + constraint + ";"};
}

}  // namespace schemaforge
