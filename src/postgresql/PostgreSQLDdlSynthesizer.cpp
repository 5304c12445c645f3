#include "PostgreSQLDdlSynthesizer.hpp"
#include "StringUtils.hpp"
#include <sstream>

namespace schemaforge {

namespace {

std::string commentLiteral(const std::optional<std::string>& comment) {
    return comment ? "'" + escapeStringLiteral(*comment) + "'" : "NULL";
}

std::string signature(const std::optional<std::string>& paramTypes) {
    return "(" + paramTypes.value_or("") + ")";
}

}  // namespace

// ============================================================================
// Row-level security
// ============================================================================

std::string PostgreSQLDdlSynthesizer::roleList(const std::vector<std::string>& roles) const {
    if (roles.empty()) {
        return "PUBLIC";
    }
    std::vector<std::string> quoted;
    for (const auto& role : roles) {
        quoted.push_back(iequals(role, "public") ? "PUBLIC" : m_quoter.quoteSegment(role));
    }
    return join(quoted, ", ");
}

std::string PostgreSQLDdlSynthesizer::createPolicy(const PolicySpec& spec) const {
    std::ostringstream sql;
    sql << "CREATE POLICY " << m_quoter.quoteSegment(spec.name)
        << " ON " << m_quoter.qualify(spec.schema, spec.table);

    if (spec.policyType != PolicyType::Permissive) {
        sql << " AS " << policyTypeToSql(spec.policyType);
    }
    if (spec.command != PolicyCommand::All) {
        sql << " FOR " << policyCommandToSql(spec.command);
    }

    sql << " TO " << roleList(spec.roles);

    if (spec.usingExpr) {
        sql << " USING (" << *spec.usingExpr << ")";
    }
    if (spec.checkExpr) {
        sql << " WITH CHECK (" << *spec.checkExpr << ")";
    }
    return sql.str();
}

std::string PostgreSQLDdlSynthesizer::alterRowSecurity(const std::optional<std::string>& schema,
                                                       const std::string& table,
                                                       const std::string& action) const {
    return "ALTER TABLE " + m_quoter.qualify(schema, table) + " " + action + " ROW LEVEL SECURITY";
}

std::string PostgreSQLDdlSynthesizer::dropPolicy(const std::string& name,
                                                 const std::optional<std::string>& schema,
                                                 const std::string& table, bool ifExists) const {
    return std::string("DROP POLICY ") + (ifExists ? "IF EXISTS " : "") +
           m_quoter.quoteSegment(name) + " ON " + m_quoter.qualify(schema, table);
}

std::string PostgreSQLDdlSynthesizer::renamePolicy(const std::string& oldName,
                                                   const std::string& newName,
                                                   const std::optional<std::string>& schema,
                                                   const std::string& table) const {
    return "ALTER POLICY " + m_quoter.quoteSegment(oldName) + " ON " +
           m_quoter.qualify(schema, table) + " RENAME TO " + m_quoter.quoteSegment(newName);
}

std::string PostgreSQLDdlSynthesizer::alterPolicyRoles(const std::string& name,
                                                       const std::optional<std::string>& schema,
                                                       const std::string& table,
                                                       const std::vector<std::string>& roles) const {
    return "ALTER POLICY " + m_quoter.quoteSegment(name) + " ON " +
           m_quoter.qualify(schema, table) + " TO " + roleList(roles);
}

std::string PostgreSQLDdlSynthesizer::alterPolicyExpression(const std::string& name,
                                                            const std::optional<std::string>& schema,
                                                            const std::string& table,
                                                            const std::string& clause,
                                                            const std::optional<std::string>& expr) const {
    return "ALTER POLICY " + m_quoter.quoteSegment(name) + " ON " +
           m_quoter.qualify(schema, table) + " " + clause + " (" + expr.value_or("true") + ")";
}

// ============================================================================
// Triggers
// ============================================================================

std::string PostgreSQLDdlSynthesizer::eventsClause(const TriggerSpec& spec) const {
    std::vector<std::string> parts;
    for (auto event : spec.events) {
        if (event == TriggerEvent::Update && !spec.updateColumns.empty()) {
            std::vector<std::string> columns;
            for (const auto& c : spec.updateColumns) columns.push_back(m_quoter.quoteSegment(c));
            parts.push_back("UPDATE OF " + join(columns, ", "));
        } else {
            parts.push_back(triggerEventToSql(event));
        }
    }
    return join(parts, " OR ");
}

std::string PostgreSQLDdlSynthesizer::createTrigger(const TriggerSpec& spec) const {
    std::ostringstream sql;
    sql << "CREATE TRIGGER " << m_quoter.quoteSegment(spec.name) << "\n"
        << "    " << triggerTimingToSql(spec.timing) << " " << eventsClause(spec) << "\n"
        << "    ON " << m_quoter.qualify(spec.schema, spec.table) << "\n"
        << "    " << triggerLevelToSql(spec.level);
    if (spec.whenCondition) {
        sql << "\n    WHEN (" << *spec.whenCondition << ")";
    }
    sql << "\n    EXECUTE FUNCTION " << m_quoter.quote(spec.functionName.value_or("")) << "()";
    return sql.str();
}

std::string PostgreSQLDdlSynthesizer::dropTrigger(const std::string& name,
                                                  const std::optional<std::string>& table,
                                                  const std::optional<std::string>& schema,
                                                  bool ifExists) const {
    std::string sql = std::string("DROP TRIGGER ") + (ifExists ? "IF EXISTS " : "") +
                      m_quoter.quoteSegment(name);
    if (table) {
        sql += " ON " + m_quoter.qualify(schema, *table);
    }
    return sql;
}

std::optional<std::string> PostgreSQLDdlSynthesizer::enableTrigger(const std::string& name,
                                                                   const std::optional<std::string>& table,
                                                                   const std::optional<std::string>& schema,
                                                                   bool enable) const {
    if (!table) {
        return std::nullopt;
    }
    return "ALTER TABLE " + m_quoter.qualify(schema, *table) + (enable ? " ENABLE" : " DISABLE") +
           " TRIGGER " + m_quoter.quoteSegment(name);
}

std::optional<std::string> PostgreSQLDdlSynthesizer::commentOnTrigger(const std::string& name,
                                                                      const std::string& table,
                                                                      const std::optional<std::string>& comment) const {
    return "COMMENT ON TRIGGER " + m_quoter.quoteSegment(name) + " ON " + m_quoter.quote(table) +
           " IS " + commentLiteral(comment);
}

// ============================================================================
// Functions
// ============================================================================

std::string PostgreSQLDdlSynthesizer::returnsClause(const FunctionSpec& spec) const {
    if (spec.tableColumns) {
        std::vector<std::string> columns;
        for (const auto& column : *spec.tableColumns) {
            columns.push_back(m_quoter.quoteSegment(column.name) + " " + column.dataType);
        }
        return "TABLE (" + join(columns, ", ") + ")";
    }
    if (spec.isSetReturning) {
        return "SETOF " + spec.returnType;
    }
    return spec.returnType;
}

std::string PostgreSQLDdlSynthesizer::createFunction(const FunctionSpec& spec) const {
    std::vector<std::string> attributes;
    attributes.push_back("LANGUAGE " + spec.language.toSql());
    if (spec.volatility != FunctionVolatility::Volatile) {
        attributes.push_back(volatilityToSql(spec.volatility));
    }
    if (spec.nullBehavior != NullBehavior::CalledOnNullInput) {
        attributes.push_back(nullBehaviorToSql(spec.nullBehavior));
    }
    if (spec.security == SecurityMode::Definer) {
        attributes.push_back(securityModeToSql(spec.security));
    }
    if (spec.parallelSafe) {
        attributes.push_back("PARALLEL SAFE");
    }
    if (spec.cost) {
        attributes.push_back("COST " + std::to_string(*spec.cost));
    }
    if (spec.rows) {
        attributes.push_back("ROWS " + std::to_string(*spec.rows));
    }

    const std::string body = trim(spec.body.value_or(""));
    const std::string delimiter = body.find("$$") != std::string::npos ? "$func$" : "$$";

    std::ostringstream sql;
    sql << "CREATE FUNCTION " << m_quoter.qualify(spec.schema, spec.name)
        << "(" << parameterList(spec.parameters) << ")\n"
        << "RETURNS " << returnsClause(spec) << "\n"
        << join(attributes, "\n") << "\n"
        << "AS " << delimiter << "\n"
        << body << "\n"
        << delimiter;
    return sql.str();
}

std::optional<std::string> PostgreSQLDdlSynthesizer::createOrReplaceFunction(const FunctionSpec& spec) const {
    std::string sql = createFunction(spec);
    sql.replace(0, std::string("CREATE FUNCTION").size(), "CREATE OR REPLACE FUNCTION");
    return sql;
}

std::string PostgreSQLDdlSynthesizer::dropFunction(const std::string& name,
                                                   const std::optional<std::string>& paramTypes,
                                                   bool ifExists, bool cascade) const {
    return std::string("DROP FUNCTION ") + (ifExists ? "IF EXISTS " : "") + m_quoter.quote(name) +
           signature(paramTypes) + (cascade ? " CASCADE" : "");
}

std::optional<std::string> PostgreSQLDdlSynthesizer::commentOnFunction(const std::string& name,
                                                                       const std::optional<std::string>& paramTypes,
                                                                       const std::optional<std::string>& comment) const {
    return "COMMENT ON FUNCTION " + m_quoter.quote(name) + signature(paramTypes) + " IS " +
           commentLiteral(comment);
}

std::optional<std::string> PostgreSQLDdlSynthesizer::alterFunctionOwner(const std::string& name,
                                                                        const std::optional<std::string>& paramTypes,
                                                                        const std::string& owner) const {
    return "ALTER FUNCTION " + m_quoter.quote(name) + signature(paramTypes) + " OWNER TO " +
           m_quoter.quoteSegment(owner);
}

// ============================================================================
// ALTER TABLE
// ============================================================================

std::vector<std::string> PostgreSQLDdlSynthesizer::alterColumn(const std::string& quotedTable,
                                                               const std::string&,
                                                               const ColumnDesign& before,
                                                               const ColumnDesign& after) const {
    const std::string prefix = "ALTER TABLE " + quotedTable + " ALTER COLUMN " + quoteName(after.name);
    std::vector<std::string> statements;

    if (before.typeSpec() != after.typeSpec()) {
        statements.push_back(prefix + " TYPE " + after.typeSpec() + ";");
    }
    if (before.nullable != after.nullable) {
        statements.push_back(prefix + (after.nullable ? " DROP NOT NULL;" : " SET NOT NULL;"));
    }
    if (before.defaultValue != after.defaultValue) {
        statements.push_back(after.defaultValue ? prefix + " SET DEFAULT " + *after.defaultValue + ";"
                                                : prefix + " DROP DEFAULT;");
    }
    return statements;
}

std::vector<std::string> PostgreSQLDdlSynthesizer::alterUnique(const std::string& quotedTable,
                                                               const std::string& tableName,
                                                               const ColumnDesign& column) const {
    return uniqueConstraintChange(*this, quotedTable, tableName, column);
}

}  // namespace schemaforge
