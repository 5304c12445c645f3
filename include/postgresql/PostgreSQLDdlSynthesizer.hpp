#pragma once

/**
 * @file PostgreSQLDdlSynthesizer.hpp
 * @brief PostgreSQL DDL generation: row-level security, triggers, functions, ALTER COLUMN.
 *
 * PostgreSQL is the most complete dialect: it is the only one with
 * row-level security policies, its triggers call a trigger function instead
 * of carrying an inline body, and its ALTER TABLE can change each column
 * property with a dedicated statement.
 */

#include "DdlSynthesizer.hpp"

namespace schemaforge {

/**
 * @class PostgreSQLDdlSynthesizer
 * @brief DdlSynthesizer for PostgreSQL.
 *
 * PostgreSQL Syntax Notes:
 * - Identifiers: double quotes ("user")
 * - Policies: CREATE POLICY n ON t [AS RESTRICTIVE] [FOR cmd] TO roles
 *   [USING (e)] [WITH CHECK (e)]
 * - Triggers: EXECUTE FUNCTION f(), events joined with OR, UPDATE OF cols
 * - Functions: dollar-quoted bodies ($$ or $func$ when the body holds $$)
 * - Auto-increment: SERIAL / BIGSERIAL / SMALLSERIAL type names
 */
class PostgreSQLDdlSynthesizer : public DdlSynthesizer {
public:
    PostgreSQLDdlSynthesizer() : DdlSynthesizer(Dialect::PostgreSQL) {}

    // ----- Row-level security -----

    std::string createPolicy(const PolicySpec& spec) const override;
    std::string alterRowSecurity(const std::optional<std::string>& schema,
                                 const std::string& table,
                                 const std::string& action) const override;
    std::string dropPolicy(const std::string& name, const std::optional<std::string>& schema,
                           const std::string& table, bool ifExists) const override;
    std::string renamePolicy(const std::string& oldName, const std::string& newName,
                             const std::optional<std::string>& schema,
                             const std::string& table) const override;
    std::string alterPolicyRoles(const std::string& name, const std::optional<std::string>& schema,
                                 const std::string& table,
                                 const std::vector<std::string>& roles) const override;
    std::string alterPolicyExpression(const std::string& name,
                                      const std::optional<std::string>& schema,
                                      const std::string& table, const std::string& clause,
                                      const std::optional<std::string>& expr) const override;

    // ----- Triggers -----

    std::string createTrigger(const TriggerSpec& spec) const override;
    std::string dropTrigger(const std::string& name, const std::optional<std::string>& table,
                            const std::optional<std::string>& schema,
                            bool ifExists) const override;
    std::optional<std::string> enableTrigger(const std::string& name,
                                             const std::optional<std::string>& table,
                                             const std::optional<std::string>& schema,
                                             bool enable) const override;
    std::optional<std::string> commentOnTrigger(const std::string& name, const std::string& table,
                                                const std::optional<std::string>& comment) const override;

    // ----- Functions -----

    std::string createFunction(const FunctionSpec& spec) const override;
    std::optional<std::string> createOrReplaceFunction(const FunctionSpec& spec) const override;
    std::string dropFunction(const std::string& name, const std::optional<std::string>& paramTypes,
                             bool ifExists, bool cascade) const override;
    std::optional<std::string> commentOnFunction(const std::string& name,
                                                 const std::optional<std::string>& paramTypes,
                                                 const std::optional<std::string>& comment) const override;
    std::optional<std::string> alterFunctionOwner(const std::string& name,
                                                  const std::optional<std::string>& paramTypes,
                                                  const std::string& owner) const override;

    // ----- ALTER TABLE -----

    std::vector<std::string> alterColumn(const std::string& quotedTable,
                                         const std::string& tableName,
                                         const ColumnDesign& before,
                                         const ColumnDesign& after) const override;
    std::vector<std::string> alterUnique(const std::string& quotedTable,
                                         const std::string& tableName,
                                         const ColumnDesign& column) const override;

private:
    // role list of a TO clause; empty means PUBLIC
    std::string roleList(const std::vector<std::string>& roles) const;

    // UPDATE with update columns becomes UPDATE OF c1, c2
    std::string eventsClause(const TriggerSpec& spec) const;

    std::string returnsClause(const FunctionSpec& spec) const;
};

}  // namespace schemaforge
