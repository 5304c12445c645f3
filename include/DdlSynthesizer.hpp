#pragma once

/**
 * @file DdlSynthesizer.hpp
 * @brief Per-dialect SQL text generation for policies, triggers, functions and tables.
 *
 * DdlSynthesizer is a small strategy interface with one implementation per
 * dialect. forDialect() selects the implementation with a single dispatch on
 * the dialect tag; callers never branch on the dialect themselves.
 *
 * Synthesis assumes its input has already passed the matching validator.
 * Asking a strategy for an object kind its dialect cannot express throws
 * std::logic_error.
 *
 * Identifier handling:
 * - Table DDL (CREATE/ALTER/DROP TABLE, indexes, foreign keys) always quotes
 *   every identifier segment.
 * - Policy, trigger and function DDL quotes only identifiers that need it.
 */

#include "CapabilityMatrix.hpp"
#include "Dialect.hpp"
#include "FunctionSpec.hpp"
#include "IdentifierQuoter.hpp"
#include "PolicySpec.hpp"
#include "TableDesign.hpp"
#include "TriggerSpec.hpp"
#include <optional>
#include <string>
#include <vector>

namespace schemaforge {

class DdlSynthesizer {
public:
    virtual ~DdlSynthesizer() = default;

    DdlSynthesizer(const DdlSynthesizer&) = delete;
    DdlSynthesizer& operator=(const DdlSynthesizer&) = delete;

    /**
     * @brief Get the process-wide strategy for a dialect.
     *
     * The strategies hold no mutable state and may be shared across threads.
     */
    static const DdlSynthesizer& forDialect(Dialect dialect);

    Dialect dialect() const { return m_quoter.dialect(); }
    const IdentifierQuoter& quoter() const { return m_quoter; }
    const DialectCapabilities& capabilities() const { return m_caps; }

    // ----- Row-level security -----

    virtual std::string createPolicy(const PolicySpec& spec) const;

    // action is ENABLE, DISABLE, FORCE or NO FORCE
    virtual std::string alterRowSecurity(const std::optional<std::string>& schema,
                                         const std::string& table,
                                         const std::string& action) const;
    virtual std::string dropPolicy(const std::string& name,
                                   const std::optional<std::string>& schema,
                                   const std::string& table, bool ifExists) const;
    virtual std::string renamePolicy(const std::string& oldName, const std::string& newName,
                                     const std::optional<std::string>& schema,
                                     const std::string& table) const;
    virtual std::string alterPolicyRoles(const std::string& name,
                                         const std::optional<std::string>& schema,
                                         const std::string& table,
                                         const std::vector<std::string>& roles) const;
    // clause is USING or WITH CHECK; a missing expression resets it to true
    virtual std::string alterPolicyExpression(const std::string& name,
                                              const std::optional<std::string>& schema,
                                              const std::string& table,
                                              const std::string& clause,
                                              const std::optional<std::string>& expr) const;

    // ----- Triggers -----

    virtual std::string createTrigger(const TriggerSpec& spec) const = 0;
    virtual std::string dropTrigger(const std::string& name,
                                    const std::optional<std::string>& table,
                                    const std::optional<std::string>& schema,
                                    bool ifExists) const;
    virtual std::optional<std::string> enableTrigger(const std::string& name,
                                                     const std::optional<std::string>& table,
                                                     const std::optional<std::string>& schema,
                                                     bool enable) const;
    virtual std::optional<std::string> commentOnTrigger(const std::string& name,
                                                        const std::string& table,
                                                        const std::optional<std::string>& comment) const;

    // ----- Functions -----

    virtual std::string createFunction(const FunctionSpec& spec) const;

    // Empty when the dialect has no replace form
    virtual std::optional<std::string> createOrReplaceFunction(const FunctionSpec& spec) const;

    virtual std::string dropFunction(const std::string& name,
                                     const std::optional<std::string>& paramTypes,
                                     bool ifExists, bool cascade) const;
    virtual std::optional<std::string> commentOnFunction(const std::string& name,
                                                         const std::optional<std::string>& paramTypes,
                                                         const std::optional<std::string>& comment) const;
    virtual std::optional<std::string> alterFunctionOwner(const std::string& name,
                                                          const std::optional<std::string>& paramTypes,
                                                          const std::string& owner) const;

    // ----- Tables -----

    std::string createTable(const TableDesign& design) const;
    std::string dropTable(const std::optional<std::string>& schema, const std::string& name) const;

    // How column-level key constraints are rendered by columnDefinition()
    enum class ColumnKeys {
        Inline,     // PRIMARY KEY and UNIQUE on the column
        Composite,  // UNIQUE only; the table emits PRIMARY KEY (...)
        Omitted     // neither; redefines a column whose keys already exist
    };

    /**
     * @brief Column definition without leading indentation.
     * @param tableName Unqualified owning table, used for named default constraints.
     * @param column Column to render.
     * @param keys Which column-level key constraints to emit.
     */
    std::string columnDefinition(const std::string& tableName, const ColumnDesign& column,
                                 ColumnKeys keys = ColumnKeys::Inline) const;

    // [CONSTRAINT n ]FOREIGN KEY (...) REFERENCES t (...)[ ON UPDATE a][ ON DELETE a]
    std::string foreignKeyClause(const ForeignKeyDesign& fk) const;

    std::string createIndex(const std::string& quotedTable, const IndexDesign& index) const;

    // Every segment quoted unconditionally
    std::string quoteTable(const std::optional<std::string>& schema, const std::string& name) const;
    std::string quoteName(const std::string& name) const { return m_quoter.quoteAlways(name); }

    // ----- ALTER TABLE building blocks -----

    virtual std::string renameTable(const TableDesign& original, const TableDesign& modified) const;
    std::string dropColumn(const std::string& quotedTable, const std::string& column) const;
    virtual std::string addColumn(const std::string& quotedTable, const std::string& tableName,
                                  const ColumnDesign& column) const;

    // Type, length, scale, nullable and default changes of one column
    virtual std::vector<std::string> alterColumn(const std::string& quotedTable,
                                                 const std::string& tableName,
                                                 const ColumnDesign& before,
                                                 const ColumnDesign& after) const = 0;

    // Column-level UNIQUE flag flipped; the constraint is named <table>_<column>_unique
    virtual std::vector<std::string> alterUnique(const std::string& quotedTable,
                                                 const std::string& tableName,
                                                 const ColumnDesign& column) const;

    virtual std::string dropForeignKey(const std::string& quotedTable, const std::string& name) const;
    std::string addForeignKey(const std::string& quotedTable, const ForeignKeyDesign& fk) const;
    // PostgreSQL and SQLite qualify the index with the table's schema
    virtual std::string dropIndex(const std::string& quotedTable,
                                  const std::optional<std::string>& schema,
                                  const std::string& name) const;

protected:
    explicit DdlSynthesizer(Dialect dialect);

    // Suffix placed between the closing parenthesis and the semicolon
    virtual std::string tableOptions(const TableOptions& options) const;

    // " DEFAULT <expr>" for a column with a default, empty otherwise
    virtual std::string defaultClause(const std::string& tableName, const ColumnDesign& column) const;

    // [MODE ]name type[ DEFAULT d], joined with ", "
    std::string parameterList(const std::vector<FunctionParam>& params) const;

    [[noreturn]] void unsupported(const std::string& what) const;

    IdentifierQuoter m_quoter;
    const DialectCapabilities& m_caps;
};

// Shared by PostgreSQL and SQL Server: ADD CONSTRAINT ... UNIQUE / DROP CONSTRAINT IF EXISTS
std::vector<std::string> uniqueConstraintChange(const DdlSynthesizer& synth,
                                                const std::string& quotedTable,
                                                const std::string& tableName,
                                                const ColumnDesign& column);

// Name used for the column-level unique constraint or index
std::string uniqueConstraintName(const std::string& tableName, const std::string& column);

}  // namespace schemaforge
