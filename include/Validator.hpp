#pragma once

/**
 * @file Validator.hpp
 * @brief Ordered precondition checks for every specification kind.
 *
 * Each validator stops at the first failing check. The order of the checks
 * is fixed, so a given spec always reports the same error.
 *
 * Policy:   EmptyName, EmptyTable, command expression rule, blank expression,
 *           dialect support
 * Trigger:  EmptyName, EmptyTable, NoEvents, BEFORE, INSTEAD OF, TRUNCATE,
 *           statement level, WHEN, UPDATE OF, multiple events,
 *           function (PostgreSQL) or body (others)
 * Function: EmptyName, EmptyReturnType, EmptyBody, dialect support,
 *           per parameter (name, type, OUT mode), RETURNS TABLE
 * Table:    table name, column count, per column (name, type), duplicates,
 *           index columns, foreign key columns, referenced table
 */

#include "DdlErrors.hpp"
#include "Dialect.hpp"
#include "FunctionSpec.hpp"
#include "PolicySpec.hpp"
#include "Result.hpp"
#include "TableDesign.hpp"
#include "TriggerSpec.hpp"

namespace schemaforge {

class PolicyValidator {
public:
    static Result<void, PolicyError> validate(const PolicySpec& spec, Dialect dialect);
};

class TriggerValidator {
public:
    static Result<void, TriggerError> validate(const TriggerSpec& spec, Dialect dialect);
};

class FunctionValidator {
public:
    static Result<void, FunctionError> validate(const FunctionSpec& spec, Dialect dialect);
};

class TableValidator {
public:
    // Validates against design.dialect
    static Result<void, TableError> validate(const TableDesign& design);
};

}  // namespace schemaforge
