#pragma once

/**
 * @file CapabilityMatrix.hpp
 * @brief Static per-dialect description of supported DDL features.
 *
 * Validators consult the matrix to reject specifications a dialect cannot
 * express; synthesizers consult it to decide which clauses to emit. The
 * rows are process-wide constants and never change after startup.
 */

#include "Dialect.hpp"
#include <string>

namespace schemaforge {

// How a dialect spells an auto-incrementing primary key
enum class AutoIncrementStyle {
    Suffix,     // INTEGER PRIMARY KEY AUTOINCREMENT
    TypeName,   // SERIAL PRIMARY KEY
    Generated   // INTEGER GENERATED ALWAYS AS IDENTITY
};

struct DialectCapabilities {
    Dialect dialect = Dialect::PostgreSQL;

    // Triggers
    bool supportsBeforeTrigger = false;
    bool supportsInsteadOfTrigger = false;
    bool requiresFunctionForTrigger = false;
    bool supportsStatementLevel = false;
    bool supportsWhenCondition = false;
    bool supportsUpdateColumns = false;
    bool supportsTruncateTrigger = false;
    bool supportsMultipleTriggerEvents = false;

    // Functions
    bool supportsFunctions = false;
    bool supportsReturnsTable = false;
    bool supportsOutParameters = false;
    bool supportsVolatility = false;
    bool supportsSecurityMode = false;
    bool supportsParallel = false;
    bool supportsCreateOrReplaceFunction = false;

    // Tables and policies
    bool supportsRowSecurity = false;
    bool supportsAlterColumn = false;
    bool supportsComments = false;

    // Identifiers
    char identifierQuoteChar = '"';
    char identifierCloseChar = '"';

    AutoIncrementStyle autoIncrementStyle = AutoIncrementStyle::Suffix;
    std::string autoIncrementKeyword;
};

// Look up the capability row of a dialect
const DialectCapabilities& capabilitiesFor(Dialect dialect);

}  // namespace schemaforge
