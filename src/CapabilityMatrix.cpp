#include "CapabilityMatrix.hpp"
#include <stdexcept>

namespace schemaforge {

namespace {

DialectCapabilities makePostgreSQL() {
    DialectCapabilities caps;
    caps.dialect = Dialect::PostgreSQL;
    caps.supportsBeforeTrigger = true;
    caps.supportsInsteadOfTrigger = true;
    caps.requiresFunctionForTrigger = true;
    caps.supportsStatementLevel = true;
    caps.supportsWhenCondition = true;
    caps.supportsUpdateColumns = true;
    caps.supportsTruncateTrigger = true;
    caps.supportsMultipleTriggerEvents = true;
    caps.supportsFunctions = true;
    caps.supportsReturnsTable = true;
    caps.supportsOutParameters = true;
    caps.supportsVolatility = true;
    caps.supportsSecurityMode = true;
    caps.supportsParallel = true;
    caps.supportsCreateOrReplaceFunction = true;
    caps.supportsRowSecurity = true;
    caps.supportsAlterColumn = true;
    caps.supportsComments = true;
    caps.identifierQuoteChar = '"';
    caps.identifierCloseChar = '"';
    caps.autoIncrementStyle = AutoIncrementStyle::TypeName;
    caps.autoIncrementKeyword = "SERIAL";
    return caps;
}

DialectCapabilities makeMySQL() {
    DialectCapabilities caps;
    caps.dialect = Dialect::MySQL;
    caps.supportsBeforeTrigger = true;
    caps.supportsFunctions = true;
    caps.supportsSecurityMode = true;
    caps.supportsAlterColumn = true;
    caps.identifierQuoteChar = '`';
    caps.identifierCloseChar = '`';
    caps.autoIncrementStyle = AutoIncrementStyle::Suffix;
    caps.autoIncrementKeyword = "AUTO_INCREMENT";
    return caps;
}

DialectCapabilities makeSQLite() {
    DialectCapabilities caps;
    caps.dialect = Dialect::SQLite;
    caps.supportsBeforeTrigger = true;
    caps.supportsInsteadOfTrigger = true;
    caps.supportsWhenCondition = true;
    caps.supportsUpdateColumns = true;
    caps.identifierQuoteChar = '"';
    caps.identifierCloseChar = '"';
    caps.autoIncrementStyle = AutoIncrementStyle::Suffix;
    caps.autoIncrementKeyword = "AUTOINCREMENT";
    return caps;
}

DialectCapabilities makeMsSql() {
    DialectCapabilities caps;
    caps.dialect = Dialect::MsSql;
    caps.supportsInsteadOfTrigger = true;
    caps.supportsMultipleTriggerEvents = true;
    caps.supportsFunctions = true;
    caps.supportsReturnsTable = true;
    caps.supportsOutParameters = true;
    caps.supportsSecurityMode = true;
    caps.supportsCreateOrReplaceFunction = true;
    caps.supportsAlterColumn = true;
    caps.identifierQuoteChar = '[';
    caps.identifierCloseChar = ']';
    caps.autoIncrementStyle = AutoIncrementStyle::Suffix;
    caps.autoIncrementKeyword = "IDENTITY(1,1)";
    return caps;
}

}  // namespace

const DialectCapabilities& capabilitiesFor(Dialect dialect) {
    static const DialectCapabilities postgresql = makePostgreSQL();
    static const DialectCapabilities mysql = makeMySQL();
    static const DialectCapabilities sqlite = makeSQLite();
    static const DialectCapabilities mssql = makeMsSql();

    switch (dialect) {
        case Dialect::PostgreSQL:
            return postgresql;
        case Dialect::MySQL:
            return mysql;
        case Dialect::SQLite:
            return sqlite;
        case Dialect::MsSql:
            return mssql;
    }
    throw std::invalid_argument("No capability row for dialect");
}

}  // namespace schemaforge
