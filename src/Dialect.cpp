#include "Dialect.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace schemaforge {

Dialect parseDialect(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "postgresql" || lower == "postgres" || lower == "pgsql" || lower == "pg") {
        return Dialect::PostgreSQL;
    } else if (lower == "mysql" || lower == "mariadb") {
        return Dialect::MySQL;
    } else if (lower == "sqlite" || lower == "sqlite3") {
        return Dialect::SQLite;
    } else if (lower == "mssql" || lower == "sqlserver" || lower == "tsql") {
        return Dialect::MsSql;
    }

    throw std::invalid_argument("Unknown dialect: " + name);
}

std::string dialectToString(Dialect dialect) {
    switch (dialect) {
        case Dialect::PostgreSQL:
            return "postgresql";
        case Dialect::MySQL:
            return "mysql";
        case Dialect::SQLite:
            return "sqlite";
        case Dialect::MsSql:
            return "mssql";
        default:
            return "unknown";
    }
}

std::string dialectDisplayName(Dialect dialect) {
    switch (dialect) {
        case Dialect::PostgreSQL:
            return "PostgreSQL";
        case Dialect::MySQL:
            return "MySQL";
        case Dialect::SQLite:
            return "SQLite";
        case Dialect::MsSql:
            return "SQL Server";
        default:
            return "unknown";
    }
}

}  // namespace schemaforge
