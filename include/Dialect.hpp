#pragma once

#include <string>

namespace schemaforge {

// SQL dialect enumeration
enum class Dialect {
    PostgreSQL,
    MySQL,
    SQLite,
    MsSql
};

// Convert string to Dialect
Dialect parseDialect(const std::string& name);

// Convert Dialect to its short lowercase name
std::string dialectToString(Dialect dialect);

// Human readable product name, used in error messages
std::string dialectDisplayName(Dialect dialect);

}  // namespace schemaforge
