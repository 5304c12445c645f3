#pragma once

#include "DdlErrors.hpp"
#include "Dialect.hpp"
#include "Result.hpp"
#include "TableDesign.hpp"
#include <optional>
#include <string>
#include <vector>

namespace schemaforge {

// Table DDL entry point. CREATE and ALTER use the dialect carried by the
// design; DROP uses the dialect given at construction.
class TableManager {
public:
    explicit TableManager(Dialect dialect = Dialect::PostgreSQL);

    Dialect dialect() const { return m_dialect; }

    Result<void, TableError> validate(const TableDesign& design) const;

    Result<std::string, TableError> buildCreateTable(const TableDesign& design) const;

    // Validates both designs before diffing them
    Result<std::vector<std::string>, TableError> buildAlterTable(const TableDesign& original,
                                                                 const TableDesign& modified) const;

    // DROP TABLE IF EXISTS
    Result<std::string, TableError> buildDropTable(const std::string& name,
                                                   const std::optional<std::string>& schema = std::nullopt) const;

private:
    Dialect m_dialect;
};

}  // namespace schemaforge
