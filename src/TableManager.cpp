#include "TableManager.hpp"
#include "AlterGenerator.hpp"
#include "DdlSynthesizer.hpp"
#include "StringUtils.hpp"
#include "Validator.hpp"
#include <spdlog/spdlog.h>

namespace schemaforge {

TableManager::TableManager(Dialect dialect) : m_dialect(dialect) {
}

Result<void, TableError> TableManager::validate(const TableDesign& design) const {
    auto result = TableValidator::validate(design);
    if (!result) {
        spdlog::debug("Rejected table design '{}': {}", design.tableName, result.error().message());
    }
    return result;
}

Result<std::string, TableError> TableManager::buildCreateTable(const TableDesign& design) const {
    auto valid = validate(design);
    if (!valid) {
        return Result<std::string, TableError>::fromError(valid);
    }
    spdlog::debug("Generating CREATE TABLE {} for {}", design.tableName,
                  dialectDisplayName(design.dialect));
    return DdlSynthesizer::forDialect(design.dialect).createTable(design);
}

Result<std::vector<std::string>, TableError> TableManager::buildAlterTable(const TableDesign& original,
                                                                           const TableDesign& modified) const {
    auto originalValid = validate(original);
    if (!originalValid) {
        return Result<std::vector<std::string>, TableError>::fromError(originalValid);
    }
    auto modifiedValid = validate(modified);
    if (!modifiedValid) {
        return Result<std::vector<std::string>, TableError>::fromError(modifiedValid);
    }
    return AlterGenerator::generateAlterTable(original, modified);
}

Result<std::string, TableError> TableManager::buildDropTable(const std::string& name,
                                                             const std::optional<std::string>& schema) const {
    if (isBlank(name)) {
        return TableError(TableError::Code::EmptyTableName);
    }
    return DdlSynthesizer::forDialect(m_dialect).dropTable(schema, name);
}

}  // namespace schemaforge
