#include "FunctionManager.hpp"
#include "StringUtils.hpp"
#include "Validator.hpp"
#include <spdlog/spdlog.h>

namespace schemaforge {

namespace {

std::optional<std::string> typeList(const std::optional<std::vector<std::string>>& paramTypes) {
    if (!paramTypes) {
        return std::nullopt;
    }
    return join(*paramTypes, ", ");
}

}  // namespace

FunctionManager::FunctionManager(Dialect dialect)
    : m_dialect(dialect), m_synth(DdlSynthesizer::forDialect(dialect)) {
}

Result<void, FunctionError> FunctionManager::validate(const FunctionSpec& spec) const {
    auto result = FunctionValidator::validate(spec, m_dialect);
    if (!result) {
        spdlog::debug("Rejected function '{}' for {}: {}", spec.qualifiedName(),
                      dialectDisplayName(m_dialect), result.error().message());
    }
    return result;
}

Result<std::string, FunctionError> FunctionManager::buildCreateFunction(const FunctionSpec& spec) const {
    auto valid = validate(spec);
    if (!valid) {
        return Result<std::string, FunctionError>::fromError(valid);
    }
    spdlog::debug("Generating CREATE FUNCTION {} for {}", spec.qualifiedName(),
                  dialectDisplayName(m_dialect));
    return m_synth.createFunction(spec);
}

Result<std::string, FunctionError> FunctionManager::buildCreateOrReplaceFunction(const FunctionSpec& spec) const {
    auto valid = validate(spec);
    if (!valid) {
        return Result<std::string, FunctionError>::fromError(valid);
    }
    auto sql = m_synth.createOrReplaceFunction(spec);
    if (!sql) {
        return FunctionError(FunctionError::Code::InvalidParameter,
                             dialectDisplayName(m_dialect) +
                                 " does not support CREATE OR REPLACE for functions");
    }
    return *sql;
}

Result<std::string, FunctionError> FunctionManager::buildDropFunction(
    const std::string& name,
    const std::optional<std::vector<std::string>>& paramTypes,
    bool ifExists, bool cascade) const {
    if (isBlank(name)) {
        return FunctionError(FunctionError::Code::EmptyName);
    }
    return m_synth.dropFunction(name, typeList(paramTypes), ifExists, cascade);
}

std::optional<std::string> FunctionManager::buildComment(const std::string& name,
                                                         const std::optional<std::vector<std::string>>& paramTypes,
                                                         const std::optional<std::string>& comment) const {
    return m_synth.commentOnFunction(name, typeList(paramTypes), comment);
}

std::optional<std::string> FunctionManager::buildAlterOwner(const std::string& name,
                                                            const std::optional<std::vector<std::string>>& paramTypes,
                                                            const std::string& owner) const {
    return m_synth.alterFunctionOwner(name, typeList(paramTypes), owner);
}

}  // namespace schemaforge
