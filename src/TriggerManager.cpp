#include "TriggerManager.hpp"
#include "StringUtils.hpp"
#include "Validator.hpp"
#include <spdlog/spdlog.h>

namespace schemaforge {

TriggerManager::TriggerManager(Dialect dialect)
    : m_dialect(dialect), m_synth(DdlSynthesizer::forDialect(dialect)) {
}

Result<void, TriggerError> TriggerManager::validate(const TriggerSpec& spec) const {
    auto result = TriggerValidator::validate(spec, m_dialect);
    if (!result) {
        spdlog::debug("Rejected trigger '{}' on '{}' for {}: {}", spec.name, spec.table,
                      dialectDisplayName(m_dialect), result.error().message());
    }
    return result;
}

Result<std::string, TriggerError> TriggerManager::buildCreateTrigger(const TriggerSpec& spec) const {
    auto valid = validate(spec);
    if (!valid) {
        return Result<std::string, TriggerError>::fromError(valid);
    }
    spdlog::debug("Generating CREATE TRIGGER {} for {}", spec.name, dialectDisplayName(m_dialect));
    return m_synth.createTrigger(spec);
}

Result<std::string, TriggerError> TriggerManager::buildDropTrigger(const std::string& name,
                                                                   const std::optional<std::string>& table,
                                                                   const std::optional<std::string>& schema,
                                                                   bool ifExists) const {
    if (isBlank(name)) {
        return TriggerError(TriggerError::Code::EmptyName);
    }
    if (table && isBlank(*table)) {
        return TriggerError(TriggerError::Code::EmptyTable);
    }
    return m_synth.dropTrigger(name, table, schema, ifExists);
}

std::optional<std::string> TriggerManager::buildEnableDisable(const std::string& name,
                                                              const std::optional<std::string>& table,
                                                              const std::optional<std::string>& schema,
                                                              bool enable) const {
    return m_synth.enableTrigger(name, table, schema, enable);
}

std::optional<std::string> TriggerManager::buildComment(const std::string& name,
                                                        const std::string& table,
                                                        const std::optional<std::string>& comment) const {
    return m_synth.commentOnTrigger(name, table, comment);
}

}  // namespace schemaforge
