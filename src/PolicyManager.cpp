#include "PolicyManager.hpp"
#include "StringUtils.hpp"
#include "Validator.hpp"
#include <spdlog/spdlog.h>

namespace schemaforge {

PolicyManager::PolicyManager(Dialect dialect)
    : m_dialect(dialect), m_synth(DdlSynthesizer::forDialect(dialect)) {
}

Result<void, PolicyError> PolicyManager::validate(const PolicySpec& spec) const {
    auto result = PolicyValidator::validate(spec, m_dialect);
    if (!result) {
        spdlog::debug("Rejected policy '{}' on '{}': {}", spec.name, spec.table,
                      result.error().message());
    }
    return result;
}

Result<std::string, PolicyError> PolicyManager::buildCreatePolicy(const PolicySpec& spec) const {
    auto valid = validate(spec);
    if (!valid) {
        return Result<std::string, PolicyError>::fromError(valid);
    }
    spdlog::debug("Generating CREATE POLICY {} for {}", spec.name, dialectDisplayName(m_dialect));
    return m_synth.createPolicy(spec);
}

// ============================================================================
// Row-level security switches
// ============================================================================

Result<void, PolicyError> PolicyManager::checkTarget(const std::string& table,
                                                     const std::optional<std::string>& name) const {
    if (!m_synth.capabilities().supportsRowSecurity) {
        PolicyError error(PolicyError::Code::NotSupported,
                          "Row-level security policies on " + dialectDisplayName(m_dialect));
        spdlog::debug("Rejected row security statement: {}", error.message());
        return error;
    }
    if (name && isBlank(*name)) {
        return PolicyError(PolicyError::Code::EmptyName);
    }
    if (isBlank(table)) {
        return PolicyError(PolicyError::Code::EmptyTable);
    }
    return {};
}

Result<std::string, PolicyError> PolicyManager::buildRowSecurity(const std::string& table,
                                                                 const std::optional<std::string>& schema,
                                                                 const std::string& action) const {
    auto target = checkTarget(table);
    if (!target) {
        return Result<std::string, PolicyError>::fromError(target);
    }
    return m_synth.alterRowSecurity(schema, table, action);
}

Result<std::string, PolicyError> PolicyManager::buildEnableRls(const std::string& table,
                                                               const std::optional<std::string>& schema) const {
    return buildRowSecurity(table, schema, "ENABLE");
}

Result<std::string, PolicyError> PolicyManager::buildDisableRls(const std::string& table,
                                                                const std::optional<std::string>& schema) const {
    return buildRowSecurity(table, schema, "DISABLE");
}

Result<std::string, PolicyError> PolicyManager::buildForceRls(const std::string& table,
                                                              const std::optional<std::string>& schema) const {
    return buildRowSecurity(table, schema, "FORCE");
}

Result<std::string, PolicyError> PolicyManager::buildNoForceRls(const std::string& table,
                                                                const std::optional<std::string>& schema) const {
    return buildRowSecurity(table, schema, "NO FORCE");
}

// ============================================================================
// Policy maintenance
// ============================================================================

Result<std::string, PolicyError> PolicyManager::buildDropPolicy(const std::string& name,
                                                                const std::string& table,
                                                                const std::optional<std::string>& schema,
                                                                bool ifExists) const {
    auto target = checkTarget(table, name);
    if (!target) {
        return Result<std::string, PolicyError>::fromError(target);
    }
    return m_synth.dropPolicy(name, schema, table, ifExists);
}

Result<std::string, PolicyError> PolicyManager::buildRenamePolicy(const std::string& oldName,
                                                                  const std::string& newName,
                                                                  const std::string& table,
                                                                  const std::optional<std::string>& schema) const {
    auto target = checkTarget(table, oldName);
    if (!target) {
        return Result<std::string, PolicyError>::fromError(target);
    }
    if (isBlank(newName)) {
        return PolicyError(PolicyError::Code::EmptyName);
    }
    return m_synth.renamePolicy(oldName, newName, schema, table);
}

Result<std::string, PolicyError> PolicyManager::buildAlterPolicyRoles(const std::string& name,
                                                                      const std::string& table,
                                                                      const std::optional<std::string>& schema,
                                                                      const std::vector<std::string>& roles) const {
    auto target = checkTarget(table, name);
    if (!target) {
        return Result<std::string, PolicyError>::fromError(target);
    }
    return m_synth.alterPolicyRoles(name, schema, table, roles);
}

Result<std::string, PolicyError> PolicyManager::buildAlterPolicyUsing(const std::string& name,
                                                                      const std::string& table,
                                                                      const std::optional<std::string>& schema,
                                                                      const std::optional<std::string>& expr) const {
    auto target = checkTarget(table, name);
    if (!target) {
        return Result<std::string, PolicyError>::fromError(target);
    }
    if (expr && isBlank(*expr)) {
        return PolicyError(PolicyError::Code::EmptyExpression);
    }
    return m_synth.alterPolicyExpression(name, schema, table, "USING", expr);
}

Result<std::string, PolicyError> PolicyManager::buildAlterPolicyCheck(const std::string& name,
                                                                      const std::string& table,
                                                                      const std::optional<std::string>& schema,
                                                                      const std::optional<std::string>& expr) const {
    auto target = checkTarget(table, name);
    if (!target) {
        return Result<std::string, PolicyError>::fromError(target);
    }
    if (expr && isBlank(*expr)) {
        return PolicyError(PolicyError::Code::EmptyExpression);
    }
    return m_synth.alterPolicyExpression(name, schema, table, "WITH CHECK", expr);
}

}  // namespace schemaforge
