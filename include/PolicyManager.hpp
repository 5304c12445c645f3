#pragma once

#include "DdlErrors.hpp"
#include "DdlSynthesizer.hpp"
#include "Dialect.hpp"
#include "PolicySpec.hpp"
#include "Result.hpp"
#include <optional>
#include <string>
#include <vector>

namespace schemaforge {

// Builds row-level security DDL. Every builder validates first; on dialects
// without row security every builder returns PolicyError::NotSupported.
class PolicyManager {
public:
    explicit PolicyManager(Dialect dialect);

    Dialect dialect() const { return m_dialect; }

    Result<void, PolicyError> validate(const PolicySpec& spec) const;

    // CREATE POLICY
    Result<std::string, PolicyError> buildCreatePolicy(const PolicySpec& spec) const;

    // ALTER TABLE ... ENABLE / DISABLE / FORCE / NO FORCE ROW LEVEL SECURITY
    Result<std::string, PolicyError> buildEnableRls(const std::string& table,
                                                    const std::optional<std::string>& schema = std::nullopt) const;
    Result<std::string, PolicyError> buildDisableRls(const std::string& table,
                                                     const std::optional<std::string>& schema = std::nullopt) const;
    Result<std::string, PolicyError> buildForceRls(const std::string& table,
                                                   const std::optional<std::string>& schema = std::nullopt) const;
    Result<std::string, PolicyError> buildNoForceRls(const std::string& table,
                                                     const std::optional<std::string>& schema = std::nullopt) const;

    Result<std::string, PolicyError> buildDropPolicy(const std::string& name,
                                                     const std::string& table,
                                                     const std::optional<std::string>& schema,
                                                     bool ifExists) const;
    Result<std::string, PolicyError> buildRenamePolicy(const std::string& oldName,
                                                       const std::string& newName,
                                                       const std::string& table,
                                                       const std::optional<std::string>& schema = std::nullopt) const;

    // Empty roles reset the policy to PUBLIC
    Result<std::string, PolicyError> buildAlterPolicyRoles(const std::string& name,
                                                           const std::string& table,
                                                           const std::optional<std::string>& schema,
                                                           const std::vector<std::string>& roles) const;

    // A missing expression resets the clause to (true)
    Result<std::string, PolicyError> buildAlterPolicyUsing(const std::string& name,
                                                           const std::string& table,
                                                           const std::optional<std::string>& schema,
                                                           const std::optional<std::string>& expr) const;
    Result<std::string, PolicyError> buildAlterPolicyCheck(const std::string& name,
                                                           const std::string& table,
                                                           const std::optional<std::string>& schema,
                                                           const std::optional<std::string>& expr) const;

private:
    // NotSupported on dialects without row security, otherwise table and name checks
    Result<void, PolicyError> checkTarget(const std::string& table,
                                          const std::optional<std::string>& name = std::nullopt) const;

    Result<std::string, PolicyError> buildRowSecurity(const std::string& table,
                                                      const std::optional<std::string>& schema,
                                                      const std::string& action) const;

    Dialect m_dialect;
    const DdlSynthesizer& m_synth;
};

}  // namespace schemaforge
