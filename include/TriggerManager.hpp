#pragma once

#include "DdlErrors.hpp"
#include "DdlSynthesizer.hpp"
#include "Dialect.hpp"
#include "Result.hpp"
#include "TriggerSpec.hpp"
#include <optional>
#include <string>

namespace schemaforge {

class TriggerManager {
public:
    explicit TriggerManager(Dialect dialect);

    Dialect dialect() const { return m_dialect; }

    Result<void, TriggerError> validate(const TriggerSpec& spec) const;

    Result<std::string, TriggerError> buildCreateTrigger(const TriggerSpec& spec) const;

    Result<std::string, TriggerError> buildDropTrigger(const std::string& name,
                                                       const std::optional<std::string>& table,
                                                       const std::optional<std::string>& schema,
                                                       bool ifExists) const;

    // Only PostgreSQL and SQL Server can toggle a trigger, and both need the table
    std::optional<std::string> buildEnableDisable(const std::string& name,
                                                  const std::optional<std::string>& table,
                                                  const std::optional<std::string>& schema,
                                                  bool enable) const;

    // PostgreSQL only; a missing comment clears it
    std::optional<std::string> buildComment(const std::string& name,
                                            const std::string& table,
                                            const std::optional<std::string>& comment) const;

private:
    Dialect m_dialect;
    const DdlSynthesizer& m_synth;
};

}  // namespace schemaforge
