#pragma once

#include "DdlErrors.hpp"
#include "DdlSynthesizer.hpp"
#include "Dialect.hpp"
#include "FunctionSpec.hpp"
#include "Result.hpp"
#include <optional>
#include <string>
#include <vector>

namespace schemaforge {

class FunctionManager {
public:
    explicit FunctionManager(Dialect dialect);

    Dialect dialect() const { return m_dialect; }

    Result<void, FunctionError> validate(const FunctionSpec& spec) const;

    Result<std::string, FunctionError> buildCreateFunction(const FunctionSpec& spec) const;

    // InvalidParameter on dialects without a replace form
    Result<std::string, FunctionError> buildCreateOrReplaceFunction(const FunctionSpec& spec) const;

    /**
     * @brief DROP FUNCTION statement.
     * @param paramTypes Argument types identifying an overload (PostgreSQL);
     *        absent for an empty argument list.
     */
    Result<std::string, FunctionError> buildDropFunction(const std::string& name,
                                                         const std::optional<std::vector<std::string>>& paramTypes,
                                                         bool ifExists, bool cascade) const;

    // PostgreSQL only
    std::optional<std::string> buildComment(const std::string& name,
                                            const std::optional<std::vector<std::string>>& paramTypes,
                                            const std::optional<std::string>& comment) const;
    std::optional<std::string> buildAlterOwner(const std::string& name,
                                               const std::optional<std::vector<std::string>>& paramTypes,
                                               const std::string& owner) const;

private:
    Dialect m_dialect;
    const DdlSynthesizer& m_synth;
};

}  // namespace schemaforge
