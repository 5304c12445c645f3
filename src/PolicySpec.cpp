#include "PolicySpec.hpp"
#include "StringUtils.hpp"
#include <stdexcept>

namespace schemaforge {

std::string policyCommandToSql(PolicyCommand command) {
    switch (command) {
        case PolicyCommand::Select: return "SELECT";
        case PolicyCommand::Insert: return "INSERT";
        case PolicyCommand::Update: return "UPDATE";
        case PolicyCommand::Delete: return "DELETE";
        case PolicyCommand::All: return "ALL";
    }
    return "ALL";
}

std::string policyTypeToSql(PolicyType type) {
    return type == PolicyType::Restrictive ? "RESTRICTIVE" : "PERMISSIVE";
}

PolicyCommand parsePolicyCommand(const std::string& text) {
    std::string upper = toUpper(text);
    if (upper == "SELECT") return PolicyCommand::Select;
    if (upper == "INSERT") return PolicyCommand::Insert;
    if (upper == "UPDATE") return PolicyCommand::Update;
    if (upper == "DELETE") return PolicyCommand::Delete;
    if (upper == "ALL") return PolicyCommand::All;
    throw std::invalid_argument("Unknown policy command: " + text);
}

PolicyType parsePolicyType(const std::string& text) {
    std::string upper = toUpper(text);
    if (upper == "PERMISSIVE") return PolicyType::Permissive;
    if (upper == "RESTRICTIVE") return PolicyType::Restrictive;
    throw std::invalid_argument("Unknown policy type: " + text);
}

}  // namespace schemaforge
