#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace schemaforge {

// SQL command a row-security policy applies to
enum class PolicyCommand {
    Select,
    Insert,
    Update,
    Delete,
    All
};

// PERMISSIVE policies are OR-ed together, RESTRICTIVE policies AND-ed
enum class PolicyType {
    Permissive,
    Restrictive
};

std::string policyCommandToSql(PolicyCommand command);
std::string policyTypeToSql(PolicyType type);
PolicyCommand parsePolicyCommand(const std::string& text);
PolicyType parsePolicyType(const std::string& text);

// Row-level security policy specification
struct PolicySpec {
    std::string name;
    std::string table;
    std::optional<std::string> schema;
    PolicyCommand command = PolicyCommand::All;
    PolicyType policyType = PolicyType::Permissive;
    std::vector<std::string> roles;  // empty means PUBLIC
    std::optional<std::string> usingExpr;
    std::optional<std::string> checkExpr;

    PolicySpec() = default;
    PolicySpec(std::string policyName, std::string tableName)
        : name(std::move(policyName)), table(std::move(tableName)) {}

    PolicySpec& withSchema(std::string value) { schema = std::move(value); return *this; }
    PolicySpec& withCommand(PolicyCommand value) { command = value; return *this; }
    PolicySpec& withType(PolicyType value) { policyType = value; return *this; }
    PolicySpec& withRole(std::string role) { roles.push_back(std::move(role)); return *this; }
    PolicySpec& withRoles(std::vector<std::string> value) { roles = std::move(value); return *this; }
    PolicySpec& withUsing(std::string expr) { usingExpr = std::move(expr); return *this; }
    PolicySpec& withCheck(std::string expr) { checkExpr = std::move(expr); return *this; }
};

}  // namespace schemaforge
