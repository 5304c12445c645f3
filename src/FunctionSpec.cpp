#include "FunctionSpec.hpp"
#include "StringUtils.hpp"
#include <stdexcept>

namespace schemaforge {

std::string parameterModeToSql(ParameterMode mode) {
    switch (mode) {
        case ParameterMode::In: return "IN";
        case ParameterMode::Out: return "OUT";
        case ParameterMode::InOut: return "INOUT";
        case ParameterMode::Variadic: return "VARIADIC";
    }
    return "IN";
}

std::string volatilityToSql(FunctionVolatility volatility) {
    switch (volatility) {
        case FunctionVolatility::Immutable: return "IMMUTABLE";
        case FunctionVolatility::Stable: return "STABLE";
        case FunctionVolatility::Volatile: return "VOLATILE";
    }
    return "VOLATILE";
}

std::string nullBehaviorToSql(NullBehavior behavior) {
    switch (behavior) {
        case NullBehavior::CalledOnNullInput: return "CALLED ON NULL INPUT";
        case NullBehavior::ReturnsNullOnNullInput: return "RETURNS NULL ON NULL INPUT";
        case NullBehavior::Strict: return "STRICT";
    }
    return "CALLED ON NULL INPUT";
}

std::string securityModeToSql(SecurityMode mode) {
    return mode == SecurityMode::Definer ? "SECURITY DEFINER" : "SECURITY INVOKER";
}

ParameterMode parseParameterMode(const std::string& text) {
    std::string upper = toUpper(trim(text));
    if (upper == "IN") return ParameterMode::In;
    if (upper == "OUT") return ParameterMode::Out;
    if (upper == "INOUT" || upper == "IN OUT") return ParameterMode::InOut;
    if (upper == "VARIADIC") return ParameterMode::Variadic;
    throw std::invalid_argument("Unknown parameter mode: " + text);
}

FunctionVolatility parseVolatility(const std::string& text) {
    std::string upper = toUpper(trim(text));
    if (upper == "IMMUTABLE") return FunctionVolatility::Immutable;
    if (upper == "STABLE") return FunctionVolatility::Stable;
    if (upper == "VOLATILE") return FunctionVolatility::Volatile;
    throw std::invalid_argument("Unknown volatility: " + text);
}

NullBehavior parseNullBehavior(const std::string& text) {
    std::string upper = toUpper(trim(text));
    if (upper == "CALLED ON NULL INPUT" || upper == "CALLED_ON_NULL_INPUT") {
        return NullBehavior::CalledOnNullInput;
    }
    if (upper == "RETURNS NULL ON NULL INPUT" || upper == "RETURNS_NULL_ON_NULL_INPUT") {
        return NullBehavior::ReturnsNullOnNullInput;
    }
    if (upper == "STRICT") return NullBehavior::Strict;
    throw std::invalid_argument("Unknown null behavior: " + text);
}

SecurityMode parseSecurityMode(const std::string& text) {
    std::string upper = toUpper(trim(text));
    if (upper == "INVOKER" || upper == "SECURITY INVOKER") return SecurityMode::Invoker;
    if (upper == "DEFINER" || upper == "SECURITY DEFINER") return SecurityMode::Definer;
    throw std::invalid_argument("Unknown security mode: " + text);
}

bool isOutputMode(ParameterMode mode) {
    return mode == ParameterMode::Out || mode == ParameterMode::InOut;
}

// ============================================================================
// FunctionLanguage
// ============================================================================

FunctionLanguage FunctionLanguage::custom(std::string name) {
    FunctionLanguage language;
    language.kind = Kind::Custom;
    language.customName = std::move(name);
    return language;
}

FunctionLanguage FunctionLanguage::parse(const std::string& text) {
    std::string lower = toLower(trim(text));
    FunctionLanguage language;
    if (lower == "sql") {
        language.kind = Kind::Sql;
    } else if (lower == "plpgsql") {
        language.kind = Kind::PlPgSql;
    } else if (lower == "plpython3u" || lower == "python") {
        language.kind = Kind::Python;
    } else if (lower == "plv8" || lower == "javascript") {
        language.kind = Kind::JavaScript;
    } else {
        return custom(trim(text));
    }
    return language;
}

std::string FunctionLanguage::toSql() const {
    switch (kind) {
        case Kind::Sql: return "SQL";
        case Kind::PlPgSql: return "plpgsql";
        case Kind::Python: return "plpython3u";
        case Kind::JavaScript: return "plv8";
        case Kind::Custom: return customName;
    }
    return "SQL";
}

}  // namespace schemaforge
