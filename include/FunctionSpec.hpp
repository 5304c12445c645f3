#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace schemaforge {

enum class ParameterMode {
    In,
    Out,
    InOut,
    Variadic
};

enum class FunctionVolatility {
    Immutable,
    Stable,
    Volatile
};

enum class NullBehavior {
    CalledOnNullInput,
    ReturnsNullOnNullInput,
    Strict
};

enum class SecurityMode {
    Invoker,
    Definer
};

std::string parameterModeToSql(ParameterMode mode);
std::string volatilityToSql(FunctionVolatility volatility);
std::string nullBehaviorToSql(NullBehavior behavior);
std::string securityModeToSql(SecurityMode mode);
ParameterMode parseParameterMode(const std::string& text);
FunctionVolatility parseVolatility(const std::string& text);
NullBehavior parseNullBehavior(const std::string& text);
SecurityMode parseSecurityMode(const std::string& text);

// True for OUT and INOUT parameters
bool isOutputMode(ParameterMode mode);

struct FunctionLanguage {
    enum class Kind {
        Sql,
        PlPgSql,
        Python,
        JavaScript,
        Custom
    };

    Kind kind = Kind::Sql;
    std::string customName;

    static FunctionLanguage custom(std::string name);

    // Known names map to their kind, anything else becomes Custom
    static FunctionLanguage parse(const std::string& text);

    std::string toSql() const;

    bool operator==(const FunctionLanguage& other) const {
        return kind == other.kind && customName == other.customName;
    }
};

struct FunctionParam {
    std::string name;
    std::string dataType;
    ParameterMode mode = ParameterMode::In;
    std::optional<std::string> defaultValue;

    FunctionParam() = default;
    FunctionParam(std::string paramName, std::string type)
        : name(std::move(paramName)), dataType(std::move(type)) {}

    FunctionParam& withMode(ParameterMode value) { mode = value; return *this; }
    FunctionParam& withDefault(std::string value) { defaultValue = std::move(value); return *this; }
};

// User-defined function specification
struct FunctionSpec {
    std::string name;
    std::string returnType;
    std::optional<std::string> schema;
    std::vector<FunctionParam> parameters;
    std::optional<std::string> body;
    FunctionLanguage language;
    FunctionVolatility volatility = FunctionVolatility::Volatile;
    NullBehavior nullBehavior = NullBehavior::CalledOnNullInput;
    SecurityMode security = SecurityMode::Invoker;
    bool parallelSafe = false;
    std::optional<uint32_t> cost;
    std::optional<uint32_t> rows;
    bool isSetReturning = false;
    std::optional<std::vector<FunctionParam>> tableColumns;
    std::optional<std::string> comment;

    FunctionSpec() = default;
    FunctionSpec(std::string functionName, std::string returns)
        : name(std::move(functionName)), returnType(std::move(returns)) {}

    FunctionSpec& withSchema(std::string value) { schema = std::move(value); return *this; }
    FunctionSpec& withParameter(FunctionParam param) { parameters.push_back(std::move(param)); return *this; }
    FunctionSpec& withBody(std::string value) { body = std::move(value); return *this; }
    FunctionSpec& withLanguage(FunctionLanguage value) { language = std::move(value); return *this; }
    FunctionSpec& withVolatility(FunctionVolatility value) { volatility = value; return *this; }
    FunctionSpec& withNullBehavior(NullBehavior value) { nullBehavior = value; return *this; }
    FunctionSpec& withSecurity(SecurityMode value) { security = value; return *this; }
    FunctionSpec& withParallelSafe(bool value = true) { parallelSafe = value; return *this; }
    FunctionSpec& withCost(uint32_t value) { cost = value; return *this; }
    FunctionSpec& withRows(uint32_t value) { rows = value; return *this; }
    FunctionSpec& returnsSet(bool value = true) { isSetReturning = value; return *this; }
    FunctionSpec& returnsTable(std::vector<FunctionParam> columns) {
        tableColumns = std::move(columns);
        return *this;
    }
    FunctionSpec& withComment(std::string value) { comment = std::move(value); return *this; }

    std::string qualifiedName() const {
        return schema ? *schema + "." + name : name;
    }
};

}  // namespace schemaforge
