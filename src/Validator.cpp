#include "Validator.hpp"
#include "CapabilityMatrix.hpp"
#include "StringUtils.hpp"
#include <algorithm>
#include <unordered_set>

namespace schemaforge {

namespace {

bool blankOrMissing(const std::optional<std::string>& value) {
    return !value || isBlank(*value);
}

bool hasEvent(const TriggerSpec& spec, TriggerEvent event) {
    return std::find(spec.events.begin(), spec.events.end(), event) != spec.events.end();
}

// T-SQL @variable names cannot be bracket-quoted, so only regular names pass:
// [A-Za-z_][A-Za-z0-9_@#$]*
bool isTsqlVariableName(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    auto isAlpha = [](char c) { return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z'); };
    if (!isAlpha(name[0]) && name[0] != '_') {
        return false;
    }
    return std::all_of(name.begin() + 1, name.end(), [&](char c) {
        return isAlpha(c) || (c >= '0' && c <= '9') || c == '_' || c == '@' || c == '#' || c == '$';
    });
}

}  // namespace

// ============================================================================
// Policy
// ============================================================================

Result<void, PolicyError> PolicyValidator::validate(const PolicySpec& spec, Dialect dialect) {
    using Code = PolicyError::Code;

    if (isBlank(spec.name)) {
        return PolicyError(Code::EmptyName);
    }
    if (isBlank(spec.table)) {
        return PolicyError(Code::EmptyTable);
    }

    switch (spec.command) {
        case PolicyCommand::Insert:
            // USING is never consulted for INSERT
            if (!spec.checkExpr) {
                return PolicyError(Code::InsertRequiresCheck);
            }
            break;
        case PolicyCommand::Select:
        case PolicyCommand::Delete:
            if (!spec.usingExpr) {
                return PolicyError(Code::NoExpression);
            }
            if (spec.checkExpr) {
                return PolicyError(Code::SelectDeleteNoCheck);
            }
            break;
        case PolicyCommand::Update:
        case PolicyCommand::All:
            if (!spec.usingExpr && !spec.checkExpr) {
                return PolicyError(Code::NoExpression);
            }
            break;
    }

    if (spec.usingExpr && isBlank(*spec.usingExpr)) {
        return PolicyError(Code::EmptyExpression);
    }
    if (spec.checkExpr && isBlank(*spec.checkExpr)) {
        return PolicyError(Code::EmptyExpression);
    }

    if (!capabilitiesFor(dialect).supportsRowSecurity) {
        return PolicyError(Code::NotSupported,
                           "Row-level security policies on " + dialectDisplayName(dialect));
    }

    return {};
}

// ============================================================================
// Trigger
// ============================================================================

Result<void, TriggerError> TriggerValidator::validate(const TriggerSpec& spec, Dialect dialect) {
    using Code = TriggerError::Code;
    const auto& caps = capabilitiesFor(dialect);

    if (isBlank(spec.name)) {
        return TriggerError(Code::EmptyName);
    }
    if (isBlank(spec.table)) {
        return TriggerError(Code::EmptyTable);
    }
    if (spec.events.empty()) {
        return TriggerError(Code::NoEvents);
    }
    if (spec.timing == TriggerTiming::Before && !caps.supportsBeforeTrigger) {
        return TriggerError(Code::BeforeNotSupported);
    }
    if (spec.timing == TriggerTiming::InsteadOf && !caps.supportsInsteadOfTrigger) {
        return TriggerError(Code::InsteadOfNotSupported);
    }
    if (hasEvent(spec, TriggerEvent::Truncate) && !caps.supportsTruncateTrigger) {
        return TriggerError(Code::TruncateNotSupported);
    }
    if (spec.level == TriggerLevel::Statement && !caps.supportsStatementLevel) {
        return TriggerError(Code::StatementLevelNotSupported);
    }
    if (spec.whenCondition && !caps.supportsWhenCondition) {
        return TriggerError(Code::WhenConditionNotSupported);
    }
    if (!spec.updateColumns.empty() && !caps.supportsUpdateColumns) {
        return TriggerError(Code::UpdateColumnsNotSupported);
    }
    if (spec.events.size() > 1 && !caps.supportsMultipleTriggerEvents) {
        return TriggerError(Code::MultipleEventsNotSupported);
    }

    if (caps.requiresFunctionForTrigger) {
        if (blankOrMissing(spec.functionName)) {
            return TriggerError(Code::MissingFunction);
        }
    } else if (blankOrMissing(spec.body)) {
        return TriggerError(Code::MissingBody);
    }

    return {};
}

// ============================================================================
// Function
// ============================================================================

Result<void, FunctionError> FunctionValidator::validate(const FunctionSpec& spec, Dialect dialect) {
    using Code = FunctionError::Code;
    const auto& caps = capabilitiesFor(dialect);

    if (isBlank(spec.name)) {
        return FunctionError(Code::EmptyName);
    }
    if (isBlank(spec.returnType) && !spec.tableColumns) {
        return FunctionError(Code::EmptyReturnType);
    }
    if (blankOrMissing(spec.body)) {
        return FunctionError(Code::EmptyBody);
    }
    if (!caps.supportsFunctions) {
        return FunctionError(Code::FunctionsNotSupported);
    }

    for (const auto& param : spec.parameters) {
        if (isBlank(param.name)) {
            return FunctionError(Code::EmptyParameterName);
        }
        if (isBlank(param.dataType)) {
            return FunctionError(Code::EmptyParameterType);
        }
    }

    if (!caps.supportsOutParameters &&
        std::any_of(spec.parameters.begin(), spec.parameters.end(),
                    [](const FunctionParam& param) { return isOutputMode(param.mode); })) {
        return FunctionError(Code::OutParametersNotSupported);
    }

    if (dialect == Dialect::MsSql) {
        for (const auto& param : spec.parameters) {
            if (!isTsqlVariableName(param.name)) {
                return FunctionError(Code::InvalidParameter,
                                     "'" + param.name + "' is not a valid T-SQL parameter name");
            }
        }
    }

    if (spec.tableColumns && !caps.supportsReturnsTable) {
        return FunctionError(Code::ReturnsTableNotSupported);
    }

    return {};
}

// ============================================================================
// Table
// ============================================================================

Result<void, TableError> TableValidator::validate(const TableDesign& design) {
    using Code = TableError::Code;

    if (isBlank(design.tableName)) {
        return TableError(Code::EmptyTableName);
    }
    if (design.columns.empty()) {
        return TableError(Code::NoColumns);
    }

    for (const auto& column : design.columns) {
        if (isBlank(column.name)) {
            return TableError(Code::EmptyColumnName);
        }
        if (isBlank(column.dataType)) {
            return TableError(Code::EmptyColumnType, column.name);
        }
    }

    std::unordered_set<std::string> seen;
    for (const auto& column : design.columns) {
        if (!seen.insert(toLower(column.name)).second) {
            return TableError(Code::DuplicateColumn, column.name);
        }
    }

    for (const auto& index : design.indexes) {
        for (const auto& column : index.columns) {
            if (seen.count(toLower(column)) == 0) {
                return TableError(Code::UnknownIndexColumn, column);
            }
        }
    }

    for (const auto& fk : design.foreignKeys) {
        for (const auto& column : fk.columns) {
            if (seen.count(toLower(column)) == 0) {
                return TableError(Code::UnknownForeignKeyColumn, column);
            }
        }
        if (isBlank(fk.referencedTable)) {
            return TableError(Code::EmptyReferencedTable);
        }
    }

    return {};
}

}  // namespace schemaforge
