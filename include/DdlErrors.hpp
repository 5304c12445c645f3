#pragma once

#include <ostream>
#include <string>
#include <utility>

namespace schemaforge {

// Closed error types returned by validators and managers. Each carries a
// code and an optional detail (feature name, column name, reason).

struct PolicyError {
    enum class Code {
        EmptyName,
        EmptyTable,
        NoExpression,
        EmptyExpression,
        InsertRequiresCheck,
        SelectDeleteNoCheck,
        NotSupported
    };

    Code code;
    std::string detail;

    PolicyError(Code c, std::string d = {}) : code(c), detail(std::move(d)) {}

    std::string message() const;

    bool operator==(const PolicyError& other) const {
        return code == other.code && detail == other.detail;
    }
    bool operator!=(const PolicyError& other) const { return !(*this == other); }
};

struct TriggerError {
    enum class Code {
        EmptyName,
        EmptyTable,
        NoEvents,
        BeforeNotSupported,
        InsteadOfNotSupported,
        TruncateNotSupported,
        StatementLevelNotSupported,
        WhenConditionNotSupported,
        UpdateColumnsNotSupported,
        MultipleEventsNotSupported,
        MissingFunction,
        MissingBody
    };

    Code code;
    std::string detail;

    TriggerError(Code c, std::string d = {}) : code(c), detail(std::move(d)) {}

    std::string message() const;

    bool operator==(const TriggerError& other) const {
        return code == other.code && detail == other.detail;
    }
    bool operator!=(const TriggerError& other) const { return !(*this == other); }
};

struct FunctionError {
    enum class Code {
        EmptyName,
        EmptyReturnType,
        EmptyBody,
        FunctionsNotSupported,
        EmptyParameterName,
        EmptyParameterType,
        OutParametersNotSupported,
        ReturnsTableNotSupported,
        InvalidParameter
    };

    Code code;
    std::string detail;

    FunctionError(Code c, std::string d = {}) : code(c), detail(std::move(d)) {}

    std::string message() const;

    bool operator==(const FunctionError& other) const {
        return code == other.code && detail == other.detail;
    }
    bool operator!=(const FunctionError& other) const { return !(*this == other); }
};

struct TableError {
    enum class Code {
        EmptyTableName,
        NoColumns,
        EmptyColumnName,
        EmptyColumnType,
        DuplicateColumn,
        UnknownIndexColumn,
        UnknownForeignKeyColumn,
        EmptyReferencedTable
    };

    Code code;
    std::string detail;

    TableError(Code c, std::string d = {}) : code(c), detail(std::move(d)) {}

    std::string message() const;

    bool operator==(const TableError& other) const {
        return code == other.code && detail == other.detail;
    }
    bool operator!=(const TableError& other) const { return !(*this == other); }
};

// Stream output, used by gtest failure messages and log lines
std::ostream& operator<<(std::ostream& os, const PolicyError& error);
std::ostream& operator<<(std::ostream& os, const TriggerError& error);
std::ostream& operator<<(std::ostream& os, const FunctionError& error);
std::ostream& operator<<(std::ostream& os, const TableError& error);

}  // namespace schemaforge
