#include "DdlErrors.hpp"

namespace schemaforge {

std::string PolicyError::message() const {
    switch (code) {
        case Code::EmptyName:
            return "Policy name cannot be empty";
        case Code::EmptyTable:
            return "Table name cannot be empty";
        case Code::NoExpression:
            return "At least USING or WITH CHECK expression is required";
        case Code::EmptyExpression:
            return "Expression cannot be empty";
        case Code::InsertRequiresCheck:
            return "INSERT policies require a WITH CHECK expression";
        case Code::SelectDeleteNoCheck:
            return "SELECT and DELETE policies cannot use WITH CHECK";
        case Code::NotSupported:
            return (detail.empty() ? std::string("Feature") : detail) + " is not supported";
    }
    return "Unknown policy error";
}

std::string TriggerError::message() const {
    switch (code) {
        case Code::EmptyName:
            return "Trigger name cannot be empty";
        case Code::EmptyTable:
            return "Table name cannot be empty";
        case Code::NoEvents:
            return "At least one trigger event must be specified";
        case Code::BeforeNotSupported:
            return "BEFORE triggers are not supported by this dialect";
        case Code::InsteadOfNotSupported:
            return "INSTEAD OF triggers are not supported by this dialect";
        case Code::TruncateNotSupported:
            return "TRUNCATE triggers are not supported by this dialect";
        case Code::StatementLevelNotSupported:
            return "Statement-level triggers are not supported by this dialect";
        case Code::WhenConditionNotSupported:
            return "WHEN conditions on triggers are not supported by this dialect";
        case Code::UpdateColumnsNotSupported:
            return "UPDATE OF columns is not supported by this dialect";
        case Code::MultipleEventsNotSupported:
            return "Multiple trigger events are not supported by this dialect";
        case Code::MissingFunction:
            return "PostgreSQL triggers require a function name";
        case Code::MissingBody:
            return "This dialect requires a trigger body";
    }
    return "Unknown trigger error";
}

std::string FunctionError::message() const {
    switch (code) {
        case Code::EmptyName:
            return "Function name cannot be empty";
        case Code::EmptyReturnType:
            return "Return type cannot be empty";
        case Code::EmptyBody:
            return "Function body cannot be empty";
        case Code::FunctionsNotSupported:
            return "User-defined functions are not supported by this dialect";
        case Code::EmptyParameterName:
            return "Parameter name cannot be empty";
        case Code::EmptyParameterType:
            return "Parameter type cannot be empty";
        case Code::OutParametersNotSupported:
            return "OUT parameters are not supported by this dialect";
        case Code::ReturnsTableNotSupported:
            return "RETURNS TABLE is not supported by this dialect";
        case Code::InvalidParameter:
            return "Invalid parameter: " + detail;
    }
    return "Unknown function error";
}

std::string TableError::message() const {
    switch (code) {
        case Code::EmptyTableName:
            return "Table name is required";
        case Code::NoColumns:
            return "Table must have at least one column";
        case Code::EmptyColumnName:
            return "Column name is required";
        case Code::EmptyColumnType:
            return "Column '" + detail + "' has no data type";
        case Code::DuplicateColumn:
            return "Duplicate column name: " + detail;
        case Code::UnknownIndexColumn:
            return "Index references unknown column: " + detail;
        case Code::UnknownForeignKeyColumn:
            return "Foreign key references unknown column: " + detail;
        case Code::EmptyReferencedTable:
            return "Foreign key has no referenced table";
    }
    return "Unknown table error";
}

std::ostream& operator<<(std::ostream& os, const PolicyError& error) {
    return os << "PolicyError(" << error.message() << ")";
}

std::ostream& operator<<(std::ostream& os, const TriggerError& error) {
    return os << "TriggerError(" << error.message() << ")";
}

std::ostream& operator<<(std::ostream& os, const FunctionError& error) {
    return os << "FunctionError(" << error.message() << ")";
}

std::ostream& operator<<(std::ostream& os, const TableError& error) {
    return os << "TableError(" << error.message() << ")";
}

}  // namespace schemaforge
