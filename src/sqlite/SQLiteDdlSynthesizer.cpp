#include "SQLiteDdlSynthesizer.hpp"
#include "StringUtils.hpp"
#include <sstream>

namespace schemaforge {

std::string SQLiteDdlSynthesizer::createTrigger(const TriggerSpec& spec) const {
    const TriggerEvent event = spec.events.front();
    std::string eventSql = triggerEventToSql(event);
    if (event == TriggerEvent::Update && !spec.updateColumns.empty()) {
        std::vector<std::string> columns;
        for (const auto& c : spec.updateColumns) columns.push_back(m_quoter.quoteSegment(c));
        eventSql = "UPDATE OF " + join(columns, ", ");
    }

    std::ostringstream sql;
    sql << "CREATE TRIGGER " << m_quoter.quoteSegment(spec.name) << "\n"
        << "    " << triggerTimingToSql(spec.timing) << " " << eventSql << "\n"
        << "    ON " << m_quoter.qualify(spec.schema, spec.table) << "\n"
        << "    FOR EACH ROW";
    if (spec.whenCondition) {
        sql << "\n    WHEN " << *spec.whenCondition;
    }
    sql << "\nBEGIN\n" << spec.body.value_or("") << "\nEND";
    return sql.str();
}

std::vector<std::string> SQLiteDdlSynthesizer::alterColumn(const std::string&,
                                                           const std::string&,
                                                           const ColumnDesign& before,
                                                           const ColumnDesign& after) const {
    if (before.typeSpec() == after.typeSpec() && before.nullable == after.nullable &&
        before.defaultValue == after.defaultValue) {
        return {};
    }
    const std::string column = quoteName(after.name);
    return {
        "-- SQLite does not support ALTER COLUMN for type/nullable/default changes on " + column + ".",
        "-- Consider recreating the table to apply changes to column " + column + ".",
    };
}

std::string SQLiteDdlSynthesizer::tableOptions(const TableOptions& options) const {
    std::vector<std::string> parts;
    if (options.withoutRowid) parts.push_back("WITHOUT ROWID");
    if (options.strict) parts.push_back("STRICT");

    if (parts.empty()) {
        return {};
    }
    return " " + join(parts, ", ");
}

}  // namespace schemaforge
