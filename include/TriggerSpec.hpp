#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace schemaforge {

enum class TriggerTiming {
    Before,
    After,
    InsteadOf
};

enum class TriggerEvent {
    Insert,
    Update,
    Delete,
    Truncate
};

enum class TriggerLevel {
    Row,
    Statement
};

std::string triggerTimingToSql(TriggerTiming timing);
std::string triggerEventToSql(TriggerEvent event);
std::string triggerLevelToSql(TriggerLevel level);
TriggerTiming parseTriggerTiming(const std::string& text);
TriggerEvent parseTriggerEvent(const std::string& text);
TriggerLevel parseTriggerLevel(const std::string& text);

// Trigger specification. PostgreSQL triggers call functionName; the other
// dialects carry an inline body.
struct TriggerSpec {
    std::string name;
    std::string table;
    std::optional<std::string> schema;
    TriggerTiming timing = TriggerTiming::After;
    std::vector<TriggerEvent> events{TriggerEvent::Insert};
    TriggerLevel level = TriggerLevel::Row;
    std::optional<std::string> whenCondition;
    std::optional<std::string> functionName;
    std::optional<std::string> body;
    std::vector<std::string> updateColumns;
    std::optional<std::string> comment;

    TriggerSpec() = default;
    TriggerSpec(std::string triggerName, std::string tableName)
        : name(std::move(triggerName)), table(std::move(tableName)) {}

    TriggerSpec& withSchema(std::string value) { schema = std::move(value); return *this; }
    TriggerSpec& withTiming(TriggerTiming value) { timing = value; return *this; }
    TriggerSpec& withEvents(const std::vector<TriggerEvent>& value);
    TriggerSpec& withLevel(TriggerLevel value) { level = value; return *this; }
    TriggerSpec& withWhen(std::string condition) { whenCondition = std::move(condition); return *this; }
    TriggerSpec& withFunction(std::string value) { functionName = std::move(value); return *this; }
    TriggerSpec& withBody(std::string value) { body = std::move(value); return *this; }
    TriggerSpec& withComment(std::string value) { comment = std::move(value); return *this; }
    TriggerSpec& withUpdateColumns(std::vector<std::string> value) {
        updateColumns = std::move(value);
        return *this;
    }

    // Add an event, keeping the list free of duplicates
    TriggerSpec& addEvent(TriggerEvent event);
};

}  // namespace schemaforge
