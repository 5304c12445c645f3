#include "TriggerSpec.hpp"
#include "StringUtils.hpp"
#include <algorithm>
#include <stdexcept>

namespace schemaforge {

std::string triggerTimingToSql(TriggerTiming timing) {
    switch (timing) {
        case TriggerTiming::Before: return "BEFORE";
        case TriggerTiming::After: return "AFTER";
        case TriggerTiming::InsteadOf: return "INSTEAD OF";
    }
    return "AFTER";
}

std::string triggerEventToSql(TriggerEvent event) {
    switch (event) {
        case TriggerEvent::Insert: return "INSERT";
        case TriggerEvent::Update: return "UPDATE";
        case TriggerEvent::Delete: return "DELETE";
        case TriggerEvent::Truncate: return "TRUNCATE";
    }
    return "INSERT";
}

std::string triggerLevelToSql(TriggerLevel level) {
    return level == TriggerLevel::Statement ? "FOR EACH STATEMENT" : "FOR EACH ROW";
}

TriggerTiming parseTriggerTiming(const std::string& text) {
    std::string upper = toUpper(trim(text));
    if (upper == "BEFORE") return TriggerTiming::Before;
    if (upper == "AFTER") return TriggerTiming::After;
    if (upper == "INSTEAD OF" || upper == "INSTEAD_OF" || upper == "INSTEADOF") {
        return TriggerTiming::InsteadOf;
    }
    throw std::invalid_argument("Unknown trigger timing: " + text);
}

TriggerEvent parseTriggerEvent(const std::string& text) {
    std::string upper = toUpper(trim(text));
    if (upper == "INSERT") return TriggerEvent::Insert;
    if (upper == "UPDATE") return TriggerEvent::Update;
    if (upper == "DELETE") return TriggerEvent::Delete;
    if (upper == "TRUNCATE") return TriggerEvent::Truncate;
    throw std::invalid_argument("Unknown trigger event: " + text);
}

TriggerLevel parseTriggerLevel(const std::string& text) {
    std::string upper = toUpper(trim(text));
    if (upper == "ROW" || upper == "FOR EACH ROW") return TriggerLevel::Row;
    if (upper == "STATEMENT" || upper == "FOR EACH STATEMENT") return TriggerLevel::Statement;
    throw std::invalid_argument("Unknown trigger level: " + text);
}

TriggerSpec& TriggerSpec::withEvents(const std::vector<TriggerEvent>& value) {
    events.clear();
    for (auto event : value) {
        addEvent(event);
    }
    return *this;
}

TriggerSpec& TriggerSpec::addEvent(TriggerEvent event) {
    if (std::find(events.begin(), events.end(), event) == events.end()) {
        events.push_back(event);
    }
    return *this;
}

}  // namespace schemaforge
