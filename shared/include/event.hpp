#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace srvkeeper {

struct EventAttribute {
    std::string key;
    std::string value;
};

// One journal entry. Everything the orchestrator logs, every admin command in the inbox and every
// piece of stop evidence is carried as an EventRecord.
struct EventRecord {
    std::string source;
    std::string category;
    std::string severity;
    std::string message;
    std::vector<EventAttribute> attributes;
    std::chrono::system_clock::time_point timestamp;
    std::uint64_t sequence = 0;
};

std::string SerializeEvent(const EventRecord &record);
bool DeserializeEvent(std::string_view json, EventRecord &record);

std::optional<std::string> FindAttribute(const EventRecord &record, std::string_view key);
void SetAttribute(EventRecord &record, const std::string &key, const std::string &value);

std::string FormatTimestampUtc(const std::chrono::system_clock::time_point &tp);

}  // namespace srvkeeper
