#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace rainoracle {

enum class EventType {
    PolicyFatal,
    PolicyRecovered,
    SubmissionConfirmed,
    SubmissionFailed,
    PassCompleted
};

struct Event {
    EventType eventType = EventType::PassCompleted;
    std::string policyId;
    std::string message;
    int64_t timestamp = 0;
    uint64_t cycle = 0;
    
    std::unordered_map<std::string, std::string> extras;
};

std::string eventTypeToString(EventType type);
EventType stringToEventType(const std::string& str);

} // namespace rainoracle
