#include "Event.hpp"
#include <stdexcept>

namespace rainoracle {

std::string eventTypeToString(EventType type) {
    static const std::unordered_map<EventType, std::string> typeMap = {
        {EventType::PolicyFatal, "policy_fatal"},
        {EventType::PolicyRecovered, "policy_recovered"},
        {EventType::SubmissionConfirmed, "submission_confirmed"},
        {EventType::SubmissionFailed, "submission_failed"},
        {EventType::PassCompleted, "pass_completed"}
    };
    
    auto it = typeMap.find(type);
    return (it != typeMap.end()) ? it->second : "unknown";
}

EventType stringToEventType(const std::string& str) {
    static const std::unordered_map<std::string, EventType> stringMap = {
        {"policy_fatal", EventType::PolicyFatal},
        {"policy_recovered", EventType::PolicyRecovered},
        {"submission_confirmed", EventType::SubmissionConfirmed},
        {"submission_failed", EventType::SubmissionFailed},
        {"pass_completed", EventType::PassCompleted}
    };
    
    auto it = stringMap.find(str);
    if (it == stringMap.end()) {
        throw std::invalid_argument("Unknown event type: " + str);
    }
    return it->second;
}

} // namespace rainoracle
