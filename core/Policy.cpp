#include "Policy.hpp"
#include "OracleError.hpp"
#include <unordered_map>

namespace rainoracle {

std::string makeIdempotencyKey(const PolicyId& policyId, DecisionKind kind) {
    return policyId + ":" + decisionKindToString(kind);
}

std::string triggerModeToString(TriggerMode mode) {
    switch (mode) {
        case TriggerMode::EarlyTrigger: return "early_trigger";
        case TriggerMode::MaturityOnly: return "maturity_only";
    }
    return "early_trigger";
}

TriggerMode stringToTriggerMode(const std::string& str) {
    static const std::unordered_map<std::string, TriggerMode> modeMap = {
        {"early_trigger", TriggerMode::EarlyTrigger},
        {"EarlyTrigger", TriggerMode::EarlyTrigger},
        {"maturity_only", TriggerMode::MaturityOnly},
        {"MaturityOnly", TriggerMode::MaturityOnly}
    };
    
    auto it = modeMap.find(str);
    if (it == modeMap.end()) {
        throw std::invalid_argument("Unknown trigger mode: " + str);
    }
    return it->second;
}

std::string policyStatusToString(PolicyStatus status) {
    switch (status) {
        case PolicyStatus::Active: return "active";
        case PolicyStatus::Triggered: return "triggered";
        case PolicyStatus::Matured: return "matured";
        case PolicyStatus::Settled: return "settled";
    }
    return "active";
}

PolicyStatus stringToPolicyStatus(const std::string& str) {
    static const std::unordered_map<std::string, PolicyStatus> statusMap = {
        {"active", PolicyStatus::Active},
        {"Active", PolicyStatus::Active},
        {"triggered", PolicyStatus::Triggered},
        {"Triggered", PolicyStatus::Triggered},
        {"matured", PolicyStatus::Matured},
        {"Matured", PolicyStatus::Matured},
        {"settled", PolicyStatus::Settled},
        {"Settled", PolicyStatus::Settled}
    };
    
    auto it = statusMap.find(str);
    if (it == statusMap.end()) {
        throw std::invalid_argument("Unknown policy status: " + str);
    }
    return it->second;
}

std::string decisionKindToString(DecisionKind kind) {
    switch (kind) {
        case DecisionKind::None: return "none";
        case DecisionKind::EarlyTrigger: return "early_trigger";
        case DecisionKind::Matured: return "matured";
    }
    return "none";
}

DecisionKind stringToDecisionKind(const std::string& str) {
    static const std::unordered_map<std::string, DecisionKind> kindMap = {
        {"none", DecisionKind::None},
        {"early_trigger", DecisionKind::EarlyTrigger},
        {"matured", DecisionKind::Matured}
    };
    
    auto it = kindMap.find(str);
    if (it == kindMap.end()) {
        throw std::invalid_argument("Unknown decision kind: " + str);
    }
    return it->second;
}

std::string submissionStatusToString(SubmissionStatus status) {
    switch (status) {
        case SubmissionStatus::Pending: return "pending";
        case SubmissionStatus::Confirmed: return "confirmed";
        case SubmissionStatus::Failed: return "failed";
    }
    return "pending";
}

SubmissionStatus stringToSubmissionStatus(const std::string& str) {
    static const std::unordered_map<std::string, SubmissionStatus> statusMap = {
        {"pending", SubmissionStatus::Pending},
        {"confirmed", SubmissionStatus::Confirmed},
        {"failed", SubmissionStatus::Failed}
    };
    
    auto it = statusMap.find(str);
    if (it == statusMap.end()) {
        throw std::invalid_argument("Unknown submission status: " + str);
    }
    return it->second;
}

std::string reportOutcome(const TriggerDecision& decision) {
    if (decision.kind == DecisionKind::EarlyTrigger) {
        return "Triggered";
    }
    return decision.eventOccurred ? "MaturedEvent" : "MaturedNoEvent";
}

std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Retryable: return "retryable";
        case ErrorKind::StaleReading: return "stale_reading";
        case ErrorKind::DataUnavailable: return "data_unavailable";
        case ErrorKind::Fatal: return "fatal";
        case ErrorKind::ChainRejectedDuplicate: return "chain_rejected_duplicate";
    }
    return "unknown";
}

} // namespace rainoracle
