#pragma once

#include "Event.hpp"
#include "Policy.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace rainoracle {

class JsonCodec {
public:
    static std::string serialize(const Event& event);
    static nlohmann::json eventToJson(const Event& event);
    
    static nlohmann::json policyToJson(const Policy& policy);
    static Policy jsonToPolicy(const nlohmann::json& json);
    
    static nlohmann::json evidenceToJson(const Evidence& evidence);
    static Evidence jsonToEvidence(const nlohmann::json& json);
    
    static nlohmann::json bucketsToJson(const std::vector<BucketValue>& buckets);
    static std::vector<BucketValue> jsonToBuckets(const nlohmann::json& json);
    
    static nlohmann::json checkpointToJson(const RainfallCheckpoint& checkpoint);
    static RainfallCheckpoint jsonToCheckpoint(const nlohmann::json& json);
    
    static nlohmann::json decisionToJson(const TriggerDecision& decision);
    static TriggerDecision jsonToDecision(const nlohmann::json& json);
    
    static nlohmann::json recordToJson(const SubmissionRecord& record);
    static SubmissionRecord jsonToRecord(const nlohmann::json& json);
    
    /// Audit document hashed into the report; key order is fixed by nlohmann's sorted object.
    static nlohmann::json evidenceDocument(const PolicyId& policyId, const TriggerDecision& decision);
};

} // namespace rainoracle
