#include "JsonCodec.hpp"
#include "IClock.hpp"

namespace rainoracle {

namespace {

// Chain payloads carry policy ids either as numbers or strings.
std::string idFromJson(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number_unsigned()) {
        return std::to_string(value.get<uint64_t>());
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<int64_t>());
    }
    throw std::invalid_argument("policyId must be a string or integer");
}

} // namespace

std::string JsonCodec::serialize(const Event& event) {
    return eventToJson(event).dump();
}

nlohmann::json JsonCodec::eventToJson(const Event& event) {
    nlohmann::json j;
    
    j["eventType"] = eventTypeToString(event.eventType);
    j["ts"] = formatIso8601(event.timestamp);
    j["cycle"] = event.cycle;
    if (!event.policyId.empty()) {
        j["policyId"] = event.policyId;
    }
    if (!event.message.empty()) {
        j["message"] = event.message;
    }
    
    if (!event.extras.empty()) {
        nlohmann::json extras;
        for (const auto& [key, value] : event.extras) {
            extras[key] = value;
        }
        j["extras"] = extras;
    }
    
    return j;
}

nlohmann::json JsonCodec::policyToJson(const Policy& policy) {
    nlohmann::json j;
    
    j["policyId"] = policy.policyId;
    j["marketId"] = policy.marketId;
    j["version"] = policy.version;
    j["lat"] = policy.location.lat;
    j["lon"] = policy.location.lon;
    if (!policy.location.providerKey.empty()) {
        j["locationKey"] = policy.location.providerKey;
    }
    j["coverageStart"] = policy.coverageStart;
    j["coverageEnd"] = policy.coverageEnd;
    j["threshold"] = policy.threshold;
    j["triggerMode"] = triggerModeToString(policy.triggerMode);
    j["status"] = policyStatusToString(policy.status);
    
    return j;
}

Policy JsonCodec::jsonToPolicy(const nlohmann::json& json) {
    Policy policy;
    
    policy.policyId = idFromJson(json.at("policyId"));
    policy.marketId = json.value("marketId", 0ULL);
    policy.version = json.value("version", 2U);
    policy.location.lat = json.at("lat").get<double>();
    policy.location.lon = json.at("lon").get<double>();
    policy.location.providerKey = json.value("locationKey", "");
    policy.coverageStart = json.at("coverageStart").get<int64_t>();
    policy.coverageEnd = json.at("coverageEnd").get<int64_t>();
    policy.threshold = json.at("threshold").get<Tenths>();
    policy.triggerMode = stringToTriggerMode(json.value("triggerMode", "early_trigger"));
    policy.status = stringToPolicyStatus(json.value("status", "active"));
    
    if (policy.coverageEnd <= policy.coverageStart) {
        throw std::invalid_argument("policy " + policy.policyId + " has an empty coverage window");
    }
    
    return policy;
}

nlohmann::json JsonCodec::evidenceToJson(const Evidence& evidence) {
    return {
        {"cumulative", evidence.cumulative},
        {"threshold", evidence.threshold},
        {"firstBucket", evidence.firstBucketIndex},
        {"lastBucket", evidence.lastBucketIndex},
        {"bucketDurationSec", evidence.bucketDurationSeconds},
        {"observedAt", evidence.observedAt},
        {"buckets", bucketsToJson(evidence.buckets)},
        {"historyComplete", evidence.historyComplete},
        {"historyGapEnd", evidence.historyGapEnd}
    };
}

Evidence JsonCodec::jsonToEvidence(const nlohmann::json& json) {
    Evidence evidence;
    
    evidence.cumulative = json.value("cumulative", Tenths{0});
    evidence.threshold = json.value("threshold", Tenths{0});
    evidence.firstBucketIndex = json.value("firstBucket", int64_t{0});
    evidence.lastBucketIndex = json.value("lastBucket", int64_t{0});
    evidence.bucketDurationSeconds = json.value("bucketDurationSec", int64_t{0});
    evidence.observedAt = json.value("observedAt", int64_t{0});
    evidence.historyComplete = json.value("historyComplete", true);
    evidence.historyGapEnd = json.value("historyGapEnd", int64_t{0});
    
    if (json.contains("buckets")) {
        evidence.buckets = jsonToBuckets(json["buckets"]);
    }
    
    return evidence;
}

nlohmann::json JsonCodec::bucketsToJson(const std::vector<BucketValue>& buckets) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& bucket : buckets) {
        j.push_back({{"index", bucket.index}, {"value", bucket.value}});
    }
    return j;
}

std::vector<BucketValue> JsonCodec::jsonToBuckets(const nlohmann::json& json) {
    std::vector<BucketValue> buckets;
    for (const auto& bucket : json) {
        buckets.push_back({bucket.at("index").get<int64_t>(), bucket.at("value").get<Tenths>()});
    }
    return buckets;
}

nlohmann::json JsonCodec::checkpointToJson(const RainfallCheckpoint& checkpoint) {
    nlohmann::json j;
    
    j["policyId"] = checkpoint.policyId;
    j["bucketDurationSec"] = checkpoint.bucketDurationSeconds;
    j["fetchedThrough"] = checkpoint.fetchedThrough;
    j["windowStart"] = checkpoint.windowStartIndex;
    if (checkpoint.lastBucketIndex) {
        j["lastBucket"] = *checkpoint.lastBucketIndex;
    }
    j["prunedBelow"] = checkpoint.prunedBelow;
    j["buckets"] = bucketsToJson(checkpoint.buckets);
    j["merged"] = checkpoint.mergedTimestamps;
    j["peak"] = {
        {"sum", checkpoint.peakSum},
        {"firstBucket", checkpoint.peakFirstIndex},
        {"lastBucket", checkpoint.peakLastIndex},
        {"buckets", bucketsToJson(checkpoint.peakBuckets)}
    };
    if (checkpoint.historyGapEnd) {
        j["historyGapEnd"] = *checkpoint.historyGapEnd;
    }
    
    return j;
}

RainfallCheckpoint JsonCodec::jsonToCheckpoint(const nlohmann::json& json) {
    RainfallCheckpoint checkpoint;
    
    checkpoint.policyId = json.at("policyId").get<std::string>();
    checkpoint.bucketDurationSeconds = json.at("bucketDurationSec").get<int64_t>();
    checkpoint.fetchedThrough = json.at("fetchedThrough").get<int64_t>();
    checkpoint.windowStartIndex = json.value("windowStart", int64_t{0});
    if (json.contains("lastBucket")) {
        checkpoint.lastBucketIndex = json["lastBucket"].get<int64_t>();
    }
    checkpoint.prunedBelow = json.value("prunedBelow", int64_t{0});
    checkpoint.buckets = jsonToBuckets(json.value("buckets", nlohmann::json::array()));
    checkpoint.mergedTimestamps = json.value("merged", std::vector<int64_t>{});
    if (json.contains("peak")) {
        const auto& peak = json["peak"];
        checkpoint.peakSum = peak.value("sum", Tenths{0});
        checkpoint.peakFirstIndex = peak.value("firstBucket", int64_t{0});
        checkpoint.peakLastIndex = peak.value("lastBucket", int64_t{0});
        checkpoint.peakBuckets = jsonToBuckets(peak.value("buckets", nlohmann::json::array()));
    }
    if (json.contains("historyGapEnd")) {
        checkpoint.historyGapEnd = json["historyGapEnd"].get<int64_t>();
    }
    
    return checkpoint;
}

nlohmann::json JsonCodec::decisionToJson(const TriggerDecision& decision) {
    return {
        {"kind", decisionKindToString(decision.kind)},
        {"eventOccurred", decision.eventOccurred},
        {"evidence", evidenceToJson(decision.evidence)}
    };
}

TriggerDecision JsonCodec::jsonToDecision(const nlohmann::json& json) {
    TriggerDecision decision;
    
    decision.kind = stringToDecisionKind(json.at("kind").get<std::string>());
    decision.eventOccurred = json.value("eventOccurred", false);
    if (json.contains("evidence")) {
        decision.evidence = jsonToEvidence(json["evidence"]);
    }
    
    return decision;
}

nlohmann::json JsonCodec::recordToJson(const SubmissionRecord& record) {
    nlohmann::json j;
    
    j["policyId"] = record.policyId;
    j["key"] = record.idempotencyKey;
    j["decision"] = decisionToJson(record.decision);
    j["status"] = submissionStatusToString(record.status);
    j["retryCount"] = record.retryCount;
    j["createdAt"] = record.createdAt;
    j["lastAttemptAt"] = record.lastAttemptAt;
    j["nextAttemptAt"] = record.nextAttemptAt;
    j["lastError"] = record.lastError;
    j["evidenceHash"] = record.evidenceHash;
    j["txHash"] = record.txHash;
    
    return j;
}

SubmissionRecord JsonCodec::jsonToRecord(const nlohmann::json& json) {
    SubmissionRecord record;
    
    record.policyId = json.at("policyId").get<std::string>();
    record.idempotencyKey = json.at("key").get<std::string>();
    record.decision = jsonToDecision(json.at("decision"));
    record.status = stringToSubmissionStatus(json.at("status").get<std::string>());
    record.retryCount = json.value("retryCount", 0);
    record.createdAt = json.value("createdAt", int64_t{0});
    record.lastAttemptAt = json.value("lastAttemptAt", int64_t{0});
    record.nextAttemptAt = json.value("nextAttemptAt", int64_t{0});
    record.lastError = json.value("lastError", "");
    record.evidenceHash = json.value("evidenceHash", "");
    record.txHash = json.value("txHash", "");
    
    return record;
}

nlohmann::json JsonCodec::evidenceDocument(const PolicyId& policyId, const TriggerDecision& decision) {
    nlohmann::json doc = evidenceToJson(decision.evidence);
    doc["policyId"] = policyId;
    doc["outcome"] = reportOutcome(decision);
    doc["eventOccurred"] = decision.eventOccurred;
    doc["observedAtIso"] = formatIso8601(decision.evidence.observedAt);
    return doc;
}

} // namespace rainoracle
