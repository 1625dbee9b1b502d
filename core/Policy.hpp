#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rainoracle {

/// Rainfall values are tenths of millimetres throughout the engine.
using Tenths = int64_t;

using PolicyId = std::string;

enum class TriggerMode {
    EarlyTrigger,
    MaturityOnly
};

enum class PolicyStatus {
    Active,
    Triggered,
    Matured,
    Settled
};

struct GeoLocation {
    double lat = 0.0;
    double lon = 0.0;
    std::string providerKey;   // resolved weather-provider key, may be empty
};

struct Policy {
    PolicyId policyId;
    uint64_t marketId = 0;
    uint32_t version = 2;
    GeoLocation location;
    int64_t coverageStart = 0;   // inclusive, unix seconds
    int64_t coverageEnd = 0;     // exclusive, unix seconds
    Tenths threshold = 0;
    TriggerMode triggerMode = TriggerMode::EarlyTrigger;
    PolicyStatus status = PolicyStatus::Active;
};

struct Reading {
    int64_t timestamp = 0;
    Tenths precipitation = 0;
};

enum class DecisionKind {
    None,
    EarlyTrigger,
    Matured
};

struct BucketValue {
    int64_t index = 0;
    Tenths value = 0;
};

struct Evidence {
    Tenths cumulative = 0;
    Tenths threshold = 0;
    int64_t firstBucketIndex = 0;
    int64_t lastBucketIndex = 0;
    int64_t bucketDurationSeconds = 0;
    int64_t observedAt = 0;
    std::vector<BucketValue> buckets;
    bool historyComplete = true;
    int64_t historyGapEnd = 0;   ///< readings before this could not be fetched when !historyComplete
};

struct TriggerDecision {
    DecisionKind kind = DecisionKind::None;
    bool eventOccurred = false;
    Evidence evidence;

    static TriggerDecision none() { return TriggerDecision{}; }
    bool isNone() const { return kind == DecisionKind::None; }
};

/**
 * @brief Persisted aggregation state of one policy
 *
 * Saved after every fetch so a restart resumes from fetchedThrough instead of
 * refetching history the provider may no longer serve.
 */
struct RainfallCheckpoint {
    PolicyId policyId;
    int64_t bucketDurationSeconds = 0;
    int64_t fetchedThrough = 0;
    int64_t windowStartIndex = 0;
    std::optional<int64_t> lastBucketIndex;
    int64_t prunedBelow = 0;
    std::vector<BucketValue> buckets;
    std::vector<int64_t> mergedTimestamps;   ///< timestamps of still-open buckets
    Tenths peakSum = 0;
    int64_t peakFirstIndex = 0;
    int64_t peakLastIndex = 0;
    std::vector<BucketValue> peakBuckets;
    std::optional<int64_t> historyGapEnd;
};

enum class SubmissionStatus {
    Pending,
    Confirmed,
    Failed
};

struct SubmissionRecord {
    PolicyId policyId;
    std::string idempotencyKey;
    TriggerDecision decision;
    SubmissionStatus status = SubmissionStatus::Pending;
    int retryCount = 0;
    int64_t createdAt = 0;
    int64_t lastAttemptAt = 0;
    int64_t nextAttemptAt = 0;
    std::string lastError;
    std::string evidenceHash;
    std::string txHash;
};

std::string makeIdempotencyKey(const PolicyId& policyId, DecisionKind kind);

std::string triggerModeToString(TriggerMode mode);
TriggerMode stringToTriggerMode(const std::string& str);

std::string policyStatusToString(PolicyStatus status);
PolicyStatus stringToPolicyStatus(const std::string& str);

std::string decisionKindToString(DecisionKind kind);
DecisionKind stringToDecisionKind(const std::string& str);

std::string submissionStatusToString(SubmissionStatus status);
SubmissionStatus stringToSubmissionStatus(const std::string& str);

/// Outcome name the ledger expects for a decision ("Triggered" / "MaturedNoEvent").
std::string reportOutcome(const TriggerDecision& decision);

} // namespace rainoracle
