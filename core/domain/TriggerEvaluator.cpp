#include "TriggerEvaluator.hpp"
#include <algorithm>

namespace rainoracle::domain {

TriggerDecision TriggerEvaluator::evaluate(const Policy& policy, const RollingState& state, int64_t now) {
    if (policy.status != PolicyStatus::Active || now < policy.coverageStart) {
        return TriggerDecision::none();
    }
    
    const bool thresholdReached = std::max(state.cumulativeSum, state.peakSum) >= policy.threshold;
    
    TriggerDecision decision;
    if (policy.triggerMode == TriggerMode::EarlyTrigger && thresholdReached && now < policy.coverageEnd) {
        decision.kind = DecisionKind::EarlyTrigger;
        decision.eventOccurred = true;
    } else if (now >= policy.coverageEnd) {
        decision.kind = DecisionKind::Matured;
        decision.eventOccurred = thresholdReached;
    } else {
        return TriggerDecision::none();
    }
    
    decision.evidence = buildEvidence(policy, state, now);
    return decision;
}

Evidence TriggerEvaluator::buildEvidence(const Policy& policy, const RollingState& state, int64_t now) {
    Evidence evidence;
    evidence.threshold = policy.threshold;
    evidence.bucketDurationSeconds = state.bucketDurationSeconds;
    evidence.observedAt = now < policy.coverageEnd ? now : policy.coverageEnd;
    evidence.historyComplete = !state.historyGapEnd.has_value();
    evidence.historyGapEnd = state.historyGapEnd.value_or(0);
    
    // A rolling window that already slid past its wettest span reports that span.
    if (state.peakSum > state.cumulativeSum) {
        evidence.cumulative = state.peakSum;
        evidence.firstBucketIndex = state.peakFirstIndex;
        evidence.lastBucketIndex = state.peakLastIndex;
        evidence.buckets = state.peakBuckets;
        return evidence;
    }
    
    evidence.cumulative = state.cumulativeSum;
    evidence.firstBucketIndex = state.windowStartIndex;
    evidence.lastBucketIndex = std::max(state.windowStartIndex,
                                        state.lastBucketIndex.value_or(state.windowStartIndex));
    
    for (auto it = state.buckets.lower_bound(state.windowStartIndex); it != state.buckets.end(); ++it) {
        evidence.buckets.push_back(BucketValue{it->first, it->second});
    }
    return evidence;
}

} // namespace rainoracle::domain
