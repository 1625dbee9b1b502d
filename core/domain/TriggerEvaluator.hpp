#pragma once

#include "../Policy.hpp"
#include "RainfallAggregator.hpp"

namespace rainoracle::domain {

/**
 * @brief Decides early trigger or maturity for one policy
 *
 * Pure function of (policy, rainfall state, now), where observed is the
 * current window sum or, for a rolling window, the peak window sum if higher:
 * - policy not Active, or now before coverage start: None
 * - EarlyTrigger mode, observed >= threshold, now before coverage end: EarlyTrigger
 * - now at or after coverage end: Matured, eventOccurred = observed >= threshold
 * - otherwise None
 *
 * Reaching the threshold exactly counts as the event having occurred.
 */
class TriggerEvaluator {
public:
    static TriggerDecision evaluate(const Policy& policy, const RollingState& state, int64_t now);
    
    static Evidence buildEvidence(const Policy& policy, const RollingState& state, int64_t now);
};

} // namespace rainoracle::domain
