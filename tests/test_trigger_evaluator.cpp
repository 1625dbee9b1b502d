#include <gtest/gtest.h>
#include "../core/domain/TriggerEvaluator.hpp"

using namespace rainoracle;

namespace {

constexpr int64_t kHour = 3600;
constexpr int64_t kStart = 472222 * kHour;
constexpr int64_t kEnd = kStart + 48 * kHour;

Policy makePolicy(TriggerMode mode, Tenths threshold = 100) {
    Policy policy;
    policy.policyId = "42";
    policy.coverageStart = kStart;
    policy.coverageEnd = kEnd;
    policy.threshold = threshold;
    policy.triggerMode = mode;
    return policy;
}

domain::RollingState makeState(Tenths cumulative) {
    domain::RollingState state;
    state.policyId = "42";
    state.bucketDurationSeconds = kHour;
    state.windowStartIndex = kStart / kHour;
    if (cumulative > 0) {
        state.buckets[kStart / kHour + 3] = cumulative;
        state.lastBucketIndex = kStart / kHour + 3;
    }
    state.cumulativeSum = cumulative;
    return state;
}

} // namespace

TEST(TriggerEvaluatorTest, ThresholdReachedExactlyTriggersEarly) {
    auto decision = domain::TriggerEvaluator::evaluate(makePolicy(TriggerMode::EarlyTrigger), makeState(100),
                                                       kStart + 5 * kHour);

    EXPECT_EQ(decision.kind, DecisionKind::EarlyTrigger);
    EXPECT_TRUE(decision.eventOccurred);
    EXPECT_EQ(reportOutcome(decision), "Triggered");
    EXPECT_EQ(decision.evidence.cumulative, 100);
    EXPECT_EQ(decision.evidence.threshold, 100);
}

TEST(TriggerEvaluatorTest, BelowThresholdBeforeEndIsNone) {
    auto decision = domain::TriggerEvaluator::evaluate(makePolicy(TriggerMode::EarlyTrigger), makeState(99),
                                                       kStart + 5 * kHour);
    EXPECT_TRUE(decision.isNone());
}

TEST(TriggerEvaluatorTest, MaturityOnlyWaitsForCoverageEnd) {
    const auto policy = makePolicy(TriggerMode::MaturityOnly);

    EXPECT_TRUE(domain::TriggerEvaluator::evaluate(policy, makeState(150), kEnd - 1).isNone());

    auto decision = domain::TriggerEvaluator::evaluate(policy, makeState(150), kEnd);
    EXPECT_EQ(decision.kind, DecisionKind::Matured);
    EXPECT_TRUE(decision.eventOccurred);
    EXPECT_EQ(reportOutcome(decision), "MaturedEvent");
}

TEST(TriggerEvaluatorTest, MaturesWithoutEvent) {
    auto decision = domain::TriggerEvaluator::evaluate(makePolicy(TriggerMode::EarlyTrigger), makeState(10),
                                                       kEnd + kHour);

    EXPECT_EQ(decision.kind, DecisionKind::Matured);
    EXPECT_FALSE(decision.eventOccurred);
    EXPECT_EQ(reportOutcome(decision), "MaturedNoEvent");
    EXPECT_EQ(decision.evidence.observedAt, kEnd);
}

TEST(TriggerEvaluatorTest, EarlyModeAtCoverageEndReportsMaturity) {
    auto decision = domain::TriggerEvaluator::evaluate(makePolicy(TriggerMode::EarlyTrigger), makeState(200), kEnd);
    EXPECT_EQ(decision.kind, DecisionKind::Matured);
    EXPECT_TRUE(decision.eventOccurred);
}

TEST(TriggerEvaluatorTest, InactiveOrNotStartedIsNone) {
    auto policy = makePolicy(TriggerMode::EarlyTrigger);
    EXPECT_TRUE(domain::TriggerEvaluator::evaluate(policy, makeState(500), kStart - 1).isNone());

    policy.status = PolicyStatus::Triggered;
    EXPECT_TRUE(domain::TriggerEvaluator::evaluate(policy, makeState(500), kStart + kHour).isNone());
    EXPECT_TRUE(domain::TriggerEvaluator::evaluate(policy, makeState(500), kEnd + kHour).isNone());
}

TEST(TriggerEvaluatorTest, EvidenceListsCountedBucketsOnly) {
    auto state = makeState(0);
    state.windowStartIndex = kStart / kHour + 2;
    state.buckets[kStart / kHour] = 70;        // evicted by a rolling window
    state.buckets[kStart / kHour + 2] = 40;
    state.buckets[kStart / kHour + 4] = 60;
    state.lastBucketIndex = kStart / kHour + 4;
    state.cumulativeSum = 100;

    auto evidence = domain::TriggerEvaluator::buildEvidence(makePolicy(TriggerMode::EarlyTrigger), state,
                                                            kStart + 5 * kHour);

    ASSERT_EQ(evidence.buckets.size(), 2u);
    EXPECT_EQ(evidence.buckets[0].index, kStart / kHour + 2);
    EXPECT_EQ(evidence.buckets[1].value, 60);
    EXPECT_EQ(evidence.firstBucketIndex, kStart / kHour + 2);
    EXPECT_EQ(evidence.lastBucketIndex, kStart / kHour + 4);
    EXPECT_EQ(evidence.bucketDurationSeconds, kHour);
    EXPECT_EQ(evidence.observedAt, kStart + 5 * kHour);
}

TEST(TriggerEvaluatorTest, EvidenceForEmptyStateHasCollapsedRange) {
    auto evidence = domain::TriggerEvaluator::buildEvidence(makePolicy(TriggerMode::EarlyTrigger), makeState(0), kEnd);

    EXPECT_TRUE(evidence.buckets.empty());
    EXPECT_EQ(evidence.firstBucketIndex, evidence.lastBucketIndex);
    EXPECT_EQ(evidence.cumulative, 0);
}

TEST(TriggerEvaluatorTest, PeakBeforeCoverageEndMaturesWithEvent) {
    auto state = makeState(0);
    state.buckets[kStart / kHour + 2] = 150;
    state.buckets[kStart / kHour + 3] = 90;
    state.windowStartIndex = kStart / kHour + 24;
    state.lastBucketIndex = kStart / kHour + 3;
    state.peakSum = 240;
    state.peakFirstIndex = kStart / kHour + 1;
    state.peakLastIndex = kStart / kHour + 3;
    state.peakBuckets = {{kStart / kHour + 2, 150}, {kStart / kHour + 3, 90}};

    auto decision = domain::TriggerEvaluator::evaluate(makePolicy(TriggerMode::MaturityOnly, 200), state, kEnd);

    EXPECT_EQ(decision.kind, DecisionKind::Matured);
    EXPECT_TRUE(decision.eventOccurred);
    EXPECT_EQ(reportOutcome(decision), "MaturedEvent");
    EXPECT_EQ(decision.evidence.cumulative, 240);
    EXPECT_EQ(decision.evidence.firstBucketIndex, kStart / kHour + 1);
    EXPECT_EQ(decision.evidence.lastBucketIndex, kStart / kHour + 3);
    ASSERT_EQ(decision.evidence.buckets.size(), 2u);
    EXPECT_EQ(decision.evidence.buckets[0].value, 150);
}

TEST(TriggerEvaluatorTest, PeakAlsoDrivesEarlyTrigger) {
    auto state = makeState(20);
    state.peakSum = 130;

    auto decision = domain::TriggerEvaluator::evaluate(makePolicy(TriggerMode::EarlyTrigger), state,
                                                       kStart + 30 * kHour);

    EXPECT_EQ(decision.kind, DecisionKind::EarlyTrigger);
    EXPECT_EQ(decision.evidence.cumulative, 130);
}

TEST(TriggerEvaluatorTest, EvidenceCarriesHistoryGap) {
    auto state = makeState(40);
    EXPECT_TRUE(domain::TriggerEvaluator::buildEvidence(makePolicy(TriggerMode::EarlyTrigger), state, kEnd)
                    .historyComplete);

    state.historyGapEnd = kStart + 6 * kHour;
    auto evidence = domain::TriggerEvaluator::buildEvidence(makePolicy(TriggerMode::EarlyTrigger), state, kEnd);

    EXPECT_FALSE(evidence.historyComplete);
    EXPECT_EQ(evidence.historyGapEnd, kStart + 6 * kHour);
}
