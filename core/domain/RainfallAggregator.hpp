#pragma once

#include "../OracleConfig.hpp"
#include "../Policy.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <unordered_map>
#include <vector>

namespace rainoracle::domain {

/**
 * @brief Read-only view of one policy's bucketed rainfall
 *
 * buckets holds every bucket still retained for the policy; only those with
 * index >= windowStartIndex are counted in cumulativeSum.
 *
 * For a rolling window, peakSum is the highest windowed sum observed over the
 * coverage so far, even after the window has slid past it.
 */
struct RollingState {
    PolicyId policyId;
    WindowSpec window;
    int64_t bucketDurationSeconds = 3600;
    std::map<int64_t, Tenths> buckets;
    Tenths cumulativeSum = 0;
    std::optional<int64_t> lastBucketIndex;
    int64_t windowStartIndex = 0;
    uint64_t lastChangeCycle = 0;
    
    Tenths peakSum = 0;
    int64_t peakFirstIndex = 0;
    int64_t peakLastIndex = 0;
    std::vector<BucketValue> peakBuckets;
    
    /// Set when readings before this timestamp could not be fetched
    std::optional<int64_t> historyGapEnd;
    
    bool counts(int64_t bucketIndex) const { return bucketIndex >= windowStartIndex; }
};

struct IngestResult {
    std::size_t accepted = 0;
    std::size_t duplicates = 0;
    std::size_t outsideCoverage = 0;
    std::size_t invalid = 0;
    std::vector<Reading> stale;
    
    bool changed() const { return accepted > 0; }
};

/**
 * @brief Per-policy time-bucketed rainfall aggregation
 *
 * Readings land in bucket floor(timestamp / bucketDuration). Late readings are
 * accepted up to lookbackBuckets behind the newest bucket; older ones are
 * rejected as stale because revising them could contradict a decision that has
 * already been reported. A reading timestamp is merged at most once, so
 * overlapping fetch windows do not double count.
 *
 * cumulativeSum is maintained incrementally: ingest adds accepted values and a
 * rolling window subtracts only the buckets it evicts.
 */
class RainfallAggregator {
public:
    RainfallAggregator(int64_t bucketDurationSeconds, int64_t lookbackBuckets, Tenths maxReadingTenths);
    
    /// Creates the policy's state on first observation; later calls are no-ops.
    void track(const Policy& policy, const WindowSpec& window);
    bool isTracked(const PolicyId& policyId) const;
    
    /// Throws std::out_of_range for an untracked policy.
    IngestResult ingest(const PolicyId& policyId, const std::vector<Reading>& readings, uint64_t cycleId);
    
    /// Slides a rolling window so it ends at `now` (clamped to the coverage window).
    void advanceWindow(const PolicyId& policyId, int64_t now);
    
    /// Records that history before `servedFrom` is missing for the policy.
    void markHistoryGap(const PolicyId& policyId, int64_t servedFrom);
    
    RainfallCheckpoint checkpoint(const PolicyId& policyId) const;
    
    /// Replaces the policy's state with a checkpoint. Returns false, leaving the
    /// policy untracked, when the checkpoint was taken with another bucket size.
    bool restore(const Policy& policy, const WindowSpec& window, const RainfallCheckpoint& checkpoint);
    
    Tenths currentCumulative(const PolicyId& policyId) const;
    bool hasNewDataSince(const PolicyId& policyId, uint64_t cycleId) const;
    RollingState snapshot(const PolicyId& policyId) const;
    
    void discard(const PolicyId& policyId);
    std::size_t trackedCount() const;
    
    int64_t bucketIndexFor(int64_t timestamp) const;
    int64_t bucketDurationSeconds() const { return bucketDuration_; }

private:
    struct Tracked {
        RollingState state;
        int64_t coverageStart = 0;
        int64_t coverageEnd = 0;
        std::map<int64_t, std::set<int64_t>> readingTimes;   // bucket index -> merged timestamps
        int64_t prunedBelow = 0;                              // buckets below this are closed
    };
    
    Tracked makeTracked(const Policy& policy, const WindowSpec& window) const;
    Tracked& trackedFor(const PolicyId& policyId);
    const Tracked& trackedFor(const PolicyId& policyId) const;
    
    int64_t rollingWidthBuckets(const WindowSpec& window) const;
    void slideWindowTo(Tracked& tracked, int64_t endIndex);
    void closeOldBuckets(Tracked& tracked);
    void updatePeak(Tracked& tracked);
    
    int64_t bucketDuration_;
    int64_t lookbackBuckets_;
    Tenths maxReadingTenths_;
    
    mutable std::mutex mutex_;
    std::unordered_map<PolicyId, Tracked> policies_;
};

} // namespace rainoracle::domain
