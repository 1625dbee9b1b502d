#include "RainfallAggregator.hpp"
#include "../Log.hpp"
#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace rainoracle::domain {

namespace {

int64_t floorDiv(int64_t value, int64_t divisor) {
    int64_t quotient = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
        --quotient;
    }
    return quotient;
}

} // namespace

RainfallAggregator::RainfallAggregator(int64_t bucketDurationSeconds, int64_t lookbackBuckets,
                                       Tenths maxReadingTenths)
    : bucketDuration_(bucketDurationSeconds),
      lookbackBuckets_(lookbackBuckets),
      maxReadingTenths_(maxReadingTenths) {
    if (bucketDuration_ <= 0) {
        throw std::invalid_argument("RainfallAggregator: bucket duration must be positive");
    }
    if (lookbackBuckets_ < 0) {
        throw std::invalid_argument("RainfallAggregator: look-back must not be negative");
    }
}

int64_t RainfallAggregator::bucketIndexFor(int64_t timestamp) const {
    return floorDiv(timestamp, bucketDuration_);
}

void RainfallAggregator::track(const Policy& policy, const WindowSpec& window) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (policies_.count(policy.policyId) != 0) {
        return;
    }
    policies_.emplace(policy.policyId, makeTracked(policy, window));
}

RainfallAggregator::Tracked RainfallAggregator::makeTracked(const Policy& policy, const WindowSpec& window) const {
    Tracked tracked;
    tracked.coverageStart = policy.coverageStart;
    tracked.coverageEnd = policy.coverageEnd;
    tracked.state.policyId = policy.policyId;
    tracked.state.window = window;
    tracked.state.bucketDurationSeconds = bucketDuration_;
    tracked.state.windowStartIndex = bucketIndexFor(policy.coverageStart);
    tracked.prunedBelow = tracked.state.windowStartIndex;
    return tracked;
}

bool RainfallAggregator::isTracked(const PolicyId& policyId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return policies_.count(policyId) != 0;
}

IngestResult RainfallAggregator::ingest(const PolicyId& policyId, const std::vector<Reading>& readings,
                                        uint64_t cycleId) {
    std::lock_guard<std::mutex> lock(mutex_);
    Tracked& tracked = trackedFor(policyId);
    RollingState& state = tracked.state;
    IngestResult result;
    
    for (const auto& reading : readings) {
        if (reading.timestamp < tracked.coverageStart || reading.timestamp >= tracked.coverageEnd) {
            result.outsideCoverage++;
            continue;
        }
        if (reading.precipitation < 0 || reading.precipitation > maxReadingTenths_) {
            result.invalid++;
            continue;
        }
        
        const int64_t index = bucketIndexFor(reading.timestamp);
        if (state.lastBucketIndex && index < *state.lastBucketIndex - lookbackBuckets_) {
            result.stale.push_back(reading);
            continue;
        }
        
        auto& seen = tracked.readingTimes[index];
        if (!seen.insert(reading.timestamp).second) {
            result.duplicates++;
            continue;
        }
        
        if (!state.lastBucketIndex || index > *state.lastBucketIndex) {
            state.lastBucketIndex = index;
            if (state.window.mode == WindowSpec::Mode::Rolling) {
                slideWindowTo(tracked, index);
            }
        }
        
        state.buckets[index] += reading.precipitation;
        if (state.counts(index)) {
            state.cumulativeSum += reading.precipitation;
        }
        result.accepted++;
    }
    
    if (result.changed()) {
        state.lastChangeCycle = cycleId;
        if (state.window.mode == WindowSpec::Mode::Rolling) {
            updatePeak(tracked);
        }
        closeOldBuckets(tracked);
    }
    
    if (!result.stale.empty()) {
        LogLine("Aggregator", LogLine::Warn) << "Policy " << policyId << ": rejected "
                                             << result.stale.size() << " stale reading(s) older than "
                                             << lookbackBuckets_ << " buckets";
    }
    
    return result;
}

void RainfallAggregator::advanceWindow(const PolicyId& policyId, int64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);
    Tracked& tracked = trackedFor(policyId);
    if (tracked.state.window.mode != WindowSpec::Mode::Rolling) {
        return;
    }
    
    const int64_t clamped = std::min(now, tracked.coverageEnd - 1);
    int64_t endIndex = bucketIndexFor(clamped);
    if (tracked.state.lastBucketIndex) {
        endIndex = std::max(endIndex, *tracked.state.lastBucketIndex);
    }
    slideWindowTo(tracked, endIndex);
    closeOldBuckets(tracked);
}

void RainfallAggregator::markHistoryGap(const PolicyId& policyId, int64_t servedFrom) {
    std::lock_guard<std::mutex> lock(mutex_);
    Tracked& tracked = trackedFor(policyId);
    if (servedFrom <= tracked.coverageStart) {
        return;
    }
    auto& gapEnd = tracked.state.historyGapEnd;
    gapEnd = std::max(gapEnd.value_or(servedFrom), servedFrom);
}

RainfallCheckpoint RainfallAggregator::checkpoint(const PolicyId& policyId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Tracked& tracked = trackedFor(policyId);
    const RollingState& state = tracked.state;
    
    RainfallCheckpoint checkpoint;
    checkpoint.policyId = policyId;
    checkpoint.bucketDurationSeconds = bucketDuration_;
    checkpoint.windowStartIndex = state.windowStartIndex;
    checkpoint.lastBucketIndex = state.lastBucketIndex;
    checkpoint.prunedBelow = tracked.prunedBelow;
    for (const auto& [index, value] : state.buckets) {
        checkpoint.buckets.push_back(BucketValue{index, value});
    }
    for (const auto& [index, times] : tracked.readingTimes) {
        checkpoint.mergedTimestamps.insert(checkpoint.mergedTimestamps.end(), times.begin(), times.end());
    }
    checkpoint.peakSum = state.peakSum;
    checkpoint.peakFirstIndex = state.peakFirstIndex;
    checkpoint.peakLastIndex = state.peakLastIndex;
    checkpoint.peakBuckets = state.peakBuckets;
    checkpoint.historyGapEnd = state.historyGapEnd;
    return checkpoint;
}

bool RainfallAggregator::restore(const Policy& policy, const WindowSpec& window,
                                 const RainfallCheckpoint& checkpoint) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (checkpoint.bucketDurationSeconds != bucketDuration_) {
        policies_.erase(policy.policyId);
        return false;
    }
    
    Tracked tracked = makeTracked(policy, window);
    RollingState& state = tracked.state;
    state.windowStartIndex = std::max(state.windowStartIndex, checkpoint.windowStartIndex);
    state.lastBucketIndex = checkpoint.lastBucketIndex;
    tracked.prunedBelow = std::max(tracked.prunedBelow, checkpoint.prunedBelow);
    
    for (const auto& bucket : checkpoint.buckets) {
        state.buckets[bucket.index] = bucket.value;
        if (state.counts(bucket.index)) {
            state.cumulativeSum += bucket.value;
        }
    }
    for (int64_t timestamp : checkpoint.mergedTimestamps) {
        tracked.readingTimes[bucketIndexFor(timestamp)].insert(timestamp);
    }
    
    state.peakSum = checkpoint.peakSum;
    state.peakFirstIndex = checkpoint.peakFirstIndex;
    state.peakLastIndex = checkpoint.peakLastIndex;
    state.peakBuckets = checkpoint.peakBuckets;
    state.historyGapEnd = checkpoint.historyGapEnd;
    
    policies_[policy.policyId] = std::move(tracked);
    return true;
}

Tenths RainfallAggregator::currentCumulative(const PolicyId& policyId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trackedFor(policyId).state.cumulativeSum;
}

bool RainfallAggregator::hasNewDataSince(const PolicyId& policyId, uint64_t cycleId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trackedFor(policyId).state.lastChangeCycle > cycleId;
}

RollingState RainfallAggregator::snapshot(const PolicyId& policyId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trackedFor(policyId).state;
}

void RainfallAggregator::discard(const PolicyId& policyId) {
    std::lock_guard<std::mutex> lock(mutex_);
    policies_.erase(policyId);
}

std::size_t RainfallAggregator::trackedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return policies_.size();
}

RainfallAggregator::Tracked& RainfallAggregator::trackedFor(const PolicyId& policyId) {
    auto it = policies_.find(policyId);
    if (it == policies_.end()) {
        throw std::out_of_range("RainfallAggregator: policy " + policyId + " is not tracked");
    }
    return it->second;
}

const RainfallAggregator::Tracked& RainfallAggregator::trackedFor(const PolicyId& policyId) const {
    auto it = policies_.find(policyId);
    if (it == policies_.end()) {
        throw std::out_of_range("RainfallAggregator: policy " + policyId + " is not tracked");
    }
    return it->second;
}

int64_t RainfallAggregator::rollingWidthBuckets(const WindowSpec& window) const {
    return std::max<int64_t>(1, window.rollingWindowSeconds / bucketDuration_);
}

void RainfallAggregator::slideWindowTo(Tracked& tracked, int64_t endIndex) {
    RollingState& state = tracked.state;
    const int64_t newStart = std::max(bucketIndexFor(tracked.coverageStart),
                                      endIndex - rollingWidthBuckets(state.window) + 1);
    if (newStart <= state.windowStartIndex) {
        return;
    }
    
    // Only buckets crossing out of the window are visited.
    auto first = state.buckets.lower_bound(state.windowStartIndex);
    auto last = state.buckets.lower_bound(newStart);
    for (auto it = first; it != last; ++it) {
        state.cumulativeSum -= it->second;
    }
    state.windowStartIndex = newStart;
}

void RainfallAggregator::closeOldBuckets(Tracked& tracked) {
    RollingState& state = tracked.state;
    if (!state.lastBucketIndex) {
        return;
    }
    
    const int64_t openFrom = *state.lastBucketIndex - lookbackBuckets_;
    if (openFrom <= tracked.prunedBelow) {
        return;
    }
    
    // Closed buckets can no longer receive readings: drop their timestamp sets,
    // and drop the bucket itself once it no longer counts toward the window.
    auto timesEnd = tracked.readingTimes.lower_bound(openFrom);
    tracked.readingTimes.erase(tracked.readingTimes.begin(), timesEnd);
    
    // Windows reaching an open bucket stay computable for the peak.
    const int64_t dropBelow = std::min(openFrom - rollingWidthBuckets(state.window) + 1, state.windowStartIndex);
    state.buckets.erase(state.buckets.begin(), state.buckets.lower_bound(dropBelow));
    
    tracked.prunedBelow = openFrom;
}

void RainfallAggregator::updatePeak(Tracked& tracked) {
    RollingState& state = tracked.state;
    const int64_t width = rollingWidthBuckets(state.window);
    const int64_t coverageStartIndex = bucketIndexFor(tracked.coverageStart);
    
    // The best window always ends on a non-empty bucket, so only those ends are tried.
    Tenths windowSum = 0;
    auto first = state.buckets.begin();
    for (auto last = state.buckets.begin(); last != state.buckets.end(); ++last) {
        windowSum += last->second;
        const int64_t start = std::max(coverageStartIndex, last->first - width + 1);
        while (first->first < start) {
            windowSum -= first->second;
            ++first;
        }
        if (windowSum > state.peakSum) {
            state.peakSum = windowSum;
            state.peakFirstIndex = start;
            state.peakLastIndex = last->first;
            state.peakBuckets.clear();
            for (auto it = first; it != std::next(last); ++it) {
                state.peakBuckets.push_back(BucketValue{it->first, it->second});
            }
        }
    }
}

} // namespace rainoracle::domain
