#pragma once

#include "../IClock.hpp"
#include "../OracleConfig.hpp"
#include "../ports/IChainClient.hpp"
#include "../ports/IEventBus.hpp"
#include "../ports/ISubmissionStore.hpp"
#include "../ports/IWeatherProvider.hpp"
#include "KeyedMutex.hpp"
#include "LocationResolver.hpp"
#include "PolicyRegistry.hpp"
#include "RainfallAggregator.hpp"
#include "ReportSubmitter.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <unordered_map>

namespace rainoracle::domain {

struct PassSummary {
    uint64_t cycle = 0;
    bool chainVerified = false;
    std::size_t activePolicies = 0;
    std::size_t fetched = 0;
    std::size_t readingsAccepted = 0;
    std::size_t decisions = 0;
    std::size_t confirmed = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;          ///< Retryable or DataUnavailable this pass
    std::size_t fatal = 0;
    std::size_t resumed = 0;
};

/**
 * @brief Fixed-cadence monitoring pass over every active policy
 *
 * Each pass: apply queued chain events, reconcile the registry, then process
 * every active policy on a bounded worker pool. Work on one policy runs under
 * that policy's lock; failures are isolated per policy. Outstanding
 * submissions of untouched policies are resumed afterwards.
 */
class OracleScheduler {
public:
    struct Dependencies {
        std::shared_ptr<IClock> clock;
        std::shared_ptr<PolicyRegistry> registry;
        std::shared_ptr<LocationResolver> resolver;
        std::shared_ptr<ports::IWeatherProvider> weather;
        std::shared_ptr<RainfallAggregator> aggregator;
        std::shared_ptr<ReportSubmitter> submitter;
        std::shared_ptr<ports::ISubmissionStore> store;
        std::shared_ptr<ports::IChainClient> chain;
        std::shared_ptr<ports::IEventBus> eventBus;
        /// Optional: drains inbound chain events at the start of each pass
        std::function<std::size_t()> applyChainEvents;
        /// Optional: flushes the operator feed after each pass
        std::function<void()> afterPass;
    };
    
    OracleScheduler(const OracleConfig& config, Dependencies deps);
    
    PassSummary runPass();
    
    /// Runs passes every pollInterval until stop().
    void run();
    
    /// Stops new fetches; in-flight policy work finishes before run() returns.
    void stop();
    bool stopping() const { return stopping_; }
    
    /// Compares the chain genesis hash with the stored one; clears the store on change.
    bool verifyChainIdentity();
    
    uint64_t currentCycle() const { return cycle_; }

private:
    struct PolicyProgress {
        int64_t lastFetchEnd = 0;
        bool fetchedOnce = false;
        bool evaluatedOnce = false;
    };
    
    struct FetchedWindow {
        std::vector<Reading> readings;
        int64_t servedFrom = 0;   ///< later than the requested start when history was cut short
    };
    
    struct PassCounters {
        std::atomic<std::size_t> fetched{0};
        std::atomic<std::size_t> readingsAccepted{0};
        std::atomic<std::size_t> decisions{0};
        std::atomic<std::size_t> confirmed{0};
        std::atomic<std::size_t> failed{0};
        std::atomic<std::size_t> skipped{0};
        std::atomic<std::size_t> fatal{0};
    };
    
    void applyReconcileReport(const ReconcileReport& report);
    void processPolicy(const Policy& policy, uint64_t cycle, int64_t now, PassCounters& counters);
    void monitorPolicy(const Policy& policy, uint64_t cycle, int64_t now, PassCounters& counters);
    FetchedWindow fetchWindow(const Policy& policy, const std::string& locationKey, int64_t start, int64_t end);
    void resumeFromCheckpoint(const Policy& policy, const WindowSpec& window);
    void saveCheckpoint(const PolicyId& policyId, int64_t fetchedThrough);
    void countResult(const SubmitResult& result, PassCounters& counters);
    void publishPassSummary(const PassSummary& summary, int64_t now);
    
    PolicyProgress progressFor(const PolicyId& policyId);
    void updateProgress(const PolicyId& policyId, const PolicyProgress& progress);
    
    OracleConfig config_;
    Dependencies deps_;
    
    std::atomic<bool> stopping_{false};
    std::atomic<uint64_t> cycle_{0};
    bool chainVerified_ = false;
    
    KeyedMutex policyLocks_;
    std::mutex progressMutex_;
    std::unordered_map<PolicyId, PolicyProgress> progress_;
    
    std::mutex sleepMutex_;
    std::condition_variable sleepCv_;
};

} // namespace rainoracle::domain
