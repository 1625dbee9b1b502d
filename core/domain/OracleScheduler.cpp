#include "OracleScheduler.hpp"
#include "../Log.hpp"
#include "../OracleError.hpp"
#include "TriggerEvaluator.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <algorithm>

namespace rainoracle::domain {

OracleScheduler::OracleScheduler(const OracleConfig& config, Dependencies deps)
    : config_(config), deps_(std::move(deps)) {
}

bool OracleScheduler::verifyChainIdentity() {
    std::string genesis;
    try {
        genesis = deps_.chain->genesisHash();
    } catch (const OracleError& e) {
        LogLine("Scheduler", LogLine::Warn) << "Cannot read chain genesis hash: " << e.what();
        return false;
    }
    
    const std::string stored = deps_.store->chainGenesis();
    if (stored.empty()) {
        LogLine("Scheduler") << "Chain genesis " << genesis << " recorded";
    } else if (stored != genesis) {
        LogLine("Scheduler", LogLine::Warn) << "Chain restarted (genesis " << stored << " -> " << genesis
                                            << "); discarding submission records of the old chain";
        deps_.store->clear();
        std::lock_guard<std::mutex> lock(progressMutex_);
        progress_.clear();
    }
    if (stored != genesis) {
        deps_.store->setChainGenesis(genesis);
    }
    chainVerified_ = true;
    return true;
}

PassSummary OracleScheduler::runPass() {
    PassSummary summary;
    summary.cycle = ++cycle_;
    const int64_t now = deps_.clock->epochSeconds();
    
    if (!chainVerified_ && !verifyChainIdentity()) {
        // Records may belong to another chain; nothing is submitted until verified.
        LogLine("Scheduler", LogLine::Warn) << "Pass " << summary.cycle << " skipped: chain identity unknown";
        publishPassSummary(summary, now);
        return summary;
    }
    summary.chainVerified = true;
    
    if (deps_.applyChainEvents) {
        deps_.applyChainEvents();
    }
    
    try {
        applyReconcileReport(deps_.registry->reconcile());
    } catch (const OracleError& e) {
        LogLine("Scheduler", LogLine::Warn) << "Reconciliation failed, using cached policies: " << e.what();
    }
    
    const auto released = deps_.registry->releaseFatalDue(now, config_.fatalRecheckInterval.count());
    for (const auto& policyId : released) {
        LogLine("Scheduler") << "Re-checking excluded policy " << policyId;
    }
    
    const auto policies = deps_.registry->activePolicies();
    summary.activePolicies = policies.size();
    
    PassCounters counters;
    std::set<PolicyId> touched;
    {
        boost::asio::thread_pool pool(std::max<std::size_t>(1, config_.workerThreads));
        for (const auto& policy : policies) {
            touched.insert(policy.policyId);
            boost::asio::post(pool, [this, policy, cycle = summary.cycle, now, &counters]() {
                processPolicy(policy, cycle, now, counters);
            });
        }
        pool.join();
    }
    
    if (!stopping_) {
        try {
            for (const auto& result : deps_.submitter->resumeOutstanding(touched)) {
                summary.resumed++;
                countResult(result, counters);
            }
        } catch (const OracleError& e) {
            LogLine("Scheduler", LogLine::Warn) << "Resuming outstanding submissions failed: " << e.what();
        }
    }
    
    for (const auto& policyId : released) {
        if (!deps_.registry->isFatal(policyId) && deps_.eventBus) {
            Event event;
            event.eventType = EventType::PolicyRecovered;
            event.policyId = policyId;
            event.message = "policy back under monitoring";
            event.timestamp = now;
            event.cycle = summary.cycle;
            deps_.eventBus->publish(event);
        }
    }
    
    summary.fetched = counters.fetched;
    summary.readingsAccepted = counters.readingsAccepted;
    summary.decisions = counters.decisions;
    summary.confirmed = counters.confirmed;
    summary.failed = counters.failed;
    summary.skipped = counters.skipped;
    summary.fatal = counters.fatal;
    
    LogLine("Scheduler") << "Pass " << summary.cycle << ": " << summary.activePolicies << " active, "
                         << summary.fetched << " fetched, " << summary.decisions << " decisions, "
                         << summary.confirmed << " confirmed, " << summary.failed << " failed, "
                         << summary.skipped << " skipped, " << summary.fatal << " fatal";
    
    publishPassSummary(summary, now);
    return summary;
}

void OracleScheduler::applyReconcileReport(const ReconcileReport& report) {
    for (const auto& policyId : report.settled) {
        std::lock_guard<std::mutex> lock(policyLocks_.mutexFor(policyId));
        deps_.aggregator->discard(policyId);
        try {
            deps_.store->eraseCheckpoint(policyId);
        } catch (const OracleError& e) {
            LogLine("Scheduler", LogLine::Warn) << "Policy " << policyId << ": checkpoint not removed: " << e.what();
        }
        const auto pruned = deps_.submitter->prune(policyId);
        {
            std::lock_guard<std::mutex> progressLock(progressMutex_);
            progress_.erase(policyId);
        }
        if (pruned > 0) {
            LogLine("Scheduler") << "Policy " << policyId << " settled; pruned " << pruned << " record(s)";
        }
    }
    
    for (const auto& policyId : report.drifted) {
        std::lock_guard<std::mutex> lock(policyLocks_.mutexFor(policyId));
        deps_.submitter->confirmFromChain(policyId);
    }
}

void OracleScheduler::processPolicy(const Policy& policy, uint64_t cycle, int64_t now, PassCounters& counters) {
    std::lock_guard<std::mutex> lock(policyLocks_.mutexFor(policy.policyId));
    
    try {
        monitorPolicy(policy, cycle, now, counters);
    } catch (const DataUnavailableError& e) {
        counters.skipped++;
        LogLine("Scheduler", LogLine::Warn) << "Policy " << policy.policyId << ": data unavailable: " << e.what();
    } catch (const OracleError& e) {
        if (e.isFatal()) {
            counters.fatal++;
            deps_.registry->markFatal(policy.policyId, e.what(), now);
            LogLine("Scheduler", LogLine::Error) << "Policy " << policy.policyId << " excluded: " << e.what();
            if (deps_.eventBus) {
                Event event;
                event.eventType = EventType::PolicyFatal;
                event.policyId = policy.policyId;
                event.message = e.what();
                event.timestamp = now;
                event.cycle = cycle;
                deps_.eventBus->publish(event);
            }
        } else {
            counters.skipped++;
            LogLine("Scheduler", LogLine::Warn) << "Policy " << policy.policyId << " skipped this pass ("
                                                << errorKindToString(e.kind()) << "): " << e.what();
        }
    } catch (const std::exception& e) {
        // Unexpected failure stays confined to this policy; retried next pass.
        counters.skipped++;
        LogLine("Scheduler", LogLine::Error) << "Policy " << policy.policyId << ": " << e.what();
    }
}

void OracleScheduler::monitorPolicy(const Policy& policy, uint64_t cycle, int64_t now, PassCounters& counters) {
    // An existing record is the decision; never re-derive it.
    if (deps_.submitter->hasRecord(policy.policyId)) {
        for (const auto& result : deps_.submitter->driveFor(policy.policyId)) {
            countResult(result, counters);
        }
        return;
    }
    
    if (stopping_ || now < policy.coverageStart) {
        return;
    }
    
    const std::string locationKey = deps_.resolver->resolveFor(policy);
    if (policy.location.providerKey.empty()) {
        deps_.registry->setProviderKey(policy.policyId, locationKey);
    }
    
    const WindowSpec window = config_.windowFor(policy.version);
    if (!deps_.aggregator->isTracked(policy.policyId)) {
        resumeFromCheckpoint(policy, window);
    }
    deps_.aggregator->track(policy, window);
    
    PolicyProgress progress = progressFor(policy.policyId);
    const int64_t resumeFrom = progress.fetchedOnce ? progress.lastFetchEnd - config_.fetchOverlapSeconds
                                                    : policy.coverageStart;
    const int64_t fetchStart = std::max(policy.coverageStart, resumeFrom);
    const int64_t fetchEnd = std::min(now, policy.coverageEnd);
    
    if (fetchEnd > fetchStart && !(progress.fetchedOnce && progress.lastFetchEnd >= policy.coverageEnd)) {
        const auto fetched = fetchWindow(policy, locationKey, fetchStart, fetchEnd);
        counters.fetched++;
        
        // Only the part not covered by an earlier fetch counts as missing
        const int64_t neededFrom = progress.fetchedOnce ? std::max(policy.coverageStart, progress.lastFetchEnd)
                                                        : policy.coverageStart;
        if (fetched.servedFrom > neededFrom) {
            deps_.aggregator->markHistoryGap(policy.policyId, fetched.servedFrom);
        }
        
        const auto ingest = deps_.aggregator->ingest(policy.policyId, fetched.readings, cycle);
        counters.readingsAccepted += ingest.accepted;
        
        progress.fetchedOnce = true;
        progress.lastFetchEnd = fetchEnd;
        saveCheckpoint(policy.policyId, fetchEnd);
    }
    
    deps_.aggregator->advanceWindow(policy.policyId, now);
    
    const bool evaluate = !progress.evaluatedOnce ||
                          deps_.aggregator->hasNewDataSince(policy.policyId, cycle - 1) ||
                          now >= policy.coverageEnd;
    if (evaluate) {
        const auto decision = TriggerEvaluator::evaluate(policy, deps_.aggregator->snapshot(policy.policyId), now);
        progress.evaluatedOnce = true;
        updateProgress(policy.policyId, progress);
        
        // A partial total can prove the event but never its absence.
        if (decision.kind == DecisionKind::Matured && !decision.eventOccurred &&
            !decision.evidence.historyComplete) {
            throw OracleError(ErrorKind::Fatal, "rainfall before " + formatIso8601(decision.evidence.historyGapEnd) +
                                                " is unavailable; no-event maturity needs operator review");
        }
        
        if (!decision.isNone()) {
            counters.decisions++;
            countResult(deps_.submitter->submit(policy, decision), counters);
        }
        return;
    }
    
    updateProgress(policy.policyId, progress);
}

OracleScheduler::FetchedWindow OracleScheduler::fetchWindow(const Policy& policy, const std::string& locationKey,
                                                            int64_t start, int64_t end) {
    try {
        return FetchedWindow{deps_.weather->fetchPrecipitation(locationKey, start, end), start};
    } catch (const DataUnavailableError& e) {
        const bool overlaps = e.servedEnd() > start && e.servedStart() < end;
        if (!config_.acceptPartialHistory || !overlaps) {
            throw;
        }
        const int64_t servedStart = std::max(start, e.servedStart());
        LogLine("Scheduler", LogLine::Warn) << "Policy " << policy.policyId << ": history gap of "
                                            << (servedStart - start) << "s before " << formatIso8601(servedStart)
                                            << "; continuing with the served range";
        return FetchedWindow{deps_.weather->fetchPrecipitation(locationKey, servedStart, end), servedStart};
    }
}

void OracleScheduler::resumeFromCheckpoint(const Policy& policy, const WindowSpec& window) {
    const auto checkpoint = deps_.store->loadCheckpoint(policy.policyId);
    if (!checkpoint) {
        return;
    }
    if (!deps_.aggregator->restore(policy, window, *checkpoint)) {
        LogLine("Scheduler", LogLine::Warn) << "Policy " << policy.policyId
                                            << ": checkpoint uses another bucket size; refetching history";
        return;
    }
    
    PolicyProgress progress = progressFor(policy.policyId);
    progress.fetchedOnce = true;
    progress.lastFetchEnd = checkpoint->fetchedThrough;
    updateProgress(policy.policyId, progress);
    LogLine("Scheduler") << "Policy " << policy.policyId << ": resumed rainfall through "
                         << formatIso8601(checkpoint->fetchedThrough);
}

void OracleScheduler::saveCheckpoint(const PolicyId& policyId, int64_t fetchedThrough) {
    auto checkpoint = deps_.aggregator->checkpoint(policyId);
    checkpoint.fetchedThrough = fetchedThrough;
    try {
        deps_.store->saveCheckpoint(checkpoint);
    } catch (const OracleError& e) {
        // In-memory state is intact; only a restart before the next save would refetch.
        LogLine("Scheduler", LogLine::Warn) << "Policy " << policyId << ": checkpoint not saved: " << e.what();
    }
}

void OracleScheduler::countResult(const SubmitResult& result, PassCounters& counters) {
    switch (result.outcome) {
        case SubmitOutcome::Confirmed:
            counters.confirmed++;
            break;
        case SubmitOutcome::Failed:
            counters.failed++;
            break;
        default:
            break;
    }
}

void OracleScheduler::publishPassSummary(const PassSummary& summary, int64_t now) {
    if (deps_.eventBus) {
        Event event;
        event.eventType = EventType::PassCompleted;
        event.timestamp = now;
        event.cycle = summary.cycle;
        event.message = summary.chainVerified ? "pass completed" : "pass skipped: chain identity unknown";
        
        for (const auto& [status, count] : deps_.registry->countByStatus()) {
            event.extras["policies." + policyStatusToString(status)] = std::to_string(count);
        }
        for (const auto& [status, count] : deps_.submitter->countByStatus()) {
            event.extras["submissions." + submissionStatusToString(status)] = std::to_string(count);
        }
        std::string fatalList;
        for (const auto& exclusion : deps_.registry->fatalPolicies()) {
            fatalList += (fatalList.empty() ? "" : ",") + exclusion.policyId;
        }
        event.extras["fatal"] = fatalList;
        event.extras["fetched"] = std::to_string(summary.fetched);
        event.extras["decisions"] = std::to_string(summary.decisions);
        event.extras["skipped"] = std::to_string(summary.skipped);
        
        deps_.eventBus->publish(event);
        deps_.eventBus->processEvents();
    }
    if (deps_.afterPass) {
        deps_.afterPass();
    }
}

void OracleScheduler::run() {
    LogLine("Scheduler") << "Polling every " << config_.pollInterval.count() << "s with "
                         << config_.workerThreads << " worker(s)";
    
    while (!stopping_) {
        const auto started = std::chrono::steady_clock::now();
        try {
            runPass();
        } catch (const OracleError& e) {
            LogLine("Scheduler", LogLine::Error) << "Pass " << cycle_ << " aborted: " << e.what();
        }
        
        std::unique_lock<std::mutex> lock(sleepMutex_);
        sleepCv_.wait_until(lock, started + config_.pollInterval, [this]() { return stopping_.load(); });
    }
    
    LogLine("Scheduler") << "Stopped after " << cycle_ << " pass(es)";
}

void OracleScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(sleepMutex_);
        stopping_ = true;
    }
    sleepCv_.notify_all();
}

OracleScheduler::PolicyProgress OracleScheduler::progressFor(const PolicyId& policyId) {
    std::lock_guard<std::mutex> lock(progressMutex_);
    auto it = progress_.find(policyId);
    return it != progress_.end() ? it->second : PolicyProgress{};
}

void OracleScheduler::updateProgress(const PolicyId& policyId, const PolicyProgress& progress) {
    std::lock_guard<std::mutex> lock(progressMutex_);
    progress_[policyId] = progress;
}

} // namespace rainoracle::domain
