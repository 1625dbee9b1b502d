#include "ReportSubmitter.hpp"
#include "../JsonCodec.hpp"
#include "../Log.hpp"
#include "../OracleError.hpp"
#include <algorithm>

namespace rainoracle::domain {

std::string submitOutcomeToString(SubmitOutcome outcome) {
    switch (outcome) {
        case SubmitOutcome::Confirmed: return "confirmed";
        case SubmitOutcome::AlreadyConfirmed: return "already_confirmed";
        case SubmitOutcome::RetryScheduled: return "retry_scheduled";
        case SubmitOutcome::Failed: return "failed";
        case SubmitOutcome::NotDue: return "not_due";
        case SubmitOutcome::Skipped: return "skipped";
    }
    return "skipped";
}

ReportSubmitter::ReportSubmitter(std::shared_ptr<ports::IChainClient> chain,
                                 std::shared_ptr<ports::ISubmissionStore> store,
                                 std::shared_ptr<ReportSigner> signer,
                                 std::shared_ptr<IClock> clock,
                                 std::shared_ptr<ports::RetryPolicy> retryPolicy,
                                 std::shared_ptr<ports::IEventBus> eventBus,
                                 std::chrono::seconds failedRetryInterval)
    : chain_(std::move(chain)),
      store_(std::move(store)),
      signer_(std::move(signer)),
      clock_(std::move(clock)),
      retryPolicy_(std::move(retryPolicy)),
      eventBus_(std::move(eventBus)),
      failedRetryInterval_(failedRetryInterval) {
}

SubmitResult ReportSubmitter::submit(const Policy& policy, const TriggerDecision& decision) {
    if (decision.isNone() || policy.status != PolicyStatus::Active) {
        return SubmitResult{SubmitOutcome::Skipped, {}};
    }
    
    // A policy gets exactly one decision: an existing record of either kind wins.
    auto existing = recordsFor(policy.policyId);
    if (!existing.empty()) {
        auto results = driveFor(policy.policyId);
        return results.empty() ? SubmitResult{SubmitOutcome::NotDue, existing.front().idempotencyKey}
                               : results.front();
    }
    
    const std::string key = makeIdempotencyKey(policy.policyId, decision.kind);
    std::lock_guard<std::mutex> lock(keyLocks_.mutexFor(key));
    
    const int64_t now = clock_->epochSeconds();
    if (auto stored = store_->load(key)) {
        return driveLocked(std::move(*stored), now);
    }
    
    SubmissionRecord record;
    record.policyId = policy.policyId;
    record.idempotencyKey = key;
    record.decision = decision;
    record.status = SubmissionStatus::Pending;
    record.createdAt = now;
    record.nextAttemptAt = now;
    
    // Persist before the chain call; if this throws nothing was sent.
    store_->save(record);
    LogLine("Submitter") << "Policy " << policy.policyId << ": " << decisionKindToString(decision.kind)
                         << " decision (" << reportOutcome(decision) << ", cumulative "
                         << decision.evidence.cumulative << "/" << decision.evidence.threshold
                         << " tenths mm) recorded";
    
    return attempt(record, now);
}

std::vector<SubmitResult> ReportSubmitter::driveFor(const PolicyId& policyId) {
    std::vector<SubmitResult> results;
    for (const auto& record : recordsFor(policyId)) {
        std::lock_guard<std::mutex> lock(keyLocks_.mutexFor(record.idempotencyKey));
        // Re-read under the key lock; another thread may have advanced it.
        auto current = store_->load(record.idempotencyKey);
        if (!current) {
            continue;
        }
        results.push_back(driveLocked(std::move(*current), clock_->epochSeconds()));
    }
    return results;
}

std::vector<SubmitResult> ReportSubmitter::resumeOutstanding(const std::set<PolicyId>& touched) {
    std::vector<SubmitResult> results;
    std::set<PolicyId> outstanding;
    for (const auto& record : store_->loadAll()) {
        if (record.status != SubmissionStatus::Confirmed && touched.count(record.policyId) == 0) {
            outstanding.insert(record.policyId);
        }
    }
    
    for (const auto& policyId : outstanding) {
        for (auto& result : driveFor(policyId)) {
            if (result.outcome != SubmitOutcome::NotDue && result.outcome != SubmitOutcome::AlreadyConfirmed) {
                results.push_back(std::move(result));
            }
        }
    }
    return results;
}

SubmitResult ReportSubmitter::driveLocked(SubmissionRecord record, int64_t now) {
    if (record.status == SubmissionStatus::Confirmed) {
        return SubmitResult{SubmitOutcome::AlreadyConfirmed, record.idempotencyKey};
    }
    if (record.nextAttemptAt > now) {
        return SubmitResult{SubmitOutcome::NotDue, record.idempotencyKey};
    }
    return attempt(record, now);
}

SubmitResult ReportSubmitter::attempt(SubmissionRecord& record, int64_t now) {
    record.lastAttemptAt = now;
    
    ports::SignedReport report;
    report.policyId = record.policyId;
    report.kind = record.decision.kind;
    report.outcome = reportOutcome(record.decision);
    report.eventOccurred = record.decision.eventOccurred;
    report.observedAt = record.decision.evidence.observedAt;
    report.cumulative = record.decision.evidence.cumulative;
    
    const std::string evidenceJson = JsonCodec::evidenceDocument(record.policyId, record.decision).dump();
    report = signer_->sign(std::move(report), evidenceJson);
    record.evidenceHash = report.evidenceHash;
    
    ports::ChainSubmitResult chainResult;
    try {
        chainResult = chain_->submitReport(report);
    } catch (const OracleError& e) {
        if (e.isFatal()) {
            record.retryCount++;
            markFailed(record, e.what(), now);
            return SubmitResult{SubmitOutcome::Failed, record.idempotencyKey};
        }
        onRetryableFailure(record, e.what(), now);
        return SubmitResult{record.status == SubmissionStatus::Failed ? SubmitOutcome::Failed
                                                                      : SubmitOutcome::RetryScheduled,
                            record.idempotencyKey};
    }
    
    switch (chainResult.status) {
        case ports::ChainSubmitResult::Status::Accepted:
        case ports::ChainSubmitResult::Status::DuplicateReport: {
            const bool duplicate = chainResult.status == ports::ChainSubmitResult::Status::DuplicateReport;
            record.status = SubmissionStatus::Confirmed;
            record.txHash = chainResult.txHash;
            record.lastError = duplicate ? "chain already holds report: " + chainResult.message : "";
            store_->save(record);
            LogLine("Submitter") << "Policy " << record.policyId << ": " << report.outcome << " report "
                                 << (duplicate ? "already on chain" : "confirmed")
                                 << (record.txHash.empty() ? "" : " tx " + record.txHash);
            publish(EventType::SubmissionConfirmed, record, report.outcome);
            return SubmitResult{SubmitOutcome::Confirmed, record.idempotencyKey};
        }
        case ports::ChainSubmitResult::Status::Rejected:
            record.retryCount++;
            markFailed(record, "chain rejected report: " + chainResult.message, now);
            return SubmitResult{SubmitOutcome::Failed, record.idempotencyKey};
    }
    return SubmitResult{SubmitOutcome::Failed, record.idempotencyKey};
}

void ReportSubmitter::onRetryableFailure(SubmissionRecord& record, const std::string& error, int64_t now) {
    record.retryCount++;
    record.lastError = error;
    
    if (record.status == SubmissionStatus::Failed) {
        // Already escalated; stay on the slow cadence.
        record.nextAttemptAt = now + failedRetryInterval_.count();
        store_->save(record);
        return;
    }
    
    if (!retryPolicy_->shouldRetry(record.retryCount)) {
        markFailed(record, error, now);
        return;
    }
    
    const auto delay = retryPolicy_->getBackoffDelay(record.retryCount);
    const int64_t delaySeconds = std::max<int64_t>(1, (delay.count() + 999) / 1000);
    record.nextAttemptAt = now + delaySeconds;
    store_->save(record);
    
    LogLine("Submitter", LogLine::Warn) << "Policy " << record.policyId << ": attempt " << record.retryCount
                                        << " failed (" << error << "); retry in " << delaySeconds << "s";
}

void ReportSubmitter::markFailed(SubmissionRecord& record, const std::string& error, int64_t now) {
    const bool escalated = record.status != SubmissionStatus::Failed;
    record.status = SubmissionStatus::Failed;
    record.lastError = error;
    record.nextAttemptAt = now + failedRetryInterval_.count();
    store_->save(record);
    
    if (escalated) {
        LogLine("Submitter", LogLine::Error) << "Policy " << record.policyId << ": submission "
                                             << record.idempotencyKey << " failed: " << error;
        publish(EventType::SubmissionFailed, record, error);
    }
}

std::size_t ReportSubmitter::confirmFromChain(const PolicyId& policyId) {
    std::size_t confirmed = 0;
    for (const auto& record : recordsFor(policyId)) {
        std::lock_guard<std::mutex> lock(keyLocks_.mutexFor(record.idempotencyKey));
        auto current = store_->load(record.idempotencyKey);
        if (!current || current->status == SubmissionStatus::Confirmed) {
            continue;
        }
        current->status = SubmissionStatus::Confirmed;
        current->lastError = "confirmed from chain state";
        store_->save(*current);
        publish(EventType::SubmissionConfirmed, *current, "confirmed from chain state");
        confirmed++;
    }
    return confirmed;
}

std::size_t ReportSubmitter::prune(const PolicyId& policyId) {
    std::size_t pruned = 0;
    for (const auto& record : recordsFor(policyId)) {
        std::lock_guard<std::mutex> lock(keyLocks_.mutexFor(record.idempotencyKey));
        store_->erase(record.idempotencyKey);
        pruned++;
    }
    return pruned;
}

bool ReportSubmitter::hasRecord(const PolicyId& policyId) {
    return !recordsFor(policyId).empty();
}

std::vector<SubmissionRecord> ReportSubmitter::recordsFor(const PolicyId& policyId) {
    std::vector<SubmissionRecord> records;
    for (auto kind : {DecisionKind::EarlyTrigger, DecisionKind::Matured}) {
        if (auto record = store_->load(makeIdempotencyKey(policyId, kind))) {
            records.push_back(std::move(*record));
        }
    }
    return records;
}

std::map<SubmissionStatus, std::size_t> ReportSubmitter::countByStatus() {
    std::map<SubmissionStatus, std::size_t> counts;
    for (const auto& record : store_->loadAll()) {
        counts[record.status]++;
    }
    return counts;
}

void ReportSubmitter::publish(EventType type, const SubmissionRecord& record, const std::string& message) {
    if (!eventBus_) {
        return;
    }
    Event event;
    event.eventType = type;
    event.policyId = record.policyId;
    event.message = message;
    event.timestamp = clock_->epochSeconds();
    event.extras["key"] = record.idempotencyKey;
    event.extras["retryCount"] = std::to_string(record.retryCount);
    if (!record.txHash.empty()) {
        event.extras["txHash"] = record.txHash;
    }
    eventBus_->publish(event);
}

} // namespace rainoracle::domain
