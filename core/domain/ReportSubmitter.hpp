#pragma once

#include "../../crypto/ReportSigner.hpp"
#include "../IClock.hpp"
#include "../Policy.hpp"
#include "../ports/IChainClient.hpp"
#include "../ports/IEventBus.hpp"
#include "../ports/IRetryPolicy.hpp"
#include "../ports/ISubmissionStore.hpp"
#include "KeyedMutex.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <set>
#include <vector>

namespace rainoracle::domain {

enum class SubmitOutcome {
    Confirmed,          ///< Chain accepted the report (or already held it) on this attempt
    AlreadyConfirmed,   ///< Nothing to do
    RetryScheduled,     ///< Transient failure; record stays Pending with a backoff
    Failed,             ///< Record is Failed; retried on the slow cadence
    NotDue,             ///< Record exists but its next attempt is in the future
    Skipped             ///< No decision or policy not Active
};

std::string submitOutcomeToString(SubmitOutcome outcome);

struct SubmitResult {
    SubmitOutcome outcome = SubmitOutcome::Skipped;
    std::string idempotencyKey;
};

/**
 * @brief Idempotent, retried write path for trigger and maturity reports
 *
 * One SubmissionRecord per (policyId, decisionKind). The record is persisted
 * as Pending before the first chain call, so a crash between persisting and
 * submitting is resolved by resuming the stored record; a chain that already
 * holds the report answers "duplicate", which is treated as confirmation.
 * Retries always replay the stored decision and evidence.
 */
class ReportSubmitter {
public:
    ReportSubmitter(std::shared_ptr<ports::IChainClient> chain,
                    std::shared_ptr<ports::ISubmissionStore> store,
                    std::shared_ptr<ReportSigner> signer,
                    std::shared_ptr<IClock> clock,
                    std::shared_ptr<ports::RetryPolicy> retryPolicy,
                    std::shared_ptr<ports::IEventBus> eventBus,
                    std::chrono::seconds failedRetryInterval);
    
    SubmitResult submit(const Policy& policy, const TriggerDecision& decision);
    
    /// Drives every stored record of the policy that is due.
    std::vector<SubmitResult> driveFor(const PolicyId& policyId);
    
    /// Drives due records whose policy is not in `touched` (restart safety).
    std::vector<SubmitResult> resumeOutstanding(const std::set<PolicyId>& touched);
    
    /// Chain moved the policy out of Active: its records are settled facts.
    std::size_t confirmFromChain(const PolicyId& policyId);
    
    /// Drops every record of a Settled policy.
    std::size_t prune(const PolicyId& policyId);
    
    bool hasRecord(const PolicyId& policyId);
    std::vector<SubmissionRecord> recordsFor(const PolicyId& policyId);
    std::map<SubmissionStatus, std::size_t> countByStatus();

private:
    SubmitResult driveLocked(SubmissionRecord record, int64_t now);
    SubmitResult attempt(SubmissionRecord& record, int64_t now);
    void onRetryableFailure(SubmissionRecord& record, const std::string& error, int64_t now);
    void markFailed(SubmissionRecord& record, const std::string& error, int64_t now);
    void publish(EventType type, const SubmissionRecord& record, const std::string& message);
    
    std::shared_ptr<ports::IChainClient> chain_;
    std::shared_ptr<ports::ISubmissionStore> store_;
    std::shared_ptr<ReportSigner> signer_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<ports::RetryPolicy> retryPolicy_;
    std::shared_ptr<ports::IEventBus> eventBus_;
    std::chrono::seconds failedRetryInterval_;
    
    KeyedMutex keyLocks_;
};

} // namespace rainoracle::domain
