#include "PolicyRegistry.hpp"
#include "../Log.hpp"
#include <algorithm>
#include <mutex>

namespace rainoracle::domain {

namespace {

void appendUnique(std::vector<PolicyId>& ids, const PolicyId& id) {
    if (std::find(ids.begin(), ids.end(), id) == ids.end()) {
        ids.push_back(id);
    }
}

} // namespace

PolicyRegistry::PolicyRegistry(std::shared_ptr<ports::IChainClient> chain)
    : chain_(std::move(chain)) {
}

ReconcileReport PolicyRegistry::reconcile() {
    // Network read happens outside the lock.
    auto policies = chain_->listPolicies();
    
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto& policy : policies) {
        upsert(std::move(policy));
    }
    
    ReconcileReport report = std::move(pending_);
    pending_ = ReconcileReport{};
    
    if (!report.empty()) {
        LogLine("Registry") << "Reconciled " << policies_.size() << " policies: +" << report.added.size()
                            << " added, " << report.settled.size() << " settled, "
                            << report.drifted.size() << " status drift";
    }
    return report;
}

void PolicyRegistry::applyEvent(const PolicyEvent& event) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    
    if (settled_.count(event.policyId) != 0) {
        return;
    }
    
    switch (event.type) {
        case PolicyEvent::Type::Created:
            if (event.policy) {
                upsert(*event.policy);
            }
            break;
        case PolicyEvent::Type::StatusChanged:
            if (event.status == PolicyStatus::Settled) {
                settle(event.policyId);
            } else {
                changeStatus(event.policyId, event.status);
            }
            break;
        case PolicyEvent::Type::Settled:
            settle(event.policyId);
            break;
    }
}

void PolicyRegistry::upsert(Policy policy) {
    if (settled_.count(policy.policyId) != 0) {
        return;
    }
    if (policy.status == PolicyStatus::Settled) {
        settle(policy.policyId);
        return;
    }
    
    auto it = policies_.find(policy.policyId);
    if (it == policies_.end()) {
        appendUnique(pending_.added, policy.policyId);
        policies_.emplace(policy.policyId, std::move(policy));
        return;
    }
    
    Policy& known = it->second;
    if (policy.location.providerKey.empty()) {
        policy.location.providerKey = known.location.providerKey;
    }
    const PolicyStatus previous = known.status;
    known = std::move(policy);
    if (previous == PolicyStatus::Active && known.status != PolicyStatus::Active) {
        appendUnique(pending_.drifted, known.policyId);
    }
}

void PolicyRegistry::settle(const PolicyId& policyId) {
    settled_.insert(policyId);
    policies_.erase(policyId);
    fatal_.erase(policyId);
    appendUnique(pending_.settled, policyId);
}

void PolicyRegistry::changeStatus(const PolicyId& policyId, PolicyStatus status) {
    auto it = policies_.find(policyId);
    if (it == policies_.end()) {
        // Unknown policy; the next full read brings it in with complete terms.
        return;
    }
    if (it->second.status == PolicyStatus::Active && status != PolicyStatus::Active) {
        appendUnique(pending_.drifted, policyId);
    }
    it->second.status = status;
}

std::vector<Policy> PolicyRegistry::activePolicies() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Policy> active;
    for (const auto& [id, policy] : policies_) {
        if (policy.status == PolicyStatus::Active && fatal_.count(id) == 0) {
            active.push_back(policy);
        }
    }
    std::sort(active.begin(), active.end(),
              [](const Policy& a, const Policy& b) { return a.policyId < b.policyId; });
    return active;
}

std::optional<Policy> PolicyRegistry::find(const PolicyId& policyId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = policies_.find(policyId);
    if (it == policies_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool PolicyRegistry::isSettled(const PolicyId& policyId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return settled_.count(policyId) != 0;
}

void PolicyRegistry::setProviderKey(const PolicyId& policyId, const std::string& providerKey) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = policies_.find(policyId);
    if (it != policies_.end()) {
        it->second.location.providerKey = providerKey;
    }
}

void PolicyRegistry::markFatal(const PolicyId& policyId, const std::string& reason, int64_t now) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (settled_.count(policyId) != 0) {
        return;
    }
    fatal_[policyId] = FatalExclusion{policyId, reason, now};
}

void PolicyRegistry::clearFatal(const PolicyId& policyId) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    fatal_.erase(policyId);
}

bool PolicyRegistry::isFatal(const PolicyId& policyId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return fatal_.count(policyId) != 0;
}

std::vector<FatalExclusion> PolicyRegistry::fatalPolicies() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<FatalExclusion> list;
    for (const auto& [id, exclusion] : fatal_) {
        list.push_back(exclusion);
    }
    std::sort(list.begin(), list.end(),
              [](const FatalExclusion& a, const FatalExclusion& b) { return a.policyId < b.policyId; });
    return list;
}

std::vector<PolicyId> PolicyRegistry::releaseFatalDue(int64_t now, int64_t recheckSeconds) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::vector<PolicyId> released;
    for (auto it = fatal_.begin(); it != fatal_.end();) {
        if (now - it->second.since >= recheckSeconds) {
            released.push_back(it->first);
            it = fatal_.erase(it);
        } else {
            ++it;
        }
    }
    return released;
}

std::map<PolicyStatus, std::size_t> PolicyRegistry::countByStatus() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::map<PolicyStatus, std::size_t> counts;
    for (const auto& [id, policy] : policies_) {
        counts[policy.status]++;
    }
    counts[PolicyStatus::Settled] = settled_.size();
    return counts;
}

std::size_t PolicyRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return policies_.size();
}

} // namespace rainoracle::domain
