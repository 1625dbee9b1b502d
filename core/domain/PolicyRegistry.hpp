#pragma once

#include "../Policy.hpp"
#include "../ports/IChainClient.hpp"
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace rainoracle::domain {

/// Policy lifecycle notification from the chain event stream.
struct PolicyEvent {
    enum class Type {
        Created,
        StatusChanged,
        Settled
    };
    
    Type type = Type::Created;
    PolicyId policyId;
    std::optional<Policy> policy;              ///< Set for Created
    PolicyStatus status = PolicyStatus::Active; ///< Set for StatusChanged
};

/**
 * Changes observed since the previous reconcile(), from the full chain read
 * and from events applied in between.
 */
struct ReconcileReport {
    std::vector<PolicyId> added;
    std::vector<PolicyId> settled;
    std::vector<PolicyId> drifted;   ///< Known policies the chain moved out of Active
    
    bool empty() const { return added.empty() && settled.empty() && drifted.empty(); }
};

struct FatalExclusion {
    PolicyId policyId;
    std::string reason;
    int64_t since = 0;
};

/**
 * @brief Authoritative in-memory set of policies under monitoring
 *
 * Two producers feed it: periodic full reads (reconcile) and chain events
 * (applyEvent). Settled policies leave the set and are remembered so a late
 * or replayed event cannot bring them back.
 */
class PolicyRegistry {
public:
    explicit PolicyRegistry(std::shared_ptr<ports::IChainClient> chain);
    
    /// Full chain read; throws OracleError when the read fails.
    ReconcileReport reconcile();
    
    void applyEvent(const PolicyEvent& event);
    
    /// Active policies not excluded as Fatal.
    std::vector<Policy> activePolicies() const;
    std::optional<Policy> find(const PolicyId& policyId) const;
    bool isSettled(const PolicyId& policyId) const;
    
    /// Records a provider key resolved for the policy's coordinates.
    void setProviderKey(const PolicyId& policyId, const std::string& providerKey);
    
    void markFatal(const PolicyId& policyId, const std::string& reason, int64_t now);
    void clearFatal(const PolicyId& policyId);
    bool isFatal(const PolicyId& policyId) const;
    std::vector<FatalExclusion> fatalPolicies() const;
    
    /// Lifts exclusions older than recheckSeconds so the next pass retries them.
    std::vector<PolicyId> releaseFatalDue(int64_t now, int64_t recheckSeconds);
    
    std::map<PolicyStatus, std::size_t> countByStatus() const;
    std::size_t size() const;

private:
    // Caller holds the exclusive lock.
    void upsert(Policy policy);
    void settle(const PolicyId& policyId);
    void changeStatus(const PolicyId& policyId, PolicyStatus status);
    
    std::shared_ptr<ports::IChainClient> chain_;
    
    mutable std::shared_mutex mutex_;
    std::unordered_map<PolicyId, Policy> policies_;
    std::unordered_set<PolicyId> settled_;
    std::unordered_map<PolicyId, FatalExclusion> fatal_;
    ReconcileReport pending_;
};

} // namespace rainoracle::domain
