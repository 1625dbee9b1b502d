#pragma once

#include "../Policy.hpp"
#include <optional>
#include <string>
#include <vector>

namespace rainoracle::ports {

/**
 * Durable SubmissionRecord storage keyed by idempotency key, plus one rainfall
 * checkpoint per policy. Implementations are internally synchronized; callers
 * serialize logical read-modify-write sequences per key.
 */
class ISubmissionStore {
public:
    virtual ~ISubmissionStore() = default;
    
    virtual std::optional<SubmissionRecord> load(const std::string& idempotencyKey) = 0;
    virtual std::vector<SubmissionRecord> loadAll() = 0;
    virtual void save(const SubmissionRecord& record) = 0;
    virtual void erase(const std::string& idempotencyKey) = 0;
    
    virtual std::optional<RainfallCheckpoint> loadCheckpoint(const PolicyId& policyId) = 0;
    virtual void saveCheckpoint(const RainfallCheckpoint& checkpoint) = 0;
    virtual void eraseCheckpoint(const PolicyId& policyId) = 0;
    
    /// Drops every record and checkpoint; the chain genesis is kept.
    virtual void clear() = 0;
    
    virtual std::string chainGenesis() = 0;
    virtual void setChainGenesis(const std::string& genesisHash) = 0;
};

} // namespace rainoracle::ports
