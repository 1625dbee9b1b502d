#pragma once

#include "../ports/ISubmissionStore.hpp"
#include <map>
#include <mutex>

namespace rainoracle::sim {

/// Volatile store; share one instance between submitters to model a restart.
class InMemorySubmissionStore : public ports::ISubmissionStore {
public:
    std::optional<SubmissionRecord> load(const std::string& idempotencyKey) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(idempotencyKey);
        if (it == records_.end()) {
            return std::nullopt;
        }
        return it->second;
    }
    
    std::vector<SubmissionRecord> loadAll() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<SubmissionRecord> all;
        for (const auto& [key, record] : records_) {
            all.push_back(record);
        }
        return all;
    }
    
    void save(const SubmissionRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        records_[record.idempotencyKey] = record;
        saves_++;
    }
    
    void erase(const std::string& idempotencyKey) override {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.erase(idempotencyKey);
    }
    
    std::optional<RainfallCheckpoint> loadCheckpoint(const PolicyId& policyId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = checkpoints_.find(policyId);
        if (it == checkpoints_.end()) {
            return std::nullopt;
        }
        return it->second;
    }
    
    void saveCheckpoint(const RainfallCheckpoint& checkpoint) override {
        std::lock_guard<std::mutex> lock(mutex_);
        checkpoints_[checkpoint.policyId] = checkpoint;
    }
    
    void eraseCheckpoint(const PolicyId& policyId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        checkpoints_.erase(policyId);
    }
    
    void clear() override {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.clear();
        checkpoints_.clear();
    }
    
    std::string chainGenesis() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return genesis_;
    }
    
    void setChainGenesis(const std::string& genesisHash) override {
        std::lock_guard<std::mutex> lock(mutex_);
        genesis_ = genesisHash;
    }
    
    std::size_t saveCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return saves_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, SubmissionRecord> records_;
    std::map<PolicyId, RainfallCheckpoint> checkpoints_;
    std::string genesis_;
    std::size_t saves_ = 0;
};

} // namespace rainoracle::sim
