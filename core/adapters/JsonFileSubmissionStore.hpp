#pragma once

#include "../ports/ISubmissionStore.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace rainoracle::adapters {

/**
 * @brief Submission records and rainfall checkpoints persisted as one JSON document
 *
 * Every mutation rewrites the whole file through a temporary file and an
 * atomic rename, so a crash leaves either the old or the new document.
 * Layout: {"formatVersion":1,"chainGenesis":"0x..","records":[...],"checkpoints":[...]}
 *
 * The file is written outside the state lock. Mutations waiting on a write in
 * progress are folded into the next one, so readers and other policies do not
 * wait on disk I/O and a burst of saves costs one rewrite. A failed write rolls
 * the caller's change back before the error propagates.
 */
class JsonFileSubmissionStore : public ports::ISubmissionStore {
public:
    /// Loads an existing document; throws OracleError(Fatal) when it cannot be parsed.
    explicit JsonFileSubmissionStore(std::string path);
    
    std::optional<SubmissionRecord> load(const std::string& idempotencyKey) override;
    std::vector<SubmissionRecord> loadAll() override;
    void save(const SubmissionRecord& record) override;
    void erase(const std::string& idempotencyKey) override;
    
    std::optional<RainfallCheckpoint> loadCheckpoint(const PolicyId& policyId) override;
    void saveCheckpoint(const RainfallCheckpoint& checkpoint) override;
    void eraseCheckpoint(const PolicyId& policyId) override;
    
    void clear() override;
    
    std::string chainGenesis() override;
    void setChainGenesis(const std::string& genesisHash) override;
    
    const std::string& path() const { return path_; }
    
    /// Number of document rewrites performed since construction.
    uint64_t writeCount() const;

private:
    void readFile();
    std::string serializeLocked() const;   // caller holds mutex_
    void writeFile(const std::string& document) const;
    
    /// Brings the file up to at least `generation`; on failure runs `undo` under mutex_ and rethrows.
    void persist(uint64_t generation, const std::function<void()>& undo);
    
    std::string path_;
    
    mutable std::mutex mutex_;   // guards the in-memory state below
    std::map<std::string, SubmissionRecord> records_;
    std::map<PolicyId, RainfallCheckpoint> checkpoints_;
    std::string chainGenesis_;
    uint64_t generation_ = 0;
    
    mutable std::mutex fileMutex_;   // serializes rewrites of path_
    uint64_t writtenGeneration_ = 0;
    uint64_t writes_ = 0;
};

} // namespace rainoracle::adapters
