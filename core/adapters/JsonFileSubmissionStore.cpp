#include "JsonFileSubmissionStore.hpp"
#include "../JsonCodec.hpp"
#include "../Log.hpp"
#include "../OracleError.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace rainoracle::adapters {

namespace fs = std::filesystem;

namespace {
constexpr int kFormatVersion = 1;
}

JsonFileSubmissionStore::JsonFileSubmissionStore(std::string path)
    : path_(std::move(path)) {
    readFile();
}

void JsonFileSubmissionStore::readFile() {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        LogLine("Store") << "No submission store at " << path_ << "; starting empty";
        return;
    }
    
    std::ifstream file(path_);
    if (!file.is_open()) {
        throw OracleError(ErrorKind::Fatal, "Cannot open submission store: " + path_);
    }
    
    std::stringstream buffer;
    buffer << file.rdbuf();
    
    try {
        const auto doc = nlohmann::json::parse(buffer.str());
        const int version = doc.value("formatVersion", kFormatVersion);
        if (version != kFormatVersion) {
            throw OracleError(ErrorKind::Fatal, "Unsupported submission store format " + std::to_string(version));
        }
        chainGenesis_ = doc.value("chainGenesis", "");
        for (const auto& entry : doc.value("records", nlohmann::json::array())) {
            auto record = JsonCodec::jsonToRecord(entry);
            records_[record.idempotencyKey] = std::move(record);
        }
        for (const auto& entry : doc.value("checkpoints", nlohmann::json::array())) {
            auto checkpoint = JsonCodec::jsonToCheckpoint(entry);
            checkpoints_[checkpoint.policyId] = std::move(checkpoint);
        }
    } catch (const nlohmann::json::exception& e) {
        throw OracleError(ErrorKind::Fatal, "Corrupt submission store " + path_ + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw OracleError(ErrorKind::Fatal, "Corrupt submission store " + path_ + ": " + e.what());
    }
    
    LogLine("Store") << "Loaded " << records_.size() << " submission record(s) and " << checkpoints_.size()
                     << " rainfall checkpoint(s) from " << path_;
}

std::string JsonFileSubmissionStore::serializeLocked() const {
    nlohmann::json doc;
    doc["formatVersion"] = kFormatVersion;
    doc["chainGenesis"] = chainGenesis_;
    doc["records"] = nlohmann::json::array();
    for (const auto& [key, record] : records_) {
        doc["records"].push_back(JsonCodec::recordToJson(record));
    }
    doc["checkpoints"] = nlohmann::json::array();
    for (const auto& [policyId, checkpoint] : checkpoints_) {
        doc["checkpoints"].push_back(JsonCodec::checkpointToJson(checkpoint));
    }
    return doc.dump(2);
}

void JsonFileSubmissionStore::writeFile(const std::string& document) const {
    const fs::path target(path_);
    if (target.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
    }
    
    const std::string tmpPath = path_ + ".tmp";
    {
        std::ofstream out(tmpPath, std::ios::trunc);
        if (!out.is_open()) {
            throw OracleError(ErrorKind::Retryable, "Cannot write submission store temp file " + tmpPath);
        }
        out << document << '\n';
        out.flush();
        if (!out.good()) {
            throw OracleError(ErrorKind::Retryable, "Short write to submission store temp file " + tmpPath);
        }
    }
    
    std::error_code ec;
    fs::rename(tmpPath, target, ec);
    if (ec) {
        throw OracleError(ErrorKind::Retryable, "Cannot replace submission store " + path_ + ": " + ec.message());
    }
}

void JsonFileSubmissionStore::persist(uint64_t generation, const std::function<void()>& undo) {
    std::lock_guard<std::mutex> fileLock(fileMutex_);
    if (writtenGeneration_ >= generation) {
        return;   // an earlier writer already carried this change to disk
    }
    
    std::string document;
    uint64_t snapshot = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        document = serializeLocked();
        snapshot = generation_;
    }
    
    try {
        writeFile(document);
    } catch (const OracleError&) {
        // Keep memory and disk in agreement when the write fails.
        std::lock_guard<std::mutex> lock(mutex_);
        undo();
        ++generation_;
        throw;
    }
    writtenGeneration_ = snapshot;
    ++writes_;
}

std::optional<SubmissionRecord> JsonFileSubmissionStore::load(const std::string& idempotencyKey) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(idempotencyKey);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<SubmissionRecord> JsonFileSubmissionStore::loadAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SubmissionRecord> all;
    all.reserve(records_.size());
    for (const auto& [key, record] : records_) {
        all.push_back(record);
    }
    return all;
}

void JsonFileSubmissionStore::save(const SubmissionRecord& record) {
    std::optional<SubmissionRecord> previous;
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(record.idempotencyKey);
        if (it != records_.end()) {
            previous = it->second;
        }
        records_[record.idempotencyKey] = record;
        generation = ++generation_;
    }
    
    persist(generation, [this, &record, &previous]() {
        if (previous) {
            records_[record.idempotencyKey] = *previous;
        } else {
            records_.erase(record.idempotencyKey);
        }
    });
}

void JsonFileSubmissionStore::erase(const std::string& idempotencyKey) {
    std::optional<SubmissionRecord> previous;
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(idempotencyKey);
        if (it == records_.end()) {
            return;
        }
        previous = std::move(it->second);
        records_.erase(it);
        generation = ++generation_;
    }
    
    persist(generation, [this, &idempotencyKey, &previous]() {
        records_.emplace(idempotencyKey, *previous);
    });
}

std::optional<RainfallCheckpoint> JsonFileSubmissionStore::loadCheckpoint(const PolicyId& policyId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = checkpoints_.find(policyId);
    if (it == checkpoints_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void JsonFileSubmissionStore::saveCheckpoint(const RainfallCheckpoint& checkpoint) {
    std::optional<RainfallCheckpoint> previous;
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = checkpoints_.find(checkpoint.policyId);
        if (it != checkpoints_.end()) {
            previous = it->second;
        }
        checkpoints_[checkpoint.policyId] = checkpoint;
        generation = ++generation_;
    }
    
    persist(generation, [this, &checkpoint, &previous]() {
        if (previous) {
            checkpoints_[checkpoint.policyId] = *previous;
        } else {
            checkpoints_.erase(checkpoint.policyId);
        }
    });
}

void JsonFileSubmissionStore::eraseCheckpoint(const PolicyId& policyId) {
    std::optional<RainfallCheckpoint> previous;
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = checkpoints_.find(policyId);
        if (it == checkpoints_.end()) {
            return;
        }
        previous = std::move(it->second);
        checkpoints_.erase(it);
        generation = ++generation_;
    }
    
    persist(generation, [this, &policyId, &previous]() {
        checkpoints_.emplace(policyId, *previous);
    });
}

void JsonFileSubmissionStore::clear() {
    std::map<std::string, SubmissionRecord> records;
    std::map<PolicyId, RainfallCheckpoint> checkpoints;
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        records.swap(records_);
        checkpoints.swap(checkpoints_);
        generation = ++generation_;
    }
    
    // insert keeps anything saved after the clear
    persist(generation, [this, &records, &checkpoints]() {
        records_.insert(records.begin(), records.end());
        checkpoints_.insert(checkpoints.begin(), checkpoints.end());
    });
}

std::string JsonFileSubmissionStore::chainGenesis() {
    std::lock_guard<std::mutex> lock(mutex_);
    return chainGenesis_;
}

void JsonFileSubmissionStore::setChainGenesis(const std::string& genesisHash) {
    std::string previous;
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = chainGenesis_;
        chainGenesis_ = genesisHash;
        generation = ++generation_;
    }
    
    persist(generation, [this, &previous]() {
        chainGenesis_ = previous;
    });
}

uint64_t JsonFileSubmissionStore::writeCount() const {
    std::lock_guard<std::mutex> lock(fileMutex_);
    return writes_;
}

} // namespace rainoracle::adapters
