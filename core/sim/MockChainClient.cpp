#include "MockChainClient.hpp"

namespace rainoracle::sim {

std::vector<Policy> MockChainClient::listPolicies() {
    std::lock_guard<std::mutex> lock(mutex_);
    listCalls_++;
    if (failList_) {
        throw OracleError(ErrorKind::Retryable, "mock chain unreachable");
    }
    std::vector<Policy> list;
    for (const auto& [id, policy] : policies_) {
        list.push_back(policy);
    }
    return list;
}

ports::ChainSubmitResult MockChainClient::submitReport(const ports::SignedReport& report) {
    std::lock_guard<std::mutex> lock(mutex_);
    submitCalls_++;
    
    ports::ChainSubmitResult result;
    if (!scripts_.empty()) {
        const Script script = scripts_.front();
        scripts_.pop_front();
        switch (script) {
            case Script::ThrowRetryable:
                throw OracleError(ErrorKind::Retryable, "mock chain timeout");
            case Script::ThrowFatal:
                throw OracleError(ErrorKind::Fatal, "mock chain unauthorized");
            case Script::Reject:
                result.status = ports::ChainSubmitResult::Status::Rejected;
                result.message = "BadOrigin";
                return result;
            case Script::Duplicate:
                result.status = ports::ChainSubmitResult::Status::DuplicateReport;
                result.message = "ReportAlreadySubmitted";
                return result;
            case Script::Accept:
                break;
        }
    }
    
    if (reports_.count(report.policyId) != 0) {
        result.status = ports::ChainSubmitResult::Status::DuplicateReport;
        result.message = "ReportAlreadySubmitted";
        return result;
    }
    
    reports_[report.policyId] = report;
    accepted_.push_back(report);
    auto it = policies_.find(report.policyId);
    if (it != policies_.end()) {
        it->second.status = report.kind == DecisionKind::EarlyTrigger ? PolicyStatus::Triggered
                                                                      : PolicyStatus::Matured;
    }
    
    result.status = ports::ChainSubmitResult::Status::Accepted;
    result.txHash = "0xtx" + std::to_string(nextTx_++);
    return result;
}

std::string MockChainClient::genesisHash() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failGenesis_) {
        throw OracleError(ErrorKind::Retryable, "mock chain unreachable");
    }
    return genesis_;
}

void MockChainClient::addPolicy(const Policy& policy) {
    std::lock_guard<std::mutex> lock(mutex_);
    policies_[policy.policyId] = policy;
}

void MockChainClient::setStatus(const PolicyId& policyId, PolicyStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = policies_.find(policyId);
    if (it != policies_.end()) {
        it->second.status = status;
    }
}

void MockChainClient::setGenesis(const std::string& genesis) {
    std::lock_guard<std::mutex> lock(mutex_);
    genesis_ = genesis;
    reports_.clear();
}

void MockChainClient::setListFailure(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    failList_ = fail;
}

void MockChainClient::setGenesisFailure(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    failGenesis_ = fail;
}

void MockChainClient::scriptSubmit(Script script, int times) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (int i = 0; i < times; ++i) {
        scripts_.push_back(script);
    }
}

std::vector<ports::SignedReport> MockChainClient::acceptedReports() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accepted_;
}

std::size_t MockChainClient::submitCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return submitCalls_;
}

std::size_t MockChainClient::listCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listCalls_;
}

std::optional<Policy> MockChainClient::policy(const PolicyId& policyId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = policies_.find(policyId);
    if (it == policies_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace rainoracle::sim
