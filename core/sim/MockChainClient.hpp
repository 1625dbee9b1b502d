#pragma once

#include "../OracleError.hpp"
#include "../ports/IChainClient.hpp"
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace rainoracle::sim {

/**
 * In-memory ledger. Accepting a report moves the policy to Triggered or
 * Matured and a second report for the same policy is answered with
 * DuplicateReport, as the real pallet does. Scripted results override
 * that behaviour one call at a time.
 */
class MockChainClient : public ports::IChainClient {
public:
    enum class Script {
        Accept,
        Duplicate,
        Reject,
        ThrowRetryable,
        ThrowFatal
    };
    
    std::vector<Policy> listPolicies() override;
    ports::ChainSubmitResult submitReport(const ports::SignedReport& report) override;
    std::string genesisHash() override;
    
    void addPolicy(const Policy& policy);
    void setStatus(const PolicyId& policyId, PolicyStatus status);
    void setGenesis(const std::string& genesis);
    void setListFailure(bool fail);
    void setGenesisFailure(bool fail);
    void scriptSubmit(Script script, int times = 1);
    
    std::vector<ports::SignedReport> acceptedReports() const;
    std::size_t submitCalls() const;
    std::size_t listCalls() const;
    std::optional<Policy> policy(const PolicyId& policyId) const;

private:
    mutable std::mutex mutex_;
    std::map<PolicyId, Policy> policies_;
    std::map<PolicyId, ports::SignedReport> reports_;
    std::vector<ports::SignedReport> accepted_;
    std::deque<Script> scripts_;
    std::string genesis_ = "0xgenesis-a";
    bool failList_ = false;
    bool failGenesis_ = false;
    std::size_t submitCalls_ = 0;
    std::size_t listCalls_ = 0;
    uint64_t nextTx_ = 1;
};

} // namespace rainoracle::sim
