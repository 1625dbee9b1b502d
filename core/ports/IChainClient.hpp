#pragma once

#include "../Policy.hpp"
#include <string>
#include <vector>

namespace rainoracle::ports {

struct SignedReport {
    PolicyId policyId;
    DecisionKind kind = DecisionKind::None;
    std::string outcome;
    bool eventOccurred = false;
    int64_t observedAt = 0;
    Tenths cumulative = 0;
    std::string evidenceHash;
    std::string reporter;
    std::string signature;
};

struct ChainSubmitResult {
    enum class Status {
        Accepted,          ///< Report included; txHash set
        DuplicateReport,   ///< Chain already holds a report for this policy
        Rejected           ///< Chain refused the report for a non-transient reason
    };
    
    Status status = Status::Accepted;
    std::string txHash;
    std::string message;
};

class IChainClient {
public:
    virtual ~IChainClient() = default;
    
    /// Full read of every policy the ledger knows; throws OracleError(Retryable) on transport failure.
    virtual std::vector<Policy> listPolicies() = 0;
    
    virtual ChainSubmitResult submitReport(const SignedReport& report) = 0;
    
    virtual std::string genesisHash() = 0;
};

} // namespace rainoracle::ports
