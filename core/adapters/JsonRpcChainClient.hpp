#pragma once

#include "../ports/IChainClient.hpp"
#include "../ports/IHttpClient.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace rainoracle::adapters {

/**
 * @brief Ledger access over JSON-RPC 2.0 (HTTP POST)
 *
 * Methods: oracle_listPolicies, oracle_submitReport, chain_getBlockHash [0].
 * Transport failures, 429/5xx and transient pool errors throw
 * OracleError(Retryable). submitReport maps "already reported/settled" errors
 * to DuplicateReport and any other refusal to Rejected.
 */
class JsonRpcChainClient : public ports::IChainClient {
public:
    JsonRpcChainClient(std::shared_ptr<ports::IHttpClient> http,
                       std::string endpoint,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(10000));
    
    std::vector<Policy> listPolicies() override;
    ports::ChainSubmitResult submitReport(const ports::SignedReport& report) override;
    std::string genesisHash() override;
    
    static bool isDuplicateMessage(const std::string& message);
    static bool isTransientMessage(const std::string& message);

private:
    struct Reply {
        nlohmann::json result;
        bool isError = false;
        int errorCode = 0;
        std::string errorMessage;
    };
    
    Reply call(const std::string& method, nlohmann::json params);
    
    std::shared_ptr<ports::IHttpClient> http_;
    std::string endpoint_;
    std::chrono::milliseconds timeout_;
    std::atomic<uint64_t> nextId_{1};
};

} // namespace rainoracle::adapters
