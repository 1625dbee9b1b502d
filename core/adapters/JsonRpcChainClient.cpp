#include "JsonRpcChainClient.hpp"
#include "../JsonCodec.hpp"
#include "../Log.hpp"
#include "../OracleError.hpp"

namespace rainoracle::adapters {

namespace {

bool containsAny(const std::string& text, std::initializer_list<const char*> needles) {
    for (const char* needle : needles) {
        if (text.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // namespace

JsonRpcChainClient::JsonRpcChainClient(std::shared_ptr<ports::IHttpClient> http,
                                       std::string endpoint,
                                       std::chrono::milliseconds timeout)
    : http_(std::move(http)), endpoint_(std::move(endpoint)), timeout_(timeout) {
}

bool JsonRpcChainClient::isDuplicateMessage(const std::string& message) {
    return containsAny(message, {"ReportAlreadySubmitted", "AlreadySettled", "PolicyAlreadySettled"});
}

bool JsonRpcChainClient::isTransientMessage(const std::string& message) {
    return containsAny(message, {"Temporarily", "pool is full", "Priority is too low", "Stale"});
}

JsonRpcChainClient::Reply JsonRpcChainClient::call(const std::string& method, nlohmann::json params) {
    const nlohmann::json envelope = {
        {"jsonrpc", "2.0"},
        {"id", nextId_++},
        {"method", method},
        {"params", std::move(params)}
    };
    
    ports::HttpRequest request;
    request.method = "POST";
    request.url = endpoint_;
    request.headers["Content-Type"] = "application/json";
    request.body = envelope.dump();
    request.timeout = timeout_;
    
    const auto response = http_->send(request);
    const std::string what = "chain " + method;
    
    if (response.status == 401 || response.status == 403) {
        throw OracleError(ErrorKind::Fatal, what + ": HTTP " + std::to_string(response.status) + " (unauthorized)");
    }
    if (response.status < 200 || response.status >= 300) {
        throw OracleError(ErrorKind::Retryable, what + ": HTTP " + std::to_string(response.status));
    }
    
    nlohmann::json body;
    try {
        body = nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw OracleError(ErrorKind::Retryable, what + ": malformed JSON-RPC response: " + e.what());
    }
    
    Reply reply;
    if (body.contains("error") && !body["error"].is_null()) {
        const auto& error = body["error"];
        reply.isError = true;
        reply.errorCode = error.value("code", 0);
        reply.errorMessage = error.value("message", "");
        if (error.contains("data") && !error["data"].is_null()) {
            reply.errorMessage += " " + (error["data"].is_string() ? error["data"].get<std::string>()
                                                                   : error["data"].dump());
        }
        return reply;
    }
    if (!body.contains("result")) {
        throw OracleError(ErrorKind::Retryable, what + ": response has neither result nor error");
    }
    
    reply.result = body["result"];
    return reply;
}

std::vector<Policy> JsonRpcChainClient::listPolicies() {
    auto reply = call("oracle_listPolicies", nlohmann::json::array());
    if (reply.isError) {
        throw OracleError(ErrorKind::Retryable, "chain oracle_listPolicies: " + reply.errorMessage);
    }
    if (!reply.result.is_array()) {
        throw OracleError(ErrorKind::Retryable, "chain oracle_listPolicies: expected an array");
    }
    
    std::vector<Policy> policies;
    policies.reserve(reply.result.size());
    for (const auto& entry : reply.result) {
        try {
            policies.push_back(JsonCodec::jsonToPolicy(entry));
        } catch (const std::exception& e) {
            LogLine("Chain", LogLine::Warn) << "Skipping malformed policy entry: " << e.what();
        }
    }
    return policies;
}

ports::ChainSubmitResult JsonRpcChainClient::submitReport(const ports::SignedReport& report) {
    const nlohmann::json payload = {
        {"policyId", report.policyId},
        {"kind", decisionKindToString(report.kind)},
        {"outcome", report.outcome},
        {"eventOccurred", report.eventOccurred},
        {"observedAt", report.observedAt},
        {"cumulative", report.cumulative},
        {"evidenceHash", report.evidenceHash},
        {"reporter", report.reporter},
        {"signature", report.signature}
    };
    
    ports::ChainSubmitResult result;
    Reply reply;
    try {
        reply = call("oracle_submitReport", nlohmann::json::array({payload}));
    } catch (const OracleError& e) {
        if (!e.isFatal()) {
            throw;
        }
        result.status = ports::ChainSubmitResult::Status::Rejected;
        result.message = e.what();
        return result;
    }
    
    if (reply.isError) {
        if (isDuplicateMessage(reply.errorMessage)) {
            result.status = ports::ChainSubmitResult::Status::DuplicateReport;
        } else if (isTransientMessage(reply.errorMessage)) {
            throw OracleError(ErrorKind::Retryable, "chain oracle_submitReport: " + reply.errorMessage);
        } else {
            result.status = ports::ChainSubmitResult::Status::Rejected;
        }
        result.message = reply.errorMessage;
        return result;
    }
    
    result.status = ports::ChainSubmitResult::Status::Accepted;
    if (reply.result.is_string()) {
        result.txHash = reply.result.get<std::string>();
    } else if (reply.result.is_object()) {
        result.txHash = reply.result.value("txHash", "");
    }
    return result;
}

std::string JsonRpcChainClient::genesisHash() {
    auto reply = call("chain_getBlockHash", nlohmann::json::array({0}));
    if (reply.isError || !reply.result.is_string()) {
        throw OracleError(ErrorKind::Retryable, "chain chain_getBlockHash: " +
                          (reply.isError ? reply.errorMessage : std::string("unexpected result")));
    }
    return reply.result.get<std::string>();
}

} // namespace rainoracle::adapters
