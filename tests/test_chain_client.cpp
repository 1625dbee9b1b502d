#include <gtest/gtest.h>
#include "../core/OracleError.hpp"
#include "../core/adapters/JsonRpcChainClient.hpp"
#include "../core/sim/MockHttpClient.hpp"
#include <nlohmann/json.hpp>
#include <memory>

using namespace rainoracle;

namespace {

const std::string kEndpoint = "http://127.0.0.1:9933";

ports::SignedReport makeReport() {
    ports::SignedReport report;
    report.policyId = "7";
    report.kind = DecisionKind::EarlyTrigger;
    report.outcome = "Triggered";
    report.eventOccurred = true;
    report.observedAt = 1700003600;
    report.cumulative = 512;
    report.evidenceHash = std::string(64, 'a');
    report.reporter = "oracle-1";
    report.signature = std::string(64, 'b');
    return report;
}

} // namespace

class JsonRpcChainClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        http_ = std::make_shared<sim::MockHttpClient>();
        client_ = std::make_unique<adapters::JsonRpcChainClient>(http_, kEndpoint);
    }

    void reply(const std::string& body, int status = 200) {
        http_->reset();
        http_->respond(kEndpoint, status, body);
    }

    nlohmann::json lastRequest() const {
        auto requests = http_->requests();
        return nlohmann::json::parse(requests.back().body);
    }

    std::shared_ptr<sim::MockHttpClient> http_;
    std::unique_ptr<adapters::JsonRpcChainClient> client_;
};

TEST_F(JsonRpcChainClientTest, ListsPoliciesAndSkipsMalformedEntries) {
    reply(R"({"jsonrpc":"2.0","id":1,"result":[
        {"policyId":7,"marketId":3,"version":1,"lat":-1.2921,"lon":36.8219,
         "coverageStart":1700000000,"coverageEnd":1702592000,"threshold":500,
         "triggerMode":"early_trigger","status":"active"},
        {"policyId":"8","lat":0.0,"lon":0.0,"coverageStart":10,"coverageEnd":5,"threshold":1},
        {"policyId":"9"}
    ]})");

    auto policies = client_->listPolicies();

    ASSERT_EQ(policies.size(), 1u);
    EXPECT_EQ(policies[0].policyId, "7");
    EXPECT_EQ(policies[0].version, 1u);
    EXPECT_EQ(policies[0].threshold, 500);
    EXPECT_EQ(policies[0].status, PolicyStatus::Active);

    auto request = lastRequest();
    EXPECT_EQ(request["method"], "oracle_listPolicies");
    EXPECT_EQ(request["jsonrpc"], "2.0");
    EXPECT_EQ(http_->requests().back().method, "POST");
}

TEST_F(JsonRpcChainClientTest, SubmitSendsSignedPayload) {
    reply(R"({"jsonrpc":"2.0","id":1,"result":"0xabc"})");

    auto result = client_->submitReport(makeReport());

    EXPECT_EQ(result.status, ports::ChainSubmitResult::Status::Accepted);
    EXPECT_EQ(result.txHash, "0xabc");

    auto params = lastRequest()["params"][0];
    EXPECT_EQ(params["policyId"], "7");
    EXPECT_EQ(params["kind"], "early_trigger");
    EXPECT_EQ(params["outcome"], "Triggered");
    EXPECT_EQ(params["cumulative"], 512);
    EXPECT_EQ(params["reporter"], "oracle-1");
}

TEST_F(JsonRpcChainClientTest, TxHashFromObjectResult) {
    reply(R"({"jsonrpc":"2.0","id":1,"result":{"txHash":"0xdef","block":12}})");
    EXPECT_EQ(client_->submitReport(makeReport()).txHash, "0xdef");
}

TEST_F(JsonRpcChainClientTest, DuplicateErrorMapsToDuplicateReport) {
    reply(R"({"jsonrpc":"2.0","id":1,"error":{"code":1010,"message":"Invalid Transaction",
              "data":"Module error: ReportAlreadySubmitted"}})");

    auto result = client_->submitReport(makeReport());

    EXPECT_EQ(result.status, ports::ChainSubmitResult::Status::DuplicateReport);
}

TEST_F(JsonRpcChainClientTest, TransientPoolErrorIsRetryable) {
    reply(R"({"jsonrpc":"2.0","id":1,"error":{"code":1014,"message":"Priority is too low"}})");

    try {
        client_->submitReport(makeReport());
        FAIL() << "expected OracleError";
    } catch (const OracleError& e) {
        EXPECT_TRUE(e.isRetryable());
    }
}

TEST_F(JsonRpcChainClientTest, OtherRpcErrorIsRejected) {
    reply(R"({"jsonrpc":"2.0","id":1,"error":{"code":1010,"message":"BadOrigin"}})");

    auto result = client_->submitReport(makeReport());

    EXPECT_EQ(result.status, ports::ChainSubmitResult::Status::Rejected);
    EXPECT_NE(result.message.find("BadOrigin"), std::string::npos);
}

TEST_F(JsonRpcChainClientTest, UnauthorizedSubmitIsRejectedNotThrown) {
    reply("", 401);
    EXPECT_EQ(client_->submitReport(makeReport()).status, ports::ChainSubmitResult::Status::Rejected);
}

TEST_F(JsonRpcChainClientTest, ServerErrorsAreRetryable) {
    reply("", 502);
    EXPECT_THROW(client_->listPolicies(), OracleError);

    reply("not json");
    try {
        client_->submitReport(makeReport());
        FAIL() << "expected OracleError";
    } catch (const OracleError& e) {
        EXPECT_TRUE(e.isRetryable());
    }
}

TEST_F(JsonRpcChainClientTest, GenesisHashReadsBlockZero) {
    reply(R"({"jsonrpc":"2.0","id":1,"result":"0x91b171bb158e2d38"})");

    EXPECT_EQ(client_->genesisHash(), "0x91b171bb158e2d38");
    auto request = lastRequest();
    EXPECT_EQ(request["method"], "chain_getBlockHash");
    EXPECT_EQ(request["params"][0], 0);
}

TEST_F(JsonRpcChainClientTest, RequestIdsIncrease) {
    reply(R"({"jsonrpc":"2.0","id":1,"result":"0x1"})");
    client_->genesisHash();
    client_->genesisHash();

    auto requests = http_->requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_LT(nlohmann::json::parse(requests[0].body)["id"].get<int>(),
              nlohmann::json::parse(requests[1].body)["id"].get<int>());
}

TEST(JsonRpcMessageTest, ClassifiesChainMessages) {
    EXPECT_TRUE(adapters::JsonRpcChainClient::isDuplicateMessage("PolicyAlreadySettled"));
    EXPECT_FALSE(adapters::JsonRpcChainClient::isDuplicateMessage("BadOrigin"));
    EXPECT_TRUE(adapters::JsonRpcChainClient::isTransientMessage("Transaction pool is full"));
    EXPECT_FALSE(adapters::JsonRpcChainClient::isTransientMessage("ReportAlreadySubmitted"));
}
