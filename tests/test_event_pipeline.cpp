#include <gtest/gtest.h>
#include "../core/adapters/ExponentialBackoff.hpp"
#include "../core/adapters/MqttPolicyEventSource.hpp"
#include "../core/adapters/MqttTransportAdapter.hpp"
#include "../core/domain/EventBus.hpp"
#include "../core/domain/StatusReporter.hpp"
#include "../core/sim/MockChainClient.hpp"
#include "../core/sim/MockTransport.hpp"
#include <nlohmann/json.hpp>
#include <memory>

using namespace rainoracle;

class EventPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        eventBus_ = std::make_shared<domain::EventBus>();
        transport_ = std::make_shared<sim::MockTransport>();
        retryPolicy_ = std::make_shared<adapters::ExponentialBackoffRetryPolicy>(
            std::chrono::milliseconds(0), 2.0, std::chrono::milliseconds(0), 3);
        reporter_ = std::make_unique<domain::StatusReporter>(transport_, eventBus_, retryPolicy_, "rainoracle");

        ports::Credentials credentials;
        credentials.host = "localhost";
        credentials.clientId = "test";
        credentials.offlineTopic = reporter_->statusTopic();
        credentials.offlinePayload = domain::StatusReporter::offlinePayload("oracle-1");
        transport_->connect(credentials);
        reporter_->start();
    }

    Event makeEvent(EventType type, const std::string& policyId = "") {
        Event event;
        event.eventType = type;
        event.policyId = policyId;
        event.timestamp = 1700000000;
        event.message = "test";
        return event;
    }

    std::shared_ptr<domain::EventBus> eventBus_;
    std::shared_ptr<sim::MockTransport> transport_;
    std::shared_ptr<adapters::ExponentialBackoffRetryPolicy> retryPolicy_;
    std::unique_ptr<domain::StatusReporter> reporter_;
};

TEST_F(EventPipelineTest, EventBusDeliversOnlySubscribedTypes) {
    int fatalCount = 0;
    int recoveredCount = 0;
    domain::EventBus bus;
    bus.subscribe(EventType::PolicyFatal, [&](const Event&) { fatalCount++; });
    bus.subscribe(EventType::PolicyRecovered, [&](const Event&) { recoveredCount++; });

    bus.publish(makeEvent(EventType::PolicyFatal));
    bus.publish(makeEvent(EventType::PassCompleted));
    EXPECT_EQ(bus.pendingCount(), 2u);

    bus.processEvents();

    EXPECT_EQ(fatalCount, 1);
    EXPECT_EQ(recoveredCount, 0);
    EXPECT_EQ(bus.pendingCount(), 0u);
}

TEST_F(EventPipelineTest, HandlerExceptionDoesNotStopDelivery) {
    int delivered = 0;
    domain::EventBus bus;
    bus.subscribe(EventType::PolicyFatal, [](const Event&) { throw std::runtime_error("handler failed"); });
    bus.subscribe(EventType::PolicyFatal, [&](const Event&) { delivered++; });

    bus.publish(makeEvent(EventType::PolicyFatal));
    bus.processEvents();

    EXPECT_EQ(delivered, 1);
}

TEST_F(EventPipelineTest, RoutesEventsToFeedTopics) {
    eventBus_->publish(makeEvent(EventType::PassCompleted));
    eventBus_->publish(makeEvent(EventType::PolicyFatal, "7"));
    eventBus_->publish(makeEvent(EventType::SubmissionFailed, "8"));
    eventBus_->publish(makeEvent(EventType::SubmissionConfirmed, "9"));
    eventBus_->processEvents();

    EXPECT_EQ(transport_->getPublishedOn("rainoracle/status").size(), 1u);
    EXPECT_EQ(transport_->getPublishedOn("rainoracle/alerts").size(), 2u);
    ASSERT_EQ(transport_->getPublishedOn("rainoracle/submissions").size(), 1u);

    auto payload = nlohmann::json::parse(transport_->getPublishedOn("rainoracle/submissions")[0].payload);
    EXPECT_EQ(payload["eventType"], eventTypeToString(EventType::SubmissionConfirmed));
    EXPECT_EQ(payload["policyId"], "9");
    EXPECT_EQ(payload["ts"], "2023-11-14T22:13:20Z");
}

TEST_F(EventPipelineTest, QueuesWhileOfflineAndFlushesOnReconnect) {
    transport_->simulateConnectionLoss();
    eventBus_->publish(makeEvent(EventType::PolicyFatal, "7"));
    eventBus_->processEvents();

    EXPECT_TRUE(transport_->getPublishedMessages().empty());
    EXPECT_EQ(reporter_->queuedCount(), 1u);

    transport_->simulateConnectionRestore();
    reporter_->processEvents();

    EXPECT_EQ(reporter_->queuedCount(), 0u);
    EXPECT_EQ(transport_->getPublishedOn("rainoracle/alerts").size(), 1u);
}

TEST_F(EventPipelineTest, StatusIsRetainedAndReplacedByWillOnDrop) {
    eventBus_->publish(makeEvent(EventType::PassCompleted));
    eventBus_->publish(makeEvent(EventType::PolicyFatal, "7"));
    eventBus_->processEvents();

    auto status = transport_->getPublishedOn("rainoracle/status");
    ASSERT_EQ(status.size(), 1u);
    EXPECT_TRUE(status[0].retained);
    EXPECT_FALSE(transport_->getPublishedOn("rainoracle/alerts")[0].retained);
    EXPECT_EQ(transport_->retainedOn("rainoracle/status"), status[0].payload);

    transport_->simulateConnectionLoss();

    auto will = nlohmann::json::parse(transport_->retainedOn("rainoracle/status"));
    EXPECT_EQ(will["eventType"], "Offline");
    EXPECT_EQ(will["reporter"], "oracle-1");
}

TEST_F(EventPipelineTest, CleanDisconnectLeavesLastStatus) {
    eventBus_->publish(makeEvent(EventType::PassCompleted));
    eventBus_->processEvents();
    const auto last = transport_->retainedOn("rainoracle/status");

    transport_->disconnect();

    EXPECT_EQ(transport_->retainedOn("rainoracle/status"), last);
}

TEST_F(EventPipelineTest, StopUnsubscribes) {
    reporter_->stop();
    eventBus_->publish(makeEvent(EventType::PassCompleted));
    eventBus_->processEvents();

    EXPECT_TRUE(transport_->getPublishedMessages().empty());
}

TEST_F(EventPipelineTest, PolicyEventsReachRegistryOnNextApply) {
    auto chain = std::make_shared<sim::MockChainClient>();
    auto registry = std::make_shared<domain::PolicyRegistry>(chain);
    adapters::MqttPolicyEventSource source(transport_, registry, "rainoracle");
    source.start();

    ASSERT_EQ(transport_->getSubscriptions().size(), 1u);
    EXPECT_EQ(transport_->getSubscriptions()[0], "rainoracle/events/#");

    transport_->injectMessage("rainoracle/events/created", R"({"event":"PolicyCreated","policy":{
        "policyId":11,"lat":1.5,"lon":2.5,"coverageStart":100,"coverageEnd":200,"threshold":50}})");
    transport_->injectMessage("rainoracle/events/garbage", "not json");
    transport_->processEvents();

    EXPECT_EQ(registry->size(), 0u);
    EXPECT_EQ(source.applyPending(), 1u);
    ASSERT_TRUE(registry->find("11").has_value());
    EXPECT_EQ(registry->find("11")->threshold, 50);
    EXPECT_EQ(source.applyPending(), 0u);
}

TEST(PolicyEventDecodeTest, DecodesStatusAndSettlement) {
    auto changed = adapters::MqttPolicyEventSource::decode(
        R"({"event":"PolicyStatusChanged","policyId":7,"status":"triggered"})");
    ASSERT_TRUE(changed.has_value());
    EXPECT_EQ(changed->type, domain::PolicyEvent::Type::StatusChanged);
    EXPECT_EQ(changed->policyId, "7");
    EXPECT_EQ(changed->status, PolicyStatus::Triggered);

    auto settled = adapters::MqttPolicyEventSource::decode(R"({"event":"PolicySettled","policyId":"7"})");
    ASSERT_TRUE(settled.has_value());
    EXPECT_EQ(settled->type, domain::PolicyEvent::Type::Settled);
}

TEST(PolicyEventDecodeTest, RejectsUnknownOrIncompleteEvents) {
    EXPECT_FALSE(adapters::MqttPolicyEventSource::decode(R"({"event":"MarketOpened","policyId":"7"})"));
    EXPECT_FALSE(adapters::MqttPolicyEventSource::decode(R"({"event":"PolicyStatusChanged","policyId":"7"})"));
    EXPECT_FALSE(adapters::MqttPolicyEventSource::decode(
        R"({"event":"PolicyStatusChanged","policyId":"7","status":"exploded"})"));
    EXPECT_FALSE(adapters::MqttPolicyEventSource::decode(R"({"event":"PolicySettled","policyId":""})"));
    EXPECT_FALSE(adapters::MqttPolicyEventSource::decode("[1,2,3]"));
}

namespace {

class RecordingMqttClient : public IMqttClient {
public:
    bool connect(const MqttConnectOptions& options) override {
        options_ = options;
        return true;
    }
    void disconnect() override {}
    bool isConnected() const override { return connected_; }
    bool publish(const std::string& topic, const std::string& payload, int qos, bool retained) override {
        published_.push_back(MqttMessage{topic, payload, qos, retained});
        return true;
    }
    bool subscribe(const std::string&, int) override { return true; }
    bool unsubscribe(const std::string&) override { return true; }
    void setMessageCallback(MessageCallback callback) override { onMessage_ = std::move(callback); }
    void setConnectionCallback(ConnectionCallback callback) override { onConnection_ = std::move(callback); }
    void processEvents() override {}

    void fireConnection(bool connected) {
        connected_ = connected;
        onConnection_(connected, connected ? "up" : "lost");
    }

    MqttConnectOptions options_;
    std::vector<MqttMessage> published_;
    MessageCallback onMessage_;
    ConnectionCallback onConnection_;
    bool connected_ = false;
};

} // namespace

TEST(MqttTransportAdapterTest, MapsCredentialsIncludingWill) {
    auto client = std::make_shared<RecordingMqttClient>();
    adapters::MqttTransportAdapter adapter(client);

    ports::Credentials credentials;
    credentials.host = "broker.local";
    credentials.port = 8883;
    credentials.clientId = "rainoracle-1";
    credentials.useTls = true;
    credentials.offlineTopic = "rainoracle/status";
    credentials.offlinePayload = "{}";
    ASSERT_TRUE(adapter.connect(credentials));

    EXPECT_EQ(client->options_.port, 8883);
    EXPECT_TRUE(client->options_.useTls);
    EXPECT_EQ(client->options_.willTopic, "rainoracle/status");
    EXPECT_TRUE(client->options_.willRetained);

    credentials.port = 70000;
    EXPECT_FALSE(adapter.connect(credentials));
}

TEST(MqttTransportAdapterTest, ForwardsRetainAndCountsDrops) {
    auto client = std::make_shared<RecordingMqttClient>();
    adapters::MqttTransportAdapter adapter(client);

    std::vector<bool> states;
    adapter.setConnectionHandler([&states](bool connected, std::string_view) { states.push_back(connected); });

    adapter.publish("rainoracle/status", "{}", 1, true);
    ASSERT_EQ(client->published_.size(), 1u);
    EXPECT_TRUE(client->published_[0].retained);

    client->fireConnection(false);
    client->fireConnection(true);
    client->fireConnection(false);

    EXPECT_EQ(adapter.connectionDrops(), 1u);
    EXPECT_EQ(states.size(), 3u);

    std::string seenTopic;
    adapter.setMessageHandler([&seenTopic](std::string_view topic, std::string_view) { seenTopic = topic; });
    client->onMessage_(MqttMessage{"rainoracle/events/created", "{}", 1, false});
    EXPECT_EQ(seenTopic, "rainoracle/events/created");
}
