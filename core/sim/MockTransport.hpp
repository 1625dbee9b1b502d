#pragma once

#include "../ports/ITransport.hpp"
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace rainoracle::sim {

struct RecordedMessage {
    std::string topic;
    std::string payload;
    int qos = 0;
    bool retained = false;
};

/**
 * In-process broker stand-in. Records everything published, keeps the last
 * retained message per topic, and queues injected inbound messages until
 * processEvents(). Safe to publish from worker threads.
 */
class MockTransport : public ports::ITransport {
public:
    bool connect(const ports::Credentials& credentials) override;
    void disconnect() override;
    bool isConnected() const override;

    bool publish(std::string_view topic, std::string_view payload, int qos, bool retain) override;
    bool subscribe(std::string_view topicFilter, int qos) override;

    void setMessageHandler(MessageHandler handler) override;
    void setConnectionHandler(ConnectionHandler handler) override;

    void processEvents() override;

    void simulateConnectionLoss();
    void simulateConnectionRestore();
    void injectMessage(std::string_view topic, std::string_view payload);
    void setFailPublish(bool fail);

    std::vector<RecordedMessage> getPublishedMessages() const;
    std::vector<RecordedMessage> getPublishedOn(const std::string& topic) const;
    /// Last retained payload on a topic, including the offline will after an unclean drop
    std::string retainedOn(const std::string& topic) const;
    std::vector<std::string> getSubscriptions() const;
    ports::Credentials lastCredentials() const;

private:
    void setConnected(bool connected, bool clean, const char* reason);

    mutable std::mutex mutex_;
    bool connected_ = false;
    bool failPublish_ = false;

    MessageHandler messageHandler_;
    ConnectionHandler connectionHandler_;

    std::vector<RecordedMessage> published_;
    std::vector<RecordedMessage> retained_;
    std::deque<RecordedMessage> inbound_;
    std::vector<std::string> subscriptions_;
    ports::Credentials credentials_;
};

} // namespace rainoracle::sim
