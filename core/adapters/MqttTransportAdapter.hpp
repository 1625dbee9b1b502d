#pragma once

#include "../IMqttClient.hpp"
#include "../ports/ITransport.hpp"
#include <atomic>
#include <memory>
#include <mutex>

namespace rainoracle::adapters {

/**
 * Binds an IMqttClient (Paho in production) to the transport port. Tracks
 * how often the broker session dropped so pass summaries can report it.
 */
class MqttTransportAdapter : public ports::ITransport {
public:
    explicit MqttTransportAdapter(std::shared_ptr<IMqttClient> mqttClient);
    ~MqttTransportAdapter() override = default;

    bool connect(const ports::Credentials& credentials) override;
    void disconnect() override;
    bool isConnected() const override;

    bool publish(std::string_view topic, std::string_view payload, int qos, bool retain) override;
    bool subscribe(std::string_view topicFilter, int qos) override;

    void setMessageHandler(MessageHandler handler) override;
    void setConnectionHandler(ConnectionHandler handler) override;

    void processEvents() override;

    std::size_t connectionDrops() const { return drops_; }

    static MqttConnectOptions toConnectOptions(const ports::Credentials& credentials);

private:
    void onMqttMessage(const MqttMessage& message);
    void onMqttConnection(bool connected, const std::string& reason);

    std::shared_ptr<IMqttClient> mqttClient_;

    std::mutex handlerMutex_;
    MessageHandler messageHandler_;
    ConnectionHandler connectionHandler_;

    std::atomic<bool> wasConnected_{false};
    std::atomic<std::size_t> drops_{0};
};

} // namespace rainoracle::adapters
