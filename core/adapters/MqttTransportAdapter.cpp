#include "MqttTransportAdapter.hpp"
#include "../Log.hpp"

namespace rainoracle::adapters {

MqttTransportAdapter::MqttTransportAdapter(std::shared_ptr<IMqttClient> mqttClient)
    : mqttClient_(std::move(mqttClient)) {

    mqttClient_->setMessageCallback([this](const MqttMessage& msg) {
        onMqttMessage(msg);
    });

    mqttClient_->setConnectionCallback([this](bool connected, const std::string& reason) {
        onMqttConnection(connected, reason);
    });
}

MqttConnectOptions MqttTransportAdapter::toConnectOptions(const ports::Credentials& credentials) {
    MqttConnectOptions options;
    options.host = credentials.host;
    options.port = static_cast<std::uint16_t>(credentials.port);
    options.clientId = credentials.clientId;
    options.username = credentials.username;
    options.password = credentials.password;
    options.useTls = credentials.useTls;
    options.willTopic = credentials.offlineTopic;
    options.willPayload = credentials.offlinePayload;
    options.willRetained = true;
    return options;
}

bool MqttTransportAdapter::connect(const ports::Credentials& credentials) {
    if (credentials.port <= 0 || credentials.port > 65535) {
        LogLine("Transport", LogLine::Error) << "Invalid broker port " << credentials.port;
        return false;
    }
    return mqttClient_->connect(toConnectOptions(credentials));
}

void MqttTransportAdapter::disconnect() {
    mqttClient_->disconnect();
}

bool MqttTransportAdapter::isConnected() const {
    return mqttClient_->isConnected();
}

bool MqttTransportAdapter::publish(std::string_view topic, std::string_view payload, int qos, bool retain) {
    return mqttClient_->publish(std::string(topic), std::string(payload), qos, retain);
}

bool MqttTransportAdapter::subscribe(std::string_view topicFilter, int qos) {
    return mqttClient_->subscribe(std::string(topicFilter), qos);
}

void MqttTransportAdapter::setMessageHandler(MessageHandler handler) {
    std::lock_guard<std::mutex> lock(handlerMutex_);
    messageHandler_ = std::move(handler);
}

void MqttTransportAdapter::setConnectionHandler(ConnectionHandler handler) {
    std::lock_guard<std::mutex> lock(handlerMutex_);
    connectionHandler_ = std::move(handler);
}

void MqttTransportAdapter::processEvents() {
    mqttClient_->processEvents();
}

void MqttTransportAdapter::onMqttMessage(const MqttMessage& message) {
    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlerMutex_);
        handler = messageHandler_;
    }
    if (handler) {
        handler(message.topic, message.payload);
    }
}

void MqttTransportAdapter::onMqttConnection(bool connected, const std::string& reason) {
    if (!connected && wasConnected_.exchange(false)) {
        drops_++;
        LogLine("Transport", LogLine::Warn) << "Broker session lost (" << reason << "); "
                                            << drops_ << " drop(s) so far";
    } else if (connected) {
        wasConnected_ = true;
    }

    ConnectionHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlerMutex_);
        handler = connectionHandler_;
    }
    if (handler) {
        handler(connected, reason);
    }
}

} // namespace rainoracle::adapters
