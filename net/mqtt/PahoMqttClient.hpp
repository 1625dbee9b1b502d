/**
 * @file PahoMqttClient.hpp
 * @brief Eclipse Paho MQTT C (async) implementation of IMqttClient
 *
 * Queues outbound messages while offline, re-subscribes remembered topics on
 * every successful connect and relies on Paho's automatic reconnect.
 */

#pragma once

#include "../../core/IMqttClient.hpp"
#include <MQTTAsync.h>
#include <atomic>
#include <map>
#include <string>
#include <memory>
#include <queue>
#include <mutex>
#include <cstdint>

namespace rainoracle {

/**
 * @brief Paho MQTT C library implementation for desktop/server platforms
 *
 * Features:
 * - Offline message queuing with a bounded FIFO (oldest dropped first)
 * - Automatic reconnection (Paho, 1..60 s)
 * - Subscriptions restored after reconnect
 */
class PahoMqttClient : public IMqttClient {
public:
    PahoMqttClient();
    
    /// Disconnects if still connected and destroys the Paho handle
    ~PahoMqttClient() override;
    
    PahoMqttClient(const PahoMqttClient&) = delete;
    PahoMqttClient& operator=(const PahoMqttClient&) = delete;
    PahoMqttClient(PahoMqttClient&&) = delete;
    PahoMqttClient& operator=(PahoMqttClient&&) = delete;
    
    bool connect(const MqttConnectOptions& options) override;
    void disconnect() override;
    bool isConnected() const override;
    
    bool publish(const std::string& topic, const std::string& payload, 
                int qos = 0, bool retained = false) override;
    
    bool subscribe(const std::string& topic, int qos = 0) override;
    bool unsubscribe(const std::string& topic) override;
    
    void setMessageCallback(MessageCallback callback) override;
    void setConnectionCallback(ConnectionCallback callback) override;
    
    void processEvents() override;
    
private:
    /// Maximum number of messages to queue when offline
    static constexpr std::size_t kMaxOfflineQueueSize = 100;
    
    static constexpr int kKeepAliveIntervalSeconds = 60;
    static constexpr int kConnectionTimeoutSeconds = 10;
    
    MQTTAsync client_;                     ///< Paho MQTT client handle
    std::atomic<bool> connected_{false};   ///< Updated from Paho callbacks
    MqttConnectOptions options_;           ///< Kept alive for Paho's pointers into it
    
    MessageCallback messageCallback_;
    ConnectionCallback connectionCallback_;
    
    std::queue<MqttMessage> offlineQueue_; ///< Messages published while offline
    std::mutex queueMutex_;
    
    std::map<std::string, int> subscriptions_; ///< topic -> qos, re-applied on connect
    std::mutex subscriptionMutex_;
    
    /**
     * @brief Static callback for incoming MQTT messages
     * @return 1 to tell Paho the message was consumed
     */
    static int messageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message);
    
    /// Fires on the first connect and on every automatic reconnect
    static void onConnectionEstablished(void* context, char* cause);
    
    static void onConnectFailure(void* context, MQTTAsync_failureData* response);
    static void connectionLost(void* context, char* cause);
    static void onDisconnected(void* context, MQTTAsync_successData* response);
    
    bool sendNow(const MqttMessage& message);
    void restoreSubscriptions();
    void flushOfflineQueue();
    void queueMessage(MqttMessage message);
};

} // namespace rainoracle
