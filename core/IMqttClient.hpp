/**
 * @file IMqttClient.hpp
 * @brief MQTT client interface for the chain-event bridge and the operator feed
 *
 * Broker-agnostic abstraction over an asynchronous MQTT client. The oracle
 * consumes policy lifecycle events from the bridge and publishes pass
 * summaries and alerts for operators over the same connection.
 */

#pragma once

#include <string>
#include <functional>
#include <memory>
#include <cstdint>

namespace rainoracle {

/**
 * @brief One MQTT message, inbound or outbound
 *
 * @note QoS levels: 0 (at most once), 1 (at least once), 2 (exactly once)
 */
struct MqttMessage {
    std::string topic;              ///< MQTT topic (e.g. "rainoracle/events/policy")
    std::string payload;            ///< Message payload (JSON)
    int qos = 0;                    ///< Quality of Service level (0, 1, or 2)
    bool retained = false;          ///< Retain flag
};

/**
 * @brief Broker connection parameters
 *
 * Username and password are optional; TLS uses the system trust store unless
 * caPath names a PEM bundle. A non-empty willTopic registers a last-will
 * message the broker publishes if the connection drops uncleanly.
 */
struct MqttConnectOptions {
    std::string host;
    std::uint16_t port = 1883;
    std::string clientId;
    std::string username;
    std::string password;
    bool useTls = false;
    std::string caPath;             ///< Optional CA bundle (.pem) for TLS
    std::string willTopic;
    std::string willPayload;
    bool willRetained = true;
};

/**
 * @brief Platform-independent MQTT client interface
 *
 * Subscriptions requested through subscribe() are remembered and re-applied
 * whenever the connection is (re)established.
 *
 * @note Callbacks run on the client library's thread; handlers must be thread-safe
 */
class IMqttClient {
public:
    virtual ~IMqttClient() = default;
    
    /// Callback function type for incoming MQTT messages
    using MessageCallback = std::function<void(const MqttMessage&)>;
    
    /// Callback function type for connection state changes
    using ConnectionCallback = std::function<void(bool connected, const std::string& reason)>;
    
    /**
     * @brief Start connecting to the broker
     * @return true if the connection attempt was initiated
     * @note Asynchronous: the connection callback reports the outcome
     */
    virtual bool connect(const MqttConnectOptions& options) = 0;
    
    /// Disconnect gracefully from the broker
    virtual void disconnect() = 0;
    
    virtual bool isConnected() const = 0;
    
    /**
     * @brief Publish message to MQTT topic
     * @return true if the message was handed to the broker connection
     * @note While offline the message is queued and false is returned
     */
    virtual bool publish(const std::string& topic, const std::string& payload, 
                        int qos = 0, bool retained = false) = 0;
    
    /**
     * @brief Subscribe to MQTT topic (wildcards allowed)
     * @return true if the subscription was sent now or recorded for the next connect
     */
    virtual bool subscribe(const std::string& topic, int qos = 0) = 0;
    
    virtual bool unsubscribe(const std::string& topic) = 0;
    
    virtual void setMessageCallback(MessageCallback callback) = 0;
    virtual void setConnectionCallback(ConnectionCallback callback) = 0;
    
    /**
     * @brief Process pending MQTT events
     * @note No-op for clients that run their own network thread
     */
    virtual void processEvents() = 0;

protected:
    IMqttClient() = default;
    IMqttClient(const IMqttClient&) = default;
    IMqttClient& operator=(const IMqttClient&) = default;
    IMqttClient(IMqttClient&&) = default;
    IMqttClient& operator=(IMqttClient&&) = default;
};

} // namespace rainoracle
