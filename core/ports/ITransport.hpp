#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace rainoracle::ports {

/// Broker session settings for the chain-event bridge and the operator feed.
struct Credentials {
    std::string host;
    int port = 1883;
    std::string clientId;
    std::string username;
    std::string password;
    bool useTls = false;

    /// Published (retained) by the broker when the oracle drops off without a clean disconnect
    std::string offlineTopic;
    std::string offlinePayload;
};

/**
 * Message transport used by the oracle's MQTT-facing components. Inbound
 * messages and connection changes may be delivered on a library thread.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    using MessageHandler = std::function<void(std::string_view topic, std::string_view payload)>;
    using ConnectionHandler = std::function<void(bool connected, std::string_view reason)>;

    virtual bool connect(const Credentials& credentials) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    /// @param retain broker keeps the last message on the topic for late subscribers
    virtual bool publish(std::string_view topic, std::string_view payload, int qos, bool retain) = 0;
    virtual bool subscribe(std::string_view topicFilter, int qos) = 0;

    virtual void setMessageHandler(MessageHandler handler) = 0;
    virtual void setConnectionHandler(ConnectionHandler handler) = 0;

    virtual void processEvents() = 0;
};

} // namespace rainoracle::ports
