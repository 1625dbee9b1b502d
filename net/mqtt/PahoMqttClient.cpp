#include "PahoMqttClient.hpp"
#include "../../core/Log.hpp"
#include <cstring>

namespace rainoracle {

PahoMqttClient::PahoMqttClient() : client_(nullptr) {}

PahoMqttClient::~PahoMqttClient() {
    disconnect();
    if (client_) {
        MQTTAsync_destroy(&client_);
    }
}

bool PahoMqttClient::connect(const MqttConnectOptions& options) {
    if (client_) {
        LogLine("MQTT", LogLine::Warn) << "connect() called twice; ignoring";
        return false;
    }
    
    options_ = options;
    const std::string scheme = options_.useTls ? "ssl://" : "tcp://";
    const std::string serverURI = scheme + options_.host + ":" + std::to_string(options_.port);
    
    LogLine("MQTT") << "Connecting to " << serverURI << " as " << options_.clientId;
    
    int rc = MQTTAsync_create(&client_, serverURI.c_str(), options_.clientId.c_str(),
                              MQTTCLIENT_PERSISTENCE_NONE, nullptr);
    if (rc != MQTTASYNC_SUCCESS) {
        LogLine("MQTT", LogLine::Error) << "Failed to create client, error code: " << rc;
        client_ = nullptr;
        return false;
    }
    
    MQTTAsync_setCallbacks(client_, this, connectionLost, messageArrived, nullptr);
    MQTTAsync_setConnected(client_, this, onConnectionEstablished);
    
    MQTTAsync_connectOptions conn_opts = MQTTAsync_connectOptions_initializer;
    MQTTAsync_SSLOptions ssl_opts = MQTTAsync_SSLOptions_initializer;
    MQTTAsync_willOptions will_opts = MQTTAsync_willOptions_initializer;
    
    conn_opts.keepAliveInterval = kKeepAliveIntervalSeconds;
    conn_opts.cleansession = 1;
    conn_opts.connectTimeout = kConnectionTimeoutSeconds;
    conn_opts.automaticReconnect = 1;
    conn_opts.minRetryInterval = 1;
    conn_opts.maxRetryInterval = 60;
    conn_opts.onFailure = onConnectFailure;
    conn_opts.context = this;
    
    if (!options_.username.empty()) {
        conn_opts.username = options_.username.c_str();
        conn_opts.password = options_.password.c_str();
    }
    
    if (!options_.willTopic.empty()) {
        will_opts.topicName = options_.willTopic.c_str();
        will_opts.message = options_.willPayload.c_str();
        will_opts.qos = 1;
        will_opts.retained = options_.willRetained ? 1 : 0;
        conn_opts.will = &will_opts;
    }
    
    if (options_.useTls) {
        ssl_opts.enableServerCertAuth = 1;
        ssl_opts.verify = 1;
        ssl_opts.sslVersion = MQTT_SSL_VERSION_TLS_1_2;
        if (!options_.caPath.empty()) {
            ssl_opts.trustStore = options_.caPath.c_str();
        }
        conn_opts.ssl = &ssl_opts;
    }
    
    rc = MQTTAsync_connect(client_, &conn_opts);
    if (rc != MQTTASYNC_SUCCESS) {
        LogLine("MQTT", LogLine::Error) << "Connection attempt failed, error code: " << rc;
        return false;
    }
    return true;
}

void PahoMqttClient::disconnect() {
    if (client_ && connected_) {
        MQTTAsync_disconnectOptions disc_opts = MQTTAsync_disconnectOptions_initializer;
        disc_opts.onSuccess = onDisconnected;
        disc_opts.context = this;
        disc_opts.timeout = 1000;
        
        MQTTAsync_disconnect(client_, &disc_opts);
        connected_ = false;
    }
}

bool PahoMqttClient::isConnected() const {
    return connected_;
}

bool PahoMqttClient::publish(const std::string& topic, const std::string& payload, 
                             int qos, bool retained) {
    MqttMessage message{topic, payload, qos, retained};
    if (!connected_) {
        queueMessage(std::move(message));
        return false;
    }
    return sendNow(message);
}

bool PahoMqttClient::sendNow(const MqttMessage& message) {
    MQTTAsync_message pubmsg = MQTTAsync_message_initializer;
    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;
    
    pubmsg.payload = const_cast<void*>(static_cast<const void*>(message.payload.c_str()));
    pubmsg.payloadlen = static_cast<int>(message.payload.length());
    pubmsg.qos = message.qos;
    pubmsg.retained = message.retained ? 1 : 0;
    
    int rc = MQTTAsync_sendMessage(client_, message.topic.c_str(), &pubmsg, &opts);
    return rc == MQTTASYNC_SUCCESS;
}

bool PahoMqttClient::subscribe(const std::string& topic, int qos) {
    {
        std::lock_guard<std::mutex> lock(subscriptionMutex_);
        subscriptions_[topic] = qos;
    }
    
    if (!connected_) {
        return true;   // applied by restoreSubscriptions() on connect
    }
    
    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;
    int rc = MQTTAsync_subscribe(client_, topic.c_str(), qos, &opts);
    return rc == MQTTASYNC_SUCCESS;
}

bool PahoMqttClient::unsubscribe(const std::string& topic) {
    {
        std::lock_guard<std::mutex> lock(subscriptionMutex_);
        subscriptions_.erase(topic);
    }
    
    if (!connected_) {
        return true;
    }
    
    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;
    int rc = MQTTAsync_unsubscribe(client_, topic.c_str(), &opts);
    return rc == MQTTASYNC_SUCCESS;
}

void PahoMqttClient::setMessageCallback(MessageCallback callback) {
    messageCallback_ = std::move(callback);
}

void PahoMqttClient::setConnectionCallback(ConnectionCallback callback) {
    connectionCallback_ = std::move(callback);
}

void PahoMqttClient::processEvents() {
}

int PahoMqttClient::messageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message) {
    auto* client = static_cast<PahoMqttClient*>(context);
    
    if (client->messageCallback_) {
        MqttMessage msg;
        msg.topic = topicLen > 0 ? std::string(topicName, topicLen) : std::string(topicName);
        msg.payload = std::string(static_cast<char*>(message->payload), message->payloadlen);
        msg.qos = message->qos;
        msg.retained = message->retained != 0;
        
        client->messageCallback_(msg);
    }
    
    MQTTAsync_freeMessage(&message);
    MQTTAsync_free(topicName);
    return 1;
}

void PahoMqttClient::onConnectionEstablished(void* context, char* cause) {
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = true;
    
    LogLine("MQTT") << "Connected" << (cause ? std::string(" (") + cause + ")" : std::string());
    
    client->restoreSubscriptions();
    client->flushOfflineQueue();
    
    if (client->connectionCallback_) {
        client->connectionCallback_(true, "Connected successfully");
    }
}

void PahoMqttClient::onConnectFailure(void* context, MQTTAsync_failureData* response) {
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;
    
    std::string reason = "Connection failed";
    if (response) {
        reason = "CONNACK return code " + std::to_string(response->code);
        if (response->message) {
            reason += " (" + std::string(response->message) + ")";
        }
    }
    LogLine("MQTT", LogLine::Warn) << reason;
    
    if (client->connectionCallback_) {
        client->connectionCallback_(false, reason);
    }
}

void PahoMqttClient::connectionLost(void* context, char* cause) {
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;
    
    std::string reason = cause ? std::string(cause) : "Connection lost";
    LogLine("MQTT", LogLine::Warn) << reason << "; reconnecting";
    
    if (client->connectionCallback_) {
        client->connectionCallback_(false, reason);
    }
}

void PahoMqttClient::onDisconnected(void* context, MQTTAsync_successData* response) {
    (void)response;
    
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;
}

void PahoMqttClient::restoreSubscriptions() {
    std::lock_guard<std::mutex> lock(subscriptionMutex_);
    for (const auto& [topic, qos] : subscriptions_) {
        MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;
        int rc = MQTTAsync_subscribe(client_, topic.c_str(), qos, &opts);
        if (rc != MQTTASYNC_SUCCESS) {
            LogLine("MQTT", LogLine::Error) << "Subscribe to " << topic << " failed, error code: " << rc;
        }
    }
}

void PahoMqttClient::flushOfflineQueue() {
    std::lock_guard<std::mutex> lock(queueMutex_);
    
    while (!offlineQueue_.empty() && connected_) {
        if (!sendNow(offlineQueue_.front())) {
            break;
        }
        offlineQueue_.pop();
    }
}

void PahoMqttClient::queueMessage(MqttMessage message) {
    std::lock_guard<std::mutex> lock(queueMutex_);
    
    // Remove oldest message if queue is full (FIFO behavior)
    if (offlineQueue_.size() >= kMaxOfflineQueueSize) {
        offlineQueue_.pop();
    }
    
    offlineQueue_.push(std::move(message));
}

} // namespace rainoracle
