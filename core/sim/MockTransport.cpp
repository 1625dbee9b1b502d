#include "MockTransport.hpp"
#include <algorithm>
#include <iterator>

namespace rainoracle::sim {

namespace {

void retain(std::vector<RecordedMessage>& retained, const RecordedMessage& message) {
    auto it = std::find_if(retained.begin(), retained.end(),
                           [&message](const RecordedMessage& m) { return m.topic == message.topic; });
    if (it != retained.end()) {
        *it = message;
    } else {
        retained.push_back(message);
    }
}

} // namespace

bool MockTransport::connect(const ports::Credentials& credentials) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        credentials_ = credentials;
    }
    setConnected(true, true, "mock broker accepted session");
    return true;
}

void MockTransport::disconnect() {
    setConnected(false, true, "client disconnect");
}

bool MockTransport::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_;
}

bool MockTransport::publish(std::string_view topic, std::string_view payload, int qos, bool retainFlag) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_ || failPublish_) {
        return false;
    }
    RecordedMessage message{std::string(topic), std::string(payload), qos, retainFlag};
    if (retainFlag) {
        retain(retained_, message);
    }
    published_.push_back(std::move(message));
    return true;
}

bool MockTransport::subscribe(std::string_view topicFilter, int) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_) {
        return false;
    }
    const std::string filter(topicFilter);
    if (std::find(subscriptions_.begin(), subscriptions_.end(), filter) == subscriptions_.end()) {
        subscriptions_.push_back(filter);
    }
    return true;
}

void MockTransport::setMessageHandler(MessageHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    messageHandler_ = std::move(handler);
}

void MockTransport::setConnectionHandler(ConnectionHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    connectionHandler_ = std::move(handler);
}

void MockTransport::processEvents() {
    std::deque<RecordedMessage> inbound;
    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        inbound.swap(inbound_);
        handler = messageHandler_;
    }
    if (!handler) {
        return;
    }
    for (const auto& message : inbound) {
        handler(message.topic, message.payload);
    }
}

void MockTransport::simulateConnectionLoss() {
    setConnected(false, false, "keepalive timeout");
}

void MockTransport::simulateConnectionRestore() {
    setConnected(true, true, "reconnected");
}

void MockTransport::injectMessage(std::string_view topic, std::string_view payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    inbound_.push_back(RecordedMessage{std::string(topic), std::string(payload), 1, false});
}

void MockTransport::setFailPublish(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    failPublish_ = fail;
}

std::vector<RecordedMessage> MockTransport::getPublishedMessages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return published_;
}

std::vector<RecordedMessage> MockTransport::getPublishedOn(const std::string& topic) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RecordedMessage> matching;
    std::copy_if(published_.begin(), published_.end(), std::back_inserter(matching),
                 [&topic](const RecordedMessage& m) { return m.topic == topic; });
    return matching;
}

std::string MockTransport::retainedOn(const std::string& topic) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& message : retained_) {
        if (message.topic == topic) {
            return message.payload;
        }
    }
    return {};
}

std::vector<std::string> MockTransport::getSubscriptions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_;
}

ports::Credentials MockTransport::lastCredentials() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return credentials_;
}

void MockTransport::setConnected(bool connected, bool clean, const char* reason) {
    ConnectionHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connected_ == connected) {
            return;
        }
        connected_ = connected;
        // Broker fires the will only for an unclean drop
        if (!connected && !clean && !credentials_.offlineTopic.empty()) {
            retain(retained_, RecordedMessage{credentials_.offlineTopic, credentials_.offlinePayload, 1, true});
        }
        handler = connectionHandler_;
    }
    if (handler) {
        handler(connected, reason);
    }
}

} // namespace rainoracle::sim
