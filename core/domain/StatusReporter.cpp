#include "StatusReporter.hpp"
#include "../Log.hpp"
#include <nlohmann/json.hpp>

namespace rainoracle::domain {

StatusReporter::StatusReporter(std::shared_ptr<ports::ITransport> transport,
                               std::shared_ptr<ports::IEventBus> eventBus,
                               std::shared_ptr<ports::RetryPolicy> retryPolicy,
                               std::string topicPrefix)
    : transport_(std::move(transport)),
      eventBus_(std::move(eventBus)),
      retryPolicy_(std::move(retryPolicy)),
      topicPrefix_(std::move(topicPrefix)) {
}

void StatusReporter::start() {
    running_ = true;
    for (auto eventType : kReportedEvents) {
        eventBus_->subscribe(eventType, [this](const Event& event) {
            onEvent(event);
        });
    }
}

void StatusReporter::stop() {
    running_ = false;
    for (auto eventType : kReportedEvents) {
        eventBus_->unsubscribe(eventType);
    }
}

void StatusReporter::processEvents() {
    if (!running_) return;
    
    retryFailedMessages();
}

void StatusReporter::onEvent(const Event& event) {
    if (!running_) return;
    
    if (event.eventType == EventType::PolicyFatal || event.eventType == EventType::SubmissionFailed) {
        LogLine("Alert", LogLine::Error) << eventTypeToString(event.eventType) << " policy " << event.policyId
                                         << ": " << event.message;
    }
    send(event);
}

void StatusReporter::send(const Event& event) {
    PendingMessage msg;
    msg.topic = buildTopic(event);
    msg.payload = JsonCodec::serialize(event);
    msg.retain = event.eventType == EventType::PassCompleted;
    
    if (transport_->isConnected() && transport_->publish(msg.topic, msg.payload, 1, msg.retain)) {
        return;
    }
    
    // Queue for retry when connection restored
    msg.attempts = 1;
    msg.nextRetry = std::chrono::steady_clock::now() + retryPolicy_->getBackoffDelay(1);
    if (retryQueue_.size() >= kMaxQueued) {
        retryQueue_.pop_front();
    }
    retryQueue_.push_back(std::move(msg));
}

void StatusReporter::retryFailedMessages() {
    if (retryQueue_.empty() || !transport_->isConnected()) return;
    
    auto now = std::chrono::steady_clock::now();
    
    while (!retryQueue_.empty()) {
        auto& msg = retryQueue_.front();
        
        if (msg.nextRetry > now) break;
        
        if (!retryPolicy_->shouldRetry(msg.attempts)) {
            LogLine("Status", LogLine::Warn) << "Dropping " << msg.topic << " message after "
                                             << msg.attempts << " attempts";
            retryQueue_.pop_front();
            continue;
        }
        
        if (transport_->publish(msg.topic, msg.payload, 1, msg.retain)) {
            retryQueue_.pop_front();
        } else {
            msg.attempts++;
            msg.nextRetry = now + retryPolicy_->getBackoffDelay(msg.attempts);
            break; // Keep ordering; try again later
        }
    }
}

std::string StatusReporter::offlinePayload(const std::string& reporterId) {
    nlohmann::json payload;
    payload["eventType"] = "Offline";
    payload["reporter"] = reporterId;
    payload["message"] = "oracle disconnected";
    return payload.dump();
}

std::string StatusReporter::buildTopic(const Event& event) const {
    switch (event.eventType) {
        case EventType::PassCompleted:
            return statusTopic();
        case EventType::PolicyFatal:
        case EventType::SubmissionFailed:
            return topicPrefix_ + "/alerts";
        case EventType::SubmissionConfirmed:
        case EventType::PolicyRecovered:
            return topicPrefix_ + "/submissions";
    }
    return statusTopic();
}

} // namespace rainoracle::domain
