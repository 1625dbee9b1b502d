#pragma once

#include "../ports/ITransport.hpp"
#include "../ports/IEventBus.hpp"
#include "../ports/IRetryPolicy.hpp"
#include "../JsonCodec.hpp"
#include "../Event.hpp"
#include <memory>
#include <deque>
#include <chrono>

namespace rainoracle::domain {

/**
 * Operator feed over MQTT. Pass summaries go to "{prefix}/status", Fatal
 * exclusions and failed submissions to "{prefix}/alerts", confirmations and
 * recoveries to "{prefix}/submissions". Status messages are retained, so a
 * late subscriber sees the latest pass, or the offline will if the oracle
 * dropped. Messages that cannot be published are queued and retried with
 * backoff.
 */
class StatusReporter {
public:
    StatusReporter(std::shared_ptr<ports::ITransport> transport,
                   std::shared_ptr<ports::IEventBus> eventBus,
                   std::shared_ptr<ports::RetryPolicy> retryPolicy,
                   std::string topicPrefix);

    void start();
    void stop();
    
    /// Retries queued messages whose backoff elapsed.
    void processEvents();
    
    std::size_t queuedCount() const { return retryQueue_.size(); }
    std::string buildTopic(const Event& event) const;
    std::string statusTopic() const { return topicPrefix_ + "/status"; }
    
    /// Payload the broker publishes on statusTopic() when the session drops uncleanly.
    static std::string offlinePayload(const std::string& reporterId);
    
private:
    void onEvent(const Event& event);
    void send(const Event& event);
    void retryFailedMessages();
    
    struct PendingMessage {
        std::string topic;
        std::string payload;
        bool retain = false;
        int attempts = 0;
        std::chrono::steady_clock::time_point nextRetry;
    };
    
    static constexpr std::size_t kMaxQueued = 500;
    static constexpr EventType kReportedEvents[] = {
        EventType::PolicyFatal, EventType::PolicyRecovered, EventType::SubmissionConfirmed,
        EventType::SubmissionFailed, EventType::PassCompleted
    };
    
    std::shared_ptr<ports::ITransport> transport_;
    std::shared_ptr<ports::IEventBus> eventBus_;
    std::shared_ptr<ports::RetryPolicy> retryPolicy_;
    std::string topicPrefix_;
    bool running_ = false;
    
    std::deque<PendingMessage> retryQueue_;
};

} // namespace rainoracle::domain
