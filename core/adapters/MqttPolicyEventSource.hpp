#pragma once

#include "../domain/PolicyRegistry.hpp"
#include "../ports/ITransport.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rainoracle::adapters {

/**
 * @brief Policy lifecycle events from the MQTT chain-event bridge
 *
 * Subscribes to "{prefix}/events/#". Messages arrive on the MQTT thread and are
 * queued; applyPending() hands them to the registry from the scheduler thread.
 *
 * Payloads:
 *   {"event":"PolicyCreated","policy":{...}}
 *   {"event":"PolicyStatusChanged","policyId":"7","status":"triggered"}
 *   {"event":"PolicySettled","policyId":"7"}
 */
class MqttPolicyEventSource {
public:
    MqttPolicyEventSource(std::shared_ptr<ports::ITransport> transport,
                          std::shared_ptr<domain::PolicyRegistry> registry,
                          std::string topicPrefix);
    
    void start();
    
    /// Applies queued events to the registry; returns how many were applied.
    std::size_t applyPending();
    
    /// Returns nullopt for payloads that are not well-formed policy events.
    static std::optional<domain::PolicyEvent> decode(std::string_view payload);
    
    std::string topicFilter() const { return topicPrefix_ + "/events/#"; }

private:
    void onMessage(std::string_view topic, std::string_view payload);
    
    std::shared_ptr<ports::ITransport> transport_;
    std::shared_ptr<domain::PolicyRegistry> registry_;
    std::string topicPrefix_;
    
    std::mutex queueMutex_;
    std::vector<domain::PolicyEvent> queue_;
};

} // namespace rainoracle::adapters
