#include "MqttPolicyEventSource.hpp"
#include "../JsonCodec.hpp"
#include "../Log.hpp"
#include <nlohmann/json.hpp>

namespace rainoracle::adapters {

MqttPolicyEventSource::MqttPolicyEventSource(std::shared_ptr<ports::ITransport> transport,
                                             std::shared_ptr<domain::PolicyRegistry> registry,
                                             std::string topicPrefix)
    : transport_(std::move(transport)),
      registry_(std::move(registry)),
      topicPrefix_(std::move(topicPrefix)) {
}

void MqttPolicyEventSource::start() {
    transport_->setMessageHandler([this](std::string_view topic, std::string_view payload) {
        onMessage(topic, payload);
    });
    
    if (!transport_->subscribe(topicFilter(), 1)) {
        LogLine("Events", LogLine::Warn) << "Subscribe to " << topicFilter()
                                         << " failed; relying on periodic reconciliation";
    } else {
        LogLine("Events") << "Listening for policy events on " << topicFilter();
    }
}

void MqttPolicyEventSource::onMessage(std::string_view topic, std::string_view payload) {
    auto event = decode(payload);
    if (!event) {
        LogLine("Events", LogLine::Warn) << "Ignoring malformed event on " << topic;
        return;
    }
    
    std::lock_guard<std::mutex> lock(queueMutex_);
    queue_.push_back(std::move(*event));
}

std::size_t MqttPolicyEventSource::applyPending() {
    std::vector<domain::PolicyEvent> events;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        events.swap(queue_);
    }
    
    for (const auto& event : events) {
        registry_->applyEvent(event);
    }
    return events.size();
}

std::optional<domain::PolicyEvent> MqttPolicyEventSource::decode(std::string_view payload) {
    try {
        const auto json = nlohmann::json::parse(payload.begin(), payload.end());
        const std::string name = json.at("event").get<std::string>();
        
        domain::PolicyEvent event;
        if (name == "PolicyCreated") {
            event.type = domain::PolicyEvent::Type::Created;
            event.policy = JsonCodec::jsonToPolicy(json.at("policy"));
            event.policyId = event.policy->policyId;
        } else if (name == "PolicyStatusChanged") {
            event.type = domain::PolicyEvent::Type::StatusChanged;
            event.policyId = json.at("policyId").is_string() ? json["policyId"].get<std::string>()
                                                             : json["policyId"].dump();
            event.status = stringToPolicyStatus(json.at("status").get<std::string>());
        } else if (name == "PolicySettled") {
            event.type = domain::PolicyEvent::Type::Settled;
            event.policyId = json.at("policyId").is_string() ? json["policyId"].get<std::string>()
                                                             : json["policyId"].dump();
        } else {
            return std::nullopt;
        }
        
        if (event.policyId.empty()) {
            return std::nullopt;
        }
        return event;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
}

} // namespace rainoracle::adapters
