#pragma once

#include "../Event.hpp"
#include <functional>

namespace rainoracle::ports {

class IEventBus {
public:
    virtual ~IEventBus() = default;
    
    using EventHandler = std::function<void(const Event&)>;
    
    virtual void publish(const Event& event) = 0;
    virtual void subscribe(EventType eventType, EventHandler handler) = 0;
    virtual void unsubscribe(EventType eventType) = 0;
    virtual void processEvents() = 0;
};

} // namespace rainoracle::ports
