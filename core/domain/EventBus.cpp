#include "EventBus.hpp"
#include "../Log.hpp"
#include <exception>

namespace rainoracle::domain {

void EventBus::publish(const Event& event) {
    std::lock_guard<std::mutex> lock(queueMutex_);
    eventQueue_.push(event);
}

void EventBus::subscribe(EventType eventType, EventHandler handler) {
    std::lock_guard<std::mutex> lock(handlersMutex_);
    handlers_[eventType].push_back(std::move(handler));
}

void EventBus::unsubscribe(EventType eventType) {
    std::lock_guard<std::mutex> lock(handlersMutex_);
    handlers_.erase(eventType);
}

std::size_t EventBus::pendingCount() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return eventQueue_.size();
}

void EventBus::processEvents() {
    if (processing_) return; // Prevent recursive processing
    
    processing_ = true;
    
    while (true) {
        Event event;
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (eventQueue_.empty()) break;
            
            event = std::move(eventQueue_.front());
            eventQueue_.pop();
        }
        
        std::vector<EventHandler> handlers;
        {
            std::lock_guard<std::mutex> lock(handlersMutex_);
            auto it = handlers_.find(event.eventType);
            if (it != handlers_.end()) {
                handlers = it->second;
            }
        }
        
        for (const auto& handler : handlers) {
            try {
                handler(event);
            } catch (const std::exception& e) {
                // One failing subscriber must not starve the others
                LogLine("EventBus", LogLine::Error) << "Handler for " << eventTypeToString(event.eventType)
                                                    << " failed: " << e.what();
            }
        }
    }
    
    processing_ = false;
}

} // namespace rainoracle::domain
