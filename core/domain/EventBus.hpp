#pragma once

#include "../ports/IEventBus.hpp"
#include <unordered_map>
#include <vector>
#include <queue>
#include <mutex>

namespace rainoracle::domain {

/**
 * publish() may be called from any worker thread; handlers run on the thread
 * that calls processEvents().
 */
class EventBus : public ports::IEventBus {
public:
    EventBus() = default;
    ~EventBus() override = default;

    void publish(const Event& event) override;
    void subscribe(EventType eventType, EventHandler handler) override;
    void unsubscribe(EventType eventType) override;
    void processEvents() override;
    
    std::size_t pendingCount() const;

private:
    std::unordered_map<EventType, std::vector<EventHandler>> handlers_;
    std::queue<Event> eventQueue_;
    mutable std::mutex queueMutex_;
    std::mutex handlersMutex_;
    bool processing_ = false;
};

} // namespace rainoracle::domain
