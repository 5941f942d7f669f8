/*
 * agentmem - Memory Events Implementation
 */
#include <agentmem/memory/events.hpp>
#include <agentmem/core/logger.hpp>

namespace agentmem {

const char* memory_event_type_str(MemoryEventType type) {
    switch (type) {
        case MemoryEventType::STORED: return "stored";
        case MemoryEventType::EVICTED: return "evicted";
        case MemoryEventType::REINFORCED: return "reinforced";
        case MemoryEventType::PROMOTED: return "promoted";
        case MemoryEventType::MERGED: return "merged";
        case MemoryEventType::EXPIRED: return "expired";
        case MemoryEventType::EXECUTION_RECORDED: return "execution_recorded";
        case MemoryEventType::CLEARED: return "cleared";
        case MemoryEventType::DEGRADED: return "degraded";
    }
    return "unknown";
}

EventDispatcher::EventDispatcher() : next_id_(1) {}

int EventDispatcher::add_listener(const MemoryEventListener& listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    int id = next_id_++;
    listeners_[id] = listener;
    return id;
}

bool EventDispatcher::remove_listener(int listener_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.erase(listener_id) > 0;
}

size_t EventDispatcher::listener_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.size();
}

void EventDispatcher::dispatch(const std::vector<MemoryEvent>& events) const {
    if (events.empty()) return;
    
    // Listeners may add or remove listeners; work on a copy
    std::map<int, MemoryEventListener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners = listeners_;
    }
    
    for (size_t i = 0; i < events.size(); ++i) {
        for (std::map<int, MemoryEventListener>::const_iterator it = listeners.begin();
             it != listeners.end(); ++it) {
            if (!it->second) continue;
            try {
                it->second(events[i]);
            } catch (const std::exception& e) {
                LOG_WARN("Memory event listener %d failed on '%s': %s",
                         it->first, memory_event_type_str(events[i].type), e.what());
            }
        }
    }
}

} // namespace agentmem
