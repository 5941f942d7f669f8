/*
 * agentmem - Memory Events
 * 
 * Notifications for an observability collaborator. Delivery happens after
 * the engine releases its lock; a failing listener never fails the call
 * that produced the event.
 */
#ifndef AGENTMEM_MEMORY_EVENTS_HPP
#define AGENTMEM_MEMORY_EVENTS_HPP

#include "types.hpp"
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <functional>

namespace agentmem {

enum class MemoryEventType {
    STORED,
    EVICTED,
    REINFORCED,
    PROMOTED,
    MERGED,
    EXPIRED,
    EXECUTION_RECORDED,
    CLEARED,
    DEGRADED
};

const char* memory_event_type_str(MemoryEventType type);

struct MemoryEvent {
    MemoryEventType type;
    std::string item_id;
    MemoryTier tier;
    std::vector<std::string> related_ids;   // merge inputs, etc.
    std::string detail;
    int64_t timestamp;
    
    MemoryEvent() : type(MemoryEventType::STORED), tier(MemoryTier::WORKING), timestamp(0) {}
    MemoryEvent(MemoryEventType t, const std::string& id, MemoryTier tr, int64_t ts)
        : type(t), item_id(id), tier(tr), timestamp(ts) {}
};

typedef std::function<void(const MemoryEvent&)> MemoryEventListener;

class EventDispatcher {
public:
    EventDispatcher();
    
    int add_listener(const MemoryEventListener& listener);
    bool remove_listener(int listener_id);
    size_t listener_count() const;
    
    // Calls every listener for each event, in order
    void dispatch(const std::vector<MemoryEvent>& events) const;

private:
    std::map<int, MemoryEventListener> listeners_;
    int next_id_;
    mutable std::mutex mutex_;
};

} // namespace agentmem

#endif // AGENTMEM_MEMORY_EVENTS_HPP
