/*
 * agentmem - Tiered Memory Store
 * 
 * Tier-partitioned keyed collection. Lookups by id are O(1); each tier
 * keeps insertion order. Not synchronised: the owning engine serialises
 * access.
 */
#ifndef AGENTMEM_MEMORY_STORE_HPP
#define AGENTMEM_MEMORY_STORE_HPP

#include "types.hpp"
#include "policies.hpp"
#include <string>
#include <vector>
#include <map>
#include <unordered_map>

namespace agentmem {

class MemoryStore {
public:
    MemoryStore(const TierPolicies& policies, const Clock& clock);
    
    // Assigns id/timestamp when absent, inserts, then enforces the tier's
    // capacity. Items evicted to make room are appended to `evicted` (the
    // new item itself may be among them). A known id keeps its timestamp
    // and tier.
    std::string store(const MemoryItem& item, std::vector<MemoryItem>* evicted = nullptr);
    
    bool retrieve(const std::string& id, MemoryItem& out) const;
    
    // In-place access for policy mutations; nullptr when unknown
    MemoryItem* find(const std::string& id);
    const MemoryItem* find(const std::string& id) const;
    
    // Case-insensitive skill name lookup; nullptr when unknown
    MemoryItem* find_skill(const std::string& skill_name);
    
    bool contains(const std::string& id) const;
    
    // Snapshot in insertion order
    std::vector<MemoryItem> get_all_by_tier(MemoryTier tier) const;
    std::vector<MemoryItem> get_all() const;
    
    bool remove(const std::string& id);
    
    // Move an item to another tier after its tier field was rewritten
    void retier(const std::string& id, MemoryTier from);
    
    void clear();
    
    size_t count(MemoryTier tier) const;
    size_t size() const;
    
    // Current instant: max(clock(), newest timestamp handed out)
    int64_t now();
    
    // Raise the timestamp floor (used after loading a snapshot)
    void observe_timestamp(int64_t ts);

private:
    struct Entry {
        MemoryItem item;
        uint64_t seq;
    };
    
    const TierPolicies& policies_;
    Clock clock_;
    std::unordered_map<std::string, Entry> items_;
    std::map<MemoryTier, std::map<uint64_t, std::string> > order_;
    uint64_t next_seq_;
    int64_t last_timestamp_;
    
    void enforce_capacity(MemoryTier tier, std::vector<MemoryItem>* evicted);
    std::string unique_id();
};

} // namespace agentmem

#endif // AGENTMEM_MEMORY_STORE_HPP
