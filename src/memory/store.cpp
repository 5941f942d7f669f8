/*
 * agentmem - Tiered Memory Store Implementation
 */
#include <agentmem/memory/store.hpp>
#include <agentmem/core/utils.hpp>
#include <agentmem/core/logger.hpp>

namespace agentmem {

MemoryStore::MemoryStore(const TierPolicies& policies, const Clock& clock)
    : policies_(policies)
    , clock_(clock ? clock : system_clock())
    , next_seq_(1)
    , last_timestamp_(0)
{
}

int64_t MemoryStore::now() {
    int64_t t = clock_();
    if (t < last_timestamp_) t = last_timestamp_;
    last_timestamp_ = t;
    return t;
}

void MemoryStore::observe_timestamp(int64_t ts) {
    if (ts > last_timestamp_) last_timestamp_ = ts;
}

std::string MemoryStore::unique_id() {
    std::string id = generate_uuid();
    while (items_.count(id)) {
        id = generate_uuid();
    }
    return id;
}

std::string MemoryStore::store(const MemoryItem& item, std::vector<MemoryItem>* evicted) {
    Entry entry;
    entry.item = item;
    TierPolicies::sanitize(entry.item);
    
    if (entry.item.id.empty()) {
        entry.item.id = unique_id();
    }
    
    // Re-storing a known id replaces its content in place; identity stays
    std::unordered_map<std::string, Entry>::iterator existing = items_.find(entry.item.id);
    if (existing != items_.end()) {
        const MemoryItem& prev = existing->second.item;
        if (prev.tier != entry.item.tier) {
            LOG_WARN("MemoryStore: %s stays %s, ignoring re-store as %s", prev.id.c_str(),
                     memory_tier_to_string(prev.tier).c_str(),
                     memory_tier_to_string(entry.item.tier).c_str());
            entry.item.tier = prev.tier;
        }
        entry.item.timestamp = prev.timestamp;
        order_[prev.tier].erase(existing->second.seq);
        items_.erase(existing);
    } else if (entry.item.timestamp <= 0) {
        entry.item.timestamp = now();
    } else {
        observe_timestamp(entry.item.timestamp);
    }
    
    entry.seq = next_seq_++;
    std::string id = entry.item.id;
    MemoryTier tier = entry.item.tier;
    order_[tier][entry.seq] = id;
    items_[id] = entry;
    
    enforce_capacity(tier, evicted);
    return id;
}

void MemoryStore::enforce_capacity(MemoryTier tier, std::vector<MemoryItem>* evicted) {
    int limit = policies_.capacity(tier);
    if (limit <= 0) return;
    
    std::map<uint64_t, std::string>& ids = order_[tier];
    while (ids.size() > static_cast<size_t>(limit)) {
        const Entry* victim = nullptr;
        for (std::map<uint64_t, std::string>::const_iterator it = ids.begin(); it != ids.end(); ++it) {
            const Entry& e = items_[it->second];
            if (!victim || TierPolicies::evicts_before(e.item, e.seq, victim->item, victim->seq)) {
                victim = &e;
            }
        }
        if (!victim) break;
        
        LOG_DEBUG("MemoryStore: evicting %s item %s (attention %.3f)",
                  memory_tier_to_string(tier).c_str(), victim->item.id.c_str(),
                  victim->item.working.attention);
        if (evicted) evicted->push_back(victim->item);
        std::string victim_id = victim->item.id;
        ids.erase(victim->seq);
        items_.erase(victim_id);
    }
}

bool MemoryStore::retrieve(const std::string& id, MemoryItem& out) const {
    const MemoryItem* item = find(id);
    if (!item) return false;
    out = *item;
    return true;
}

MemoryItem* MemoryStore::find(const std::string& id) {
    std::unordered_map<std::string, Entry>::iterator it = items_.find(id);
    return it == items_.end() ? nullptr : &it->second.item;
}

const MemoryItem* MemoryStore::find(const std::string& id) const {
    std::unordered_map<std::string, Entry>::const_iterator it = items_.find(id);
    return it == items_.end() ? nullptr : &it->second.item;
}

MemoryItem* MemoryStore::find_skill(const std::string& skill_name) {
    std::string wanted = to_lower(skill_name);
    std::map<uint64_t, std::string>& ids = order_[MemoryTier::PROCEDURAL];
    for (std::map<uint64_t, std::string>::const_iterator it = ids.begin(); it != ids.end(); ++it) {
        MemoryItem* item = find(it->second);
        if (item && to_lower(item->procedural.skill_name) == wanted) {
            return item;
        }
    }
    return nullptr;
}

bool MemoryStore::contains(const std::string& id) const {
    return items_.count(id) > 0;
}

std::vector<MemoryItem> MemoryStore::get_all_by_tier(MemoryTier tier) const {
    std::vector<MemoryItem> out;
    std::map<MemoryTier, std::map<uint64_t, std::string> >::const_iterator t = order_.find(tier);
    if (t == order_.end()) return out;
    out.reserve(t->second.size());
    for (std::map<uint64_t, std::string>::const_iterator it = t->second.begin(); it != t->second.end(); ++it) {
        const MemoryItem* item = find(it->second);
        if (item) out.push_back(*item);
    }
    return out;
}

std::vector<MemoryItem> MemoryStore::get_all() const {
    std::vector<MemoryItem> out;
    const std::vector<MemoryTier>& tiers = all_memory_tiers();
    for (size_t i = 0; i < tiers.size(); ++i) {
        std::vector<MemoryItem> part = get_all_by_tier(tiers[i]);
        out.insert(out.end(), part.begin(), part.end());
    }
    return out;
}

bool MemoryStore::remove(const std::string& id) {
    std::unordered_map<std::string, Entry>::iterator it = items_.find(id);
    if (it == items_.end()) return false;
    order_[it->second.item.tier].erase(it->second.seq);
    items_.erase(it);
    return true;
}

void MemoryStore::retier(const std::string& id, MemoryTier from) {
    std::unordered_map<std::string, Entry>::iterator it = items_.find(id);
    if (it == items_.end()) return;
    order_[from].erase(it->second.seq);
    order_[it->second.item.tier][it->second.seq] = id;
}

void MemoryStore::clear() {
    items_.clear();
    order_.clear();
}

size_t MemoryStore::count(MemoryTier tier) const {
    std::map<MemoryTier, std::map<uint64_t, std::string> >::const_iterator t = order_.find(tier);
    return t == order_.end() ? 0 : t->second.size();
}

size_t MemoryStore::size() const {
    return items_.size();
}

} // namespace agentmem
