/*
 * agentmem - Tier Policies
 * 
 * Decay, reinforcement, promotion, retention and eviction rules.
 * Every rule is self-healing: values are clamped, nothing here fails.
 */
#ifndef AGENTMEM_MEMORY_POLICIES_HPP
#define AGENTMEM_MEMORY_POLICIES_HPP

#include "types.hpp"
#include <cstdint>

namespace agentmem {

class TierPolicies {
public:
    explicit TierPolicies(const EngineConfig& config);
    
    // Bring caller-supplied fields into their ranges and de-duplicate sets
    static void sanitize(MemoryItem& item);
    
    // attention * (1 - decay)^ticks, clamped to [0,1]
    static double decayed_attention(double attention, double decay, int ticks);
    
    // One decay pass over a working item; other tiers are untouched
    void apply_decay(MemoryItem& item, int ticks) const;
    
    // Bumps metadata.reinforcementCount; working items also gain attention
    void reinforce(MemoryItem& item) const;
    
    bool is_promotable(const MemoryItem& item) const;
    
    // Rewrite a working item into an episodic one, keeping id and timestamp
    void promote(MemoryItem& item, int64_t now_ms) const;
    
    bool is_expired(const MemoryItem& item, int64_t now_ms) const;
    
    // Working eviction order: lower attention first, then older, then
    // earlier insertion
    static bool evicts_before(const MemoryItem& a, uint64_t seq_a,
                              const MemoryItem& b, uint64_t seq_b);
    
    // Running averages for success rate and duration
    static void record_execution(MemoryItem& item, bool success, double duration_ms);
    
    int capacity(MemoryTier tier) const;
    double merge_cutoff() const { return merge_cutoff_; }
    
private:
    int working_limit_;
    int promotion_threshold_;
    double reinforcement_boost_;
    int64_t retention_ms_;
    double merge_cutoff_;
};

} // namespace agentmem

#endif // AGENTMEM_MEMORY_POLICIES_HPP
