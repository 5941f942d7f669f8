/*
 * agentmem - Memory Engine
 * 
 * Per-agent facade over the tiered store. One mutex serialises every
 * access to tier state; embedding calls run on snapshots outside it and
 * their results are applied afterwards in a short critical section.
 * Listeners are called after the lock is released.
 */
#ifndef AGENTMEM_MEMORY_ENGINE_HPP
#define AGENTMEM_MEMORY_ENGINE_HPP

#include "types.hpp"
#include "policies.hpp"
#include "store.hpp"
#include "embedding.hpp"
#include "embedder.hpp"
#include "retrieval.hpp"
#include "consolidation.hpp"
#include "context.hpp"
#include "events.hpp"
#include "persistence.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace agentmem {

struct MemoryStats {
    size_t working;
    size_t episodic;
    size_t semantic;
    size_t procedural;
    uint64_t total_stored;
    uint64_t evictions;
    uint64_t promotions;
    uint64_t merges;
    uint64_t expirations;
    uint64_t degraded_searches;
    uint64_t cache_hits;
    uint64_t cache_misses;
    
    MemoryStats()
        : working(0), episodic(0), semantic(0), procedural(0)
        , total_stored(0), evictions(0), promotions(0), merges(0)
        , expirations(0), degraded_searches(0), cache_hits(0), cache_misses(0) {}
    
    size_t total() const { return working + episodic + semantic + procedural; }
};

class MemoryEngine {
public:
    // Throws InvalidConfigurationError when config does not validate.
    // A null provider disables similarity: searches and merges run lexically.
    explicit MemoryEngine(const EngineConfig& config = EngineConfig(),
                          const std::shared_ptr<EmbeddingProvider>& provider = std::shared_ptr<EmbeddingProvider>(),
                          const Clock& clock = Clock());
    
    // ---- Store ----
    
    // Returns the id of the stored item. A procedural item whose skill name
    // is already known updates that skill and returns its id.
    std::string store(const MemoryItem& item);
    bool retrieve(const std::string& id, MemoryItem& out) const;
    std::vector<MemoryItem> get_all_by_tier(MemoryTier tier) const;
    bool get_skill(const std::string& skill_name, MemoryItem& out) const;
    void clear();
    size_t size() const;
    
    // ---- Tier policies ----
    
    // Decays every working item n times; returns how many were touched
    int tick(int n = 1);
    OpResult reinforce(const std::string& id);
    OpResult record_execution(const std::string& id, bool success, double duration_ms);
    
    // ---- Consolidation ----
    
    ConsolidationReport consolidate();
    // Empty category merges within every category
    int merge_related_semantics(const std::string& category);
    
    // ---- Retrieval ----
    
    std::vector<MemoryItem> query_by_participant(const std::string& participant) const;
    std::vector<MemoryItem> query_by_category(const std::string& category) const;
    std::vector<MemoryItem> query_by_prerequisite(const std::string& skill_name) const;
    std::vector<MemoryItem> search_by_tier(MemoryTier tier, const std::string& query, int limit,
                                           SortKey key = SortKey::TIMESTAMP) const;
    SearchResults semantic_search(const std::string& query, MemoryTier tier, int limit);
    
    // ---- Context ----
    
    AssembledContext assemble_context(const std::string& query);
    std::string format_context_for_prompt(const AssembledContext& context) const;
    std::vector<MemoryItem> available_skills() const;
    
    // ---- Observability ----
    
    int add_listener(const MemoryEventListener& listener);
    bool remove_listener(int listener_id);
    MemoryStats stats() const;
    
    // ---- Snapshots ----
    
    bool save_snapshot(MemoryPersistence& persistence) const;
    // Replaces all state with the stored snapshot
    bool load_snapshot(MemoryPersistence& persistence);
    std::string export_json(int indent = 0) const;
    bool import_json(const std::string& text, std::string* error = nullptr);
    
    const EngineConfig& config() const { return config_; }
    std::string provider_name() const { return embedder_.provider_name(); }

private:
    EngineConfig config_;
    TierPolicies policies_;
    mutable std::mutex mutex_;
    MemoryStore store_;
    Embedder embedder_;
    RetrievalEngine retrieval_;
    Consolidator consolidator_;
    EventDispatcher events_;
    
    uint64_t total_stored_;
    uint64_t evictions_;
    uint64_t promotions_;
    uint64_t merges_;
    uint64_t expirations_;
    uint64_t degraded_searches_;
    
    MemoryEngine(const MemoryEngine&);
    MemoryEngine& operator=(const MemoryEngine&);
    
    static const EngineConfig& validated(const EngineConfig& config);
    
    // Callers hold mutex_
    std::string store_locked(const MemoryItem& item, std::vector<MemoryEvent>& events);
    void replace_all_locked(const std::vector<MemoryItem>& items, std::vector<MemoryEvent>& events);
    MemoryEvent make_event(MemoryEventType type, const MemoryItem& item);
    
    std::vector<MergeRecord> merge_pass(const std::string& category, MergePlan& plan,
                                        std::vector<MemoryEvent>& events);
    void note_degraded(const std::string& what, const std::string& diagnostic,
                       std::vector<MemoryEvent>& events);
};

} // namespace agentmem

#endif // AGENTMEM_MEMORY_ENGINE_HPP
