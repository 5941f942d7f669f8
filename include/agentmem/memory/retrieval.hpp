/*
 * agentmem - Retrieval Engine
 * 
 * Exact filters, tier search and similarity search over tier snapshots.
 * Works on copies handed over by the engine, so embedding calls made here
 * never run under the engine lock.
 */
#ifndef AGENTMEM_MEMORY_RETRIEVAL_HPP
#define AGENTMEM_MEMORY_RETRIEVAL_HPP

#include "types.hpp"
#include "embedder.hpp"
#include <string>
#include <vector>

namespace agentmem {

enum class SortKey {
    IMPORTANCE,
    ATTENTION,
    DECAY,
    CONFIDENCE,
    EMOTIONAL_VALENCE,
    SUCCESS_RATE,
    EXECUTION_COUNT,
    AVERAGE_EXECUTION_TIME,
    TIMESTAMP
};

std::string sort_key_to_string(SortKey key);
// Accepts camelCase and snake_case names ("successRate", "success_rate")
bool string_to_sort_key(const std::string& s, SortKey& out);

// Value of key for item; 0 when the key does not apply to the item's tier
double sort_value(const MemoryItem& item, SortKey key);

struct ScoredMemory {
    MemoryItem item;
    double score;
    
    ScoredMemory() : score(0.0) {}
    ScoredMemory(const MemoryItem& m, double s) : item(m), score(s) {}
};

struct SearchResults {
    std::vector<ScoredMemory> items;
    bool degraded;              // lexical fallback was used
    std::string diagnostic;     // why, when degraded
    size_t total_searched;
    
    SearchResults() : degraded(false), total_searched(0) {}
    
    std::vector<MemoryItem> memories() const;
};

class RetrievalEngine {
public:
    explicit RetrievalEngine(Embedder& embedder);
    
    static std::vector<MemoryItem> filter_by_participant(const std::vector<MemoryItem>& items,
                                                         const std::string& participant);
    static std::vector<MemoryItem> filter_by_category(const std::vector<MemoryItem>& items,
                                                      const std::string& category);
    static std::vector<MemoryItem> filter_by_prerequisite(const std::vector<MemoryItem>& items,
                                                          const std::string& skill_name);
    
    // Empty query: top `limit` by key. Otherwise only items whose content
    // or tags contain the query (case-insensitive). Ties: newest first.
    static std::vector<MemoryItem> search_tier(const std::vector<MemoryItem>& items,
                                               const std::string& query,
                                               int limit, SortKey key);
    
    // Token-overlap ranking; items sharing no token with the query drop out
    static SearchResults lexical_search(const std::vector<MemoryItem>& items,
                                        const std::string& query, int limit);
    
    // Cosine ranking over (cached) embeddings of item content. Falls back to
    // lexical_search, flagged degraded, when any embedding is unavailable.
    SearchResults semantic_search(const std::vector<MemoryItem>& items,
                                  const std::string& query, int limit);
    
    // Content followed by tags, space separated
    static std::string searchable_text(const MemoryItem& item);

private:
    Embedder& embedder_;
    
    static void sort_scored(std::vector<ScoredMemory>& scored);
};

} // namespace agentmem

#endif // AGENTMEM_MEMORY_RETRIEVAL_HPP
