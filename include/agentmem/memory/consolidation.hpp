/*
 * agentmem - Consolidation
 * 
 * Explicit maintenance pass: episodic expiry, working -> episodic
 * promotion and semantic merging. Promotion and expiry run under the
 * engine lock; merge planning (which embeds) runs on a snapshot outside
 * it and is applied afterwards only to items that did not change.
 */
#ifndef AGENTMEM_MEMORY_CONSOLIDATION_HPP
#define AGENTMEM_MEMORY_CONSOLIDATION_HPP

#include "types.hpp"
#include "policies.hpp"
#include "store.hpp"
#include "embedder.hpp"
#include <string>
#include <vector>

namespace agentmem {

struct MergeRecord {
    std::string merged_id;
    std::string first_id;
    std::string second_id;
    std::string category;
    double score;
    
    MergeRecord() : score(0.0) {}
};

struct ConsolidationReport {
    std::vector<std::string> promoted;  // ids, unchanged by promotion
    std::vector<std::string> expired;
    std::vector<MergeRecord> merged;
    bool degraded;                      // merge scoring fell back to lexical
    std::string diagnostic;
    
    ConsolidationReport() : degraded(false) {}
};

struct MergeCandidate {
    MemoryItem first;
    MemoryItem second;
    double score;
    
    MergeCandidate() : score(0.0) {}
};

struct MergePlan {
    std::vector<MergeCandidate> pairs;  // disjoint, best score first
    bool degraded;
    std::string diagnostic;
    
    MergePlan() : degraded(false) {}
};

class Consolidator {
public:
    Consolidator(const TierPolicies& policies, Embedder& embedder, double lexical_weight);
    
    // Removes episodic items past retention; returns them
    std::vector<MemoryItem> expire(MemoryStore& store, int64_t now_ms) const;
    
    // Rewrites every promotable working item into episodic memory in
    // place; returns the promoted items in their new form
    std::vector<MemoryItem> promote(MemoryStore& store, int64_t now_ms) const;
    
    // Scores same-category pairs of `semantic` and picks disjoint pairs
    // above the cutoff. Empty category merges within every category.
    MergePlan plan_merges(const std::vector<MemoryItem>& semantic,
                          const std::string& category) const;
    
    // Replaces each planned pair whose members are still stored unchanged
    // with its merged item. Returns what was applied.
    std::vector<MergeRecord> apply_merges(MemoryStore& store, const MergePlan& plan) const;
    
    // Union of two facts: new identity, containing or joined content,
    // de-duplicated relations, max confidence
    static MemoryItem merge_items(const MemoryItem& a, const MemoryItem& b);
    
    double lexical_weight() const { return lexical_weight_; }

private:
    const TierPolicies& policies_;
    Embedder& embedder_;
    double lexical_weight_;
};

} // namespace agentmem

#endif // AGENTMEM_MEMORY_CONSOLIDATION_HPP
