/*
 * agentmem - Consolidation Implementation
 */
#include <agentmem/memory/consolidation.hpp>
#include <agentmem/memory/serialization.hpp>
#include <agentmem/core/utils.hpp>
#include <agentmem/core/logger.hpp>
#include <algorithm>
#include <map>
#include <set>

namespace agentmem {

namespace {

struct ScoredPair {
    size_t a;
    size_t b;
    double score;
};

bool higher_score(const ScoredPair& x, const ScoredPair& y) {
    if (x.score != y.score) return x.score > y.score;
    if (x.a != y.a) return x.a < y.a;
    return x.b < y.b;
}

bool same_state(const MemoryItem& a, const MemoryItem& b) {
    return memory_item_to_json(a) == memory_item_to_json(b);
}

} // namespace

Consolidator::Consolidator(const TierPolicies& policies, Embedder& embedder, double lexical_weight)
    : policies_(policies)
    , embedder_(embedder)
    , lexical_weight_(clamp_unit(lexical_weight))
{
}

std::vector<MemoryItem> Consolidator::expire(MemoryStore& store, int64_t now_ms) const {
    std::vector<MemoryItem> expired;
    std::vector<MemoryItem> episodic = store.get_all_by_tier(MemoryTier::EPISODIC);
    for (size_t i = 0; i < episodic.size(); ++i) {
        if (policies_.is_expired(episodic[i], now_ms) && store.remove(episodic[i].id)) {
            LOG_DEBUG("Consolidation: expired episodic item %s", episodic[i].id.c_str());
            expired.push_back(episodic[i]);
        }
    }
    return expired;
}

std::vector<MemoryItem> Consolidator::promote(MemoryStore& store, int64_t now_ms) const {
    std::vector<MemoryItem> promoted;
    std::vector<MemoryItem> working = store.get_all_by_tier(MemoryTier::WORKING);
    for (size_t i = 0; i < working.size(); ++i) {
        if (!policies_.is_promotable(working[i])) continue;
        
        MemoryItem* item = store.find(working[i].id);
        if (!item) continue;
        
        policies_.promote(*item, now_ms);
        store.retier(item->id, MemoryTier::WORKING);
        LOG_DEBUG("Consolidation: promoted %s to episodic (importance %.3f)",
                  item->id.c_str(), item->episodic.importance);
        promoted.push_back(*item);
    }
    return promoted;
}

MergePlan Consolidator::plan_merges(const std::vector<MemoryItem>& semantic,
                                    const std::string& category) const {
    MergePlan plan;
    
    std::vector<MemoryItem> pool;
    for (size_t i = 0; i < semantic.size(); ++i) {
        if (semantic[i].tier != MemoryTier::SEMANTIC) continue;
        if (!category.empty() && semantic[i].semantic.category != category) continue;
        pool.push_back(semantic[i]);
    }
    if (pool.size() < 2) return plan;
    
    std::vector<std::set<std::string> > tokens(pool.size());
    for (size_t i = 0; i < pool.size(); ++i) {
        tokens[i] = token_set(pool[i].content);
    }
    
    // Embeddings are all-or-nothing so every pair is scored the same way
    std::vector<std::vector<float> > vectors;
    if (!embedder_.available()) {
        plan.degraded = true;
        plan.diagnostic = "no embedding provider configured";
    } else {
        vectors.reserve(pool.size());
        for (size_t i = 0; i < pool.size(); ++i) {
            EmbeddingResult r = embedder_.embed(pool[i].content);
            if (!r.success) {
                plan.degraded = true;
                plan.diagnostic = r.error;
                vectors.clear();
                break;
            }
            vectors.push_back(r.vector);
        }
    }
    
    double cutoff = policies_.merge_cutoff();
    std::vector<ScoredPair> scored;
    for (size_t i = 0; i < pool.size(); ++i) {
        for (size_t j = i + 1; j < pool.size(); ++j) {
            if (pool[i].semantic.category != pool[j].semantic.category) continue;
            
            double score = jaccard(tokens[i], tokens[j]);
            if (!plan.degraded) {
                score = lexical_weight_ * score +
                        (1.0 - lexical_weight_) * cosine_similarity(vectors[i], vectors[j]);
            }
            if (score > cutoff) {
                ScoredPair p;
                p.a = i;
                p.b = j;
                p.score = score;
                scored.push_back(p);
            }
        }
    }
    
    std::sort(scored.begin(), scored.end(), higher_score);
    std::vector<bool> used(pool.size(), false);
    for (size_t k = 0; k < scored.size(); ++k) {
        if (used[scored[k].a] || used[scored[k].b]) continue;
        used[scored[k].a] = true;
        used[scored[k].b] = true;
        
        MergeCandidate c;
        c.first = pool[scored[k].a];
        c.second = pool[scored[k].b];
        c.score = scored[k].score;
        plan.pairs.push_back(c);
    }
    return plan;
}

std::vector<MergeRecord> Consolidator::apply_merges(MemoryStore& store, const MergePlan& plan) const {
    std::vector<MergeRecord> applied;
    for (size_t i = 0; i < plan.pairs.size(); ++i) {
        const MergeCandidate& c = plan.pairs[i];
        const MemoryItem* first = store.find(c.first.id);
        const MemoryItem* second = store.find(c.second.id);
        if (!first || !second || !same_state(*first, c.first) || !same_state(*second, c.second)) {
            LOG_DEBUG("Consolidation: skipping merge of %s and %s, changed since planning",
                      c.first.id.c_str(), c.second.id.c_str());
            continue;
        }
        
        MemoryItem merged = merge_items(c.first, c.second);
        store.remove(c.first.id);
        store.remove(c.second.id);
        
        MergeRecord record;
        record.merged_id = store.store(merged);
        record.first_id = c.first.id;
        record.second_id = c.second.id;
        record.category = merged.semantic.category;
        record.score = c.score;
        LOG_DEBUG("Consolidation: merged %s + %s -> %s (score %.3f)",
                  record.first_id.c_str(), record.second_id.c_str(),
                  record.merged_id.c_str(), record.score);
        applied.push_back(record);
    }
    return applied;
}

MemoryItem Consolidator::merge_items(const MemoryItem& a, const MemoryItem& b) {
    MemoryItem merged;
    merged.tier = MemoryTier::SEMANTIC;
    merged.source = a.source.empty() ? b.source : a.source;
    
    if (contains_ci(a.content, b.content)) {
        merged.content = a.content;
    } else if (contains_ci(b.content, a.content)) {
        merged.content = b.content;
    } else {
        merged.content = a.content + "; " + b.content;
    }
    
    merged.semantic.category = a.semantic.category;
    merged.semantic.confidence = std::max(a.semantic.confidence, b.semantic.confidence);
    merged.semantic.relations = a.semantic.relations;
    for (size_t i = 0; i < b.semantic.relations.size(); ++i) {
        const Relation& r = b.semantic.relations[i];
        if (std::find(merged.semantic.relations.begin(), merged.semantic.relations.end(), r) ==
            merged.semantic.relations.end()) {
            merged.semantic.relations.push_back(r);
        }
    }
    
    // a's metadata wins on conflicting keys
    merged.metadata = b.metadata.is_object() ? b.metadata : Json::object();
    if (a.metadata.is_object()) {
        const std::map<std::string, Json>& am = a.metadata.as_object();
        for (std::map<std::string, Json>::const_iterator it = am.begin(); it != am.end(); ++it) {
            merged.metadata.set(it->first, it->second);
        }
    }
    merged.metadata.set(META_REINFORCEMENT_COUNT,
                        Json(a.reinforcement_count() + b.reinforcement_count()));
    std::vector<std::string> from;
    from.push_back(a.id);
    from.push_back(b.id);
    merged.metadata.set(META_MERGED_FROM, Json::from_strings(from));
    return merged;
}

} // namespace agentmem
