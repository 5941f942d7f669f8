/*
 * agentmem - Retrieval Engine Implementation
 */
#include <agentmem/memory/retrieval.hpp>
#include <agentmem/core/utils.hpp>
#include <agentmem/core/logger.hpp>
#include <algorithm>
#include <set>

namespace agentmem {

std::string sort_key_to_string(SortKey key) {
    switch (key) {
        case SortKey::IMPORTANCE: return "importance";
        case SortKey::ATTENTION: return "attention";
        case SortKey::DECAY: return "decay";
        case SortKey::CONFIDENCE: return "confidence";
        case SortKey::EMOTIONAL_VALENCE: return "emotionalValence";
        case SortKey::SUCCESS_RATE: return "successRate";
        case SortKey::EXECUTION_COUNT: return "executionCount";
        case SortKey::AVERAGE_EXECUTION_TIME: return "averageExecutionTime";
        case SortKey::TIMESTAMP: return "timestamp";
    }
    return "timestamp";
}

bool string_to_sort_key(const std::string& s, SortKey& out) {
    std::string k;
    std::string lowered = to_lower(trim(s));
    for (size_t i = 0; i < lowered.size(); ++i) {
        if (lowered[i] != '_') k += lowered[i];
    }
    if (k == "importance") { out = SortKey::IMPORTANCE; return true; }
    if (k == "attention") { out = SortKey::ATTENTION; return true; }
    if (k == "decay") { out = SortKey::DECAY; return true; }
    if (k == "confidence") { out = SortKey::CONFIDENCE; return true; }
    if (k == "emotionalvalence") { out = SortKey::EMOTIONAL_VALENCE; return true; }
    if (k == "successrate") { out = SortKey::SUCCESS_RATE; return true; }
    if (k == "executioncount") { out = SortKey::EXECUTION_COUNT; return true; }
    if (k == "averageexecutiontime") { out = SortKey::AVERAGE_EXECUTION_TIME; return true; }
    if (k == "timestamp") { out = SortKey::TIMESTAMP; return true; }
    return false;
}

double sort_value(const MemoryItem& item, SortKey key) {
    switch (key) {
        case SortKey::IMPORTANCE:
            return item.tier == MemoryTier::EPISODIC ? item.episodic.importance : 0.0;
        case SortKey::ATTENTION:
            return item.tier == MemoryTier::WORKING ? item.working.attention : 0.0;
        case SortKey::DECAY:
            return item.tier == MemoryTier::WORKING ? item.working.decay : 0.0;
        case SortKey::CONFIDENCE:
            return item.tier == MemoryTier::SEMANTIC ? item.semantic.confidence : 0.0;
        case SortKey::EMOTIONAL_VALENCE:
            return item.tier == MemoryTier::EPISODIC ? item.episodic.emotional_valence : 0.0;
        case SortKey::SUCCESS_RATE:
            return item.tier == MemoryTier::PROCEDURAL ? item.procedural.success_rate : 0.0;
        case SortKey::EXECUTION_COUNT:
            return item.tier == MemoryTier::PROCEDURAL
                ? static_cast<double>(item.procedural.execution_count) : 0.0;
        case SortKey::AVERAGE_EXECUTION_TIME:
            return item.tier == MemoryTier::PROCEDURAL ? item.procedural.average_execution_time : 0.0;
        case SortKey::TIMESTAMP:
            return static_cast<double>(item.timestamp);
    }
    return 0.0;
}

std::vector<MemoryItem> SearchResults::memories() const {
    std::vector<MemoryItem> out;
    out.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) out.push_back(items[i].item);
    return out;
}

RetrievalEngine::RetrievalEngine(Embedder& embedder) : embedder_(embedder) {}

std::vector<MemoryItem> RetrievalEngine::filter_by_participant(const std::vector<MemoryItem>& items,
                                                               const std::string& participant) {
    std::vector<MemoryItem> out;
    for (size_t i = 0; i < items.size(); ++i) {
        const std::vector<std::string>& p = items[i].episodic.participants;
        if (items[i].tier == MemoryTier::EPISODIC &&
            std::find(p.begin(), p.end(), participant) != p.end()) {
            out.push_back(items[i]);
        }
    }
    return out;
}

std::vector<MemoryItem> RetrievalEngine::filter_by_category(const std::vector<MemoryItem>& items,
                                                            const std::string& category) {
    std::vector<MemoryItem> out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (items[i].tier == MemoryTier::SEMANTIC && items[i].semantic.category == category) {
            out.push_back(items[i]);
        }
    }
    return out;
}

std::vector<MemoryItem> RetrievalEngine::filter_by_prerequisite(const std::vector<MemoryItem>& items,
                                                                const std::string& skill_name) {
    std::vector<MemoryItem> out;
    for (size_t i = 0; i < items.size(); ++i) {
        const std::vector<std::string>& p = items[i].procedural.prerequisites;
        if (items[i].tier == MemoryTier::PROCEDURAL &&
            std::find(p.begin(), p.end(), skill_name) != p.end()) {
            out.push_back(items[i]);
        }
    }
    return out;
}

namespace {
struct SortKeyDescending {
    SortKey key;
    explicit SortKeyDescending(SortKey k) : key(k) {}
    bool operator()(const MemoryItem& a, const MemoryItem& b) const {
        double va = sort_value(a, key);
        double vb = sort_value(b, key);
        if (va != vb) return va > vb;
        return a.timestamp > b.timestamp;
    }
};
} // namespace

std::vector<MemoryItem> RetrievalEngine::search_tier(const std::vector<MemoryItem>& items,
                                                     const std::string& query,
                                                     int limit, SortKey key) {
    std::vector<MemoryItem> out;
    if (limit <= 0) return out;
    
    std::string q = trim(query);
    for (size_t i = 0; i < items.size(); ++i) {
        if (q.empty()) {
            out.push_back(items[i]);
            continue;
        }
        if (contains_ci(items[i].content, q)) {
            out.push_back(items[i]);
            continue;
        }
        std::vector<std::string> tags = items[i].tags();
        for (size_t t = 0; t < tags.size(); ++t) {
            if (contains_ci(tags[t], q)) {
                out.push_back(items[i]);
                break;
            }
        }
    }
    
    std::stable_sort(out.begin(), out.end(), SortKeyDescending(key));
    if (out.size() > static_cast<size_t>(limit)) {
        out.resize(static_cast<size_t>(limit));
    }
    return out;
}

std::string RetrievalEngine::searchable_text(const MemoryItem& item) {
    std::vector<std::string> parts;
    parts.push_back(item.content);
    std::vector<std::string> tags = item.tags();
    parts.insert(parts.end(), tags.begin(), tags.end());
    return join(parts, " ");
}

void RetrievalEngine::sort_scored(std::vector<ScoredMemory>& scored) {
    std::stable_sort(scored.begin(), scored.end(),
                     [](const ScoredMemory& a, const ScoredMemory& b) {
                         if (a.score != b.score) return a.score > b.score;
                         return a.item.timestamp > b.item.timestamp;
                     });
}

SearchResults RetrievalEngine::lexical_search(const std::vector<MemoryItem>& items,
                                              const std::string& query, int limit) {
    SearchResults results;
    results.total_searched = items.size();
    if (limit <= 0) return results;
    
    std::set<std::string> q = token_set(query);
    for (size_t i = 0; i < items.size(); ++i) {
        double score = jaccard(q, token_set(searchable_text(items[i])));
        if (score > 0.0) {
            results.items.push_back(ScoredMemory(items[i], score));
        }
    }
    
    sort_scored(results.items);
    if (results.items.size() > static_cast<size_t>(limit)) {
        results.items.resize(static_cast<size_t>(limit));
    }
    return results;
}

SearchResults RetrievalEngine::semantic_search(const std::vector<MemoryItem>& items,
                                               const std::string& query, int limit) {
    SearchResults results;
    results.total_searched = items.size();
    if (limit <= 0) return results;
    
    std::string failure;
    std::vector<ScoredMemory> scored;
    
    if (!embedder_.available()) {
        failure = "no embedding provider configured";
    } else {
        EmbeddingResult q = embedder_.embed(query);
        if (!q.success) {
            failure = q.error;
        } else {
            scored.reserve(items.size());
            for (size_t i = 0; i < items.size(); ++i) {
                EmbeddingResult e = embedder_.embed(items[i].content);
                if (!e.success) {
                    failure = e.error;
                    break;
                }
                scored.push_back(ScoredMemory(items[i], cosine_similarity(q.vector, e.vector)));
            }
        }
    }
    
    if (!failure.empty()) {
        LOG_DEBUG("semantic search degraded to lexical: %s", failure.c_str());
        SearchResults fallback = lexical_search(items, query, limit);
        fallback.degraded = true;
        fallback.diagnostic = failure;
        return fallback;
    }
    
    sort_scored(scored);
    if (scored.size() > static_cast<size_t>(limit)) {
        scored.resize(static_cast<size_t>(limit));
    }
    results.items.swap(scored);
    return results;
}

} // namespace agentmem
