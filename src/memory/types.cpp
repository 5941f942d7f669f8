/*
 * agentmem - Memory Types Implementation
 */
#include <agentmem/memory/types.hpp>
#include <agentmem/core/config.hpp>
#include <agentmem/core/utils.hpp>
#include <cmath>
#include <sstream>

namespace agentmem {

const char* const META_REINFORCEMENT_COUNT = "reinforcementCount";
const char* const META_PARTICIPANTS = "participants";
const char* const META_PROMOTED_AT = "promotedAt";
const char* const META_PROMOTED_FROM = "promotedFrom";
const char* const META_MERGED_FROM = "mergedFrom";

std::string memory_tier_to_string(MemoryTier tier) {
    switch (tier) {
        case MemoryTier::WORKING: return "working";
        case MemoryTier::EPISODIC: return "episodic";
        case MemoryTier::SEMANTIC: return "semantic";
        case MemoryTier::PROCEDURAL: return "procedural";
    }
    return "working";
}

bool string_to_memory_tier(const std::string& s, MemoryTier& out) {
    std::string t = to_lower(trim(s));
    if (t == "working") { out = MemoryTier::WORKING; return true; }
    if (t == "episodic") { out = MemoryTier::EPISODIC; return true; }
    if (t == "semantic") { out = MemoryTier::SEMANTIC; return true; }
    if (t == "procedural") { out = MemoryTier::PROCEDURAL; return true; }
    return false;
}

const std::vector<MemoryTier>& all_memory_tiers() {
    static const MemoryTier tiers[] = {
        MemoryTier::WORKING, MemoryTier::EPISODIC, MemoryTier::SEMANTIC, MemoryTier::PROCEDURAL
    };
    static const std::vector<MemoryTier> all(tiers, tiers + 4);
    return all;
}

Clock system_clock() {
    return Clock(&current_timestamp_ms);
}

// ============ MemoryItem ============

MemoryItem MemoryItem::make_working(const std::string& content, double attention, double decay,
                                    const std::string& source) {
    MemoryItem m;
    m.tier = MemoryTier::WORKING;
    m.content = content;
    m.source = source;
    m.working.attention = attention;
    m.working.decay = decay;
    return m;
}

MemoryItem MemoryItem::make_episodic(const std::string& content, const std::string& event_type,
                                     const std::vector<std::string>& participants,
                                     double emotional_valence, double importance,
                                     const std::string& source) {
    MemoryItem m;
    m.tier = MemoryTier::EPISODIC;
    m.content = content;
    m.source = source;
    m.episodic.event_type = event_type;
    m.episodic.participants = participants;
    m.episodic.emotional_valence = emotional_valence;
    m.episodic.importance = importance;
    return m;
}

MemoryItem MemoryItem::make_semantic(const std::string& content, const std::string& category,
                                     double confidence, const std::vector<Relation>& relations,
                                     const std::string& source) {
    MemoryItem m;
    m.tier = MemoryTier::SEMANTIC;
    m.content = content;
    m.source = source;
    m.semantic.category = category;
    m.semantic.confidence = confidence;
    m.semantic.relations = relations;
    return m;
}

MemoryItem MemoryItem::make_procedural(const std::string& content, const std::string& skill_name,
                                       const std::vector<std::string>& steps,
                                       const std::vector<std::string>& prerequisites,
                                       const std::string& source) {
    MemoryItem m;
    m.tier = MemoryTier::PROCEDURAL;
    m.content = content;
    m.source = source;
    m.procedural.skill_name = skill_name;
    m.procedural.steps = steps;
    m.procedural.prerequisites = prerequisites;
    return m;
}

int64_t MemoryItem::reinforcement_count() const {
    return metadata.get_int64(META_REINFORCEMENT_COUNT, 0);
}

std::vector<std::string> MemoryItem::tags() const {
    std::vector<std::string> out;
    if (!source.empty()) out.push_back(source);
    switch (tier) {
        case MemoryTier::WORKING:
            break;
        case MemoryTier::EPISODIC:
            if (!episodic.event_type.empty()) out.push_back(episodic.event_type);
            out.insert(out.end(), episodic.participants.begin(), episodic.participants.end());
            break;
        case MemoryTier::SEMANTIC:
            if (!semantic.category.empty()) out.push_back(semantic.category);
            for (size_t i = 0; i < semantic.relations.size(); ++i) {
                out.push_back(semantic.relations[i].type);
                out.push_back(semantic.relations[i].target);
            }
            break;
        case MemoryTier::PROCEDURAL:
            if (!procedural.skill_name.empty()) out.push_back(procedural.skill_name);
            out.insert(out.end(), procedural.prerequisites.begin(), procedural.prerequisites.end());
            break;
    }
    return out;
}

const char* memory_error_str(MemoryError error) {
    switch (error) {
        case MemoryError::NONE: return "none";
        case MemoryError::NOT_FOUND: return "not_found";
        case MemoryError::WRONG_TIER: return "wrong_tier";
    }
    return "none";
}

// ============ Configuration ============

EmbeddingConfig EmbeddingConfig::from_config(const Config& config) {
    EmbeddingConfig c;
    c.provider = to_lower(config.get_string("embedding.provider", c.provider));
    c.model = config.get_string("embedding.model", c.model);
    c.base_url = config.get_string("embedding.baseUrl", c.base_url);
    c.api_key = config.get_string("embedding.apiKey", c.api_key);
    c.dimensions = static_cast<int>(config.get_int("embedding.dimensions", c.dimensions));
    c.timeout_ms = static_cast<long>(config.get_int("embedding.timeoutMs", c.timeout_ms));
    return c;
}

void EngineConfig::validate() const {
    std::ostringstream err;
    if (working_memory_limit <= 0) {
        err << "workingMemoryLimit must be > 0 (got " << working_memory_limit << ")";
    } else if (episodic_retention_days < 0) {
        err << "episodicRetentionDays must be >= 0 (got " << episodic_retention_days << ")";
    } else if (std::isnan(semantic_consolidation_threshold) || semantic_consolidation_threshold < 0.0) {
        err << "semanticConsolidationThreshold must be >= 0";
    } else if (procedural_min_executions < 0) {
        err << "proceduralMinExecutions must be >= 0 (got " << procedural_min_executions << ")";
    } else if (promotion_threshold < 1) {
        err << "promotionThreshold must be >= 1 (got " << promotion_threshold << ")";
    } else if (!(reinforcement_boost > 0.0 && reinforcement_boost <= 1.0)) {
        err << "reinforcementBoost must be in (0, 1]";
    } else if (!(lexical_weight >= 0.0 && lexical_weight <= 1.0)) {
        err << "lexicalWeight must be in [0, 1]";
    } else if (context_fact_limit <= 0) {
        err << "contextFactLimit must be > 0 (got " << context_fact_limit << ")";
    } else if (embedding_timeout_ms < 0) {
        err << "embeddingTimeoutMs must be >= 0 (got " << embedding_timeout_ms << ")";
    } else if (embedding_cache_size <= 0) {
        err << "embeddingCacheSize must be > 0 (got " << embedding_cache_size << ")";
    }
    
    std::string msg = err.str();
    if (!msg.empty()) {
        throw InvalidConfigurationError(msg);
    }
}

double EngineConfig::merge_cutoff() const {
    if (semantic_consolidation_threshold <= 1.0) {
        return semantic_consolidation_threshold;
    }
    // A corroboration count: 3 -> 0.75, 9 -> 0.9
    return semantic_consolidation_threshold / (semantic_consolidation_threshold + 1.0);
}

EngineConfig EngineConfig::from_config(const Config& config) {
    EngineConfig c;
    c.working_memory_limit = static_cast<int>(config.get_int("memory.workingMemoryLimit", c.working_memory_limit));
    c.episodic_retention_days = static_cast<int>(config.get_int("memory.episodicRetentionDays", c.episodic_retention_days));
    c.semantic_consolidation_threshold = config.get_double("memory.semanticConsolidationThreshold", c.semantic_consolidation_threshold);
    c.procedural_min_executions = static_cast<int>(config.get_int("memory.proceduralMinExecutions", c.procedural_min_executions));
    c.promotion_threshold = static_cast<int>(config.get_int("memory.promotionThreshold", c.promotion_threshold));
    c.reinforcement_boost = config.get_double("memory.reinforcementBoost", c.reinforcement_boost);
    c.lexical_weight = config.get_double("memory.lexicalWeight", c.lexical_weight);
    c.context_fact_limit = static_cast<int>(config.get_int("memory.contextFactLimit", c.context_fact_limit));
    c.embedding_timeout_ms = static_cast<int>(config.get_int("memory.embeddingTimeoutMs", c.embedding_timeout_ms));
    c.embedding_cache_size = static_cast<int>(config.get_int("memory.embeddingCacheSize", c.embedding_cache_size));
    c.merge_on_consolidate = config.get_bool("memory.mergeOnConsolidate", c.merge_on_consolidate);
    return c;
}

} // namespace agentmem
