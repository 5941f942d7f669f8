/*
 * agentmem - Tier Policies Implementation
 */
#include <agentmem/memory/policies.hpp>
#include <agentmem/core/utils.hpp>
#include <agentmem/core/logger.hpp>
#include <algorithm>
#include <cmath>

namespace agentmem {

namespace {
const int64_t MS_PER_DAY = 86400000LL;

void dedupe_preserving_order(std::vector<std::string>& values) {
    std::vector<std::string> out;
    for (size_t i = 0; i < values.size(); ++i) {
        if (std::find(out.begin(), out.end(), values[i]) == out.end()) {
            out.push_back(values[i]);
        }
    }
    values.swap(out);
}
} // namespace

TierPolicies::TierPolicies(const EngineConfig& config)
    : working_limit_(config.working_memory_limit)
    , promotion_threshold_(config.promotion_threshold)
    , reinforcement_boost_(config.reinforcement_boost)
    , retention_ms_(static_cast<int64_t>(config.episodic_retention_days) * MS_PER_DAY)
    , merge_cutoff_(config.merge_cutoff())
{
}

void TierPolicies::sanitize(MemoryItem& item) {
    if (!item.metadata.is_object()) {
        item.metadata = Json::object();
    }
    switch (item.tier) {
        case MemoryTier::WORKING:
            item.working.attention = clamp_unit(item.working.attention);
            item.working.decay = clamp_unit(item.working.decay);
            break;
        case MemoryTier::EPISODIC:
            item.episodic.emotional_valence = clamp_unit(item.episodic.emotional_valence, -1.0, 1.0);
            item.episodic.importance = clamp_unit(item.episodic.importance);
            dedupe_preserving_order(item.episodic.participants);
            break;
        case MemoryTier::SEMANTIC:
            item.semantic.confidence = clamp_unit(item.semantic.confidence);
            break;
        case MemoryTier::PROCEDURAL:
            if (item.procedural.execution_count < 0) item.procedural.execution_count = 0;
            item.procedural.success_rate = clamp_unit(item.procedural.success_rate);
            if (std::isnan(item.procedural.average_execution_time) ||
                item.procedural.average_execution_time < 0.0) {
                item.procedural.average_execution_time = 0.0;
            }
            dedupe_preserving_order(item.procedural.prerequisites);
            break;
    }
}

double TierPolicies::decayed_attention(double attention, double decay, int ticks) {
    double a = clamp_unit(attention);
    double d = clamp_unit(decay);
    for (int i = 0; i < ticks; ++i) {
        if (a == 0.0 || d == 0.0) break;
        a = clamp_unit(a * (1.0 - d));
    }
    return a;
}

void TierPolicies::apply_decay(MemoryItem& item, int ticks) const {
    if (item.tier != MemoryTier::WORKING || ticks <= 0) return;
    item.working.attention = decayed_attention(item.working.attention, item.working.decay, ticks);
}

void TierPolicies::reinforce(MemoryItem& item) const {
    item.metadata.set(META_REINFORCEMENT_COUNT, Json(item.reinforcement_count() + 1));
    if (item.tier == MemoryTier::WORKING) {
        double a = clamp_unit(item.working.attention);
        item.working.attention = clamp_unit(a + (1.0 - a) * reinforcement_boost_);
    }
}

bool TierPolicies::is_promotable(const MemoryItem& item) const {
    return item.tier == MemoryTier::WORKING &&
           item.reinforcement_count() >= promotion_threshold_;
}

void TierPolicies::promote(MemoryItem& item, int64_t now_ms) const {
    double attention = clamp_unit(item.working.attention);
    
    EpisodicAttributes ep;
    ep.event_type = "promoted";
    ep.importance = attention;
    ep.emotional_valence = 0.0;
    ep.participants = item.metadata[META_PARTICIPANTS].as_string_list();
    dedupe_preserving_order(ep.participants);
    
    item.tier = MemoryTier::EPISODIC;
    item.episodic = ep;
    item.working = WorkingAttributes();
    item.metadata.set(META_PROMOTED_FROM, Json("working"));
    item.metadata.set(META_PROMOTED_AT, Json(now_ms));
}

bool TierPolicies::is_expired(const MemoryItem& item, int64_t now_ms) const {
    if (item.tier != MemoryTier::EPISODIC || retention_ms_ <= 0) return false;
    return now_ms - item.timestamp > retention_ms_;
}

bool TierPolicies::evicts_before(const MemoryItem& a, uint64_t seq_a,
                                 const MemoryItem& b, uint64_t seq_b) {
    if (a.working.attention != b.working.attention) {
        return a.working.attention < b.working.attention;
    }
    if (a.timestamp != b.timestamp) {
        return a.timestamp < b.timestamp;
    }
    return seq_a < seq_b;
}

void TierPolicies::record_execution(MemoryItem& item, bool success, double duration_ms) {
    ProceduralAttributes& p = item.procedural;
    if (std::isnan(duration_ms) || duration_ms < 0.0) duration_ms = 0.0;
    
    p.execution_count += 1;
    double n = static_cast<double>(p.execution_count);
    p.success_rate = clamp_unit((p.success_rate * (n - 1.0) + (success ? 1.0 : 0.0)) / n);
    p.average_execution_time = (p.average_execution_time * (n - 1.0) + duration_ms) / n;
}

int TierPolicies::capacity(MemoryTier tier) const {
    return tier == MemoryTier::WORKING ? working_limit_ : 0;
}

} // namespace agentmem
