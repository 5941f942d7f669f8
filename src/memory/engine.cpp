/*
 * agentmem - Memory Engine Implementation
 */
#include <agentmem/memory/engine.hpp>
#include <agentmem/memory/serialization.hpp>
#include <agentmem/core/utils.hpp>
#include <agentmem/core/logger.hpp>

namespace agentmem {

const EngineConfig& MemoryEngine::validated(const EngineConfig& config) {
    config.validate();
    return config;
}

MemoryEngine::MemoryEngine(const EngineConfig& config,
                           const std::shared_ptr<EmbeddingProvider>& provider,
                           const Clock& clock)
    : config_(validated(config))
    , policies_(config_)
    , store_(policies_, clock)
    , embedder_(provider, static_cast<size_t>(config_.embedding_cache_size), config_.embedding_timeout_ms)
    , retrieval_(embedder_)
    , consolidator_(policies_, embedder_, config_.lexical_weight)
    , total_stored_(0)
    , evictions_(0)
    , promotions_(0)
    , merges_(0)
    , expirations_(0)
    , degraded_searches_(0)
{
    LOG_INFO("MemoryEngine: working limit %d, retention %d days, merge cutoff %.3f, embeddings: %s",
             config_.working_memory_limit, config_.episodic_retention_days,
             config_.merge_cutoff(), embedder_.provider_name().c_str());
}

MemoryEvent MemoryEngine::make_event(MemoryEventType type, const MemoryItem& item) {
    return MemoryEvent(type, item.id, item.tier, store_.now());
}

void MemoryEngine::note_degraded(const std::string& what, const std::string& diagnostic,
                                 std::vector<MemoryEvent>& events) {
    // A missing provider is a configuration choice, not a degradation
    if (!embedder_.available()) return;
    MemoryEvent e(MemoryEventType::DEGRADED, "", MemoryTier::SEMANTIC, store_.now());
    e.detail = what + ": " + diagnostic;
    events.push_back(e);
}

// ============ Store ============

std::string MemoryEngine::store_locked(const MemoryItem& item, std::vector<MemoryEvent>& events) {
    if (item.tier == MemoryTier::PROCEDURAL && !item.procedural.skill_name.empty()) {
        MemoryItem* existing = store_.find_skill(item.procedural.skill_name);
        if (existing) {
            existing->content = item.content;
            existing->source = item.source;
            existing->procedural.steps = item.procedural.steps;
            existing->procedural.prerequisites = item.procedural.prerequisites;
            TierPolicies::sanitize(*existing);
            
            MemoryEvent e = make_event(MemoryEventType::STORED, *existing);
            e.detail = "updated skill " + existing->procedural.skill_name;
            events.push_back(e);
            return existing->id;
        }
    }
    
    // Execution statistics only move through record_execution
    MemoryItem fresh = item;
    if (fresh.tier == MemoryTier::PROCEDURAL) {
        const MemoryItem* known = fresh.id.empty() ? nullptr : store_.find(fresh.id);
        if (known && known->tier == MemoryTier::PROCEDURAL) {
            fresh.procedural.execution_count = known->procedural.execution_count;
            fresh.procedural.success_rate = known->procedural.success_rate;
            fresh.procedural.average_execution_time = known->procedural.average_execution_time;
        } else {
            fresh.procedural.execution_count = 0;
            fresh.procedural.success_rate = 0.0;
            fresh.procedural.average_execution_time = 0.0;
        }
    }
    
    std::vector<MemoryItem> evicted;
    std::string id = store_.store(fresh, &evicted);
    total_stored_++;
    
    const MemoryItem* kept = store_.find(id);
    MemoryEvent stored(MemoryEventType::STORED, id, kept ? kept->tier : fresh.tier, store_.now());
    events.push_back(stored);
    for (size_t i = 0; i < evicted.size(); ++i) {
        evictions_++;
        events.push_back(make_event(MemoryEventType::EVICTED, evicted[i]));
    }
    return id;
}

std::string MemoryEngine::store(const MemoryItem& item) {
    std::vector<MemoryEvent> events;
    std::string id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = store_locked(item, events);
    }
    events_.dispatch(events);
    return id;
}

bool MemoryEngine::retrieve(const std::string& id, MemoryItem& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_.retrieve(id, out);
}

std::vector<MemoryItem> MemoryEngine::get_all_by_tier(MemoryTier tier) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_.get_all_by_tier(tier);
}

bool MemoryEngine::get_skill(const std::string& skill_name, MemoryItem& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string wanted = to_lower(skill_name);
    std::vector<MemoryItem> skills = store_.get_all_by_tier(MemoryTier::PROCEDURAL);
    for (size_t i = 0; i < skills.size(); ++i) {
        if (to_lower(skills[i].procedural.skill_name) == wanted) {
            out = skills[i];
            return true;
        }
    }
    return false;
}

void MemoryEngine::clear() {
    std::vector<MemoryEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        MemoryEvent e(MemoryEventType::CLEARED, "", MemoryTier::WORKING, store_.now());
        e.detail = std::to_string(store_.size()) + " items removed";
        store_.clear();
        events.push_back(e);
    }
    events_.dispatch(events);
}

size_t MemoryEngine::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_.size();
}

// ============ Tier policies ============

int MemoryEngine::tick(int n) {
    if (n <= 0) return 0;
    
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<MemoryItem> working = store_.get_all_by_tier(MemoryTier::WORKING);
    int touched = 0;
    for (size_t i = 0; i < working.size(); ++i) {
        MemoryItem* item = store_.find(working[i].id);
        if (!item) continue;
        policies_.apply_decay(*item, n);
        touched++;
    }
    return touched;
}

OpResult MemoryEngine::reinforce(const std::string& id) {
    std::vector<MemoryEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        MemoryItem* item = store_.find(id);
        if (!item) {
            return OpResult::fail(MemoryError::NOT_FOUND, "no memory with id " + id);
        }
        policies_.reinforce(*item);
        
        MemoryEvent e = make_event(MemoryEventType::REINFORCED, *item);
        e.detail = "count " + std::to_string(item->reinforcement_count());
        events.push_back(e);
    }
    events_.dispatch(events);
    return OpResult::ok();
}

OpResult MemoryEngine::record_execution(const std::string& id, bool success, double duration_ms) {
    std::vector<MemoryEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        MemoryItem* item = store_.find(id);
        if (!item) {
            return OpResult::fail(MemoryError::NOT_FOUND, "no memory with id " + id);
        }
        if (item->tier != MemoryTier::PROCEDURAL) {
            return OpResult::fail(MemoryError::WRONG_TIER,
                                  id + " is a " + memory_tier_to_string(item->tier) + " memory");
        }
        TierPolicies::record_execution(*item, success, duration_ms);
        
        MemoryEvent e = make_event(MemoryEventType::EXECUTION_RECORDED, *item);
        e.detail = success ? "success" : "failure";
        events.push_back(e);
    }
    events_.dispatch(events);
    return OpResult::ok();
}

// ============ Consolidation ============

std::vector<MergeRecord> MemoryEngine::merge_pass(const std::string& category, MergePlan& plan,
                                                  std::vector<MemoryEvent>& events) {
    std::vector<MemoryItem> semantic;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        semantic = store_.get_all_by_tier(MemoryTier::SEMANTIC);
    }
    
    plan = consolidator_.plan_merges(semantic, category);
    
    std::lock_guard<std::mutex> lock(mutex_);
    if (plan.degraded) {
        note_degraded("merge scoring", plan.diagnostic, events);
    }
    std::vector<MergeRecord> applied = consolidator_.apply_merges(store_, plan);
    for (size_t i = 0; i < applied.size(); ++i) {
        merges_++;
        MemoryEvent e(MemoryEventType::MERGED, applied[i].merged_id, MemoryTier::SEMANTIC, store_.now());
        e.related_ids.push_back(applied[i].first_id);
        e.related_ids.push_back(applied[i].second_id);
        e.detail = applied[i].category;
        events.push_back(e);
    }
    return applied;
}

int MemoryEngine::merge_related_semantics(const std::string& category) {
    std::vector<MemoryEvent> events;
    MergePlan plan;
    std::vector<MergeRecord> applied = merge_pass(category, plan, events);
    events_.dispatch(events);
    return static_cast<int>(applied.size());
}

ConsolidationReport MemoryEngine::consolidate() {
    ConsolidationReport report;
    std::vector<MemoryEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        int64_t now = store_.now();
        
        std::vector<MemoryItem> expired = consolidator_.expire(store_, now);
        for (size_t i = 0; i < expired.size(); ++i) {
            expirations_++;
            report.expired.push_back(expired[i].id);
            events.push_back(make_event(MemoryEventType::EXPIRED, expired[i]));
        }
        
        std::vector<MemoryItem> promoted = consolidator_.promote(store_, now);
        for (size_t i = 0; i < promoted.size(); ++i) {
            promotions_++;
            report.promoted.push_back(promoted[i].id);
            MemoryEvent e = make_event(MemoryEventType::PROMOTED, promoted[i]);
            e.detail = "working -> episodic";
            events.push_back(e);
        }
    }
    
    if (config_.merge_on_consolidate) {
        MergePlan plan;
        report.merged = merge_pass("", plan, events);
        report.degraded = plan.degraded;
        report.diagnostic = plan.diagnostic;
    }
    
    LOG_DEBUG("MemoryEngine: consolidated (%d promoted, %d expired, %d merged)",
              static_cast<int>(report.promoted.size()), static_cast<int>(report.expired.size()),
              static_cast<int>(report.merged.size()));
    events_.dispatch(events);
    return report;
}

// ============ Retrieval ============

std::vector<MemoryItem> MemoryEngine::query_by_participant(const std::string& participant) const {
    return RetrievalEngine::filter_by_participant(get_all_by_tier(MemoryTier::EPISODIC), participant);
}

std::vector<MemoryItem> MemoryEngine::query_by_category(const std::string& category) const {
    return RetrievalEngine::filter_by_category(get_all_by_tier(MemoryTier::SEMANTIC), category);
}

std::vector<MemoryItem> MemoryEngine::query_by_prerequisite(const std::string& skill_name) const {
    return RetrievalEngine::filter_by_prerequisite(get_all_by_tier(MemoryTier::PROCEDURAL), skill_name);
}

std::vector<MemoryItem> MemoryEngine::search_by_tier(MemoryTier tier, const std::string& query,
                                                     int limit, SortKey key) const {
    return RetrievalEngine::search_tier(get_all_by_tier(tier), query, limit, key);
}

SearchResults MemoryEngine::semantic_search(const std::string& query, MemoryTier tier, int limit) {
    SearchResults results = retrieval_.semantic_search(get_all_by_tier(tier), query, limit);
    if (results.degraded) {
        std::vector<MemoryEvent> events;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            degraded_searches_++;
            note_degraded("semantic search", results.diagnostic, events);
        }
        events_.dispatch(events);
    }
    return results;
}

// ============ Context ============

std::vector<MemoryItem> MemoryEngine::available_skills() const {
    return ContextAssembler::select_skills(get_all_by_tier(MemoryTier::PROCEDURAL),
                                           config_.procedural_min_executions);
}

AssembledContext MemoryEngine::assemble_context(const std::string& query) {
    AssembledContext context;
    context.query = query;
    context.working_context = ContextAssembler::order_by_attention(get_all_by_tier(MemoryTier::WORKING));
    
    SearchResults facts = semantic_search(query, MemoryTier::SEMANTIC, config_.context_fact_limit);
    context.relevant_facts = facts.items;
    context.degraded = facts.degraded;
    context.diagnostic = facts.diagnostic;
    
    context.available_skills = available_skills();
    return context;
}

std::string MemoryEngine::format_context_for_prompt(const AssembledContext& context) const {
    return ContextAssembler::format(context);
}

// ============ Observability ============

int MemoryEngine::add_listener(const MemoryEventListener& listener) {
    return events_.add_listener(listener);
}

bool MemoryEngine::remove_listener(int listener_id) {
    return events_.remove_listener(listener_id);
}

MemoryStats MemoryEngine::stats() const {
    MemoryStats s;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        s.working = store_.count(MemoryTier::WORKING);
        s.episodic = store_.count(MemoryTier::EPISODIC);
        s.semantic = store_.count(MemoryTier::SEMANTIC);
        s.procedural = store_.count(MemoryTier::PROCEDURAL);
        s.total_stored = total_stored_;
        s.evictions = evictions_;
        s.promotions = promotions_;
        s.merges = merges_;
        s.expirations = expirations_;
        s.degraded_searches = degraded_searches_;
    }
    s.cache_hits = embedder_.cache().hits();
    s.cache_misses = embedder_.cache().misses();
    return s;
}

// ============ Snapshots ============

void MemoryEngine::replace_all_locked(const std::vector<MemoryItem>& items,
                                      std::vector<MemoryEvent>& events) {
    MemoryEvent cleared(MemoryEventType::CLEARED, "", MemoryTier::WORKING, store_.now());
    cleared.detail = "replaced by snapshot of " + std::to_string(items.size()) + " items";
    store_.clear();
    events.push_back(cleared);
    
    for (size_t i = 0; i < items.size(); ++i) {
        const MemoryItem& item = items[i];
        if (item.tier == MemoryTier::PROCEDURAL && !item.procedural.skill_name.empty() &&
            store_.find_skill(item.procedural.skill_name)) {
            LOG_WARN("MemoryEngine: snapshot repeats skill %s, keeping the first copy (dropped %s)",
                     item.procedural.skill_name.c_str(), item.id.c_str());
            continue;
        }
        std::vector<MemoryItem> evicted;
        store_.store(item, &evicted);
        for (size_t j = 0; j < evicted.size(); ++j) {
            evictions_++;
            events.push_back(make_event(MemoryEventType::EVICTED, evicted[j]));
        }
    }
}

bool MemoryEngine::save_snapshot(MemoryPersistence& persistence) const {
    std::vector<MemoryItem> items;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        items = store_.get_all();
    }
    if (!persistence.save_all(items)) {
        LOG_ERROR("MemoryEngine: snapshot save failed: %s", persistence.last_error().c_str());
        return false;
    }
    return true;
}

bool MemoryEngine::load_snapshot(MemoryPersistence& persistence) {
    std::vector<MemoryItem> items;
    if (!persistence.load_all(items)) {
        LOG_ERROR("MemoryEngine: snapshot load failed: %s", persistence.last_error().c_str());
        return false;
    }
    
    std::vector<MemoryEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        replace_all_locked(items, events);
    }
    LOG_INFO("MemoryEngine: loaded %d memories", static_cast<int>(items.size()));
    events_.dispatch(events);
    return true;
}

std::string MemoryEngine::export_json(int indent) const {
    std::vector<MemoryItem> items;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        items = store_.get_all();
    }
    return memory_items_to_json(items).dump(indent);
}

bool MemoryEngine::import_json(const std::string& text, std::string* error) {
    std::vector<MemoryItem> items;
    std::string why;
    try {
        if (!memory_items_from_json(Json::parse(text), items, &why)) {
            LOG_ERROR("MemoryEngine: snapshot import rejected: %s", why.c_str());
            if (error) *error = why;
            return false;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("MemoryEngine: snapshot import failed: %s", e.what());
        if (error) *error = e.what();
        return false;
    }
    
    std::vector<MemoryEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        replace_all_locked(items, events);
    }
    events_.dispatch(events);
    return true;
}

} // namespace agentmem
