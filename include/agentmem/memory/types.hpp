/*
 * agentmem - Memory Types
 * 
 * Tiered memory items and the configuration of the engine that owns them.
 * Every item carries the common header (id, timestamp, tier, source,
 * content, metadata); the attribute block matching `tier` holds the
 * tier-specific fields and the other blocks stay at their defaults.
 */
#ifndef AGENTMEM_MEMORY_TYPES_HPP
#define AGENTMEM_MEMORY_TYPES_HPP

#include <agentmem/core/json.hpp>
#include <string>
#include <vector>
#include <functional>
#include <stdexcept>
#include <cstdint>

namespace agentmem {

class Config;

enum class MemoryTier {
    WORKING,
    EPISODIC,
    SEMANTIC,
    PROCEDURAL
};

std::string memory_tier_to_string(MemoryTier tier);
bool string_to_memory_tier(const std::string& s, MemoryTier& out);
const std::vector<MemoryTier>& all_memory_tiers();

// Milliseconds since the Unix epoch
typedef std::function<int64_t()> Clock;
Clock system_clock();

// Typed edge of a semantic fact ("is_a" -> "programming_language")
struct Relation {
    std::string type;
    std::string target;
    
    Relation() {}
    Relation(const std::string& t, const std::string& tgt) : type(t), target(tgt) {}
    
    bool operator==(const Relation& o) const { return type == o.type && target == o.target; }
    bool operator!=(const Relation& o) const { return !(*this == o); }
    bool operator<(const Relation& o) const {
        return type < o.type || (type == o.type && target < o.target);
    }
};

struct WorkingAttributes {
    double attention;   // 0..1, salience right now
    double decay;       // 0..1, fraction of attention lost per tick
    
    WorkingAttributes() : attention(1.0), decay(0.1) {}
};

struct EpisodicAttributes {
    std::string event_type;
    std::vector<std::string> participants;  // distinct identifiers
    double emotional_valence;               // -1..1
    double importance;                      // 0..1
    
    EpisodicAttributes() : emotional_valence(0.0), importance(0.5) {}
};

struct SemanticAttributes {
    std::string category;
    double confidence;                      // 0..1
    std::vector<Relation> relations;
    
    SemanticAttributes() : confidence(0.5) {}
};

struct ProceduralAttributes {
    std::string skill_name;
    std::vector<std::string> steps;          // ordered
    std::vector<std::string> prerequisites;  // skill names, may be dangling
    int64_t execution_count;
    double success_rate;                     // 0..1
    double average_execution_time;           // ms
    
    ProceduralAttributes() : execution_count(0), success_rate(0.0), average_execution_time(0.0) {}
};

// Metadata keys maintained by the engine
extern const char* const META_REINFORCEMENT_COUNT;
extern const char* const META_PARTICIPANTS;
extern const char* const META_PROMOTED_AT;
extern const char* const META_PROMOTED_FROM;
extern const char* const META_MERGED_FROM;

struct MemoryItem {
    std::string id;         // assigned at store time when empty
    int64_t timestamp;      // creation instant (ms), assigned when 0
    MemoryTier tier;
    std::string source;     // provenance tag
    std::string content;
    Json metadata;          // open key -> value object
    
    WorkingAttributes working;
    EpisodicAttributes episodic;
    SemanticAttributes semantic;
    ProceduralAttributes procedural;
    
    MemoryItem() : timestamp(0), tier(MemoryTier::WORKING), metadata(Json::object()) {}
    
    static MemoryItem make_working(const std::string& content, double attention, double decay,
                                   const std::string& source = "");
    static MemoryItem make_episodic(const std::string& content, const std::string& event_type,
                                    const std::vector<std::string>& participants,
                                    double emotional_valence, double importance,
                                    const std::string& source = "");
    static MemoryItem make_semantic(const std::string& content, const std::string& category,
                                    double confidence,
                                    const std::vector<Relation>& relations = std::vector<Relation>(),
                                    const std::string& source = "");
    static MemoryItem make_procedural(const std::string& content, const std::string& skill_name,
                                      const std::vector<std::string>& steps,
                                      const std::vector<std::string>& prerequisites = std::vector<std::string>(),
                                      const std::string& source = "");
    
    int64_t reinforcement_count() const;
    
    // Tier-specific labels searched alongside content
    std::vector<std::string> tags() const;
};

// ============ Errors ============

enum class MemoryError {
    NONE,
    NOT_FOUND,
    WRONG_TIER
};

const char* memory_error_str(MemoryError error);

// Outcome of an operation that targets an existing item
struct OpResult {
    bool success;
    MemoryError error;
    std::string message;
    
    OpResult() : success(false), error(MemoryError::NONE) {}
    
    static OpResult ok() {
        OpResult r;
        r.success = true;
        return r;
    }
    
    static OpResult fail(MemoryError err, const std::string& msg) {
        OpResult r;
        r.success = false;
        r.error = err;
        r.message = msg;
        return r;
    }
    
    bool not_found() const { return error == MemoryError::NOT_FOUND; }
};

// Raised only while constructing an engine from bad parameters
class InvalidConfigurationError : public std::runtime_error {
public:
    explicit InvalidConfigurationError(const std::string& what)
        : std::runtime_error("invalid memory configuration: " + what) {}
};

// ============ Configuration ============

struct EmbeddingConfig {
    std::string provider;       // "mock", "ollama", "openai", "none"
    std::string model;
    std::string base_url;
    std::string api_key;
    int dimensions;             // mock only
    long timeout_ms;            // HTTP timeout
    
    EmbeddingConfig()
        : provider("mock")
        , dimensions(256)
        , timeout_ms(30000)
    {}
    
    // Reads the "embedding" section
    static EmbeddingConfig from_config(const Config& config);
};

struct EngineConfig {
    int working_memory_limit;
    int episodic_retention_days;            // 0 disables age expiry
    double semantic_consolidation_threshold; // <= 1: cutoff, > 1: count n -> n/(n+1)
    int procedural_min_executions;
    int promotion_threshold;                // reinforcements needed to promote
    double reinforcement_boost;             // share of the gap to 1 closed per reinforce
    double lexical_weight;                  // Jaccard share of the merge score
    int context_fact_limit;
    int embedding_timeout_ms;               // 0 = call the provider inline
    int embedding_cache_size;
    bool merge_on_consolidate;
    
    EngineConfig()
        : working_memory_limit(7)
        , episodic_retention_days(30)
        , semantic_consolidation_threshold(0.8)
        , procedural_min_executions(3)
        , promotion_threshold(3)
        , reinforcement_boost(0.5)
        , lexical_weight(0.5)
        , context_fact_limit(5)
        , embedding_timeout_ms(0)
        , embedding_cache_size(1024)
        , merge_on_consolidate(true)
    {}
    
    // Throws InvalidConfigurationError naming the first bad parameter
    void validate() const;
    
    double merge_cutoff() const;
    
    // Reads the "memory" section; missing keys keep their defaults
    static EngineConfig from_config(const Config& config);
};

} // namespace agentmem

#endif // AGENTMEM_MEMORY_TYPES_HPP
