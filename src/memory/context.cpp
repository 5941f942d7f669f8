/*
 * agentmem - Context Assembly Implementation
 */
#include <agentmem/memory/context.hpp>
#include <agentmem/core/utils.hpp>
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <set>
#include <sstream>

namespace agentmem {

namespace {

// Shortest of %.15g / %.17g that reads back to the same double
std::string format_number(double v) {
    char buf[64];
    snprintf(buf, sizeof(buf), "%.15g", v);
    if (std::strtod(buf, nullptr) != v) {
        snprintf(buf, sizeof(buf), "%.17g", v);
    }
    return buf;
}

std::string quote_list(const std::vector<std::string>& values) {
    std::vector<std::string> quoted;
    for (size_t i = 0; i < values.size(); ++i) {
        quoted.push_back("\"" + values[i] + "\"");
    }
    return "[" + join(quoted, ", ") + "]";
}

void append_header(std::ostringstream& ss, size_t index, const MemoryItem& item) {
    ss << (index + 1) << ". " << item.content << "\n";
    ss << "   id: " << item.id << "\n";
    ss << "   tier: " << memory_tier_to_string(item.tier) << "\n";
    ss << "   timestamp: " << item.timestamp << " (" << format_timestamp_ms(item.timestamp) << ")\n";
    ss << "   source: " << item.source << "\n";
}

void append_attributes(std::ostringstream& ss, const MemoryItem& item) {
    switch (item.tier) {
        case MemoryTier::WORKING:
            ss << "   attention: " << format_number(item.working.attention) << "\n";
            ss << "   decay: " << format_number(item.working.decay) << "\n";
            break;
        case MemoryTier::EPISODIC:
            ss << "   eventType: " << item.episodic.event_type << "\n";
            ss << "   participants: " << quote_list(item.episodic.participants) << "\n";
            ss << "   emotionalValence: " << format_number(item.episodic.emotional_valence) << "\n";
            ss << "   importance: " << format_number(item.episodic.importance) << "\n";
            break;
        case MemoryTier::SEMANTIC: {
            ss << "   category: " << item.semantic.category << "\n";
            ss << "   confidence: " << format_number(item.semantic.confidence) << "\n";
            std::vector<std::string> rel;
            for (size_t i = 0; i < item.semantic.relations.size(); ++i) {
                rel.push_back(item.semantic.relations[i].type + " -> " +
                              item.semantic.relations[i].target);
            }
            ss << "   relations: [" << join(rel, ", ") << "]\n";
            break;
        }
        case MemoryTier::PROCEDURAL: {
            const ProceduralAttributes& p = item.procedural;
            ss << "   skillName: " << p.skill_name << "\n";
            ss << "   steps:\n";
            for (size_t i = 0; i < p.steps.size(); ++i) {
                ss << "     " << (i + 1) << ") " << p.steps[i] << "\n";
            }
            ss << "   prerequisites: " << quote_list(p.prerequisites) << "\n";
            ss << "   executionCount: " << p.execution_count << "\n";
            ss << "   successRate: " << format_number(p.success_rate) << "\n";
            ss << "   averageExecutionTime: " << format_number(p.average_execution_time) << " ms\n";
            break;
        }
    }
}

void append_item(std::ostringstream& ss, size_t index, const MemoryItem& item) {
    append_header(ss, index, item);
    append_attributes(ss, item);
    ss << "   metadata: " << item.metadata.dump() << "\n";
}

bool by_attention(const MemoryItem& a, const MemoryItem& b) {
    if (a.working.attention != b.working.attention) {
        return a.working.attention > b.working.attention;
    }
    return a.timestamp > b.timestamp;
}

bool by_skill_rank(const MemoryItem& a, const MemoryItem& b) {
    if (a.procedural.success_rate != b.procedural.success_rate) {
        return a.procedural.success_rate > b.procedural.success_rate;
    }
    if (a.procedural.execution_count != b.procedural.execution_count) {
        return a.procedural.execution_count > b.procedural.execution_count;
    }
    return a.timestamp > b.timestamp;
}

} // namespace

std::vector<MemoryItem> ContextAssembler::order_by_attention(const std::vector<MemoryItem>& working) {
    std::vector<MemoryItem> out = working;
    std::stable_sort(out.begin(), out.end(), by_attention);
    return out;
}

std::vector<MemoryItem> ContextAssembler::select_skills(const std::vector<MemoryItem>& procedural,
                                                        int min_executions) {
    std::vector<bool> qualifies(procedural.size(), false);
    std::set<std::string> names;
    for (size_t i = 0; i < procedural.size(); ++i) {
        if (procedural[i].procedural.execution_count >= min_executions) {
            qualifies[i] = true;
            names.insert(to_lower(procedural[i].procedural.skill_name));
        }
    }
    
    bool changed = true;
    while (changed) {
        changed = false;
        for (size_t i = 0; i < procedural.size(); ++i) {
            const std::vector<std::string>& prereqs = procedural[i].procedural.prerequisites;
            if (qualifies[i] || prereqs.empty()) continue;
            
            bool satisfied = true;
            for (size_t p = 0; p < prereqs.size() && satisfied; ++p) {
                satisfied = names.count(to_lower(prereqs[p])) > 0;
            }
            if (satisfied) {
                qualifies[i] = true;
                names.insert(to_lower(procedural[i].procedural.skill_name));
                changed = true;
            }
        }
    }
    
    std::vector<MemoryItem> out;
    for (size_t i = 0; i < procedural.size(); ++i) {
        if (qualifies[i]) out.push_back(procedural[i]);
    }
    std::stable_sort(out.begin(), out.end(), by_skill_rank);
    return out;
}

std::string ContextAssembler::format(const AssembledContext& context) {
    std::ostringstream ss;
    ss << "Query: " << context.query << "\n";
    if (context.degraded) {
        ss << "Retrieval: lexical fallback (" << context.diagnostic << ")\n";
    } else {
        ss << "Retrieval: semantic\n";
    }
    
    ss << "\n=== Working Context ===\n";
    if (context.working_context.empty()) ss << "(none)\n";
    for (size_t i = 0; i < context.working_context.size(); ++i) {
        append_item(ss, i, context.working_context[i]);
    }
    
    ss << "\n=== Relevant Facts ===\n";
    if (context.relevant_facts.empty()) ss << "(none)\n";
    for (size_t i = 0; i < context.relevant_facts.size(); ++i) {
        append_item(ss, i, context.relevant_facts[i].item);
        ss << "   score: " << format_number(context.relevant_facts[i].score) << "\n";
    }
    
    ss << "\n=== Available Skills ===\n";
    if (context.available_skills.empty()) ss << "(none)\n";
    for (size_t i = 0; i < context.available_skills.size(); ++i) {
        append_item(ss, i, context.available_skills[i]);
    }
    
    return ss.str();
}

} // namespace agentmem
