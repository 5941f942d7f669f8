/*
 * agentmem - Context Assembly
 * 
 * Bounded snapshot of what the agent holds for a query, and its text
 * rendering for a prompt.
 */
#ifndef AGENTMEM_MEMORY_CONTEXT_HPP
#define AGENTMEM_MEMORY_CONTEXT_HPP

#include "types.hpp"
#include "retrieval.hpp"
#include <string>
#include <vector>

namespace agentmem {

struct AssembledContext {
    std::string query;
    std::vector<MemoryItem> working_context;    // attention descending
    std::vector<ScoredMemory> relevant_facts;   // similarity descending
    std::vector<MemoryItem> available_skills;   // success rate descending
    bool degraded;                              // facts ranked lexically
    std::string diagnostic;
    
    AssembledContext() : degraded(false) {}
};

class ContextAssembler {
public:
    // Working items by attention, newest first on ties
    static std::vector<MemoryItem> order_by_attention(const std::vector<MemoryItem>& working);
    
    // Skills run at least min_executions times, plus skills whose
    // prerequisites all name such skills (transitively)
    static std::vector<MemoryItem> select_skills(const std::vector<MemoryItem>& procedural,
                                                 int min_executions);
    
    // Sections in fixed order: working, facts, skills. Every field of the
    // structured context appears in the text.
    static std::string format(const AssembledContext& context);
};

} // namespace agentmem

#endif // AGENTMEM_MEMORY_CONTEXT_HPP
