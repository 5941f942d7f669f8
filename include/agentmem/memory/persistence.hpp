/*
 * agentmem - Persistence Contract
 * 
 * A durable backend saves and restores whole engine snapshots. Failures
 * are reported through the return value and last_error(); the engine
 * itself stays in memory and keeps working.
 */
#ifndef AGENTMEM_MEMORY_PERSISTENCE_HPP
#define AGENTMEM_MEMORY_PERSISTENCE_HPP

#include "types.hpp"
#include <string>
#include <vector>

namespace agentmem {

class MemoryPersistence {
public:
    virtual ~MemoryPersistence() {}
    
    // Replaces the stored snapshot with `items`, all or nothing
    virtual bool save_all(const std::vector<MemoryItem>& items) = 0;
    
    // Reads the stored snapshot; an empty backend yields no items
    virtual bool load_all(std::vector<MemoryItem>& items) = 0;
    
    virtual bool clear() = 0;
    
    virtual std::string last_error() const = 0;
};

} // namespace agentmem

#endif // AGENTMEM_MEMORY_PERSISTENCE_HPP
