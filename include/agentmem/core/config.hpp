#ifndef AGENTMEM_CORE_CONFIG_HPP
#define AGENTMEM_CORE_CONFIG_HPP

#include "json.hpp"
#include <string>
#include <cstdint>

namespace agentmem {

// JSON-backed configuration. Keys use dot notation for nesting
// ("memory.workingMemoryLimit"), to any depth.
class Config {
public:
    Config();
    
    // Load from JSON file
    bool load_file(const std::string& path);
    
    // Load from JSON string
    bool load_string(const std::string& json_str);
    
    std::string get_string(const std::string& key, const std::string& def = "") const;
    
    int64_t get_int(const std::string& key, int64_t def = 0) const;
    
    double get_double(const std::string& key, double def = 0.0) const;
    
    bool get_bool(const std::string& key, bool def = false) const;
    
    bool has(const std::string& key) const;
    
    // Get nested object (null Json when absent)
    const Json& get_section(const std::string& key) const;
    
    // Raw data access
    const Json& data() const;

private:
    Json data_;
    
    const Json& lookup(const std::string& key) const;
};

} // namespace agentmem

#endif // AGENTMEM_CORE_CONFIG_HPP
