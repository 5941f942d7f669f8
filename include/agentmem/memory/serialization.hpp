/*
 * agentmem - Memory Item Serialization
 * 
 * Item <-> JSON mapping shared by snapshot export/import and the SQLite
 * payload column. Field names follow the camelCase used in configuration.
 */
#ifndef AGENTMEM_MEMORY_SERIALIZATION_HPP
#define AGENTMEM_MEMORY_SERIALIZATION_HPP

#include "types.hpp"
#include <agentmem/core/json.hpp>
#include <string>
#include <vector>

namespace agentmem {

// Snapshot document format version written by export
extern const int SNAPSHOT_FORMAT_VERSION;

// Tier-specific fields only ({"attention":..,"decay":..} for working, ...)
Json tier_attributes_to_json(const MemoryItem& item);

// Reads the fields of item.tier from obj; absent fields keep their defaults
void tier_attributes_from_json(const Json& obj, MemoryItem& item);

// Header, metadata and tier fields in one object
Json memory_item_to_json(const MemoryItem& item);

// false (with a reason in `error`) when the tier is missing or unknown
bool memory_item_from_json(const Json& obj, MemoryItem& out, std::string* error = nullptr);

// {"version":1,"items":[...]}
Json memory_items_to_json(const std::vector<MemoryItem>& items);

// Accepts the versioned document or a bare array of items. Rejects the
// whole document if any item is malformed.
bool memory_items_from_json(const Json& doc, std::vector<MemoryItem>& out,
                            std::string* error = nullptr);

} // namespace agentmem

#endif // AGENTMEM_MEMORY_SERIALIZATION_HPP
