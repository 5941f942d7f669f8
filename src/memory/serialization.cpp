/*
 * agentmem - Memory Item Serialization Implementation
 */
#include <agentmem/memory/serialization.hpp>

namespace agentmem {

const int SNAPSHOT_FORMAT_VERSION = 1;

namespace {

Json relations_to_json(const std::vector<Relation>& relations) {
    Json arr = Json::array();
    for (size_t i = 0; i < relations.size(); ++i) {
        Json r = Json::object();
        r.set("type", Json(relations[i].type));
        r.set("target", Json(relations[i].target));
        arr.push(r);
    }
    return arr;
}

std::vector<Relation> relations_from_json(const Json& arr) {
    std::vector<Relation> out;
    if (!arr.is_array()) return out;
    for (size_t i = 0; i < arr.size(); ++i) {
        const Json& r = arr[i];
        if (!r.is_object()) continue;
        out.push_back(Relation(r.get_string("type"), r.get_string("target")));
    }
    return out;
}

void set_error(std::string* error, const std::string& msg) {
    if (error) *error = msg;
}

} // namespace

Json tier_attributes_to_json(const MemoryItem& item) {
    Json obj = Json::object();
    switch (item.tier) {
        case MemoryTier::WORKING:
            obj.set("attention", Json(item.working.attention));
            obj.set("decay", Json(item.working.decay));
            break;
        case MemoryTier::EPISODIC:
            obj.set("eventType", Json(item.episodic.event_type));
            obj.set("participants", Json::from_strings(item.episodic.participants));
            obj.set("emotionalValence", Json(item.episodic.emotional_valence));
            obj.set("importance", Json(item.episodic.importance));
            break;
        case MemoryTier::SEMANTIC:
            obj.set("category", Json(item.semantic.category));
            obj.set("confidence", Json(item.semantic.confidence));
            obj.set("relations", relations_to_json(item.semantic.relations));
            break;
        case MemoryTier::PROCEDURAL:
            obj.set("skillName", Json(item.procedural.skill_name));
            obj.set("steps", Json::from_strings(item.procedural.steps));
            obj.set("prerequisites", Json::from_strings(item.procedural.prerequisites));
            obj.set("executionCount", Json(item.procedural.execution_count));
            obj.set("successRate", Json(item.procedural.success_rate));
            obj.set("averageExecutionTime", Json(item.procedural.average_execution_time));
            break;
    }
    return obj;
}

void tier_attributes_from_json(const Json& obj, MemoryItem& item) {
    switch (item.tier) {
        case MemoryTier::WORKING: {
            WorkingAttributes w;
            w.attention = obj.get_double("attention", w.attention);
            w.decay = obj.get_double("decay", w.decay);
            item.working = w;
            break;
        }
        case MemoryTier::EPISODIC: {
            EpisodicAttributes e;
            e.event_type = obj.get_string("eventType");
            e.participants = obj["participants"].as_string_list();
            e.emotional_valence = obj.get_double("emotionalValence", e.emotional_valence);
            e.importance = obj.get_double("importance", e.importance);
            item.episodic = e;
            break;
        }
        case MemoryTier::SEMANTIC: {
            SemanticAttributes s;
            s.category = obj.get_string("category");
            s.confidence = obj.get_double("confidence", s.confidence);
            s.relations = relations_from_json(obj["relations"]);
            item.semantic = s;
            break;
        }
        case MemoryTier::PROCEDURAL: {
            ProceduralAttributes p;
            p.skill_name = obj.get_string("skillName");
            p.steps = obj["steps"].as_string_list();
            p.prerequisites = obj["prerequisites"].as_string_list();
            p.execution_count = obj.get_int64("executionCount", 0);
            p.success_rate = obj.get_double("successRate", 0.0);
            p.average_execution_time = obj.get_double("averageExecutionTime", 0.0);
            item.procedural = p;
            break;
        }
    }
}

Json memory_item_to_json(const MemoryItem& item) {
    Json obj = tier_attributes_to_json(item);
    obj.set("id", Json(item.id));
    obj.set("timestamp", Json(item.timestamp));
    obj.set("tier", Json(memory_tier_to_string(item.tier)));
    obj.set("source", Json(item.source));
    obj.set("content", Json(item.content));
    obj.set("metadata", item.metadata.is_object() ? item.metadata : Json::object());
    return obj;
}

bool memory_item_from_json(const Json& obj, MemoryItem& out, std::string* error) {
    if (!obj.is_object()) {
        set_error(error, "memory item is not an object");
        return false;
    }
    
    MemoryItem item;
    if (!string_to_memory_tier(obj.get_string("tier"), item.tier)) {
        set_error(error, "unknown tier '" + obj.get_string("tier") + "'");
        return false;
    }
    
    item.id = obj.get_string("id");
    item.timestamp = obj.get_int64("timestamp", 0);
    item.source = obj.get_string("source");
    item.content = obj.get_string("content");
    if (obj["metadata"].is_object()) {
        item.metadata = obj["metadata"];
    }
    tier_attributes_from_json(obj, item);
    
    out = item;
    return true;
}

Json memory_items_to_json(const std::vector<MemoryItem>& items) {
    Json arr = Json::array();
    for (size_t i = 0; i < items.size(); ++i) {
        arr.push(memory_item_to_json(items[i]));
    }
    Json doc = Json::object();
    doc.set("version", Json(SNAPSHOT_FORMAT_VERSION));
    doc.set("items", arr);
    return doc;
}

bool memory_items_from_json(const Json& doc, std::vector<MemoryItem>& out, std::string* error) {
    const Json* arr = &doc;
    if (doc.is_object()) {
        int version = doc.get_int("version", SNAPSHOT_FORMAT_VERSION);
        if (version > SNAPSHOT_FORMAT_VERSION) {
            set_error(error, "unsupported snapshot version " + std::to_string(version));
            return false;
        }
        arr = &doc["items"];
    }
    if (!arr->is_array()) {
        set_error(error, "snapshot has no item array");
        return false;
    }
    
    std::vector<MemoryItem> items;
    items.reserve(arr->size());
    for (size_t i = 0; i < arr->size(); ++i) {
        MemoryItem item;
        std::string why;
        if (!memory_item_from_json((*arr)[i], item, &why)) {
            set_error(error, "item " + std::to_string(i) + ": " + why);
            return false;
        }
        items.push_back(item);
    }
    out.swap(items);
    return true;
}

} // namespace agentmem
