#include <agentmem/core/config.hpp>
#include <agentmem/core/logger.hpp>
#include <agentmem/core/utils.hpp>
#include <fstream>
#include <iterator>

namespace agentmem {

Config::Config() : data_(Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream f(path.c_str());
    if (!f.is_open()) {
        LOG_ERROR("Config: cannot open '%s'", path.c_str());
        return false;
    }
    
    std::string content((std::istreambuf_iterator<char>(f)),
                        std::istreambuf_iterator<char>());
    if (!load_string(content)) {
        LOG_ERROR("Config: '%s' is not valid JSON", path.c_str());
        return false;
    }
    return true;
}

bool Config::load_string(const std::string& json_str) {
    try {
        Json parsed = Json::parse(json_str);
        if (!parsed.is_object()) {
            LOG_WARN("Config: top-level value is not an object");
            return false;
        }
        data_ = parsed;
        return true;
    } catch (const std::exception& e) {
        LOG_WARN("Config: %s", e.what());
        return false;
    }
}

const Json& Config::lookup(const std::string& key) const {
    static const Json null_json;
    const Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->has(parts[i])) {
            LOG_DEBUG("Config: key '%s' not found", key.c_str());
            return null_json;
        }
        node = &(*node)[parts[i]];
    }
    return parts.empty() ? null_json : *node;
}

std::string Config::get_string(const std::string& key, const std::string& def) const {
    const Json& v = lookup(key);
    return v.is_string() ? v.as_string() : def;
}

int64_t Config::get_int(const std::string& key, int64_t def) const {
    const Json& v = lookup(key);
    return v.is_number() ? v.as_int() : def;
}

double Config::get_double(const std::string& key, double def) const {
    const Json& v = lookup(key);
    return v.is_number() ? v.as_number() : def;
}

bool Config::get_bool(const std::string& key, bool def) const {
    const Json& v = lookup(key);
    return v.is_bool() ? v.as_bool() : def;
}

bool Config::has(const std::string& key) const {
    return !lookup(key).is_null();
}

const Json& Config::get_section(const std::string& key) const {
    return lookup(key);
}

const Json& Config::data() const { return data_; }

} // namespace agentmem
