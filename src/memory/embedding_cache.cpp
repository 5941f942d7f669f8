/*
 * agentmem - Embedding Cache Implementation
 */
#include <agentmem/memory/embedding_cache.hpp>
#include <agentmem/core/utils.hpp>

namespace agentmem {

EmbeddingCache::EmbeddingCache(size_t capacity)
    : capacity_(capacity > 0 ? capacity : 1)
    , hits_(0)
    , misses_(0)
{
}

std::string EmbeddingCache::make_key(const std::string& model, const std::string& text) {
    return sha256_hex(model + "\n" + text);
}

bool EmbeddingCache::get(const std::string& model, const std::string& text, std::vector<float>& out) {
    std::string key = make_key(model, text);
    std::lock_guard<std::mutex> lock(mutex_);
    std::unordered_map<std::string, std::list<Slot>::iterator>::iterator it = index_.find(key);
    if (it == index_.end()) {
        ++misses_;
        return false;
    }
    lru_.splice(lru_.begin(), lru_, it->second);
    out = it->second->second;
    ++hits_;
    return true;
}

void EmbeddingCache::put(const std::string& model, const std::string& text, const std::vector<float>& vec) {
    std::string key = make_key(model, text);
    std::lock_guard<std::mutex> lock(mutex_);
    std::unordered_map<std::string, std::list<Slot>::iterator>::iterator it = index_.find(key);
    if (it != index_.end()) {
        it->second->second = vec;
        lru_.splice(lru_.begin(), lru_, it->second);
        return;
    }
    lru_.push_front(Slot(key, vec));
    index_[key] = lru_.begin();
    while (lru_.size() > capacity_) {
        index_.erase(lru_.back().first);
        lru_.pop_back();
    }
}

size_t EmbeddingCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lru_.size();
}

void EmbeddingCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lru_.clear();
    index_.clear();
}

uint64_t EmbeddingCache::hits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

uint64_t EmbeddingCache::misses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return misses_;
}

} // namespace agentmem
