/*
 * agentmem - Embedding Cache
 * 
 * Content-addressed LRU of embedding vectors, keyed by
 * sha256(model + text). Internally synchronised.
 */
#ifndef AGENTMEM_MEMORY_EMBEDDING_CACHE_HPP
#define AGENTMEM_MEMORY_EMBEDDING_CACHE_HPP

#include <string>
#include <vector>
#include <list>
#include <unordered_map>
#include <mutex>
#include <cstdint>

namespace agentmem {

class EmbeddingCache {
public:
    explicit EmbeddingCache(size_t capacity);
    
    bool get(const std::string& model, const std::string& text, std::vector<float>& out);
    void put(const std::string& model, const std::string& text, const std::vector<float>& vec);
    
    size_t size() const;
    size_t capacity() const { return capacity_; }
    void clear();
    
    uint64_t hits() const;
    uint64_t misses() const;
    
    static std::string make_key(const std::string& model, const std::string& text);

private:
    typedef std::pair<std::string, std::vector<float> > Slot;
    
    size_t capacity_;
    std::list<Slot> lru_;  // front = most recent
    std::unordered_map<std::string, std::list<Slot>::iterator> index_;
    uint64_t hits_;
    uint64_t misses_;
    mutable std::mutex mutex_;
};

} // namespace agentmem

#endif // AGENTMEM_MEMORY_EMBEDDING_CACHE_HPP
