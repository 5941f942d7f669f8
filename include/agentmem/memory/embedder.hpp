/*
 * agentmem - Embedder
 * 
 * Front door to the embedding provider: cache lookup, provider call with
 * an optional deadline, and degradation tracking. Safe to call from any
 * thread; never holds engine locks.
 */
#ifndef AGENTMEM_MEMORY_EMBEDDER_HPP
#define AGENTMEM_MEMORY_EMBEDDER_HPP

#include "embedding.hpp"
#include "embedding_cache.hpp"
#include <agentmem/core/thread_pool.hpp>
#include <memory>
#include <atomic>

namespace agentmem {

class Embedder {
public:
    // provider may be null: every call then fails and callers degrade
    Embedder(const std::shared_ptr<EmbeddingProvider>& provider,
             size_t cache_capacity, int timeout_ms);
    
    bool available() const { return provider_ != nullptr; }
    
    EmbeddingResult embed(const std::string& text);
    
    // Provider calls started on the worker pool that have not returned,
    // including ones whose caller already gave up
    int calls_in_flight() const { return *in_flight_; }
    
    // True between a failed call and the next successful one
    bool degraded() const { return degraded_; }
    
    EmbeddingCache& cache() { return cache_; }
    const EmbeddingCache& cache() const { return cache_; }
    
    std::string provider_name() const;

private:
    std::shared_ptr<EmbeddingProvider> provider_;
    EmbeddingCache cache_;
    int timeout_ms_;
    std::shared_ptr<std::atomic<int> > in_flight_;   // calls still running on pool_
    std::unique_ptr<ThreadPool> pool_;
    std::atomic<bool> degraded_;
    
    EmbeddingResult call_provider(const std::string& text);
};

} // namespace agentmem

#endif // AGENTMEM_MEMORY_EMBEDDER_HPP
