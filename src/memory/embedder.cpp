/*
 * agentmem - Embedder Implementation
 */
#include <agentmem/memory/embedder.hpp>
#include <agentmem/core/logger.hpp>
#include <chrono>

namespace agentmem {

static const size_t POOL_THREADS = 2;

Embedder::Embedder(const std::shared_ptr<EmbeddingProvider>& provider,
                   size_t cache_capacity, int timeout_ms)
    : provider_(provider)
    , cache_(cache_capacity)
    , timeout_ms_(timeout_ms)
    , in_flight_(std::make_shared<std::atomic<int> >(0))
    , degraded_(false)
{
    if (provider_ && timeout_ms_ > 0) {
        pool_.reset(new ThreadPool(POOL_THREADS));
    }
}

std::string Embedder::provider_name() const {
    return provider_ ? provider_->name() : "none";
}

EmbeddingResult Embedder::call_provider(const std::string& text) {
    if (!pool_) {
        try {
            return provider_->embed(text);
        } catch (const std::exception& e) {
            return EmbeddingResult::fail(provider_name() + ": " + e.what());
        } catch (...) {
            return EmbeddingResult::fail(provider_name() + ": unknown error");
        }
    }
    
    // Every worker is still stuck on an abandoned call; queueing more would
    // only grow the backlog
    int running = in_flight_->fetch_add(1);
    if (running >= static_cast<int>(POOL_THREADS)) {
        --*in_flight_;
        return EmbeddingResult::fail(provider_name() + ": " + std::to_string(running) +
                                     " earlier calls still running", true);
    }
    
    std::shared_ptr<EmbeddingProvider> provider = provider_;
    std::shared_ptr<std::atomic<int> > in_flight = in_flight_;
    std::future<EmbeddingResult> pending = pool_->submit([provider, in_flight, text]() -> EmbeddingResult {
        try {
            EmbeddingResult r = provider->embed(text);
            --*in_flight;
            return r;
        } catch (...) {
            --*in_flight;
            throw;
        }
    });
    if (pending.wait_for(std::chrono::milliseconds(timeout_ms_)) != std::future_status::ready) {
        // The worker finishes on its own; its result is dropped
        return EmbeddingResult::fail(provider_name() + ": timed out after " +
                                     std::to_string(timeout_ms_) + " ms", true);
    }
    try {
        return pending.get();
    } catch (const std::exception& e) {
        return EmbeddingResult::fail(provider_name() + ": " + e.what());
    } catch (...) {
        return EmbeddingResult::fail(provider_name() + ": unknown error");
    }
}

EmbeddingResult Embedder::embed(const std::string& text) {
    if (!provider_) {
        return EmbeddingResult::fail("no embedding provider configured");
    }
    
    std::string model = provider_->name();
    std::vector<float> cached;
    if (cache_.get(model, text, cached)) {
        return EmbeddingResult::ok(cached);
    }
    
    EmbeddingResult result = call_provider(text);
    if (!result.success) {
        if (!degraded_.exchange(true)) {
            LOG_WARN("Embedding provider degraded, using lexical fallback: %s", result.error.c_str());
        }
        return result;
    }
    
    if (degraded_.exchange(false)) {
        LOG_INFO("Embedding provider %s recovered", model.c_str());
    }
    cache_.put(model, text, result.vector);
    return result;
}

} // namespace agentmem
