/*
 * agentmem - Embedding Providers
 * 
 * Text -> vector. Implementations may fail (network, quota, malformed
 * replies); failures are reported in the result, never thrown. Vectors
 * from one provider configuration are comparable with each other only.
 */
#ifndef AGENTMEM_MEMORY_EMBEDDING_HPP
#define AGENTMEM_MEMORY_EMBEDDING_HPP

#include "types.hpp"
#include <string>
#include <vector>
#include <memory>
#include <atomic>

namespace agentmem {

struct EmbeddingResult {
    bool success;
    std::vector<float> vector;
    std::string error;
    bool timed_out;
    
    EmbeddingResult() : success(false), timed_out(false) {}
    
    static EmbeddingResult ok(const std::vector<float>& v) {
        EmbeddingResult r;
        r.success = true;
        r.vector = v;
        return r;
    }
    
    static EmbeddingResult fail(const std::string& err, bool timeout = false) {
        EmbeddingResult r;
        r.error = err;
        r.timed_out = timeout;
        return r;
    }
};

class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() {}
    
    virtual EmbeddingResult embed(const std::string& text) = 0;
    
    // Default loops over embed()
    virtual std::vector<EmbeddingResult> embed_batch(const std::vector<std::string>& texts);
    
    // Identifies the model in cache keys ("mock-256", "ollama:nomic-embed-text")
    virtual std::string name() const = 0;
    
    // 0 when unknown until the first reply
    virtual int dimensions() const = 0;
};

// Deterministic feature-hashed bag of words. Texts sharing tokens get a
// positive cosine; identical texts get identical vectors.
class MockEmbeddingProvider : public EmbeddingProvider {
public:
    explicit MockEmbeddingProvider(int dimensions = 256);
    
    EmbeddingResult embed(const std::string& text) override;
    std::string name() const override;
    int dimensions() const override { return dimensions_; }
    
    // Failure / latency injection for degradation tests
    void set_failing(bool failing) { failing_ = failing; }
    void set_delay_ms(int ms) { delay_ms_ = ms; }
    
    int call_count() const { return calls_; }

private:
    int dimensions_;
    std::atomic<bool> failing_;
    std::atomic<int> delay_ms_;
    std::atomic<int> calls_;
};

// Remote embedding endpoint over HTTP (libcurl)
//   ollama: POST {base}/api/embeddings  {"model","prompt"} -> {"embedding":[...]}
//   openai: POST {base}/v1/embeddings   {"model","input"}  -> {"data":[{"embedding":[...]}]}
class HttpEmbeddingProvider : public EmbeddingProvider {
public:
    enum Flavor { OLLAMA, OPENAI };
    
    HttpEmbeddingProvider(Flavor flavor, const EmbeddingConfig& config);
    
    EmbeddingResult embed(const std::string& text) override;
    std::string name() const override;
    int dimensions() const override { return dimensions_; }
    
    std::string endpoint() const;
    
    // Extract the vector from a reply body; false when absent or empty
    static bool parse_reply(Flavor flavor, const Json& body, std::vector<float>& out);

private:
    Flavor flavor_;
    EmbeddingConfig config_;
    std::atomic<int> dimensions_;
};

// Build the provider named by config.provider. "none" yields nullptr
// (lexical-only engine); unknown names fall back to the mock.
std::shared_ptr<EmbeddingProvider> create_embedding_provider(const EmbeddingConfig& config);

// 0 when lengths differ or either vector has zero norm
double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

} // namespace agentmem

#endif // AGENTMEM_MEMORY_EMBEDDING_HPP
