/*
 * agentmem - Embedding Providers Implementation
 */
#include <agentmem/memory/embedding.hpp>
#include <agentmem/core/http_client.hpp>
#include <agentmem/core/logger.hpp>
#include <agentmem/core/utils.hpp>
#include <cmath>

namespace agentmem {

std::vector<EmbeddingResult> EmbeddingProvider::embed_batch(const std::vector<std::string>& texts) {
    std::vector<EmbeddingResult> results;
    results.reserve(texts.size());
    for (size_t i = 0; i < texts.size(); ++i) {
        results.push_back(embed(texts[i]));
    }
    return results;
}

// ============ Mock ============

MockEmbeddingProvider::MockEmbeddingProvider(int dimensions)
    : dimensions_(dimensions > 0 ? dimensions : 256)
    , failing_(false)
    , delay_ms_(0)
    , calls_(0)
{
}

EmbeddingResult MockEmbeddingProvider::embed(const std::string& text) {
    ++calls_;
    sleep_ms(delay_ms_);
    if (failing_) {
        return EmbeddingResult::fail("mock provider set to fail");
    }
    
    std::vector<float> v(static_cast<size_t>(dimensions_), 0.0f);
    std::vector<std::string> tokens = tokenize(text);
    for (size_t i = 0; i < tokens.size(); ++i) {
        uint32_t h = fnv1a_32(tokens[i]);
        size_t bucket = h % static_cast<uint32_t>(dimensions_);
        v[bucket] += (h & 0x80000000u) ? -1.0f : 1.0f;
    }
    
    double norm = 0.0;
    for (size_t i = 0; i < v.size(); ++i) norm += static_cast<double>(v[i]) * v[i];
    if (norm > 0.0) {
        float inv = static_cast<float>(1.0 / std::sqrt(norm));
        for (size_t i = 0; i < v.size(); ++i) v[i] *= inv;
    }
    return EmbeddingResult::ok(v);
}

std::string MockEmbeddingProvider::name() const {
    return "mock-" + std::to_string(dimensions_);
}

// ============ HTTP ============

HttpEmbeddingProvider::HttpEmbeddingProvider(Flavor flavor, const EmbeddingConfig& config)
    : flavor_(flavor)
    , config_(config)
    , dimensions_(0)
{
    if (config_.base_url.empty()) {
        config_.base_url = flavor_ == OLLAMA ? "http://localhost:11434" : "https://api.openai.com";
    }
    if (config_.model.empty()) {
        config_.model = flavor_ == OLLAMA ? "nomic-embed-text" : "text-embedding-3-small";
    }
    while (!config_.base_url.empty() && config_.base_url[config_.base_url.size() - 1] == '/') {
        config_.base_url.erase(config_.base_url.size() - 1);
    }
}

std::string HttpEmbeddingProvider::endpoint() const {
    return config_.base_url + (flavor_ == OLLAMA ? "/api/embeddings" : "/v1/embeddings");
}

std::string HttpEmbeddingProvider::name() const {
    return std::string(flavor_ == OLLAMA ? "ollama:" : "openai:") + config_.model;
}

bool HttpEmbeddingProvider::parse_reply(Flavor flavor, const Json& body, std::vector<float>& out) {
    const Json* vec = nullptr;
    if (flavor == OLLAMA) {
        vec = &body["embedding"];
        // Newer Ollama builds answer /api/embed with "embeddings": [[...]]
        if (!vec->is_array() && body["embeddings"].is_array()) {
            vec = &body["embeddings"][0];
        }
    } else {
        vec = &body["data"][0]["embedding"];
    }
    if (!vec->is_array()) return false;
    out = vec->as_float_list();
    return !out.empty() && out.size() == vec->size();
}

EmbeddingResult HttpEmbeddingProvider::embed(const std::string& text) {
    Json body = Json::object();
    body.set("model", Json(config_.model));
    body.set(flavor_ == OLLAMA ? "prompt" : "input", Json(text));
    
    std::map<std::string, std::string> headers;
    if (!config_.api_key.empty()) {
        headers["Authorization"] = "Bearer " + config_.api_key;
    }
    
    // curl handles are not shareable across threads
    HttpClient http;
    http.set_timeout(config_.timeout_ms);
    HttpResponse resp = http.post_json(endpoint(), body, headers);
    if (!resp.ok()) {
        return EmbeddingResult::fail(name() + ": " + resp.error, resp.timed_out);
    }
    
    std::vector<float> vec;
    if (!parse_reply(flavor_, resp.json(), vec)) {
        return EmbeddingResult::fail(name() + ": reply has no embedding");
    }
    dimensions_ = static_cast<int>(vec.size());
    return EmbeddingResult::ok(vec);
}

// ============ Factory ============

std::shared_ptr<EmbeddingProvider> create_embedding_provider(const EmbeddingConfig& config) {
    std::string p = to_lower(trim(config.provider));
    if (p == "none" || p == "off") {
        LOG_INFO("Embedding provider disabled, similarity search is lexical only");
        return std::shared_ptr<EmbeddingProvider>();
    }
    if (p == "ollama") {
        return std::make_shared<HttpEmbeddingProvider>(HttpEmbeddingProvider::OLLAMA, config);
    }
    if (p == "openai") {
        if (config.api_key.empty()) {
            LOG_WARN("OpenAI embedding provider configured without apiKey");
        }
        return std::make_shared<HttpEmbeddingProvider>(HttpEmbeddingProvider::OPENAI, config);
    }
    if (!p.empty() && p != "mock") {
        LOG_WARN("Unknown embedding provider '%s', using mock", config.provider.c_str());
    }
    return std::make_shared<MockEmbeddingProvider>(config.dimensions);
}

double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) return 0.0;
    
    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        norm_a += static_cast<double>(a[i]) * a[i];
        norm_b += static_cast<double>(b[i]) * b[i];
    }
    
    double denom = std::sqrt(norm_a) * std::sqrt(norm_b);
    return denom == 0.0 ? 0.0 : dot / denom;
}

} // namespace agentmem
