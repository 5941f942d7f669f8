/*
 * agentmem - Memory Maintenance CLI
 * 
 * Loads a memory snapshot, runs one consolidation pass, writes the
 * snapshot back and prints the prompt context for a query.
 * 
 * Usage:
 *   ./agentmem-cli <config.json> <snapshot.db> [query]
 */

#include <agentmem/core/logger.hpp>
#include <agentmem/core/config.hpp>
#include <agentmem/core/utils.hpp>
#include <agentmem/memory/types.hpp>
#include <agentmem/memory/embedding.hpp>
#include <agentmem/memory/engine.hpp>
#include <agentmem/memory/sqlite_persistence.hpp>

#include <iostream>
#include <cstring>
#include <memory>
#include <string>
#include <vector>
#include <curl/curl.h>

namespace agentmem {

static const char* APP_NAME = "agentmem";
static const char* APP_VERSION = "0.1.0";

static void print_usage(const char* prog) {
    std::cout << APP_NAME << " - tiered agent memory maintenance\n\n"
              << "Usage: " << prog << " [options] <config.json> <snapshot.db> [query]\n\n"
              << "Options:\n"
              << "  -h, --help     Show this help message\n"
              << "  -v, --version  Show version\n\n"
              << "Config file format (JSON):\n"
              << "  {\n"
              << "    \"log_level\": \"info\",\n"
              << "    \"memory\": { \"workingMemoryLimit\": 7, \"episodicRetentionDays\": 30 },\n"
              << "    \"embedding\": { \"provider\": \"ollama\", \"model\": \"nomic-embed-text\" }\n"
              << "  }\n";
}

static int run(const std::string& config_path, const std::string& db_path, const std::string& query) {
    Config config;
    if (!config.load_file(config_path)) {
        std::cerr << "Cannot load config " << config_path << "\n";
        return 1;
    }
    Logger::instance().set_level(parse_log_level(config.get_string("log_level", "info")));
    
    EngineConfig engine_config = EngineConfig::from_config(config);
    EmbeddingConfig embedding_config = EmbeddingConfig::from_config(config);
    
    std::unique_ptr<MemoryEngine> engine;
    try {
        engine.reset(new MemoryEngine(engine_config, create_embedding_provider(embedding_config)));
    } catch (const InvalidConfigurationError& e) {
        LOG_ERROR("%s", e.what());
        return 1;
    }
    
    SqlitePersistence snapshot;
    if (!snapshot.open(db_path)) {
        std::cerr << "Cannot open snapshot " << db_path << ": " << snapshot.last_error() << "\n";
        return 1;
    }
    if (!engine->load_snapshot(snapshot)) {
        return 1;
    }
    
    ConsolidationReport report = engine->consolidate();
    LOG_INFO("Consolidation: %d promoted, %d expired, %d merged",
             static_cast<int>(report.promoted.size()),
             static_cast<int>(report.expired.size()),
             static_cast<int>(report.merged.size()));
    
    if (!engine->save_snapshot(snapshot)) {
        return 1;
    }
    
    std::cout << engine->format_context_for_prompt(engine->assemble_context(query));
    
    MemoryStats stats = engine->stats();
    uint64_t lookups = stats.cache_hits + stats.cache_misses;
    LOG_INFO("Memory: %d items, embedding cache hit rate %s",
             static_cast<int>(stats.total()),
             format_fixed(lookups > 0 ? static_cast<double>(stats.cache_hits) / lookups : 0.0, 2).c_str());
    return 0;
}

} // namespace agentmem

int main(int argc, char* argv[]) {
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            agentmem::print_usage(argv[0]);
            return 0;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << agentmem::APP_NAME << " v" << agentmem::APP_VERSION << "\n";
            return 0;
        }
        positional.push_back(argv[i]);
    }
    if (positional.size() < 2) {
        agentmem::print_usage(argv[0]);
        return 1;
    }
    
    // Before any provider threads start
    curl_global_init(CURL_GLOBAL_ALL);
    int result = agentmem::run(positional[0], positional[1],
                               positional.size() > 2 ? positional[2] : std::string());
    curl_global_cleanup();
    return result;
}
