// Tests for filters, tier search and similarity search

#include <agentmem/memory/retrieval.hpp>
#include <agentmem/memory/embedder.hpp>
#include <agentmem/memory/embedding.hpp>
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace agentmem;

namespace {

MemoryItem stamped(MemoryItem item, const std::string& id, int64_t ts) {
    item.id = id;
    item.timestamp = ts;
    return item;
}

} // namespace

class RetrievalTest : public test::QuietTest {
protected:
    RetrievalTest()
        : mock_(std::make_shared<MockEmbeddingProvider>(128))
        , embedder_(mock_, 64, 0)
        , retrieval_(embedder_) {}
    
    std::vector<MemoryItem> facts() const {
        std::vector<MemoryItem> out;
        out.push_back(stamped(MemoryItem::make_semantic(
            "Python is an interpreted programming language", "programming", 0.9), "py", 1));
        out.push_back(stamped(MemoryItem::make_semantic(
            "The Eiffel Tower is in Paris", "geography", 0.99), "eiffel", 2));
        out.push_back(stamped(MemoryItem::make_semantic(
            "JavaScript runs in web browsers", "programming", 0.95), "js", 3));
        return out;
    }
    
    std::shared_ptr<MockEmbeddingProvider> mock_;
    Embedder embedder_;
    RetrievalEngine retrieval_;
};

TEST_F(RetrievalTest, FilterByParticipant) {
    std::vector<std::string> alice(1, "alice");
    std::vector<std::string> bob(1, "bob");
    std::vector<MemoryItem> episodes;
    episodes.push_back(MemoryItem::make_episodic("Met Alice at the conference", "meeting", alice, 0.5, 0.7));
    episodes.push_back(MemoryItem::make_episodic("Called Bob", "call", bob, 0.0, 0.4));
    
    std::vector<MemoryItem> found = RetrievalEngine::filter_by_participant(episodes, "alice");
    ASSERT_EQ(1u, found.size());
    EXPECT_NE(std::string::npos, found[0].content.find("Alice"));
    EXPECT_TRUE(RetrievalEngine::filter_by_participant(episodes, "carol").empty());
}

TEST_F(RetrievalTest, FilterByCategory) {
    std::vector<MemoryItem> items;
    items.push_back(MemoryItem::make_semantic("React is a UI library", "frontend", 0.9));
    items.push_back(MemoryItem::make_semantic("PostgreSQL is a database", "backend", 0.9));
    
    std::vector<MemoryItem> frontend = RetrievalEngine::filter_by_category(items, "frontend");
    ASSERT_EQ(1u, frontend.size());
    EXPECT_NE(std::string::npos, frontend[0].content.find("React"));
    EXPECT_TRUE(RetrievalEngine::filter_by_category(items, "Frontend").empty());
}

TEST_F(RetrievalTest, FilterByPrerequisite) {
    std::vector<MemoryItem> skills;
    skills.push_back(MemoryItem::make_procedural("Basics", "react_basics",
        std::vector<std::string>(1, "Create component")));
    skills.push_back(MemoryItem::make_procedural("Advanced", "react_advanced",
        std::vector<std::string>(1, "Use hooks"), std::vector<std::string>(1, "react_basics")));
    
    std::vector<MemoryItem> advanced = RetrievalEngine::filter_by_prerequisite(skills, "react_basics");
    ASSERT_EQ(1u, advanced.size());
    EXPECT_EQ("react_advanced", advanced[0].procedural.skill_name);
}

TEST_F(RetrievalTest, SearchTierSortsByKeyWithNewestFirstOnTies) {
    std::vector<MemoryItem> items;
    items.push_back(stamped(MemoryItem::make_episodic("Low importance event", "e",
        std::vector<std::string>(), 0.0, 0.2), "low", 10));
    items.push_back(stamped(MemoryItem::make_episodic("High importance event", "e",
        std::vector<std::string>(), 0.0, 0.9), "high", 20));
    items.push_back(stamped(MemoryItem::make_episodic("Older tie", "e",
        std::vector<std::string>(), 0.0, 0.5), "old", 30));
    items.push_back(stamped(MemoryItem::make_episodic("Newer tie", "e",
        std::vector<std::string>(), 0.0, 0.5), "new", 40));
    
    std::vector<MemoryItem> r = RetrievalEngine::search_tier(items, "", 10, SortKey::IMPORTANCE);
    ASSERT_EQ(4u, r.size());
    EXPECT_EQ("high", r[0].id);
    EXPECT_EQ("new", r[1].id);
    EXPECT_EQ("old", r[2].id);
    EXPECT_EQ("low", r[3].id);
    
    r = RetrievalEngine::search_tier(items, "", 2, SortKey::IMPORTANCE);
    EXPECT_EQ(2u, r.size());
    EXPECT_TRUE(RetrievalEngine::search_tier(items, "", 0, SortKey::IMPORTANCE).empty());
}

TEST_F(RetrievalTest, SearchTierMatchesContentAndTagsCaseInsensitively) {
    std::vector<std::string> alice(1, "Alice");
    std::vector<MemoryItem> items;
    items.push_back(stamped(MemoryItem::make_episodic("Shipped v1", "MILESTONE", alice, 0.8, 0.9), "m", 1));
    items.push_back(stamped(MemoryItem::make_episodic("Lunch", "social", std::vector<std::string>(), 0.2, 0.1), "l", 2));
    
    EXPECT_EQ(1u, RetrievalEngine::search_tier(items, "shipped", 5, SortKey::TIMESTAMP).size());
    EXPECT_EQ(1u, RetrievalEngine::search_tier(items, "milestone", 5, SortKey::TIMESTAMP).size());
    EXPECT_EQ(1u, RetrievalEngine::search_tier(items, "alice", 5, SortKey::TIMESTAMP).size());
    EXPECT_TRUE(RetrievalEngine::search_tier(items, "nothing here", 5, SortKey::TIMESTAMP).empty());
}

TEST_F(RetrievalTest, InapplicableSortKeyReadsAsZero) {
    MemoryItem fact = MemoryItem::make_semantic("f", "c", 0.7);
    EXPECT_DOUBLE_EQ(0.0, sort_value(fact, SortKey::IMPORTANCE));
    EXPECT_DOUBLE_EQ(0.7, sort_value(fact, SortKey::CONFIDENCE));
}

TEST_F(RetrievalTest, SortKeyNames) {
    SortKey key;
    ASSERT_TRUE(string_to_sort_key("successRate", key));
    EXPECT_EQ(SortKey::SUCCESS_RATE, key);
    ASSERT_TRUE(string_to_sort_key("average_execution_time", key));
    EXPECT_EQ(SortKey::AVERAGE_EXECUTION_TIME, key);
    EXPECT_EQ("emotionalValence", sort_key_to_string(SortKey::EMOTIONAL_VALENCE));
    EXPECT_FALSE(string_to_sort_key("popularity", key));
}

TEST_F(RetrievalTest, SemanticSearchRanksBySimilarity) {
    SearchResults r = retrieval_.semantic_search(facts(), "programming languages like Python", 5);
    EXPECT_FALSE(r.degraded);
    ASSERT_EQ(3u, r.items.size());
    EXPECT_EQ("py", r.items[0].item.id);
    for (size_t i = 1; i < r.items.size(); ++i) {
        EXPECT_GE(r.items[i - 1].score, r.items[i].score);
    }
    EXPECT_EQ(3u, r.total_searched);
}

TEST_F(RetrievalTest, SemanticSearchHonoursLimit) {
    EXPECT_EQ(1u, retrieval_.semantic_search(facts(), "programming", 1).items.size());
    EXPECT_TRUE(retrieval_.semantic_search(facts(), "programming", 0).items.empty());
}

TEST_F(RetrievalTest, ItemEmbeddingsAreCached) {
    retrieval_.semantic_search(facts(), "first query", 5);
    int calls = mock_->call_count();
    retrieval_.semantic_search(facts(), "second query", 5);
    EXPECT_EQ(calls + 1, mock_->call_count());
}

TEST_F(RetrievalTest, ProviderFailureFallsBackToLexical) {
    mock_->set_failing(true);
    SearchResults r = retrieval_.semantic_search(facts(), "Paris tower", 5);
    EXPECT_TRUE(r.degraded);
    EXPECT_FALSE(r.diagnostic.empty());
    ASSERT_EQ(1u, r.items.size());
    EXPECT_EQ("eiffel", r.items[0].item.id);
}

TEST_F(RetrievalTest, MissingProviderFallsBackToLexical) {
    Embedder none(std::shared_ptr<EmbeddingProvider>(), 8, 0);
    RetrievalEngine lexical(none);
    SearchResults r = lexical.semantic_search(facts(), "programming", 5);
    EXPECT_TRUE(r.degraded);
    ASSERT_EQ(2u, r.items.size());
    EXPECT_EQ("js", r.items[0].item.id);
}

TEST_F(RetrievalTest, SlowProviderTimesOutToLexical) {
    std::shared_ptr<MockEmbeddingProvider> slow = std::make_shared<MockEmbeddingProvider>(32);
    slow->set_delay_ms(400);
    Embedder embedder(slow, 8, 40);
    RetrievalEngine retrieval(embedder);
    
    SearchResults r = retrieval.semantic_search(facts(), "Eiffel", 5);
    EXPECT_TRUE(r.degraded);
    ASSERT_EQ(1u, r.items.size());
    EXPECT_EQ("eiffel", r.items[0].item.id);
}
