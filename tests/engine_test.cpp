// End-to-end tests for the memory engine facade

#include <agentmem/memory/engine.hpp>
#include <agentmem/memory/sqlite_persistence.hpp>
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <cstdio>
#include <thread>

using namespace agentmem;

class MemoryEngineTest : public test::QuietTest {
protected:
    void SetUp() override {
        test::QuietTest::SetUp();
        config_.working_memory_limit = 10;
        config_.episodic_retention_days = 30;
        config_.semantic_consolidation_threshold = 0.8;
        config_.procedural_min_executions = 3;
        mock_ = std::make_shared<MockEmbeddingProvider>(256);
        engine_.reset(new MemoryEngine(config_, mock_, clock_.clock()));
    }
    
    EngineConfig config_;
    test::ManualClock clock_;
    std::shared_ptr<MockEmbeddingProvider> mock_;
    std::unique_ptr<MemoryEngine> engine_;
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(MemoryEngineTest, RejectsInvalidConfiguration) {
    EngineConfig bad;
    bad.working_memory_limit = -1;
    EXPECT_THROW(MemoryEngine engine(bad), InvalidConfigurationError);
    
    bad = EngineConfig();
    bad.procedural_min_executions = -1;
    EXPECT_THROW(MemoryEngine engine(bad), InvalidConfigurationError);
}

// ============================================================================
// Working memory
// ============================================================================

TEST_F(MemoryEngineTest, StoresAndRetrievesWorkingItems) {
    std::string id = engine_->store(MemoryItem::make_working("The user asked about TypeScript", 0.9, 0.1,
                                                             "conversation"));
    MemoryItem out;
    ASSERT_TRUE(engine_->retrieve(id, out));
    EXPECT_EQ("The user asked about TypeScript", out.content);
    EXPECT_EQ(MemoryTier::WORKING, out.tier);
    EXPECT_FALSE(engine_->retrieve("unknown", out));
}

TEST_F(MemoryEngineTest, WorkingLimitKeepsTheTenMostAttended) {
    std::vector<std::string> ids;
    for (int i = 0; i < 15; ++i) {
        ids.push_back(engine_->store(MemoryItem::make_working("Item " + std::to_string(i), i * 0.05, 0.1)));
    }
    ASSERT_EQ(10u, engine_->get_all_by_tier(MemoryTier::WORKING).size());
    MemoryItem out;
    for (int i = 0; i < 5; ++i) {
        EXPECT_FALSE(engine_->retrieve(ids[i], out));
    }
    EXPECT_EQ(5u, engine_->stats().evictions);
}

TEST_F(MemoryEngineTest, TickDecaysAttention) {
    std::string id = engine_->store(MemoryItem::make_working("Decaying", 1.0, 0.5));
    EXPECT_EQ(1, engine_->tick(2));
    MemoryItem out;
    ASSERT_TRUE(engine_->retrieve(id, out));
    EXPECT_DOUBLE_EQ(0.25, out.working.attention);
    
    EXPECT_EQ(0, engine_->tick(0));
    EXPECT_EQ(0, engine_->tick(-3));
    ASSERT_TRUE(engine_->retrieve(id, out));
    EXPECT_DOUBLE_EQ(0.25, out.working.attention);
}

TEST_F(MemoryEngineTest, RetrieveDoesNotDecay) {
    std::string id = engine_->store(MemoryItem::make_working("Stable", 0.8, 0.5));
    MemoryItem out;
    for (int i = 0; i < 5; ++i) ASSERT_TRUE(engine_->retrieve(id, out));
    EXPECT_DOUBLE_EQ(0.8, out.working.attention);
}

TEST_F(MemoryEngineTest, ReinforceUnknownIdIsNotFound) {
    OpResult r = engine_->reinforce("missing");
    EXPECT_FALSE(r.success);
    EXPECT_TRUE(r.not_found());
}

// ============================================================================
// Episodic, semantic, procedural
// ============================================================================

TEST_F(MemoryEngineTest, QueriesByParticipantAndSortsByImportance) {
    engine_->store(MemoryItem::make_episodic("Met Alice at the conference", "meeting",
        std::vector<std::string>(1, "alice"), 0.6, 0.7));
    engine_->store(MemoryItem::make_episodic("Low importance event", "note",
        std::vector<std::string>(1, "bob"), 0.0, 0.1));
    engine_->store(MemoryItem::make_episodic("High importance event", "milestone",
        std::vector<std::string>(1, "bob"), 0.9, 0.95));
    
    std::vector<MemoryItem> alice = engine_->query_by_participant("alice");
    ASSERT_EQ(1u, alice.size());
    EXPECT_NE(std::string::npos, alice[0].content.find("Alice"));
    
    std::vector<MemoryItem> top = engine_->search_by_tier(MemoryTier::EPISODIC, "", 5, SortKey::IMPORTANCE);
    ASSERT_EQ(3u, top.size());
    EXPECT_NE(std::string::npos, top[0].content.find("High importance"));
    
    std::vector<MemoryItem> events = engine_->search_by_tier(MemoryTier::EPISODIC, "event", 5, SortKey::IMPORTANCE);
    EXPECT_EQ(2u, events.size());
}

TEST_F(MemoryEngineTest, SemanticSearchFindsProgrammingFacts) {
    engine_->store(MemoryItem::make_semantic("Python is an interpreted programming language", "programming", 0.9));
    engine_->store(MemoryItem::make_semantic("The Eiffel Tower is in Paris", "geography", 0.99));
    engine_->store(MemoryItem::make_semantic("JavaScript runs in web browsers", "programming", 0.95));
    
    SearchResults r = engine_->semantic_search("programming languages", MemoryTier::SEMANTIC, 5);
    EXPECT_FALSE(r.degraded);
    ASSERT_FALSE(r.items.empty());
    EXPECT_EQ("Python is an interpreted programming language", r.items[0].item.content);
    
    std::vector<MemoryItem> frontend = engine_->query_by_category("geography");
    ASSERT_EQ(1u, frontend.size());
}

TEST_F(MemoryEngineTest, DegradedSearchIsCountedAndReported) {
    std::vector<MemoryEvent> seen;
    engine_->add_listener([&seen](const MemoryEvent& e) { seen.push_back(e); });
    engine_->store(MemoryItem::make_semantic("The Eiffel Tower is in Paris", "geography", 0.99));
    
    mock_->set_failing(true);
    SearchResults r = engine_->semantic_search("Paris", MemoryTier::SEMANTIC, 5);
    EXPECT_TRUE(r.degraded);
    ASSERT_EQ(1u, r.items.size());
    EXPECT_EQ(1u, engine_->stats().degraded_searches);
    ASSERT_FALSE(seen.empty());
    EXPECT_EQ(MemoryEventType::DEGRADED, seen.back().type);
}

TEST_F(MemoryEngineTest, HungProviderDoesNotStallTeardown) {
    std::shared_ptr<MockEmbeddingProvider> slow = std::make_shared<MockEmbeddingProvider>(64);
    slow->set_delay_ms(1000);
    EngineConfig config = config_;
    config.embedding_timeout_ms = 20;
    
    std::chrono::steady_clock::time_point searched;
    {
        MemoryEngine engine(config, slow, clock_.clock());
        engine.store(MemoryItem::make_semantic("The Eiffel Tower is in Paris", "geography", 0.99));
        for (int i = 0; i < 5; ++i) {
            SearchResults r = engine.semantic_search("Paris " + std::to_string(i), MemoryTier::SEMANTIC, 5);
            EXPECT_TRUE(r.degraded);
        }
        EXPECT_EQ(5u, engine.stats().degraded_searches);
        searched = std::chrono::steady_clock::now();
    }
    long long teardown_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - searched).count();
    EXPECT_LT(teardown_ms, 2000);
}

TEST_F(MemoryEngineTest, TracksSkillExecutions) {
    std::string id = engine_->store(MemoryItem::make_procedural("Deploy the app", "deploy_app",
        std::vector<std::string>(4, "step")));
    MemoryItem out;
    ASSERT_TRUE(engine_->retrieve(id, out));
    EXPECT_EQ(4u, out.procedural.steps.size());
    
    EXPECT_TRUE(engine_->record_execution(id, true, 5000).success);
    EXPECT_TRUE(engine_->record_execution(id, true, 3000).success);
    EXPECT_TRUE(engine_->record_execution(id, false, 8000).success);
    
    ASSERT_TRUE(engine_->get_skill("DEPLOY_APP", out));
    EXPECT_EQ(3, out.procedural.execution_count);
    EXPECT_NEAR(0.667, out.procedural.success_rate, 0.001);
    EXPECT_NEAR(5333.33, out.procedural.average_execution_time, 0.01);
}

TEST_F(MemoryEngineTest, RecordExecutionRejectsUnknownAndWrongTier) {
    OpResult missing = engine_->record_execution("missing", true, 10);
    EXPECT_EQ(MemoryError::NOT_FOUND, missing.error);
    
    std::string fact = engine_->store(MemoryItem::make_semantic("fact", "c", 0.5));
    OpResult wrong = engine_->record_execution(fact, true, 10);
    EXPECT_FALSE(wrong.success);
    EXPECT_EQ(MemoryError::WRONG_TIER, wrong.error);
}

TEST_F(MemoryEngineTest, StoringAKnownSkillUpdatesIt) {
    std::string first = engine_->store(MemoryItem::make_procedural("v1", "build",
        std::vector<std::string>(1, "make")));
    engine_->record_execution(first, true, 100);
    
    std::string second = engine_->store(MemoryItem::make_procedural("v2", "Build",
        std::vector<std::string>(2, "cmake")));
    EXPECT_EQ(first, second);
    
    MemoryItem out;
    ASSERT_TRUE(engine_->retrieve(first, out));
    EXPECT_EQ("v2", out.content);
    EXPECT_EQ(2u, out.procedural.steps.size());
    EXPECT_EQ(1, out.procedural.execution_count);
    EXPECT_EQ(1u, engine_->get_all_by_tier(MemoryTier::PROCEDURAL).size());
}

TEST_F(MemoryEngineTest, StoredSkillStartsWithoutExecutionHistory) {
    MemoryItem claimed = MemoryItem::make_procedural("Deploy", "deploy", std::vector<std::string>(1, "push"));
    claimed.procedural.execution_count = 50;
    claimed.procedural.success_rate = 1.0;
    claimed.procedural.average_execution_time = 250;
    std::string id = engine_->store(claimed);
    
    MemoryItem out;
    ASSERT_TRUE(engine_->retrieve(id, out));
    EXPECT_EQ(0, out.procedural.execution_count);
    EXPECT_DOUBLE_EQ(0.0, out.procedural.success_rate);
    EXPECT_DOUBLE_EQ(0.0, out.procedural.average_execution_time);
    EXPECT_TRUE(engine_->available_skills().empty());
    
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(engine_->record_execution(id, true, 100).success);
    }
    ASSERT_EQ(1u, engine_->available_skills().size());
    
    // Re-storing by id keeps the recorded history
    MemoryItem again = claimed;
    again.id = id;
    again.procedural.skill_name = "deploy_v2";
    engine_->store(again);
    ASSERT_TRUE(engine_->retrieve(id, out));
    EXPECT_EQ(3, out.procedural.execution_count);
    EXPECT_DOUBLE_EQ(1.0, out.procedural.success_rate);
}

TEST_F(MemoryEngineTest, QueriesByPrerequisite) {
    engine_->store(MemoryItem::make_procedural("Basics", "react_basics", std::vector<std::string>(1, "jsx")));
    engine_->store(MemoryItem::make_procedural("Advanced", "react_advanced", std::vector<std::string>(1, "hooks"),
                                               std::vector<std::string>(1, "react_basics")));
    std::vector<MemoryItem> advanced = engine_->query_by_prerequisite("react_basics");
    ASSERT_EQ(1u, advanced.size());
    EXPECT_EQ("react_advanced", advanced[0].procedural.skill_name);
}

// ============================================================================
// Consolidation
// ============================================================================

TEST_F(MemoryEngineTest, ReinforcedWorkingItemIsPromoted) {
    std::string id = engine_->store(MemoryItem::make_working("Important insight", 0.8, 0.01));
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(engine_->reinforce(id).success);
    }
    ConsolidationReport report = engine_->consolidate();
    ASSERT_EQ(1u, report.promoted.size());
    
    std::vector<MemoryItem> working = engine_->get_all_by_tier(MemoryTier::WORKING);
    std::vector<MemoryItem> episodic = engine_->get_all_by_tier(MemoryTier::EPISODIC);
    EXPECT_TRUE(working.empty());
    ASSERT_EQ(1u, episodic.size());
    EXPECT_EQ("Important insight", episodic[0].content);
    EXPECT_EQ(id, episodic[0].id);
    EXPECT_EQ(1u, engine_->stats().promotions);
}

TEST_F(MemoryEngineTest, ConsolidationExpiresOldEpisodes) {
    engine_->store(MemoryItem::make_episodic("Ancient", "chat", std::vector<std::string>(), 0.0, 0.5));
    clock_.advance_days(31);
    std::string fresh = engine_->store(MemoryItem::make_episodic("Fresh", "chat",
                                                                 std::vector<std::string>(), 0.0, 0.5));
    ConsolidationReport report = engine_->consolidate();
    EXPECT_EQ(1u, report.expired.size());
    std::vector<MemoryItem> episodic = engine_->get_all_by_tier(MemoryTier::EPISODIC);
    ASSERT_EQ(1u, episodic.size());
    EXPECT_EQ(fresh, episodic[0].id);
}

TEST_F(MemoryEngineTest, MergeRelatedSemanticsReturnsCount) {
    engine_->store(MemoryItem::make_semantic("TypeScript is a typed superset of JavaScript", "programming", 0.8,
                                             std::vector<Relation>(1, Relation("extends", "JavaScript"))));
    engine_->store(MemoryItem::make_semantic("TypeScript is a typed superset of JavaScript.", "programming", 0.9,
                                             std::vector<Relation>(1, Relation("compiles_to", "JavaScript"))));
    engine_->store(MemoryItem::make_semantic("Go has goroutines", "programming", 0.9));
    
    EXPECT_EQ(0, engine_->merge_related_semantics("geography"));
    EXPECT_EQ(1, engine_->merge_related_semantics("programming"));
    
    std::vector<MemoryItem> facts = engine_->query_by_category("programming");
    ASSERT_EQ(2u, facts.size());
    const MemoryItem& merged = facts[1];
    EXPECT_DOUBLE_EQ(0.9, merged.semantic.confidence);
    EXPECT_EQ(2u, merged.semantic.relations.size());
    EXPECT_EQ(1u, engine_->stats().merges);
}

TEST_F(MemoryEngineTest, ConsolidateCanSkipMerging) {
    config_.merge_on_consolidate = false;
    MemoryEngine engine(config_, mock_, clock_.clock());
    engine.store(MemoryItem::make_semantic("Same fact", "c", 0.5));
    engine.store(MemoryItem::make_semantic("Same fact", "c", 0.6));
    EXPECT_TRUE(engine.consolidate().merged.empty());
    EXPECT_EQ(2u, engine.get_all_by_tier(MemoryTier::SEMANTIC).size());
}

// ============================================================================
// Context assembly
// ============================================================================

TEST_F(MemoryEngineTest, AssemblesContextForPrompt) {
    engine_->store(MemoryItem::make_working("Current topic: API design", 0.95, 0.1, "conversation"));
    engine_->store(MemoryItem::make_semantic("REST APIs use HTTP methods", "api", 0.9));
    std::string rest = engine_->store(MemoryItem::make_procedural("How to design a REST endpoint", "rest_design",
                                                                  std::vector<std::string>(3, "step")));
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(engine_->record_execution(rest, i != 2, 1000).success);
    }
    
    AssembledContext context = engine_->assemble_context("How do I design an API?");
    EXPECT_EQ(1u, context.working_context.size());
    EXPECT_FALSE(context.relevant_facts.empty());
    EXPECT_EQ(1u, context.available_skills.size());
    
    std::string prompt = engine_->format_context_for_prompt(context);
    EXPECT_NE(std::string::npos, prompt.find("REST APIs use HTTP methods"));
    EXPECT_NE(std::string::npos, prompt.find("rest_design"));
}

TEST_F(MemoryEngineTest, ContextFactsAreBounded) {
    config_.context_fact_limit = 2;
    MemoryEngine engine(config_, mock_, clock_.clock());
    for (int i = 0; i < 6; ++i) {
        engine.store(MemoryItem::make_semantic("fact number " + std::to_string(i), "c" + std::to_string(i), 0.5));
    }
    EXPECT_EQ(2u, engine.assemble_context("fact").relevant_facts.size());
}

// ============================================================================
// Events, stats, clear
// ============================================================================

TEST_F(MemoryEngineTest, ListenersReceiveEventsInOrder) {
    std::vector<MemoryEventType> types;
    int listener = engine_->add_listener([&types](const MemoryEvent& e) { types.push_back(e.type); });
    
    std::string id = engine_->store(MemoryItem::make_working("w", 0.5, 0.1));
    engine_->reinforce(id);
    engine_->clear();
    
    ASSERT_EQ(3u, types.size());
    EXPECT_EQ(MemoryEventType::STORED, types[0]);
    EXPECT_EQ(MemoryEventType::REINFORCED, types[1]);
    EXPECT_EQ(MemoryEventType::CLEARED, types[2]);
    
    EXPECT_TRUE(engine_->remove_listener(listener));
    engine_->store(MemoryItem::make_working("w2", 0.5, 0.1));
    EXPECT_EQ(3u, types.size());
}

TEST_F(MemoryEngineTest, ThrowingListenerDoesNotFailTheCall) {
    engine_->add_listener([](const MemoryEvent&) { throw std::runtime_error("listener bug"); });
    int delivered = 0;
    engine_->add_listener([&delivered](const MemoryEvent&) { ++delivered; });
    
    std::string id;
    EXPECT_NO_THROW(id = engine_->store(MemoryItem::make_working("w", 0.5, 0.1)));
    EXPECT_FALSE(id.empty());
    EXPECT_EQ(1, delivered);
}

TEST_F(MemoryEngineTest, ListenerMayCallBackIntoEngine) {
    size_t seen_size = 0;
    MemoryEngine* engine = engine_.get();
    engine_->add_listener([engine, &seen_size](const MemoryEvent&) { seen_size = engine->size(); });
    engine_->store(MemoryItem::make_semantic("fact", "c", 0.5));
    EXPECT_EQ(1u, seen_size);
}

TEST_F(MemoryEngineTest, StatsCountTiers) {
    engine_->store(MemoryItem::make_working("w", 0.5, 0.1));
    engine_->store(MemoryItem::make_semantic("s", "c", 0.5));
    engine_->store(MemoryItem::make_semantic("t", "c", 0.5));
    MemoryStats s = engine_->stats();
    EXPECT_EQ(1u, s.working);
    EXPECT_EQ(2u, s.semantic);
    EXPECT_EQ(3u, s.total());
    EXPECT_EQ(3u, s.total_stored);
    
    engine_->clear();
    EXPECT_EQ(0u, engine_->size());
}

TEST_F(MemoryEngineTest, ConcurrentWritersRespectTheWorkingLimit) {
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.push_back(std::thread([this, t]() {
            for (int i = 0; i < 50; ++i) {
                std::string id = engine_->store(MemoryItem::make_working(
                    "thread " + std::to_string(t) + " item " + std::to_string(i), (i % 10) / 10.0, 0.1));
                engine_->reinforce(id);
                engine_->tick(1);
            }
        }));
    }
    for (size_t i = 0; i < writers.size(); ++i) writers[i].join();
    
    std::vector<MemoryItem> working = engine_->get_all_by_tier(MemoryTier::WORKING);
    EXPECT_EQ(10u, working.size());
    for (size_t i = 0; i < working.size(); ++i) {
        EXPECT_GE(working[i].working.attention, 0.0);
        EXPECT_LE(working[i].working.attention, 1.0);
    }
}

// ============================================================================
// Snapshots
// ============================================================================

TEST_F(MemoryEngineTest, JsonExportImportRestoresState) {
    std::string w = engine_->store(MemoryItem::make_working("w", 0.7, 0.2));
    engine_->store(MemoryItem::make_semantic("s", "c", 0.5, std::vector<Relation>(1, Relation("is_a", "x"))));
    engine_->store(MemoryItem::make_procedural("p", "skill", std::vector<std::string>(2, "go")));
    std::string exported = engine_->export_json(2);
    
    MemoryEngine copy(config_, mock_, clock_.clock());
    ASSERT_TRUE(copy.import_json(exported));
    EXPECT_EQ(3u, copy.size());
    MemoryItem out;
    ASSERT_TRUE(copy.retrieve(w, out));
    EXPECT_DOUBLE_EQ(0.7, out.working.attention);
    EXPECT_EQ(exported, copy.export_json(2));
}

TEST_F(MemoryEngineTest, ImportRejectsMalformedDocumentsAndKeepsState) {
    engine_->store(MemoryItem::make_semantic("keep me", "c", 0.5));
    std::string error;
    EXPECT_FALSE(engine_->import_json("{not json", &error));
    EXPECT_FALSE(error.empty());
    EXPECT_FALSE(engine_->import_json("{\"items\": [{\"tier\": \"bogus\"}]}"));
    EXPECT_EQ(1u, engine_->size());
}

TEST_F(MemoryEngineTest, ImportKeepsOneCopyOfARepeatedSkill) {
    const char* doc =
        "{\"version\": 1, \"items\": ["
        "{\"id\": \"a\", \"timestamp\": 10, \"tier\": \"procedural\", \"content\": \"first\","
        " \"skillName\": \"deploy\", \"executionCount\": 4},"
        "{\"id\": \"b\", \"timestamp\": 20, \"tier\": \"procedural\", \"content\": \"second\","
        " \"skillName\": \"Deploy\", \"executionCount\": 9}"
        "]}";
    ASSERT_TRUE(engine_->import_json(doc));
    
    std::vector<MemoryItem> skills = engine_->get_all_by_tier(MemoryTier::PROCEDURAL);
    ASSERT_EQ(1u, skills.size());
    EXPECT_EQ("a", skills[0].id);
    EXPECT_EQ(4, skills[0].procedural.execution_count);
}

TEST_F(MemoryEngineTest, SqliteSnapshotRoundTrip) {
    std::string path = test::temp_path("snapshot.db");
    std::remove(path.c_str());
    
    std::string fact = engine_->store(MemoryItem::make_semantic("Paris is in France", "geography", 0.9,
                                                                std::vector<Relation>(1, Relation("in", "France"))));
    std::string skill = engine_->store(MemoryItem::make_procedural("Deploy", "deploy",
                                                                   std::vector<std::string>(2, "push")));
    engine_->record_execution(skill, true, 1200);
    {
        SqlitePersistence db;
        ASSERT_TRUE(db.open(path)) << db.last_error();
        ASSERT_TRUE(engine_->save_snapshot(db));
        EXPECT_EQ(2, db.count());
        EXPECT_EQ("1", db.get_meta("schema_version"));
    }
    
    MemoryEngine restored(config_, mock_, clock_.clock());
    SqlitePersistence db;
    ASSERT_TRUE(db.open(path));
    ASSERT_TRUE(restored.load_snapshot(db));
    
    MemoryItem out;
    ASSERT_TRUE(restored.retrieve(fact, out));
    EXPECT_EQ("geography", out.semantic.category);
    ASSERT_EQ(1u, out.semantic.relations.size());
    ASSERT_TRUE(restored.get_skill("deploy", out));
    EXPECT_EQ(skill, out.id);
    EXPECT_EQ(1, out.procedural.execution_count);
    EXPECT_DOUBLE_EQ(1200.0, out.procedural.average_execution_time);
    
    std::string later = restored.store(MemoryItem::make_semantic("later", "c", 0.5));
    MemoryItem later_item;
    ASSERT_TRUE(restored.retrieve(later, later_item));
    EXPECT_GE(later_item.timestamp, out.timestamp);
    
    db.close();
    std::remove(path.c_str());
}

TEST_F(MemoryEngineTest, SaveToClosedDatabaseFails) {
    SqlitePersistence db;
    EXPECT_FALSE(engine_->save_snapshot(db));
    EXPECT_FALSE(db.last_error().empty());
    std::vector<MemoryItem> items;
    EXPECT_FALSE(db.load_all(items));
}
