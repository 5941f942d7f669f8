// Tests for the core layer: JSON, configuration, logging and utilities

#include <agentmem/core/json.hpp>
#include <agentmem/core/config.hpp>
#include <agentmem/core/logger.hpp>
#include <agentmem/core/utils.hpp>
#include <agentmem/core/thread_pool.hpp>
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <cmath>
#include <limits>
#include <atomic>
#include <future>

using namespace agentmem;

// ============================================================================
// Json
// ============================================================================

TEST(JsonTest, ParsesNestedDocument) {
    Json doc = Json::parse("{\"a\": {\"b\": [1, 2.5, \"x\", true, null]}, \"n\": -3}");
    ASSERT_TRUE(doc.is_object());
    const Json& arr = doc["a"]["b"];
    ASSERT_TRUE(arr.is_array());
    EXPECT_EQ(5u, arr.size());
    EXPECT_EQ(1, arr[0].as_int());
    EXPECT_DOUBLE_EQ(2.5, arr[1].as_number());
    EXPECT_EQ("x", arr[2].as_string());
    EXPECT_TRUE(arr[3].as_bool());
    EXPECT_TRUE(arr[4].is_null());
    EXPECT_EQ(-3, doc.get_int("n"));
}

TEST(JsonTest, MissingKeysReadAsNull) {
    Json doc = Json::parse("{\"a\": 1}");
    EXPECT_TRUE(doc["missing"].is_null());
    EXPECT_TRUE(doc["a"]["deeper"].is_null());
    EXPECT_EQ("fallback", doc.get_string("missing", "fallback"));
    EXPECT_TRUE(doc[7].is_null());
}

TEST(JsonTest, RejectsMalformedInput) {
    EXPECT_THROW(Json::parse(""), std::runtime_error);
    EXPECT_THROW(Json::parse("{\"a\": 1"), std::runtime_error);
    EXPECT_THROW(Json::parse("[1, 2] trailing"), std::runtime_error);
    EXPECT_THROW(Json::parse("\"unterminated"), std::runtime_error);
    EXPECT_THROW(Json::parse("{a: 1}"), std::runtime_error);
}

TEST(JsonTest, RejectsExcessiveNesting) {
    std::string deep(300, '[');
    deep += std::string(300, ']');
    EXPECT_THROW(Json::parse(deep), std::runtime_error);
}

TEST(JsonTest, DecodesUnicodeEscapes) {
    Json s = Json::parse("\"caf\\u00e9 \\ud83d\\ude00\"");
    EXPECT_EQ("caf\xc3\xa9 \xf0\x9f\x98\x80", s.as_string());
}

TEST(JsonTest, DumpsIntegersExactlyAndEscapesStrings) {
    Json obj = Json::object();
    obj.set("ts", Json(static_cast<int64_t>(1700000000123LL)));
    obj.set("text", Json("line\n\"quoted\""));
    EXPECT_EQ("{\"text\":\"line\\n\\\"quoted\\\"\",\"ts\":1700000000123}", obj.dump());
}

TEST(JsonTest, NonFiniteNumbersDumpAsNull) {
    Json arr = Json::array();
    arr.push(Json(std::numeric_limits<double>::infinity()));
    EXPECT_EQ("[null]", arr.dump());
}

TEST(JsonTest, DumpParsePreservesValue) {
    Json obj = Json::object();
    obj.set("ratio", Json(0.1));
    obj.set("list", Json::from_strings(std::vector<std::string>(2, "a")));
    Json back = Json::parse(obj.dump(2));
    EXPECT_EQ(obj, back);
}

TEST(JsonTest, EraseRemovesKey) {
    Json obj = Json::object();
    obj.set("a", Json(1));
    EXPECT_TRUE(obj.erase("a"));
    EXPECT_FALSE(obj.erase("a"));
    EXPECT_FALSE(obj.has("a"));
}

TEST(JsonTest, FloatListHelpersSkipNonNumbers) {
    Json arr = Json::parse("[0.5, \"x\", -1]");
    std::vector<float> v = arr.as_float_list();
    ASSERT_EQ(2u, v.size());
    EXPECT_FLOAT_EQ(0.5f, v[0]);
    EXPECT_FLOAT_EQ(-1.0f, v[1]);
}

// ============================================================================
// Config
// ============================================================================

class ConfigTest : public test::QuietTest {};

TEST_F(ConfigTest, DottedLookupsReachNestedValues) {
    Config config;
    ASSERT_TRUE(config.load_string(
        "{\"memory\": {\"workingMemoryLimit\": 10, \"lexicalWeight\": 0.25,"
        " \"mergeOnConsolidate\": false, \"nested\": {\"deep\": \"yes\"}}}"));
    EXPECT_EQ(10, config.get_int("memory.workingMemoryLimit"));
    EXPECT_DOUBLE_EQ(0.25, config.get_double("memory.lexicalWeight"));
    EXPECT_FALSE(config.get_bool("memory.mergeOnConsolidate", true));
    EXPECT_EQ("yes", config.get_string("memory.nested.deep"));
    EXPECT_TRUE(config.has("memory.nested"));
    EXPECT_TRUE(config.get_section("memory").is_object());
}

TEST_F(ConfigTest, WrongTypesFallBackToDefaults) {
    Config config;
    ASSERT_TRUE(config.load_string("{\"memory\": {\"workingMemoryLimit\": \"ten\"}}"));
    EXPECT_EQ(7, config.get_int("memory.workingMemoryLimit", 7));
    EXPECT_EQ("d", config.get_string("memory.absent", "d"));
    EXPECT_FALSE(config.has("memory.absent"));
    EXPECT_TRUE(config.get_section("nothing").is_null());
}

TEST_F(ConfigTest, RejectsInvalidDocuments) {
    Config config;
    EXPECT_FALSE(config.load_string("[1, 2]"));
    EXPECT_FALSE(config.load_string("{\"broken\": "));
    EXPECT_FALSE(config.load_file(test::temp_path("does_not_exist.json")));
    EXPECT_TRUE(config.data().is_object());
}

TEST_F(ConfigTest, LoadsFromFile) {
    std::string path = test::temp_path("config.json");
    {
        std::ofstream f(path.c_str());
        f << "{\"log_level\": \"debug\", \"embedding\": {\"provider\": \"none\"}}";
    }
    Config config;
    ASSERT_TRUE(config.load_file(path));
    EXPECT_EQ("debug", config.get_string("log_level"));
    EXPECT_EQ("none", config.get_string("embedding.provider"));
    std::remove(path.c_str());
}

// ============================================================================
// Logger
// ============================================================================

TEST(LoggerTest, ParsesLevelNames) {
    EXPECT_EQ(LogLevel::DEBUG, parse_log_level("debug"));
    EXPECT_EQ(LogLevel::WARN, parse_log_level(" Warning "));
    EXPECT_EQ(LogLevel::ERROR, parse_log_level("ERROR"));
    EXPECT_EQ(LogLevel::OFF, parse_log_level("off"));
    EXPECT_EQ(LogLevel::INFO, parse_log_level("chatty"));
    EXPECT_STREQ("WARN", log_level_str(LogLevel::WARN));
}

TEST(LoggerTest, WritesFilteredLinesToRedirectedOutput) {
    FILE* out = std::tmpfile();
    ASSERT_TRUE(out != nullptr);
    
    Logger& logger = Logger::instance();
    LogLevel saved = logger.level();
    logger.set_output(out);
    logger.set_level(LogLevel::WARN);
    LOG_INFO("hidden %d", 1);
    LOG_WARN("shown %d", 2);
    logger.set_output(nullptr);
    logger.set_level(saved);
    
    std::rewind(out);
    char buf[256] = {0};
    size_t n = std::fread(buf, 1, sizeof(buf) - 1, out);
    std::fclose(out);
    
    std::string text(buf, n);
    EXPECT_EQ(std::string::npos, text.find("hidden"));
    EXPECT_NE(std::string::npos, text.find("[WARN] shown 2"));
}

// ============================================================================
// Utilities
// ============================================================================

TEST(UtilsTest, TokenizeLowercasesAlphanumericRuns) {
    std::vector<std::string> t = tokenize("REST APIs use HTTP-methods, v2!");
    ASSERT_EQ(6u, t.size());
    EXPECT_EQ("rest", t[0]);
    EXPECT_EQ("apis", t[1]);
    EXPECT_EQ("http", t[3]);
    EXPECT_EQ("v2", t[5]);
}

TEST(UtilsTest, JaccardOverTokenSets) {
    EXPECT_DOUBLE_EQ(1.0, jaccard(token_set("a b"), token_set("B a")));
    EXPECT_DOUBLE_EQ(1.0 / 3.0, jaccard(token_set("a b"), token_set("b c")));
    EXPECT_DOUBLE_EQ(0.0, jaccard(token_set(""), token_set("")));
    EXPECT_DOUBLE_EQ(0.0, jaccard(token_set("x"), token_set("y")));
}

TEST(UtilsTest, ClampUnitHandlesRangeAndNan) {
    EXPECT_DOUBLE_EQ(0.0, clamp_unit(-0.5));
    EXPECT_DOUBLE_EQ(1.0, clamp_unit(1.5));
    EXPECT_DOUBLE_EQ(-1.0, clamp_unit(-3.0, -1.0, 1.0));
    EXPECT_DOUBLE_EQ(0.0, clamp_unit(std::nan("")));
    EXPECT_EQ("0.667", format_fixed(2.0 / 3.0, 3));
}

TEST(UtilsTest, ContainsIgnoresCase) {
    EXPECT_TRUE(contains_ci("Python is an Interpreted language", "interpreted"));
    EXPECT_TRUE(contains_ci("anything", ""));
    EXPECT_FALSE(contains_ci("short", "longer needle"));
}

TEST(UtilsTest, Sha256MatchesKnownDigest) {
    EXPECT_EQ("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", sha256_hex("abc"));
}

TEST(UtilsTest, UuidsAreWellFormedAndDistinct) {
    std::string a = generate_uuid();
    std::string b = generate_uuid();
    EXPECT_EQ(36u, a.size());
    EXPECT_EQ('4', a[14]);
    EXPECT_NE(a, b);
}

TEST(UtilsTest, FormatsTimestampsAsIso8601) {
    EXPECT_EQ("1970-01-01T00:00:01.500Z", format_timestamp_ms(1500));
}

TEST(UtilsTest, PathHelpers) {
    EXPECT_EQ("/var/lib", dirname("/var/lib/agentmem.db"));
    EXPECT_EQ(".", dirname("agentmem.db"));
    std::string dir = test::temp_path("dir/nested");
    EXPECT_TRUE(mkdir_p(dir));
    EXPECT_TRUE(is_directory(dir));
}

// ============================================================================
// ThreadPool
// ============================================================================

class ThreadPoolTest : public test::QuietTest {};

TEST_F(ThreadPoolTest, RunsSubmittedWork) {
    ThreadPool pool(2);
    std::future<int> answer = pool.submit([]() { return 6 * 7; });
    EXPECT_EQ(42, answer.get());
}

TEST_F(ThreadPoolTest, ShutdownDropsQueuedTasks) {
    ThreadPool pool(1);
    std::atomic<int> ran(0);
    std::future<void> blocker = pool.submit([]() { sleep_ms(200); });
    std::vector<std::future<void> > queued;
    for (int i = 0; i < 5; ++i) {
        queued.push_back(pool.submit([&ran]() { ++ran; }));
    }
    pool.shutdown();
    
    EXPECT_EQ(0, ran.load());
    EXPECT_EQ(0u, pool.pending());
    for (size_t i = 0; i < queued.size(); ++i) {
        EXPECT_THROW(queued[i].get(), std::future_error);
    }
    EXPECT_FALSE(pool.enqueue([&ran]() { ++ran; }));
}
