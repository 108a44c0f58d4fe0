// ═══════════════════════════════════════════════════════════════════
//  test_config.cpp - Tests for engine configuration
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <bizgraph/config.h>
#include <bizgraph/console.h>
#include <bizgraph/sqlite_graph_store.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace bizgraph;

namespace {

bool hasField(const std::vector<validator::ValidationError>& errors, const std::string& field) {
    for (const auto& e : errors) {
        if (e.field == field) return true;
    }
    return false;
}

} // namespace

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { ::unsetenv("BIZGRAPH_LOG_LEVEL"); }
    void TearDown() override {
        ::unsetenv("BIZGRAPH_LOG_LEVEL");
        console::setLevel(console::Level::Info);
        console::setColor(true);
    }
};

TEST_F(ConfigTest, EmptyDocumentGivesDefaults) {
    auto config = parseConfig(nlohmann::json::object());
    EXPECT_EQ(config.traversal.defaultMaxDepth, 3);
    EXPECT_EQ(config.traversal.maxDepthCeiling, 6);
    EXPECT_EQ(config.traversal.maxNeighborsPerNode, 100u);
    EXPECT_DOUBLE_EQ(config.weights.halfSaturationVolume, 10000.0);
    EXPECT_EQ(config.cache.maxEntries, 10000u);
    EXPECT_EQ(config.cache.ttlMs, 3600000);
    EXPECT_EQ(config.invalidation.eagerDepth, 1);
    EXPECT_FALSE(config.invalidation.refreshAfterInvalidate);
    EXPECT_EQ(config.service.defaultTimeoutMs, 250);
    EXPECT_TRUE(config.service.coalesceMisses);
    EXPECT_EQ(config.service.retry.maxAttempts, 3);
    EXPECT_EQ(config.store.backend, "memory");
    EXPECT_EQ(config.log.level, "info");
}

TEST_F(ConfigTest, PartialOverride) {
    auto config = parseConfig({
        {"traversal", {{"maxDepthCeiling", 4}}},
        {"cache", {{"ttlMs", 1000}}},
        {"service", {{"retry", {{"maxAttempts", 5}}}}}
    });
    EXPECT_EQ(config.traversal.maxDepthCeiling, 4);
    EXPECT_EQ(config.traversal.defaultMaxDepth, 3);
    EXPECT_EQ(config.cache.ttlMs, 1000);
    EXPECT_EQ(config.cache.maxEntries, 10000u);
    EXPECT_EQ(config.service.retry.maxAttempts, 5);
    EXPECT_EQ(config.service.retry.baseDelayMs, 5);
}

TEST_F(ConfigTest, ValidationNamesEveryField) {
    auto errors = validateConfig({
        {"traversal", {{"defaultMaxDepth", 0}}},
        {"cache", {{"maxEntries", "lots"}}},
        {"store", {{"backend", "redis"}}},
        {"log", {{"level", "verbose"}}},
        {"service", {{"retry", {{"maxAttempts", 0}}}}}
    });
    EXPECT_TRUE(hasField(errors, "traversal.defaultMaxDepth"));
    EXPECT_TRUE(hasField(errors, "cache.maxEntries"));
    EXPECT_TRUE(hasField(errors, "store.backend"));
    EXPECT_TRUE(hasField(errors, "log.level"));
    EXPECT_TRUE(hasField(errors, "service.retry.maxAttempts"));
    EXPECT_EQ(errors.size(), 5u);
    EXPECT_EQ(errors[0].message.rfind("traversal: ", 0), 0u);
}

TEST_F(ConfigTest, SectionMustBeObject) {
    auto errors = validateConfig({{"cache", 5}});
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].field, "cache");
    EXPECT_FALSE(validateConfig(nlohmann::json::array()).empty());
}

TEST_F(ConfigTest, DefaultDepthMustFitCeiling) {
    auto errors = validateConfig({{"traversal", {{"maxDepthCeiling", 2}}}});
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].field, "traversal.defaultMaxDepth");
    EXPECT_TRUE(validateConfig({{"traversal", {{"maxDepthCeiling", 2}, {"defaultMaxDepth", 2}}}}).empty());
}

TEST_F(ConfigTest, NonPositiveHalfSaturationRejected) {
    EXPECT_TRUE(hasField(validateConfig({{"weights", {{"halfSaturationVolume", 0}}}}),
                         "weights.halfSaturationVolume"));
}

TEST_F(ConfigTest, ParseThrowsInvalidArgument) {
    try {
        parseConfig({{"cache", {{"ttlMs", -1}}}});
        FAIL() << "expected InvalidArgument";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidArgument);
        EXPECT_NE(std::string(e.what()).find("cache: ttlMs"), std::string::npos);
    }
}

TEST_F(ConfigTest, EnvironmentOverridesLogLevel) {
    ::setenv("BIZGRAPH_LOG_LEVEL", "debug", 1);
    EXPECT_EQ(parseConfig({{"log", {{"level", "warn"}}}}).log.level, "debug");

    ::setenv("BIZGRAPH_LOG_LEVEL", "chatty", 1);
    EXPECT_EQ(parseConfig({{"log", {{"level", "warn"}}}}).log.level, "warn");
}

TEST_F(ConfigTest, ApplyLogging) {
    LogOptions options;
    options.level = "error";
    options.color = false;
    applyLogging(options);
    EXPECT_EQ(console::level(), console::Level::Error);
}

TEST_F(ConfigTest, LoadConfigFile) {
    auto path = std::filesystem::temp_directory_path() / "bizgraph_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"invalidation": {"eagerDepth": 2}, "store": {"backend": "memory"}})";
    }
    auto config = loadConfig(path.string());
    EXPECT_EQ(config.invalidation.eagerDepth, 2);

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    try {
        loadConfig(path.string());
        FAIL() << "expected InvalidArgument";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidArgument);
    }
    std::filesystem::remove(path);

    try {
        loadConfig(path.string());
        FAIL() << "expected NotFound";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::NotFound);
    }
}

TEST_F(ConfigTest, MakeStore) {
    EngineConfig config;
    auto memory = makeStore(config);
    EXPECT_NE(dynamic_cast<InMemoryGraphStore*>(memory.get()), nullptr);

    config.store.backend = "sqlite";
    config.weights.halfSaturationVolume = 100;
    auto sqlite = makeStore(config);
    ASSERT_NE(dynamic_cast<SqliteGraphStore*>(sqlite.get()), nullptr);

    BusinessNode a, b;
    a.id = "A";
    b.id = "B";
    sqlite->upsertNode(a);
    sqlite->upsertNode(b);
    RelationshipEdge e;
    e.source = "A";
    e.target = "B";
    e.type = RelationshipType::Vendor;
    e.transactionVolume = 100;
    sqlite->upsertEdge(e);
    EXPECT_DOUBLE_EQ(sqlite->getNeighbors("A")[0].edge.weight, 0.5);

    config.store.backend = "redis";
    EXPECT_THROW(makeStore(config), Error);
}

TEST_F(ConfigTest, SerializesBack) {
    nlohmann::json j = EngineConfig{};
    EXPECT_EQ(j["traversal"]["maxDepthCeiling"], 6);
    EXPECT_EQ(j["service"]["retry"]["maxAttempts"], 3);
    EXPECT_EQ(j["store"]["backend"], "memory");
}
