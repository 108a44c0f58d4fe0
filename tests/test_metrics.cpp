// ═══════════════════════════════════════════════════════════════════
//  test_metrics.cpp - Tests for query engine counters
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <bizgraph/metrics.h>
#include <thread>
#include <vector>

using namespace bizgraph;

TEST(MetricsTest, RecordAndSerialize) {
    QueryMetrics m;
    m.recordQuery(QueryKind::Path, QueryOutcome::Miss, 15.5);
    m.recordQuery(QueryKind::Path, QueryOutcome::Hit, 0.2);
    m.recordQuery(QueryKind::Neighborhood, QueryOutcome::Miss, 30.25);

    EXPECT_EQ(m.totalQueries(), 3u);

    auto output = m.serialize();
    EXPECT_TRUE(output.find("bizgraph_queries_total 3") != std::string::npos);
    EXPECT_TRUE(output.find("bizgraph_query_duration_ms_max 30.25") != std::string::npos);
    EXPECT_TRUE(output.find("kind=\"path\",outcome=\"hit\"} 1") != std::string::npos);
    EXPECT_TRUE(output.find("kind=\"neighborhood\",outcome=\"miss\"} 1") != std::string::npos);
}

TEST(MetricsTest, OutcomeCounts) {
    QueryMetrics m;
    m.recordQuery(QueryKind::Path, QueryOutcome::NoPath, 1.0);
    m.recordQuery(QueryKind::Path, QueryOutcome::NoPath, 1.0);
    m.recordQuery(QueryKind::Relationships, QueryOutcome::Error, 1.0);

    EXPECT_EQ(m.count(QueryKind::Path, QueryOutcome::NoPath), 2u);
    EXPECT_EQ(m.count(QueryKind::Relationships, QueryOutcome::Error), 1u);
    EXPECT_EQ(m.count(QueryKind::Path, QueryOutcome::Timeout), 0u);
}

TEST(MetricsTest, EngineCounters) {
    QueryMetrics m;
    m.recordInvalidated(3);
    m.recordInvalidated(2);
    m.recordMutation();
    m.recordStalePut();
    m.recordOversizedNodes(4);
    m.recordCoalescedWait();

    EXPECT_EQ(m.invalidatedEntries(), 5u);
    EXPECT_EQ(m.mutations(), 1u);
    EXPECT_EQ(m.stalePuts(), 1u);
    EXPECT_EQ(m.oversizedNodes(), 4u);
    EXPECT_EQ(m.coalescedWaits(), 1u);

    auto output = m.serialize();
    EXPECT_TRUE(output.find("bizgraph_cache_invalidated_total 5") != std::string::npos);
    EXPECT_TRUE(output.find("# TYPE bizgraph_mutations_total counter") != std::string::npos);
}

TEST(MetricsTest, Reset) {
    QueryMetrics m;
    m.recordQuery(QueryKind::Path, QueryOutcome::Hit, 1.0);
    m.recordMutation();
    m.reset();
    EXPECT_EQ(m.totalQueries(), 0u);
    EXPECT_EQ(m.mutations(), 0u);
    EXPECT_EQ(m.count(QueryKind::Path, QueryOutcome::Hit), 0u);
}

TEST(MetricsTest, ConcurrentRecording) {
    QueryMetrics m;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([&m] {
            for (int i = 0; i < 250; i++) {
                m.recordQuery(QueryKind::Path, QueryOutcome::Miss, 0.5);
                m.recordMutation();
            }
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(m.totalQueries(), 1000u);
    EXPECT_EQ(m.mutations(), 1000u);
}

TEST(MetricsTest, Names) {
    EXPECT_STREQ(queryKindName(QueryKind::Neighborhood), "neighborhood");
    EXPECT_STREQ(queryOutcomeName(QueryOutcome::NoPath), "no_path");
}
