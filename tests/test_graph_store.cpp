// ═══════════════════════════════════════════════════════════════════
//  test_graph_store.cpp - Tests for snapshots and the in-memory store
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <bizgraph/graph_store.h>
#include <atomic>
#include <thread>
#include <vector>

using namespace bizgraph;

namespace {

BusinessNode business(const std::string& id) {
    BusinessNode n;
    n.id = id;
    n.name = "Business " + id;
    return n;
}

RelationshipEdge edge(const std::string& a, const std::string& b, RelationshipType type, double volume) {
    RelationshipEdge e;
    e.source = a;
    e.target = b;
    e.type = type;
    e.transactionVolume = volume;
    e.frequency = "monthly";
    return e;
}

} // namespace

class InMemoryStoreTest : public ::testing::Test {
protected:
    InMemoryGraphStore store;

    void SetUp() override {
        for (auto id : {"A", "B", "C", "D"}) store.upsertNode(business(id));
    }
};

TEST_F(InMemoryStoreTest, GetNode) {
    auto node = store.getNode("A");
    EXPECT_EQ(node.name, "Business A");
    EXPECT_NE(node.createdAt, Timestamp{});
}

TEST_F(InMemoryStoreTest, GetUnknownNodeThrowsNotFound) {
    try {
        store.getNode("Z");
        FAIL() << "expected NotFound";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::NotFound);
    }
}

TEST_F(InMemoryStoreTest, UpsertNodeKeepsCreatedAt) {
    auto created = store.getNode("A").createdAt;
    auto updated = business("A");
    updated.name = "Renamed";
    EXPECT_EQ(store.upsertNode(updated), UpsertOutcome::Updated);
    auto node = store.getNode("A");
    EXPECT_EQ(node.name, "Renamed");
    EXPECT_EQ(node.createdAt, created);
}

TEST_F(InMemoryStoreTest, EdgesAreSymmetric) {
    EXPECT_EQ(store.upsertEdge(edge("B", "A", RelationshipType::Vendor, 90000)), UpsertOutcome::Created);

    auto fromA = store.getNeighbors("A");
    auto fromB = store.getNeighbors("B");
    ASSERT_EQ(fromA.size(), 1u);
    ASSERT_EQ(fromB.size(), 1u);
    EXPECT_EQ(fromA[0].neighborId, "B");
    EXPECT_EQ(fromB[0].neighborId, "A");
    EXPECT_DOUBLE_EQ(fromA[0].edge.weight, 0.9);
}

TEST_F(InMemoryStoreTest, WeightIsDerivedFromVolume) {
    auto e = edge("A", "B", RelationshipType::Client, 10000);
    e.weight = 0.99;   // ignored
    store.upsertEdge(e);
    auto snap = store.snapshot();
    const auto* stored = snap->findEdge(NodePair::of("A", "B"), RelationshipType::Client);
    ASSERT_NE(stored, nullptr);
    EXPECT_DOUBLE_EQ(stored->weight, 0.5);
    EXPECT_EQ(stored->lastTransaction, stored->createdAt);
}

TEST_F(InMemoryStoreTest, DuplicateEdgeWithoutOverwriteConflicts) {
    store.upsertEdge(edge("A", "B", RelationshipType::Vendor, 100));
    try {
        store.upsertEdge(edge("B", "A", RelationshipType::Vendor, 200));
        FAIL() << "expected Conflict";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::Conflict);
    }
    auto snap = store.snapshot();
    EXPECT_DOUBLE_EQ(snap->findEdge(NodePair::of("A", "B"), RelationshipType::Vendor)->transactionVolume, 100);
}

TEST_F(InMemoryStoreTest, OverwriteReplacesAndKeepsCreatedAt) {
    auto first = edge("A", "B", RelationshipType::Vendor, 100);
    first.createdAt = parseTimestamp("2023-05-01T00:00:00Z");
    store.upsertEdge(first);

    EXPECT_EQ(store.upsertEdge(edge("A", "B", RelationshipType::Vendor, 300), true), UpsertOutcome::Updated);
    auto snap = store.snapshot();
    const auto* stored = snap->findEdge(NodePair::of("A", "B"), RelationshipType::Vendor);
    EXPECT_DOUBLE_EQ(stored->transactionVolume, 300);
    EXPECT_EQ(stored->createdAt, first.createdAt);
    EXPECT_EQ(snap->edgeCount(), 1u);
}

TEST_F(InMemoryStoreTest, OneEdgePerTypePerPair) {
    store.upsertEdge(edge("A", "B", RelationshipType::Vendor, 100));
    store.upsertEdge(edge("A", "B", RelationshipType::Client, 100));
    store.upsertEdge(edge("A", "B", RelationshipType::Partner, 100));
    auto snap = store.snapshot();
    EXPECT_EQ(snap->edgeCount(), 3u);
    EXPECT_EQ(snap->edgesBetween(NodePair::of("B", "A")).size(), 3u);
    EXPECT_EQ(snap->degree("A"), 3u);
}

TEST_F(InMemoryStoreTest, EdgeToUnknownNodeIsNotFound) {
    try {
        store.upsertEdge(edge("A", "Z", RelationshipType::Vendor, 1));
        FAIL() << "expected NotFound";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::NotFound);
    }
}

TEST_F(InMemoryStoreTest, RejectsInvalidEdges) {
    EXPECT_THROW(store.upsertEdge(edge("A", "A", RelationshipType::Vendor, 1)), Error);
    EXPECT_THROW(store.upsertEdge(edge("A", "B", RelationshipType::Vendor, -1)), Error);
    EXPECT_THROW(store.upsertEdge(edge("", "B", RelationshipType::Vendor, 1)), Error);
}

TEST_F(InMemoryStoreTest, DeleteEdge) {
    store.upsertEdge(edge("A", "B", RelationshipType::Vendor, 1));
    store.deleteEdge(NodePair::of("B", "A"), RelationshipType::Vendor);
    EXPECT_TRUE(store.getNeighbors("A").empty());
    EXPECT_EQ(store.snapshot()->edgeCount(), 0u);

    try {
        store.deleteEdge(NodePair::of("A", "B"), RelationshipType::Vendor);
        FAIL() << "expected NotFound";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::NotFound);
    }
}

TEST_F(InMemoryStoreTest, RemoveNodeDropsIncidentEdges) {
    store.upsertEdge(edge("A", "B", RelationshipType::Vendor, 1));
    store.upsertEdge(edge("B", "C", RelationshipType::Client, 1));
    store.upsertEdge(edge("C", "D", RelationshipType::Client, 1));
    store.removeNode("B");

    auto snap = store.snapshot();
    EXPECT_FALSE(snap->hasNode("B"));
    EXPECT_EQ(snap->edgeCount(), 1u);
    EXPECT_TRUE(snap->neighbors("A").empty());
    EXPECT_EQ(snap->neighbors("C").size(), 1u);
    EXPECT_THROW(store.removeNode("B"), Error);
}

TEST_F(InMemoryStoreTest, SnapshotIsImmutable) {
    store.upsertEdge(edge("A", "B", RelationshipType::Vendor, 1));
    auto before = store.snapshot();

    store.upsertEdge(edge("A", "C", RelationshipType::Vendor, 1));
    store.deleteEdge(NodePair::of("A", "B"), RelationshipType::Vendor);

    EXPECT_EQ(before->neighbors("A").size(), 1u);
    EXPECT_EQ(before->neighbors("A")[0].neighborId, "B");
    EXPECT_EQ(store.snapshot()->neighbors("A")[0].neighborId, "C");
    EXPECT_GT(store.version(), before->version());
}

TEST_F(InMemoryStoreTest, NeighborsAreSorted) {
    store.upsertEdge(edge("A", "D", RelationshipType::Vendor, 1));
    store.upsertEdge(edge("A", "B", RelationshipType::Partner, 1));
    store.upsertEdge(edge("A", "B", RelationshipType::Vendor, 1));
    store.upsertEdge(edge("A", "C", RelationshipType::Client, 1));

    auto list = store.getNeighbors("A");
    ASSERT_EQ(list.size(), 4u);
    EXPECT_EQ(list[0].neighborId, "B");
    EXPECT_EQ(list[0].edge.type, RelationshipType::Vendor);
    EXPECT_EQ(list[1].edge.type, RelationshipType::Partner);
    EXPECT_EQ(list[2].neighborId, "C");
    EXPECT_EQ(list[3].neighborId, "D");
}

TEST_F(InMemoryStoreTest, ForEachEdgeVisitsOnce) {
    store.upsertEdge(edge("A", "B", RelationshipType::Vendor, 1));
    store.upsertEdge(edge("B", "C", RelationshipType::Vendor, 1));
    int count = 0;
    store.snapshot()->forEachEdge([&](const RelationshipEdge&) { count++; });
    EXPECT_EQ(count, 2);
    EXPECT_EQ(store.snapshot()->nodeIds(), (std::vector<std::string>{"A", "B", "C", "D"}));
}

TEST(InMemoryStoreConcurrencyTest, DisjointPairsProceedIndependently) {
    InMemoryGraphStore store;
    const int nodes = 40;
    for (int i = 0; i < nodes; i++) store.upsertNode(business("n" + std::to_string(i)));

    std::vector<std::thread> writers;
    for (int t = 0; t < 4; t++) {
        writers.emplace_back([&store, t] {
            for (int i = t; i < nodes - 1; i += 4) {
                store.upsertEdge(edge("n" + std::to_string(i), "n" + std::to_string(i + 1),
                                      RelationshipType::Partner, 100.0 * (i + 1)));
            }
        });
    }
    for (auto& w : writers) w.join();

    auto snap = store.snapshot();
    EXPECT_EQ(snap->edgeCount(), static_cast<std::size_t>(nodes - 1));
    for (int i = 0; i < nodes - 1; i++) {
        EXPECT_NE(snap->findEdge(NodePair::of("n" + std::to_string(i), "n" + std::to_string(i + 1)),
                                 RelationshipType::Partner), nullptr);
    }
}

TEST(InMemoryStoreConcurrencyTest, SamePairWritesLinearize) {
    InMemoryGraphStore store;
    store.upsertNode(business("A"));
    store.upsertNode(business("B"));

    std::atomic<int> created{0};
    std::atomic<int> conflicts{0};
    std::vector<std::thread> writers;
    for (int t = 0; t < 8; t++) {
        writers.emplace_back([&] {
            try {
                if (store.upsertEdge(edge("A", "B", RelationshipType::Vendor, 5)) == UpsertOutcome::Created) {
                    created++;
                }
            } catch (const Error& e) {
                if (e.code() == ErrorCode::Conflict) conflicts++;
            }
        });
    }
    for (auto& w : writers) w.join();

    EXPECT_EQ(created.load(), 1);
    EXPECT_EQ(conflicts.load(), 7);
    EXPECT_EQ(store.snapshot()->edgeCount(), 1u);
}

TEST(InMemoryStoreConcurrencyTest, ReadersSeeWholeSnapshots) {
    InMemoryGraphStore store;
    store.upsertNode(business("hub"));
    for (int i = 0; i < 50; i++) store.upsertNode(business("s" + std::to_string(i)));

    std::atomic<bool> done{false};
    std::atomic<int> inconsistent{0};
    std::thread reader([&] {
        while (!done.load()) {
            auto snap = store.snapshot();
            // every adjacency entry has its mirror on the other side
            for (const auto& adj : snap->neighbors("hub")) {
                if (!snap->findEdge(adj.edge.pair(), adj.edge.type)) inconsistent++;
                bool mirrored = false;
                for (const auto& back : snap->neighbors(adj.neighborId)) {
                    if (back.neighborId == "hub") mirrored = true;
                }
                if (!mirrored) inconsistent++;
            }
        }
    });
    for (int i = 0; i < 50; i++) {
        store.upsertEdge(edge("hub", "s" + std::to_string(i), RelationshipType::Client, 10));
    }
    done.store(true);
    reader.join();
    EXPECT_EQ(inconsistent.load(), 0);
}

TEST(LoadGraphJsonTest, LoadsAndValidates) {
    InMemoryGraphStore store;
    nlohmann::json doc = {
        {"businesses", {{{"id", "A"}}, {{"id", "B"}, {"name", "Bee"}}}},
        {"relationships", {{{"source", "A"}, {"target", "B"}, {"relationship_type", "vendor"},
                            {"transaction_volume", 90000}, {"frequency", "daily"}}}}
    };
    auto summary = loadGraphJson(store, doc);
    EXPECT_EQ(summary.businesses, 2u);
    EXPECT_EQ(summary.relationships, 1u);
    EXPECT_EQ(store.getNode("B").name, "Bee");

    nlohmann::json bad = {{"relationships", {{{"source", "A"}, {"target", "B"},
                                              {"relationship_type", "friend"},
                                              {"transaction_volume", 1}}}}};
    try {
        loadGraphJson(store, bad);
        FAIL() << "expected InvalidArgument";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidArgument);
    }
}
