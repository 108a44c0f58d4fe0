// ═══════════════════════════════════════════════════════════════════
//  test_events.cpp - Tests for the typed event emitter
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <bizgraph/events.h>
#include <bizgraph/types.h>
#include <atomic>
#include <thread>
#include <vector>

using namespace bizgraph;

namespace {
InvalidationEvent nodeEvent(const std::string& id) {
    return InvalidationEvent::forNode(id, ChangeKind::Updated, std::chrono::system_clock::now());
}
}

TEST(EventEmitterTest, DeliversToAllListeners) {
    EventEmitter<InvalidationEvent> emitter;
    std::vector<std::string> seen;
    emitter.on([&](const InvalidationEvent& e) { seen.push_back("first:" + e.nodeId); });
    emitter.on([&](const InvalidationEvent& e) { seen.push_back("second:" + e.nodeId); });

    EXPECT_EQ(emitter.emit(nodeEvent("A")), 2u);
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], "first:A");
    EXPECT_EQ(seen[1], "second:A");
}

TEST(EventEmitterTest, OnceFiresOnce) {
    EventEmitter<InvalidationEvent> emitter;
    int calls = 0;
    emitter.once([&](const InvalidationEvent&) { calls++; });
    emitter.emit(nodeEvent("A"));
    emitter.emit(nodeEvent("B"));
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(emitter.listenerCount(), 0u);
}

TEST(EventEmitterTest, OffRemovesListener) {
    EventEmitter<InvalidationEvent> emitter;
    int calls = 0;
    auto id = emitter.on([&](const InvalidationEvent&) { calls++; });
    EXPECT_TRUE(emitter.off(id));
    EXPECT_FALSE(emitter.off(id));
    EXPECT_EQ(emitter.emit(nodeEvent("A")), 0u);
    EXPECT_EQ(calls, 0);
}

TEST(EventEmitterTest, ListenerMayRegisterDuringEmit) {
    EventEmitter<InvalidationEvent> emitter;
    int late = 0;
    emitter.once([&](const InvalidationEvent&) {
        emitter.on([&](const InvalidationEvent&) { late++; });
    });
    emitter.emit(nodeEvent("A"));
    EXPECT_EQ(late, 0);
    emitter.emit(nodeEvent("B"));
    EXPECT_EQ(late, 1);
}

TEST(EventEmitterTest, ConcurrentEmit) {
    EventEmitter<InvalidationEvent> emitter;
    std::atomic<int> calls{0};
    emitter.on([&](const InvalidationEvent&) { calls++; });

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([&] {
            for (int i = 0; i < 100; i++) emitter.emit(nodeEvent("A"));
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(calls.load(), 400);
}

TEST(EventEmitterTest, RemoveAll) {
    EventEmitter<InvalidationEvent> emitter;
    emitter.on([](const InvalidationEvent&) {});
    emitter.on([](const InvalidationEvent&) {});
    emitter.removeAllListeners();
    EXPECT_EQ(emitter.listenerCount(), 0u);
}
