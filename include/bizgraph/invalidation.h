#pragma once
// ═══════════════════════════════════════════════════════════════════
//  bizgraph/invalidation.h - Mutation-driven cache invalidation
// ═══════════════════════════════════════════════════════════════════
//
//  Entries with maxDepth <= eagerDepth are removed as soon as a
//  mutation touches their source, target or any node of their
//  recorded result. Deeper entries expire through their TTL, except
//  on node deletion, which removes every entry naming the node, and
//  on edge events, which remove every entry whose recorded result
//  steps across the changed relationship.
//
//  Handling runs on the mutating thread, so the next read of an
//  eagerly invalidated key is a miss.
//
// ═══════════════════════════════════════════════════════════════════

#include "events.h"
#include "json_utils.h"
#include "metrics.h"
#include "result_cache.h"
#include "types.h"
#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

namespace bizgraph {

struct InvalidationOptions {
    int eagerDepth = 1;
    bool refreshAfterInvalidate = false;

    BIZGRAPH_SERIALIZE_DEFAULTS(InvalidationOptions, eagerDepth, refreshAfterInvalidate)
};

class InvalidationCoordinator {
public:
    using RefreshHandler = std::function<void(const std::vector<CacheKey>&)>;

    InvalidationCoordinator(ResultCache& cache, InvalidationOptions options = {},
                            QueryMetrics* metrics = nullptr);
    ~InvalidationCoordinator();

    InvalidationCoordinator(const InvalidationCoordinator&) = delete;
    InvalidationCoordinator& operator=(const InvalidationCoordinator&) = delete;

    // Subscribe to a mutation channel (one at a time).
    void attach(EventEmitter<InvalidationEvent>& channel);
    void detach();

    // Returns the number of cache entries removed.
    std::size_t handle(const InvalidationEvent& event);

    // Receives the removed keys when refreshAfterInvalidate is set.
    void onRefresh(RefreshHandler handler) { refresh_ = std::move(handler); }

    // Predicate matching the entries an event invalidates.
    ResultCache::Predicate affected(const InvalidationEvent& event) const;

    const InvalidationOptions& options() const { return options_; }

private:
    ResultCache& cache_;
    InvalidationOptions options_;
    QueryMetrics* metrics_;
    RefreshHandler refresh_;
    EventEmitter<InvalidationEvent>* channel_ = nullptr;
    std::optional<EventEmitter<InvalidationEvent>::ListenerId> listener_;
};

} // namespace bizgraph
