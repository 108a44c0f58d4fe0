// ═══════════════════════════════════════════════════════════════════
//  invalidation.cpp - Mutation-driven cache invalidation
// ═══════════════════════════════════════════════════════════════════

#include "bizgraph/invalidation.h"
#include "bizgraph/console.h"
#include <string>

namespace bizgraph {

InvalidationCoordinator::InvalidationCoordinator(ResultCache& cache, InvalidationOptions options,
                                                 QueryMetrics* metrics)
    : cache_(cache), options_(options), metrics_(metrics) {}

InvalidationCoordinator::~InvalidationCoordinator() {
    detach();
}

void InvalidationCoordinator::attach(EventEmitter<InvalidationEvent>& channel) {
    detach();
    channel_ = &channel;
    listener_ = channel.on([this](const InvalidationEvent& event) { handle(event); });
}

void InvalidationCoordinator::detach() {
    if (channel_ && listener_) channel_->off(*listener_);
    channel_ = nullptr;
    listener_.reset();
}

ResultCache::Predicate InvalidationCoordinator::affected(const InvalidationEvent& event) const {
    int eagerDepth = options_.eagerDepth;

    if (event.entity == EntityKind::Node) {
        std::string id = event.nodeId;
        if (event.kind == ChangeKind::Deleted) {
            return [id](const CacheEntry& e) { return e.references(id); };
        }
        return [id, eagerDepth](const CacheEntry& e) {
            return e.key.maxDepth <= eagerDepth && e.references(id);
        };
    }

    if (!event.edge) {
        return [](const CacheEntry&) { return false; };
    }
    NodePair pair = event.edge->pair;
    RelationshipType type = event.edge->type;
    return [pair, type, eagerDepth](const CacheEntry& e) {
        if (e.walks(pair, type)) return true;
        return e.key.maxDepth <= eagerDepth && (e.references(pair.a) || e.references(pair.b));
    };
}

std::size_t InvalidationCoordinator::handle(const InvalidationEvent& event) {
    bool refresh = options_.refreshAfterInvalidate && refresh_;
    std::vector<CacheKey> removed;
    std::size_t count = cache_.invalidate(affected(event), refresh ? &removed : nullptr);

    if (metrics_) metrics_->recordInvalidated(count);

    if (event.entity == EntityKind::Node) {
        console::debug("invalidated", count, "cached results for business", event.nodeId,
                       "(" + std::string(changeKindName(event.kind)) + ")");
    } else if (event.edge) {
        console::debug("invalidated", count, "cached results for relationship",
                       event.edge->pair.toString() + "|" + relationshipTypeName(event.edge->type),
                       "(" + std::string(changeKindName(event.kind)) + ")");
    }

    if (refresh && !removed.empty()) refresh_(removed);
    return count;
}

} // namespace bizgraph
