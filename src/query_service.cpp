// ═══════════════════════════════════════════════════════════════════
//  query_service.cpp - Network Query Service
// ═══════════════════════════════════════════════════════════════════

#include "bizgraph/query_service.h"
#include "bizgraph/console.h"
#include "bizgraph/schemas.h"
#include <algorithm>
#include <chrono>

namespace bizgraph {

namespace {

double elapsedMs(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

QueryOutcome outcomeOf(const Error& e) {
    return e.code() == ErrorCode::Timeout ? QueryOutcome::Timeout : QueryOutcome::Error;
}

std::vector<RelationshipEdge> directRelationships(const GraphSnapshot& graph, const std::string& id) {
    std::vector<RelationshipEdge> edges;
    for (const auto& adj : graph.neighbors(id)) edges.push_back(adj.edge);
    return edges;
}

// Leader side of miss coalescing: unpublishes the key and wakes
// followers however the computation ends.
class InflightSlot {
public:
    InflightSlot(std::mutex& mutex,
                 std::unordered_map<CacheKey, std::shared_future<void>, CacheKeyHash>& inflight,
                 const CacheKey& key)
        : mutex_(mutex), inflight_(inflight), key_(key) {}

    ~InflightSlot() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            inflight_.erase(key_);
        }
        promise_.set_value();
    }

    InflightSlot(const InflightSlot&) = delete;
    InflightSlot& operator=(const InflightSlot&) = delete;

    std::shared_future<void> future() { return promise_.get_future().share(); }

private:
    std::mutex& mutex_;
    std::unordered_map<CacheKey, std::shared_future<void>, CacheKeyHash>& inflight_;
    CacheKey key_;
    std::promise<void> promise_;
};

} // namespace

// ─── RelationshipChange ────────────────────────────────────────────

RelationshipChange RelationshipChange::fromJson(const nlohmann::json& doc) {
    schemas::relationshipChange().enforce(doc, "relationship change");

    RelationshipChange change;
    change.entity = doc.at("entity").get<std::string>() == "node" ? EntityKind::Node : EntityKind::Edge;
    change.kind = parseChangeKind(doc.at("kind").get<std::string>());
    change.overwrite = doc.value("overwrite", false);

    if (change.entity == EntityKind::Edge) {
        if (change.kind == ChangeKind::Deleted) {
            if (!doc.contains("source") || !doc.contains("target") || !doc.contains("relationship_type")) {
                throw invalidArgument("edge deletion needs source, target and relationship_type");
            }
            change.edge = EdgeRef{
                NodePair::of(doc.at("source").get<std::string>(), doc.at("target").get<std::string>()),
                parseRelationshipType(doc.at("relationship_type").get<std::string>())};
        } else {
            if (!doc.contains("relationship")) {
                throw invalidArgument("edge " + std::string(changeKindName(change.kind)) +
                                      " needs a relationship object");
            }
            schemas::relationship().enforce(doc.at("relationship"), "relationship record");
            change.relationship = doc.at("relationship").get<RelationshipEdge>();
        }
    } else {
        if (change.kind == ChangeKind::Deleted) {
            if (!doc.contains("id")) throw invalidArgument("node deletion needs an id");
            change.nodeId = doc.at("id").get<std::string>();
        } else {
            if (!doc.contains("business")) {
                throw invalidArgument("node " + std::string(changeKindName(change.kind)) +
                                      " needs a business object");
            }
            schemas::business().enforce(doc.at("business"), "business record");
            change.business = doc.at("business").get<BusinessNode>();
        }
    }
    return change;
}

// ─── NetworkQueryService ───────────────────────────────────────────

NetworkQueryService::NetworkQueryService(GraphStore& store, ResultCache& cache, QueryMetrics& metrics,
                                         ServiceOptions options, TraversalOptions traversal)
    : store_(store), cache_(cache), metrics_(metrics), options_(options), finder_(traversal) {
    if (options_.defaultTimeoutMs <= 0) throw invalidArgument("defaultTimeoutMs must be positive");
}

Deadline NetworkQueryService::deadlineFor(const std::optional<Deadline>& requested) const {
    return requested ? *requested : Deadline::afterMs(options_.defaultTimeoutMs);
}

int NetworkQueryService::depthFor(const std::optional<int>& requested) const {
    int depth = requested.value_or(finder_.options().defaultMaxDepth);
    finder_.checkDepth(depth);
    return depth;
}

std::shared_ptr<const GraphSnapshot> NetworkQueryService::acquireSnapshot(const Deadline& deadline) {
    return withRetry("graph snapshot", options_.retry, deadline, [this] { return store_.snapshot(); });
}

template <typename Compute>
NetworkQueryService::Lookup NetworkQueryService::cachedOrCompute(const CacheKey& key,
                                                                 const GraphSnapshot& graph,
                                                                 Timestamp startedAt,
                                                                 const Deadline& deadline,
                                                                 Compute&& compute) {
    if (auto cached = cache_.lookup(key)) {
        return Lookup{std::move(cached->value), true, cached->graphVersion};
    }

    std::optional<InflightSlot> slot;
    if (options_.coalesceMisses) {
        std::shared_future<void> pending;
        {
            std::lock_guard<std::mutex> lock(inflightMutex_);
            auto it = inflight_.find(key);
            if (it != inflight_.end()) {
                pending = it->second;
            } else {
                slot.emplace(inflightMutex_, inflight_, key);
                inflight_.emplace(key, slot->future());
            }
        }
        if (pending.valid()) {
            metrics_.recordCoalescedWait();
            auto wait = std::min(std::chrono::milliseconds(options_.coalesceWaitMs), deadline.remaining());
            pending.wait_for(wait);
            if (auto cached = cache_.lookup(key)) {
                return Lookup{std::move(cached->value), true, cached->graphVersion};
            }
            // leader slow or its put refused; compute independently
        }
    }

    if (deadline.expired()) throw timeoutError("query " + key.toString());

    CachedResult value = compute();
    if (!cache_.put(key, value, std::chrono::milliseconds(0), startedAt, graph.version())) {
        metrics_.recordStalePut();
        console::debug("cache put refused for", key.toString(), "(stale result)");
    }
    return Lookup{std::move(value), false, graph.version()};
}

PathResponse NetworkQueryService::findPath(const PathQuery& query) {
    auto start = std::chrono::steady_clock::now();
    try {
        if (query.source.empty() || query.target.empty()) {
            throw invalidArgument("source and target ids must not be empty");
        }
        int depth = depthFor(query.maxDepth);
        Deadline deadline = deadlineFor(query.deadline);

        // Existence is checked against the live snapshot even when the
        // answer is cached: a business removed without an event must not
        // be served, and the envelope carries its current record.
        Timestamp startedAt = std::chrono::system_clock::now();
        auto graph = acquireSnapshot(deadline);
        const BusinessNode* source = graph->findNode(query.source);
        if (!source) throw unknownEntity(query.source);
        if (!graph->hasNode(query.target)) throw unknownEntity(query.target);

        CacheKey key = cache_.pathKey(query.source, query.target, depth, startedAt);
        TraversalStats stats;
        auto lookup = cachedOrCompute(key, *graph, startedAt, deadline, [&]() -> CachedResult {
            auto path = finder_.findPath(*graph, query.source, query.target, depth, deadline, &stats);
            if (path) return *path;
            return NoPath{query.source, query.target, depth};
        });
        if (stats.oversizedNodes > 0) metrics_.recordOversizedNodes(stats.oversizedNodes);

        PathResponse response;
        response.source = query.source;
        response.target = query.target;
        response.maxDepth = depth;
        response.business = *source;
        if (auto* path = std::get_if<PathResult>(&lookup.value)) response.path = *path;
        response.metadata.cacheHit = lookup.hit;
        response.metadata.snapshotVersion = lookup.version;
        response.metadata.cacheKey = key.toString();
        response.metadata.totalRelationships = response.path ? response.path->edges.size() : 0;
        response.metadata.queryTimeMs = elapsedMs(start);

        QueryOutcome outcome = lookup.hit ? QueryOutcome::Hit
                             : response.path ? QueryOutcome::Miss : QueryOutcome::NoPath;
        metrics_.recordQuery(QueryKind::Path, outcome, response.metadata.queryTimeMs);
        return response;
    } catch (const Error& e) {
        metrics_.recordQuery(QueryKind::Path, outcomeOf(e), elapsedMs(start));
        throw;
    }
}

NeighborhoodResponse NetworkQueryService::neighborhood(const NeighborhoodQuery& query) {
    auto start = std::chrono::steady_clock::now();
    try {
        if (query.source.empty()) throw invalidArgument("source id must not be empty");
        int depth = depthFor(query.maxDepth);
        Deadline deadline = deadlineFor(query.deadline);

        Timestamp startedAt = std::chrono::system_clock::now();
        auto graph = acquireSnapshot(deadline);
        const BusinessNode* source = graph->findNode(query.source);
        if (!source) throw unknownEntity(query.source);

        CacheKey key = cache_.neighborhoodKey(query.source, depth, startedAt);
        TraversalStats stats;
        auto lookup = cachedOrCompute(key, *graph, startedAt, deadline, [&]() -> CachedResult {
            return finder_.neighborhood(*graph, query.source, depth, deadline, &stats);
        });
        if (stats.oversizedNodes > 0) metrics_.recordOversizedNodes(stats.oversizedNodes);

        NeighborhoodResponse response;
        response.business = *source;
        response.relationships = directRelationships(*graph, query.source);
        response.neighborhood = std::get<Neighborhood>(lookup.value);
        response.metadata.cacheHit = lookup.hit;
        response.metadata.snapshotVersion = lookup.version;
        response.metadata.cacheKey = key.toString();
        response.metadata.totalRelationships = response.relationships.size();
        response.metadata.queryTimeMs = elapsedMs(start);

        metrics_.recordQuery(QueryKind::Neighborhood, lookup.hit ? QueryOutcome::Hit : QueryOutcome::Miss,
                             response.metadata.queryTimeMs);
        return response;
    } catch (const Error& e) {
        metrics_.recordQuery(QueryKind::Neighborhood, outcomeOf(e), elapsedMs(start));
        throw;
    }
}

RelationshipsResponse NetworkQueryService::relationships(const std::string& businessId,
                                                         std::optional<Deadline> deadline) {
    auto start = std::chrono::steady_clock::now();
    try {
        if (businessId.empty()) throw invalidArgument("business id must not be empty");
        auto graph = acquireSnapshot(deadlineFor(deadline));
        const BusinessNode* node = graph->findNode(businessId);
        if (!node) throw notFound("Business '" + businessId + "'");

        RelationshipsResponse response;
        response.business = *node;
        response.relationships = directRelationships(*graph, businessId);
        response.metadata.snapshotVersion = graph->version();
        response.metadata.totalRelationships = response.relationships.size();
        response.metadata.queryTimeMs = elapsedMs(start);

        metrics_.recordQuery(QueryKind::Relationships, QueryOutcome::Miss, response.metadata.queryTimeMs);
        return response;
    } catch (const Error& e) {
        metrics_.recordQuery(QueryKind::Relationships, outcomeOf(e), elapsedMs(start));
        throw;
    }
}

ChangeAck NetworkQueryService::applyRelationshipChange(const RelationshipChange& change) {
    Deadline deadline = Deadline::afterMs(options_.defaultTimeoutMs);
    InvalidationEvent event;

    if (change.entity == EntityKind::Edge) {
        if (change.kind == ChangeKind::Deleted) {
            if (!change.edge) throw invalidArgument("edge deletion without an edge reference");
            withRetry("delete relationship", options_.retry, deadline,
                      [&] { store_.deleteEdge(change.edge->pair, change.edge->type); });
            event = InvalidationEvent::forEdge(*change.edge, ChangeKind::Deleted,
                                               std::chrono::system_clock::now());
        } else {
            if (!change.relationship) throw invalidArgument("edge change without a relationship");
            bool overwrite = change.overwrite || change.kind == ChangeKind::Updated;
            auto outcome = withRetry("upsert relationship", options_.retry, deadline,
                                     [&] { return store_.upsertEdge(*change.relationship, overwrite); });
            EdgeRef ref{change.relationship->pair(), change.relationship->type};
            event = InvalidationEvent::forEdge(
                ref, outcome == UpsertOutcome::Created ? ChangeKind::Created : ChangeKind::Updated,
                std::chrono::system_clock::now());
        }
    } else {
        if (change.kind == ChangeKind::Deleted) {
            if (change.nodeId.empty()) throw invalidArgument("node deletion without an id");
            withRetry("remove business", options_.retry, deadline,
                      [&] { store_.removeNode(change.nodeId); });
            event = InvalidationEvent::forNode(change.nodeId, ChangeKind::Deleted,
                                               std::chrono::system_clock::now());
        } else {
            if (!change.business) throw invalidArgument("node change without a business");
            auto outcome = withRetry("upsert business", options_.retry, deadline,
                                     [&] { return store_.upsertNode(*change.business); });
            event = InvalidationEvent::forNode(
                change.business->id,
                outcome == UpsertOutcome::Created ? ChangeKind::Created : ChangeKind::Updated,
                std::chrono::system_clock::now());
        }
    }
    metrics_.recordMutation();

    // Listeners run on this thread. Concurrent mutations may add to the
    // count, so it is an upper bound for this change alone.
    std::size_t before = cache_.stats().invalidations;
    mutations_.emit(event);
    std::size_t after = cache_.stats().invalidations;

    ChangeAck ack{event, store_.version(), after - before};
    console::debug("applied", nlohmann::json(event).dump(), "->", ack.invalidated, "invalidated");
    return ack;
}

ChangeAck NetworkQueryService::applyRelationshipChange(const nlohmann::json& change) {
    return applyRelationshipChange(RelationshipChange::fromJson(change));
}

void NetworkQueryService::refresh(const std::vector<CacheKey>& keys) {
    for (const auto& key : keys) {
        try {
            if (key.kind == QueryShape::Path) {
                findPath(PathQuery{key.source, key.target, key.maxDepth, std::nullopt});
            } else {
                neighborhood(NeighborhoodQuery{key.source, key.maxDepth, std::nullopt});
            }
        } catch (const Error& e) {
            console::warn("refresh of", key.toString(), "failed:", e.what());
        }
    }
}

// ─── Envelopes ─────────────────────────────────────────────────────

namespace {

nlohmann::json metadataJson(const QueryMetadata& m) {
    nlohmann::json j = {
        {"total_relationships", m.totalRelationships},
        {"query_time_ms", m.queryTimeMs},
        {"cache_hit", m.cacheHit},
        {"snapshot_version", m.snapshotVersion}
    };
    if (!m.cacheKey.empty()) j["cache_key"] = m.cacheKey;
    return j;
}

} // namespace

nlohmann::json toEnvelope(const PathResponse& response) {
    nlohmann::json data = {
        {"business", response.business},
        {"relationships", response.path ? nlohmann::json(response.path->edges) : nlohmann::json::array()},
        {"path", response.path ? nlohmann::json(*response.path) : nlohmann::json(nullptr)},
        {"target", response.target},
        {"max_depth", response.maxDepth}
    };
    return {
        {"status", response.found() ? "success" : "no_path"},
        {"data", data},
        {"metadata", metadataJson(response.metadata)}
    };
}

nlohmann::json toEnvelope(const NeighborhoodResponse& response) {
    nlohmann::json data = {
        {"business", response.business},
        {"relationships", response.relationships},
        {"neighbors", response.neighborhood.entries},
        {"max_depth", response.neighborhood.maxDepth}
    };
    return {
        {"status", "success"},
        {"data", data},
        {"metadata", metadataJson(response.metadata)}
    };
}

nlohmann::json toEnvelope(const RelationshipsResponse& response) {
    return {
        {"status", "success"},
        {"data", {{"business", response.business}, {"relationships", response.relationships}}},
        {"metadata", metadataJson(response.metadata)}
    };
}

nlohmann::json toEnvelope(const ChangeAck& ack) {
    return {
        {"status", "success"},
        {"data", {{"event", ack.event}}},
        {"metadata", {{"version", ack.version}, {"invalidated", ack.invalidated}}}
    };
}

nlohmann::json errorEnvelope(const Error& error) {
    return {{"status", "error"}, {"error", error.toJson()}};
}

} // namespace bizgraph
