#pragma once
// ═══════════════════════════════════════════════════════════════════
//  bizgraph/query_service.h - Network Query Service
// ═══════════════════════════════════════════════════════════════════
//
//  Cache first, then snapshot + traversal on a miss, then a
//  best-effort put. No lock is held across the store read or the
//  traversal; identical concurrent misses may compute twice.
//
//  With coalesceMisses, the first miss for a key publishes a future
//  and later identical misses wait for it at most
//  min(coalesceWaitMs, deadline) before computing on their own.
//
//  Mutations go to the store first, then an InvalidationEvent is
//  emitted on mutations(); the coordinator listens there.
//
// ═══════════════════════════════════════════════════════════════════

#include "deadline.h"
#include "errors.h"
#include "events.h"
#include "graph_store.h"
#include "json_utils.h"
#include "metrics.h"
#include "path_finder.h"
#include "result_cache.h"
#include "retry.h"
#include "types.h"
#include <cstdint>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace bizgraph {

struct ServiceOptions {
    int defaultTimeoutMs = 250;
    bool coalesceMisses = true;
    int coalesceWaitMs = 25;
    RetryPolicy retry;

    BIZGRAPH_SERIALIZE_DEFAULTS(ServiceOptions, defaultTimeoutMs, coalesceMisses, coalesceWaitMs, retry)
};

// ── Requests ──
// Unset maxDepth uses TraversalOptions::defaultMaxDepth; unset deadline
// uses ServiceOptions::defaultTimeoutMs.
struct PathQuery {
    std::string source;
    std::string target;
    std::optional<int> maxDepth;
    std::optional<Deadline> deadline;
};

struct NeighborhoodQuery {
    std::string source;
    std::optional<int> maxDepth;
    std::optional<Deadline> deadline;
};

// ── Responses ──
struct QueryMetadata {
    bool cacheHit = false;
    double queryTimeMs = 0.0;
    std::size_t totalRelationships = 0;
    std::uint64_t snapshotVersion = 0;
    std::string cacheKey;
};

struct PathResponse {
    std::string source;
    std::string target;
    int maxDepth = 0;
    BusinessNode business;               // the source
    std::optional<PathResult> path;      // nullopt: no path within maxDepth
    QueryMetadata metadata;

    bool found() const { return path.has_value(); }
};

struct NeighborhoodResponse {
    BusinessNode business;
    std::vector<RelationshipEdge> relationships;   // direct relationships of the source
    Neighborhood neighborhood;
    QueryMetadata metadata;
};

struct RelationshipsResponse {
    BusinessNode business;
    std::vector<RelationshipEdge> relationships;
    QueryMetadata metadata;
};

// ── Mutations ──
struct RelationshipChange {
    EntityKind entity = EntityKind::Edge;
    ChangeKind kind = ChangeKind::Created;
    std::optional<RelationshipEdge> relationship;   // edge created/updated
    std::optional<EdgeRef> edge;                    // edge deleted
    std::optional<BusinessNode> business;           // node created/updated
    std::string nodeId;                             // node deleted
    bool overwrite = false;

    // Validates against schemas::relationshipChange(); throws InvalidArgument.
    static RelationshipChange fromJson(const nlohmann::json& doc);
};

struct ChangeAck {
    InvalidationEvent event;
    std::uint64_t version = 0;       // store version after the change
    std::size_t invalidated = 0;     // cache entries removed while handling the event
};

// ═══════════════════════════════════════════
//  NetworkQueryService
// ═══════════════════════════════════════════
class NetworkQueryService {
public:
    NetworkQueryService(GraphStore& store, ResultCache& cache, QueryMetrics& metrics,
                        ServiceOptions options = {}, TraversalOptions traversal = {});

    NetworkQueryService(const NetworkQueryService&) = delete;
    NetworkQueryService& operator=(const NetworkQueryService&) = delete;

    // Throws InvalidArgument, InvalidDepth, UnknownEntity, Timeout,
    // StoreUnavailable (after retries), Storage.
    PathResponse findPath(const PathQuery& query);
    NeighborhoodResponse neighborhood(const NeighborhoodQuery& query);

    // Business and its direct relationships, read from the store.
    RelationshipsResponse relationships(const std::string& businessId,
                                        std::optional<Deadline> deadline = std::nullopt);

    ChangeAck applyRelationshipChange(const RelationshipChange& change);
    ChangeAck applyRelationshipChange(const nlohmann::json& change);

    // Recompute evicted keys with the current bucket; failures are logged.
    void refresh(const std::vector<CacheKey>& keys);

    EventEmitter<InvalidationEvent>& mutations() { return mutations_; }
    const PathFinder& pathFinder() const { return finder_; }
    const ServiceOptions& options() const { return options_; }

private:
    struct Lookup {
        CachedResult value;
        bool hit = false;
        std::uint64_t version = 0;
    };

    template <typename Compute>
    Lookup cachedOrCompute(const CacheKey& key, const GraphSnapshot& graph, Timestamp startedAt,
                           const Deadline& deadline, Compute&& compute);

    std::shared_ptr<const GraphSnapshot> acquireSnapshot(const Deadline& deadline);
    Deadline deadlineFor(const std::optional<Deadline>& requested) const;
    int depthFor(const std::optional<int>& requested) const;

    GraphStore& store_;
    ResultCache& cache_;
    QueryMetrics& metrics_;
    ServiceOptions options_;
    PathFinder finder_;
    EventEmitter<InvalidationEvent> mutations_;

    std::mutex inflightMutex_;
    std::unordered_map<CacheKey, std::shared_future<void>, CacheKeyHash> inflight_;
};

// ── Response envelopes ──
// {"status": "success" | "no_path", "data": {...},
//  "metadata": {"total_relationships", "query_time_ms", "cache_hit", ...}}
nlohmann::json toEnvelope(const PathResponse& response);
nlohmann::json toEnvelope(const NeighborhoodResponse& response);
nlohmann::json toEnvelope(const RelationshipsResponse& response);
nlohmann::json toEnvelope(const ChangeAck& ack);

// {"status": "error", "error": {"code": ..., "message": ...}}
nlohmann::json errorEnvelope(const Error& error);

} // namespace bizgraph
