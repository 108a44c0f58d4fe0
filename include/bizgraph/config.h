#pragma once
// ═══════════════════════════════════════════════════════════════════
//  bizgraph/config.h - Engine configuration
// ═══════════════════════════════════════════════════════════════════
//
//  {
//    "traversal":    {"defaultMaxDepth": 3, "maxDepthCeiling": 6, "maxNeighborsPerNode": 100},
//    "weights":      {"halfSaturationVolume": 10000},
//    "cache":        {"maxEntries": 10000, "ttlMs": 3600000, "bucketWidthMs": 3600000,
//                     "sweepIntervalMs": 60000, "invalidationHistory": 64},
//    "invalidation": {"eagerDepth": 1, "refreshAfterInvalidate": false},
//    "service":      {"defaultTimeoutMs": 250, "coalesceMisses": true, "coalesceWaitMs": 25,
//                     "retry": {"maxAttempts": 3, "baseDelayMs": 5, "maxDelayMs": 40}},
//    "store":        {"backend": "memory", "path": ":memory:", "busyTimeoutMs": 50},
//    "log":          {"level": "info", "color": true}
//  }
//
//  Every key is optional. BIZGRAPH_LOG_LEVEL overrides log.level.
//
// ═══════════════════════════════════════════════════════════════════

#include "graph_store.h"
#include "invalidation.h"
#include "json_utils.h"
#include "path_finder.h"
#include "query_service.h"
#include "result_cache.h"
#include "validator.h"
#include <memory>
#include <string>
#include <vector>

namespace bizgraph {

struct StoreOptions {
    std::string backend = "memory";   // "memory" | "sqlite"
    std::string path = ":memory:";
    int busyTimeoutMs = 50;

    BIZGRAPH_SERIALIZE_DEFAULTS(StoreOptions, backend, path, busyTimeoutMs)
};

struct LogOptions {
    std::string level = "info";
    bool color = true;

    BIZGRAPH_SERIALIZE_DEFAULTS(LogOptions, level, color)
};

struct EngineConfig {
    TraversalOptions traversal;
    WeightOptions weights;
    CacheOptions cache;
    InvalidationOptions invalidation;
    ServiceOptions service;
    StoreOptions store;
    LogOptions log;

    BIZGRAPH_SERIALIZE_DEFAULTS(EngineConfig, traversal, weights, cache, invalidation,
                                service, store, log)
};

// Every violation in the document, fields named "section.key".
std::vector<validator::ValidationError> validateConfig(const nlohmann::json& doc);

// Throw Error(InvalidArgument) listing every violation.
EngineConfig parseConfig(const nlohmann::json& doc);
EngineConfig loadConfig(const std::string& path);

// BIZGRAPH_LOG_LEVEL
void applyEnvironment(EngineConfig& config);

// Push log options into the console.
void applyLogging(const LogOptions& options);

std::unique_ptr<GraphStore> makeStore(const EngineConfig& config);

} // namespace bizgraph
