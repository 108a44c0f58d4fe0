#pragma once
// ═══════════════════════════════════════════════════════════════════
//  bizgraph/bizgraph.h - Umbrella header for the bizgraph engine
// ═══════════════════════════════════════════════════════════════════
//
//  #include "bizgraph/bizgraph.h"
//  using namespace bizgraph;
//
//  This single include gives you:
//    • InMemoryGraphStore, SqliteGraphStore, loadGraphJson()
//    • PathFinder (findPath, neighborhood)
//    • ResultCache, CacheSweeper
//    • NetworkQueryService, toEnvelope(), errorEnvelope()
//    • InvalidationCoordinator
//    • EngineConfig, loadConfig()
//    • console::log(), info(), warn(), error()
//
// ═══════════════════════════════════════════════════════════════════

// Core
#include "json_utils.h"
#include "errors.h"
#include "console.h"
#include "events.h"
#include "types.h"

// Storage
#include "graph_store.h"
#include "sqlite_graph_store.h"

// Query engine
#include "path_finder.h"
#include "result_cache.h"
#include "invalidation.h"
#include "query_service.h"

// Wiring
#include "config.h"
#include "metrics.h"
