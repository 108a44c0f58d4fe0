#pragma once
// ═══════════════════════════════════════════════════════════════════
//  bizgraph/path_finder.h - Bounded-depth weighted traversal
// ═══════════════════════════════════════════════════════════════════
//
//  Level-synchronous breadth-first search over one GraphSnapshot.
//  Every node is labeled at its minimal hop distance with the best
//  path reaching it: highest product of edge weights, then the
//  lexicographically smallest node-id sequence. Labels of level d are
//  final before level d is expanded, so the result does not depend on
//  hash order or thread timing.
//
//  Cost: at most min(degree, maxNeighborsPerNode)^depth expansions in
//  the typical case; nodes above the cap are still walked, so the
//  depth ceiling is the hard bound.
//
// ═══════════════════════════════════════════════════════════════════

#include "deadline.h"
#include "graph_store.h"
#include "json_utils.h"
#include "types.h"
#include <cstddef>
#include <optional>
#include <string>

namespace bizgraph {

struct TraversalOptions {
    int defaultMaxDepth = 3;
    int maxDepthCeiling = 6;
    std::size_t maxNeighborsPerNode = 100;   // fan-out above this is logged, not cut

    BIZGRAPH_SERIALIZE_DEFAULTS(TraversalOptions, defaultMaxDepth, maxDepthCeiling, maxNeighborsPerNode)
};

struct TraversalStats {
    std::size_t expandedNodes = 0;
    std::size_t scannedEdges = 0;
    std::size_t oversizedNodes = 0;
    int depthReached = 0;
};

class PathFinder {
public:
    explicit PathFinder(TraversalOptions options = {});

    // Fewest hops, then max aggregate weight, then smallest id sequence.
    // std::nullopt when target is not reachable within maxDepth.
    // Throws InvalidDepth, UnknownEntity, Timeout.
    std::optional<PathResult> findPath(const GraphSnapshot& graph,
                                       const std::string& source,
                                       const std::string& target,
                                       int maxDepth,
                                       const Deadline& deadline = Deadline::never(),
                                       TraversalStats* stats = nullptr) const;

    // Every node within maxDepth hops except the source.
    Neighborhood neighborhood(const GraphSnapshot& graph,
                              const std::string& source,
                              int maxDepth,
                              const Deadline& deadline = Deadline::never(),
                              TraversalStats* stats = nullptr) const;

    // Throws InvalidDepth unless 1 <= depth <= maxDepthCeiling.
    void checkDepth(int depth) const;

    const TraversalOptions& options() const { return options_; }

private:
    TraversalOptions options_;
};

} // namespace bizgraph
