// ═══════════════════════════════════════════════════════════════════
//  path_finder.cpp - Bounded-depth weighted traversal
// ═══════════════════════════════════════════════════════════════════

#include "bizgraph/path_finder.h"
#include "bizgraph/console.h"
#include <algorithm>
#include <cmath>
#include <unordered_map>
#include <vector>

namespace bizgraph {

namespace {

struct Label {
    double weight = 1.0;
    std::vector<std::string> nodes;
    std::vector<RelationshipEdge> edges;
};

// Per node: its hop distance, the preferred path (heaviest, then
// smallest id sequence) and the smallest id sequence regardless of
// weight. The second one is what a zero-weight step extends, since
// every path through that step aggregates to 0.
struct Reach {
    int distance = 0;
    Label best;
    Label lexFirst;
};

// Products of the same weights taken in another order may differ in
// the last bits; those count as equal.
bool sameWeight(double x, double y) {
    return std::fabs(x - y) <= 1e-12 * std::max(std::fabs(x), std::fabs(y));
}

bool preferred(const Label& candidate, const Label& current) {
    if (!sameWeight(candidate.weight, current.weight)) return candidate.weight > current.weight;
    return candidate.nodes < current.nodes;
}

Label extend(const Label& from, const Adjacent& step) {
    Label out{from.weight * step.edge.weight, from.nodes, from.edges};
    out.nodes.push_back(step.neighborId);
    out.edges.push_back(step.edge);
    return out;
}

// One traversal over one snapshot. Discarded as a whole on timeout.
class Search {
public:
    Search(const GraphSnapshot& graph, const TraversalOptions& options,
           const Deadline& deadline, TraversalStats& stats)
        : graph_(graph), options_(options), deadline_(deadline), stats_(stats) {}

    // Expands level by level up to maxDepth. With a target, stops after
    // the level on which the target was reached.
    void run(const std::string& source, int maxDepth, const std::string* target) {
        Label start{1.0, {source}, {}};
        reached_[source] = Reach{0, start, start};
        std::vector<std::string> frontier{source};

        for (int depth = 0; depth < maxDepth && !frontier.empty(); depth++) {
            std::vector<std::string> next;
            for (const auto& id : frontier) {
                if (deadline_.expired()) {
                    console::warn("traversal from", source, "timed out at depth", depth,
                                  "after", stats_.expandedNodes, "expansions");
                    throw timeoutError("traversal from '" + source + "'");
                }
                expand(id, depth + 1, next);
            }
            std::sort(next.begin(), next.end());
            frontier = std::move(next);
            if (!frontier.empty()) stats_.depthReached = depth + 1;
            if (target && reached_.count(*target)) break;
        }
    }

    const std::unordered_map<std::string, Reach>& reached() const { return reached_; }

private:
    void expand(const std::string& id, int distance, std::vector<std::string>& next) {
        const auto& adjacent = graph_.neighbors(id);
        stats_.expandedNodes++;
        if (adjacent.size() > options_.maxNeighborsPerNode) {
            stats_.oversizedNodes++;
            console::warn("business", id, "has", adjacent.size(),
                          "relationships, above the fan-out cap of", options_.maxNeighborsPerNode);
        }

        // Copy: inserting into reached_ below may rehash.
        const Reach from = reached_.at(id);

        // Adjacency is sorted by (neighborId, type); walk each neighbor
        // once through its heaviest edge.
        std::size_t i = 0;
        while (i < adjacent.size()) {
            const Adjacent* best = &adjacent[i];
            std::size_t j = i;
            for (; j < adjacent.size() && adjacent[j].neighborId == adjacent[i].neighborId; j++) {
                stats_.scannedEdges++;
                if (adjacent[j].edge.weight > best->edge.weight) best = &adjacent[j];
            }
            i = j;
            relax(from, *best, distance, next);
        }
    }

    void relax(const Reach& from, const Adjacent& step, int distance, std::vector<std::string>& next) {
        auto it = reached_.find(step.neighborId);
        if (it != reached_.end() && it->second.distance < distance) return;

        bool zero = step.edge.weight == 0.0 || from.best.weight == 0.0;
        Label viaBest = extend(zero ? from.lexFirst : from.best, step);
        Label viaLex = extend(from.lexFirst, step);

        if (it == reached_.end()) {
            reached_.emplace(step.neighborId, Reach{distance, std::move(viaBest), std::move(viaLex)});
            next.push_back(step.neighborId);
            return;
        }

        Reach& current = it->second;
        if (preferred(viaBest, current.best)) current.best = std::move(viaBest);
        if (viaLex.nodes < current.lexFirst.nodes) current.lexFirst = std::move(viaLex);
    }

    const GraphSnapshot& graph_;
    const TraversalOptions& options_;
    const Deadline& deadline_;
    TraversalStats& stats_;
    std::unordered_map<std::string, Reach> reached_;
};

} // namespace

PathFinder::PathFinder(TraversalOptions options) : options_(options) {
    if (options_.maxDepthCeiling < 1) {
        throw invalidArgument("maxDepthCeiling must be at least 1");
    }
}

void PathFinder::checkDepth(int depth) const {
    if (depth <= 0 || depth > options_.maxDepthCeiling) {
        throw invalidDepth(depth, options_.maxDepthCeiling);
    }
}

std::optional<PathResult> PathFinder::findPath(const GraphSnapshot& graph,
                                               const std::string& source,
                                               const std::string& target,
                                               int maxDepth,
                                               const Deadline& deadline,
                                               TraversalStats* stats) const {
    checkDepth(maxDepth);
    if (!graph.hasNode(source)) throw unknownEntity(source);
    if (!graph.hasNode(target)) throw unknownEntity(target);

    if (source == target) {
        return PathResult{{source}, {}, 1.0};
    }

    TraversalStats local;
    Search search(graph, options_, deadline, stats ? *stats : local);
    search.run(source, maxDepth, &target);

    auto it = search.reached().find(target);
    if (it == search.reached().end()) return std::nullopt;
    const Label& best = it->second.best;
    return PathResult{best.nodes, best.edges, best.weight};
}

Neighborhood PathFinder::neighborhood(const GraphSnapshot& graph,
                                      const std::string& source,
                                      int maxDepth,
                                      const Deadline& deadline,
                                      TraversalStats* stats) const {
    checkDepth(maxDepth);
    if (!graph.hasNode(source)) throw unknownEntity(source);

    TraversalStats local;
    Search search(graph, options_, deadline, stats ? *stats : local);
    search.run(source, maxDepth, nullptr);

    Neighborhood result;
    result.source = source;
    result.maxDepth = maxDepth;
    for (const auto& [id, reach] : search.reached()) {
        if (id == source) continue;
        result.entries.push_back(NeighborhoodEntry{id, reach.distance, reach.best.weight, reach.best.nodes});
    }
    std::sort(result.entries.begin(), result.entries.end(),
        [](const NeighborhoodEntry& x, const NeighborhoodEntry& y) {
            if (x.distance != y.distance) return x.distance < y.distance;
            return x.nodeId < y.nodeId;
        });
    return result;
}

} // namespace bizgraph
