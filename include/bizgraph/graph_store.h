#pragma once
// ═══════════════════════════════════════════════════════════════════
//  bizgraph/graph_store.h - Graph Store Adapter and snapshots
// ═══════════════════════════════════════════════════════════════════
//
//  A GraphSnapshot is an immutable view of the whole graph. Writers
//  never touch a published snapshot: each mutation builds a new one
//  that shares every untouched node and adjacency list with its base.
//  Readers pay one shared_ptr copy, and a traversal that holds a
//  snapshot sees no partial writes.
//
// ═══════════════════════════════════════════════════════════════════

#include "json_utils.h"
#include "types.h"
#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace bizgraph {

struct WeightOptions {
    double halfSaturationVolume = 10000.0;   // volume at which weight reaches 0.5

    BIZGRAPH_SERIALIZE_DEFAULTS(WeightOptions, halfSaturationVolume)
};

// One direction of an undirected edge, as seen from a node.
struct Adjacent {
    std::string neighborId;
    RelationshipEdge edge;
};

// ═══════════════════════════════════════════
//  GraphSnapshot
// ═══════════════════════════════════════════
class GraphSnapshot {
public:
    using AdjacencyList = std::vector<Adjacent>;   // sorted by (neighborId, type)

    GraphSnapshot() = default;

    const BusinessNode* findNode(const std::string& id) const;
    bool hasNode(const std::string& id) const { return nodes_.count(id) > 0; }

    // Empty list for unknown ids.
    const AdjacencyList& neighbors(const std::string& id) const;
    std::size_t degree(const std::string& id) const { return neighbors(id).size(); }

    const RelationshipEdge* findEdge(const NodePair& pair, RelationshipType type) const;
    std::vector<RelationshipEdge> edgesBetween(const NodePair& pair) const;

    std::vector<std::string> nodeIds() const;   // sorted
    void forEachNode(const std::function<void(const BusinessNode&)>& fn) const;
    void forEachEdge(const std::function<void(const RelationshipEdge&)>& fn) const;   // each edge once

    std::size_t nodeCount() const { return nodes_.size(); }
    std::size_t edgeCount() const { return edgeCount_; }
    std::uint64_t version() const { return version_; }

    // ── Copy-on-write editing; each returns a new unpublished snapshot ──
    std::shared_ptr<GraphSnapshot> withNode(const BusinessNode& node) const;
    std::shared_ptr<GraphSnapshot> withoutNode(const std::string& id) const;
    std::shared_ptr<GraphSnapshot> withEdge(const RelationshipEdge& edge) const;
    std::shared_ptr<GraphSnapshot> withoutEdge(const NodePair& pair, RelationshipType type) const;

    // ── In-place building; only valid before the snapshot is published ──
    void insertNode(const BusinessNode& node);
    void insertEdge(const RelationshipEdge& edge);

    void setVersion(std::uint64_t v) { version_ = v; }

private:
    void putAdjacent(const std::string& from, Adjacent adj);
    void dropAdjacent(const std::string& from, const std::string& neighborId, RelationshipType type);

    std::unordered_map<std::string, std::shared_ptr<const BusinessNode>> nodes_;
    std::unordered_map<std::string, std::shared_ptr<const AdjacencyList>> adjacency_;
    std::size_t edgeCount_ = 0;
    std::uint64_t version_ = 0;
};

enum class UpsertOutcome { Created, Updated };

// ═══════════════════════════════════════════
//  GraphStore - canonical node/edge state
// ═══════════════════════════════════════════
class GraphStore {
public:
    virtual ~GraphStore() = default;

    // Consistent view for the duration of one traversal.
    virtual std::shared_ptr<const GraphSnapshot> snapshot() = 0;

    // Throws NotFound.
    BusinessNode getNode(const std::string& id);
    std::vector<Adjacent> getNeighbors(const std::string& id);

    virtual UpsertOutcome upsertNode(const BusinessNode& node) = 0;
    virtual void removeNode(const std::string& id) = 0;

    // NotFound when an endpoint is absent; Conflict when (pair, type)
    // exists and overwrite is false.
    virtual UpsertOutcome upsertEdge(const RelationshipEdge& edge, bool overwrite = false) = 0;
    virtual void deleteEdge(const NodePair& pair, RelationshipType type) = 0;

    virtual std::uint64_t version() = 0;
};

// ═══════════════════════════════════════════
//  InMemoryGraphStore
//  Edge writes to the same pair are linearized by a lock stripe;
//  disjoint pairs build their snapshots concurrently and publish with
//  a version check, rebuilding on a lost race. Node writes are
//  exclusive.
// ═══════════════════════════════════════════
class InMemoryGraphStore : public GraphStore {
public:
    explicit InMemoryGraphStore(WeightOptions weights = {});

    std::shared_ptr<const GraphSnapshot> snapshot() override;

    UpsertOutcome upsertNode(const BusinessNode& node) override;
    void removeNode(const std::string& id) override;
    UpsertOutcome upsertEdge(const RelationshipEdge& edge, bool overwrite = false) override;
    void deleteEdge(const NodePair& pair, RelationshipType type) override;

    std::uint64_t version() override;

    // Swap in a fully built graph (hydration from durable storage).
    void replace(std::shared_ptr<GraphSnapshot> next);

    const WeightOptions& weights() const { return weights_; }

    // Normalizes an incoming edge: derived weight, default timestamps.
    // Validates the edge against `base` and reports whether it exists.
    static RelationshipEdge prepareEdge(const GraphSnapshot& base, const RelationshipEdge& edge,
                                        bool overwrite, const WeightOptions& weights,
                                        UpsertOutcome& outcome);
    static BusinessNode prepareNode(const GraphSnapshot& base, const BusinessNode& node,
                                    UpsertOutcome& outcome);

private:
    // Build a successor from the current root and publish it.
    template <typename Edit>
    void commit(Edit&& edit);

    std::mutex& stripeFor(const NodePair& pair);

    WeightOptions weights_;
    std::shared_mutex structure_;                 // shared: edge writes, exclusive: node writes
    std::array<std::mutex, 64> stripes_;
    std::mutex rootMutex_;
    std::shared_ptr<const GraphSnapshot> root_;
};

// ── Bulk loading ──
// {"businesses": [...], "relationships": [...]}; every record is
// validated, relationships are upserted with overwrite.
struct LoadSummary {
    std::size_t businesses = 0;
    std::size_t relationships = 0;
};

LoadSummary loadGraphJson(GraphStore& store, const nlohmann::json& doc);

} // namespace bizgraph
