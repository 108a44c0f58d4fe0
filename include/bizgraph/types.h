#pragma once
// ═══════════════════════════════════════════════════════════════════
//  bizgraph/types.h - Business graph data model
// ═══════════════════════════════════════════════════════════════════

#include "json_utils.h"
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace bizgraph {

// ── Relationship type ──
enum class RelationshipType { Vendor, Client, Partner };

const char* relationshipTypeName(RelationshipType type);
RelationshipType parseRelationshipType(const std::string& name);

// ── Business entity ──
struct BusinessNode {
    std::string id;
    std::string name;
    std::string category;
    std::string location;
    std::string sizeClass;
    Timestamp createdAt{};
    Timestamp updatedAt{};
};

// ── Unordered pair of business ids, smaller id first ──
struct NodePair {
    std::string a;
    std::string b;

    static NodePair of(const std::string& x, const std::string& y) {
        return x <= y ? NodePair{x, y} : NodePair{y, x};
    }

    bool contains(const std::string& id) const { return a == id || b == id; }
    std::string toString() const { return a + "|" + b; }

    bool operator==(const NodePair&) const = default;
    auto operator<=>(const NodePair&) const = default;
};

struct NodePairHash {
    std::size_t operator()(const NodePair& p) const {
        std::size_t h = std::hash<std::string>{}(p.a);
        return h ^ (std::hash<std::string>{}(p.b) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }
};

// ── Weighted undirected relationship record ──
struct RelationshipEdge {
    std::string source;
    std::string target;
    RelationshipType type = RelationshipType::Partner;
    double transactionVolume = 0.0;
    std::string frequency;
    Timestamp createdAt{};
    Timestamp lastTransaction{};
    double weight = 0.0;    // derived from transactionVolume by the store

    NodePair pair() const { return NodePair::of(source, target); }

    // "a|b|type" with the pair normalized
    std::string key() const;

    // The endpoint opposite to `id` (edges walk in both directions).
    const std::string& otherEnd(const std::string& id) const {
        return id == source ? target : source;
    }

    bool operator==(const RelationshipEdge&) const = default;
};

// Monotonic volume -> [0,1] mapping: v / (v + halfSaturationVolume).
double deriveWeight(double transactionVolume, double halfSaturationVolume);

// Inverse of deriveWeight, for fixtures and tooling. weight must be in [0,1).
double volumeForWeight(double weight, double halfSaturationVolume);

// ── Query results ──
struct PathResult {
    std::vector<std::string> nodes;        // source .. target
    std::vector<RelationshipEdge> edges;   // one per hop
    double aggregateWeight = 1.0;          // product of edge weights

    std::size_t hops() const { return edges.size(); }
    bool operator==(const PathResult&) const = default;
};

struct NoPath {
    std::string source;
    std::string target;
    int maxDepth = 0;

    bool operator==(const NoPath&) const = default;
};

struct NeighborhoodEntry {
    std::string nodeId;
    int distance = 0;
    double weight = 1.0;
    std::vector<std::string> path;

    bool operator==(const NeighborhoodEntry&) const = default;
};

struct Neighborhood {
    std::string source;
    int maxDepth = 0;
    std::vector<NeighborhoodEntry> entries;   // ordered by (distance, nodeId)

    const NeighborhoodEntry* find(const std::string& nodeId) const;
    bool operator==(const Neighborhood&) const = default;
};

// ── Mutation events ──
enum class ChangeKind { Created, Updated, Deleted };
enum class EntityKind { Node, Edge };

const char* changeKindName(ChangeKind kind);
ChangeKind parseChangeKind(const std::string& name);

struct EdgeRef {
    NodePair pair;
    RelationshipType type = RelationshipType::Partner;

    bool operator==(const EdgeRef&) const = default;
};

struct InvalidationEvent {
    EntityKind entity = EntityKind::Edge;
    std::string nodeId;              // node events
    std::optional<EdgeRef> edge;     // edge events
    ChangeKind kind = ChangeKind::Updated;
    Timestamp at{};

    static InvalidationEvent forEdge(const EdgeRef& ref, ChangeKind kind, Timestamp at);
    static InvalidationEvent forNode(const std::string& id, ChangeKind kind, Timestamp at);

    // True when the event concerns this business id (node or edge endpoint).
    bool touches(const std::string& id) const;
};

// ── JSON (snake_case on the wire) ──
void to_json(nlohmann::json& j, const RelationshipType& t);
void from_json(const nlohmann::json& j, RelationshipType& t);
void to_json(nlohmann::json& j, const BusinessNode& n);
void from_json(const nlohmann::json& j, BusinessNode& n);
void to_json(nlohmann::json& j, const RelationshipEdge& e);
void from_json(const nlohmann::json& j, RelationshipEdge& e);
void to_json(nlohmann::json& j, const PathResult& p);
void to_json(nlohmann::json& j, const NeighborhoodEntry& e);
void to_json(nlohmann::json& j, const Neighborhood& n);
void to_json(nlohmann::json& j, const InvalidationEvent& e);

} // namespace bizgraph
