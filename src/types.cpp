// ═══════════════════════════════════════════════════════════════════
//  types.cpp - Data model helpers and JSON conversions
// ═══════════════════════════════════════════════════════════════════

#include "bizgraph/types.h"
#include <algorithm>
#include <cmath>

namespace bizgraph {

const char* relationshipTypeName(RelationshipType type) {
    switch (type) {
        case RelationshipType::Vendor:  return "vendor";
        case RelationshipType::Client:  return "client";
        case RelationshipType::Partner: return "partner";
    }
    return "partner";
}

RelationshipType parseRelationshipType(const std::string& name) {
    if (name == "vendor")  return RelationshipType::Vendor;
    if (name == "client")  return RelationshipType::Client;
    if (name == "partner") return RelationshipType::Partner;
    throw invalidArgument("Unknown relationship_type: '" + name + "'");
}

const char* changeKindName(ChangeKind kind) {
    switch (kind) {
        case ChangeKind::Created: return "created";
        case ChangeKind::Updated: return "updated";
        case ChangeKind::Deleted: return "deleted";
    }
    return "updated";
}

ChangeKind parseChangeKind(const std::string& name) {
    if (name == "created") return ChangeKind::Created;
    if (name == "updated") return ChangeKind::Updated;
    if (name == "deleted") return ChangeKind::Deleted;
    throw invalidArgument("Unknown change kind: '" + name + "'");
}

std::string RelationshipEdge::key() const {
    return pair().toString() + "|" + relationshipTypeName(type);
}

double deriveWeight(double transactionVolume, double halfSaturationVolume) {
    if (!(transactionVolume > 0.0) || !std::isfinite(transactionVolume)) return 0.0;
    if (halfSaturationVolume <= 0.0) return 1.0;
    return std::clamp(transactionVolume / (transactionVolume + halfSaturationVolume), 0.0, 1.0);
}

double volumeForWeight(double weight, double halfSaturationVolume) {
    if (weight < 0.0 || weight >= 1.0) {
        throw invalidArgument("weight must be in [0, 1) to invert");
    }
    return halfSaturationVolume * weight / (1.0 - weight);
}

const NeighborhoodEntry* Neighborhood::find(const std::string& nodeId) const {
    auto it = std::find_if(entries.begin(), entries.end(),
        [&](const NeighborhoodEntry& e) { return e.nodeId == nodeId; });
    return it != entries.end() ? &*it : nullptr;
}

InvalidationEvent InvalidationEvent::forEdge(const EdgeRef& ref, ChangeKind kind, Timestamp at) {
    InvalidationEvent ev;
    ev.entity = EntityKind::Edge;
    ev.edge = ref;
    ev.kind = kind;
    ev.at = at;
    return ev;
}

InvalidationEvent InvalidationEvent::forNode(const std::string& id, ChangeKind kind, Timestamp at) {
    InvalidationEvent ev;
    ev.entity = EntityKind::Node;
    ev.nodeId = id;
    ev.kind = kind;
    ev.at = at;
    return ev;
}

bool InvalidationEvent::touches(const std::string& id) const {
    if (entity == EntityKind::Node) return nodeId == id;
    return edge.has_value() && edge->pair.contains(id);
}

// ─── JSON ──────────────────────────────────────────────────────────

void to_json(nlohmann::json& j, const RelationshipType& t) {
    j = relationshipTypeName(t);
}

void from_json(const nlohmann::json& j, RelationshipType& t) {
    t = parseRelationshipType(j.get<std::string>());
}

void to_json(nlohmann::json& j, const BusinessNode& n) {
    j = {
        {"id", n.id},
        {"name", n.name},
        {"category", n.category},
        {"location", n.location},
        {"size_class", n.sizeClass},
        {"created_at", n.createdAt},
        {"updated_at", n.updatedAt}
    };
}

void from_json(const nlohmann::json& j, BusinessNode& n) {
    n.id = j.at("id").get<std::string>();
    n.name = j.value("name", "");
    n.category = j.value("category", "");
    n.location = j.value("location", "");
    n.sizeClass = j.value("size_class", "");
    if (j.contains("created_at")) n.createdAt = j.at("created_at").get<Timestamp>();
    if (j.contains("updated_at")) n.updatedAt = j.at("updated_at").get<Timestamp>();
}

void to_json(nlohmann::json& j, const RelationshipEdge& e) {
    j = {
        {"source", e.source},
        {"target", e.target},
        {"relationship_type", e.type},
        {"transaction_volume", e.transactionVolume},
        {"frequency", e.frequency},
        {"created_at", e.createdAt},
        {"last_transaction", e.lastTransaction},
        {"weight", e.weight}
    };
}

void from_json(const nlohmann::json& j, RelationshipEdge& e) {
    e.source = j.at("source").get<std::string>();
    e.target = j.at("target").get<std::string>();
    e.type = j.at("relationship_type").get<RelationshipType>();
    e.transactionVolume = j.value("transaction_volume", 0.0);
    e.frequency = j.value("frequency", "");
    if (j.contains("created_at")) e.createdAt = j.at("created_at").get<Timestamp>();
    if (j.contains("last_transaction")) e.lastTransaction = j.at("last_transaction").get<Timestamp>();
    // weight is derived by the store; an incoming value is ignored
    e.weight = 0.0;
}

void to_json(nlohmann::json& j, const PathResult& p) {
    j = {
        {"nodes", p.nodes},
        {"hops", p.hops()},
        {"aggregate_weight", p.aggregateWeight}
    };
}

void to_json(nlohmann::json& j, const NeighborhoodEntry& e) {
    j = {
        {"node_id", e.nodeId},
        {"distance", e.distance},
        {"weight", e.weight},
        {"path", e.path}
    };
}

void to_json(nlohmann::json& j, const Neighborhood& n) {
    j = {
        {"source", n.source},
        {"max_depth", n.maxDepth},
        {"entries", n.entries}
    };
}

void to_json(nlohmann::json& j, const InvalidationEvent& e) {
    j = {
        {"entity", e.entity == EntityKind::Node ? "node" : "edge"},
        {"kind", changeKindName(e.kind)},
        {"at", e.at}
    };
    if (e.entity == EntityKind::Node) {
        j["node_id"] = e.nodeId;
    } else if (e.edge) {
        j["pair"] = {e.edge->pair.a, e.edge->pair.b};
        j["relationship_type"] = e.edge->type;
    }
}

} // namespace bizgraph
