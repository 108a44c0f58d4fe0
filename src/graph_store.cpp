// ═══════════════════════════════════════════════════════════════════
//  graph_store.cpp - Copy-on-write snapshots and the in-memory store
// ═══════════════════════════════════════════════════════════════════

#include "bizgraph/graph_store.h"
#include "bizgraph/console.h"
#include "bizgraph/schemas.h"
#include <algorithm>
#include <cmath>

namespace bizgraph {

namespace {

const GraphSnapshot::AdjacencyList& emptyAdjacency() {
    static const GraphSnapshot::AdjacencyList empty;
    return empty;
}

bool adjacentLess(const Adjacent& x, const std::string& neighborId, RelationshipType type) {
    if (x.neighborId != neighborId) return x.neighborId < neighborId;
    return x.edge.type < type;
}

} // namespace

// ─── GraphSnapshot: reads ──────────────────────────────────────────

const BusinessNode* GraphSnapshot::findNode(const std::string& id) const {
    auto it = nodes_.find(id);
    return it != nodes_.end() ? it->second.get() : nullptr;
}

const GraphSnapshot::AdjacencyList& GraphSnapshot::neighbors(const std::string& id) const {
    auto it = adjacency_.find(id);
    return it != adjacency_.end() ? *it->second : emptyAdjacency();
}

const RelationshipEdge* GraphSnapshot::findEdge(const NodePair& pair, RelationshipType type) const {
    const auto& list = neighbors(pair.a);
    auto it = std::lower_bound(list.begin(), list.end(), pair.b,
        [type](const Adjacent& x, const std::string& id) { return adjacentLess(x, id, type); });
    if (it != list.end() && it->neighborId == pair.b && it->edge.type == type) {
        return &it->edge;
    }
    return nullptr;
}

std::vector<RelationshipEdge> GraphSnapshot::edgesBetween(const NodePair& pair) const {
    std::vector<RelationshipEdge> out;
    for (const auto& adj : neighbors(pair.a)) {
        if (adj.neighborId == pair.b) out.push_back(adj.edge);
    }
    return out;
}

std::vector<std::string> GraphSnapshot::nodeIds() const {
    std::vector<std::string> ids;
    ids.reserve(nodes_.size());
    for (const auto& [id, _] : nodes_) ids.push_back(id);
    std::sort(ids.begin(), ids.end());
    return ids;
}

void GraphSnapshot::forEachNode(const std::function<void(const BusinessNode&)>& fn) const {
    for (const auto& [_, node] : nodes_) fn(*node);
}

void GraphSnapshot::forEachEdge(const std::function<void(const RelationshipEdge&)>& fn) const {
    for (const auto& [id, list] : adjacency_) {
        for (const auto& adj : *list) {
            if (adj.edge.pair().a == id) fn(adj.edge);
        }
    }
}

// ─── GraphSnapshot: copy-on-write edits ────────────────────────────

void GraphSnapshot::putAdjacent(const std::string& from, Adjacent adj) {
    auto copy = std::make_shared<AdjacencyList>(neighbors(from));
    auto type = adj.edge.type;
    auto it = std::lower_bound(copy->begin(), copy->end(), adj.neighborId,
        [type](const Adjacent& x, const std::string& id) { return adjacentLess(x, id, type); });
    if (it != copy->end() && it->neighborId == adj.neighborId && it->edge.type == type) {
        *it = std::move(adj);
    } else {
        copy->insert(it, std::move(adj));
    }
    adjacency_[from] = std::move(copy);
}

void GraphSnapshot::dropAdjacent(const std::string& from, const std::string& neighborId,
                                 RelationshipType type) {
    auto copy = std::make_shared<AdjacencyList>(neighbors(from));
    copy->erase(std::remove_if(copy->begin(), copy->end(),
        [&](const Adjacent& x) { return x.neighborId == neighborId && x.edge.type == type; }),
        copy->end());
    adjacency_[from] = std::move(copy);
}

void GraphSnapshot::insertNode(const BusinessNode& node) {
    nodes_[node.id] = std::make_shared<const BusinessNode>(node);
    if (!adjacency_.count(node.id)) {
        adjacency_[node.id] = std::make_shared<const AdjacencyList>();
    }
}

void GraphSnapshot::insertEdge(const RelationshipEdge& edge) {
    auto pair = edge.pair();
    if (!findEdge(pair, edge.type)) edgeCount_++;
    putAdjacent(pair.a, Adjacent{pair.b, edge});
    putAdjacent(pair.b, Adjacent{pair.a, edge});
}

std::shared_ptr<GraphSnapshot> GraphSnapshot::withNode(const BusinessNode& node) const {
    auto next = std::make_shared<GraphSnapshot>(*this);
    next->insertNode(node);
    return next;
}

std::shared_ptr<GraphSnapshot> GraphSnapshot::withoutNode(const std::string& id) const {
    auto next = std::make_shared<GraphSnapshot>(*this);
    for (const auto& adj : neighbors(id)) {
        if (adj.neighborId != id) {
            next->dropAdjacent(adj.neighborId, id, adj.edge.type);
        }
        next->edgeCount_--;
    }
    next->adjacency_.erase(id);
    next->nodes_.erase(id);
    return next;
}

std::shared_ptr<GraphSnapshot> GraphSnapshot::withEdge(const RelationshipEdge& edge) const {
    auto next = std::make_shared<GraphSnapshot>(*this);
    next->insertEdge(edge);
    return next;
}

std::shared_ptr<GraphSnapshot> GraphSnapshot::withoutEdge(const NodePair& pair, RelationshipType type) const {
    auto next = std::make_shared<GraphSnapshot>(*this);
    if (findEdge(pair, type)) {
        next->dropAdjacent(pair.a, pair.b, type);
        next->dropAdjacent(pair.b, pair.a, type);
        next->edgeCount_--;
    }
    return next;
}

// ─── GraphStore convenience reads ──────────────────────────────────

BusinessNode GraphStore::getNode(const std::string& id) {
    auto snap = snapshot();
    const BusinessNode* node = snap->findNode(id);
    if (!node) throw notFound("Business '" + id + "'");
    return *node;
}

std::vector<Adjacent> GraphStore::getNeighbors(const std::string& id) {
    auto snap = snapshot();
    if (!snap->hasNode(id)) throw notFound("Business '" + id + "'");
    return snap->neighbors(id);
}

// ─── InMemoryGraphStore ────────────────────────────────────────────

InMemoryGraphStore::InMemoryGraphStore(WeightOptions weights)
    : weights_(weights), root_(std::make_shared<GraphSnapshot>()) {}

std::shared_ptr<const GraphSnapshot> InMemoryGraphStore::snapshot() {
    std::lock_guard<std::mutex> lock(rootMutex_);
    return root_;
}

std::uint64_t InMemoryGraphStore::version() {
    return snapshot()->version();
}

void InMemoryGraphStore::replace(std::shared_ptr<GraphSnapshot> next) {
    std::unique_lock<std::shared_mutex> structure(structure_);
    std::lock_guard<std::mutex> lock(rootMutex_);
    next->setVersion(root_->version() + 1);
    root_ = std::move(next);
}

std::mutex& InMemoryGraphStore::stripeFor(const NodePair& pair) {
    return stripes_[NodePairHash{}(pair) % stripes_.size()];
}

template <typename Edit>
void InMemoryGraphStore::commit(Edit&& edit) {
    for (;;) {
        auto base = snapshot();
        std::shared_ptr<GraphSnapshot> next = edit(*base);
        std::lock_guard<std::mutex> lock(rootMutex_);
        if (root_ == base) {
            next->setVersion(base->version() + 1);
            root_ = std::move(next);
            return;
        }
        // another pair was published in between; rebuild on the new root
    }
}

BusinessNode InMemoryGraphStore::prepareNode(const GraphSnapshot& base, const BusinessNode& node,
                                             UpsertOutcome& outcome) {
    if (node.id.empty()) throw invalidArgument("Business id must not be empty");
    BusinessNode prepared = node;
    auto now = std::chrono::system_clock::now();
    const BusinessNode* existing = base.findNode(node.id);
    if (existing) {
        outcome = UpsertOutcome::Updated;
        prepared.createdAt = existing->createdAt;
        if (prepared.updatedAt == Timestamp{}) prepared.updatedAt = now;
    } else {
        outcome = UpsertOutcome::Created;
        if (prepared.createdAt == Timestamp{}) prepared.createdAt = now;
        if (prepared.updatedAt == Timestamp{}) prepared.updatedAt = prepared.createdAt;
    }
    return prepared;
}

RelationshipEdge InMemoryGraphStore::prepareEdge(const GraphSnapshot& base, const RelationshipEdge& edge,
                                                 bool overwrite, const WeightOptions& weights,
                                                 UpsertOutcome& outcome) {
    if (edge.source.empty() || edge.target.empty()) {
        throw invalidArgument("Relationship endpoints must not be empty");
    }
    if (edge.source == edge.target) {
        throw invalidArgument("A business cannot have a relationship with itself: " + edge.source);
    }
    if (!std::isfinite(edge.transactionVolume) || edge.transactionVolume < 0.0) {
        throw invalidArgument("transaction_volume must be a finite value >= 0");
    }
    if (!base.hasNode(edge.source)) throw notFound("Business '" + edge.source + "'");
    if (!base.hasNode(edge.target)) throw notFound("Business '" + edge.target + "'");

    RelationshipEdge prepared = edge;
    const RelationshipEdge* existing = base.findEdge(edge.pair(), edge.type);
    if (existing) {
        if (!overwrite) {
            throw Error(ErrorCode::Conflict,
                "Relationship " + edge.key() + " already exists; overwrite not requested");
        }
        outcome = UpsertOutcome::Updated;
        if (prepared.createdAt == Timestamp{}) prepared.createdAt = existing->createdAt;
    } else {
        outcome = UpsertOutcome::Created;
        if (prepared.createdAt == Timestamp{}) prepared.createdAt = std::chrono::system_clock::now();
    }
    if (prepared.lastTransaction == Timestamp{}) prepared.lastTransaction = prepared.createdAt;
    prepared.weight = deriveWeight(prepared.transactionVolume, weights.halfSaturationVolume);
    return prepared;
}

UpsertOutcome InMemoryGraphStore::upsertNode(const BusinessNode& node) {
    std::unique_lock<std::shared_mutex> structure(structure_);
    UpsertOutcome outcome = UpsertOutcome::Created;
    commit([&](const GraphSnapshot& base) {
        return base.withNode(prepareNode(base, node, outcome));
    });
    return outcome;
}

void InMemoryGraphStore::removeNode(const std::string& id) {
    std::unique_lock<std::shared_mutex> structure(structure_);
    commit([&](const GraphSnapshot& base) {
        if (!base.hasNode(id)) throw notFound("Business '" + id + "'");
        return base.withoutNode(id);
    });
}

UpsertOutcome InMemoryGraphStore::upsertEdge(const RelationshipEdge& edge, bool overwrite) {
    std::shared_lock<std::shared_mutex> structure(structure_);
    std::lock_guard<std::mutex> pairLock(stripeFor(edge.pair()));
    UpsertOutcome outcome = UpsertOutcome::Created;
    commit([&](const GraphSnapshot& base) {
        return base.withEdge(prepareEdge(base, edge, overwrite, weights_, outcome));
    });
    return outcome;
}

void InMemoryGraphStore::deleteEdge(const NodePair& pair, RelationshipType type) {
    std::shared_lock<std::shared_mutex> structure(structure_);
    std::lock_guard<std::mutex> pairLock(stripeFor(pair));
    commit([&](const GraphSnapshot& base) {
        if (!base.findEdge(pair, type)) {
            throw notFound("Relationship " + pair.toString() + "|" + relationshipTypeName(type));
        }
        return base.withoutEdge(pair, type);
    });
}

// ─── Bulk loading ──────────────────────────────────────────────────

LoadSummary loadGraphJson(GraphStore& store, const nlohmann::json& doc) {
    if (!doc.is_object()) throw invalidArgument("Graph document must be a JSON object");

    LoadSummary summary;
    auto businessRules = schemas::business();
    auto relationshipRules = schemas::relationship();

    if (doc.contains("businesses")) {
        for (const auto& record : doc.at("businesses")) {
            businessRules.enforce(record, "business record");
            store.upsertNode(record.get<BusinessNode>());
            summary.businesses++;
        }
    }
    if (doc.contains("relationships")) {
        for (const auto& record : doc.at("relationships")) {
            relationshipRules.enforce(record, "relationship record");
            store.upsertEdge(record.get<RelationshipEdge>(), true);
            summary.relationships++;
        }
    }
    console::info("graph loaded:", summary.businesses, "businesses,",
                  summary.relationships, "relationships");
    return summary;
}

} // namespace bizgraph
