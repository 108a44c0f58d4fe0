// ═══════════════════════════════════════════════════════════════════
//  sqlite_graph_store.cpp - Durable graph store on SQLite
// ═══════════════════════════════════════════════════════════════════

#include "bizgraph/sqlite_graph_store.h"
#include "bizgraph/console.h"
#include <cstdint>
#include <string>

namespace bizgraph {

namespace {

constexpr const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS businesses (
    id          TEXT PRIMARY KEY,
    name        TEXT NOT NULL DEFAULT '',
    category    TEXT NOT NULL DEFAULT '',
    location    TEXT NOT NULL DEFAULT '',
    size_class  TEXT NOT NULL DEFAULT '',
    created_at  INTEGER NOT NULL,
    updated_at  INTEGER NOT NULL
);

CREATE TABLE IF NOT EXISTS relationships (
    node_a             TEXT NOT NULL REFERENCES businesses(id) ON DELETE CASCADE,
    node_b             TEXT NOT NULL REFERENCES businesses(id) ON DELETE CASCADE,
    relationship_type  TEXT NOT NULL CHECK (relationship_type IN ('vendor', 'client', 'partner')),
    source             TEXT NOT NULL,
    target             TEXT NOT NULL,
    transaction_volume REAL NOT NULL CHECK (transaction_volume >= 0),
    frequency          TEXT NOT NULL DEFAULT '',
    created_at         INTEGER NOT NULL,
    last_transaction   INTEGER NOT NULL,
    PRIMARY KEY (node_a, node_b, relationship_type)
);

CREATE INDEX IF NOT EXISTS idx_relationships_node_b ON relationships(node_b);
)SQL";

// Timestamps are stored as epoch milliseconds.
std::int64_t millis(Timestamp tp) {
    return epochMillis(tp);
}

Timestamp fromMillis(const std::string& text) {
    return Timestamp{std::chrono::milliseconds(std::stoll(text))};
}

} // namespace

SqliteGraphStore::SqliteGraphStore(const std::string& path, WeightOptions weights, int busyTimeoutMs)
    : db_(path, busyTimeoutMs), mirror_(weights) {
    migrate();
    hydrate();
}

void SqliteGraphStore::migrate() {
    db_.execMulti(kSchema);
}

void SqliteGraphStore::hydrate() {
    auto next = std::make_shared<GraphSnapshot>();
    const auto& weights = mirror_.weights();

    db_.each("SELECT id, name, category, location, size_class, created_at, updated_at FROM businesses",
             {}, [&](const db::Row& row) {
        BusinessNode node;
        node.id = row.at("id");
        node.name = row.at("name");
        node.category = row.at("category");
        node.location = row.at("location");
        node.sizeClass = row.at("size_class");
        node.createdAt = fromMillis(row.at("created_at"));
        node.updatedAt = fromMillis(row.at("updated_at"));
        next->insertNode(node);
    });

    db_.each("SELECT relationship_type, source, target, transaction_volume, frequency, "
             "created_at, last_transaction FROM relationships",
             {}, [&](const db::Row& row) {
        RelationshipEdge edge;
        edge.source = row.at("source");
        edge.target = row.at("target");
        edge.type = parseRelationshipType(row.at("relationship_type"));
        edge.transactionVolume = std::stod(row.at("transaction_volume"));
        edge.frequency = row.at("frequency");
        edge.createdAt = fromMillis(row.at("created_at"));
        edge.lastTransaction = fromMillis(row.at("last_transaction"));
        edge.weight = deriveWeight(edge.transactionVolume, weights.halfSaturationVolume);
        next->insertEdge(edge);
    });

    seenDataVersion_ = db_.dataVersion();
    console::debug("sqlite store hydrated:", next->nodeCount(), "businesses,",
                   next->edgeCount(), "relationships from", db_.path());
    mirror_.replace(std::move(next));
}

void SqliteGraphStore::refreshIfChanged() {
    if (db_.dataVersion() != seenDataVersion_) {
        console::debug("sqlite store changed by another connection, rehydrating");
        hydrate();
    }
}

std::shared_ptr<const GraphSnapshot> SqliteGraphStore::snapshot() {
    // A writer in progress publishes to the mirror itself.
    std::unique_lock<std::mutex> lock(writeMutex_, std::try_to_lock);
    if (lock.owns_lock()) refreshIfChanged();
    return mirror_.snapshot();
}

std::uint64_t SqliteGraphStore::version() {
    return snapshot()->version();
}

UpsertOutcome SqliteGraphStore::upsertNode(const BusinessNode& node) {
    std::lock_guard<std::mutex> lock(writeMutex_);
    refreshIfChanged();

    UpsertOutcome outcome = UpsertOutcome::Created;
    BusinessNode prepared = InMemoryGraphStore::prepareNode(*mirror_.snapshot(), node, outcome);

    db_.transaction([&] {
        db_.exec(
            "INSERT INTO businesses (id, name, category, location, size_class, created_at, updated_at) "
            "VALUES (?, ?, ?, ?, ?, ?, ?) "
            "ON CONFLICT(id) DO UPDATE SET name = excluded.name, category = excluded.category, "
            "location = excluded.location, size_class = excluded.size_class, "
            "updated_at = excluded.updated_at",
            {prepared.id, prepared.name, prepared.category, prepared.location, prepared.sizeClass,
             millis(prepared.createdAt), millis(prepared.updatedAt)});
    });

    mirror_.upsertNode(prepared);
    return outcome;
}

void SqliteGraphStore::removeNode(const std::string& id) {
    std::lock_guard<std::mutex> lock(writeMutex_);
    refreshIfChanged();

    if (!mirror_.snapshot()->hasNode(id)) throw notFound("Business '" + id + "'");

    // relationships go with the business (ON DELETE CASCADE)
    db_.transaction([&] {
        db_.exec("DELETE FROM businesses WHERE id = ?", {id});
    });

    mirror_.removeNode(id);
}

UpsertOutcome SqliteGraphStore::upsertEdge(const RelationshipEdge& edge, bool overwrite) {
    std::lock_guard<std::mutex> lock(writeMutex_);
    refreshIfChanged();

    UpsertOutcome outcome = UpsertOutcome::Created;
    RelationshipEdge prepared = InMemoryGraphStore::prepareEdge(
        *mirror_.snapshot(), edge, overwrite, mirror_.weights(), outcome);
    auto pair = prepared.pair();

    db_.transaction([&] {
        db_.exec(
            "INSERT INTO relationships (node_a, node_b, relationship_type, source, target, "
            "transaction_volume, frequency, created_at, last_transaction) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?) "
            "ON CONFLICT(node_a, node_b, relationship_type) DO UPDATE SET "
            "source = excluded.source, target = excluded.target, "
            "transaction_volume = excluded.transaction_volume, frequency = excluded.frequency, "
            "last_transaction = excluded.last_transaction",
            {pair.a, pair.b, relationshipTypeName(prepared.type), prepared.source, prepared.target,
             prepared.transactionVolume, prepared.frequency,
             millis(prepared.createdAt), millis(prepared.lastTransaction)});
    });

    mirror_.upsertEdge(prepared, true);
    return outcome;
}

void SqliteGraphStore::deleteEdge(const NodePair& pair, RelationshipType type) {
    std::lock_guard<std::mutex> lock(writeMutex_);
    refreshIfChanged();

    if (!mirror_.snapshot()->findEdge(pair, type)) {
        throw notFound("Relationship " + pair.toString() + "|" + relationshipTypeName(type));
    }

    db_.transaction([&] {
        db_.exec("DELETE FROM relationships WHERE node_a = ? AND node_b = ? AND relationship_type = ?",
                 {pair.a, pair.b, relationshipTypeName(type)});
    });

    mirror_.deleteEdge(pair, type);
}

} // namespace bizgraph
