#pragma once
// ═══════════════════════════════════════════════════════════════════
//  bizgraph/sqlite_graph_store.h - Durable graph store on SQLite
// ═══════════════════════════════════════════════════════════════════
//
//  SQLite is the canonical state. Reads are served from an in-memory
//  snapshot mirror, which is rebuilt when PRAGMA data_version shows
//  that another connection committed to the same file.
//
// ═══════════════════════════════════════════════════════════════════

#include "database.h"
#include "graph_store.h"
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace bizgraph {

class SqliteGraphStore : public GraphStore {
public:
    explicit SqliteGraphStore(const std::string& path = ":memory:",
                              WeightOptions weights = {},
                              int busyTimeoutMs = 50);

    std::shared_ptr<const GraphSnapshot> snapshot() override;

    UpsertOutcome upsertNode(const BusinessNode& node) override;
    void removeNode(const std::string& id) override;
    UpsertOutcome upsertEdge(const RelationshipEdge& edge, bool overwrite = false) override;
    void deleteEdge(const NodePair& pair, RelationshipType type) override;

    std::uint64_t version() override;

    // Re-read every row into a fresh snapshot.
    void hydrate();

    db::Database& database() { return db_; }

private:
    void migrate();
    void refreshIfChanged();

    db::Database db_;
    InMemoryGraphStore mirror_;
    std::mutex writeMutex_;
    std::int64_t seenDataVersion_ = 0;
};

} // namespace bizgraph
