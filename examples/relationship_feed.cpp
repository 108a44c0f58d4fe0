// ═══════════════════════════════════════════════════════════════════
//  relationship_feed.cpp - Apply a stream of relationship changes
// ═══════════════════════════════════════════════════════════════════
//
//  relationship_feed [config.json] < changes.jsonl
//
//  Each input line is one change, e.g.
//    {"entity":"node","kind":"created","business":{"id":"acme","name":"Acme"}}
//    {"entity":"edge","kind":"created","relationship":{"source":"acme","target":"bolt",
//     "relationship_type":"vendor","transaction_volume":1200,"frequency":"weekly"}}
//    {"entity":"edge","kind":"deleted","source":"acme","target":"bolt","relationship_type":"vendor"}
//
//  Lines starting with "?" are queries: "? path acme bolt 2", "? hood acme 1".
//
// ═══════════════════════════════════════════════════════════════════

#include <bizgraph/bizgraph.h>
#include <iostream>
#include <sstream>
#include <string>

using namespace bizgraph;

namespace {

nlohmann::json runQuery(NetworkQueryService& service, const std::string& line) {
    std::istringstream in(line.substr(1));
    std::string shape, source, target;
    int depth = 0;
    in >> shape >> source;
    if (shape == "path") {
        in >> target >> depth;
        return toEnvelope(service.findPath({source, target, depth, std::nullopt}));
    }
    if (shape == "hood") {
        in >> depth;
        return toEnvelope(service.neighborhood({source, depth, std::nullopt}));
    }
    throw invalidArgument("unknown query shape '" + shape + "'");
}

} // namespace

int main(int argc, char** argv) {
    EngineConfig config;
    try {
        config = argc > 1 ? loadConfig(argv[1]) : parseConfig(nlohmann::json::object());
    } catch (const Error& e) {
        console::error(errorEnvelope(e).dump());
        return 1;
    }
    applyLogging(config.log);

    std::unique_ptr<GraphStore> store;
    try {
        store = makeStore(config);
    } catch (const Error& e) {
        console::error(errorEnvelope(e).dump());
        return 1;
    }

    ResultCache cache(config.cache);
    QueryMetrics metrics;
    NetworkQueryService service(*store, cache, metrics, config.service, config.traversal);

    InvalidationCoordinator coordinator(cache, config.invalidation, &metrics);
    coordinator.attach(service.mutations());
    coordinator.onRefresh([&service](const std::vector<CacheKey>& keys) { service.refresh(keys); });

    std::size_t lineNo = 0, applied = 0, failed = 0;
    std::string line;
    while (std::getline(std::cin, line)) {
        lineNo++;
        if (line.empty() || line[0] == '#') continue;
        try {
            if (line[0] == '?') {
                std::cout << runQuery(service, line).dump() << "\n";
                continue;
            }
            auto ack = service.applyRelationshipChange(nlohmann::json::parse(line));
            applied++;
            console::success("line", lineNo, "applied, version", ack.version,
                             "invalidated", ack.invalidated);
            std::cout << toEnvelope(ack).dump() << "\n";
        } catch (const Error& e) {
            failed++;
            console::warn("line", lineNo, "rejected:", e.what());
            std::cout << errorEnvelope(e).dump() << "\n";
        } catch (const nlohmann::json::parse_error& e) {
            failed++;
            console::warn("line", lineNo, "is not JSON:", e.what());
        }
    }

    console::info(applied, "changes applied,", failed, "rejected");
    std::cout << metrics.serialize();
    return failed == 0 ? 0 : 2;
}
