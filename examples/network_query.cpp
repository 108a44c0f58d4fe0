// ═══════════════════════════════════════════════════════════════════
//  network_query.cpp - Path, neighborhood and relationship queries
// ═══════════════════════════════════════════════════════════════════
//
//  network_query [config.json] [graph.json]
//
//  Without a graph file a small sample network is loaded.
//
// ═══════════════════════════════════════════════════════════════════

#include <bizgraph/bizgraph.h>
#include <fstream>
#include <sstream>
#include <iostream>

using namespace bizgraph;

namespace {

nlohmann::json sampleGraph() {
    auto business = [](const std::string& id, const std::string& name, const std::string& category) {
        return nlohmann::json{{"id", id}, {"name", name}, {"category", category},
                              {"location", "Austin, TX"}, {"size_class", "small"}};
    };
    auto relationship = [](const std::string& a, const std::string& b, const std::string& type, double volume) {
        return nlohmann::json{{"source", a}, {"target", b}, {"relationship_type", type},
                              {"transaction_volume", volume}, {"frequency", "monthly"},
                              {"created_at", "2024-01-15T09:00:00Z"},
                              {"last_transaction", "2024-06-01T12:00:00Z"}};
    };
    return {
        {"businesses", {
            business("acme", "Acme Supply", "wholesale"),
            business("bolt", "Bolt Logistics", "logistics"),
            business("cedar", "Cedar Cafe", "food"),
            business("delta", "Delta Print", "printing"),
            business("ember", "Ember Studio", "design")
        }},
        {"relationships", {
            relationship("acme", "bolt", "vendor", 90000),
            relationship("bolt", "cedar", "client", 10000),
            relationship("acme", "cedar", "partner", 30000.0 / 7.0),
            relationship("cedar", "delta", "vendor", 25000),
            relationship("delta", "ember", "partner", 5000)
        }}
    };
}

nlohmann::json readJsonFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) throw notFound("File '" + path + "'");
    std::stringstream ss;
    ss << file.rdbuf();
    return nlohmann::json::parse(ss.str());
}

void show(const std::string& title, const nlohmann::json& envelope) {
    console::info(title);
    std::cout << envelope.dump(2) << "\n";
}

} // namespace

int main(int argc, char** argv) {
    try {
        EngineConfig config = argc > 1 ? loadConfig(argv[1]) : parseConfig(nlohmann::json::object());
        applyLogging(config.log);

        auto store = makeStore(config);
        loadGraphJson(*store, argc > 2 ? readJsonFile(argv[2]) : sampleGraph());

        ResultCache cache(config.cache);
        CacheSweeper sweeper(cache);
        QueryMetrics metrics;
        NetworkQueryService service(*store, cache, metrics, config.service, config.traversal);

        InvalidationCoordinator coordinator(cache, config.invalidation, &metrics);
        coordinator.attach(service.mutations());

        console::time("queries");
        show("acme -> cedar (depth 2)", toEnvelope(service.findPath({"acme", "cedar", 2, std::nullopt})));
        show("acme -> ember (depth 2)", toEnvelope(service.findPath({"acme", "ember", 2, std::nullopt})));
        show("acme -> ember (depth 4)", toEnvelope(service.findPath({"acme", "ember", 4, std::nullopt})));
        show("neighborhood of acme (depth 1)", toEnvelope(service.neighborhood({"acme", 1, std::nullopt})));
        show("relationships of cedar", toEnvelope(service.relationships("cedar")));

        // same query again: served from the cache
        show("acme -> cedar (repeat)", toEnvelope(service.findPath({"acme", "cedar", 2, std::nullopt})));
        console::timeEnd("queries");

        try {
            service.findPath({"acme", "cedar", 0, std::nullopt});
        } catch (const Error& e) {
            show("invalid depth", errorEnvelope(e));
        }

        std::cout << metrics.serialize();
        std::cout << nlohmann::json(cache.stats()).dump(2) << "\n";
    } catch (const Error& e) {
        console::error(errorEnvelope(e).dump());
        return 1;
    } catch (const nlohmann::json::exception& e) {
        console::error("bad JSON input:", e.what());
        return 1;
    }
    return 0;
}
