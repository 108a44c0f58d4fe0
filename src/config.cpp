// ═══════════════════════════════════════════════════════════════════
//  config.cpp - Engine configuration loading and validation
// ═══════════════════════════════════════════════════════════════════

#include "bizgraph/config.h"
#include "bizgraph/console.h"
#include "bizgraph/sqlite_graph_store.h"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

namespace bizgraph {

namespace {

constexpr const char* kLogLevelEnv = "BIZGRAPH_LOG_LEVEL";

std::vector<std::pair<std::string, validator::Schema>> sectionSchemas() {
    std::vector<std::pair<std::string, validator::Schema>> sections;

    validator::Schema traversal;
    traversal.field("defaultMaxDepth").optional().isInt().min(1).max(16);
    traversal.field("maxDepthCeiling").optional().isInt().min(1).max(16);
    traversal.field("maxNeighborsPerNode").optional().isInt().min(1);
    sections.emplace_back("traversal", std::move(traversal));

    validator::Schema weights;
    weights.field("halfSaturationVolume").optional().isNumber().custom(
        [](const nlohmann::json& v) -> std::optional<std::string> {
            if (v.get<double>() <= 0) return std::string("halfSaturationVolume must be > 0");
            return std::nullopt;
        });
    sections.emplace_back("weights", std::move(weights));

    validator::Schema cache;
    cache.field("maxEntries").optional().isInt().min(1);
    cache.field("ttlMs").optional().isInt().min(1);
    cache.field("bucketWidthMs").optional().isInt().min(1);
    cache.field("sweepIntervalMs").optional().isInt().min(1);
    cache.field("invalidationHistory").optional().isInt().min(0);
    sections.emplace_back("cache", std::move(cache));

    validator::Schema invalidation;
    invalidation.field("eagerDepth").optional().isInt().min(0).max(16);
    invalidation.field("refreshAfterInvalidate").optional().isBool();
    sections.emplace_back("invalidation", std::move(invalidation));

    validator::Schema service;
    service.field("defaultTimeoutMs").optional().isInt().min(1);
    service.field("coalesceMisses").optional().isBool();
    service.field("coalesceWaitMs").optional().isInt().min(0);
    service.field("retry").optional().isObject();
    sections.emplace_back("service", std::move(service));

    validator::Schema store;
    store.field("backend").optional().isString().oneOf({"memory", "sqlite"});
    store.field("path").optional().isString().minLength(1);
    store.field("busyTimeoutMs").optional().isInt().min(0);
    sections.emplace_back("store", std::move(store));

    validator::Schema log;
    log.field("level").optional().isString().oneOf({"debug", "info", "warn", "error", "silent"});
    log.field("color").optional().isBool();
    sections.emplace_back("log", std::move(log));

    return sections;
}

validator::Schema retrySchema() {
    validator::Schema retry;
    retry.field("maxAttempts").optional().isInt().min(1).max(10);
    retry.field("baseDelayMs").optional().isInt().min(0);
    retry.field("maxDelayMs").optional().isInt().min(0);
    return retry;
}

void collect(std::vector<validator::ValidationError>& out, const std::string& prefix,
             const std::vector<validator::ValidationError>& errors) {
    for (const auto& e : errors) {
        std::string field = e.field.empty() ? prefix : prefix + "." + e.field;
        out.push_back({field, prefix + ": " + e.message, e.rule});
    }
}

} // namespace

std::vector<validator::ValidationError> validateConfig(const nlohmann::json& doc) {
    std::vector<validator::ValidationError> errors;
    if (!doc.is_object()) {
        errors.push_back({"", "config must be a JSON object", "type"});
        return errors;
    }

    for (const auto& [name, rules] : sectionSchemas()) {
        if (doc.contains(name)) collect(errors, name, rules.validate(doc.at(name)));
    }
    if (doc.contains("service") && doc.at("service").is_object() && doc.at("service").contains("retry")) {
        const auto& retry = doc.at("service").at("retry");
        if (retry.is_object()) collect(errors, "service.retry", retrySchema().validate(retry));
    }

    // cross-field: the default depth must be allowed by the ceiling
    if (errors.empty() && doc.contains("traversal")) {
        TraversalOptions defaults;
        const auto& t = doc.at("traversal");
        int depth = t.value("defaultMaxDepth", defaults.defaultMaxDepth);
        int ceiling = t.value("maxDepthCeiling", defaults.maxDepthCeiling);
        if (depth > ceiling) {
            errors.push_back({"traversal.defaultMaxDepth",
                              "traversal: defaultMaxDepth must not exceed maxDepthCeiling", "max"});
        }
    }
    return errors;
}

EngineConfig parseConfig(const nlohmann::json& doc) {
    auto errors = validateConfig(doc);
    if (!errors.empty()) {
        std::string message = "Invalid config:";
        for (const auto& e : errors) message += " " + e.message + ";";
        throw invalidArgument(message);
    }
    EngineConfig config = doc.get<EngineConfig>();
    applyEnvironment(config);
    return config;
}

EngineConfig loadConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) throw notFound("Config file '" + path + "'");

    std::stringstream ss;
    ss << file.rdbuf();

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(ss.str());
    } catch (const nlohmann::json::parse_error& e) {
        throw invalidArgument("Config file '" + path + "' is not valid JSON: " + e.what());
    }
    auto config = parseConfig(doc);
    console::debug("config loaded from", path);
    return config;
}

void applyEnvironment(EngineConfig& config) {
    const char* level = std::getenv(kLogLevelEnv);
    if (!level || !*level) return;
    std::string value = level;
    if (value == "debug" || value == "info" || value == "warn" || value == "error" || value == "silent") {
        config.log.level = value;
    } else {
        console::warn(kLogLevelEnv, "has unknown level", value, "- ignored");
    }
}

void applyLogging(const LogOptions& options) {
    console::setLevel(console::parseLevel(options.level));
    console::setColor(options.color);
}

std::unique_ptr<GraphStore> makeStore(const EngineConfig& config) {
    if (config.store.backend == "sqlite") {
        console::info("opening sqlite graph store at", config.store.path);
        return std::make_unique<SqliteGraphStore>(config.store.path, config.weights,
                                                  config.store.busyTimeoutMs);
    }
    if (config.store.backend == "memory") {
        return std::make_unique<InMemoryGraphStore>(config.weights);
    }
    throw invalidArgument("Unknown store backend: " + config.store.backend);
}

} // namespace bizgraph
