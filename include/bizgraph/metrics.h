#pragma once
// ═══════════════════════════════════════════════════════════════════
//  bizgraph/metrics.h - Query engine counters, Prometheus exposition
// ═══════════════════════════════════════════════════════════════════

#include <cstdint>
#include <iomanip>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

namespace bizgraph {

enum class QueryKind { Path, Neighborhood, Relationships };
enum class QueryOutcome { Hit, Miss, NoPath, Error, Timeout };

inline const char* queryKindName(QueryKind kind) {
    switch (kind) {
        case QueryKind::Path:          return "path";
        case QueryKind::Neighborhood:  return "neighborhood";
        case QueryKind::Relationships: return "relationships";
    }
    return "unknown";
}

inline const char* queryOutcomeName(QueryOutcome outcome) {
    switch (outcome) {
        case QueryOutcome::Hit:     return "hit";
        case QueryOutcome::Miss:    return "miss";
        case QueryOutcome::NoPath:  return "no_path";
        case QueryOutcome::Error:   return "error";
        case QueryOutcome::Timeout: return "timeout";
    }
    return "unknown";
}

// Owned by whoever wires the engine together and passed in explicitly.
class QueryMetrics {
public:
    void recordQuery(QueryKind kind, QueryOutcome outcome, double durationMs) {
        std::lock_guard<std::mutex> lock(mutex_);
        totalQueries_++;
        byOutcome_[{queryKindName(kind), queryOutcomeName(outcome)}]++;
        totalDurationMs_ += durationMs;
        if (durationMs > maxDurationMs_) maxDurationMs_ = durationMs;
    }

    void recordStalePut() { add(stalePuts_); }
    void recordInvalidated(std::uint64_t entries) { add(invalidatedEntries_, entries); }
    void recordMutation() { add(mutations_); }
    void recordOversizedNodes(std::uint64_t n) { add(oversizedNodes_, n); }
    void recordCoalescedWait() { add(coalescedWaits_); }

    std::uint64_t totalQueries() const { return read(totalQueries_); }
    std::uint64_t stalePuts() const { return read(stalePuts_); }
    std::uint64_t invalidatedEntries() const { return read(invalidatedEntries_); }
    std::uint64_t mutations() const { return read(mutations_); }
    std::uint64_t oversizedNodes() const { return read(oversizedNodes_); }
    std::uint64_t coalescedWaits() const { return read(coalescedWaits_); }

    std::uint64_t count(QueryKind kind, QueryOutcome outcome) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = byOutcome_.find({queryKindName(kind), queryOutcomeName(outcome)});
        return it == byOutcome_.end() ? 0 : it->second;
    }

    std::string serialize() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostringstream oss;
        oss << "# HELP bizgraph_queries_total Total graph queries\n"
            << "# TYPE bizgraph_queries_total counter\n"
            << "bizgraph_queries_total " << totalQueries_ << "\n\n"
            << "# HELP bizgraph_query_duration_ms_total Total query duration\n"
            << "# TYPE bizgraph_query_duration_ms_total counter\n"
            << "bizgraph_query_duration_ms_total " << std::fixed << std::setprecision(2)
            << totalDurationMs_ << "\n\n"
            << "# HELP bizgraph_query_duration_ms_max Max query duration\n"
            << "# TYPE bizgraph_query_duration_ms_max gauge\n"
            << "bizgraph_query_duration_ms_max " << std::fixed << std::setprecision(2)
            << maxDurationMs_ << "\n\n";

        oss << "# HELP bizgraph_queries_by_outcome Queries by kind and outcome\n"
            << "# TYPE bizgraph_queries_by_outcome counter\n";
        for (auto& [labels, count] : byOutcome_) {
            oss << "bizgraph_queries_by_outcome{kind=\"" << labels.first
                << "\",outcome=\"" << labels.second << "\"} " << count << "\n";
        }

        counter(oss, "bizgraph_cache_stale_puts_total", "Cache puts refused as stale", stalePuts_);
        counter(oss, "bizgraph_cache_invalidated_total", "Cache entries removed by invalidation", invalidatedEntries_);
        counter(oss, "bizgraph_mutations_total", "Relationship changes applied", mutations_);
        counter(oss, "bizgraph_oversized_nodes_total", "Expansions of nodes above the fan-out cap", oversizedNodes_);
        counter(oss, "bizgraph_coalesced_waits_total", "Misses that waited on an identical in-flight query", coalescedWaits_);
        return oss.str();
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        totalQueries_ = 0;
        totalDurationMs_ = 0;
        maxDurationMs_ = 0;
        byOutcome_.clear();
        stalePuts_ = invalidatedEntries_ = mutations_ = oversizedNodes_ = coalescedWaits_ = 0;
    }

private:
    void add(std::uint64_t& field, std::uint64_t n = 1) {
        std::lock_guard<std::mutex> lock(mutex_);
        field += n;
    }

    std::uint64_t read(const std::uint64_t& field) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return field;
    }

    static void counter(std::ostringstream& oss, const char* name, const char* help, std::uint64_t value) {
        oss << "\n# HELP " << name << " " << help << "\n"
            << "# TYPE " << name << " counter\n"
            << name << " " << value << "\n";
    }

    mutable std::mutex mutex_;
    std::uint64_t totalQueries_ = 0;
    double totalDurationMs_ = 0;
    double maxDurationMs_ = 0;
    std::map<std::pair<std::string, std::string>, std::uint64_t> byOutcome_;
    std::uint64_t stalePuts_ = 0;
    std::uint64_t invalidatedEntries_ = 0;
    std::uint64_t mutations_ = 0;
    std::uint64_t oversizedNodes_ = 0;
    std::uint64_t coalescedWaits_ = 0;
};

} // namespace bizgraph
