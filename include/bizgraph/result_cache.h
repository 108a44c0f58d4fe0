#pragma once
// ═══════════════════════════════════════════════════════════════════
//  bizgraph/result_cache.h - Memoized traversal results
// ═══════════════════════════════════════════════════════════════════
//
//  LRU + TTL cache keyed by query shape and a coarse time bucket, so
//  that entries age out even when no invalidation reaches them.
//
//  put() is last-write-wins by insertion time: a result computed
//  before the resident entry never replaces it. The cache also keeps
//  a short history of invalidations and refuses a put whose result
//  was computed before a matching invalidation, which closes the race
//  between a slow miss and a concurrent mutation.
//
// ═══════════════════════════════════════════════════════════════════

#include "console.h"
#include "errors.h"
#include "json_utils.h"
#include "scheduler.h"
#include "types.h"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <iterator>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace bizgraph {

struct CacheOptions {
    std::size_t maxEntries = 10000;
    int ttlMs = 3600000;                 // 1 hour
    int bucketWidthMs = 3600000;         // key time bucket
    int sweepIntervalMs = 60000;         // CacheSweeper period
    std::size_t invalidationHistory = 64;

    BIZGRAPH_SERIALIZE_DEFAULTS(CacheOptions, maxEntries, ttlMs, bucketWidthMs,
                                sweepIntervalMs, invalidationHistory)
};

enum class QueryShape { Path, Neighborhood };

inline const char* queryShapeName(QueryShape shape) {
    return shape == QueryShape::Path ? "path" : "neighborhood";
}

// ═══════════════════════════════════════════
//  CacheKey - pure function of the query and the time bucket
// ═══════════════════════════════════════════
struct CacheKey {
    QueryShape kind = QueryShape::Path;
    std::string source;
    std::string target;      // empty for neighborhood queries
    int maxDepth = 0;
    long long bucket = 0;    // floor(epoch_ms / bucketWidth)

    static long long bucketOf(Timestamp now, std::chrono::milliseconds width) {
        long long w = std::max<long long>(1, width.count());
        long long ms = epochMillis(now);
        return ms >= 0 ? ms / w : (ms - w + 1) / w;
    }

    static CacheKey forPath(const std::string& source, const std::string& target, int maxDepth,
                            Timestamp now, std::chrono::milliseconds bucketWidth) {
        return CacheKey{QueryShape::Path, source, target, maxDepth, bucketOf(now, bucketWidth)};
    }

    static CacheKey forNeighborhood(const std::string& source, int maxDepth,
                                    Timestamp now, std::chrono::milliseconds bucketWidth) {
        return CacheKey{QueryShape::Neighborhood, source, "", maxDepth, bucketOf(now, bucketWidth)};
    }

    // "path:A>C:d2:b472000", "neighborhood:A:d1:b472000"
    std::string toString() const {
        std::string s = queryShapeName(kind);
        s += ":" + source;
        if (kind == QueryShape::Path) s += ">" + target;
        s += ":d" + std::to_string(maxDepth) + ":b" + std::to_string(bucket);
        return s;
    }

    bool references(const std::string& id) const {
        return source == id || (kind == QueryShape::Path && target == id);
    }

    bool operator==(const CacheKey&) const = default;
};

struct CacheKeyHash {
    std::size_t operator()(const CacheKey& k) const {
        return std::hash<std::string>{}(k.toString());
    }
};

using CachedResult = std::variant<PathResult, NoPath, Neighborhood>;

// Every node id a cached result depends on.
inline std::vector<std::string> resultNodes(const CachedResult& value) {
    std::vector<std::string> nodes;
    if (auto* path = std::get_if<PathResult>(&value)) {
        nodes = path->nodes;
    } else if (auto* none = std::get_if<NoPath>(&value)) {
        nodes = {none->source, none->target};
    } else if (auto* hood = std::get_if<Neighborhood>(&value)) {
        nodes.reserve(hood->entries.size() + 1);
        nodes.push_back(hood->source);
        for (const auto& entry : hood->entries) nodes.push_back(entry.nodeId);
    }
    return nodes;
}

struct CacheEntry {
    CacheKey key;
    CachedResult value;
    Timestamp insertedAt{};
    std::chrono::steady_clock::time_point expiresAt{};
    std::uint64_t graphVersion = 0;

    bool expired(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now()) const {
        return now >= expiresAt;
    }

    bool references(const std::string& id) const {
        if (key.references(id)) return true;
        auto nodes = resultNodes(value);
        return std::find(nodes.begin(), nodes.end(), id) != nodes.end();
    }

    // True when the recorded result steps across this relationship.
    // Neighborhood paths carry no edge types, so any hop between the
    // two endpoints counts.
    bool walks(const NodePair& pair, RelationshipType type) const {
        if (auto path = std::get_if<PathResult>(&value)) {
            return std::any_of(path->edges.begin(), path->edges.end(), [&](const RelationshipEdge& e) {
                return e.type == type && e.pair() == pair;
            });
        }
        if (auto hood = std::get_if<Neighborhood>(&value)) {
            for (const auto& entry : hood->entries) {
                for (std::size_t i = 1; i < entry.path.size(); i++) {
                    if (NodePair::of(entry.path[i - 1], entry.path[i]) == pair) return true;
                }
            }
        }
        return false;
    }
};

struct CacheStats {
    std::size_t hits = 0;
    std::size_t misses = 0;
    std::size_t puts = 0;
    std::size_t rejectedPuts = 0;
    std::size_t evictions = 0;
    std::size_t expirations = 0;
    std::size_t invalidations = 0;
    std::size_t size = 0;
};

inline void to_json(nlohmann::json& j, const CacheStats& s) {
    j = nlohmann::json{{"hits", s.hits}, {"misses", s.misses}, {"puts", s.puts},
                       {"rejected_puts", s.rejectedPuts}, {"evictions", s.evictions},
                       {"expirations", s.expirations}, {"invalidations", s.invalidations},
                       {"size", s.size}};
}

// ═══════════════════════════════════════════
//  ResultCache - every call individually atomic
// ═══════════════════════════════════════════
class ResultCache {
public:
    using Predicate = std::function<bool(const CacheEntry&)>;

    explicit ResultCache(CacheOptions options = {}) : options_(options) {
        if (options_.maxEntries == 0) throw invalidArgument("cache maxEntries must be positive");
        if (options_.ttlMs <= 0) throw invalidArgument("cache ttlMs must be positive");
    }

    ResultCache(const ResultCache&) = delete;
    ResultCache& operator=(const ResultCache&) = delete;

    CacheKey pathKey(const std::string& source, const std::string& target, int maxDepth,
                     Timestamp now = std::chrono::system_clock::now()) const {
        return CacheKey::forPath(source, target, maxDepth, now,
                                 std::chrono::milliseconds(options_.bucketWidthMs));
    }

    CacheKey neighborhoodKey(const std::string& source, int maxDepth,
                             Timestamp now = std::chrono::system_clock::now()) const {
        return CacheKey::forNeighborhood(source, maxDepth, now,
                                         std::chrono::milliseconds(options_.bucketWidthMs));
    }

    std::optional<CachedResult> get(const CacheKey& key) {
        auto entry = lookup(key);
        if (!entry) return std::nullopt;
        return std::move(entry->value);
    }

    // Same as get(), with the graph version and insertion time the
    // result was recorded with.
    std::optional<CacheEntry> lookup(const CacheKey& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end()) {
            stats_.misses++;
            return std::nullopt;
        }
        if (it->second->expired()) {
            list_.erase(it->second);
            map_.erase(it);
            stats_.expirations++;
            stats_.misses++;
            return std::nullopt;
        }
        // Move to front (most recently used)
        list_.splice(list_.begin(), list_, it->second);
        stats_.hits++;
        return *it->second;
    }

    // Copy of the resident entry; no LRU touch, no stats.
    std::optional<CacheEntry> peek(const CacheKey& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end() || it->second->expired()) return std::nullopt;
        return *it->second;
    }

    // ttl of zero means options().ttlMs; insertedAt defaults to now and
    // should be taken before the snapshot the value was computed from.
    bool put(const CacheKey& key, CachedResult value,
             std::chrono::milliseconds ttl = std::chrono::milliseconds(0),
             Timestamp insertedAt = Timestamp{},
             std::uint64_t graphVersion = 0) {
        if (ttl.count() <= 0) ttl = std::chrono::milliseconds(options_.ttlMs);
        if (insertedAt == Timestamp{}) insertedAt = std::chrono::system_clock::now();

        CacheEntry entry{key, std::move(value), insertedAt,
                         std::chrono::steady_clock::now() + ttl, graphVersion};

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it != map_.end() && !it->second->expired() && it->second->insertedAt > insertedAt) {
            stats_.rejectedPuts++;
            return false;
        }
        if (invalidatedSince(entry)) {
            stats_.rejectedPuts++;
            return false;
        }

        if (it != map_.end()) {
            list_.erase(it->second);
            map_.erase(it);
        }
        list_.push_front(std::move(entry));
        map_[key] = list_.begin();
        stats_.puts++;
        evict();
        return true;
    }

    // Removes every entry the predicate matches and remembers the
    // predicate so that in-flight results computed earlier are refused.
    std::size_t invalidate(const Predicate& predicate, std::vector<CacheKey>* removed = nullptr) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t count = 0;
        for (auto it = list_.begin(); it != list_.end();) {
            if (predicate(*it)) {
                if (removed) removed->push_back(it->key);
                map_.erase(it->key);
                it = list_.erase(it);
                count++;
            } else {
                ++it;
            }
        }
        remember(predicate);
        stats_.invalidations += count;
        return count;
    }

    std::size_t invalidate(const CacheKey& key) {
        return invalidate([key](const CacheEntry& e) { return e.key == key; });
    }

    std::size_t purgeExpired() {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = std::chrono::steady_clock::now();
        std::size_t count = 0;
        for (auto it = list_.begin(); it != list_.end();) {
            if (it->expired(now)) {
                map_.erase(it->key);
                it = list_.erase(it);
                count++;
            } else {
                ++it;
            }
        }
        stats_.expirations += count;
        return count;
    }

    // Drops everything; results computed before now are refused.
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        list_.clear();
        map_.clear();
        history_.clear();
        watermark_ = std::chrono::system_clock::now();
    }

    std::size_t size() {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.size();
    }

    CacheStats stats() {
        std::lock_guard<std::mutex> lock(mutex_);
        CacheStats s = stats_;
        s.size = map_.size();
        return s;
    }

    const CacheOptions& options() const { return options_; }

private:
    struct Invalidation {
        Predicate predicate;
        Timestamp at;
    };

    void remember(const Predicate& predicate) {
        if (options_.invalidationHistory == 0) {
            watermark_ = std::chrono::system_clock::now();
            return;
        }
        history_.push_back({predicate, std::chrono::system_clock::now()});
        while (history_.size() > options_.invalidationHistory) {
            // forgotten predicates still reject anything older than them
            watermark_ = std::max(watermark_, history_.front().at);
            history_.pop_front();
        }
    }

    bool invalidatedSince(const CacheEntry& entry) const {
        if (entry.insertedAt <= watermark_) return true;
        for (auto it = history_.rbegin(); it != history_.rend(); ++it) {
            if (it->at < entry.insertedAt) break;
            if (it->predicate(entry)) return true;
        }
        return false;
    }

    void evict() {
        while (map_.size() > options_.maxEntries) {
            auto last = std::prev(list_.end());
            map_.erase(last->key);
            list_.pop_back();
            stats_.evictions++;
        }
    }

    CacheOptions options_;
    std::list<CacheEntry> list_;
    std::unordered_map<CacheKey, std::list<CacheEntry>::iterator, CacheKeyHash> map_;
    std::deque<Invalidation> history_;
    Timestamp watermark_{};
    CacheStats stats_;
    std::mutex mutex_;
};

// ═══════════════════════════════════════════
//  CacheSweeper - periodic purgeExpired()
// ═══════════════════════════════════════════
class CacheSweeper {
public:
    CacheSweeper(ResultCache& cache, int intervalMs)
        : task_(std::chrono::milliseconds(intervalMs), [&cache] {
              std::size_t purged = cache.purgeExpired();
              if (purged > 0) console::debug("cache sweep purged", purged, "expired entries");
          }) {}

    explicit CacheSweeper(ResultCache& cache)
        : CacheSweeper(cache, cache.options().sweepIntervalMs) {}

    CacheSweeper(const CacheSweeper&) = delete;
    CacheSweeper& operator=(const CacheSweeper&) = delete;

    // Waits for a sweep in progress; the cache may be destroyed after.
    void stop() { task_.stop(); }

    std::uint64_t sweeps() const { return task_.ticks(); }

private:
    scheduler::PeriodicTask task_;
};

} // namespace bizgraph
