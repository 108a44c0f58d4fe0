#pragma once
// ═══════════════════════════════════════════════════════════════════
//  bizgraph/database.h - SQLite connection wrapper
// ═══════════════════════════════════════════════════════════════════
//
//  db::Database db("graph.db");
//  db.exec("INSERT INTO businesses (id, created_at) VALUES (?, ?)", {"acme", std::int64_t{1700000000000}});
//  db.each("SELECT id FROM businesses", {}, [](const db::Row& row) { ... });
//
//  SQLITE_BUSY / SQLITE_LOCKED surface as Error(StoreUnavailable) so
//  callers may retry; every other failure is Error(Storage).
//
// ═══════════════════════════════════════════════════════════════════

#include "errors.h"
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

struct sqlite3;

namespace bizgraph::db {

// Bound parameter: NULL, INTEGER, REAL or TEXT.
using Value = std::variant<std::nullptr_t, std::int64_t, double, std::string>;
using Params = std::vector<Value>;

// Column values as text, keyed by column name. NULL reads as "".
using Row = std::unordered_map<std::string, std::string>;

struct Result {
    std::vector<Row> rows;
    std::vector<std::string> columns;
    int affectedRows = 0;
    std::int64_t lastInsertId = 0;

    bool empty() const { return rows.empty(); }
    std::size_t size() const { return rows.size(); }
    const Row& first() const { return rows.front(); }
};

// ═══════════════════════════════════════════
//  Database - one connection, calls serialized by a recursive mutex
// ═══════════════════════════════════════════
class Database {
public:
    explicit Database(const std::string& path = ":memory:", int busyTimeoutMs = 50);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    Result exec(const std::string& sql, const Params& params = {});

    // Streams rows without collecting them; returns the row count.
    std::size_t each(const std::string& sql, const Params& params,
                     const std::function<void(const Row&)>& visit);

    // Schema scripts: several statements, no parameters.
    void execMulti(const std::string& sql);

    void beginTransaction();
    void commit();
    void rollback();

    // BEGIN IMMEDIATE ... COMMIT around fn; rolls back and rethrows
    // whatever fn throws.
    template <typename Func>
    auto transaction(Func&& fn) -> decltype(fn()) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        beginTransaction();
        try {
            if constexpr (std::is_void_v<decltype(fn())>) {
                fn();
                commit();
            } else {
                auto result = fn();
                commit();
                return result;
            }
        } catch (...) {
            rollback();
            throw;
        }
    }

    // Changes whenever another connection commits to the same file.
    std::int64_t dataVersion();

    const std::string& path() const { return path_; }
    bool isOpen() const { return db_ != nullptr; }
    void close();

private:
    [[noreturn]] void fail(int rc, const std::string& context);

    sqlite3* db_ = nullptr;
    std::string path_;
    std::recursive_mutex mutex_;
};

} // namespace bizgraph::db
