// ═══════════════════════════════════════════════════════════════════
//  database.cpp - SQLite connection wrapper
// ═══════════════════════════════════════════════════════════════════

#include "bizgraph/database.h"
#include <sqlite3.h>
#include <memory>

namespace bizgraph::db {

namespace {

struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

bool transient(int rc) {
    int primary = rc & 0xff;
    return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
}

void bindValue(sqlite3_stmt* stmt, int index, const Value& value) {
    if (std::holds_alternative<std::nullptr_t>(value)) {
        sqlite3_bind_null(stmt, index);
    } else if (auto* i = std::get_if<std::int64_t>(&value)) {
        sqlite3_bind_int64(stmt, index, *i);
    } else if (auto* d = std::get_if<double>(&value)) {
        sqlite3_bind_double(stmt, index, *d);
    } else {
        const auto& text = std::get<std::string>(value);
        sqlite3_bind_text(stmt, index, text.c_str(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
    }
}

// REAL columns are rendered with full precision so that std::stod
// gives back the stored double.
std::string columnText(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_FLOAT) {
        char buf[32];
        sqlite3_snprintf(sizeof(buf), buf, "%!.17g", sqlite3_column_double(stmt, col));
        return buf;
    }
    auto text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

} // namespace

Database::Database(const std::string& path, int busyTimeoutMs) : path_(path) {
    int rc = sqlite3_open_v2(path.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        throw Error(ErrorCode::Storage, "Failed to open database '" + path + "': " + err);
    }
    sqlite3_busy_timeout(db_, busyTimeoutMs);
    // WAL lets readers proceed while a writer commits
    if (path != ":memory:") {
        exec("PRAGMA journal_mode=WAL");
    }
    exec("PRAGMA foreign_keys=ON");
}

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept
    : db_(other.db_), path_(std::move(other.path_)) {
    other.db_ = nullptr;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        path_ = std::move(other.path_);
        other.db_ = nullptr;
    }
    return *this;
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void Database::fail(int rc, const std::string& context) {
    std::string msg = context + ": " + (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
    if (transient(rc)) throw Error(ErrorCode::StoreUnavailable, msg);
    throw Error(ErrorCode::Storage, msg);
}

std::size_t Database::each(const std::string& sql, const Params& params,
                           const std::function<void(const Row&)>& visit) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!db_) throw Error(ErrorCode::Storage, "Database is closed");

    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &raw, nullptr);
    Statement stmt(raw);
    if (rc != SQLITE_OK) fail(rc, "SQL error");

    for (std::size_t i = 0; i < params.size(); i++) {
        bindValue(stmt.get(), static_cast<int>(i) + 1, params[i]);
    }

    int colCount = sqlite3_column_count(stmt.get());
    std::vector<std::string> columns;
    columns.reserve(colCount);
    for (int i = 0; i < colCount; i++) columns.push_back(sqlite3_column_name(stmt.get(), i));

    std::size_t count = 0;
    Row row;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        for (int i = 0; i < colCount; i++) row[columns[i]] = columnText(stmt.get(), i);
        visit(row);
        count++;
    }
    if (rc != SQLITE_DONE) fail(rc, "SQL step error");
    return count;
}

Result Database::exec(const std::string& sql, const Params& params) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Result result;
    each(sql, params, [&](const Row& row) {
        if (result.columns.empty()) {
            for (const auto& [name, _] : row) result.columns.push_back(name);
        }
        result.rows.push_back(row);
    });
    result.affectedRows = sqlite3_changes(db_);
    result.lastInsertId = sqlite3_last_insert_rowid(db_);
    return result;
}

void Database::execMulti(const std::string& sql) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!db_) throw Error(ErrorCode::Storage, "Database is closed");

    char* errMsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string err = errMsg ? errMsg : sqlite3_errstr(rc);
        sqlite3_free(errMsg);
        throw Error(transient(rc) ? ErrorCode::StoreUnavailable : ErrorCode::Storage,
                    "SQL exec error: " + err);
    }
}

void Database::beginTransaction() {
    exec("BEGIN IMMEDIATE TRANSACTION");
}

void Database::commit() {
    exec("COMMIT");
}

void Database::rollback() {
    if (db_ && !sqlite3_get_autocommit(db_)) {
        exec("ROLLBACK");
    }
}

std::int64_t Database::dataVersion() {
    auto result = exec("PRAGMA data_version");
    if (result.empty()) return 0;
    return std::stoll(result.first().at("data_version"));
}

} // namespace bizgraph::db
