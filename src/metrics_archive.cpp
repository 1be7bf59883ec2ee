#include "metrics_archive.hpp"
#include "utils.hpp"
#include <stdexcept>
#include <map>
#include <utility>

namespace guardrail {

MetricsArchive::MetricsArchive(const std::string& db_path) {
    auto parent = fs::path(db_path).parent_path();
    if (!parent.empty()) fs::create_directories(parent);
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open metrics archive: " + msg);
    }
    sqlite3_busy_timeout(db_, 2000);
    init_db();
}

MetricsArchive::~MetricsArchive() {
    if (db_) sqlite3_close(db_);
}

void MetricsArchive::exec(const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("Metrics archive: " + msg);
    }
}

void MetricsArchive::init_db() {
    exec(R"(
        CREATE TABLE IF NOT EXISTS daily_rollups (
            day TEXT NOT NULL,
            hook_name TEXT NOT NULL,
            category TEXT NOT NULL DEFAULT '',
            runs INTEGER NOT NULL DEFAULT 0,
            violations INTEGER NOT NULL DEFAULT 0,
            faults INTEGER NOT NULL DEFAULT 0,
            total_duration_ms INTEGER NOT NULL DEFAULT 0,
            PRIMARY KEY (day, hook_name)
        );
    )");
}

size_t MetricsArchive::archive(const std::vector<MetricsRecord>& records) {
    if (records.empty()) return 0;

    std::map<std::pair<std::string, std::string>, DailyRollup> grouped;
    for (auto& r : records) {
        auto key = std::make_pair(day_str(r.timestamp_ms), r.hook_name);
        auto& row = grouped[key];
        row.day = key.first;
        row.hook_name = r.hook_name;
        row.category = r.category;
        row.runs++;
        if (r.outcome != Outcome::ok) row.faults++;
        else if (r.violation()) row.violations++;
        row.total_duration_ms += r.duration_ms;
    }

    const char* sql =
        "INSERT INTO daily_rollups (day, hook_name, category, runs, violations, faults, total_duration_ms) "
        "VALUES (?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(day, hook_name) DO UPDATE SET "
        "category = excluded.category, "
        "runs = runs + excluded.runs, "
        "violations = violations + excluded.violations, "
        "faults = faults + excluded.faults, "
        "total_duration_ms = total_duration_ms + excluded.total_duration_ms";

    exec("BEGIN IMMEDIATE");
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::string msg = sqlite3_errmsg(db_);
        exec("ROLLBACK");
        throw std::runtime_error("Failed to prepare rollup upsert: " + msg);
    }

    for (auto& [key, row] : grouped) {
        sqlite3_bind_text(stmt, 1, row.day.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, row.hook_name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, row.category.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 4, row.runs);
        sqlite3_bind_int64(stmt, 5, row.violations);
        sqlite3_bind_int64(stmt, 6, row.faults);
        sqlite3_bind_int64(stmt, 7, row.total_duration_ms);
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            std::string msg = sqlite3_errmsg(db_);
            sqlite3_finalize(stmt);
            exec("ROLLBACK");
            throw std::runtime_error("Failed to archive rollup for " + row.hook_name + ": " + msg);
        }
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
    }
    sqlite3_finalize(stmt);
    exec("COMMIT");
    return grouped.size();
}

std::vector<DailyRollup> MetricsArchive::rollups(const std::string& since_day) {
    std::vector<DailyRollup> out;
    const char* sql =
        "SELECT day, hook_name, category, runs, violations, faults, total_duration_ms "
        "FROM daily_rollups WHERE day >= ? ORDER BY day, hook_name";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("Failed to query rollups: " + std::string(sqlite3_errmsg(db_)));
    }
    sqlite3_bind_text(stmt, 1, since_day.c_str(), -1, SQLITE_TRANSIENT);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        DailyRollup r;
        r.day = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        r.hook_name = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        r.category = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2));
        r.runs = sqlite3_column_int64(stmt, 3);
        r.violations = sqlite3_column_int64(stmt, 4);
        r.faults = sqlite3_column_int64(stmt, 5);
        r.total_duration_ms = sqlite3_column_int64(stmt, 6);
        out.push_back(std::move(r));
    }
    sqlite3_finalize(stmt);
    return out;
}

} // namespace guardrail
