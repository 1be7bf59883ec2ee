#pragma once
#include "metrics.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <sqlite3.h>

namespace guardrail {

struct DailyRollup {
    std::string day;          // UTC, YYYY-MM-DD
    std::string hook_name;
    std::string category;
    int64_t runs = 0;
    int64_t violations = 0;
    int64_t faults = 0;
    int64_t total_duration_ms = 0;
};

// Long-term per-day, per-hook counters for metrics records that have aged
// out of the JSONL log. Written only by the maintenance pass.
class MetricsArchive {
public:
    explicit MetricsArchive(const std::string& db_path);
    ~MetricsArchive();

    MetricsArchive(const MetricsArchive&) = delete;
    MetricsArchive& operator=(const MetricsArchive&) = delete;

    // Folds records into the rollups; counts add to existing rows.
    // Returns the number of (day, hook) rows touched.
    size_t archive(const std::vector<MetricsRecord>& records);

    // Rows ordered by day then hook; since_day is inclusive, empty for all.
    std::vector<DailyRollup> rollups(const std::string& since_day = "");

private:
    sqlite3* db_ = nullptr;
    void init_db();
    void exec(const char* sql);
};

} // namespace guardrail
