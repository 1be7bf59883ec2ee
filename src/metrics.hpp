#pragma once
#include "types.hpp"
#include <string>
#include <vector>
#include <map>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace guardrail {

enum class Outcome {
    ok,
    timeout,
    error,
};

std::string to_string(Outcome o);

struct MetricsRecord {
    std::string hook_name;
    std::string category;
    Verdict verdict = Verdict::allow;   // as reported, before enforcement
    int64_t duration_ms = 0;
    int64_t timestamp_ms = 0;
    Outcome outcome = Outcome::ok;
    std::string session_id;

    bool violation() const { return outcome == Outcome::ok && verdict != Verdict::allow; }

    nlohmann::json to_json() const;
    static std::optional<MetricsRecord> from_json(const nlohmann::json& j);
    static MetricsRecord from_result(const ExecutionResult& r, const std::string& session_id,
                                     int64_t now_ms);
};

struct WindowStats {
    int64_t runs = 0;         // all records in the window
    int64_t violations = 0;   // completed runs with warn/block
    int64_t faults = 0;       // timeouts + errors

    int64_t completed() const { return runs - faults; }
    double violation_rate() const {
        return completed() > 0 ? static_cast<double>(violations) / static_cast<double>(completed()) : 0.0;
    }
    double fault_rate() const {
        return runs > 0 ? static_cast<double>(faults) / static_cast<double>(runs) : 0.0;
    }
};

struct HookSummary {
    int64_t runs = 0;
    int64_t violations = 0;
    int64_t faults = 0;
    int64_t total_duration_ms = 0;
};

// Append-only JSONL log shared by concurrent invocations. Appends take an
// exclusive file lock; reads tolerate torn or foreign lines.
class MetricsLog {
public:
    explicit MetricsLog(std::string path);

    const std::string& path() const { return path_; }

    bool append(const std::vector<MetricsRecord>& batch);

    // All parseable records, oldest first. Cached after the first read.
    const std::vector<MetricsRecord>& records() const;

    WindowStats window(const std::string& category, int64_t start_ms, int64_t end_ms) const;
    double violation_rate(const std::string& category, int window_days, int64_t now_ms) const;
    double violation_rate(const std::string& category, int window_days) const;
    double fault_rate(const std::string& category, int window_days, int64_t now_ms) const;

    std::vector<std::string> categories() const;
    std::map<std::string, HookSummary> summary_by_hook(int window_days, int64_t now_ms) const;

    // Maintenance only: rewrites the log without records older than the
    // retention window and returns the removed records.
    std::vector<MetricsRecord> prune(int retention_days, int64_t now_ms);

private:
    std::string path_;
    mutable std::mutex cache_mutex_;
    mutable std::optional<std::vector<MetricsRecord>> cache_;

    std::vector<MetricsRecord> read_unlocked() const;
};

// Best-effort asynchronous recorder: producers never block on I/O. A
// bounded queue drops its oldest record when full; one writer thread
// drains it into the MetricsLog.
class MetricsRecorder {
public:
    MetricsRecorder(std::string log_path, size_t capacity);
    ~MetricsRecorder();

    MetricsRecorder(const MetricsRecorder&) = delete;
    MetricsRecorder& operator=(const MetricsRecorder&) = delete;

    void record(const ExecutionResult& result, const std::string& session_id);
    void record(MetricsRecord rec);

    // Waits up to timeout_ms for the queue to drain. Returns true if drained.
    bool flush(int timeout_ms = 1000);

    size_t dropped() const { return dropped_.load(); }
    size_t written() const { return written_.load(); }
    size_t failed() const { return failed_.load(); }

private:
    MetricsLog log_;
    size_t capacity_;

    std::mutex mutex_;
    std::condition_variable wake_;
    std::condition_variable drained_;
    std::deque<MetricsRecord> queue_;
    bool writing_ = false;
    bool stopping_ = false;

    std::atomic<size_t> dropped_{0};
    std::atomic<size_t> written_{0};
    std::atomic<size_t> failed_{0};
    std::thread thread_;

    void run_loop();
};

} // namespace guardrail
