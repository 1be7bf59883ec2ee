#include "metrics.hpp"
#include "file_lock.hpp"
#include "utils.hpp"
#include <fstream>
#include <iostream>
#include <set>
#include <chrono>
#include <iterator>

namespace guardrail {

static constexpr int64_t kDayMs = 24LL * 60 * 60 * 1000;

std::string to_string(Outcome o) {
    switch (o) {
        case Outcome::ok:      return "ok";
        case Outcome::timeout: return "timeout";
        case Outcome::error:   return "error";
    }
    return "ok";
}

static std::optional<Outcome> parse_outcome(const std::string& s) {
    if (s == "ok")      return Outcome::ok;
    if (s == "timeout") return Outcome::timeout;
    if (s == "error")   return Outcome::error;
    return std::nullopt;
}

nlohmann::json MetricsRecord::to_json() const {
    return {
        {"hook", hook_name},
        {"category", category},
        {"verdict", to_string(verdict)},
        {"durationMs", duration_ms},
        {"ts", timestamp_ms},
        {"outcome", to_string(outcome)},
        {"session", session_id},
    };
}

std::optional<MetricsRecord> MetricsRecord::from_json(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    try {
        MetricsRecord r;
        r.hook_name = j.value("hook", "");
        r.category = j.value("category", "");
        auto verdict = parse_verdict(j.value("verdict", "allow"));
        auto outcome = parse_outcome(j.value("outcome", "ok"));
        if (!verdict || !outcome || r.hook_name.empty()) return std::nullopt;
        r.verdict = *verdict;
        r.outcome = *outcome;
        r.duration_ms = j.value("durationMs", int64_t{0});
        r.timestamp_ms = j.value("ts", int64_t{0});
        r.session_id = j.value("session", "");
        return r;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

MetricsRecord MetricsRecord::from_result(const ExecutionResult& res, const std::string& session_id,
                                         int64_t now_ms) {
    MetricsRecord r;
    r.hook_name = res.hook_name;
    r.category = res.family;
    r.verdict = res.raw_verdict;
    r.duration_ms = res.duration_ms;
    r.timestamp_ms = now_ms;
    r.outcome = res.timed_out ? Outcome::timeout : (res.error ? Outcome::error : Outcome::ok);
    r.session_id = session_id;
    return r;
}

// ── MetricsLog ─────────────────────────────────────────────────────

MetricsLog::MetricsLog(std::string path) : path_(std::move(path)) {}

bool MetricsLog::append(const std::vector<MetricsRecord>& batch) {
    if (batch.empty()) return true;

    auto parent = fs::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
    }

    std::string lines;
    for (auto& r : batch) {
        lines += dump_json(r.to_json());
        lines += '\n';
    }

    FileLock lock(path_);
    if (!lock.locked()) return false;
    std::ofstream f(path_, std::ios::app | std::ios::binary);
    if (!f) return false;
    f.write(lines.data(), static_cast<std::streamsize>(lines.size()));
    f.flush();
    bool ok = static_cast<bool>(f);

    std::lock_guard<std::mutex> guard(cache_mutex_);
    cache_.reset();
    return ok;
}

std::vector<MetricsRecord> MetricsLog::read_unlocked() const {
    std::vector<MetricsRecord> out;
    std::ifstream f(path_);
    if (!f) return out;

    std::string line;
    while (std::getline(f, line)) {
        if (line.empty()) continue;
        try {
            auto rec = MetricsRecord::from_json(nlohmann::json::parse(line));
            if (rec) out.push_back(std::move(*rec));
        } catch (const std::exception&) {
            // torn line from an interrupted writer
        }
    }
    return out;
}

const std::vector<MetricsRecord>& MetricsLog::records() const {
    std::lock_guard<std::mutex> guard(cache_mutex_);
    if (!cache_) cache_ = read_unlocked();
    return *cache_;
}

WindowStats MetricsLog::window(const std::string& category, int64_t start_ms, int64_t end_ms) const {
    WindowStats w;
    for (auto& r : records()) {
        if (r.category != category) continue;
        if (r.timestamp_ms < start_ms || r.timestamp_ms >= end_ms) continue;
        w.runs++;
        if (r.outcome != Outcome::ok) w.faults++;
        else if (r.verdict != Verdict::allow) w.violations++;
    }
    return w;
}

double MetricsLog::violation_rate(const std::string& category, int window_days, int64_t now_ms) const {
    return window(category, now_ms - window_days * kDayMs, now_ms + 1).violation_rate();
}

double MetricsLog::violation_rate(const std::string& category, int window_days) const {
    return violation_rate(category, window_days, epoch_ms_now());
}

double MetricsLog::fault_rate(const std::string& category, int window_days, int64_t now_ms) const {
    return window(category, now_ms - window_days * kDayMs, now_ms + 1).fault_rate();
}

std::vector<std::string> MetricsLog::categories() const {
    std::set<std::string> seen;
    for (auto& r : records()) {
        if (!r.category.empty()) seen.insert(r.category);
    }
    return {seen.begin(), seen.end()};
}

std::map<std::string, HookSummary> MetricsLog::summary_by_hook(int window_days, int64_t now_ms) const {
    std::map<std::string, HookSummary> out;
    int64_t start = now_ms - window_days * kDayMs;
    for (auto& r : records()) {
        if (r.timestamp_ms < start) continue;
        auto& s = out[r.hook_name];
        s.runs++;
        if (r.outcome != Outcome::ok) s.faults++;
        else if (r.verdict != Verdict::allow) s.violations++;
        s.total_duration_ms += r.duration_ms;
    }
    return out;
}

std::vector<MetricsRecord> MetricsLog::prune(int retention_days, int64_t now_ms) {
    int64_t cutoff = now_ms - retention_days * kDayMs;
    std::vector<MetricsRecord> expired;

    FileLock lock(path_);
    if (!lock.locked()) {
        std::cerr << "[metrics] Could not lock " << path_ << " for pruning\n";
        return expired;
    }

    // Keep unparseable lines out of the rewrite; they can never be counted.
    auto all = read_unlocked();
    std::string kept;
    for (auto& r : all) {
        if (r.timestamp_ms < cutoff) {
            expired.push_back(r);
        } else {
            kept += dump_json(r.to_json());
            kept += '\n';
        }
    }
    if (expired.empty()) return expired;

    if (!write_file_atomic(path_, kept)) {
        std::cerr << "[metrics] Failed to rewrite " << path_ << " while pruning\n";
        return {};
    }

    std::lock_guard<std::mutex> guard(cache_mutex_);
    cache_.reset();
    return expired;
}

// ── MetricsRecorder ────────────────────────────────────────────────

MetricsRecorder::MetricsRecorder(std::string log_path, size_t capacity)
    : log_(std::move(log_path)), capacity_(capacity > 0 ? capacity : 1) {
    thread_ = std::thread(&MetricsRecorder::run_loop, this);
}

MetricsRecorder::~MetricsRecorder() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    wake_.notify_all();
    if (thread_.joinable()) thread_.join();
}

void MetricsRecorder::record(const ExecutionResult& result, const std::string& session_id) {
    record(MetricsRecord::from_result(result, session_id, epoch_ms_now()));
}

void MetricsRecorder::record(MetricsRecord rec) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.size() >= capacity_) {
            queue_.pop_front();
            dropped_++;
        }
        queue_.push_back(std::move(rec));
    }
    wake_.notify_one();
}

bool MetricsRecorder::flush(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    wake_.notify_one();
    return drained_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                             [this] { return queue_.empty() && !writing_; });
}

void MetricsRecorder::run_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        wake_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (queue_.empty() && stopping_) break;

        std::vector<MetricsRecord> batch(std::make_move_iterator(queue_.begin()),
                                         std::make_move_iterator(queue_.end()));
        queue_.clear();
        writing_ = true;
        lock.unlock();

        bool ok = false;
        try {
            ok = log_.append(batch);
        } catch (const std::exception& e) {
            std::cerr << "[metrics] Append failed: " << e.what() << "\n";
        }
        if (ok) {
            written_ += batch.size();
        } else {
            failed_ += batch.size();
            std::cerr << "[metrics] Dropped " << batch.size() << " record(s): cannot write "
                      << log_.path() << "\n";
        }

        lock.lock();
        writing_ = false;
        if (queue_.empty()) drained_.notify_all();
    }
    writing_ = false;
    drained_.notify_all();
}

} // namespace guardrail
