#pragma once
#include "types.hpp"
#include <string>
#include <map>
#include <vector>
#include <optional>
#include <memory>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace guardrail {

class MetricsLog;

// Graduated strictness of one rule category (hook family).
enum class EnforcementLevel {
    silent,    // hooks not run; nothing collected but their absence
    warning,   // blocks reported as warnings
    partial,   // only critical-priority hooks may block
    full,      // verdicts as reported
};

std::string to_string(EnforcementLevel l);
std::optional<EnforcementLevel> parse_level(const std::string& s);

// Verdict after applying a category's level to a hook's reported verdict.
Verdict apply_level(EnforcementLevel level, Priority priority, Verdict reported);

struct GraduationPolicy {
    double threshold = 0.05;        // max violation rate per window to advance
    int sustained_windows = 3;      // consecutive windows that must be under threshold
    int window_days = 1;
    int min_samples = 10;           // records a window needs to count as evidence
    double error_rate_spike = 0.25; // fault rate that forces an immediate step down
};

struct LevelTransition {
    std::string category;
    EnforcementLevel from;
    EnforcementLevel to;
    std::string reason;
    bool manual = false;
    int64_t at_ms = 0;

    nlohmann::json to_json() const;
    static LevelTransition from_json(const nlohmann::json& j);
};

// Immutable per-invocation view of the enforcement configuration. Every
// change produces a new snapshot through transition().
class EnforcementSnapshot {
public:
    EnforcementSnapshot() = default;
    EnforcementSnapshot(std::map<std::string, EnforcementLevel> levels,
                        EnforcementLevel default_level);

    EnforcementLevel level_for(const std::string& category) const;
    const std::map<std::string, EnforcementLevel>& levels() const { return levels_; }
    EnforcementLevel default_level() const { return default_level_; }
    int64_t version() const { return version_; }
    int64_t updated_at_ms() const { return updated_at_ms_; }
    const std::vector<LevelTransition>& history() const { return history_; }

    nlohmann::json to_json() const;
    // Throws std::runtime_error on malformed documents.
    static EnforcementSnapshot from_json(const nlohmann::json& j);

private:
    std::map<std::string, EnforcementLevel> levels_;
    EnforcementLevel default_level_ = EnforcementLevel::full;
    int64_t version_ = 0;
    int64_t updated_at_ms_ = 0;
    std::vector<LevelTransition> history_;   // most recent last, bounded

    friend EnforcementSnapshot transition(const EnforcementSnapshot&, const std::string&,
                                          EnforcementLevel, const std::string&, bool, int64_t);
};

using SnapshotPtr = std::shared_ptr<const EnforcementSnapshot>;

// The only mutator. Automatic transitions move exactly one step; manual
// overrides may drop any distance but rise at most one step. Throws
// std::invalid_argument for a disallowed move.
EnforcementSnapshot transition(const EnforcementSnapshot& current,
                               const std::string& category,
                               EnforcementLevel to,
                               const std::string& reason,
                               bool manual,
                               int64_t now_ms);

struct GraduationReport {
    EnforcementSnapshot snapshot;
    std::vector<LevelTransition> transitions;
};

// One graduation cycle over every category that has a level or appears in
// the metrics. Never runs on the decision path.
GraduationReport graduate(const EnforcementSnapshot& current,
                          const MetricsLog& metrics,
                          const GraduationPolicy& policy,
                          int64_t now_ms);

// ── Snapshot file (single writer, atomic replace) ──────────────────

// Returns nullopt when the file does not exist; throws on a corrupt file.
std::optional<EnforcementSnapshot> load_snapshot(const std::string& path);
bool save_snapshot(const std::string& path, const EnforcementSnapshot& snap);

} // namespace guardrail
