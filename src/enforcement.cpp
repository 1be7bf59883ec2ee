#include "enforcement.hpp"
#include "metrics.hpp"
#include "file_lock.hpp"
#include "utils.hpp"
#include <set>
#include <algorithm>
#include <stdexcept>
#include <iostream>
#include <iomanip>
#include <sstream>

namespace guardrail {

static constexpr int64_t kDayMs = 24LL * 60 * 60 * 1000;
static constexpr size_t kMaxHistory = 50;

std::string to_string(EnforcementLevel l) {
    switch (l) {
        case EnforcementLevel::silent:  return "SILENT";
        case EnforcementLevel::warning: return "WARNING";
        case EnforcementLevel::partial: return "PARTIAL";
        case EnforcementLevel::full:    return "FULL";
    }
    return "FULL";
}

std::optional<EnforcementLevel> parse_level(const std::string& s) {
    std::string v = to_upper(s);
    if (v == "SILENT")  return EnforcementLevel::silent;
    if (v == "WARNING") return EnforcementLevel::warning;
    if (v == "PARTIAL") return EnforcementLevel::partial;
    if (v == "FULL")    return EnforcementLevel::full;
    return std::nullopt;
}

Verdict apply_level(EnforcementLevel level, Priority priority, Verdict reported) {
    if (reported != Verdict::block) {
        return level == EnforcementLevel::silent ? Verdict::allow : reported;
    }
    switch (level) {
        case EnforcementLevel::silent:  return Verdict::allow;
        case EnforcementLevel::warning: return Verdict::warn;
        case EnforcementLevel::partial:
            return priority == Priority::critical ? Verdict::block : Verdict::warn;
        case EnforcementLevel::full:    return Verdict::block;
    }
    return reported;
}

// ── LevelTransition ────────────────────────────────────────────────

nlohmann::json LevelTransition::to_json() const {
    return {
        {"category", category},
        {"from", to_string(from)},
        {"to", to_string(to)},
        {"reason", reason},
        {"manual", manual},
        {"at", at_ms},
    };
}

LevelTransition LevelTransition::from_json(const nlohmann::json& j) {
    LevelTransition t;
    t.category = j.at("category").get<std::string>();
    auto from = parse_level(j.at("from").get<std::string>());
    auto to = parse_level(j.at("to").get<std::string>());
    if (!from || !to) throw std::runtime_error("bad level in transition history");
    t.from = *from;
    t.to = *to;
    t.reason = j.value("reason", "");
    t.manual = j.value("manual", false);
    t.at_ms = j.value("at", int64_t{0});
    return t;
}

// ── EnforcementSnapshot ────────────────────────────────────────────

EnforcementSnapshot::EnforcementSnapshot(std::map<std::string, EnforcementLevel> levels,
                                         EnforcementLevel default_level)
    : levels_(std::move(levels)), default_level_(default_level) {}

EnforcementLevel EnforcementSnapshot::level_for(const std::string& category) const {
    auto it = levels_.find(category);
    return it != levels_.end() ? it->second : default_level_;
}

nlohmann::json EnforcementSnapshot::to_json() const {
    nlohmann::json j;
    j["version"] = version_;
    j["updatedAt"] = updated_at_ms_;
    j["defaultLevel"] = to_string(default_level_);
    j["levels"] = nlohmann::json::object();
    for (auto& [cat, lvl] : levels_) j["levels"][cat] = to_string(lvl);
    j["history"] = nlohmann::json::array();
    for (auto& t : history_) j["history"].push_back(t.to_json());
    return j;
}

EnforcementSnapshot EnforcementSnapshot::from_json(const nlohmann::json& j) {
    if (!j.is_object()) throw std::runtime_error("enforcement snapshot must be a JSON object");

    EnforcementSnapshot s;
    s.version_ = j.value("version", int64_t{0});
    s.updated_at_ms_ = j.value("updatedAt", int64_t{0});
    auto def = parse_level(j.value("defaultLevel", "FULL"));
    if (!def) throw std::runtime_error("enforcement snapshot has an unknown defaultLevel");
    s.default_level_ = *def;

    if (j.contains("levels")) {
        if (!j["levels"].is_object()) throw std::runtime_error("\"levels\" must be an object");
        for (auto& [cat, v] : j["levels"].items()) {
            auto lvl = v.is_string() ? parse_level(v.get<std::string>()) : std::nullopt;
            if (!lvl) throw std::runtime_error("unknown enforcement level for category '" + cat + "'");
            s.levels_[cat] = *lvl;
        }
    }
    if (j.contains("history") && j["history"].is_array()) {
        for (auto& t : j["history"]) s.history_.push_back(LevelTransition::from_json(t));
    }
    return s;
}

EnforcementSnapshot transition(const EnforcementSnapshot& current,
                               const std::string& category,
                               EnforcementLevel to,
                               const std::string& reason,
                               bool manual,
                               int64_t now_ms) {
    if (category.empty()) throw std::invalid_argument("category is required");

    EnforcementLevel from = current.level_for(category);
    int step = static_cast<int>(to) - static_cast<int>(from);
    if (step == 0) {
        throw std::invalid_argument("'" + category + "' is already at " + to_string(to));
    }
    if (manual ? step > 1 : (step != 1 && step != -1)) {
        throw std::invalid_argument("cannot move '" + category + "' from " + to_string(from) +
                                    " to " + to_string(to) + ": levels rise one step at a time");
    }

    EnforcementSnapshot next = current;
    next.levels_[category] = to;
    next.version_ = current.version_ + 1;
    next.updated_at_ms_ = now_ms;

    LevelTransition t;
    t.category = category;
    t.from = from;
    t.to = to;
    t.reason = reason;
    t.manual = manual;
    t.at_ms = now_ms;
    next.history_.push_back(std::move(t));
    if (next.history_.size() > kMaxHistory) {
        next.history_.erase(next.history_.begin(),
                            next.history_.begin() + static_cast<std::ptrdiff_t>(next.history_.size() - kMaxHistory));
    }
    return next;
}

static std::string percent(double rate) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << rate * 100.0 << "%";
    return ss.str();
}

GraduationReport graduate(const EnforcementSnapshot& current,
                          const MetricsLog& metrics,
                          const GraduationPolicy& policy,
                          int64_t now_ms) {
    GraduationReport report{current, {}};

    std::set<std::string> categories;
    for (auto& [cat, _] : current.levels()) categories.insert(cat);
    for (auto& cat : metrics.categories()) categories.insert(cat);

    const int64_t window_ms = std::max(1, policy.window_days) * kDayMs;

    for (auto& cat : categories) {
        EnforcementLevel level = report.snapshot.level_for(cat);

        // Emergency de-escalation: judged on the most recent window alone.
        WindowStats recent = metrics.window(cat, now_ms - window_ms, now_ms + 1);
        if (level != EnforcementLevel::silent && recent.runs >= policy.min_samples &&
            recent.fault_rate() >= policy.error_rate_spike) {
            auto lower = static_cast<EnforcementLevel>(static_cast<int>(level) - 1);
            std::string reason = "hook fault rate " + percent(recent.fault_rate()) +
                                 " over the last window";
            report.snapshot = transition(report.snapshot, cat, lower, reason, false, now_ms);
            report.transitions.push_back(report.snapshot.history().back());
            continue;
        }

        // SILENT categories produce no evidence; they leave SILENT by manual override only.
        if (level == EnforcementLevel::full || level == EnforcementLevel::silent) continue;

        bool sustained = policy.sustained_windows > 0;
        double worst = 0.0;
        for (int k = 0; k < policy.sustained_windows && sustained; ++k) {
            int64_t end = now_ms + 1 - k * window_ms;
            WindowStats w = metrics.window(cat, end - window_ms, end);
            if (w.completed() < policy.min_samples || w.violation_rate() >= policy.threshold) {
                sustained = false;
            }
            worst = std::max(worst, w.violation_rate());
        }
        if (!sustained) continue;

        auto higher = static_cast<EnforcementLevel>(static_cast<int>(level) + 1);
        std::string reason = "violation rate at most " + percent(worst) + " for " +
                             std::to_string(policy.sustained_windows) + " consecutive window(s)";
        report.snapshot = transition(report.snapshot, cat, higher, reason, false, now_ms);
        report.transitions.push_back(report.snapshot.history().back());
    }
    return report;
}

// ── Snapshot file ──────────────────────────────────────────────────

std::optional<EnforcementSnapshot> load_snapshot(const std::string& path) {
    if (!fs::exists(path)) return std::nullopt;
    std::string text = read_file(path);
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const std::exception& e) {
        throw std::runtime_error("corrupt enforcement snapshot " + path + ": " + e.what());
    }
    return EnforcementSnapshot::from_json(j);
}

bool save_snapshot(const std::string& path, const EnforcementSnapshot& snap) {
    auto parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
    }
    FileLock lock(path);
    if (!lock.locked()) {
        std::cerr << "[enforcement] Could not lock " << path << "\n";
        return false;
    }
    if (!write_file_atomic(path, dump_json(snap.to_json(), 2) + "\n")) {
        std::cerr << "[enforcement] Failed to write " << path << "\n";
        return false;
    }
    return true;
}

} // namespace guardrail
