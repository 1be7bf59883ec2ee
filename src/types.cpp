#include "types.hpp"
#include "utils.hpp"

namespace guardrail {

std::string to_string(Verdict v) {
    switch (v) {
        case Verdict::allow: return "allow";
        case Verdict::warn:  return "warn";
        case Verdict::block: return "block";
    }
    return "allow";
}

std::string to_string(Priority p) {
    switch (p) {
        case Priority::critical: return "critical";
        case Priority::high:     return "high";
        case Priority::normal:   return "normal";
        case Priority::low:      return "low";
    }
    return "normal";
}

std::string to_string(Phase p) {
    switch (p) {
        case Phase::pre:  return "PreToolUse";
        case Phase::post: return "PostToolUse";
        case Phase::stop: return "Stop";
    }
    return "PreToolUse";
}

std::optional<Verdict> parse_verdict(const std::string& s) {
    std::string v = to_lower(s);
    if (v == "allow") return Verdict::allow;
    if (v == "warn" || v == "warning") return Verdict::warn;
    if (v == "block") return Verdict::block;
    return std::nullopt;
}

std::optional<Priority> parse_priority(const std::string& s) {
    std::string v = to_lower(s);
    if (v == "critical") return Priority::critical;
    if (v == "high")     return Priority::high;
    if (v == "normal" || v == "medium") return Priority::normal;
    if (v == "low")      return Priority::low;
    return std::nullopt;
}

std::optional<Phase> parse_phase(const std::string& s) {
    std::string v = to_lower(s);
    if (v == "pretooluse" || v == "pre")   return Phase::pre;
    if (v == "posttooluse" || v == "post") return Phase::post;
    if (v == "stop" || v == "subagentstop") return Phase::stop;
    return std::nullopt;
}

nlohmann::json FixResult::to_json() const {
    nlohmann::json j = {
        {"filePath", file_path},
        {"hook", hook_name},
        {"backupPath", backup_path.empty() ? nlohmann::json(nullptr) : nlohmann::json(backup_path)},
        {"applied", applied},
        {"verified", verified},
        {"rolledBack", rolled_back},
        {"dryRun", dry_run},
        {"diffSummary", diff_summary},
    };
    if (error) j["error"] = *error;
    return j;
}

} // namespace guardrail
