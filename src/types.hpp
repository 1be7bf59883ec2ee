#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace guardrail {

// Ordered by severity: comparisons rely on allow < warn < block.
enum class Verdict {
    allow,
    warn,
    block,
};

// Lower value runs and sorts first.
enum class Priority {
    critical,
    high,
    normal,
    low,
};

enum class Phase {
    pre,
    post,
    stop,
};

std::string to_string(Verdict v);
std::string to_string(Priority p);
std::string to_string(Phase p);

std::optional<Verdict> parse_verdict(const std::string& s);
// Accepts "medium" as an alias of normal.
std::optional<Priority> parse_priority(const std::string& s);
// Accepts both the assistant's event names (PreToolUse) and short forms (pre).
std::optional<Phase> parse_phase(const std::string& s);

struct Violation {
    std::string hook_name;
    std::string severity;                  // "error" | "warning" | "info"
    std::string message;
    std::optional<std::string> suggested_fix;
};

struct ExecutionResult {
    std::string hook_name;
    std::string family;
    Priority priority = Priority::normal;
    Verdict verdict = Verdict::allow;      // after enforcement level
    Verdict raw_verdict = Verdict::allow;  // as the validator reported it
    std::string message;
    std::vector<Violation> violations;
    int64_t duration_ms = 0;
    bool timed_out = false;
    std::optional<std::string> error;

    bool faulted() const { return timed_out || error.has_value(); }
};

struct Decision {
    Verdict verdict = Verdict::allow;
    std::vector<std::string> messages;
    std::vector<std::string> contributing_hooks;
    std::vector<std::string> faults;

    bool operator==(const Decision& o) const {
        return verdict == o.verdict && messages == o.messages &&
               contributing_hooks == o.contributing_hooks && faults == o.faults;
    }
    bool operator!=(const Decision& o) const { return !(*this == o); }
};

struct FixResult {
    std::string file_path;
    std::string hook_name;
    std::string backup_path;
    bool applied = false;
    bool verified = false;
    bool rolled_back = false;
    bool dry_run = false;
    std::string diff_summary;
    std::optional<std::string> error;

    nlohmann::json to_json() const;
};

} // namespace guardrail
