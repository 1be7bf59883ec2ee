#pragma once
#include <string>
#include <vector>
#include <map>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "enforcement.hpp"
#include "utils.hpp"

namespace guardrail {

// A configuration the engine refuses to run with. The only fail-closed fault.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

struct MatcherConfig {
    std::string tools = "Write|Edit|MultiEdit";   // regex over the tool name
    std::vector<std::string> paths;               // globs, empty = any
    std::vector<std::string> extensions;          // ".ts" or "ts", empty = any
    std::vector<std::string> exclude;             // globs
};

struct HookConfig {
    std::string name;
    std::string validator;       // ValidatorSet kind
    std::string family;
    std::string priority = "normal";
    std::string phase = "pre";
    std::string description;
    MatcherConfig matcher;
    int timeout_ms = 0;          // 0 = hookTimeoutMs
    bool fixable = false;
    nlohmann::json options;      // passed to the validator factory
};

struct MetricsConfig {
    bool enabled = true;
    std::string path = "metrics.jsonl";
    size_t queue_capacity = 1024;
    int retention_days = 30;
};

struct BackupConfig {
    std::string directory = "backups";
    int retention_days = 7;
};

struct Config {
    std::map<std::string, std::string> enforcement_level;   // category -> level
    std::string default_level = "FULL";
    int hook_timeout_ms = 2000;
    int global_deadline_ms = 5000;
    std::string deadline_scope = "invocation";              // or "phase"
    int max_concurrency = 8;
    std::vector<std::string> enabled_families;              // empty = all
    bool auto_fix = true;
    bool dry_run = false;
    int message_limit = 10;
    int message_char_limit = 4000;

    MetricsConfig metrics;
    GraduationPolicy graduation;
    BackupConfig backup;
    std::string archive_path = "archive.db";

    std::vector<HookConfig> hooks;

    // Directory relative state paths resolve against; not serialized.
    std::string state_dir = ".guardrail";

    std::string resolve(const std::string& p) const {
        std::string e = expand_path(p);
        if (e.empty() || fs::path(e).is_absolute()) return e;
        return (fs::path(state_dir) / e).string();
    }
    std::string metrics_path() const { return resolve(metrics.path); }
    std::string backup_dir() const { return resolve(backup.directory); }
    std::string archive_db_path() const { return resolve(archive_path); }
    std::string snapshot_path() const { return resolve("enforcement.json"); }

    // Seed snapshot for a state directory that has none yet.
    EnforcementSnapshot initial_snapshot() const;

    static std::vector<HookConfig> default_hooks();
    static Config make_default();
    // Missing file: defaults. Unreadable or invalid file: ConfigError.
    static Config load(const std::string& path);
    // Throws ConfigError.
    static Config from_json(const nlohmann::json& j);
};

} // namespace guardrail
