#include "config.hpp"
#include <fstream>
#include <set>

namespace guardrail {

// Reads camelCase first, then the snake_case spelling.
template <typename T>
static T pick(const nlohmann::json& j, const char* camel, const char* snake, T def) {
    if (j.contains(camel)) return j[camel].get<T>();
    if (j.contains(snake)) return j[snake].get<T>();
    return def;
}

static const nlohmann::json* find_key(const nlohmann::json& j, const char* camel, const char* snake) {
    if (j.contains(camel)) return &j[camel];
    if (j.contains(snake)) return &j[snake];
    return nullptr;
}

static std::vector<std::string> parse_string_array(const nlohmann::json& arr, const std::string& what) {
    std::vector<std::string> result;
    if (!arr.is_array()) throw ConfigError(what + " must be an array of strings");
    for (auto& item : arr) {
        if (!item.is_string()) throw ConfigError(what + " must be an array of strings");
        result.push_back(item.get<std::string>());
    }
    return result;
}

static HookConfig make_hook(const std::string& name, const std::string& validator,
                            const std::string& family, const std::string& priority,
                            const std::string& phase, const std::string& description) {
    HookConfig h;
    h.name = name;
    h.validator = validator;
    h.family = family;
    h.priority = priority;
    h.phase = phase;
    h.description = description;
    return h;
}

std::vector<HookConfig> Config::default_hooks() {
    std::vector<HookConfig> hooks;

    hooks.push_back(make_hook("improved_file_names", "improved_file_names", "file_hygiene",
                              "critical", "pre",
                              "Blocks versioned copies such as Foo_improved.ts or Bar_v2.py"));

    auto docs = make_hook("banned_documents", "banned_documents", "documentation",
                          "normal", "pre",
                          "Blocks status and summary markdown documents");
    docs.matcher.extensions = {".md"};
    hooks.push_back(docs);

    const std::vector<std::string> scripts = {".js", ".jsx", ".ts", ".tsx", ".mjs", ".cjs"};

    auto debug = make_hook("debug_print", "debug_print", "code_cleanup", "low", "pre",
                           "Warns about console.* calls in JS/TS sources");
    debug.matcher.extensions = scripts;
    hooks.push_back(debug);

    auto autofix = make_hook("debug_print_autofix", "debug_print", "code_cleanup", "low", "post",
                             "Rewrites console.* calls to logger.* after the write lands");
    autofix.matcher.extensions = scripts;
    autofix.fixable = true;
    hooks.push_back(autofix);

    return hooks;
}

Config Config::make_default() {
    Config c;
    c.hooks = default_hooks();
    return c;
}

EnforcementSnapshot Config::initial_snapshot() const {
    std::map<std::string, EnforcementLevel> levels;
    for (auto& [cat, name] : enforcement_level) {
        auto lvl = parse_level(name);
        if (!lvl) throw ConfigError("Unknown enforcement level '" + name + "' for " + cat);
        levels[cat] = *lvl;
    }
    auto def = parse_level(default_level);
    if (!def) throw ConfigError("Unknown defaultLevel '" + default_level + "'");
    return EnforcementSnapshot(std::move(levels), *def);
}

static MatcherConfig parse_matcher(const nlohmann::json& m, const std::string& hook) {
    MatcherConfig mc;
    // Shorthand: "matcher": "Write|Edit"
    if (m.is_string()) {
        mc.tools = m.get<std::string>();
        return mc;
    }
    if (!m.is_object()) throw ConfigError("hook '" + hook + "': matcher must be a string or object");
    mc.tools = m.value("tools", mc.tools);
    if (m.contains("paths")) mc.paths = parse_string_array(m["paths"], "hook '" + hook + "' matcher.paths");
    if (m.contains("extensions")) {
        mc.extensions = parse_string_array(m["extensions"], "hook '" + hook + "' matcher.extensions");
    }
    if (m.contains("exclude")) mc.exclude = parse_string_array(m["exclude"], "hook '" + hook + "' matcher.exclude");
    return mc;
}

static HookConfig parse_hook(const nlohmann::json& h) {
    if (!h.is_object()) throw ConfigError("each hook must be an object");

    HookConfig hc;
    hc.name = h.value("name", "");
    if (hc.name.empty()) throw ConfigError("hook is missing a \"name\"");
    hc.validator = h.value("validator", hc.name);
    hc.family = h.value("family", "general");
    hc.priority = h.value("priority", hc.priority);
    hc.phase = h.value("phase", hc.phase);
    hc.description = h.value("description", "");
    if (h.contains("matcher")) hc.matcher = parse_matcher(h["matcher"], hc.name);
    hc.timeout_ms = pick<int>(h, "timeoutMs", "timeout_ms", 0);
    if (hc.timeout_ms < 0) throw ConfigError("hook '" + hc.name + "': timeoutMs must not be negative");
    hc.fixable = h.value("fixable", false);
    if (h.contains("options")) hc.options = h["options"];
    // Command hooks may put the command at the top level.
    if (h.contains("command")) {
        if (!hc.options.is_object()) hc.options = nlohmann::json::object();
        hc.options["command"] = h["command"];
    }
    return hc;
}

Config Config::from_json(const nlohmann::json& j) {
    if (!j.is_object()) throw ConfigError("configuration must be a JSON object");

    Config c;
    try {
        if (auto* levels = find_key(j, "enforcementLevel", "enforcement_level")) {
            if (!levels->is_object()) throw ConfigError("enforcementLevel must be an object");
            for (auto& [cat, v] : levels->items()) c.enforcement_level[cat] = v.get<std::string>();
        }
        c.default_level = pick<std::string>(j, "defaultLevel", "default_level", c.default_level);
        c.hook_timeout_ms = pick<int>(j, "hookTimeoutMs", "hook_timeout_ms", c.hook_timeout_ms);
        c.global_deadline_ms = pick<int>(j, "globalDeadlineMs", "global_deadline_ms", c.global_deadline_ms);
        c.deadline_scope = pick<std::string>(j, "deadlineScope", "deadline_scope", c.deadline_scope);
        c.max_concurrency = pick<int>(j, "maxConcurrency", "max_concurrency", c.max_concurrency);
        if (auto* fams = find_key(j, "enabledFamilies", "enabled_families")) {
            c.enabled_families = parse_string_array(*fams, "enabledFamilies");
        }
        c.auto_fix = pick<bool>(j, "autoFix", "auto_fix", c.auto_fix);
        c.dry_run = pick<bool>(j, "dryRun", "dry_run", c.dry_run);
        c.message_limit = pick<int>(j, "messageLimit", "message_limit", c.message_limit);
        c.message_char_limit = pick<int>(j, "messageCharLimit", "message_char_limit", c.message_char_limit);

        if (j.contains("metrics")) {
            auto& m = j["metrics"];
            if (!m.is_object()) throw ConfigError("metrics must be an object");
            c.metrics.enabled = m.value("enabled", c.metrics.enabled);
            c.metrics.path = m.value("path", c.metrics.path);
            c.metrics.queue_capacity = pick<size_t>(m, "queueCapacity", "queue_capacity", c.metrics.queue_capacity);
            c.metrics.retention_days = pick<int>(m, "retentionDays", "retention_days", c.metrics.retention_days);
        }
        if (j.contains("graduation")) {
            auto& g = j["graduation"];
            if (!g.is_object()) throw ConfigError("graduation must be an object");
            auto& p = c.graduation;
            p.threshold = g.value("threshold", p.threshold);
            p.sustained_windows = pick<int>(g, "sustainedWindows", "sustained_windows", p.sustained_windows);
            p.window_days = pick<int>(g, "windowDays", "window_days", p.window_days);
            p.min_samples = pick<int>(g, "minSamples", "min_samples", p.min_samples);
            p.error_rate_spike = pick<double>(g, "errorRateSpike", "error_rate_spike", p.error_rate_spike);
        }
        if (j.contains("backup")) {
            auto& b = j["backup"];
            if (!b.is_object()) throw ConfigError("backup must be an object");
            c.backup.directory = b.value("directory", c.backup.directory);
            c.backup.retention_days = pick<int>(b, "retentionDays", "retention_days", c.backup.retention_days);
        }
        c.archive_path = pick<std::string>(j, "archivePath", "archive_path", c.archive_path);

        if (j.contains("hooks")) {
            if (!j["hooks"].is_array()) throw ConfigError("hooks must be an array");
            for (auto& h : j["hooks"]) c.hooks.push_back(parse_hook(h));
        } else {
            c.hooks = default_hooks();
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid value: ") + e.what());
    }

    if (c.hook_timeout_ms <= 0) throw ConfigError("hookTimeoutMs must be positive");
    if (c.global_deadline_ms <= 0) throw ConfigError("globalDeadlineMs must be positive");
    if (c.max_concurrency < 1) throw ConfigError("maxConcurrency must be at least 1");
    if (c.message_limit < 1) throw ConfigError("messageLimit must be at least 1");
    if (c.message_char_limit < 1) throw ConfigError("messageCharLimit must be at least 1");
    if (c.deadline_scope != "invocation" && c.deadline_scope != "phase") {
        throw ConfigError("deadlineScope must be \"invocation\" or \"phase\"");
    }
    if (c.graduation.window_days < 1 || c.graduation.sustained_windows < 1) {
        throw ConfigError("graduation windows must be at least 1");
    }

    std::set<std::string> names;
    for (auto& h : c.hooks) {
        if (!names.insert(h.name).second) throw ConfigError("duplicate hook name '" + h.name + "'");
    }

    // Validates every level string up front.
    c.initial_snapshot();
    return c;
}

Config Config::load(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        if (fs::exists(path)) throw ConfigError("cannot read " + path);
        Config c = make_default();
        c.state_dir = fs::path(path).parent_path().string();
        if (c.state_dir.empty()) c.state_dir = ".";
        return c;
    }
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(f);
    } catch (const std::exception& e) {
        throw ConfigError("failed to parse " + path + ": " + e.what());
    }
    Config c = from_json(j);
    c.state_dir = fs::path(path).parent_path().string();
    if (c.state_dir.empty()) c.state_dir = ".";
    return c;
}

} // namespace guardrail
