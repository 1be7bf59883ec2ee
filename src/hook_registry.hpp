#pragma once
#include "config.hpp"
#include "enforcement.hpp"
#include "event.hpp"
#include "validator.hpp"
#include <string>
#include <vector>
#include <memory>
#include <regex>

namespace guardrail {

// Glob over '/'-separated paths: '*' and '?' stop at '/', '**' crosses it.
bool glob_match(const std::string& pattern, const std::string& path);

struct Matcher {
    std::string tools_pattern;
    std::regex tools;
    std::vector<std::string> paths;
    std::vector<std::string> extensions;   // lower-case, with leading dot
    std::vector<std::string> exclude;

    // Throws ConfigError for an invalid tools regex.
    static Matcher from_config(const MatcherConfig& mc, const std::string& hook_name);

    bool accepts(const ToolUseEvent& ev) const;
};

struct HookDefinition {
    std::string name;
    std::string family;
    Priority priority = Priority::normal;
    Phase phase = Phase::pre;
    Matcher matcher;
    int timeout_ms = 2000;
    bool fixable = false;
    std::string validator_kind;
    ValidatorPtr validator;
    std::string description;
};

using HookPtr = std::shared_ptr<const HookDefinition>;

// Immutable set of hook definitions, built once per invocation.
class HookRegistry {
public:
    // Throws ConfigError for unknown validators, priorities, phases,
    // duplicate names or bad matchers.
    static HookRegistry from_config(const Config& config, const ValidatorSet& validators);

    void add(HookDefinition def);
    void set_enabled_families(std::vector<std::string> families) { enabled_families_ = std::move(families); }

    // Hooks for this event, sorted by (priority, family, name).
    std::vector<HookPtr> select(const ToolUseEvent& ev, const EnforcementSnapshot& snapshot) const;

    const std::vector<HookPtr>& hooks() const { return hooks_; }
    bool family_enabled(const std::string& family) const;

private:
    std::vector<HookPtr> hooks_;   // kept sorted
    std::vector<std::string> enabled_families_;
};

} // namespace guardrail
