#include "hook_registry.hpp"
#include "utils.hpp"
#include <algorithm>
#include <iostream>
#include <tuple>

namespace guardrail {

static bool glob_at(const char* p, const char* s) {
    for (; *p; ++p) {
        if (*p == '*') {
            bool deep = p[1] == '*';
            if (deep) {
                ++p;
                // "**/" also matches zero directories
                if (p[1] == '/' && glob_at(p + 2, s)) return true;
            }
            for (const char* t = s;; ++t) {
                if (glob_at(p + 1, t)) return true;
                if (!*t || (!deep && *t == '/')) return false;
            }
        }
        if (!*s) return false;
        if (*p == '?') {
            if (*s == '/') return false;
            ++s;
            continue;
        }
        if (*p != *s) return false;
        ++s;
    }
    return *s == '\0';
}

bool glob_match(const std::string& pattern, const std::string& path) {
    std::string pat = normalize_slashes(pattern);
    std::string p = normalize_slashes(path);
    if (glob_at(pat.c_str(), p.c_str())) return true;

    // Relative patterns match at any directory boundary of an absolute path.
    if (!pat.empty() && pat[0] != '/') {
        for (size_t i = p.find('/'); i != std::string::npos; i = p.find('/', i + 1)) {
            if (glob_at(pat.c_str(), p.c_str() + i + 1)) return true;
        }
    }
    return false;
}

Matcher Matcher::from_config(const MatcherConfig& mc, const std::string& hook_name) {
    Matcher m;
    m.tools_pattern = mc.tools;
    if (!mc.tools.empty() && mc.tools != "*") {
        try {
            m.tools = std::regex(mc.tools);
        } catch (const std::regex_error& e) {
            throw ConfigError("hook '" + hook_name + "': invalid tools pattern '" + mc.tools + "': " + e.what());
        }
    }
    m.paths = mc.paths;
    m.exclude = mc.exclude;
    for (auto& ext : mc.extensions) {
        std::string e = to_lower(ext);
        if (!e.empty() && e[0] != '.') e = "." + e;
        m.extensions.push_back(e);
    }
    return m;
}

bool Matcher::accepts(const ToolUseEvent& ev) const {
    // Stop events carry no tool or file.
    if (ev.phase == Phase::stop) return true;

    if (!tools_pattern.empty() && tools_pattern != "*") {
        if (!std::regex_match(ev.tool_name, tools)) return false;
    }

    if (!extensions.empty()) {
        if (std::find(extensions.begin(), extensions.end(), ev.extension()) == extensions.end()) return false;
    }

    if (!paths.empty()) {
        if (!ev.has_file()) return false;
        bool any = std::any_of(paths.begin(), paths.end(),
                               [&](const std::string& g) { return glob_match(g, ev.file_path); });
        if (!any) return false;
    }

    for (auto& g : exclude) {
        if (ev.has_file() && glob_match(g, ev.file_path)) return false;
    }
    return true;
}

static bool hook_order(const HookPtr& a, const HookPtr& b) {
    return std::tie(a->priority, a->family, a->name) < std::tie(b->priority, b->family, b->name);
}

void HookRegistry::add(HookDefinition def) {
    for (auto& h : hooks_) {
        if (h->name == def.name) throw ConfigError("duplicate hook name '" + def.name + "'");
    }
    hooks_.push_back(std::make_shared<const HookDefinition>(std::move(def)));
    std::sort(hooks_.begin(), hooks_.end(), hook_order);
}

HookRegistry HookRegistry::from_config(const Config& config, const ValidatorSet& validators) {
    HookRegistry reg;
    reg.set_enabled_families(config.enabled_families);

    for (auto& hc : config.hooks) {
        HookDefinition def;
        def.name = hc.name;
        def.family = hc.family;
        def.description = hc.description;

        auto prio = parse_priority(hc.priority);
        if (!prio) throw ConfigError("hook '" + hc.name + "': unknown priority '" + hc.priority + "'");
        def.priority = *prio;

        auto phase = parse_phase(hc.phase);
        if (!phase) throw ConfigError("hook '" + hc.name + "': unknown phase '" + hc.phase + "'");
        def.phase = *phase;

        def.matcher = Matcher::from_config(hc.matcher, hc.name);
        def.timeout_ms = hc.timeout_ms > 0 ? hc.timeout_ms : config.hook_timeout_ms;

        if (!validators.has(hc.validator)) {
            throw ConfigError("hook '" + hc.name + "': unknown validator '" + hc.validator + "'");
        }
        try {
            def.validator = validators.create(hc.validator, hc.options);
        } catch (const ConfigError&) {
            throw;
        } catch (const std::exception& e) {
            throw ConfigError("hook '" + hc.name + "': " + e.what());
        }
        def.validator_kind = hc.validator;

        if (hc.fixable && !def.validator->fixable()) {
            throw ConfigError("hook '" + hc.name + "': validator '" + hc.validator + "' cannot fix files");
        }
        def.fixable = hc.fixable;

        reg.add(std::move(def));
    }
    return reg;
}

// A validator whose pre-filter throws is left out of this event only.
static bool validator_matches(const HookDefinition& h, const ToolUseEvent& ev) {
    try {
        return h.validator->match(ev);
    } catch (const std::exception& e) {
        std::cerr << "[registry] Hook '" << h.name << "' match failed, skipping: " << e.what() << "\n";
    } catch (...) {
        std::cerr << "[registry] Hook '" << h.name << "' match failed, skipping: unknown exception\n";
    }
    return false;
}

bool HookRegistry::family_enabled(const std::string& family) const {
    if (enabled_families_.empty()) return true;
    return std::find(enabled_families_.begin(), enabled_families_.end(), family) != enabled_families_.end();
}

std::vector<HookPtr> HookRegistry::select(const ToolUseEvent& ev, const EnforcementSnapshot& snapshot) const {
    std::vector<HookPtr> out;
    for (auto& h : hooks_) {
        if (h->phase != ev.phase) continue;
        if (!family_enabled(h->family)) continue;
        if (snapshot.level_for(h->family) == EnforcementLevel::silent) continue;
        if (!h->matcher.accepts(ev)) continue;
        if (!validator_matches(*h, ev)) continue;
        out.push_back(h);
    }
    return out;
}

} // namespace guardrail
