#include "builtin_validators.hpp"
#include "../utils.hpp"
#include <regex>
#include <set>
#include <utility>
#include <iterator>

namespace guardrail {

// console.* -> logger.* replacement table
static const std::pair<const char*, const char*> kReplacements[] = {
    {"log",   "info"},
    {"error", "error"},
    {"warn",  "warn"},
    {"info",  "info"},
    {"debug", "debug"},
};

static const std::regex& console_regex() {
    static const std::regex re("\\bconsole\\.(log|error|warn|info|debug)\\b");
    return re;
}

static bool is_script_file(const std::string& ext) {
    static const std::set<std::string> exts = {
        ".js", ".jsx", ".ts", ".tsx", ".mjs", ".cjs",
    };
    return exts.count(ext) > 0;
}

// Tooling directories print to the console on purpose.
static bool in_tooling_dir(const std::string& file_path) {
    std::string p = "/" + normalize_slashes(file_path);
    for (auto* dir : {"/hooks/", "/scripts/", "/tools/"}) {
        if (p.find(dir) != std::string::npos) return true;
    }
    return false;
}

std::string rewrite_debug_prints(const std::string& content, int* count) {
    std::string out;
    out.reserve(content.size());
    int n = 0;

    auto begin = std::sregex_iterator(content.begin(), content.end(), console_regex());
    auto end = std::sregex_iterator();
    size_t last = 0;
    for (auto it = begin; it != end; ++it) {
        const std::smatch& m = *it;
        out.append(content, last, static_cast<size_t>(m.position(0)) - last);
        std::string method = m[1].str();
        for (auto& [from, to] : kReplacements) {
            if (method == from) {
                out += "logger.";
                out += to;
                break;
            }
        }
        last = static_cast<size_t>(m.position(0) + m.length(0));
        ++n;
    }
    out.append(content, last, std::string::npos);

    if (count) *count = n;
    return out;
}

class DebugPrintValidator : public Validator {
public:
    explicit DebugPrintValidator(Verdict verdict) : verdict_(verdict) {}

    std::string name() const override { return "debug_print"; }

    bool match(const ToolUseEvent& ev) const override {
        return ev.has_file() && is_script_file(ev.extension()) && !in_tooling_dir(ev.file_path);
    }

    ValidatorOutcome run(const ToolUseEvent& ev) const override {
        // PostToolUse payloads may omit the content; read what was written.
        std::string content = ev.content;
        if (content.empty() && ev.phase == Phase::post) content = read_file(ev.file_path);

        auto begin = std::sregex_iterator(content.begin(), content.end(), console_regex());
        auto count = std::distance(begin, std::sregex_iterator());
        if (count == 0) return ValidatorOutcome::allow();

        ValidatorOutcome out;
        out.verdict = verdict_;
        out.message = std::to_string(count) + " console.* call(s) in " + ev.file_name() +
                      ". Use the project logger (logger.info/warn/error) instead of console output.";
        Violation v;
        v.hook_name = name();
        v.severity = verdict_ == Verdict::block ? "error" : "warning";
        v.message = "debug print in " + ev.file_path;
        v.suggested_fix = "replace console.* with logger.*";
        out.violations.push_back(std::move(v));
        return out;
    }

    bool fixable() const override { return true; }

    std::optional<std::string> fix(const ToolUseEvent& ev, const std::string& content) const override {
        if (!match(ev)) return std::nullopt;
        int n = 0;
        std::string rewritten = rewrite_debug_prints(content, &n);
        if (n == 0) return std::nullopt;
        return rewritten;
    }

private:
    Verdict verdict_;
};

void register_debug_print_validator(ValidatorSet& set) {
    set.register_kind("debug_print", [](const nlohmann::json& options) -> ValidatorPtr {
        Verdict verdict = Verdict::warn;
        if (options.is_object()) {
            auto v = parse_verdict(options.value("verdict", std::string("warn")));
            if (!v) throw std::runtime_error("debug_print: verdict must be allow, warn or block");
            verdict = *v;
        }
        return std::make_shared<DebugPrintValidator>(verdict);
    });
}

} // namespace guardrail
