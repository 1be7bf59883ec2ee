#include "builtin_validators.hpp"
#include "../utils.hpp"
#include <regex>
#include <vector>

namespace guardrail {

// Versioned-copy suffixes that AI assistants tend to invent instead of
// editing the original file.
static const char* kVersionSuffixes =
    "improved|enhanced|v\\d+|fixed|updated|new|final|refactored|optimized|"
    "better|copy|backup|old|temp|tmp";

static const std::regex& suffix_regex() {
    static const std::regex re(std::string("_(") + kVersionSuffixes + ")$", std::regex::icase);
    return re;
}

// "Profile (1)" -> "Profile"
static std::string strip_copy_counter(const std::string& stem) {
    static const std::regex re("\\s*\\(\\d+\\)$");
    return std::regex_replace(stem, re, "");
}

std::optional<std::string> canonical_file_name(const std::string& file_name) {
    fs::path p(file_name);
    std::string stem = p.stem().string();
    std::string ext = p.extension().string();

    std::string stripped = strip_copy_counter(stem);
    bool had_counter = stripped != stem;

    std::smatch m;
    bool had_suffix = std::regex_search(stripped, m, suffix_regex());
    if (!had_suffix && !had_counter) return std::nullopt;
    if (had_suffix) stripped = stripped.substr(0, static_cast<size_t>(m.position(0)));

    bool only_underscores = stripped.find_first_not_of('_') == std::string::npos;
    if (stripped.empty() || only_underscores) stripped = "renamed-file";
    return stripped + ext;
}

class NamingValidator : public Validator {
public:
    explicit NamingValidator(std::vector<std::string> allow)
        : allow_(std::move(allow)) {}

    std::string name() const override { return "improved_file_names"; }

    ValidatorOutcome run(const ToolUseEvent& ev) const override {
        std::string file = ev.file_name();
        for (auto& a : allow_) {
            if (a == file) return ValidatorOutcome::allow();
        }

        auto canonical = canonical_file_name(file);
        if (!canonical) return ValidatorOutcome::allow();

        ValidatorOutcome out;
        out.verdict = Verdict::block;
        out.message =
            "File name '" + file + "' looks like a versioned copy. "
            "Edit the original file instead of creating a new variant: use '" +
            *canonical + "'.";
        Violation v;
        v.hook_name = name();
        v.severity = "error";
        v.message = "versioned file name: " + ev.file_path;
        v.suggested_fix = "rename to " + *canonical;
        out.violations.push_back(std::move(v));
        return out;
    }

private:
    std::vector<std::string> allow_;   // exact file names exempt from the check
};

void register_naming_validator(ValidatorSet& set) {
    set.register_kind("improved_file_names", [](const nlohmann::json& options) -> ValidatorPtr {
        std::vector<std::string> allow;
        if (options.is_object() && options.contains("allow") && options["allow"].is_array()) {
            for (auto& a : options["allow"]) {
                if (a.is_string()) allow.push_back(a.get<std::string>());
            }
        }
        return std::make_shared<NamingValidator>(std::move(allow));
    });
}

void register_builtin_validators(ValidatorSet& set) {
    register_naming_validator(set);
    register_debug_print_validator(set);
    register_banned_docs_validator(set);
    register_command_validator(set);
}

} // namespace guardrail
