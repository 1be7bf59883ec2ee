#include "builtin_validators.hpp"
#include "../utils.hpp"
#include <regex>

namespace guardrail {

// Status and completion write-ups; the project keeps history in git and the
// changelog, not in one-off markdown reports.
static bool is_banned_document(const std::string& file_name) {
    static const std::regex ending(
        "(^|[-_ ])(SUMMARY|REPORT|COMPLETE|COMPLETION|FIXED|DONE|FINISHED|STATUS|FINAL)\\.md$",
        std::regex::icase);
    static const std::regex leading(
        "^(COMPLETE|DONE|FIXED|FINISHED|FINAL|IMPLEMENTATION)[-_].*\\.md$",
        std::regex::icase);
    return std::regex_search(file_name, ending) || std::regex_search(file_name, leading);
}

class BannedDocsValidator : public Validator {
public:
    std::string name() const override { return "banned_documents"; }

    bool match(const ToolUseEvent& ev) const override {
        return ev.has_file() && ev.extension() == ".md";
    }

    ValidatorOutcome run(const ToolUseEvent& ev) const override {
        std::string file = ev.file_name();
        if (!is_banned_document(file)) return ValidatorOutcome::allow();

        ValidatorOutcome out;
        out.verdict = Verdict::block;
        out.message = "'" + file + "' is a status/summary document. "
                      "Report progress in your reply or update an existing doc (README, CHANGELOG) instead.";
        Violation v;
        v.hook_name = name();
        v.severity = "error";
        v.message = "banned document type: " + ev.file_path;
        out.violations.push_back(std::move(v));
        return out;
    }
};

void register_banned_docs_validator(ValidatorSet& set) {
    set.register_kind("banned_documents", [](const nlohmann::json&) -> ValidatorPtr {
        return std::make_shared<BannedDocsValidator>();
    });
}

} // namespace guardrail
