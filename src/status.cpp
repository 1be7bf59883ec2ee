#include "commands.hpp"
#include "dispatcher.hpp"
#include "metrics_archive.hpp"
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>

namespace guardrail {

static std::string pct(double rate) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << rate * 100.0 << "%";
    return ss.str();
}

int cmd_status(const CliOptions& opts, bool history) {
    ValidatorSet validators = builtin_validator_set();
    Engine engine(load_cli_config(opts), validators);
    const Config& cfg = engine.config();
    EnforcementSnapshot snap = engine.current_snapshot();

    std::cout << "=== guardrail status ===\n";
    std::cout << "State dir    : " << cfg.state_dir << "\n";
    std::cout << "Deadline     : " << cfg.global_deadline_ms << "ms (" << cfg.deadline_scope
              << "), hook timeout " << cfg.hook_timeout_ms << "ms\n";
    std::cout << "Concurrency  : " << cfg.max_concurrency << "\n";
    std::cout << "Auto-fix     : " << (cfg.auto_fix ? "on" : "off")
              << (cfg.dry_run ? " (dry run)" : "") << "\n";
    std::cout << "Snapshot     : v" << snap.version() << ", default " << to_string(snap.default_level()) << "\n";

    MetricsLog log(cfg.metrics_path());
    std::set<std::string> categories;
    for (auto& h : engine.registry().hooks()) categories.insert(h->family);
    for (auto& [cat, _] : snap.levels()) categories.insert(cat);
    for (auto& cat : log.categories()) categories.insert(cat);

    int64_t now = epoch_ms_now();
    int days = cfg.graduation.window_days;
    std::cout << "\nCategories (last " << days << " day(s)):\n";
    for (auto& cat : categories) {
        WindowStats w = log.window(cat, now - days * 24LL * 60 * 60 * 1000, now + 1);
        std::cout << "  " << std::left << std::setw(18) << cat << std::setw(9)
                  << to_string(snap.level_for(cat))
                  << " runs " << w.runs << ", violations " << pct(w.violation_rate())
                  << ", faults " << pct(w.fault_rate())
                  << (engine.registry().family_enabled(cat) ? "" : " (disabled)") << "\n";
    }

    std::cout << "\nHooks:\n";
    for (auto& h : engine.registry().hooks()) {
        std::cout << "  " << std::left << std::setw(24) << h->name << std::setw(16) << h->family
                  << std::setw(9) << to_string(h->priority) << std::setw(5) << to_string(h->phase)
                  << h->timeout_ms << "ms" << (h->fixable ? " fixable" : "") << "\n";
    }

    auto summary = log.summary_by_hook(days, now);
    if (!summary.empty()) {
        std::cout << "\nHook activity (last " << days << " day(s)):\n";
        for (auto& [name, s] : summary) {
            int64_t avg = s.runs > 0 ? s.total_duration_ms / s.runs : 0;
            std::cout << "  " << std::left << std::setw(24) << name << s.runs << " runs, "
                      << s.violations << " violations, " << s.faults << " faults, avg " << avg << "ms\n";
        }
    }

    auto& transitions = snap.history();
    if (!transitions.empty()) {
        std::cout << "\nRecent level changes:\n";
        size_t from = transitions.size() > 5 ? transitions.size() - 5 : 0;
        for (size_t i = from; i < transitions.size(); ++i) {
            auto& t = transitions[i];
            std::cout << "  " << day_str(t.at_ms) << " " << t.category << " " << to_string(t.from)
                      << " -> " << to_string(t.to) << (t.manual ? " [manual] " : " ") << t.reason << "\n";
        }
    }

    if (history) {
        std::string db_path = cfg.archive_db_path();
        std::cout << "\nArchived daily rollups:\n";
        if (!fs::exists(db_path)) {
            std::cout << "  (none)\n";
        } else {
            try {
                MetricsArchive archive(db_path);
                auto rows = archive.rollups();
                if (rows.empty()) std::cout << "  (none)\n";
                for (auto& r : rows) {
                    std::cout << "  " << r.day << "  " << std::left << std::setw(24) << r.hook_name
                              << std::setw(16) << r.category << r.runs << " runs, " << r.violations
                              << " violations, " << r.faults << " faults\n";
                }
            } catch (const std::exception& e) {
                std::cout << "  (error reading archive: " << e.what() << ")\n";
            }
        }
    }
    return 0;
}

} // namespace guardrail
