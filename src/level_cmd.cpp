#include "commands.hpp"
#include "dispatcher.hpp"
#include <iostream>

namespace guardrail {

int cmd_set_level(const CliOptions& opts, const std::string& category,
                  const std::string& level, const std::string& reason) {
    auto lvl = parse_level(level);
    if (!lvl) {
        std::cerr << "Unknown level: " << level << " (expected SILENT, WARNING, PARTIAL or FULL)\n";
        return 1;
    }

    ValidatorSet validators = builtin_validator_set();
    Engine engine(load_cli_config(opts), validators);
    EnforcementLevel before = engine.current_snapshot().level_for(category);
    try {
        EnforcementSnapshot next = engine.set_level(category, *lvl, reason);
        std::cout << category << ": " << to_string(before) << " -> " << to_string(next.level_for(category))
                  << " (snapshot v" << next.version() << ")\n";
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    return 0;
}

int cmd_graduate(const CliOptions& opts) {
    ValidatorSet validators = builtin_validator_set();
    Engine engine(load_cli_config(opts), validators);

    GraduationReport report = engine.run_graduation();
    if (report.transitions.empty()) {
        std::cout << "No level changes.\n";
        return 0;
    }
    for (auto& t : report.transitions) {
        std::cout << t.category << ": " << to_string(t.from) << " -> " << to_string(t.to)
                  << " (" << t.reason << ")\n";
    }
    return 0;
}

} // namespace guardrail
