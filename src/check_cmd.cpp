#include "commands.hpp"
#include "dispatcher.hpp"
#include "utils.hpp"
#include "validators/builtin_validators.hpp"
#include <iostream>
#include <iterator>
#include <memory>

namespace guardrail {

Config load_cli_config(const CliOptions& opts) {
    std::string state_dir = opts.state_dir.empty() ? default_state_dir() : expand_path(opts.state_dir);
    std::string path = opts.config_path.empty() ? default_config_path(state_dir) : expand_path(opts.config_path);
    Config cfg = Config::load(path);
    if (!opts.state_dir.empty() || opts.config_path.empty()) cfg.state_dir = state_dir;
    return cfg;
}

ValidatorSet builtin_validator_set() {
    ValidatorSet set;
    register_builtin_validators(set);
    return set;
}

int cmd_check(const CliOptions& opts) {
    std::string input((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());

    ValidatorSet validators = builtin_validator_set();
    Config cfg = load_cli_config(opts);   // ConfigError propagates: fail closed

    std::unique_ptr<Engine> engine;
    try {
        engine = std::make_unique<Engine>(std::move(cfg), validators);
    } catch (const ConfigError&) {
        throw;
    } catch (const std::exception& e) {
        std::cerr << "[dispatch] Engine failed to start, allowing: " << e.what() << "\n";
        std::cout << DispatchOutcome{}.render_json() << std::endl;
        return 0;
    }

    DispatchOutcome outcome = engine->dispatch(input);

    std::cout << outcome.render_json() << std::endl;
    std::string text = outcome.to_text();
    if (!text.empty()) std::cerr << text;

    // Graduation never delays the decision: it runs after the result is out.
    if (outcome.phase == Phase::stop) {
        try {
            engine->run_graduation();
        } catch (const std::exception& e) {
            std::cerr << "[enforcement] Graduation failed: " << e.what() << "\n";
        }
    }
    return outcome.exit_code();
}

int cmd_fix(const CliOptions& opts, const std::string& file, bool dry_run) {
    if (!fs::is_regular_file(file)) {
        std::cerr << "No such file: " << file << "\n";
        return 1;
    }

    ValidatorSet validators = builtin_validator_set();
    Config cfg = load_cli_config(opts);
    bool effective_dry_run = dry_run || cfg.dry_run;
    Engine engine(std::move(cfg), validators);

    auto fixes = engine.fix_file(file, effective_dry_run);
    nlohmann::json out = nlohmann::json::array();
    bool failed = false;
    for (auto& f : fixes) {
        out.push_back(f.to_json());
        if (f.error) failed = true;

        if (f.verified) {
            std::cerr << "Fixed by " << f.hook_name << ": " << f.diff_summary << "\n"
                      << "Backup: " << f.backup_path << "\n";
        } else if (f.dry_run && f.diff_summary != "no changes") {
            std::cerr << "Would fix (" << f.hook_name << "): " << f.diff_summary << "\n";
        } else if (f.error) {
            std::cerr << "Fix " << f.hook_name << " failed: " << *f.error
                      << (f.rolled_back ? " (rolled back)" : "") << "\n";
        }
    }
    if (fixes.empty()) std::cerr << "No fixable hooks apply to " << file << "\n";
    std::cout << dump_json(out, 2) << std::endl;
    return failed ? 1 : 0;
}

} // namespace guardrail
