#include <iostream>
#include <string>
#include <vector>
#include "commands.hpp"

static void print_usage() {
    std::cerr << "Usage: guardrail <command> [options]\n\n"
              << "Commands:\n"
              << "  check                       Read a tool-use event from stdin and decide\n"
              << "  fix <file> [--dry-run]      Run fixable PostToolUse hooks on a file\n"
              << "  status [--history]          Show levels, hooks and recent rates\n"
              << "  set-level <category> <LEVEL> [--reason TEXT]\n"
              << "                              Override a category's enforcement level\n"
              << "  graduate                    Run one graduation cycle now\n"
              << "  maintain                    Archive old metrics, remove old backups\n\n"
              << "Options:\n"
              << "  --config PATH               Config file (default <state dir>/config.json)\n"
              << "  --state-dir DIR             State directory (default $GUARDRAIL_HOME or .guardrail)\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string cmd = argv[1];
    guardrail::CliOptions opts;
    std::vector<std::string> args;
    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if (a == "--state-dir" && i + 1 < argc) {
            opts.state_dir = argv[++i];
        } else {
            args.push_back(a);
        }
    }

    try {
        if (cmd == "check") {
            return guardrail::cmd_check(opts);
        }
        else if (cmd == "fix") {
            std::string file;
            bool dry_run = false;
            for (auto& a : args) {
                if (a == "--dry-run") dry_run = true;
                else if (file.empty()) file = a;
            }
            if (file.empty()) {
                std::cerr << "Usage: guardrail fix <file> [--dry-run]\n";
                return 1;
            }
            return guardrail::cmd_fix(opts, file, dry_run);
        }
        else if (cmd == "status") {
            bool history = false;
            for (auto& a : args) {
                if (a == "--history") history = true;
            }
            return guardrail::cmd_status(opts, history);
        }
        else if (cmd == "set-level") {
            std::vector<std::string> positional;
            std::string reason;
            for (size_t i = 0; i < args.size(); i++) {
                if (args[i] == "--reason" && i + 1 < args.size()) {
                    reason = args[++i];
                } else {
                    positional.push_back(args[i]);
                }
            }
            if (positional.size() != 2) {
                std::cerr << "Usage: guardrail set-level <category> <SILENT|WARNING|PARTIAL|FULL> [--reason TEXT]\n";
                return 1;
            }
            return guardrail::cmd_set_level(opts, positional[0], positional[1], reason);
        }
        else if (cmd == "graduate") {
            return guardrail::cmd_graduate(opts);
        }
        else if (cmd == "maintain") {
            return guardrail::cmd_maintain(opts);
        }
        else {
            std::cerr << "Unknown command: " << cmd << "\n";
            print_usage();
            return 1;
        }
    } catch (const guardrail::ConfigError& e) {
        std::cerr << "[config] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[guardrail] " << e.what() << "\n";
        return 1;
    }
}
