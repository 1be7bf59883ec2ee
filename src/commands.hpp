#pragma once
#include "config.hpp"
#include "validator.hpp"
#include <string>
#include <vector>

namespace guardrail {

struct CliOptions {
    std::string config_path;   // --config, default <state dir>/config.json
    std::string state_dir;     // --state-dir, default GUARDRAIL_HOME or .guardrail
};

// Throws ConfigError.
Config load_cli_config(const CliOptions& opts);
ValidatorSet builtin_validator_set();

int cmd_check(const CliOptions& opts);
int cmd_fix(const CliOptions& opts, const std::string& file, bool dry_run);
int cmd_status(const CliOptions& opts, bool history);
int cmd_set_level(const CliOptions& opts, const std::string& category,
                  const std::string& level, const std::string& reason);
int cmd_graduate(const CliOptions& opts);
int cmd_maintain(const CliOptions& opts);

} // namespace guardrail
