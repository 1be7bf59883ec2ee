#pragma once
#include "aggregator.hpp"
#include "config.hpp"
#include "enforcement.hpp"
#include "event.hpp"
#include "executor.hpp"
#include "fixer.hpp"
#include "hook_registry.hpp"
#include "metrics.hpp"
#include "types.hpp"
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace guardrail {

struct DispatchOutcome {
    Decision decision;
    std::vector<ExecutionResult> results;
    std::vector<FixResult> fixes;
    Phase phase = Phase::pre;

    int exit_code() const { return decision.verdict == Verdict::block ? 2 : 0; }
    // {verdict, messages, fixesApplied, faults} for stdout.
    nlohmann::json to_json() const;
    // to_json() serialized for stdout; never throws on invalid UTF-8.
    std::string render_json() const;
    // Human text for stderr; empty for a silent allow.
    std::string to_text() const;
};

// One engine per process invocation: the registry is built once from the
// configuration and the enforcement snapshot is read once.
class Engine {
public:
    // Throws ConfigError when the hook configuration is unusable.
    Engine(Config config, const ValidatorSet& validators);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    const Config& config() const { return config_; }
    const HookRegistry& registry() const { return registry_; }

    // Snapshot on disk, or the configured seed when there is none yet. A
    // corrupt file is logged and the seed used instead.
    EnforcementSnapshot current_snapshot() const;

    // Never throws: any failure inside the pipeline degrades to allow.
    DispatchOutcome dispatch(const std::string& raw_input);
    DispatchOutcome dispatch(const ToolUseEvent& ev);
    DispatchOutcome dispatch(const ToolUseEvent& ev, const EnforcementSnapshot& snapshot);

    // Fixable PostToolUse hooks applied to one file outside the assistant pipeline.
    std::vector<FixResult> fix_file(const std::string& path, bool dry_run);

    // One graduation cycle persisted to the snapshot file.
    GraduationReport run_graduation();

    // Manual override through transition(); throws std::invalid_argument.
    EnforcementSnapshot set_level(const std::string& category, EnforcementLevel level,
                                  const std::string& reason);

    // Waits for queued metrics to reach the log.
    bool flush_metrics(int timeout_ms = 1000);

private:
    Config config_;
    HookRegistry registry_;
    ParallelExecutor executor_;
    std::unique_ptr<MetricsRecorder> recorder_;
};

} // namespace guardrail
