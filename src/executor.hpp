#pragma once
#include "event.hpp"
#include "hook_registry.hpp"
#include "types.hpp"
#include <vector>

namespace guardrail {

// Runs hooks concurrently under per-hook timeouts and one global deadline.
// A hook that overruns is reported as {allow, timed_out} and its worker is
// abandoned, never joined: the call returns by the deadline regardless.
class ParallelExecutor {
public:
    explicit ParallelExecutor(int max_concurrency = 8)
        : max_concurrency_(max_concurrency > 0 ? max_concurrency : 1) {}

    // One result per hook, in the order given. Verdicts are as reported by
    // the validators; enforcement levels are applied by the caller.
    std::vector<ExecutionResult> run(const ToolUseEvent& ev,
                                     const std::vector<HookPtr>& hooks,
                                     int global_deadline_ms) const;

private:
    int max_concurrency_;
};

} // namespace guardrail
