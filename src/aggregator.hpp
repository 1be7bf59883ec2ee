#pragma once
#include "types.hpp"
#include <vector>

namespace guardrail {

struct MessageLimits {
    int max_messages = 10;
    int max_chars = 4000;
};

// Folds hook results into one Decision. Pure: the same set of results in
// any order yields the same Decision. Faulted results never affect the
// verdict; they are listed in Decision::faults.
Decision aggregate(const std::vector<ExecutionResult>& results, const MessageLimits& limits = {});

} // namespace guardrail
