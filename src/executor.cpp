#include "executor.hpp"
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>

namespace guardrail {

using Clock = std::chrono::steady_clock;

namespace {

// Shared by the caller and every worker; the last owner frees it, so a
// worker stuck in a hung validator never touches released memory.
struct RunState {
    std::mutex mu;
    std::condition_variable cv;
    ToolUseEvent event;
    std::vector<HookPtr> hooks;
    size_t next = 0;
    std::vector<std::optional<ExecutionResult>> results;
    std::vector<std::optional<Clock::time_point>> started;
    size_t done = 0;
    bool closed = false;
};

int64_t elapsed_ms(Clock::time_point from, Clock::time_point to) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count();
}

ExecutionResult base_result(const HookDefinition& h) {
    ExecutionResult r;
    r.hook_name = h.name;
    r.family = h.family;
    r.priority = h.priority;
    return r;
}

ExecutionResult run_one(const HookDefinition& h, const ToolUseEvent& ev) {
    ExecutionResult r = base_result(h);
    auto t0 = Clock::now();
    try {
        ValidatorOutcome out = h.validator->run(ev);
        r.raw_verdict = out.verdict;
        r.verdict = out.verdict;
        r.message = std::move(out.message);
        r.violations = std::move(out.violations);
        for (auto& v : r.violations) {
            if (v.hook_name.empty()) v.hook_name = h.name;
        }
    } catch (const std::exception& e) {
        r.error = e.what();
        r.message.clear();
        r.violations.clear();
    } catch (...) {
        r.error = "unknown exception";
        r.message.clear();
        r.violations.clear();
    }
    r.duration_ms = elapsed_ms(t0, Clock::now());
    return r;
}

void worker_loop(std::shared_ptr<RunState> st) {
    while (true) {
        size_t i;
        HookPtr hook;
        {
            std::lock_guard<std::mutex> lock(st->mu);
            if (st->closed || st->next >= st->hooks.size()) return;
            i = st->next++;
            st->started[i] = Clock::now();
            hook = st->hooks[i];
        }

        ExecutionResult r = run_one(*hook, st->event);

        {
            std::lock_guard<std::mutex> lock(st->mu);
            // Already finalized as timed out: the late result is discarded.
            if (st->results[i]) continue;
            st->results[i] = std::move(r);
            st->done++;
        }
        st->cv.notify_all();
    }
}

bool spawn_worker(const std::shared_ptr<RunState>& st) {
    try {
        std::thread(worker_loop, st).detach();
        return true;
    } catch (const std::system_error& e) {
        std::cerr << "[executor] Could not start worker: " << e.what() << "\n";
        return false;
    }
}

ExecutionResult timed_out_result(const HookDefinition& h, int64_t ran_ms, const std::string& why) {
    ExecutionResult r = base_result(h);
    r.timed_out = true;
    r.duration_ms = ran_ms;
    r.message = why;
    return r;
}

} // namespace

std::vector<ExecutionResult> ParallelExecutor::run(const ToolUseEvent& ev,
                                                   const std::vector<HookPtr>& hooks,
                                                   int global_deadline_ms) const {
    if (hooks.empty()) return {};

    const auto start = Clock::now();
    const auto deadline = start + std::chrono::milliseconds(global_deadline_ms > 0 ? global_deadline_ms : 0);

    auto st = std::make_shared<RunState>();
    st->event = ev;
    st->hooks = hooks;
    st->results.resize(hooks.size());
    st->started.resize(hooks.size());

    size_t pool = std::min(hooks.size(), static_cast<size_t>(max_concurrency_));
    size_t live = 0;
    for (size_t w = 0; w < pool; ++w) {
        if (spawn_worker(st)) ++live;
    }

    std::unique_lock<std::mutex> lock(st->mu);
    if (live == 0) {
        for (size_t i = 0; i < hooks.size(); ++i) {
            ExecutionResult r = base_result(*hooks[i]);
            r.error = "no worker thread available";
            st->results[i] = std::move(r);
        }
        st->closed = true;
    }

    while (!st->closed && st->done < hooks.size()) {
        auto now = Clock::now();

        if (now >= deadline) {
            for (size_t i = 0; i < hooks.size(); ++i) {
                if (st->results[i]) continue;
                int64_t ran = st->started[i] ? elapsed_ms(*st->started[i], now) : 0;
                std::string why = st->started[i]
                    ? "did not finish before the " + std::to_string(global_deadline_ms) + "ms deadline"
                    : "not started before the " + std::to_string(global_deadline_ms) + "ms deadline";
                st->results[i] = timed_out_result(*hooks[i], ran, why);
                st->done++;
                std::cerr << "[executor] Hook '" << hooks[i]->name << "' " << why << "\n";
            }
            break;
        }

        auto wake = deadline;
        size_t replacements = 0;
        for (size_t i = 0; i < hooks.size(); ++i) {
            if (st->results[i] || !st->started[i]) continue;
            auto hook_deadline = *st->started[i] + std::chrono::milliseconds(hooks[i]->timeout_ms);
            if (hook_deadline <= now) {
                std::string why = "timed out after " + std::to_string(hooks[i]->timeout_ms) + "ms";
                st->results[i] = timed_out_result(*hooks[i], elapsed_ms(*st->started[i], now), why);
                st->done++;
                replacements++;
                std::cerr << "[executor] Hook '" << hooks[i]->name << "' " << why << "\n";
            } else if (hook_deadline < wake) {
                wake = hook_deadline;
            }
        }

        // The stuck worker is abandoned; keep the queue draining without it.
        for (; replacements > 0 && st->next < hooks.size(); --replacements) {
            spawn_worker(st);
        }

        if (st->done >= hooks.size()) break;
        st->cv.wait_until(lock, wake);
    }
    st->closed = true;

    std::vector<ExecutionResult> out;
    out.reserve(hooks.size());
    for (auto& r : st->results) out.push_back(std::move(*r));
    return out;
}

} // namespace guardrail
