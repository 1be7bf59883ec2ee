#include "dispatcher.hpp"
#include "file_lock.hpp"
#include "utils.hpp"
#include <chrono>
#include <iostream>

namespace guardrail {

// ── DispatchOutcome ────────────────────────────────────────────────

nlohmann::json DispatchOutcome::to_json() const {
    nlohmann::json fixes_json = nlohmann::json::array();
    for (auto& f : fixes) fixes_json.push_back(f.to_json());
    return {
        {"verdict", to_string(decision.verdict)},
        {"messages", decision.messages},
        {"fixesApplied", fixes_json},
        {"faults", decision.faults},
    };
}

std::string DispatchOutcome::render_json() const {
    return dump_json(to_json());
}

std::string DispatchOutcome::to_text() const {
    std::string out;
    if (decision.verdict == Verdict::block) {
        out += "guardrail: operation blocked\n";
    } else if (decision.verdict == Verdict::warn) {
        out += "guardrail: warning\n";
    }
    for (auto& m : decision.messages) out += "  - " + m + "\n";
    if (decision.verdict == Verdict::block) {
        out += "Resolve the issue above and retry. To relax a rule category while it beds in, run:\n"
               "  guardrail set-level <category> WARNING --reason \"...\"\n";
    }
    for (auto& f : fixes) {
        if (f.verified) {
            out += "guardrail: fixed " + f.file_path + " (" + f.hook_name + "), backup " + f.backup_path + "\n";
        } else if (f.dry_run && f.diff_summary != "no changes") {
            out += "guardrail: would fix " + f.file_path + " (" + f.hook_name + "): " + f.diff_summary + "\n";
        } else if (f.error) {
            out += "guardrail: fix " + f.hook_name + " not applied: " + *f.error + "\n";
        }
    }
    if (!decision.faults.empty() && !out.empty()) {
        out += "  (" + std::to_string(decision.faults.size()) + " hook(s) faulted or timed out and were ignored)\n";
    }
    return out;
}

// ── Engine ─────────────────────────────────────────────────────────

static void ensure_parent(const std::string& path) {
    auto parent = fs::path(path).parent_path();
    if (parent.empty()) return;
    std::error_code ec;
    fs::create_directories(parent, ec);
}

Engine::Engine(Config config, const ValidatorSet& validators)
    : config_(std::move(config)),
      registry_(HookRegistry::from_config(config_, validators)),
      executor_(config_.max_concurrency) {
    if (config_.metrics.enabled) {
        recorder_ = std::make_unique<MetricsRecorder>(config_.metrics_path(), config_.metrics.queue_capacity);
    }
}

Engine::~Engine() = default;

EnforcementSnapshot Engine::current_snapshot() const {
    try {
        if (auto snap = load_snapshot(config_.snapshot_path())) return *snap;
    } catch (const std::exception& e) {
        std::cerr << "[enforcement] " << e.what() << "; using configured levels\n";
    }
    return config_.initial_snapshot();
}

DispatchOutcome Engine::dispatch(const std::string& raw_input) {
    auto ev = parse_event(raw_input, epoch_ms_now());
    if (!ev) return DispatchOutcome{};
    return dispatch(*ev);
}

DispatchOutcome Engine::dispatch(const ToolUseEvent& ev) {
    EnforcementSnapshot snap;
    try {
        snap = current_snapshot();
    } catch (const std::exception& e) {
        std::cerr << "[dispatch] Cannot build enforcement snapshot: " << e.what() << "; allowing\n";
        DispatchOutcome out;
        out.phase = ev.phase;
        return out;
    }
    return dispatch(ev, snap);
}

DispatchOutcome Engine::dispatch(const ToolUseEvent& ev, const EnforcementSnapshot& snapshot) {
    const auto start = std::chrono::steady_clock::now();
    DispatchOutcome out;
    out.phase = ev.phase;

    try {
        auto hooks = registry_.select(ev, snapshot);
        out.results = executor_.run(ev, hooks, config_.global_deadline_ms);

        for (auto& r : out.results) {
            if (r.faulted()) continue;
            r.verdict = apply_level(snapshot.level_for(r.family), r.priority, r.raw_verdict);
        }

        MessageLimits limits{config_.message_limit, config_.message_char_limit};
        out.decision = aggregate(out.results, limits);

        if (recorder_) {
            for (auto& r : out.results) recorder_->record(r, ev.session_id);
        }

        if (ev.phase == Phase::post && config_.auto_fix && out.decision.verdict != Verdict::block) {
            AutoFixer::Deadline deadline;
            if (config_.deadline_scope == "invocation") {
                deadline = start + std::chrono::milliseconds(config_.global_deadline_ms);
            } else {
                deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.global_deadline_ms);
            }
            // The decision is final here; a fixer failure only loses the fixes.
            try {
                AutoFixer fixer(config_.backup_dir(), config_.dry_run);
                out.fixes = fixer.fix(ev, hooks, deadline);
            } catch (const std::exception& e) {
                std::cerr << "[fixer] Auto-fix aborted: " << e.what() << "\n";
                out.fixes.clear();
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[dispatch] Unexpected failure, allowing: " << e.what() << "\n";
        out.decision = Decision{};
        out.fixes.clear();
    }
    return out;
}

std::vector<FixResult> Engine::fix_file(const std::string& path, bool dry_run) {
    ToolUseEvent ev;
    ev.phase = Phase::post;
    ev.tool_name = "Write";
    ev.file_path = path;
    ev.content = read_file(path);
    ev.timestamp_ms = epoch_ms_now();

    auto hooks = registry_.select(ev, current_snapshot());
    AutoFixer fixer(config_.backup_dir(), dry_run);
    return fixer.fix(ev, hooks);
}

bool Engine::flush_metrics(int timeout_ms) {
    return recorder_ ? recorder_->flush(timeout_ms) : true;
}

GraduationReport Engine::run_graduation() {
    flush_metrics();

    std::string path = config_.snapshot_path();
    ensure_parent(path);
    // Serializes read-modify-write across concurrent invocations.
    FileLock writer(path + ".writer");
    if (!writer.locked()) throw std::runtime_error("could not lock " + path + " for graduation");

    EnforcementSnapshot snap = current_snapshot();
    MetricsLog log(config_.metrics_path());
    GraduationReport report = graduate(snap, log, config_.graduation, epoch_ms_now());

    for (auto& t : report.transitions) {
        std::cerr << "[enforcement] " << t.category << ": " << to_string(t.from) << " -> "
                  << to_string(t.to) << " (" << t.reason << ")\n";
    }
    if (!report.transitions.empty() && !save_snapshot(path, report.snapshot)) {
        throw std::runtime_error("failed to save " + path);
    }
    return report;
}

EnforcementSnapshot Engine::set_level(const std::string& category, EnforcementLevel level,
                                      const std::string& reason) {
    std::string path = config_.snapshot_path();
    ensure_parent(path);
    FileLock writer(path + ".writer");
    if (!writer.locked()) throw std::runtime_error("could not lock " + path);

    EnforcementSnapshot next = transition(current_snapshot(), category, level,
                                          reason.empty() ? "manual override" : reason,
                                          true, epoch_ms_now());
    if (!save_snapshot(path, next)) throw std::runtime_error("failed to save " + path);
    return next;
}

} // namespace guardrail
