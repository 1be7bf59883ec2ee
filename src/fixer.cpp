#include "fixer.hpp"
#include "file_lock.hpp"
#include "utils.hpp"
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <system_error>
#include <thread>
#include <vector>

namespace guardrail {

static bool is_brace_language(const std::string& ext) {
    static const std::set<std::string> exts = {
        ".c", ".cc", ".cpp", ".cxx", ".h", ".hh", ".hpp", ".hxx",
        ".java", ".cs", ".go", ".kt", ".swift",
        ".js", ".jsx", ".ts", ".tsx", ".mjs", ".cjs",
    };
    return exts.count(ext) > 0;
}

static std::optional<std::string> check_balance(const std::string& s) {
    std::vector<char> stack;
    size_t line = 1;
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '\n') { ++line; continue; }

        if (c == '/' && i + 1 < s.size() && s[i + 1] == '/') {
            while (i < s.size() && s[i] != '\n') ++i;
            ++line;
            continue;
        }
        if (c == '/' && i + 1 < s.size() && s[i + 1] == '*') {
            size_t end = s.find("*/", i + 2);
            if (end == std::string::npos) return "unterminated block comment at line " + std::to_string(line);
            for (size_t k = i; k < end; ++k) if (s[k] == '\n') ++line;
            i = end + 1;
            continue;
        }
        if (c == '"' || c == '\'' || c == '`') {
            size_t start_line = line;
            size_t k = i + 1;
            for (; k < s.size() && s[k] != c; ++k) {
                if (s[k] == '\\') { ++k; continue; }
                if (s[k] == '\n') {
                    if (c != '`') return "unterminated string at line " + std::to_string(start_line);
                    ++line;
                }
            }
            if (k >= s.size()) return "unterminated string at line " + std::to_string(start_line);
            i = k;
            continue;
        }
        if (c == '(' || c == '[' || c == '{') {
            stack.push_back(c);
        } else if (c == ')' || c == ']' || c == '}') {
            char open = c == ')' ? '(' : (c == ']' ? '[' : '{');
            if (stack.empty() || stack.back() != open) {
                return std::string("unbalanced '") + c + "' at line " + std::to_string(line);
            }
            stack.pop_back();
        }
    }
    if (!stack.empty()) return std::string("unclosed '") + stack.back() + "'";
    return std::nullopt;
}

std::optional<std::string> verify_content(const std::string& file_path, const std::string& content) {
    std::string ext = to_lower(fs::path(file_path).extension().string());
    if (ext == ".json") {
        try {
            (void)nlohmann::json::parse(content);
        } catch (const std::exception& e) {
            return std::string("invalid JSON: ") + e.what();
        }
        return std::nullopt;
    }
    if (is_brace_language(ext)) return check_balance(content);
    return std::nullopt;
}

static std::string clip(const std::string& s, size_t n = 80) {
    return s.size() > n ? utf8_prefix(s, n) + "..." : s;
}

std::string diff_summary(const std::string& before, const std::string& after) {
    if (before == after) return "no changes";
    auto a = split_lines(before);
    auto b = split_lines(after);

    size_t common = std::min(a.size(), b.size());
    size_t changed = 0;
    size_t first = std::string::npos;
    for (size_t i = 0; i < common; ++i) {
        if (a[i] != b[i]) {
            ++changed;
            if (first == std::string::npos) first = i;
        }
    }
    changed += std::max(a.size(), b.size()) - common;
    if (first == std::string::npos) first = common;

    std::string out = std::to_string(changed) + " line(s) changed (" + std::to_string(a.size()) +
                      " -> " + std::to_string(b.size()) + " lines)";
    out += "; first at line " + std::to_string(first + 1);
    if (first < a.size()) out += ": - " + clip(a[first]);
    if (first < b.size()) out += " + " + clip(b[first]);
    return out;
}

AutoFixer::AutoFixer(std::string backup_dir, bool dry_run)
    : backup_dir_(std::move(backup_dir)), dry_run_(dry_run) {}

std::string AutoFixer::read_back(const std::string& path) const {
    return read_file(path);
}

std::string AutoFixer::next_backup_path(const std::string& file_name) const {
    std::string stem = (fs::path(backup_dir_) / file_name).string() + "." + file_stamp(epoch_ms_now());
    for (int n = 0;; ++n) {
        std::string candidate = stem + "." + std::to_string(n) + ".bak";
        std::error_code ec;
        if (!fs::exists(candidate, ec)) return candidate;
    }
}

bool AutoFixer::restore_backup(const std::string& backup_path, const std::string& target) {
    std::error_code ec;
    if (!fs::exists(backup_path, ec)) {
        std::cerr << "[fixer] Backup not found: " << backup_path << "\n";
        return false;
    }
    std::string bytes = read_file(backup_path);
    if (!write_file_atomic(target, bytes)) {
        std::cerr << "[fixer] Failed to restore " << target << " from " << backup_path << "\n";
        return false;
    }
    return read_file(target) == bytes;
}

namespace {

using Clock = std::chrono::steady_clock;

// Shared with the fix worker, which may outlive the call that started it.
struct FixTask {
    std::mutex mu;
    std::condition_variable cv;
    bool done = false;
    std::optional<std::string> content;
    std::optional<std::string> error;
};

struct Transform {
    bool finished = false;
    std::optional<std::string> content;
    std::optional<std::string> error;
};

// Runs the validator's fix on a detached worker and waits for it until
// `until`. An unfinished worker is abandoned; its result is never used.
Transform compute_fix(const ValidatorPtr& validator, const ToolUseEvent& ev,
                      const std::string& original, Clock::time_point until) {
    Transform t;
    auto task = std::make_shared<FixTask>();
    try {
        std::thread([task, validator, ev, original]() {
            std::optional<std::string> content;
            std::optional<std::string> error;
            try {
                content = validator->fix(ev, original);
            } catch (const std::exception& e) {
                error = std::string("fix failed: ") + e.what();
            } catch (...) {
                error = "fix failed: unknown exception";
            }
            {
                std::lock_guard<std::mutex> lock(task->mu);
                task->content = std::move(content);
                task->error = std::move(error);
                task->done = true;
            }
            task->cv.notify_all();
        }).detach();
    } catch (const std::system_error& e) {
        t.finished = true;
        t.error = std::string("could not start fix worker: ") + e.what();
        return t;
    }

    std::unique_lock<std::mutex> lock(task->mu);
    t.finished = task->cv.wait_until(lock, until, [&] { return task->done; });
    if (t.finished) {
        t.content = std::move(task->content);
        t.error = std::move(task->error);
    }
    return t;
}

} // namespace

FixResult AutoFixer::fix_one(const ToolUseEvent& ev, const HookDefinition& hook, Deadline deadline) const {
    FixResult r;
    r.file_path = ev.file_path;
    r.hook_name = hook.name;
    r.dry_run = dry_run_;

    if (!ev.has_file()) {
        r.error = "event names no file";
        return r;
    }
    const std::string& path = ev.file_path;
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        r.error = ec ? "cannot inspect target: " + ec.message() : "target is not a regular file";
        return r;
    }

    // The transform runs before the lock is taken, so a fix that overruns
    // its budget writes nothing.
    const auto now = Clock::now();
    auto until = now + std::chrono::milliseconds(hook.timeout_ms > 0 ? hook.timeout_ms : 0);
    if (deadline && *deadline < until) until = *deadline;

    std::string original = read_file(path);
    Transform t = compute_fix(hook.validator, ev, original, until);
    if (!t.finished) {
        auto budget = std::chrono::duration_cast<std::chrono::milliseconds>(until - now).count();
        r.error = "skipped: fix did not finish within " + std::to_string(budget) + "ms";
        return r;
    }
    if (t.error) {
        r.error = t.error;
        return r;
    }
    if (!t.content || *t.content == original) {
        r.diff_summary = "no changes";
        return r;
    }
    const std::string& transformed = *t.content;
    r.diff_summary = diff_summary(original, transformed);
    if (dry_run_) return r;

    // Only problems the fix introduces count; a file that already fails the
    // structural check (JSX text, regex literals) is not held against it.
    const bool original_passes = !verify_content(path, original);
    if (original_passes) {
        if (auto problem = verify_content(path, transformed)) {
            r.error = "fixed content failed verification: " + *problem;
            return r;
        }
    }

    fs::create_directories(backup_dir_, ec);
    if (ec) {
        r.error = "cannot create backup directory " + backup_dir_ + ": " + ec.message();
        return r;
    }

    // Lock lives in the backup directory so the project tree stays clean.
    FileLock lock((fs::path(backup_dir_) / (ev.file_name() + ".fix")).string());
    if (!lock.locked()) {
        r.error = "could not lock " + path;
        return r;
    }
    if (read_file(path) != original) {
        r.error = "file changed while the fix was computed";
        return r;
    }

    std::string tmp = path + ".guardrail.tmp";
    if (!write_file(tmp, transformed)) {
        fs::remove(tmp, ec);
        r.error = "cannot write " + tmp;
        return r;
    }

    std::string backup = next_backup_path(ev.file_name());
    fs::copy_file(path, backup, ec);
    if (ec) {
        fs::remove(tmp, ec);
        r.error = "cannot back up to " + backup;
        return r;
    }
    r.backup_path = backup;

    fs::rename(tmp, path, ec);
    if (ec) {
        std::string why = ec.message();
        fs::remove(tmp, ec);
        r.error = "cannot replace " + path + ": " + why;
        return r;
    }
    r.applied = true;

    std::string committed = read_back(path);
    std::optional<std::string> problem;
    if (committed != transformed) problem = "content on disk differs from the fix";
    else if (original_passes) problem = verify_content(path, committed);

    if (problem) {
        r.applied = false;
        r.rolled_back = restore_backup(backup, path);
        r.error = "post-commit verification failed: " + *problem;
        std::cerr << "[fixer] " << hook.name << " on " << path << ": " << *r.error
                  << (r.rolled_back ? " (rolled back)" : " (ROLLBACK FAILED, backup at " + backup + ")")
                  << "\n";
        return r;
    }
    r.verified = true;
    return r;
}

std::vector<FixResult> AutoFixer::fix(const ToolUseEvent& ev, const std::vector<HookPtr>& hooks,
                                      Deadline deadline) const {
    std::vector<FixResult> out;
    for (auto& h : hooks) {
        if (!h->fixable) continue;
        FixResult r;
        r.file_path = ev.file_path;
        r.hook_name = h->name;
        r.dry_run = dry_run_;
        if (deadline && Clock::now() >= *deadline) {
            r.error = "skipped: deadline reached";
            out.push_back(std::move(r));
            continue;
        }
        try {
            r = fix_one(ev, *h, deadline);
        } catch (const std::exception& e) {
            r.error = std::string("fix failed: ") + e.what();
        }
        if (r.error) std::cerr << "[fixer] " << h->name << ": " << *r.error << "\n";
        out.push_back(std::move(r));
    }
    return out;
}

size_t AutoFixer::remove_expired_backups(int retention_days) const {
    std::error_code ec;
    if (!fs::is_directory(backup_dir_, ec)) return 0;

    auto cutoff = fs::file_time_type::clock::now() - std::chrono::hours(24 * retention_days);
    size_t removed = 0;
    for (auto& entry : fs::directory_iterator(backup_dir_, ec)) {
        if (!entry.is_regular_file(ec)) continue;
        if (entry.path().extension() != ".bak") continue;
        auto mtime = fs::last_write_time(entry.path(), ec);
        if (ec || mtime >= cutoff) continue;
        if (fs::remove(entry.path(), ec)) ++removed;
        else std::cerr << "[fixer] Could not remove " << entry.path().string() << "\n";
    }
    return removed;
}

} // namespace guardrail
