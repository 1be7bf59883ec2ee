#pragma once
#include "event.hpp"
#include "hook_registry.hpp"
#include "types.hpp"
#include <string>
#include <vector>
#include <optional>
#include <chrono>

namespace guardrail {

// Structural check of content about to be written to file_path: JSON must
// parse, C-family and JS/TS sources must balance brackets and quotes.
// Returns the problem, or nullopt when the content passes (or the type has
// no check).
std::optional<std::string> verify_content(const std::string& file_path, const std::string& content);

// Short human-readable summary of a line-level change.
std::string diff_summary(const std::string& before, const std::string& after);

// Applies fixable hooks to the file an event names. Each fix is computed
// first, then committed under an exclusive lock: backup, write temp,
// verify, rename, re-read. Any failure
// after the rename restores the backup byte for byte. Errors are reported
// in FixResult, never thrown.
class AutoFixer {
public:
    using Deadline = std::optional<std::chrono::steady_clock::time_point>;

    AutoFixer(std::string backup_dir, bool dry_run);
    virtual ~AutoFixer() = default;

    // Runs every fixable hook in order; hooks left when the deadline
    // passes are reported as skipped.
    std::vector<FixResult> fix(const ToolUseEvent& ev, const std::vector<HookPtr>& hooks,
                               Deadline deadline = std::nullopt) const;

    // The validator's transform gets min(hook timeout, deadline); when it
    // overruns the hook is reported as skipped and nothing is written.
    FixResult fix_one(const ToolUseEvent& ev, const HookDefinition& hook,
                      Deadline deadline = std::nullopt) const;

    // Copies backup over target atomically and checks the bytes match.
    static bool restore_backup(const std::string& backup_path, const std::string& target);

    // Deletes *.bak files in the backup directory older than retention_days.
    size_t remove_expired_backups(int retention_days) const;

    const std::string& backup_dir() const { return backup_dir_; }
    bool dry_run() const { return dry_run_; }

protected:
    // Reads the committed file back for verification.
    virtual std::string read_back(const std::string& path) const;

private:
    std::string backup_dir_;
    bool dry_run_;

    std::string next_backup_path(const std::string& file_name) const;
};

} // namespace guardrail
