#include "commands.hpp"
#include "fixer.hpp"
#include "metrics.hpp"
#include "metrics_archive.hpp"
#include <iostream>

namespace guardrail {

int cmd_maintain(const CliOptions& opts) {
    Config cfg = load_cli_config(opts);
    int rc = 0;

    MetricsLog log(cfg.metrics_path());
    auto expired = log.prune(cfg.metrics.retention_days, epoch_ms_now());
    if (!expired.empty()) {
        try {
            MetricsArchive archive(cfg.archive_db_path());
            size_t rows = archive.archive(expired);
            std::cout << "Archived " << expired.size() << " metrics record(s) into " << rows
                      << " daily rollup(s)\n";
        } catch (const std::exception& e) {
            // Put the records back rather than lose them.
            std::cerr << "[archive] " << e.what() << "\n";
            if (!log.append(expired)) {
                std::cerr << "[archive] Could not restore " << expired.size()
                          << " pruned record(s) to " << log.path() << "\n";
            }
            rc = 1;
        }
    } else {
        std::cout << "No metrics older than " << cfg.metrics.retention_days << " day(s)\n";
    }

    AutoFixer fixer(cfg.backup_dir(), false);
    size_t removed = fixer.remove_expired_backups(cfg.backup.retention_days);
    std::cout << "Removed " << removed << " backup(s) older than " << cfg.backup.retention_days << " day(s)\n";
    return rc;
}

} // namespace guardrail
