
#include <absl/strings/str_cat.h>

#include <herald_sequencer/stale_process_cleanup.h>
#include <tempo_utils/log_stream.h>

/**
 * Send the termination signal to every process whose invocation name starts with one of the
 * specified prefixes. Cleanup is best effort: failures to list or signal processes are logged
 * and counted, but never returned to the caller.
 *
 * @param processTable The process table capability.
 * @param prefixes The process name prefixes to match.
 * @param signal The signal to deliver.
 * @param log The sequencer log.
 * @return Counts of matched, terminated and failed processes.
 */
herald_sequencer::CleanupSummary
herald_sequencer::cleanup_stale_processes(
    AbstractProcessTable &processTable,
    const std::vector<std::string> &prefixes,
    int signal,
    AbstractSequencerLog &log)
{
    CleanupSummary summary;

    for (const auto &prefix : prefixes) {
        auto listMatchingResult = processTable.listMatching(prefix);
        if (listMatchingResult.isStatus()) {
            log.logMessage(NoticeSeverity::kWarning, absl::StrCat(
                "failed to list processes matching ", prefix, ": ",
                listMatchingResult.getStatus().toString()));
            summary.failed++;
            continue;
        }

        auto pids = listMatchingResult.getResult();
        summary.matched += pids.size();

        for (auto pid : pids) {
            auto status = processTable.terminate(pid, signal);
            if (status.notOk()) {
                // the process may have exited on its own since it was listed
                log.logMessage(NoticeSeverity::kWarning, absl::StrCat(
                    "failed to terminate stale process ", pid, ": ", status.toString()));
                summary.failed++;
                continue;
            }
            TU_LOG_V << "sent signal " << signal << " to stale process " << pid << " matching " << prefix;
            summary.terminated++;
        }
    }

    if (summary.terminated > 0) {
        TU_LOG_V << "terminated " << summary.terminated << " stale processes";
    }

    return summary;
}
