
#include <absl/strings/str_cat.h>

#include <herald_sequencer/readiness_wait.h>
#include <herald_sequencer/sequencer_result.h>
#include <tempo_utils/log_stream.h>

/**
 * Probe the readiness check until it reports ready. Every failed attempt logs the waiting
 * message and pauses for the policy interval before the next attempt. A probe which cannot
 * be performed counts as a failed attempt. When the policy is unbounded this function only
 * returns once the check succeeds.
 *
 * @param check The readiness check.
 * @param policy The retry policy.
 * @param pacer The pacer used to wait between attempts.
 * @param log The sequencer log.
 * @param messages The waiting and ready messages.
 * @return Ok status once the check reports ready, or kAttemptsExhausted if the policy is
 *     bounded and every attempt failed.
 */
tempo_utils::Status
herald_sequencer::wait_until_ready(
    AbstractReadinessCheck &check,
    const RetryPolicy &policy,
    AbstractPacer &pacer,
    AbstractSequencerLog &log,
    const WaitMessages &messages)
{
    TU_LOG_V << "waiting for readiness check " << check.describe();

    for (int attempt = 1;; attempt++) {
        auto checkReadyResult = check.checkReady();
        if (checkReadyResult.isResult() && checkReadyResult.getResult()) {
            log.logMessage(NoticeSeverity::kInfo, messages.ready);
            TU_LOG_V << "readiness check succeeded after " << attempt << " attempts";
            return {};
        }

        if (checkReadyResult.isStatus()) {
            log.logMessage(NoticeSeverity::kWarning, absl::StrCat(
                "readiness check failed: ", checkReadyResult.getStatus().toString()));
        }
        log.logMessage(NoticeSeverity::kInfo, messages.waiting);

        if (!policy.isUnbounded() && attempt >= policy.maxAttempts)
            return SequencerStatus::forCondition(SequencerCondition::kAttemptsExhausted,
                "dependency was not ready after {} attempts", attempt);

        pacer.pause(policy.interval);
    }
}
