#include <absl/time/clock.h>

#include <herald_sequencer/sleep_pacer.h>
#include <tempo_utils/log_stream.h>

void
herald_sequencer::SleepPacer::pause(absl::Duration interval)
{
    if (interval <= absl::ZeroDuration())
        return;
    TU_LOG_VV << "pausing for " << absl::FormatDuration(interval);
    absl::SleepFor(interval);
}
