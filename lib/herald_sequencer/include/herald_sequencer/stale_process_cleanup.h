#ifndef HERALD_SEQUENCER_STALE_PROCESS_CLEANUP_H
#define HERALD_SEQUENCER_STALE_PROCESS_CLEANUP_H

#include <string>
#include <vector>

#include "abstract_process_table.h"
#include "abstract_sequencer_log.h"

namespace herald_sequencer {

    constexpr const char *kTranscoderWorkerPrefix = "ffmpeg_";
    constexpr const char *kPipelineWorkerPrefix = "gstreamer_";

    struct CleanupSummary {
        int matched = 0;
        int terminated = 0;
        int failed = 0;
    };

    CleanupSummary cleanup_stale_processes(
        AbstractProcessTable &processTable,
        const std::vector<std::string> &prefixes,
        int signal,
        AbstractSequencerLog &log);
}

#endif // HERALD_SEQUENCER_STALE_PROCESS_CLEANUP_H
