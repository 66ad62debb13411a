#ifndef HERALD_SEQUENCER_STARTUP_SEQUENCER_H
#define HERALD_SEQUENCER_STARTUP_SEQUENCER_H

#include <memory>

#include <tempo_utils/status.h>

#include "abstract_pacer.h"
#include "abstract_process_handoff.h"
#include "abstract_process_table.h"
#include "abstract_readiness_check.h"
#include "abstract_sequencer_log.h"
#include "readiness_wait.h"
#include "retry_policy.h"
#include "sequencer_config.h"
#include "stale_process_cleanup.h"

namespace herald_sequencer {

    enum class SequencerState {
        Waiting,
        Running,
    };

    struct SequencerCollaborators {
        std::shared_ptr<AbstractProcessTable> processTable;
        std::shared_ptr<AbstractReadinessCheck> readinessCheck;
        std::shared_ptr<AbstractPacer> pacer;
        std::shared_ptr<AbstractSequencerLog> log;
        std::shared_ptr<AbstractProcessHandoff> handoff;
    };

    /**
     * Runs the container startup sequence: terminate stale workers, wait for the database
     * to become ready, then replace the calling process with the application.
     */
    class StartupSequencer {
    public:
        StartupSequencer(const SequencerConfig &sequencerConfig, const SequencerCollaborators &collaborators);

        tempo_utils::Status initialize();

        SequencerState getState() const;
        RetryPolicy getRetryPolicy() const;
        HandoffRequest getHandoffRequest() const;

        CleanupSummary cleanupStaleProcesses();
        tempo_utils::Status waitUntilReady();
        tempo_utils::Status handoff();

        tempo_utils::Status run();

    private:
        const SequencerConfig &m_config;
        SequencerCollaborators m_collaborators;
        WaitMessages m_messages;
        SequencerState m_state;
        bool m_initialized;
        bool m_started;
    };

    HandoffRequest make_handoff_request(const SequencerConfig &sequencerConfig);
}

#endif // HERALD_SEQUENCER_STARTUP_SEQUENCER_H
