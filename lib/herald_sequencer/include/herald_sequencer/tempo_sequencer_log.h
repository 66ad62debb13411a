#ifndef HERALD_SEQUENCER_TEMPO_SEQUENCER_LOG_H
#define HERALD_SEQUENCER_TEMPO_SEQUENCER_LOG_H

#include "abstract_sequencer_log.h"

namespace herald_sequencer {

    /**
     * Forwards sequencer notices to the process-wide tempo_utils logger.
     */
    class TempoSequencerLog : public AbstractSequencerLog {
    public:
        TempoSequencerLog() = default;
        void logMessage(NoticeSeverity severity, std::string_view message) override;
    };
}

#endif // HERALD_SEQUENCER_TEMPO_SEQUENCER_LOG_H
