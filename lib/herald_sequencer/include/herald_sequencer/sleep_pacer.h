#ifndef HERALD_SEQUENCER_SLEEP_PACER_H
#define HERALD_SEQUENCER_SLEEP_PACER_H

#include "abstract_pacer.h"

namespace herald_sequencer {

    /**
     * Pacer which blocks the calling thread for the full interval.
     */
    class SleepPacer : public AbstractPacer {
    public:
        SleepPacer() = default;
        void pause(absl::Duration interval) override;
    };
}

#endif // HERALD_SEQUENCER_SLEEP_PACER_H
