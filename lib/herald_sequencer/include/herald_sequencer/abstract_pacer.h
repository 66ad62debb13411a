#ifndef HERALD_SEQUENCER_ABSTRACT_PACER_H
#define HERALD_SEQUENCER_ABSTRACT_PACER_H

#include <absl/time/time.h>

namespace herald_sequencer {

    class AbstractPacer {
    public:
        virtual ~AbstractPacer() = default;

        /**
         * Block the calling thread for the specified interval.
         *
         * @param interval The interval to wait, a zero or negative interval returns immediately.
         */
        virtual void pause(absl::Duration interval) = 0;
    };
}

#endif // HERALD_SEQUENCER_ABSTRACT_PACER_H
