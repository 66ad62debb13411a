#ifndef HERALD_SEQUENCER_ABSTRACT_READINESS_CHECK_H
#define HERALD_SEQUENCER_ABSTRACT_READINESS_CHECK_H

#include <string>

#include <tempo_utils/result.h>

namespace herald_sequencer {

    class AbstractReadinessCheck {
    public:
        virtual ~AbstractReadinessCheck() = default;

        /**
         * Perform a single readiness probe.
         *
         * @return true if the dependency is ready, false if it is not, or a status if the probe
         *     itself could not be performed.
         */
        virtual tempo_utils::Result<bool> checkReady() = 0;

        virtual std::string describe() const = 0;
    };
}

#endif // HERALD_SEQUENCER_ABSTRACT_READINESS_CHECK_H
