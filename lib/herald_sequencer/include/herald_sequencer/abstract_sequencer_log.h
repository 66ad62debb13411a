#ifndef HERALD_SEQUENCER_ABSTRACT_SEQUENCER_LOG_H
#define HERALD_SEQUENCER_ABSTRACT_SEQUENCER_LOG_H

#include <string_view>

namespace herald_sequencer {

    enum class NoticeSeverity {
        kInfo,
        kWarning,
        kError,
    };

    class AbstractSequencerLog {
    public:
        virtual ~AbstractSequencerLog() = default;
        virtual void logMessage(NoticeSeverity severity, std::string_view message) = 0;
    };
}

#endif // HERALD_SEQUENCER_ABSTRACT_SEQUENCER_LOG_H
