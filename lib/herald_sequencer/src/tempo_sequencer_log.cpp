
#include <herald_sequencer/tempo_sequencer_log.h>
#include <tempo_utils/log_stream.h>

void
herald_sequencer::TempoSequencerLog::logMessage(NoticeSeverity severity, std::string_view message)
{
    switch (severity) {
        case NoticeSeverity::kInfo:
            TU_LOG_INFO << message;
            break;
        case NoticeSeverity::kWarning:
            TU_LOG_WARN << message;
            break;
        case NoticeSeverity::kError:
            TU_LOG_ERROR << message;
            break;
        default:
            TU_UNREACHABLE();
    }
}
