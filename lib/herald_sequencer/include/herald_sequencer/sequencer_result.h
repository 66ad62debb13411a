#ifndef HERALD_SEQUENCER_SEQUENCER_RESULT_H
#define HERALD_SEQUENCER_SEQUENCER_RESULT_H

#include <string>

#include <fmt/core.h>
#include <fmt/format.h>

#include <tempo_utils/status.h>

namespace herald_sequencer {

    constexpr const char *kHeraldSequencerStatusNs("dev.zuri.ns:herald-sequencer-status-1");

    enum class SequencerCondition {
        kInvalidConfiguration,
        kSequencerInvariant,
        kProcessTableFailure,
        kReadinessCheckFailed,
        kAttemptsExhausted,
        kHandoffFailed,
    };

    class SequencerStatus : public tempo_utils::TypedStatus<SequencerCondition> {
    public:
        using TypedStatus::TypedStatus;
        SequencerStatus();
        static bool convert(SequencerStatus &dstStatus, const tempo_utils::Status &srcStatus);

    private:
        SequencerStatus(tempo_utils::StatusCode statusCode, std::shared_ptr<const tempo_utils::Detail> detail);

    public:
        /**
         *
         * @param condition
         * @param message
         * @return
         */
        static SequencerStatus forCondition(
            SequencerCondition condition,
            std::string_view message)
        {
            return SequencerStatus(condition, message);
        }
        /**
         *
         * @tparam Args
         * @param condition
         * @param messageFmt
         * @param messageArgs
         * @return
         */
        template <typename... Args>
        static SequencerStatus forCondition(
            SequencerCondition condition,
            fmt::string_view messageFmt = {},
            Args... messageArgs)
        {
            auto message = fmt::vformat(messageFmt, fmt::make_format_args(messageArgs...));
            return SequencerStatus(condition, message);
        }
        /**
         *
         * @tparam Args
         * @param condition
         * @param messageFmt
         * @param messageArgs
         * @return
         */
        template <typename... Args>
        static SequencerStatus forCondition(
            SequencerCondition condition,
            tempo_utils::TraceId traceId,
            tempo_utils::SpanId spanId,
            fmt::string_view messageFmt = {},
            Args... messageArgs)
        {
            auto message = fmt::vformat(messageFmt, fmt::make_format_args(messageArgs...));
            return SequencerStatus(condition, message, traceId, spanId);
        }
    };
}

namespace tempo_utils {

    template<>
    struct StatusTraits<herald_sequencer::SequencerCondition> {
        using ConditionType = herald_sequencer::SequencerCondition;
        static bool convert(herald_sequencer::SequencerStatus &dstStatus, const tempo_utils::Status &srcStatus)
        {
            return herald_sequencer::SequencerStatus::convert(dstStatus, srcStatus);
        }
    };

    template<>
    struct ConditionTraits<herald_sequencer::SequencerCondition> {
        using StatusType = herald_sequencer::SequencerStatus;
        static constexpr const char *condition_namespace() { return herald_sequencer::kHeraldSequencerStatusNs; }
        static constexpr StatusCode make_status_code(herald_sequencer::SequencerCondition condition)
        {
            switch (condition) {
                case herald_sequencer::SequencerCondition::kInvalidConfiguration:
                    return tempo_utils::StatusCode::kInvalidArgument;
                case herald_sequencer::SequencerCondition::kSequencerInvariant:
                case herald_sequencer::SequencerCondition::kProcessTableFailure:
                    return tempo_utils::StatusCode::kInternal;
                case herald_sequencer::SequencerCondition::kReadinessCheckFailed:
                    return tempo_utils::StatusCode::kUnavailable;
                case herald_sequencer::SequencerCondition::kAttemptsExhausted:
                    return tempo_utils::StatusCode::kDeadlineExceeded;
                case herald_sequencer::SequencerCondition::kHandoffFailed:
                    return tempo_utils::StatusCode::kFailedPrecondition;
                default:
                    return tempo_utils::StatusCode::kUnknown;
            }
        };
        static constexpr const char *make_error_message(herald_sequencer::SequencerCondition condition)
        {
            switch (condition) {
                case herald_sequencer::SequencerCondition::kInvalidConfiguration:
                    return "Invalid configuration";
                case herald_sequencer::SequencerCondition::kSequencerInvariant:
                    return "Sequencer invariant";
                case herald_sequencer::SequencerCondition::kProcessTableFailure:
                    return "Process table failure";
                case herald_sequencer::SequencerCondition::kReadinessCheckFailed:
                    return "Readiness check failed";
                case herald_sequencer::SequencerCondition::kAttemptsExhausted:
                    return "Attempts exhausted";
                case herald_sequencer::SequencerCondition::kHandoffFailed:
                    return "Handoff failed";
                default:
                    return "INVALID";
            }
        }
    };
}

#endif // HERALD_SEQUENCER_SEQUENCER_RESULT_H
