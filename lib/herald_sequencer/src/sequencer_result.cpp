
#include <herald_sequencer/sequencer_result.h>

herald_sequencer::SequencerStatus::SequencerStatus()
    : tempo_utils::TypedStatus<SequencerCondition>(tempo_utils::StatusCode::kOk, {})
{
}

herald_sequencer::SequencerStatus::SequencerStatus(
    tempo_utils::StatusCode statusCode,
    std::shared_ptr<const tempo_utils::Detail> detail)
    : tempo_utils::TypedStatus<SequencerCondition>(statusCode, detail)
{
}

bool
herald_sequencer::SequencerStatus::convert(SequencerStatus &dstStatus, const tempo_utils::Status &srcStatus)
{
    std::string_view srcNs = srcStatus.getErrorCategory();
    std::string_view dstNs = kHeraldSequencerStatusNs;
    if (srcNs != dstNs)
        return false;
    dstStatus = SequencerStatus(srcStatus.getStatusCode(), srcStatus.getDetail());
    return true;
}
