#ifndef HERALD_SEQUENCER_READINESS_WAIT_H
#define HERALD_SEQUENCER_READINESS_WAIT_H

#include <string>

#include <tempo_utils/status.h>

#include "abstract_pacer.h"
#include "abstract_readiness_check.h"
#include "abstract_sequencer_log.h"
#include "retry_policy.h"

namespace herald_sequencer {

    constexpr const char *kDefaultWaitingMessage = "Waiting...";
    constexpr const char *kDefaultReadyMessage = "Server has started!";

    struct WaitMessages {
        std::string waiting = kDefaultWaitingMessage;
        std::string ready = kDefaultReadyMessage;
    };

    tempo_utils::Status wait_until_ready(
        AbstractReadinessCheck &check,
        const RetryPolicy &policy,
        AbstractPacer &pacer,
        AbstractSequencerLog &log,
        const WaitMessages &messages = {});
}

#endif // HERALD_SEQUENCER_READINESS_WAIT_H
