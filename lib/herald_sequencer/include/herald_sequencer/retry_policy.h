#ifndef HERALD_SEQUENCER_RETRY_POLICY_H
#define HERALD_SEQUENCER_RETRY_POLICY_H

#include <absl/time/time.h>

namespace herald_sequencer {

    constexpr int kUnboundedAttempts = -1;

    struct RetryPolicy {
        absl::Duration interval = absl::Seconds(1);
        int maxAttempts = kUnboundedAttempts;

        bool isUnbounded() const { return maxAttempts <= 0; }
    };
}

#endif // HERALD_SEQUENCER_RETRY_POLICY_H
