#ifndef HERALD_SEQUENCER_ABSTRACT_PROCESS_TABLE_H
#define HERALD_SEQUENCER_ABSTRACT_PROCESS_TABLE_H

#include <string_view>
#include <vector>

#include <sys/types.h>

#include <tempo_utils/result.h>
#include <tempo_utils/status.h>

namespace herald_sequencer {

    /**
     * Capability over the operating system process table. Implementations list processes by
     * invocation name prefix and deliver signals to them.
     */
    class AbstractProcessTable {
    public:
        virtual ~AbstractProcessTable() = default;

        /**
         * List the pids of all processes whose invocation name starts with the specified prefix.
         *
         * @param prefix The name prefix.
         * @return The matching pids, which may be empty, or a status if the table could not be read.
         */
        virtual tempo_utils::Result<std::vector<pid_t>> listMatching(std::string_view prefix) = 0;

        /**
         * Send the specified signal to the process.
         *
         * @param pid The process id.
         * @param signal The signal number.
         * @return Ok status if the signal was delivered, otherwise notOk status.
         */
        virtual tempo_utils::Status terminate(pid_t pid, int signal) = 0;
    };
}

#endif // HERALD_SEQUENCER_ABSTRACT_PROCESS_TABLE_H
