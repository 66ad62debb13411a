#ifndef HERALD_SEQUENCER_ABSTRACT_PROCESS_HANDOFF_H
#define HERALD_SEQUENCER_ABSTRACT_PROCESS_HANDOFF_H

#include <filesystem>
#include <string>
#include <vector>

#include <tempo_utils/status.h>

#include "environment_directory.h"

namespace herald_sequencer {

    struct HandoffRequest {
        std::string user;
        std::string displayName;
        std::vector<std::string> command;
        std::filesystem::path workingDirectory;
        std::filesystem::path environmentDirectory;
        EnvironmentMode environmentMode = EnvironmentMode::Verbatim;
    };

    class AbstractProcessHandoff {
    public:
        virtual ~AbstractProcessHandoff() = default;

        /**
         * Replace the calling process with the target described by the request. On success
         * this method does not return.
         *
         * @param request The handoff request.
         * @return The status describing why the handoff failed.
         */
        virtual tempo_utils::Status handoff(const HandoffRequest &request) = 0;
    };
}

#endif // HERALD_SEQUENCER_ABSTRACT_PROCESS_HANDOFF_H
