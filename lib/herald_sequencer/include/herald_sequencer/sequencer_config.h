#ifndef HERALD_SEQUENCER_SEQUENCER_CONFIG_H
#define HERALD_SEQUENCER_SEQUENCER_CONFIG_H

#include <filesystem>
#include <string>
#include <vector>

#include <absl/time/time.h>

#include <tempo_command/command_config.h>
#include <tempo_utils/integer_types.h>
#include <tempo_utils/status.h>

#include "environment_directory.h"

namespace herald_sequencer {

    struct SequencerConfig {
        std::vector<std::string> stalePrefixes;
        int cleanupSignal;
        std::filesystem::path readinessExecutable;
        std::string databaseName;
        std::string databaseHost;
        tu_uint16 databasePort;
        absl::Duration pollInterval;
        int maxAttempts;
        std::filesystem::path workingDirectory;
        std::filesystem::path environmentDirectory;
        EnvironmentMode environmentMode;
        std::string runAsUser;
        std::string displayName;
        std::vector<std::string> command;
        std::filesystem::path logFile;
    };

    std::vector<std::string> default_handoff_command();

    tempo_utils::Status configure_sequencer(
        const tempo_command::CommandConfig &commandConfig,
        SequencerConfig &sequencerConfig);
}

#endif // HERALD_SEQUENCER_SEQUENCER_CONFIG_H
