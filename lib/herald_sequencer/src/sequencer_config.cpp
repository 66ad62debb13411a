
#include <csignal>

#include <herald_sequencer/command_readiness_check.h>
#include <herald_sequencer/exec_process_handoff.h>
#include <herald_sequencer/retry_policy.h>
#include <herald_sequencer/sequencer_config.h>
#include <herald_sequencer/sequencer_result.h>
#include <herald_sequencer/stale_process_cleanup.h>
#include <tempo_config/base_conversions.h>
#include <tempo_config/container_conversions.h>
#include <tempo_config/time_conversions.h>

/**
 * The command which replaces the sequencer when no command is specified.
 */
std::vector<std::string>
herald_sequencer::default_handoff_command()
{
    return {"python3", "-u", "-m", "viseron"};
}

tempo_utils::Status
herald_sequencer::configure_sequencer(
    const tempo_command::CommandConfig &commandConfig,
    SequencerConfig &sequencerConfig)
{
    tempo_config::StringParser stalePrefixParser;
    tempo_config::SeqTParser<std::string> stalePrefixesParser(&stalePrefixParser,
        std::vector<std::string>{kTranscoderWorkerPrefix, kPipelineWorkerPrefix});
    tempo_config::IntegerParser cleanupSignalParser(SIGTERM);
    tempo_config::PathParser readinessExecutableParser(std::filesystem::path(kDefaultReadinessExecutable));
    tempo_config::StringParser databaseNameParser(std::string(kDefaultDatabaseName));
    tempo_config::StringParser databaseHostParser(std::string{});
    tempo_config::IntegerParser databasePortParser(0);
    tempo_config::DurationParser pollIntervalParser(absl::Seconds(1));
    tempo_config::IntegerParser maxAttemptsParser(kUnboundedAttempts);
    tempo_config::PathParser workingDirectoryParser(std::filesystem::path(kDefaultWorkingDirectory));
    tempo_config::PathParser environmentDirectoryParser(std::filesystem::path(kDefaultEnvironmentDirectory));
    EnvironmentModeParser environmentModeParser(EnvironmentMode::Verbatim);
    tempo_config::StringParser runAsUserParser(std::string(kDefaultRunAsUser));
    tempo_config::StringParser displayNameParser(std::string(kDefaultDisplayName));
    tempo_config::StringParser commandArgParser;
    tempo_config::SeqTParser<std::string> commandParser(&commandArgParser, default_handoff_command());
    tempo_config::PathParser logFileParser(std::filesystem::path{});

    // determine the stale worker prefixes
    TU_RETURN_IF_NOT_OK(tempo_command::parse_command_config(sequencerConfig.stalePrefixes, stalePrefixesParser,
        commandConfig, "stalePrefixes"));

    // determine the signal sent to stale workers
    TU_RETURN_IF_NOT_OK(tempo_command::parse_command_config(sequencerConfig.cleanupSignal, cleanupSignalParser,
        commandConfig, "cleanupSignal"));

    // determine the readiness command
    TU_RETURN_IF_NOT_OK(tempo_command::parse_command_config(sequencerConfig.readinessExecutable,
        readinessExecutableParser, commandConfig, "readinessExecutable"));

    // determine the database connection parameters
    TU_RETURN_IF_NOT_OK(tempo_command::parse_command_config(sequencerConfig.databaseName, databaseNameParser,
        commandConfig, "databaseName"));
    TU_RETURN_IF_NOT_OK(tempo_command::parse_command_config(sequencerConfig.databaseHost, databaseHostParser,
        commandConfig, "databaseHost"));
    int databasePort;
    TU_RETURN_IF_NOT_OK(tempo_command::parse_command_config(databasePort, databasePortParser,
        commandConfig, "databasePort"));

    // parse the retry policy
    TU_RETURN_IF_NOT_OK(tempo_command::parse_command_config(sequencerConfig.pollInterval, pollIntervalParser,
        commandConfig, "pollInterval"));
    TU_RETURN_IF_NOT_OK(tempo_command::parse_command_config(sequencerConfig.maxAttempts, maxAttemptsParser,
        commandConfig, "maxAttempts"));

    // determine the handoff parameters
    TU_RETURN_IF_NOT_OK(tempo_command::parse_command_config(sequencerConfig.workingDirectory,
        workingDirectoryParser, commandConfig, "workingDirectory"));
    TU_RETURN_IF_NOT_OK(tempo_command::parse_command_config(sequencerConfig.environmentDirectory,
        environmentDirectoryParser, commandConfig, "environmentDirectory"));
    TU_RETURN_IF_NOT_OK(tempo_command::parse_command_config(sequencerConfig.environmentMode,
        environmentModeParser, commandConfig, "environmentMode"));
    TU_RETURN_IF_NOT_OK(tempo_command::parse_command_config(sequencerConfig.runAsUser, runAsUserParser,
        commandConfig, "runAsUser"));
    TU_RETURN_IF_NOT_OK(tempo_command::parse_command_config(sequencerConfig.displayName, displayNameParser,
        commandConfig, "displayName"));
    TU_RETURN_IF_NOT_OK(tempo_command::parse_command_config(sequencerConfig.command, commandParser,
        commandConfig, "command"));

    // determine the log file
    TU_RETURN_IF_NOT_OK(tempo_command::parse_command_config(sequencerConfig.logFile, logFileParser,
        commandConfig, "logFile"));

    // validate the config

    for (const auto &prefix : sequencerConfig.stalePrefixes) {
        if (prefix.empty())
            return SequencerStatus::forCondition(SequencerCondition::kInvalidConfiguration,
                "stale process prefix must not be empty");
    }
    if (sequencerConfig.cleanupSignal <= 0 || sequencerConfig.cleanupSignal >= NSIG)
        return SequencerStatus::forCondition(SequencerCondition::kInvalidConfiguration,
            "invalid cleanup signal {}", sequencerConfig.cleanupSignal);
    if (sequencerConfig.readinessExecutable.empty())
        return SequencerStatus::forCondition(SequencerCondition::kInvalidConfiguration,
            "readiness command must not be empty");
    if (sequencerConfig.databaseName.empty())
        return SequencerStatus::forCondition(SequencerCondition::kInvalidConfiguration,
            "database name must not be empty");
    if (databasePort < 0 || databasePort > 65535)
        return SequencerStatus::forCondition(SequencerCondition::kInvalidConfiguration,
            "invalid database port {}", databasePort);
    sequencerConfig.databasePort = static_cast<tu_uint16>(databasePort);
    if (sequencerConfig.pollInterval < absl::ZeroDuration())
        return SequencerStatus::forCondition(SequencerCondition::kInvalidConfiguration,
            "poll interval must not be negative");
    if (sequencerConfig.maxAttempts == 0 || sequencerConfig.maxAttempts < kUnboundedAttempts)
        return SequencerStatus::forCondition(SequencerCondition::kInvalidConfiguration,
            "max attempts must be positive or {} for unbounded", kUnboundedAttempts);
    if (sequencerConfig.runAsUser.empty())
        return SequencerStatus::forCondition(SequencerCondition::kInvalidConfiguration,
            "user must not be empty");
    if (sequencerConfig.command.empty() || sequencerConfig.command.front().empty())
        return SequencerStatus::forCondition(SequencerCondition::kInvalidConfiguration,
            "command must not be empty");

    return {};
}
