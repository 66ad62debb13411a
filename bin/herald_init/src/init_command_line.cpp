/* SPDX-License-Identifier: AGPL-3.0-or-later */

#include <herald_init/init_command_line.h>
#include <tempo_command/command_help.h>
#include <tempo_command/command_parser.h>
#include <tempo_command/command_tokenizer.h>
#include <tempo_config/base_conversions.h>
#include <tempo_config/config_builder.h>
#include <tempo_config/config_types.h>

/**
 * Split the argv array at the first separator. Everything before the separator is subject to
 * option parsing, everything after it is the command to run and is never interpreted as options.
 * The program name in argv[0] is not included in either part.
 */
herald_init::InitCommandLine
herald_init::split_init_command_line(int argc, const char *argv[])
{
    InitCommandLine commandLine;
    int i = 1;
    for (; i < argc; i++) {
        std::string_view arg(argv[i]);
        if (arg == kCommandSeparator) {
            commandLine.hasSeparator = true;
            i++;
            break;
        }
        commandLine.options.emplace_back(arg);
    }
    for (; i < argc; i++) {
        commandLine.command.emplace_back(argv[i]);
    }
    return commandLine;
}

/**
 * Parse the herald-init command line into the command config. Usage is
 * `herald-init [options] [-- COMMAND...]`. If help or version was requested then the
 * corresponding text is displayed and the process exits.
 *
 * @param argc The argument count.
 * @param argv The argument vector, including the program name.
 * @param commandConfig The command config to populate.
 * @return Ok status if the command line was parsed, otherwise notOk status.
 */
tempo_utils::Status
herald_init::parse_init_command_line(
    int argc,
    const char *argv[],
    tempo_command::CommandConfig &commandConfig)
{
    tempo_config::IntegerParser verboseParser(0);
    tempo_config::IntegerParser quietParser(0);
    tempo_config::BooleanParser silentParser(false);

    std::vector<tempo_command::Default> defaults = {
        {"stalePrefixes", {}, "Terminate stale processes whose name starts with PREFIX "
            "(may be specified multiple times)", "PREFIX"},
        {"cleanupSignal", {}, "Signal number sent to stale processes", "SIGNAL"},
        {"readinessExecutable", {}, "The database readiness command", "PROGRAM"},
        {"databaseName", {}, "The database name passed to the readiness command", "NAME"},
        {"databaseHost", {}, "The database host passed to the readiness command", "HOST"},
        {"databasePort", {}, "The database port passed to the readiness command", "PORT"},
        {"pollInterval", {}, "Time to wait between readiness checks", "DURATION"},
        {"maxAttempts", {}, "Give up after the specified number of readiness checks", "COUNT"},
        {"workingDirectory", {}, "Change to the specified directory before handoff", "DIR"},
        {"environmentDirectory", {}, "Load the environment from the specified directory", "DIR"},
        {"environmentMode", {}, "How environment files are read (Verbatim or FirstLine)", "MODE"},
        {"runAsUser", {}, "Run the command as the specified user", "USER"},
        {"displayName", {}, "The process name of the command", "NAME"},
        {"logFile", {}, "path to log file", "FILE"},
        {"verbose", verboseParser.getDefault(),
            "Display verbose output (specify twice for even more verbose output)"},
        {"quiet", quietParser.getDefault(),
            "Display warnings and errors only (specify twice for errors only)"},
        {"silent", silentParser.getDefault(),
            "Suppress all output"},
        {"command", {}, "The command to run once the database is ready, specified after '--'. "
            "Arguments after '--' are never parsed as options", "COMMAND"},
    };

    const std::vector<tempo_command::Grouping> groupings = {
        {"stalePrefixes", {"--stale-prefix"}, tempo_command::GroupingType::SINGLE_ARGUMENT},
        {"cleanupSignal", {"--cleanup-signal"}, tempo_command::GroupingType::SINGLE_ARGUMENT},
        {"readinessExecutable", {"--readiness-command"}, tempo_command::GroupingType::SINGLE_ARGUMENT},
        {"databaseName", {"-d", "--database"}, tempo_command::GroupingType::SINGLE_ARGUMENT},
        {"databaseHost", {"--database-host"}, tempo_command::GroupingType::SINGLE_ARGUMENT},
        {"databasePort", {"--database-port"}, tempo_command::GroupingType::SINGLE_ARGUMENT},
        {"pollInterval", {"--poll-interval"}, tempo_command::GroupingType::SINGLE_ARGUMENT},
        {"maxAttempts", {"--max-attempts"}, tempo_command::GroupingType::SINGLE_ARGUMENT},
        {"workingDirectory", {"-C", "--working-directory"}, tempo_command::GroupingType::SINGLE_ARGUMENT},
        {"environmentDirectory", {"-e", "--environment-directory"}, tempo_command::GroupingType::SINGLE_ARGUMENT},
        {"environmentMode", {"--environment-mode"}, tempo_command::GroupingType::SINGLE_ARGUMENT},
        {"runAsUser", {"-u", "--user"}, tempo_command::GroupingType::SINGLE_ARGUMENT},
        {"displayName", {"-n", "--display-name"}, tempo_command::GroupingType::SINGLE_ARGUMENT},
        {"logFile", {"--log-file"}, tempo_command::GroupingType::SINGLE_ARGUMENT},
        {"verbose", {"-v"}, tempo_command::GroupingType::NO_ARGUMENT},
        {"quiet", {"-q"}, tempo_command::GroupingType::NO_ARGUMENT},
        {"silent", {"--silent"}, tempo_command::GroupingType::NO_ARGUMENT},
        {"help", {"-h", "--help"}, tempo_command::GroupingType::HELP_FLAG},
        {"version", {"--version"}, tempo_command::GroupingType::VERSION_FLAG},
    };

    const std::vector<tempo_command::Mapping> optMappings = {
        {tempo_command::MappingType::ANY_INSTANCES, "stalePrefixes"},
        {tempo_command::MappingType::ZERO_OR_ONE_INSTANCE, "cleanupSignal"},
        {tempo_command::MappingType::ZERO_OR_ONE_INSTANCE, "readinessExecutable"},
        {tempo_command::MappingType::ZERO_OR_ONE_INSTANCE, "databaseName"},
        {tempo_command::MappingType::ZERO_OR_ONE_INSTANCE, "databaseHost"},
        {tempo_command::MappingType::ZERO_OR_ONE_INSTANCE, "databasePort"},
        {tempo_command::MappingType::ZERO_OR_ONE_INSTANCE, "pollInterval"},
        {tempo_command::MappingType::ZERO_OR_ONE_INSTANCE, "maxAttempts"},
        {tempo_command::MappingType::ZERO_OR_ONE_INSTANCE, "workingDirectory"},
        {tempo_command::MappingType::ZERO_OR_ONE_INSTANCE, "environmentDirectory"},
        {tempo_command::MappingType::ZERO_OR_ONE_INSTANCE, "environmentMode"},
        {tempo_command::MappingType::ZERO_OR_ONE_INSTANCE, "runAsUser"},
        {tempo_command::MappingType::ZERO_OR_ONE_INSTANCE, "displayName"},
        {tempo_command::MappingType::ZERO_OR_ONE_INSTANCE, "logFile"},
        {tempo_command::MappingType::COUNT_INSTANCES, "verbose"},
        {tempo_command::MappingType::COUNT_INSTANCES, "quiet"},
        {tempo_command::MappingType::TRUE_IF_INSTANCE, "silent"},
    };

    std::vector<tempo_command::Mapping> argMappings = {
        {tempo_command::MappingType::ANY_INSTANCES, "command"},
    };

    // only the arguments before the separator are tokenized
    auto commandLine = split_init_command_line(argc, argv);
    std::vector<const char *> optionArgs;
    for (const auto &option : commandLine.options) {
        optionArgs.push_back(option.c_str());
    }

    // parse argv array into a vector of tokens
    tempo_command::TokenVector tokens;
    TU_ASSIGN_OR_RETURN (tokens, tempo_command::tokenize_argv(
        static_cast<int>(optionArgs.size()), optionArgs.data()));

    tempo_command::OptionsHash options;
    tempo_command::ArgumentVector arguments;

    // parse options and arguments
    auto status = tempo_command::parse_completely(tokens, groupings, options, arguments);
    if (status.notOk()) {
        tempo_command::CommandStatus commandStatus;
        if (!status.convertTo(commandStatus))
            return status;
        switch (commandStatus.getCondition()) {
            case tempo_command::CommandCondition::kHelpRequested:
                display_help_and_exit({"herald-init"},
                    "Clean up stale workers, wait for the database, then run the application. "
                    "Usage: herald-init [options] -- COMMAND...",
                    {}, groupings, optMappings, argMappings, defaults);
            case tempo_command::CommandCondition::kVersionRequested:
                tempo_command::display_version_and_exit(PROJECT_VERSION);
            default:
                return status;
        }
    }

    // the command is either given after the separator or as plain arguments, never both
    if (!arguments.empty() && commandLine.hasSeparator)
        return tempo_command::CommandStatus::forCondition(tempo_command::CommandCondition::kCommandError,
            "unexpected argument before '--', specify the command as: herald-init [options] -- COMMAND...");

    // initialize the command config from defaults
    commandConfig = tempo_command::command_config_from_defaults(defaults);

    // convert options to config
    TU_RETURN_IF_NOT_OK (tempo_command::convert_options(options, optMappings, commandConfig));

    // trailing arguments replace the default command
    if (!arguments.empty()) {
        TU_RETURN_IF_NOT_OK (tempo_command::convert_arguments(arguments, argMappings, commandConfig));
    } else if (!commandLine.command.empty()) {
        std::vector<tempo_config::ConfigNode> commandArgs;
        for (const auto &arg : commandLine.command) {
            commandArgs.push_back(tempo_config::valueNode(arg));
        }
        commandConfig["command"] = tempo_config::ConfigSeq(commandArgs);
    }

    return {};
}
