/* SPDX-License-Identifier: AGPL-3.0-or-later */

#include <herald_init/herald_init.h>
#include <herald_init/init_command_line.h>
#include <herald_sequencer/command_readiness_check.h>
#include <herald_sequencer/exec_process_handoff.h>
#include <herald_sequencer/proc_process_table.h>
#include <herald_sequencer/sequencer_config.h>
#include <herald_sequencer/sleep_pacer.h>
#include <herald_sequencer/startup_sequencer.h>
#include <herald_sequencer/tempo_sequencer_log.h>
#include <tempo_command/command_config.h>
#include <tempo_command/command_help.h>
#include <tempo_command/command_parser.h>
#include <tempo_config/base_conversions.h>
#include <tempo_utils/log_sink.h>
#include <tempo_utils/log_stream.h>

tempo_utils::Status
herald_init::herald_init(int argc, const char *argv[])
{
    tempo_config::IntegerParser verboseParser(0);
    tempo_config::IntegerParser quietParser(0);
    tempo_config::BooleanParser silentParser(false);

    // parse the command line, options before '--' and the command after it
    tempo_command::CommandConfig commandConfig;
    TU_RETURN_IF_NOT_OK (parse_init_command_line(argc, argv, commandConfig));

    // configure logging
    tempo_utils::LoggingConfiguration logging = {
        tempo_utils::SeverityFilter::kDefault,
        true,
    };

    bool silent;
    TU_RETURN_IF_NOT_OK(tempo_command::parse_command_config(silent, silentParser,
        commandConfig, "silent"));
    if (silent) {
        logging.severityFilter = tempo_utils::SeverityFilter::kSilent;
    } else {
        int verbose, quiet;
        TU_RETURN_IF_NOT_OK(tempo_command::parse_command_config(verbose, verboseParser,
            commandConfig, "verbose"));
        TU_RETURN_IF_NOT_OK(tempo_command::parse_command_config(quiet, quietParser,
            commandConfig, "quiet"));
        if (verbose && quiet)
            return tempo_command::CommandStatus::forCondition(tempo_command::CommandCondition::kCommandError,
                "cannot specify both -v and -q");
        if (verbose == 1) {
            logging.severityFilter = tempo_utils::SeverityFilter::kVerbose;
        } else if (verbose > 1) {
            logging.severityFilter = tempo_utils::SeverityFilter::kVeryVerbose;
        }
        if (quiet == 1) {
            logging.severityFilter = tempo_utils::SeverityFilter::kWarningsAndErrors;
        } else if (quiet > 1) {
            logging.severityFilter = tempo_utils::SeverityFilter::kErrorsOnly;
        }
    }

    // configure the sequencer
    herald_sequencer::SequencerConfig sequencerConfig;
    TU_RETURN_IF_NOT_OK (herald_sequencer::configure_sequencer(commandConfig, sequencerConfig));

    // initialize logging
    if (!sequencerConfig.logFile.empty()) {
        auto logSink = std::make_unique<tempo_utils::LogFileSink>(sequencerConfig.logFile);
        tempo_utils::init_logging(logging, std::move(logSink));
    } else {
        tempo_utils::init_logging(logging);
    }

    TU_LOG_V << "command config:\n" << tempo_command::command_config_to_string(commandConfig);

    // construct the collaborators
    herald_sequencer::SequencerCollaborators collaborators;
    collaborators.processTable = std::make_shared<herald_sequencer::ProcProcessTable>();
    collaborators.readinessCheck = herald_sequencer::make_database_readiness_check(
        sequencerConfig.readinessExecutable, sequencerConfig.databaseName,
        sequencerConfig.databaseHost, sequencerConfig.databasePort);
    collaborators.pacer = std::make_shared<herald_sequencer::SleepPacer>();
    collaborators.log = std::make_shared<herald_sequencer::TempoSequencerLog>();
    collaborators.handoff = std::make_shared<herald_sequencer::ExecProcessHandoff>();

    herald_sequencer::StartupSequencer sequencer(sequencerConfig, collaborators);
    TU_RETURN_IF_NOT_OK (sequencer.initialize());

    // on success the process is replaced and run does not return
    return sequencer.run();
}
