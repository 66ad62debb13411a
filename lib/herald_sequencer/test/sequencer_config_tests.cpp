#include <csignal>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <herald_sequencer/sequencer_config.h>
#include <tempo_config/config_builder.h>
#include <tempo_test/tempo_test.h>

#include "test_mocks.h"

using ::testing::ElementsAre;

TEST(SequencerConfig, EmptyCommandConfigUsesDefaults)
{
    tempo_command::CommandConfig commandConfig;
    herald_sequencer::SequencerConfig config;
    ASSERT_THAT (herald_sequencer::configure_sequencer(commandConfig, config), tempo_test::IsOk());

    ASSERT_THAT (config.stalePrefixes, ElementsAre("ffmpeg_", "gstreamer_"));
    ASSERT_EQ (SIGTERM, config.cleanupSignal);
    ASSERT_EQ (std::filesystem::path("pg_isready"), config.readinessExecutable);
    ASSERT_EQ ("viseron", config.databaseName);
    ASSERT_TRUE (config.databaseHost.empty());
    ASSERT_EQ (0, config.databasePort);
    ASSERT_EQ (absl::Seconds(1), config.pollInterval);
    ASSERT_EQ (-1, config.maxAttempts);
    ASSERT_EQ (std::filesystem::path("/src"), config.workingDirectory);
    ASSERT_EQ (std::filesystem::path("/var/run/s6/container_environment"), config.environmentDirectory);
    ASSERT_EQ (herald_sequencer::EnvironmentMode::Verbatim, config.environmentMode);
    ASSERT_EQ ("abc", config.runAsUser);
    ASSERT_EQ ("viseron", config.displayName);
    ASSERT_THAT (config.command, ElementsAre("python3", "-u", "-m", "viseron"));
    ASSERT_TRUE (config.logFile.empty());
}

TEST(SequencerConfig, OverrideDatabaseAndCommand)
{
    tempo_command::CommandConfig commandConfig;
    commandConfig["databaseName"] = tempo_config::valueNode("nvr");
    commandConfig["databaseHost"] = tempo_config::valueNode("postgres");
    commandConfig["databasePort"] = tempo_config::valueNode("5433");
    commandConfig["maxAttempts"] = tempo_config::valueNode("30");
    commandConfig["environmentMode"] = tempo_config::valueNode("FirstLine");
    commandConfig["stalePrefixes"] = tempo_config::startSeq()
        .append(tempo_config::valueNode("ffmpeg_"))
        .buildNode();
    commandConfig["command"] = tempo_config::startSeq()
        .append(tempo_config::valueNode("python3"))
        .append(tempo_config::valueNode("-m"))
        .append(tempo_config::valueNode("viseron"))
        .buildNode();

    herald_sequencer::SequencerConfig config;
    ASSERT_THAT (herald_sequencer::configure_sequencer(commandConfig, config), tempo_test::IsOk());

    ASSERT_EQ ("nvr", config.databaseName);
    ASSERT_EQ ("postgres", config.databaseHost);
    ASSERT_EQ (5433, config.databasePort);
    ASSERT_EQ (30, config.maxAttempts);
    ASSERT_EQ (herald_sequencer::EnvironmentMode::FirstLine, config.environmentMode);
    ASSERT_THAT (config.stalePrefixes, ElementsAre("ffmpeg_"));
    ASSERT_THAT (config.command, ElementsAre("python3", "-m", "viseron"));
}

TEST(SequencerConfig, InvalidPortIsRejected)
{
    tempo_command::CommandConfig commandConfig;
    commandConfig["databasePort"] = tempo_config::valueNode("70000");

    herald_sequencer::SequencerConfig config;
    auto status = herald_sequencer::configure_sequencer(commandConfig, config);
    ASSERT_TRUE (has_sequencer_condition(status, herald_sequencer::SequencerCondition::kInvalidConfiguration));
}

TEST(SequencerConfig, ZeroMaxAttemptsIsRejected)
{
    tempo_command::CommandConfig commandConfig;
    commandConfig["maxAttempts"] = tempo_config::valueNode("0");

    herald_sequencer::SequencerConfig config;
    auto status = herald_sequencer::configure_sequencer(commandConfig, config);
    ASSERT_TRUE (has_sequencer_condition(status, herald_sequencer::SequencerCondition::kInvalidConfiguration));
}

TEST(SequencerConfig, EmptyUserIsRejected)
{
    tempo_command::CommandConfig commandConfig;
    commandConfig["runAsUser"] = tempo_config::valueNode("");

    herald_sequencer::SequencerConfig config;
    auto status = herald_sequencer::configure_sequencer(commandConfig, config);
    ASSERT_TRUE (has_sequencer_condition(status, herald_sequencer::SequencerCondition::kInvalidConfiguration));
}

TEST(SequencerConfig, EmptyStalePrefixIsRejected)
{
    tempo_command::CommandConfig commandConfig;
    commandConfig["stalePrefixes"] = tempo_config::startSeq()
        .append(tempo_config::valueNode(""))
        .buildNode();

    herald_sequencer::SequencerConfig config;
    auto status = herald_sequencer::configure_sequencer(commandConfig, config);
    ASSERT_TRUE (has_sequencer_condition(status, herald_sequencer::SequencerCondition::kInvalidConfiguration));
}
