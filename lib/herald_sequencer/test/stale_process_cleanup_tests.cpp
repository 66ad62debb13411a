#include <csignal>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <herald_sequencer/sequencer_result.h>
#include <herald_sequencer/stale_process_cleanup.h>

#include "test_mocks.h"

using ::testing::_;
using ::testing::Return;

TEST(StaleProcessCleanup, NoMatchingProcessesSendsNoSignals)
{
    MockProcessTable processTable;
    RecordingSequencerLog log;

    EXPECT_CALL (processTable, listMatching(_))
        .Times(4)
        .WillRepeatedly(Return(std::vector<pid_t>{}));
    EXPECT_CALL (processTable, terminate(_, _))
        .Times(0);

    std::vector<std::string> prefixes = {
        herald_sequencer::kTranscoderWorkerPrefix,
        herald_sequencer::kPipelineWorkerPrefix,
    };

    // running cleanup twice with nothing to clean up is harmless
    for (int i = 0; i < 2; i++) {
        auto summary = herald_sequencer::cleanup_stale_processes(processTable, prefixes, SIGTERM, log);
        ASSERT_EQ (0, summary.matched);
        ASSERT_EQ (0, summary.terminated);
        ASSERT_EQ (0, summary.failed);
    }
    ASSERT_TRUE (log.notices.empty());
}

TEST(StaleProcessCleanup, TerminatesEveryMatchingProcess)
{
    MockProcessTable processTable;
    RecordingSequencerLog log;

    EXPECT_CALL (processTable, listMatching(std::string_view("ffmpeg_")))
        .WillOnce(Return(std::vector<pid_t>{101, 102}));
    EXPECT_CALL (processTable, listMatching(std::string_view("gstreamer_")))
        .WillOnce(Return(std::vector<pid_t>{201}));
    EXPECT_CALL (processTable, terminate(101, SIGTERM))
        .WillOnce(Return(tempo_utils::Status{}));
    EXPECT_CALL (processTable, terminate(102, SIGTERM))
        .WillOnce(Return(tempo_utils::Status{}));
    EXPECT_CALL (processTable, terminate(201, SIGTERM))
        .WillOnce(Return(tempo_utils::Status{}));

    auto summary = herald_sequencer::cleanup_stale_processes(processTable,
        {"ffmpeg_", "gstreamer_"}, SIGTERM, log);
    ASSERT_EQ (3, summary.matched);
    ASSERT_EQ (3, summary.terminated);
    ASSERT_EQ (0, summary.failed);
    ASSERT_TRUE (log.notices.empty());
}

TEST(StaleProcessCleanup, TerminateFailureIsLoggedAndSkipped)
{
    MockProcessTable processTable;
    RecordingSequencerLog log;

    EXPECT_CALL (processTable, listMatching(std::string_view("ffmpeg_")))
        .WillOnce(Return(std::vector<pid_t>{101, 102}));
    EXPECT_CALL (processTable, terminate(101, SIGKILL))
        .WillOnce(Return(herald_sequencer::SequencerStatus::forCondition(
            herald_sequencer::SequencerCondition::kProcessTableFailure, "no such process")));
    EXPECT_CALL (processTable, terminate(102, SIGKILL))
        .WillOnce(Return(tempo_utils::Status{}));

    auto summary = herald_sequencer::cleanup_stale_processes(processTable, {"ffmpeg_"}, SIGKILL, log);
    ASSERT_EQ (2, summary.matched);
    ASSERT_EQ (1, summary.terminated);
    ASSERT_EQ (1, summary.failed);

    auto warnings = log.messagesWithSeverity(herald_sequencer::NoticeSeverity::kWarning);
    ASSERT_EQ (1, warnings.size());
    ASSERT_THAT (warnings.front(), ::testing::HasSubstr("101"));
}

TEST(StaleProcessCleanup, ListFailureIsLoggedAndCleanupContinues)
{
    MockProcessTable processTable;
    RecordingSequencerLog log;

    EXPECT_CALL (processTable, listMatching(std::string_view("ffmpeg_")))
        .WillOnce(Return(tempo_utils::Result<std::vector<pid_t>>(
            herald_sequencer::SequencerStatus::forCondition(
                herald_sequencer::SequencerCondition::kProcessTableFailure, "proc is not mounted"))));
    EXPECT_CALL (processTable, listMatching(std::string_view("gstreamer_")))
        .WillOnce(Return(std::vector<pid_t>{201}));
    EXPECT_CALL (processTable, terminate(201, SIGTERM))
        .WillOnce(Return(tempo_utils::Status{}));

    auto summary = herald_sequencer::cleanup_stale_processes(processTable,
        {"ffmpeg_", "gstreamer_"}, SIGTERM, log);
    ASSERT_EQ (1, summary.matched);
    ASSERT_EQ (1, summary.terminated);
    ASSERT_EQ (1, summary.failed);
    ASSERT_EQ (1, log.messagesWithSeverity(herald_sequencer::NoticeSeverity::kWarning).size());
    ASSERT_TRUE (log.messagesWithSeverity(herald_sequencer::NoticeSeverity::kError).empty());
}
