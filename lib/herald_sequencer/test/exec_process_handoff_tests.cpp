#include <pwd.h>
#include <sys/wait.h>
#include <unistd.h>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <herald_sequencer/exec_process_handoff.h>
#include <tempo_test/tempo_test.h>
#include <tempo_utils/file_writer.h>
#include <tempo_utils/tempdir_maker.h>

#include "test_mocks.h"

using ::testing::ElementsAre;

static constexpr int kHandoffReturnedExitStatus = 99;

class ExecProcessHandoffTests : public ::testing::Test {
protected:
    std::unique_ptr<tempo_utils::TempdirMaker> tempdir;
    std::string currentUser;
    void SetUp() override {
        tempdir = std::make_unique<tempo_utils::TempdirMaker>(
            std::filesystem::current_path(), "tester.XXXXXXXX");
        ASSERT_TRUE (tempdir->isValid());
        auto *pw = getpwuid(geteuid());
        ASSERT_TRUE (pw != nullptr);
        currentUser = pw->pw_name;
    }

    /**
     * Run the handoff in a forked child and return the exit status of the child. If the handoff
     * returns then the child exits with kHandoffReturnedExitStatus.
     */
    int runHandoffInChild(const herald_sequencer::HandoffRequest &request) {
        auto pid = fork();
        if (pid == 0) {
            herald_sequencer::ExecProcessHandoff handoff;
            auto status = handoff.handoff(request);
            _exit(status.isOk()? 0 : kHandoffReturnedExitStatus);
        }
        EXPECT_LT (0, pid);
        int wstatus;
        EXPECT_EQ (pid, waitpid(pid, &wstatus, 0));
        EXPECT_TRUE (WIFEXITED(wstatus));
        return WEXITSTATUS(wstatus);
    }
};

TEST_F(ExecProcessHandoffTests, HandoffReplacesProcess)
{
    herald_sequencer::HandoffRequest request;
    request.user = currentUser;
    request.displayName = "viseron";
    request.command = {"/bin/sh", "-c", "exit 7"};

    ASSERT_EQ (7, runHandoffInChild(request));
}

TEST_F(ExecProcessHandoffTests, HandoffResolvesCommandOnPath)
{
    herald_sequencer::HandoffRequest request;
    request.user = currentUser;
    request.command = {"sh", "-c", "exit 5"};

    ASSERT_EQ (5, runHandoffInChild(request));
}

TEST_F(ExecProcessHandoffTests, HandoffAppliesWorkingDirectoryAndEnvironment)
{
    auto workingDirectory = std::filesystem::canonical(tempdir->getTempdir());
    auto environmentDirectory = workingDirectory / "env";
    ASSERT_TRUE (std::filesystem::create_directory(environmentDirectory));
    tempo_utils::FileWriter writer(environmentDirectory / "HERALD_TEST_INJECTED", std::string("injected"),
        tempo_utils::FileWriterMode::CREATE_ONLY);
    ASSERT_TRUE (writer.isValid());

    herald_sequencer::HandoffRequest request;
    request.user = currentUser;
    request.displayName = "viseron";
    request.workingDirectory = workingDirectory;
    request.environmentDirectory = environmentDirectory;
    request.command = {
        "/bin/sh", "-c",
        "[ \"$HERALD_TEST_INJECTED\" = injected ] || exit 3; "
        "[ \"$(pwd -P)\" = \"" + workingDirectory.string() + "\" ] || exit 4; "
        "exit 7",
    };

    ASSERT_EQ (7, runHandoffInChild(request));
}

TEST_F(ExecProcessHandoffTests, HandoffFailsWhenExecutableIsMissing)
{
    herald_sequencer::HandoffRequest request;
    request.user = currentUser;
    request.command = {"/nonexistent/python3", "-u", "-m", "viseron"};

    ASSERT_EQ (kHandoffReturnedExitStatus, runHandoffInChild(request));
}

TEST_F(ExecProcessHandoffTests, HandoffFailsWhenEnvironmentDirectoryIsMissing)
{
    herald_sequencer::HandoffRequest request;
    request.user = currentUser;
    request.environmentDirectory = tempdir->getTempdir() / "missing";
    request.command = {"/bin/sh", "-c", "exit 7"};

    ASSERT_EQ (kHandoffReturnedExitStatus, runHandoffInChild(request));
}

TEST_F(ExecProcessHandoffTests, HandoffFailsWhenCommandIsEmpty)
{
    herald_sequencer::HandoffRequest request;
    request.user = currentUser;

    herald_sequencer::ExecProcessHandoff handoff;
    auto status = handoff.handoff(request);
    ASSERT_TRUE (has_sequencer_condition(status, herald_sequencer::SequencerCondition::kInvalidConfiguration));
}

TEST_F(ExecProcessHandoffTests, LookupCurrentUser)
{
    auto lookupResult = herald_sequencer::lookup_user_identity(currentUser);
    ASSERT_THAT (lookupResult, tempo_test::IsResult());
    auto identity = lookupResult.getResult();
    ASSERT_EQ (currentUser, identity.name);
    ASSERT_EQ (geteuid(), identity.uid);

    // dropping to the identity we already run as is a no-op
    if (getegid() == identity.gid) {
        ASSERT_THAT (herald_sequencer::drop_privileges(identity), tempo_test::IsOk());
    }
}

TEST_F(ExecProcessHandoffTests, LookupMissingUserFails)
{
    auto lookupResult = herald_sequencer::lookup_user_identity("herald-no-such-user");
    ASSERT_TRUE (lookupResult.isStatus());
    ASSERT_TRUE (has_sequencer_condition(lookupResult.getStatus(),
        herald_sequencer::SequencerCondition::kHandoffFailed));
}

TEST(BuildHandoffArgv, DisplayNameReplacesFirstArgument)
{
    herald_sequencer::HandoffRequest request;
    request.displayName = "viseron";
    request.command = {"python3", "-u", "-m", "viseron"};

    ASSERT_THAT (herald_sequencer::build_handoff_argv(request),
        ElementsAre("viseron", "-u", "-m", "viseron"));
}

TEST(BuildHandoffArgv, EmptyDisplayNameKeepsExecutable)
{
    herald_sequencer::HandoffRequest request;
    request.command = {"python3", "-u"};

    ASSERT_THAT (herald_sequencer::build_handoff_argv(request), ElementsAre("python3", "-u"));
}
