
#include <absl/strings/str_cat.h>

#include <herald_sequencer/command_readiness_check.h>
#include <herald_sequencer/sequencer_result.h>
#include <tempo_utils/log_stream.h>
#include <tempo_utils/process_runner.h>

herald_sequencer::CommandReadinessCheck::CommandReadinessCheck(
    const tempo_utils::ProcessInvoker &invoker,
    const std::filesystem::path &runDirectory)
    : m_invoker(invoker),
      m_runDirectory(runDirectory),
      m_lastExitStatus(-1)
{
    TU_ASSERT (m_invoker.isValid());
    if (m_runDirectory.empty()) {
        m_runDirectory = std::filesystem::current_path();
    }
}

std::string
herald_sequencer::CommandReadinessCheck::describe() const
{
    return m_invoker.toString();
}

std::filesystem::path
herald_sequencer::CommandReadinessCheck::getRunDirectory() const
{
    return m_runDirectory;
}

int
herald_sequencer::CommandReadinessCheck::getLastExitStatus() const
{
    return m_lastExitStatus;
}

/**
 * Run the readiness command to completion. The output of the command is collected by the
 * runner and discarded, only the exit status is significant.
 *
 * @return true if the command exited with status zero, false if it exited with any other
 *     status, or a status if the command could not be run.
 */
tempo_utils::Result<bool>
herald_sequencer::CommandReadinessCheck::checkReady()
{
    TU_LOG_VV << "running readiness check: " << m_invoker.toString();

    tempo_utils::ProcessRunner runner(m_invoker, m_runDirectory);
    auto status = runner.getStatus();
    if (status.notOk())
        return SequencerStatus::forCondition(SequencerCondition::kReadinessCheckFailed,
            "failed to run readiness check {}: {}", m_invoker.toString(), status.toString());

    m_lastExitStatus = runner.getExitStatus();
    TU_LOG_VV << "readiness check exited with status " << m_lastExitStatus;

    return m_lastExitStatus == 0;
}

std::shared_ptr<herald_sequencer::CommandReadinessCheck>
herald_sequencer::make_database_readiness_check(
    const std::filesystem::path &readinessExecutable,
    std::string_view databaseName,
    std::string_view databaseHost,
    tu_uint16 databasePort)
{
    tempo_utils::ProcessBuilder builder(readinessExecutable);
    builder.appendArg("-q");
    builder.appendArg("-d", std::string(databaseName));
    if (!databaseHost.empty()) {
        builder.appendArg("-h", std::string(databaseHost));
    }
    if (databasePort > 0) {
        builder.appendArg("-p", absl::StrCat(databasePort));
    }
    return std::make_shared<CommandReadinessCheck>(builder.toInvoker());
}
