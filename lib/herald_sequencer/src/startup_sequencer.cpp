
#include <herald_sequencer/sequencer_result.h>
#include <herald_sequencer/startup_sequencer.h>
#include <tempo_utils/log_stream.h>

herald_sequencer::StartupSequencer::StartupSequencer(
    const SequencerConfig &sequencerConfig,
    const SequencerCollaborators &collaborators)
    : m_config(sequencerConfig),
      m_collaborators(collaborators),
      m_state(SequencerState::Waiting),
      m_initialized(false),
      m_started(false)
{
}

/**
 * Initialize the sequencer. Every collaborator must be present.
 *
 * @return Ok status if sequencer initialization completed successfully, otherwise notOk status.
 */
tempo_utils::Status
herald_sequencer::StartupSequencer::initialize()
{
    if (m_initialized)
        return SequencerStatus::forCondition(SequencerCondition::kSequencerInvariant,
            "sequencer is already initialized");
    if (m_collaborators.processTable == nullptr)
        return SequencerStatus::forCondition(SequencerCondition::kSequencerInvariant,
            "missing process table");
    if (m_collaborators.readinessCheck == nullptr)
        return SequencerStatus::forCondition(SequencerCondition::kSequencerInvariant,
            "missing readiness check");
    if (m_collaborators.pacer == nullptr)
        return SequencerStatus::forCondition(SequencerCondition::kSequencerInvariant,
            "missing pacer");
    if (m_collaborators.log == nullptr)
        return SequencerStatus::forCondition(SequencerCondition::kSequencerInvariant,
            "missing sequencer log");
    if (m_collaborators.handoff == nullptr)
        return SequencerStatus::forCondition(SequencerCondition::kSequencerInvariant,
            "missing process handoff");
    m_initialized = true;
    return {};
}

herald_sequencer::SequencerState
herald_sequencer::StartupSequencer::getState() const
{
    return m_state;
}

herald_sequencer::RetryPolicy
herald_sequencer::StartupSequencer::getRetryPolicy() const
{
    RetryPolicy policy;
    policy.interval = m_config.pollInterval;
    policy.maxAttempts = m_config.maxAttempts;
    return policy;
}

herald_sequencer::HandoffRequest
herald_sequencer::StartupSequencer::getHandoffRequest() const
{
    return make_handoff_request(m_config);
}

/**
 * Terminate worker processes left over from a previous run. Failures are logged and do not
 * stop the sequence.
 *
 * @return The cleanup summary.
 */
herald_sequencer::CleanupSummary
herald_sequencer::StartupSequencer::cleanupStaleProcesses()
{
    TU_ASSERT (m_initialized);
    return cleanup_stale_processes(*m_collaborators.processTable, m_config.stalePrefixes,
        m_config.cleanupSignal, *m_collaborators.log);
}

/**
 * Block until the readiness check succeeds. On success the sequencer moves to the running state.
 *
 * @return Ok status if the dependency is ready, otherwise notOk status if the retry policy gave up.
 */
tempo_utils::Status
herald_sequencer::StartupSequencer::waitUntilReady()
{
    TU_ASSERT (m_initialized);
    if (m_state == SequencerState::Running)
        return SequencerStatus::forCondition(SequencerCondition::kSequencerInvariant,
            "sequencer is already running");

    TU_RETURN_IF_NOT_OK (wait_until_ready(*m_collaborators.readinessCheck, getRetryPolicy(),
        *m_collaborators.pacer, *m_collaborators.log, m_messages));
    m_state = SequencerState::Running;
    return {};
}

/**
 * Replace the calling process with the application. This method only returns on failure.
 *
 * @return The status describing why the handoff failed.
 */
tempo_utils::Status
herald_sequencer::StartupSequencer::handoff()
{
    TU_ASSERT (m_initialized);
    if (m_state != SequencerState::Running)
        return SequencerStatus::forCondition(SequencerCondition::kSequencerInvariant,
            "cannot hand off before the dependency is ready");

    auto request = getHandoffRequest();
    auto status = m_collaborators.handoff->handoff(request);
    if (status.isOk())
        return SequencerStatus::forCondition(SequencerCondition::kHandoffFailed,
            "process handoff returned without replacing the process");

    m_collaborators.log->logMessage(NoticeSeverity::kError, status.toString());
    return SequencerStatus::forCondition(SequencerCondition::kHandoffFailed,
        "failed to hand off to '{}': {}", request.displayName, status.toString());
}

/**
 * Run the complete startup sequence. A sequencer can be run once.
 *
 * @return The status describing why the sequence did not complete.
 */
tempo_utils::Status
herald_sequencer::StartupSequencer::run()
{
    if (!m_initialized)
        return SequencerStatus::forCondition(SequencerCondition::kSequencerInvariant,
            "sequencer is not initialized");
    if (m_started)
        return SequencerStatus::forCondition(SequencerCondition::kSequencerInvariant,
            "sequencer has already run");
    m_started = true;

    auto summary = cleanupStaleProcesses();
    TU_LOG_V << "stale process cleanup matched " << summary.matched << ", terminated "
             << summary.terminated << ", failed " << summary.failed;

    TU_RETURN_IF_NOT_OK (waitUntilReady());

    return handoff();
}

/**
 * Build the handoff request from the sequencer config.
 */
herald_sequencer::HandoffRequest
herald_sequencer::make_handoff_request(const SequencerConfig &sequencerConfig)
{
    HandoffRequest request;
    request.user = sequencerConfig.runAsUser;
    request.displayName = sequencerConfig.displayName;
    request.command = sequencerConfig.command;
    request.workingDirectory = sequencerConfig.workingDirectory;
    request.environmentDirectory = sequencerConfig.environmentDirectory;
    request.environmentMode = sequencerConfig.environmentMode;
    return request;
}
