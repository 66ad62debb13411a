
#include <cerrno>
#include <iterator>

#include <grp.h>
#include <pwd.h>
#include <unistd.h>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include <herald_sequencer/exec_process_handoff.h>
#include <herald_sequencer/sequencer_result.h>
#include <tempo_utils/log_stream.h>
#include <tempo_utils/posix_result.h>

/**
 * Look up the uid and primary gid of the specified user in the system user database.
 *
 * @param user The user name.
 * @return The user identity, or a status if the user does not exist or the lookup failed.
 */
tempo_utils::Result<herald_sequencer::UserIdentity>
herald_sequencer::lookup_user_identity(std::string_view user)
{
    if (user.empty())
        return SequencerStatus::forCondition(SequencerCondition::kInvalidConfiguration,
            "user must not be empty");

    std::string userName(user);
    errno = 0;
    auto *pw = getpwnam(userName.c_str());
    if (pw == nullptr) {
        if (errno != 0)
            return tempo_utils::PosixStatus::last(
                absl::StrCat("failed to look up user ", userName));
        return SequencerStatus::forCondition(SequencerCondition::kHandoffFailed,
            "user {} does not exist", userName);
    }

    UserIdentity identity;
    identity.name = pw->pw_name;
    identity.uid = pw->pw_uid;
    identity.gid = pw->pw_gid;
    return identity;
}

/**
 * Switch the calling process to the specified identity, including the supplementary groups
 * of the user. If the process already runs as the identity then nothing changes.
 *
 * @param identity The target identity.
 * @return Ok status if the process now runs as the identity, otherwise notOk status.
 */
tempo_utils::Status
herald_sequencer::drop_privileges(const UserIdentity &identity)
{
    if (geteuid() == identity.uid && getegid() == identity.gid) {
        TU_LOG_V << "already running as user " << identity.name;
        return {};
    }

    if (geteuid() != 0)
        return SequencerStatus::forCondition(SequencerCondition::kHandoffFailed,
            "insufficient privileges to switch to user {}", identity.name);

    // groups must be changed while we still have root privileges
    if (initgroups(identity.name.c_str(), identity.gid) < 0)
        return tempo_utils::PosixStatus::last(
            absl::StrCat("initgroups failed for user ", identity.name));
    if (setgid(identity.gid) < 0)
        return tempo_utils::PosixStatus::last(
            absl::StrCat("setgid(", identity.gid, ") failed"));
    if (setuid(identity.uid) < 0)
        return tempo_utils::PosixStatus::last(
            absl::StrCat("setuid(", identity.uid, ") failed"));

    TU_LOG_V << "switched to user " << identity.name << " (uid " << identity.uid << ", gid " << identity.gid << ")";
    return {};
}

/**
 * Build the argument vector for the target process. The first element is the display name if
 * one was specified, otherwise the command executable.
 */
std::vector<std::string>
herald_sequencer::build_handoff_argv(const HandoffRequest &request)
{
    std::vector<std::string> argv;
    if (request.command.empty())
        return argv;
    argv.push_back(request.displayName.empty()? request.command.front() : request.displayName);
    argv.insert(argv.end(), std::next(request.command.cbegin()), request.command.cend());
    return argv;
}

tempo_utils::Status
herald_sequencer::ExecProcessHandoff::handoff(const HandoffRequest &request)
{
    if (request.command.empty())
        return SequencerStatus::forCondition(SequencerCondition::kInvalidConfiguration,
            "handoff command must not be empty");

    // change to the application root
    if (!request.workingDirectory.empty()) {
        if (chdir(request.workingDirectory.c_str()) < 0)
            return tempo_utils::PosixStatus::last(
                absl::StrCat("failed to change directory to ", request.workingDirectory.string()));
    }

    // populate the environment before giving up privileges, the store may be unreadable afterwards
    if (!request.environmentDirectory.empty()) {
        std::vector<EnvironmentEntry> entries;
        TU_ASSIGN_OR_RETURN (entries, load_environment_directory(
            request.environmentDirectory, request.environmentMode));
        TU_RETURN_IF_NOT_OK (apply_environment(entries));
        TU_LOG_V << "loaded " << entries.size() << " variables from " << request.environmentDirectory;
    }

    UserIdentity identity;
    TU_ASSIGN_OR_RETURN (identity, lookup_user_identity(request.user));
    TU_RETURN_IF_NOT_OK (drop_privileges(identity));

    auto args = build_handoff_argv(request);
    std::vector<char *> argv;
    for (auto &arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    const auto &executable = request.command.front();
    TU_LOG_V << "exec " << executable << " as '" << args.front() << "': " << absl::StrJoin(args, " ");

    execvp(executable.c_str(), argv.data());

    // execvp only returns on failure
    return tempo_utils::PosixStatus::last(absl::StrCat("failed to exec ", executable));
}
