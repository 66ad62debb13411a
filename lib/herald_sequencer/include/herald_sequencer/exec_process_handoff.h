#ifndef HERALD_SEQUENCER_EXEC_PROCESS_HANDOFF_H
#define HERALD_SEQUENCER_EXEC_PROCESS_HANDOFF_H

#include <sys/types.h>

#include <tempo_utils/result.h>

#include "abstract_process_handoff.h"

namespace herald_sequencer {

    constexpr const char *kDefaultRunAsUser = "abc";
    constexpr const char *kDefaultDisplayName = "viseron";
    constexpr const char *kDefaultWorkingDirectory = "/src";

    struct UserIdentity {
        std::string name;
        uid_t uid;
        gid_t gid;
    };

    class ExecProcessHandoff : public AbstractProcessHandoff {
    public:
        ExecProcessHandoff() = default;

        tempo_utils::Status handoff(const HandoffRequest &request) override;
    };

    tempo_utils::Result<UserIdentity> lookup_user_identity(std::string_view user);

    tempo_utils::Status drop_privileges(const UserIdentity &identity);

    std::vector<std::string> build_handoff_argv(const HandoffRequest &request);
}

#endif // HERALD_SEQUENCER_EXEC_PROCESS_HANDOFF_H
