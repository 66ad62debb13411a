#ifndef HERALD_SEQUENCER_COMMAND_READINESS_CHECK_H
#define HERALD_SEQUENCER_COMMAND_READINESS_CHECK_H

#include <filesystem>
#include <memory>

#include <tempo_utils/integer_types.h>
#include <tempo_utils/process_builder.h>

#include "abstract_readiness_check.h"

namespace herald_sequencer {

    constexpr const char *kDefaultReadinessExecutable = "pg_isready";
    constexpr const char *kDefaultDatabaseName = "viseron";

    /**
     * Readiness check which runs an external command to completion. The dependency is ready
     * when the command exits with status zero.
     */
    class CommandReadinessCheck : public AbstractReadinessCheck {
    public:
        explicit CommandReadinessCheck(
            const tempo_utils::ProcessInvoker &invoker,
            const std::filesystem::path &runDirectory = {});

        tempo_utils::Result<bool> checkReady() override;
        std::string describe() const override;

        std::filesystem::path getRunDirectory() const;
        int getLastExitStatus() const;

    private:
        tempo_utils::ProcessInvoker m_invoker;
        std::filesystem::path m_runDirectory;
        int m_lastExitStatus;
    };

    std::shared_ptr<CommandReadinessCheck> make_database_readiness_check(
        const std::filesystem::path &readinessExecutable,
        std::string_view databaseName,
        std::string_view databaseHost = {},
        tu_uint16 databasePort = 0);
}

#endif // HERALD_SEQUENCER_COMMAND_READINESS_CHECK_H
