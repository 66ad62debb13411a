#ifndef HERALD_SEQUENCER_PROC_PROCESS_TABLE_H
#define HERALD_SEQUENCER_PROC_PROCESS_TABLE_H

#include <filesystem>
#include <string>

#include "abstract_process_table.h"

namespace herald_sequencer {

    constexpr const char *kDefaultProcRoot = "/proc";

    struct ProcessEntry {
        pid_t pid;
        std::string name;
    };

    class ProcProcessTable : public AbstractProcessTable {
    public:
        explicit ProcProcessTable(const std::filesystem::path &procRoot = kDefaultProcRoot);

        tempo_utils::Result<std::vector<pid_t>> listMatching(std::string_view prefix) override;
        tempo_utils::Status terminate(pid_t pid, int signal) override;

        tempo_utils::Result<std::vector<ProcessEntry>> listProcesses() const;

        std::filesystem::path getProcRoot() const;

    private:
        std::filesystem::path m_procRoot;
        pid_t m_self;
    };

    bool invocation_name_has_prefix(std::string_view name, std::string_view prefix);
}

#endif // HERALD_SEQUENCER_PROC_PROCESS_TABLE_H
