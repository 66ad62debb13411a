
#include <fcntl.h>

#include <absl/strings/numbers.h>
#include <uv.h>

#include <herald_sequencer/proc_process_table.h>
#include <herald_sequencer/sequencer_result.h>
#include <tempo_utils/log_stream.h>

herald_sequencer::ProcProcessTable::ProcProcessTable(const std::filesystem::path &procRoot)
    : m_procRoot(procRoot)
{
    TU_ASSERT (!m_procRoot.empty());
    m_self = uv_os_getpid();
}

std::filesystem::path
herald_sequencer::ProcProcessTable::getProcRoot() const
{
    return m_procRoot;
}

/**
 * Read the invocation name of the process from its cmdline file. The invocation name is the
 * first NUL terminated token, which reflects any name the process assigned to itself. procfs
 * reports a size of zero for cmdline, so the file is read in chunks until end of file.
 *
 * @param cmdlinePath The path to the cmdline file.
 * @param name The invocation name, or empty if the cmdline could not be read or is empty.
 */
static void
read_invocation_name(const std::filesystem::path &cmdlinePath, std::string &name)
{
    name.clear();

    uv_fs_t req;
    auto fd = uv_fs_open(nullptr, &req, cmdlinePath.c_str(), O_RDONLY, 0, nullptr);
    uv_fs_req_cleanup(&req);
    if (fd < 0) {
        TU_LOG_VV << "failed to open " << cmdlinePath << ": " << uv_strerror(fd);
        return;
    }

    std::string cmdline;
    char chunk[4096];
    for (;;) {
        auto buf = uv_buf_init(chunk, sizeof(chunk));
        auto nread = uv_fs_read(nullptr, &req, fd, &buf, 1, -1, nullptr);
        uv_fs_req_cleanup(&req);
        if (nread < 0) {
            TU_LOG_VV << "failed to read " << cmdlinePath << ": " << uv_strerror(nread);
            cmdline.clear();
            break;
        }
        if (nread == 0)
            break;
        cmdline.append(chunk, nread);
        // only the first token is needed
        if (cmdline.find('\0') != std::string::npos)
            break;
    }

    uv_fs_close(nullptr, &req, fd, nullptr);
    uv_fs_req_cleanup(&req);

    auto end = cmdline.find('\0');
    name = cmdline.substr(0, end);
}

/**
 * List every readable process in the process table, excluding the calling process and any
 * process with an empty cmdline (kernel threads).
 *
 * @return The process entries or a status if the proc root could not be opened.
 */
tempo_utils::Result<std::vector<herald_sequencer::ProcessEntry>>
herald_sequencer::ProcProcessTable::listProcesses() const
{
    std::error_code ec;
    std::filesystem::directory_iterator it(m_procRoot, ec);
    if (ec)
        return SequencerStatus::forCondition(SequencerCondition::kProcessTableFailure,
            "failed to read process table {}: {}", m_procRoot.string(), ec.message());

    std::vector<ProcessEntry> entries;
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec)
            break;
        auto filename = it->path().filename().string();
        int pid;
        if (!absl::SimpleAtoi(filename, &pid) || pid <= 0)
            continue;
        if (pid == m_self)
            continue;

        // the process may exit at any point while we scan, so unreadable entries are skipped
        ProcessEntry entry;
        entry.pid = pid;
        read_invocation_name(it->path() / "cmdline", entry.name);
        if (entry.name.empty())
            continue;
        entries.push_back(std::move(entry));
    }

    if (ec)
        return SequencerStatus::forCondition(SequencerCondition::kProcessTableFailure,
            "failed to scan process table {}: {}", m_procRoot.string(), ec.message());

    return entries;
}

tempo_utils::Result<std::vector<pid_t>>
herald_sequencer::ProcProcessTable::listMatching(std::string_view prefix)
{
    if (prefix.empty())
        return SequencerStatus::forCondition(SequencerCondition::kInvalidConfiguration,
            "process name prefix must not be empty");

    std::vector<ProcessEntry> entries;
    TU_ASSIGN_OR_RETURN (entries, listProcesses());

    std::vector<pid_t> matching;
    for (const auto &entry : entries) {
        if (invocation_name_has_prefix(entry.name, prefix)) {
            TU_LOG_V << "process " << entry.pid << " (" << entry.name << ") matches prefix " << prefix;
            matching.push_back(entry.pid);
        }
    }
    return matching;
}

tempo_utils::Status
herald_sequencer::ProcProcessTable::terminate(pid_t pid, int signal)
{
    if (pid <= 0)
        return SequencerStatus::forCondition(SequencerCondition::kSequencerInvariant,
            "invalid pid {}", pid);
    if (pid == m_self)
        return SequencerStatus::forCondition(SequencerCondition::kSequencerInvariant,
            "refusing to signal the calling process");

    auto ret = uv_kill(pid, signal);
    if (ret < 0)
        return SequencerStatus::forCondition(SequencerCondition::kProcessTableFailure,
            "failed to signal process {}: {} ({})", pid, uv_strerror(ret), uv_err_name(ret));
    return {};
}

/**
 * Returns true if the invocation name, or the final path component of the invocation name,
 * starts with the specified prefix.
 */
bool
herald_sequencer::invocation_name_has_prefix(std::string_view name, std::string_view prefix)
{
    if (name.empty() || prefix.empty())
        return false;
    if (name.substr(0, prefix.size()) == prefix)
        return true;
    auto slash = name.find_last_of('/');
    if (slash == std::string_view::npos)
        return false;
    auto basename = name.substr(slash + 1);
    return basename.substr(0, prefix.size()) == prefix;
}
