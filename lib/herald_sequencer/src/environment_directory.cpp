
#include <algorithm>
#include <cstdlib>

#include <absl/strings/str_cat.h>

#include <herald_sequencer/environment_directory.h>
#include <herald_sequencer/sequencer_result.h>
#include <tempo_utils/file_reader.h>
#include <tempo_utils/log_stream.h>
#include <tempo_utils/posix_result.h>

static bool
is_valid_variable_name(std::string_view name)
{
    if (name.empty() || name.front() == '.')
        return false;
    return name.find('=') == std::string_view::npos;
}

static std::string
decode_value(std::string content, herald_sequencer::EnvironmentMode mode)
{
    if (mode == herald_sequencer::EnvironmentMode::FirstLine) {
        auto eol = content.find('\n');
        if (eol != std::string::npos) {
            content.resize(eol);
        }
        auto last = content.find_last_not_of(" \t");
        content.resize(last == std::string::npos ? 0 : last + 1);
    }
    std::replace(content.begin(), content.end(), '\0', '\n');
    return content;
}

/**
 * Load the environment directory. Each regular file in the directory defines one variable,
 * where the file name is the variable name and the file content is the value. An empty file
 * removes the variable. Entries are returned sorted by name.
 *
 * @param environmentDirectory The directory to load.
 * @param mode Whether to take the first line or the complete file content as the value.
 * @return The environment entries, or a status if the directory could not be read.
 */
tempo_utils::Result<std::vector<herald_sequencer::EnvironmentEntry>>
herald_sequencer::load_environment_directory(
    const std::filesystem::path &environmentDirectory,
    EnvironmentMode mode)
{
    if (!std::filesystem::is_directory(environmentDirectory))
        return SequencerStatus::forCondition(SequencerCondition::kInvalidConfiguration,
            "environment directory {} not found", environmentDirectory.string());

    std::error_code ec;
    std::filesystem::directory_iterator it(environmentDirectory, ec);
    if (ec)
        return SequencerStatus::forCondition(SequencerCondition::kInvalidConfiguration,
            "failed to read environment directory {}: {}", environmentDirectory.string(), ec.message());

    std::vector<EnvironmentEntry> entries;
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec)
            break;
        auto name = it->path().filename().string();
        if (!is_valid_variable_name(name)) {
            TU_LOG_V << "ignoring environment file " << it->path();
            continue;
        }
        if (!it->is_regular_file())
            continue;

        tempo_utils::FileReader reader(it->path());
        if (!reader.isValid())
            return SequencerStatus::forCondition(SequencerCondition::kInvalidConfiguration,
                "failed to read environment file {}: {}", it->path().string(), reader.getStatus().toString());
        auto bytes = reader.getBytes();
        std::string content;
        if (bytes != nullptr) {
            content.assign((const char *) bytes->getData(), bytes->getSize());
        }

        EnvironmentEntry entry;
        entry.name = name;
        if (!content.empty()) {
            entry.value = Option<std::string>(decode_value(std::move(content), mode));
        }
        entries.push_back(std::move(entry));
    }

    if (ec)
        return SequencerStatus::forCondition(SequencerCondition::kInvalidConfiguration,
            "failed to scan environment directory {}: {}", environmentDirectory.string(), ec.message());

    std::sort(entries.begin(), entries.end(), [](const auto &lhs, const auto &rhs) {
        return lhs.name < rhs.name;
    });

    return entries;
}

/**
 * Apply the environment entries to the environment of the calling process.
 *
 * @param entries The entries to apply.
 * @return Ok status if every entry was applied, otherwise notOk status.
 */
tempo_utils::Status
herald_sequencer::apply_environment(const std::vector<EnvironmentEntry> &entries)
{
    for (const auto &entry : entries) {
        if (entry.value.isEmpty()) {
            if (unsetenv(entry.name.c_str()) < 0)
                return tempo_utils::PosixStatus::last(
                    absl::StrCat("failed to unset environment variable ", entry.name));
            TU_LOG_VV << "unset environment variable " << entry.name;
        } else {
            auto value = entry.value.getValue();
            if (setenv(entry.name.c_str(), value.c_str(), 1) < 0)
                return tempo_utils::PosixStatus::last(
                    absl::StrCat("failed to set environment variable ", entry.name));
            TU_LOG_VV << "set environment variable " << entry.name;
        }
    }
    return {};
}
