#ifndef HERALD_SEQUENCER_ENVIRONMENT_DIRECTORY_H
#define HERALD_SEQUENCER_ENVIRONMENT_DIRECTORY_H

#include <filesystem>
#include <string>
#include <vector>

#include <tempo_config/enum_conversions.h>
#include <tempo_utils/option_template.h>
#include <tempo_utils/result.h>
#include <tempo_utils/status.h>

namespace herald_sequencer {

    constexpr const char *kDefaultEnvironmentDirectory = "/var/run/s6/container_environment";

    enum class EnvironmentMode {
        FirstLine,                  // value is the first line of the file with trailing blanks removed
        Verbatim,                   // value is the entire file content
    };

    struct EnvironmentEntry {
        std::string name;
        Option<std::string> value;      // empty means the variable is removed
    };

    class EnvironmentModeParser : public tempo_config::EnumTParser<EnvironmentMode> {
    public:
        explicit EnvironmentModeParser(EnvironmentMode defaultMode)
            : EnumTParser({
            {"FirstLine", EnvironmentMode::FirstLine},
            {"Verbatim", EnvironmentMode::Verbatim}}, defaultMode)
        {}
    };

    tempo_utils::Result<std::vector<EnvironmentEntry>> load_environment_directory(
        const std::filesystem::path &environmentDirectory,
        EnvironmentMode mode);

    tempo_utils::Status apply_environment(const std::vector<EnvironmentEntry> &entries);
}

#endif // HERALD_SEQUENCER_ENVIRONMENT_DIRECTORY_H
