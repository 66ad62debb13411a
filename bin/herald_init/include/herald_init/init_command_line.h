/* SPDX-License-Identifier: AGPL-3.0-or-later */

#ifndef HERALD_INIT_INIT_COMMAND_LINE_H
#define HERALD_INIT_INIT_COMMAND_LINE_H

#include <string>
#include <vector>

#include <tempo_command/command_config.h>
#include <tempo_utils/status.h>

namespace herald_init {

    constexpr const char *kCommandSeparator = "--";

    struct InitCommandLine {
        std::vector<std::string> options;
        std::vector<std::string> command;
        bool hasSeparator = false;
    };

    InitCommandLine split_init_command_line(int argc, const char *argv[]);

    tempo_utils::Status parse_init_command_line(
        int argc,
        const char *argv[],
        tempo_command::CommandConfig &commandConfig);
}

#endif // HERALD_INIT_INIT_COMMAND_LINE_H
