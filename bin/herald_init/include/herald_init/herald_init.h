/* SPDX-License-Identifier: AGPL-3.0-or-later */

#ifndef HERALD_INIT_HERALD_INIT_H
#define HERALD_INIT_HERALD_INIT_H

#include <tempo_utils/status.h>

namespace herald_init {
    tempo_utils::Status herald_init(int argc, const char *argv[]);
}

#endif // HERALD_INIT_HERALD_INIT_H
