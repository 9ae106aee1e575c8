#pragma once

#include "kiln/config.hpp"

namespace kiln {

/**
 * @brief Installs the `kiln` logger as the spdlog default.
 *
 * `KILN_LOG_LEVEL` and `KILN_LOG_PATTERN` take precedence over `config`.
 */
void init_logging(const LogConfig &config);

/** @brief Maps a CLI verbosity (0 quiet .. 3 trace) onto a spdlog level name. */
std::string_view verbosity_level(int verbosity);

void shutdown_logging();

} // namespace kiln
