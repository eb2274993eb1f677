#pragma once

#include <optional>
#include <string>

#include "config.hpp"
#include "transport.hpp"

/**
 * Resolve, fetch and report one model download.
 * All failures are reported on stderr; the return value is the process
 * exit code (0 on success, the transport's code for transfer failures,
 * 1 otherwise).
 */
int runDownload(const AppConfig &config,
                const std::optional<std::string> &authToken,
                Transport &transport);
