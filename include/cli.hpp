#pragma once

#include <CLI/CLI.hpp> // CLI11 main header

#include "config.hpp"

/**
 * Register every download-model option on app, bound to config.
 * Positionals: MODEL DESTINATION. Also accepts --config FILE (TOML/INI).
 */
void configureCli(CLI::App &app, AppConfig &config);

/**
 * True if --version or -V appears anywhere in argv; checked before full
 * parsing so it works without the required positionals.
 */
bool isVersionRequest(int argc, const char *const argv[]);

void printVersion();
