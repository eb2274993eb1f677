#pragma once

#include <filesystem>
#include <map>
#include <optional> // C++17 feature for optional values
#include <string>
#include <vector>

#include "model_resolver.hpp"

/**
 * Configuration for one download-model invocation.
 * Populated by the CLI11 parser from the command line and, optionally,
 * a --config file.
 */
struct AppConfig
{
    // Required parameters
    std::string model;       // id, download URL, page URL or AIR name
    std::string destination; // directory, or a code from typeDirSpecs

    // "CODE=DIR" entries, e.g. "lora=/opt/webui/models/Lora"
    std::vector<std::string> typeDirSpecs;

    // Auth token given on the command line; see loadAuthToken for the rest
    std::optional<std::string> token;
    bool tokenInQuery = false;

    std::optional<std::string> outputName;
    std::optional<std::string> expectedChecksum; // Format: "sha256:abc123..."
    bool createDirectories = false;
    bool forceUnsafe = false; // allow .ckpt, .pt and other non-safetensors files

    ResolverOptions resolver;

    // Flags
    bool verbose = false;
    bool quiet = false;
};

/**
 * Turn "CODE=DIR" entries into a lookup table. Later entries win.
 * @throws std::invalid_argument for an entry without '=' or with an empty side
 */
std::map<std::string, std::filesystem::path> parseTypeDirectories(const std::vector<std::string> &specs);

/**
 * The directory to download into: the mapped directory if destination is a
 * configured type code, otherwise destination taken as a path.
 */
std::filesystem::path resolveDestination(const AppConfig &config);

/**
 * ~/.civitai/config
 */
std::filesystem::path defaultTokenFile();

/**
 * Token lookup, first present and non-empty wins:
 * command line, CIVITAI_TOKEN environment variable, token file.
 */
std::optional<std::string> loadAuthToken(const std::optional<std::string> &cliToken,
                                         const std::filesystem::path &tokenFile);
