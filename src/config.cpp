#include "config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <fmt/core.h>

#include "text_utils.hpp"

std::map<std::string, std::filesystem::path> parseTypeDirectories(const std::vector<std::string> &specs)
{
    std::map<std::string, std::filesystem::path> directories;
    for (const auto &spec : specs)
    {
        size_t eq = spec.find('=');
        if (eq == std::string::npos || eq == 0 || eq + 1 == spec.size())
        {
            throw std::invalid_argument(
                fmt::format("Invalid type mapping '{}'. Expected CODE=DIRECTORY", spec));
        }
        directories[spec.substr(0, eq)] = spec.substr(eq + 1);
    }
    return directories;
}

std::filesystem::path resolveDestination(const AppConfig &config)
{
    auto directories = parseTypeDirectories(config.typeDirSpecs);
    auto it = directories.find(config.destination);
    if (it != directories.end())
    {
        return it->second;
    }
    return config.destination;
}

std::filesystem::path defaultTokenFile()
{
    const char *home = std::getenv("HOME");
    if (home == nullptr || *home == '\0')
    {
        return {};
    }
    return std::filesystem::path(home) / ".civitai" / "config";
}

std::optional<std::string> loadAuthToken(const std::optional<std::string> &cliToken,
                                         const std::filesystem::path &tokenFile)
{
    if (cliToken && !trim(*cliToken).empty())
    {
        return trim(*cliToken);
    }

    if (const char *env = std::getenv("CIVITAI_TOKEN"))
    {
        std::string token = trim(env);
        if (!token.empty())
        {
            return token;
        }
    }

    std::error_code ec;
    if (tokenFile.empty() || !std::filesystem::is_regular_file(tokenFile, ec))
    {
        return std::nullopt;
    }

    std::ifstream file(tokenFile);
    if (!file)
    {
        fmt::print(stderr, "Warning: Could not read token file {}, continuing without a token\n",
                   tokenFile.string());
        return std::nullopt;
    }

    std::stringstream contents;
    contents << file.rdbuf();
    std::string token = trim(contents.str());
    if (token.empty())
    {
        return std::nullopt;
    }
    return token;
}
