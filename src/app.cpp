#include "app.hpp"

#include <chrono>

#include <fmt/core.h>

#include "errors.hpp"
#include "fetcher.hpp"
#include "model_resolver.hpp"
#include "progress.hpp"
#include "url_utils.hpp"

namespace
{
    void printConfiguration(const AppConfig &config,
                            const std::filesystem::path &destination,
                            const std::optional<std::string> &authToken)
    {
        fmt::print("Configuration:\n");
        fmt::print("  Model:       {}\n", config.model);
        fmt::print("  Destination: {}", destination.string());
        if (destination.string() != config.destination)
        {
            fmt::print(" (type '{}')", config.destination);
        }
        fmt::print("\n");
        fmt::print("  Origin:      {}\n", config.resolver.origin);
        fmt::print("  Token:       {}\n",
                   authToken ? (config.tokenInQuery ? "yes (query parameter)" : "yes (header)") : "no");
        if (config.outputName)
        {
            fmt::print("  Output name: {}\n", *config.outputName);
        }
        if (config.expectedChecksum)
        {
            fmt::print("  Checksum:    {}\n", *config.expectedChecksum);
        }
        if (config.forceUnsafe)
        {
            fmt::print("  Unsafe formats allowed\n");
        }
        fmt::print("\n");
    }
}

int runDownload(const AppConfig &config,
                const std::optional<std::string> &authToken,
                Transport &transport)
{
    try
    {
        std::filesystem::path destination = resolveDestination(config);
        if (config.verbose)
        {
            printConfiguration(config, destination, authToken);
        }

        ModelResolver resolver(config.resolver);
        DownloadRequest request(config.model, destination, authToken, resolver);

        FetchOptions options;
        options.outputName = config.outputName;
        options.tokenInQuery = config.tokenInQuery;
        options.createDirectories = config.createDirectories;
        options.allowUnsafe = config.forceUnsafe;
        options.showProgress = !config.quiet;
        options.verbose = config.verbose;
        if (config.expectedChecksum)
        {
            options.checksum = ChecksumSpec::parse(*config.expectedChecksum);
        }

        if (!config.quiet)
        {
            fmt::print("Downloading model from {}, please wait...\n", redactUrl(request.resolvedUrl()));
        }

        auto start = std::chrono::steady_clock::now();
        Fetcher fetcher(transport, options);
        TransferResult result = fetcher.fetch(request);
        auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
                           std::chrono::steady_clock::now() - start)
                           .count();

        if (!config.quiet)
        {
            fmt::print("✓ Saved: {} ({} in {})\n",
                       result.finalPath.string(),
                       formatBytes(static_cast<std::int64_t>(result.bytesWritten)),
                       formatDuration(static_cast<long>(elapsed)));
            if (!result.digestHex.empty())
            {
                fmt::print("✓ Checksum verification passed ({})\n", options.checksum->algorithmName());
            }
        }
        return 0;
    }
    catch (const DownloadError &e)
    {
        fmt::print(stderr, "✗ {}\n", e.what());
        return e.exitCode();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "✗ Fatal error: {}\n", e.what());
        return 1;
    }
}
