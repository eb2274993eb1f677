#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "checksum.hpp"
#include "model_resolver.hpp"
#include "transport.hpp"

/**
 * One download invocation. The resolved URL is computed once, in the
 * constructor, and nothing about the request changes afterwards.
 */
class DownloadRequest
{
public:
    /**
     * @throws InvalidInputError if rawInput does not resolve
     */
    DownloadRequest(std::string rawInput,
                    std::filesystem::path destinationDirectory,
                    std::optional<std::string> authToken,
                    const ModelResolver &resolver);

    const std::string &rawInput() const { return rawInput_; }
    const std::filesystem::path &destinationDirectory() const { return destinationDirectory_; }
    const std::optional<std::string> &authToken() const { return authToken_; }
    const std::string &resolvedUrl() const { return resolvedUrl_; }

private:
    const std::string rawInput_;
    const std::filesystem::path destinationDirectory_;
    const std::optional<std::string> authToken_;
    const std::string resolvedUrl_;
};

struct TransferResult
{
    bool success = false;
    std::uint64_t bytesWritten = 0;
    std::filesystem::path finalPath;
    std::string digestHex; // empty unless a checksum was requested
};

struct FetchOptions
{
    // Use this name instead of the server's; checked before any network call
    std::optional<std::string> outputName;

    // Send the token as ?token= instead of an Authorization header
    bool tokenInQuery = false;

    bool createDirectories = false;
    std::optional<ChecksumSpec> checksum;

    // Accept files other than .safetensors (pickle-based .ckpt, .pt, ...)
    bool allowUnsafe = false;

    bool showProgress = true;
    bool verbose = false;
};

/**
 * Streams a resolved download into its destination directory.
 *
 * Bytes go to "<name>.part" first, created exclusively; the part file gets
 * the final name only after the whole body arrived (and matched the
 * checksum, if one was given). On any failure the part file is removed.
 * An existing file with the final name, or with the part name, is never
 * overwritten, even one created while the body was streaming.
 *
 * Only .safetensors files are accepted unless allowUnsafe is set.
 */
class Fetcher
{
public:
    // Browser user agent; the origin rejects obvious bots
    static constexpr const char *USER_AGENT =
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
        "(KHTML, like Gecko) Chrome/91.0.4472.124 Safari/537.36";

    explicit Fetcher(Transport &transport, FetchOptions options = {});

    /**
     * @throws DestinationError, AlreadyExistsError, TransferError, IntegrityError
     */
    TransferResult fetch(const DownloadRequest &request);

    /**
     * Directory must exist (or be creatable when createDirectories is set),
     * be a directory and be writable.
     * @throws DestinationError
     */
    static void checkDestination(const std::filesystem::path &directory, bool createDirectories);

    /**
     * URL and headers actually sent for a request, token included.
     */
    HttpRequest buildHttpRequest(const DownloadRequest &request) const;

private:
    Transport &transport_;
    FetchOptions options_;
};
