#pragma once

#include <cstdint>
#include <optional>
#include <string>

/**
 * Settings that shape the canonical download URL.
 * The query options are only applied to URLs the resolver synthesizes;
 * a URL that is already canonical is never modified.
 */
struct ResolverOptions
{
    std::string origin = "https://civitai.com";

    // Download endpoint query parameters, e.g. type=Model&format=SafeTensor
    std::optional<std::string> type;
    std::optional<std::string> format;
    std::optional<std::string> size; // "full" or "pruned"
    std::optional<std::string> fp;   // "fp16", "fp32", ...
};

/**
 * Parsed AIR (Artificial Intelligence Resource) name:
 * [urn:][air:]{ecosystem}:{type}:{source}:{id}[@{version}][.{format}]
 * Example: urn:air:sdxl:lora:civitai:667004@746484
 */
struct AirReference
{
    std::string ecosystem;
    std::string type;
    std::string source;
    std::string id;
    std::optional<std::string> version;
    std::optional<std::string> format;
};

/**
 * Turns what the user typed into the canonical download URL.
 *
 * Accepted shapes, tried in order:
 *   1. bare positive integer (model-version id)
 *   2. http(s) URL with an "api" path segment (returned unchanged)
 *   3. http(s) URL with a modelVersionId query parameter
 *   4. AIR name with source "civitai"
 * Anything else throws InvalidInputError. No I/O is performed.
 */
class ModelResolver
{
public:
    explicit ModelResolver(ResolverOptions options = {});

    std::string resolve(const std::string &rawInput) const;

    /**
     * {origin}/api/download/models/{versionId} plus configured query options.
     * @param airFormat format taken from an AIR name, used when no format is configured
     */
    std::string canonicalUrl(std::uint64_t versionId,
                             const std::optional<std::string> &airFormat = std::nullopt) const;

    /**
     * Digits only, value in 1..2^64-1.
     */
    static std::optional<std::uint64_t> parseVersionId(const std::string &text);

    static std::optional<AirReference> parseAir(const std::string &text);

private:
    static bool hasApiSegment(const std::string &path);

    ResolverOptions options_;
};
