#include "model_resolver.hpp"

#include <cctype>
#include <charconv>
#include <regex>
#include <utility>

#include <fmt/core.h>

#include "errors.hpp"
#include "text_utils.hpp"
#include "url_utils.hpp"

ModelResolver::ModelResolver(ResolverOptions options) : options_(std::move(options))
{
    while (!options_.origin.empty() && options_.origin.back() == '/')
    {
        options_.origin.pop_back();
    }
}

std::string ModelResolver::resolve(const std::string &rawInput) const
{
    const std::string input = trim(rawInput);

    // 1. Bare model-version id
    if (auto versionId = parseVersionId(input))
    {
        return canonicalUrl(*versionId);
    }

    if (auto url = parseUrl(input); url && (url->scheme == "http" || url->scheme == "https"))
    {
        // 2. Already the download endpoint
        if (hasApiSegment(url->path))
        {
            return input;
        }

        // 3. Model page carrying the version as a query parameter
        if (auto value = queryValue(url->query, "modelVersionId"))
        {
            if (auto versionId = parseVersionId(*value))
            {
                return canonicalUrl(*versionId);
            }
        }

        throw InvalidInputError(rawInput);
    }

    // 4. AIR name
    if (auto air = parseAir(input))
    {
        if (air->source != "civitai")
        {
            throw InvalidInputError(rawInput);
        }

        auto versionId = parseVersionId(air->version.value_or(air->id));
        if (!versionId)
        {
            throw InvalidInputError(rawInput);
        }
        return canonicalUrl(*versionId, air->format);
    }

    throw InvalidInputError(rawInput);
}

std::string ModelResolver::canonicalUrl(std::uint64_t versionId,
                                        const std::optional<std::string> &airFormat) const
{
    std::string url = fmt::format("{}/api/download/models/{}", options_.origin, versionId);

    if (options_.type)
    {
        url = appendQueryParameter(url, "type", *options_.type);
    }
    if (options_.format)
    {
        url = appendQueryParameter(url, "format", *options_.format);
    }
    else if (airFormat)
    {
        url = appendQueryParameter(url, "format", *airFormat);
    }
    if (options_.size)
    {
        url = appendQueryParameter(url, "size", *options_.size);
    }
    if (options_.fp)
    {
        url = appendQueryParameter(url, "fp", *options_.fp);
    }
    return url;
}

std::optional<std::uint64_t> ModelResolver::parseVersionId(const std::string &text)
{
    if (text.empty())
    {
        return std::nullopt;
    }
    for (char ch : text)
    {
        if (!std::isdigit(static_cast<unsigned char>(ch)))
        {
            return std::nullopt;
        }
    }

    std::uint64_t value = 0;
    const char *end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc() || ptr != end || value == 0)
    {
        return std::nullopt;
    }
    return value;
}

std::optional<AirReference> ModelResolver::parseAir(const std::string &text)
{
    static const std::regex pattern(
        R"(^(?:urn:)?(?:air:)?([^:]+):([^:]+):([^:]+):([^@.]+)(?:@([^.]+))?(?:\.(\w+))?$)");

    std::smatch match;
    if (!std::regex_match(text, match, pattern))
    {
        return std::nullopt;
    }

    AirReference air;
    air.ecosystem = match[1];
    air.type = match[2];
    air.source = match[3];
    air.id = match[4];
    if (match[5].matched)
    {
        air.version = match[5].str();
    }
    if (match[6].matched)
    {
        air.format = match[6].str();
    }
    return air;
}

bool ModelResolver::hasApiSegment(const std::string &path)
{
    size_t start = 0;
    while (start <= path.size())
    {
        size_t end = path.find('/', start);
        if (end == std::string::npos)
        {
            end = path.size();
        }
        if (path.compare(start, end - start, "api") == 0)
        {
            return true;
        }
        start = end + 1;
    }
    return false;
}
