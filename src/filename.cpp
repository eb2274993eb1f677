#include "filename.hpp"

#include <chrono>
#include <optional>

#include <fmt/core.h>

#include "text_utils.hpp"
#include "url_utils.hpp"

namespace
{
    // Value of a parameter starting at pos (just after '='): quoted-string or token
    std::string readParameterValue(const std::string &header, size_t pos)
    {
        while (pos < header.size() && (header[pos] == ' ' || header[pos] == '\t'))
        {
            ++pos;
        }
        if (pos >= header.size())
        {
            return {};
        }

        if (header[pos] == '"')
        {
            std::string value;
            for (size_t i = pos + 1; i < header.size(); ++i)
            {
                char ch = header[i];
                if (ch == '\\' && i + 1 < header.size())
                {
                    value += header[++i];
                }
                else if (ch == '"')
                {
                    break;
                }
                else
                {
                    value += ch;
                }
            }
            return value;
        }

        size_t end = header.find(';', pos);
        return trim(header.substr(pos, end == std::string::npos ? std::string::npos : end - pos));
    }

    // Parameters are separated by ';' and matched case-insensitively
    std::optional<std::string> findParameter(const std::string &header, const std::string &name)
    {
        const std::string lowered = toLower(header);
        size_t pos = 0;
        while ((pos = lowered.find(name, pos)) != std::string::npos)
        {
            size_t before = pos;
            while (before > 0 && (lowered[before - 1] == ' ' || lowered[before - 1] == '\t'))
            {
                --before;
            }
            bool atBoundary = before == 0 || lowered[before - 1] == ';';

            size_t after = pos + name.size();
            while (after < lowered.size() && (lowered[after] == ' ' || lowered[after] == '\t'))
            {
                ++after;
            }

            if (atBoundary && after < lowered.size() && lowered[after] == '=')
            {
                return readParameterValue(header, after + 1);
            }
            pos += name.size();
        }
        return std::nullopt;
    }
}

std::string filenameFromContentDisposition(const std::string &headerValue)
{
    // filename*=charset'language'percent-encoded
    if (auto extended = findParameter(headerValue, "filename*"))
    {
        size_t firstQuote = extended->find('\'');
        size_t secondQuote = firstQuote == std::string::npos
                                 ? std::string::npos
                                 : extended->find('\'', firstQuote + 1);
        std::string encoded = secondQuote == std::string::npos
                                  ? *extended
                                  : extended->substr(secondQuote + 1);
        std::string decoded = percentDecode(encoded);
        if (!decoded.empty())
        {
            return decoded;
        }
    }

    if (auto plain = findParameter(headerValue, "filename"))
    {
        return percentDecode(*plain);
    }
    return {};
}

std::string lastPathSegment(const std::string &url)
{
    auto parts = parseUrl(url);
    std::string path = parts ? parts->path : url.substr(0, url.find_first_of("?#"));

    size_t slash = path.find_last_of('/');
    std::string segment = slash == std::string::npos ? path : path.substr(slash + 1);
    return percentDecode(segment);
}

std::string sanitizeFilename(const std::string &name)
{
    // Base name only: no directory components can escape the destination
    size_t separator = name.find_last_of("/\\");
    std::string base = separator == std::string::npos ? name : name.substr(separator + 1);

    for (char &ch : base)
    {
        unsigned char byte = static_cast<unsigned char>(ch);
        if (byte < 0x20 || byte == 0x7f || std::string("<>:\"/\\|?*").find(ch) != std::string::npos)
        {
            ch = '_';
        }
    }

    base = trim(base);
    if (base.empty() || base == "." || base == "..")
    {
        auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
                           std::chrono::system_clock::now().time_since_epoch())
                           .count();
        return fmt::format("civitai_download_{}", seconds);
    }
    return base;
}
