#include "url_utils.hpp"

#include <memory>

#include <curl/curl.h>

#include "text_utils.hpp"

namespace
{
    using UrlHandle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

    // Fetch one part of a parsed URL; empty string when the part is absent.
    std::string getPart(CURLU *url, CURLUPart part)
    {
        char *value = nullptr;
        if (curl_url_get(url, part, &value, 0) != CURLUE_OK || value == nullptr)
        {
            return {};
        }
        std::string result(value);
        curl_free(value);
        return result;
    }
}

std::optional<UrlParts> parseUrl(const std::string &url)
{
    UrlHandle handle(curl_url(), curl_url_cleanup);
    if (!handle)
    {
        return std::nullopt;
    }

    // No default scheme: bare ids and host-only strings must not parse
    if (curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK)
    {
        return std::nullopt;
    }

    UrlParts parts;
    parts.scheme = toLower(getPart(handle.get(), CURLUPART_SCHEME));
    parts.path = getPart(handle.get(), CURLUPART_PATH);
    parts.query = getPart(handle.get(), CURLUPART_QUERY);

    if (parts.path.empty())
    {
        parts.path = "/";
    }
    return parts;
}

std::optional<std::string> queryValue(const std::string &query, const std::string &name)
{
    size_t start = 0;
    while (start <= query.size())
    {
        size_t end = query.find('&', start);
        if (end == std::string::npos)
        {
            end = query.size();
        }

        std::string pair = query.substr(start, end - start);
        size_t eq = pair.find('=');
        std::string key = pair.substr(0, eq);
        if (key == name)
        {
            return eq == std::string::npos ? std::string() : percentDecode(pair.substr(eq + 1));
        }

        start = end + 1;
    }
    return std::nullopt;
}

std::string appendQueryParameter(const std::string &url,
                                 const std::string &name,
                                 const std::string &value)
{
    std::string encoded;
    char *escaped = curl_easy_escape(nullptr, value.c_str(), static_cast<int>(value.size()));
    if (escaped)
    {
        encoded = escaped;
        curl_free(escaped);
    }

    std::string result = url;
    size_t hash = result.find('#');
    std::string fragment;
    if (hash != std::string::npos)
    {
        fragment = result.substr(hash);
        result.erase(hash);
    }

    if (result.find('?') == std::string::npos)
    {
        result += '?';
    }
    else if (result.back() != '?' && result.back() != '&')
    {
        result += '&';
    }
    result += name + "=" + encoded;
    return result + fragment;
}

std::string percentDecode(const std::string &text)
{
    int length = 0;
    char *decoded = curl_easy_unescape(nullptr, text.c_str(), static_cast<int>(text.size()), &length);
    if (!decoded)
    {
        return text;
    }
    std::string result(decoded, static_cast<size_t>(length));
    curl_free(decoded);
    return result;
}

std::string redactUrl(const std::string &url)
{
    size_t queryStart = url.find('?');
    if (queryStart == std::string::npos)
    {
        return url;
    }

    std::string result = url.substr(0, queryStart + 1);
    size_t pos = queryStart + 1;
    while (pos <= url.size())
    {
        size_t end = url.find_first_of("&#", pos);
        if (end == std::string::npos)
        {
            end = url.size();
        }

        std::string pair = url.substr(pos, end - pos);
        if (pair.rfind("token=", 0) == 0)
        {
            pair = "token=***";
        }
        result += pair;

        if (end == url.size())
        {
            break;
        }
        if (url[end] == '#')
        {
            result += url.substr(end);
            break;
        }
        result += '&';
        pos = end + 1;
    }
    return result;
}
