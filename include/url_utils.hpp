#pragma once

#include <optional>
#include <string>

/**
 * URL helpers built on libcurl's URL API (curl_url / CURLU).
 * None of these perform network I/O.
 */
struct UrlParts
{
    std::string scheme; // lowercase, e.g. "https"
    std::string path;   // raw (still percent-encoded), at least "/"
    std::string query;  // raw, without the leading '?', empty if absent
};

/**
 * Split an absolute URL into its parts.
 * @return std::nullopt if libcurl cannot parse it as an absolute URL
 */
std::optional<UrlParts> parseUrl(const std::string &url);

/**
 * Look up a query parameter by exact name. The value is percent-decoded.
 * Example: queryValue("a=1&modelVersionId=46846", "modelVersionId") → "46846"
 */
std::optional<std::string> queryValue(const std::string &query, const std::string &name);

/**
 * Append name=value to a URL, escaping the value.
 * The existing text of the URL is kept byte for byte.
 */
std::string appendQueryParameter(const std::string &url,
                                 const std::string &name,
                                 const std::string &value);

std::string percentDecode(const std::string &text);

/**
 * Mask the value of every "token" query parameter so a URL can be printed.
 */
std::string redactUrl(const std::string &url);
