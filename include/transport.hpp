#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

/**
 * One HTTP GET as seen by the fetcher.
 */
struct HttpRequest
{
    std::string url;
    std::string userAgent;
    std::vector<std::string> headers; // "Name: value"
};

/**
 * Status line and headers of the final response (after redirects).
 */
struct HttpResponseInfo
{
    long statusCode = 0;
    std::string effectiveUrl;
    int redirectCount = 0;
    std::int64_t contentLength = -1; // -1 when the server did not say

    // Header names are lowercased
    std::map<std::string, std::string> headers;

    std::string header(const std::string &lowercaseName) const
    {
        auto it = headers.find(lowercaseName);
        return it == headers.end() ? std::string() : it->second;
    }
};

/**
 * Receives the response of a Transport::get call.
 */
class ResponseHandler
{
public:
    virtual ~ResponseHandler() = default;

    /**
     * Called exactly once, after the final response headers are known and
     * before any body byte is delivered.
     * @return false to abort the transfer
     */
    virtual bool onResponse(const HttpResponseInfo &info) = 0;

    /**
     * @return false to abort the transfer
     */
    virtual bool onBody(const char *data, size_t size) = 0;

    virtual void onProgress(std::int64_t total, std::int64_t received)
    {
        (void)total;
        (void)received;
    }
};

/**
 * Outcome of the transfer at the transport level.
 * code 0 means the transfer completed; otherwise it is the transport's own
 * error code (CURLcode for HttpClient).
 */
struct TransportResult
{
    int code = 0;
    std::string message;

    bool ok() const { return code == 0; }
};

/**
 * Reason phrase for common HTTP status codes, "Unknown Status" otherwise.
 */
std::string httpStatusText(long code);

/**
 * Blocking HTTP GET that streams the response to a handler.
 * No retries: a failure is reported once.
 */
class Transport
{
public:
    virtual ~Transport() = default;

    virtual TransportResult get(const HttpRequest &request, ResponseHandler &handler) = 0;
};
