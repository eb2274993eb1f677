#pragma once

#include <array>
#include <memory>
#include <string>
#include <curl/curl.h>

#include "transport.hpp"

/**
 * Transport backed by a libcurl easy handle.
 * Uses RAII to manage CURL handle lifecycle.
 *
 * Redirects are followed; libcurl drops the Authorization header when a
 * redirect leaves the original host, so a bearer token is never forwarded
 * to the storage host the origin redirects to.
 */
class HttpClient : public Transport
{
public:
    HttpClient();
    ~HttpClient() override;

    // Delete copy operations (CURL handles aren't copyable)
    HttpClient(const HttpClient &) = delete;
    HttpClient &operator=(const HttpClient &) = delete;

    HttpClient(HttpClient &&) noexcept = default;
    HttpClient &operator=(HttpClient &&) noexcept = default;

    /**
     * Perform one GET and stream the final response to the handler.
     * Never throws for network failures; they come back in the result.
     */
    TransportResult get(const HttpRequest &request, ResponseHandler &handler) override;

    static constexpr long MAX_REDIRECTS = 10;

private:
    // Per-transfer context handed to the libcurl callbacks
    struct TransferState
    {
        HttpClient *client = nullptr;
        ResponseHandler *handler = nullptr;
        HttpResponseInfo info;
        bool responseDelivered = false;
        bool aborted = false;
    };

    // CURL handle with custom deleter (RAII pattern)
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl_;

    std::array<char, CURL_ERROR_SIZE> errorBuffer_{};

    /**
     * Static callbacks for libcurl (C library, so no member function pointers).
     * userdata is the TransferState of the running transfer.
     */
    static size_t headerCallback(char *buffer, size_t size, size_t nitems, void *userdata);
    static size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata);
    static int progressCallback(void *clientp,
                                curl_off_t dltotal,
                                curl_off_t dlnow,
                                curl_off_t ultotal,
                                curl_off_t ulnow);

    /**
     * Fill in status, effective URL and length, then hand the response to
     * the handler. Returns the handler's verdict.
     */
    bool deliverResponse(TransferState &state);

    std::string describeError(CURLcode code) const;
};
