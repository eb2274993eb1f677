#include "http_client.hpp"

#include <stdexcept>

#include <fmt/core.h>

#include "text_utils.hpp"

namespace
{
    using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;
}

HttpClient::HttpClient() : curl_(curl_easy_init(), curl_easy_cleanup)
{
    if (!curl_)
    {
        throw std::runtime_error("Failed to initialize CURL (out of memory or library error)");
    }
}

// Destructor: unique_ptr handles cleanup automatically
HttpClient::~HttpClient() = default;

TransportResult HttpClient::get(const HttpRequest &request, ResponseHandler &handler)
{
    CURL *curl = curl_.get();
    curl_easy_reset(curl);
    errorBuffer_.fill('\0');

    TransferState state;
    state.client = this;
    state.handler = &handler;

    HeaderList headers(nullptr, curl_slist_free_all);
    for (const auto &header : request.headers)
    {
        curl_slist *appended = curl_slist_append(headers.get(), header.c_str());
        if (!appended)
        {
            return {CURLE_OUT_OF_MEMORY, "Failed to build request headers"};
        }
        headers.release();
        headers.reset(appended);
    }

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, request.userAgent.c_str());
    if (headers)
    {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
    }
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errorBuffer_.data());

    // Response plumbing
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &state);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);

    // HTTPS settings
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    // The download endpoint answers with a redirect to the storage host
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, MAX_REDIRECTS);

    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &state);

    CURLcode res = curl_easy_perform(curl);

    // Empty body: the write callback never ran
    if (res == CURLE_OK && !state.responseDelivered)
    {
        if (!deliverResponse(state))
        {
            state.aborted = true;
        }
    }

    if (state.aborted)
    {
        return {CURLE_ABORTED_BY_CALLBACK, "Transfer aborted by response handler"};
    }
    if (res != CURLE_OK)
    {
        return {static_cast<int>(res), describeError(res)};
    }
    return {};
}

// Called once per header line, for every response in a redirect chain
size_t HttpClient::headerCallback(char *buffer, size_t size, size_t nitems, void *userdata)
{
    auto *state = static_cast<TransferState *>(userdata);
    size_t totalSize = size * nitems;
    std::string line(buffer, totalSize);

    if (line.rfind("HTTP/", 0) == 0)
    {
        // Status line of a new response: forget the previous hop's headers
        state->info.headers.clear();
        return totalSize;
    }

    size_t colon = line.find(':');
    if (colon == std::string::npos)
    {
        return totalSize;
    }

    std::string name = toLower(trim(line.substr(0, colon)));
    state->info.headers[name] = trim(line.substr(colon + 1));

    return totalSize;
}

// Static callback: libcurl calls this with chunks of downloaded data
size_t HttpClient::writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    auto *state = static_cast<TransferState *>(userdata);
    size_t totalSize = size * nmemb;

    if (!state->responseDelivered && !state->client->deliverResponse(*state))
    {
        state->aborted = true;
        return 0; // Returning less than totalSize makes libcurl abort
    }

    if (!state->handler->onBody(ptr, totalSize))
    {
        state->aborted = true;
        return 0;
    }
    return totalSize;
}

int HttpClient::progressCallback(void *clientp,
                                 curl_off_t dltotal,
                                 curl_off_t dlnow,
                                 curl_off_t ultotal,
                                 curl_off_t ulnow)
{
    (void)ultotal;
    (void)ulnow;

    auto *state = static_cast<TransferState *>(clientp);

    // Redirect hops carry no payload worth reporting
    if (state->responseDelivered)
    {
        state->handler->onProgress(static_cast<std::int64_t>(dltotal),
                                   static_cast<std::int64_t>(dlnow));
    }
    return 0;
}

bool HttpClient::deliverResponse(TransferState &state)
{
    CURL *curl = curl_.get();
    state.responseDelivered = true;

    long statusCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &statusCode);
    state.info.statusCode = statusCode;

    char *effectiveUrl = nullptr;
    if (curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effectiveUrl) == CURLE_OK && effectiveUrl)
    {
        state.info.effectiveUrl = effectiveUrl;
    }

    long redirects = 0;
    curl_easy_getinfo(curl, CURLINFO_REDIRECT_COUNT, &redirects);
    state.info.redirectCount = static_cast<int>(redirects);

    curl_off_t contentLength = -1;
    if (curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &contentLength) == CURLE_OK)
    {
        state.info.contentLength = static_cast<std::int64_t>(contentLength);
    }

    return state.handler->onResponse(state.info);
}

std::string HttpClient::describeError(CURLcode code) const
{
    std::string message = curl_easy_strerror(code);
    if (errorBuffer_[0] != '\0')
    {
        message = fmt::format("{} ({})", message, trim(errorBuffer_.data()));
    }
    return message;
}
