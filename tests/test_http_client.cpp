#include <cstdlib>
#include <cstring>
#include <map>
#include <mutex>
#include <thread>
#include <utility>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <curl/curl.h>

#include "fetcher.hpp"
#include "http_client.hpp"
#include "test_support.hpp"

namespace
{
    /**
     * HTTP/1.1 origin on 127.0.0.1 with an ephemeral port. Each request path
     * maps to a canned raw response; every connection serves one request.
     */
    class LoopbackServer
    {
    public:
        explicit LoopbackServer(std::map<std::string, std::string> responses)
            : responses_(std::move(responses))
        {
            listenFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
            if (listenFd_ < 0)
            {
                throw std::runtime_error("socket() failed");
            }

            int reuse = 1;
            ::setsockopt(listenFd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

            sockaddr_in address;
            std::memset(&address, 0, sizeof(address));
            address.sin_family = AF_INET;
            address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
            address.sin_port = htons(0);

            socklen_t length = sizeof(address);
            if (::bind(listenFd_, reinterpret_cast<sockaddr *>(&address), sizeof(address)) != 0 ||
                ::getsockname(listenFd_, reinterpret_cast<sockaddr *>(&address), &length) != 0 ||
                ::listen(listenFd_, 8) != 0)
            {
                ::close(listenFd_);
                throw std::runtime_error("Failed to listen on 127.0.0.1");
            }
            port_ = ntohs(address.sin_port);

            thread_ = std::thread([this] { serve(); });
        }

        ~LoopbackServer()
        {
            // Unblocks accept() in the serving thread
            ::shutdown(listenFd_, SHUT_RDWR);
            ::close(listenFd_);
            thread_.join();
        }

        LoopbackServer(const LoopbackServer &) = delete;
        LoopbackServer &operator=(const LoopbackServer &) = delete;

        std::string url(const std::string &path) const
        {
            return fmt::format("http://127.0.0.1:{}{}", port_, path);
        }

        // Raw request heads received so far, in order
        std::vector<std::string> requests() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return requests_;
        }

    private:
        void serve()
        {
            while (true)
            {
                int client = ::accept(listenFd_, nullptr, nullptr);
                if (client < 0)
                {
                    return;
                }
                handle(client);
                ::close(client);
            }
        }

        void handle(int client)
        {
            std::string head;
            char buffer[4096];
            while (head.find("\r\n\r\n") == std::string::npos)
            {
                ssize_t received = ::recv(client, buffer, sizeof(buffer), 0);
                if (received <= 0)
                {
                    return;
                }
                head.append(buffer, static_cast<size_t>(received));
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                requests_.push_back(head);
            }

            // "GET /path HTTP/1.1"
            size_t pathStart = head.find(' ') + 1;
            std::string path = head.substr(pathStart, head.find(' ', pathStart) - pathStart);

            auto it = responses_.find(path);
            const std::string response = it != responses_.end()
                                             ? it->second
                                             : "HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\n"
                                               "Connection: close\r\n\r\n";

            size_t sent = 0;
            while (sent < response.size())
            {
                ssize_t n = ::send(client, response.data() + sent, response.size() - sent, MSG_NOSIGNAL);
                if (n <= 0)
                {
                    return;
                }
                sent += static_cast<size_t>(n);
            }
        }

        std::map<std::string, std::string> responses_;
        int listenFd_ = -1;
        int port_ = 0;
        std::thread thread_;

        mutable std::mutex mutex_;
        std::vector<std::string> requests_;
    };

    class RecordingHandler : public ResponseHandler
    {
    public:
        bool onResponse(const HttpResponseInfo &response) override
        {
            ++responses;
            info = response;
            return accept;
        }

        bool onBody(const char *data, size_t size) override
        {
            body.append(data, size);
            return true;
        }

        bool accept = true;
        int responses = 0;
        HttpResponseInfo info;
        std::string body;
    };

    std::map<std::string, std::string> originResponses()
    {
        return {
            {"/api/download/models/46846",
             "HTTP/1.1 302 Found\r\n"
             "Location: /files/real.safetensors?X-Amz-Signature=abc\r\n"
             "Content-Disposition: attachment; filename=\"redirect-hop.safetensors\"\r\n"
             "Content-Length: 0\r\n"
             "Connection: close\r\n\r\n"},
            {"/files/real.safetensors?X-Amz-Signature=abc",
             "HTTP/1.1 200 OK\r\n"
             "Content-Type: application/octet-stream\r\n"
             "Content-Length: 7\r\n"
             "Connection: close\r\n\r\n"
             "payload"},
            {"/empty",
             "HTTP/1.1 200 OK\r\n"
             "Content-Length: 0\r\n"
             "Connection: close\r\n\r\n"},
            {"/gone",
             "HTTP/1.1 410 Gone\r\n"
             "Content-Length: 4\r\n"
             "Connection: close\r\n\r\n"
             "gone"},
        };
    }

    void testRedirectDeliversFinalResponse()
    {
        LoopbackServer server(originResponses());
        HttpClient client;

        HttpRequest request;
        request.url = server.url("/api/download/models/46846");
        request.userAgent = Fetcher::USER_AGENT;
        request.headers = {"Authorization: Bearer s3cret"};

        RecordingHandler handler;
        TransportResult result = client.get(request, handler);

        check(result.ok(), "Redirected GET succeeds");
        check(handler.responses == 1, "Handler sees exactly one response");
        check(handler.info.statusCode == 200, "Final status delivered");
        check(handler.info.redirectCount == 1, "Redirect counted");
        check(handler.info.effectiveUrl == server.url("/files/real.safetensors?X-Amz-Signature=abc"),
              "Effective URL is the redirect target");
        check(handler.info.header("content-disposition").empty(),
              "Headers of the redirect hop are not carried over");
        check(handler.info.header("content-type") == "application/octet-stream",
              "Header names stored lowercase");
        check(handler.info.contentLength == 7, "Content-Length reported");
        check(handler.body == "payload", "Body streamed to the handler");

        auto requests = server.requests();
        check(requests.size() == 2, "Origin and redirect target both requested");
        check(!requests.empty() && requests[0].find(std::string("User-Agent: ") + Fetcher::USER_AGENT) !=
                                       std::string::npos,
              "User agent sent");
        check(!requests.empty() && requests[0].find("Authorization: Bearer s3cret") != std::string::npos,
              "Authorization header sent to the origin");
    }

    void testFetcherNamesFromFinalHop()
    {
        LoopbackServer server(originResponses());
        HttpClient client;
        TempDir out;

        ResolverOptions options;
        options.origin = server.url("");
        ModelResolver resolver(options);
        DownloadRequest request("46846", out.path(), std::nullopt, resolver);

        FetchOptions fetchOptions;
        fetchOptions.showProgress = false;
        TransferResult result = Fetcher(client, fetchOptions).fetch(request);

        check(result.finalPath == out.path() / "real.safetensors",
              "Name comes from the final URL, not the redirect hop");
        check(readFile(out.path() / "real.safetensors") == "payload", "Downloaded through libcurl");
        check(out.entryCount() == 1, "Only the final file remains");
    }

    void testEmptyAndErrorResponses()
    {
        LoopbackServer server(originResponses());
        HttpClient client;

        HttpRequest empty;
        empty.url = server.url("/empty");
        RecordingHandler emptyHandler;
        check(client.get(empty, emptyHandler).ok() && emptyHandler.responses == 1 &&
                  emptyHandler.info.contentLength == 0 && emptyHandler.body.empty(),
              "Empty body still delivers the response once");

        HttpRequest gone;
        gone.url = server.url("/gone");
        RecordingHandler goneHandler;
        check(client.get(gone, goneHandler).ok() && goneHandler.info.statusCode == 410,
              "Error status is reported to the handler, not as a transport failure");

        RecordingHandler refusing;
        refusing.accept = false;
        TransportResult aborted = client.get(gone, refusing);
        check(aborted.code == CURLE_ABORTED_BY_CALLBACK && refusing.body.empty(),
              "Handler refusing the response aborts before the body");
    }

    void testConnectionFailure()
    {
        int port = 0;
        {
            // Grab a free port, then release it so nothing listens there
            LoopbackServer server({});
            std::string url = server.url("/");
            port = std::atoi(url.substr(url.rfind(':') + 1).c_str());
        }

        HttpClient client;
        HttpRequest request;
        request.url = fmt::format("http://127.0.0.1:{}/api/download/models/1", port);
        RecordingHandler handler;
        TransportResult result = client.get(request, handler);

        check(result.code == CURLE_COULDNT_CONNECT, "Refused connection reports CURLE_COULDNT_CONNECT");
        check(!result.message.empty(), "Failure carries libcurl's message");
        check(handler.responses == 0, "No response delivered on connection failure");
    }
}

int main()
{
    // Loopback traffic must not go through a configured proxy
    setenv("no_proxy", "127.0.0.1", 1);
    setenv("NO_PROXY", "127.0.0.1", 1);

    curl_global_init(CURL_GLOBAL_DEFAULT);
    int status = 0;
    try
    {
        testRedirectDeliversFinalResponse();
        testFetcherNamesFromFinalHop();
        testEmptyAndErrorResponses();
        testConnectionFailure();
        status = finishTests();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        status = 1;
    }
    curl_global_cleanup();
    return status;
}
