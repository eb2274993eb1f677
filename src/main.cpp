#include <exception>

#include <curl/curl.h>
#include <fmt/core.h>

#include "app.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "http_client.hpp"

namespace
{
    // curl_global_init/cleanup for the lifetime of main
    struct CurlGlobal
    {
        CURLcode status = curl_global_init(CURL_GLOBAL_DEFAULT);
        ~CurlGlobal() { curl_global_cleanup(); }
    };
}

int main(int argc, char *argv[])
{
    // Quick check for --version flag before full parsing
    if (isVersionRequest(argc, argv))
    {
        printVersion();
        return 0;
    }

    CLI::App app{"download-model - fetch a Civitai model into a local model directory"};

    AppConfig config;
    configureCli(app, config);

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e)
    {
        return app.exit(e);
    }

    CurlGlobal curlGlobal;
    if (curlGlobal.status != CURLE_OK)
    {
        fmt::print(stderr, "✗ Fatal error: {}\n", curl_easy_strerror(curlGlobal.status));
        return 1;
    }

    try
    {
        auto token = loadAuthToken(config.token, defaultTokenFile());

        // Create HTTP client (RAII ensures cleanup)
        HttpClient client;
        return runDownload(config, token, client);
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "✗ Fatal error: {}\n", e.what());
        return 1;
    }
}
