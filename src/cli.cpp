#include "cli.hpp"

#include <string>

#include <curl/curl.h>
#include <fmt/core.h>
#include <openssl/crypto.h>

#include "checksum.hpp"

void configureCli(CLI::App &app, AppConfig &config)
{
    // Required positional argument: MODEL
    app.add_option("MODEL", config.model,
                   "Model-version id, download URL, model page URL (?modelVersionId=) or AIR name")
        ->required();

    // Required positional argument: DESTINATION
    app.add_option("DESTINATION", config.destination,
                   "Destination directory, or a type code configured with --type-dir")
        ->required();

    app.add_option("--type-dir", config.typeDirSpecs,
                   "Map a type code to a directory, e.g. lora=/opt/webui/models/Lora (repeatable)")
        ->allow_extra_args(false) // one CODE=DIR per flag, so positionals aren't swallowed
        ->check([](const std::string &spec) -> std::string {
            size_t eq = spec.find('=');
            if (eq == std::string::npos || eq == 0 || eq + 1 == spec.size())
            {
                return "Type mapping must look like CODE=DIRECTORY";
            }
            return ""; // Empty string = valid
        });

    app.add_option("-t,--token", config.token,
                   "API token (default: $CIVITAI_TOKEN, then ~/.civitai/config)");
    app.add_flag("--token-in-query", config.tokenInQuery,
                 "Send the token as a query parameter instead of an Authorization header");

    app.add_option("-o,--output-name", config.outputName,
                   "Save under this file name instead of the server-provided one");

    app.add_option("-c,--checksum", config.expectedChecksum,
                   "Expected checksum 'algorithm:hexhash' (sha256, autov2, sha1, md5)")
        ->check([](const std::string &cs) -> std::string {
            if (cs.empty()) return "";
            try
            {
                ChecksumSpec::parse(cs);
                return ""; // Valid
            }
            catch (const std::exception &e)
            {
                return std::string("Invalid checksum format: ") + e.what();
            }
        });

    app.add_flag("--force-unsafe", config.forceUnsafe,
                 "Allow downloading non-safetensors files (e.g. .ckpt, .pt). Use with caution.");

    app.add_flag("--mkdir", config.createDirectories,
                 "Create the destination directory if it does not exist");

    // Download endpoint parameters, only applied to URLs built from an id
    app.add_option("--origin", config.resolver.origin, "Origin base URL")
        ->capture_default_str();
    app.add_option("--type", config.resolver.type, "File type query parameter, e.g. Model, VAE");
    app.add_option("--format", config.resolver.format, "Format query parameter, e.g. SafeTensor");
    app.add_option("--size", config.resolver.size, "Size query parameter")
        ->check(CLI::IsMember({"full", "pruned"}));
    app.add_option("--fp", config.resolver.fp, "Floating point precision query parameter, e.g. fp16");

    auto *verbose = app.add_flag("-v,--verbose", config.verbose, "Print diagnostic output");
    app.add_flag("-q,--quiet", config.quiet, "Only print errors")->excludes(verbose);

    // Handled before parsing by isVersionRequest; listed here for --help
    app.add_flag("-V,--version", "Display version information");

    app.set_config("--config", "", "Read options from a TOML or INI file");
}

bool isVersionRequest(int argc, const char *const argv[])
{
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--version" || arg == "-V")
        {
            return true;
        }
    }
    return false;
}

void printVersion()
{
    fmt::print("download-model v1.0\n");
    fmt::print("Built with:\n");
    fmt::print("  - libcurl {}: HTTP/HTTPS support\n", curl_version_info(CURLVERSION_NOW)->version);
    fmt::print("  - CLI11 {}: Command-line parsing\n", CLI11_VERSION);
    fmt::print("  - fmt {}: String formatting\n", FMT_VERSION);
    fmt::print("  - {}: Checksums\n", OpenSSL_version(OPENSSL_VERSION));
}
