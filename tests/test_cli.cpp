#include <cstdlib>

#include "app.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "test_support.hpp"

namespace
{
    // Parse argv with a fresh app; returns false on a CLI11 parse error
    bool parseArgs(const std::vector<const char *> &args, AppConfig &config)
    {
        CLI::App app{"test"};
        configureCli(app, config);
        try
        {
            app.parse(static_cast<int>(args.size()), args.data());
            return true;
        }
        catch (const CLI::ParseError &e)
        {
            fmt::print("  parse error: {}\n", e.what());
            return false;
        }
    }

    void testParsing()
    {
        AppConfig config;
        bool parsed = parseArgs({"download-model", "46846", "/models/Lora",
                                 "--type-dir", "lora=/opt/webui/models/Lora",
                                 "--type-dir", "ckpt=/opt/webui/models/Stable-diffusion",
                                 "--token", "abc", "--token-in-query", "--format", "SafeTensor",
                                 "--size", "pruned", "-o", "x.safetensors", "--mkdir", "-v"},
                                config);
        check(parsed, "Full command line parses");
        check(config.model == "46846" && config.destination == "/models/Lora", "Positionals bound");
        check(config.typeDirSpecs.size() == 2, "Repeated --type-dir collected");
        check(config.token == std::optional<std::string>("abc") && config.tokenInQuery, "Token options bound");
        check(config.resolver.format == std::optional<std::string>("SafeTensor") &&
                  config.resolver.size == std::optional<std::string>("pruned"),
              "Resolver options bound");
        check(config.outputName == std::optional<std::string>("x.safetensors") && config.createDirectories &&
                  config.verbose,
              "Output options bound");
        check(config.resolver.origin == "https://civitai.com", "Default origin kept");
        check(!config.forceUnsafe, "Unsafe formats refused by default");

        AppConfig unsafe;
        check(parseArgs({"download-model", "46846", "/tmp", "--force-unsafe"}, unsafe) && unsafe.forceUnsafe,
              "--force-unsafe bound");

        AppConfig missing;
        check(!parseArgs({"download-model", "46846"}, missing), "DESTINATION is required");

        AppConfig badMap;
        check(!parseArgs({"download-model", "1", "lora", "--type-dir", "lora"}, badMap),
              "Malformed --type-dir rejected");

        AppConfig badChecksum;
        check(!parseArgs({"download-model", "1", "/tmp", "--checksum", "sha256:xyz"}, badChecksum),
              "Malformed --checksum rejected");

        AppConfig badSize;
        check(!parseArgs({"download-model", "1", "/tmp", "--size", "huge"}, badSize),
              "Unknown --size rejected");

        AppConfig both;
        check(!parseArgs({"download-model", "1", "/tmp", "-v", "-q"}, both), "--verbose and --quiet exclude");

        const char *versionArgs[] = {"download-model", "--version"};
        check(isVersionRequest(2, versionArgs), "--version detected before parsing");
    }

    void testConfigFile()
    {
        TempDir dir;
        auto file = dir.path() / "download-model.toml";
        writeFile(file,
                  "type-dir = [\"lora=/opt/webui/models/Lora\", \"embedding=/opt/webui/embeddings\"]\n"
                  "format = \"SafeTensor\"\n");

        AppConfig config;
        std::string fileArg = file.string();
        check(parseArgs({"download-model", "46846", "embedding", "--config", fileArg.c_str()}, config),
              "Config file parses");
        check(config.typeDirSpecs.size() == 2, "Type map read from config file");
        check(config.resolver.format == std::optional<std::string>("SafeTensor"), "Option read from config file");
        check(resolveDestination(config) == std::filesystem::path("/opt/webui/embeddings"),
              "Type code maps to its directory");
    }

    void testDestinationMapping()
    {
        AppConfig config;
        config.typeDirSpecs = {"lora=/a", "lora=/b", "vae=/v"};

        config.destination = "lora";
        check(resolveDestination(config) == std::filesystem::path("/b"), "Later mapping wins");

        config.destination = "/some/dir";
        check(resolveDestination(config) == std::filesystem::path("/some/dir"), "Unknown code is a path");

        check(throwsError<std::invalid_argument>([] { parseTypeDirectories({"=dir"}); }),
              "Empty type code rejected");
    }

    void testTokenLookup()
    {
        TempDir dir;
        auto tokenFile = dir.path() / "config";
        writeFile(tokenFile, "  file-token\n");

        unsetenv("CIVITAI_TOKEN");
        check(loadAuthToken(std::string("cli-token"), tokenFile) == std::optional<std::string>("cli-token"),
              "Command-line token wins");
        check(loadAuthToken(std::nullopt, tokenFile) == std::optional<std::string>("file-token"),
              "Token file used and trimmed");

        setenv("CIVITAI_TOKEN", "env-token", 1);
        check(loadAuthToken(std::nullopt, tokenFile) == std::optional<std::string>("env-token"),
              "Environment beats token file");
        unsetenv("CIVITAI_TOKEN");

        check(!loadAuthToken(std::nullopt, dir.path() / "absent"), "No token anywhere means none");
    }

    void testExitCodes()
    {
        TempDir out;

        AppConfig config;
        config.model = "46846";
        config.destination = out.path().string();
        config.quiet = true;

        MockTransport ok;
        ok.response.headers["content-disposition"] = "attachment; filename=\"model.safetensors\"";
        ok.chunks = {"B"};
        check(runDownload(config, std::nullopt, ok) == 0, "Success exits 0");
        check(readFile(out.path() / "model.safetensors") == "B", "runDownload writes the file");

        MockTransport again;
        again.response.headers["content-disposition"] = "attachment; filename=\"model.safetensors\"";
        again.chunks = {"C"};
        check(runDownload(config, std::nullopt, again) == 1, "Existing file exits 1");

        AppConfig invalid = config;
        invalid.model = "nope";
        MockTransport untouched;
        check(runDownload(invalid, std::nullopt, untouched) == 1 && untouched.calls == 0,
              "Invalid input exits 1 without a request");

        AppConfig other = config;
        TempDir empty;
        other.destination = empty.path().string();
        MockTransport unreachable;
        unreachable.response.headers["content-disposition"] = "attachment; filename=\"model.safetensors\"";
        unreachable.failAfterChunks = 0;
        unreachable.failure = {6, "Couldn't resolve host name"}; // CURLE_COULDNT_RESOLVE_HOST
        check(runDownload(other, std::nullopt, unreachable) == 6, "Transport code becomes the exit code");

        MockTransport notFound;
        notFound.response.statusCode = 404;
        check(runDownload(other, std::nullopt, notFound) == TransferError::HTTP_STATUS_CODE,
              "HTTP error status exits 22");

        MockTransport pickle;
        pickle.response.headers["content-disposition"] = "attachment; filename=\"model.ckpt\"";
        pickle.chunks = {"P"};
        check(runDownload(other, std::nullopt, pickle) == 1 && empty.entryCount() == 0,
              "Non-safetensors file exits 1 and writes nothing");

        AppConfig forced = other;
        forced.forceUnsafe = true;
        MockTransport pickleAgain;
        pickleAgain.response.headers["content-disposition"] = "attachment; filename=\"model.ckpt\"";
        pickleAgain.chunks = {"P"};
        check(runDownload(forced, std::nullopt, pickleAgain) == 0 &&
                  readFile(empty.path() / "model.ckpt") == "P",
              "--force-unsafe downloads a non-safetensors file");

        check(TransferError(300, "x").exitCode() == 255 && TransferError(0, "x").exitCode() == 1,
              "Exit code clamped to 1..255");
    }
}

int main()
{
    try
    {
        testParsing();
        testConfigFile();
        testDestinationMapping();
        testTokenLookup();
        testExitCodes();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        return 1;
    }

    return finishTests();
}
