#include "fetcher.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <exception>
#include <fstream>
#include <memory>
#include <utility>
#include <fcntl.h>
#include <unistd.h>

#include <fmt/core.h>

#include "errors.hpp"
#include "filename.hpp"
#include "progress.hpp"
#include "text_utils.hpp"
#include "url_utils.hpp"

DownloadRequest::DownloadRequest(std::string rawInput,
                                 std::filesystem::path destinationDirectory,
                                 std::optional<std::string> authToken,
                                 const ModelResolver &resolver)
    : rawInput_(std::move(rawInput)),
      destinationDirectory_(std::move(destinationDirectory)),
      authToken_(std::move(authToken)),
      resolvedUrl_(resolver.resolve(rawInput_))
{
}

namespace
{
    // Require length + 10% free, some filesystems reserve space
    void checkDiskSpace(const std::filesystem::path &directory, std::int64_t requiredBytes)
    {
        if (requiredBytes <= 0)
        {
            return;
        }

        std::error_code ec;
        auto spaceInfo = std::filesystem::space(directory, ec);
        if (ec)
        {
            // Some filesystems don't support space queries
            fmt::print(stderr, "Warning: Unable to check disk space: {}\n", ec.message());
            return;
        }

        std::uintmax_t requiredWithBuffer =
            static_cast<std::uintmax_t>(requiredBytes) + static_cast<std::uintmax_t>(requiredBytes) / 10;
        if (spaceInfo.available < requiredWithBuffer)
        {
            throw DestinationError(
                fmt::format("Insufficient disk space in {}: need {} (+ 10% buffer) but only {} available",
                            directory.string(), formatBytes(requiredBytes),
                            formatBytes(static_cast<std::int64_t>(spaceInfo.available))));
        }
    }

    bool pathExists(const std::filesystem::path &path)
    {
        // symlink_status: a dangling link still occupies the name
        std::error_code ec;
        return std::filesystem::exists(std::filesystem::symlink_status(path, ec));
    }

    // Pickle-based formats (.ckpt, .pt, .bin) can execute code when loaded
    void checkSafeFormat(const std::string &fileName, bool allowUnsafe)
    {
        if (!allowUnsafe && !endsWithIgnoreCase(fileName, ".safetensors"))
        {
            throw TransferError(TransferError::GENERIC_CODE,
                                fmt::format("Refusing to download {}: not a .safetensors file "
                                            "(pass --force-unsafe to allow it)",
                                            fileName));
        }
    }

    /**
     * Writes the response body of one transfer into "<final>.part".
     * Failures are captured and rethrown by Fetcher::fetch once the
     * transport has returned.
     */
    class PartFileSink : public ResponseHandler
    {
    public:
        PartFileSink(const DownloadRequest &request, const FetchOptions &options)
            : request_(request), options_(options)
        {
            if (options_.checksum)
            {
                digest_ = std::make_unique<DigestStream>(options_.checksum->algorithm);
            }
        }

        ~PartFileSink() override
        {
            discard();
        }

        bool onResponse(const HttpResponseInfo &info) override
        {
            responded_ = true;
            info_ = info;

            try
            {
                prepare(info);
                return true;
            }
            catch (const std::exception &)
            {
                // Must not unwind through libcurl; rethrown by Fetcher::fetch
                error_ = std::current_exception();
                return false;
            }
        }

        bool onBody(const char *data, size_t size) override
        {
            out_.write(data, static_cast<std::streamsize>(size));
            if (!out_.good())
            {
                error_ = std::make_exception_ptr(TransferError(
                    TransferError::WRITE_ERROR_CODE,
                    fmt::format("Failed writing to {}", partPath_.string())));
                return false;
            }

            if (digest_)
            {
                try
                {
                    digest_->update(data, size);
                }
                catch (const std::runtime_error &e)
                {
                    error_ = std::make_exception_ptr(IntegrityError(e.what()));
                    return false;
                }
            }

            bytesWritten_ += size;
            return true;
        }

        void onProgress(std::int64_t total, std::int64_t received) override
        {
            if (!progress_)
            {
                return;
            }
            try
            {
                progress_->update(total, received);
            }
            catch (const std::exception &)
            {
                // Progress output failed; keep downloading without it
                progress_.reset();
            }
        }

        void finishProgress()
        {
            if (progress_)
            {
                progress_->finish();
            }
        }

        // Flush and close the part file, then link it under the final name
        TransferResult commit()
        {
            out_.close();
            if (out_.fail())
            {
                throw TransferError(TransferError::WRITE_ERROR_CODE,
                                    fmt::format("Failed writing to {}", partPath_.string()));
            }

            if (info_.contentLength >= 0 &&
                bytesWritten_ != static_cast<std::uint64_t>(info_.contentLength))
            {
                throw TransferError(TransferError::PARTIAL_FILE_CODE,
                                    fmt::format("File size mismatch: expected {} but got {}",
                                                formatBytes(info_.contentLength),
                                                formatBytes(static_cast<std::int64_t>(bytesWritten_))));
            }

            TransferResult result;
            if (digest_)
            {
                result.digestHex = digest_->finalHex();
                if (!options_.checksum->matches(result.digestHex))
                {
                    throw IntegrityError(
                        fmt::format("{} checksum mismatch for {}: expected {} but got {}",
                                    options_.checksum->algorithmName(), finalPath_.filename().string(),
                                    options_.checksum->hex, result.digestHex));
                }
            }

            publish();

            // rw-r--r--, readable by the tool that loads the model
            std::error_code permissionError;
            std::filesystem::permissions(finalPath_,
                                         std::filesystem::perms::owner_read |
                                             std::filesystem::perms::owner_write |
                                             std::filesystem::perms::group_read |
                                             std::filesystem::perms::others_read,
                                         permissionError);
            if (permissionError)
            {
                fmt::print(stderr, "Warning: Could not set permissions on {}: {}\n",
                           finalPath_.string(), permissionError.message());
            }

            result.success = true;
            result.bytesWritten = bytesWritten_;
            result.finalPath = finalPath_;
            return result;
        }

        // Remove the part file, if this transfer created one. Never throws.
        void discard() noexcept
        {
            if (out_.is_open())
            {
                out_.close();
            }
            if (partCreated_)
            {
                partCreated_ = false;
                if (::unlink(partPath_.c_str()) != 0 && errno != ENOENT)
                {
                    std::fprintf(stderr, "Warning: Could not remove partial file %s: %s\n",
                                 partPath_.c_str(), std::strerror(errno));
                }
            }
        }

        bool responded() const { return responded_; }
        std::exception_ptr error() const { return error_; }

    private:
        // O_EXCL: a <name>.part that is already there belongs to someone else
        void createPartFile()
        {
            int fd = ::open(partPath_.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
            if (fd < 0)
            {
                int error = errno;
                if (error == EEXIST)
                {
                    throw AlreadyExistsError(partPath_);
                }
                throw DestinationError(fmt::format("Cannot create {}: {}", partPath_.string(),
                                                   std::strerror(error)));
            }
            ::close(fd);
            partCreated_ = true;

            out_.open(partPath_, std::ios::binary);
            if (!out_)
            {
                throw DestinationError(fmt::format("Cannot open file for writing: {}", partPath_.string()));
            }
        }

        /**
         * Give the finished part file its final name without replacing
         * anything: link() fails with EEXIST if the name was taken while
         * the body was streaming.
         */
        void publish()
        {
            if (::link(partPath_.c_str(), finalPath_.c_str()) == 0)
            {
                discard();
                return;
            }

            int error = errno;
            if (error == EEXIST)
            {
                throw AlreadyExistsError(finalPath_);
            }
            // Filesystems without hard links (FAT, some network mounts)
            if (error != EPERM && error != EOPNOTSUPP && error != ENOSYS)
            {
                throw DestinationError(fmt::format("Failed to link {} to {}: {}", partPath_.string(),
                                                   finalPath_.string(), std::strerror(error)));
            }
            if (pathExists(finalPath_))
            {
                throw AlreadyExistsError(finalPath_);
            }

            std::error_code ec;
            std::filesystem::rename(partPath_, finalPath_, ec);
            if (ec)
            {
                throw DestinationError(fmt::format("Failed to rename {} to {}: {}",
                                                   partPath_.string(), finalPath_.string(), ec.message()));
            }
            partCreated_ = false;
        }

        void prepare(const HttpResponseInfo &info)
        {
            const std::string shownUrl = redactUrl(info.effectiveUrl.empty() ? request_.resolvedUrl()
                                                                              : info.effectiveUrl);
            if (options_.verbose)
            {
                fmt::print("Response: {} {} from {}\n", info.statusCode, httpStatusText(info.statusCode), shownUrl);
                if (info.redirectCount > 0)
                {
                    fmt::print("Redirected {} time{}\n", info.redirectCount, info.redirectCount == 1 ? "" : "s");
                }
            }

            if (info.statusCode < 200 || info.statusCode >= 300)
            {
                throw TransferError(TransferError::HTTP_STATUS_CODE, describeStatus(info.statusCode));
            }

            const std::string contentType = toLower(info.header("content-type"));
            if (contentType.find("text/html") != std::string::npos)
            {
                throw TransferError(TransferError::GENERIC_CODE,
                                    "Received an HTML page instead of a file. "
                                    "Possibly an invalid token or an expired link.");
            }

            std::string name;
            if (options_.outputName)
            {
                name = *options_.outputName;
            }
            else
            {
                const std::string disposition = info.header("content-disposition");
                name = filenameFromContentDisposition(disposition);
                if (options_.verbose && !disposition.empty())
                {
                    fmt::print("Content-Disposition: {}\n", disposition);
                }
                if (name.empty())
                {
                    name = lastPathSegment(info.effectiveUrl.empty() ? request_.resolvedUrl()
                                                                     : info.effectiveUrl);
                }
            }

            const std::string fileName = sanitizeFilename(name);
            checkSafeFormat(fileName, options_.allowUnsafe);

            finalPath_ = request_.destinationDirectory() / fileName;
            if (pathExists(finalPath_))
            {
                throw AlreadyExistsError(finalPath_);
            }

            checkDiskSpace(request_.destinationDirectory(), info.contentLength);

            partPath_ = finalPath_;
            partPath_ += ".part";
            createPartFile();

            if (options_.showProgress)
            {
                progress_ = std::make_unique<ProgressMeter>(finalPath_.filename().string());
            }
        }

        std::string describeStatus(long statusCode) const
        {
            const std::string status = fmt::format("{} {}", statusCode, httpStatusText(statusCode));
            const std::string url = redactUrl(request_.resolvedUrl());

            if (statusCode == 401 || statusCode == 403)
            {
                return fmt::format("Access denied ({}) for {}. {}", status, url,
                                   request_.authToken()
                                       ? "Check that the API token is valid."
                                       : "The model may require an API token: set CIVITAI_TOKEN or pass --token.");
            }
            if (statusCode == 404 || statusCode == 410)
            {
                return fmt::format("Resource not found ({}) for {}", status, url);
            }
            if (statusCode >= 500)
            {
                return fmt::format("Server error ({}) for {}", status, url);
            }
            return fmt::format("HTTP error {} for {}", status, url);
        }

        const DownloadRequest &request_;
        const FetchOptions &options_;

        HttpResponseInfo info_;
        std::filesystem::path finalPath_;
        std::filesystem::path partPath_;
        std::ofstream out_;
        bool partCreated_ = false;
        bool responded_ = false;
        std::uint64_t bytesWritten_ = 0;

        std::unique_ptr<DigestStream> digest_;
        std::unique_ptr<ProgressMeter> progress_;
        std::exception_ptr error_;
    };
}

Fetcher::Fetcher(Transport &transport, FetchOptions options)
    : transport_(transport), options_(std::move(options))
{
}

TransferResult Fetcher::fetch(const DownloadRequest &request)
{
    checkDestination(request.destinationDirectory(), options_.createDirectories);

    // A fixed name can be checked without touching the network
    if (options_.outputName)
    {
        const std::string fileName = sanitizeFilename(*options_.outputName);
        checkSafeFormat(fileName, options_.allowUnsafe);

        auto target = request.destinationDirectory() / fileName;
        if (pathExists(target))
        {
            throw AlreadyExistsError(target);
        }
    }

    HttpRequest httpRequest = buildHttpRequest(request);
    if (options_.verbose)
    {
        fmt::print("GET {}\n", redactUrl(httpRequest.url));
    }

    PartFileSink sink(request, options_);
    TransportResult result = transport_.get(httpRequest, sink);
    sink.finishProgress();

    if (sink.error())
    {
        sink.discard();
        std::rethrow_exception(sink.error());
    }
    if (!result.ok())
    {
        sink.discard();
        throw TransferError(result.code, fmt::format("Download failed: {}", result.message));
    }
    if (!sink.responded())
    {
        throw TransferError(TransferError::GENERIC_CODE, "Download failed: no response received");
    }

    try
    {
        return sink.commit();
    }
    catch (const DownloadError &)
    {
        sink.discard();
        throw;
    }
}

void Fetcher::checkDestination(const std::filesystem::path &directory, bool createDirectories)
{
    std::error_code ec;
    if (!std::filesystem::exists(directory, ec))
    {
        if (!createDirectories)
        {
            throw DestinationError(fmt::format("Destination directory does not exist: {}", directory.string()));
        }

        // Create all parent directories (like mkdir -p)
        std::filesystem::create_directories(directory, ec);
        if (ec)
        {
            throw DestinationError(fmt::format("Failed to create directory {}: {}",
                                               directory.string(), ec.message()));
        }
    }

    if (!std::filesystem::is_directory(directory, ec))
    {
        throw DestinationError(fmt::format("Destination is not a directory: {}", directory.string()));
    }

    if (::access(directory.c_str(), W_OK) != 0)
    {
        throw DestinationError(fmt::format("Destination directory is not writable: {}", directory.string()));
    }
}

HttpRequest Fetcher::buildHttpRequest(const DownloadRequest &request) const
{
    HttpRequest httpRequest;
    httpRequest.url = request.resolvedUrl();
    httpRequest.userAgent = USER_AGENT;

    if (request.authToken() && !request.authToken()->empty())
    {
        if (options_.tokenInQuery)
        {
            httpRequest.url = appendQueryParameter(httpRequest.url, "token", *request.authToken());
        }
        else
        {
            httpRequest.headers.push_back("Authorization: Bearer " + *request.authToken());
        }
    }
    return httpRequest;
}
