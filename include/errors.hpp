#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

/**
 * Base class for every failure of a download invocation.
 * Each failure is terminal; exitCode() is what the process returns.
 */
class DownloadError : public std::runtime_error
{
public:
    explicit DownloadError(const std::string &message) : std::runtime_error(message) {}

    virtual int exitCode() const { return 1; }
};

/**
 * The raw input is not a model id, download URL, page URL or AIR string.
 */
class InvalidInputError : public DownloadError
{
public:
    explicit InvalidInputError(const std::string &input);

    const std::string &input() const { return input_; }

private:
    std::string input_;
};

/**
 * The destination file is already present. Nothing was written.
 */
class AlreadyExistsError : public DownloadError
{
public:
    explicit AlreadyExistsError(const std::filesystem::path &path);

    const std::filesystem::path &path() const { return path_; }

private:
    std::filesystem::path path_;
};

/**
 * Network or HTTP failure. code() carries the transport's own error code
 * (a CURLcode value for the libcurl transport).
 */
class TransferError : public DownloadError
{
public:
    // Codes for failures detected outside the transport, numbered like
    // libcurl's so the exit status reads the same as curl's
    static constexpr int GENERIC_CODE = 1;
    static constexpr int PARTIAL_FILE_CODE = 18;  // CURLE_PARTIAL_FILE
    static constexpr int HTTP_STATUS_CODE = 22;   // CURLE_HTTP_RETURNED_ERROR
    static constexpr int WRITE_ERROR_CODE = 23;   // CURLE_WRITE_ERROR

    TransferError(int code, const std::string &message);

    int code() const { return code_; }

    // Clamped to 1..255 so it survives as a process exit status.
    int exitCode() const override;

private:
    int code_;
};

/**
 * Destination directory missing, not a directory, not writable or full.
 */
class DestinationError : public DownloadError
{
public:
    using DownloadError::DownloadError;
};

/**
 * Downloaded bytes do not match the expected checksum.
 */
class IntegrityError : public DownloadError
{
public:
    using DownloadError::DownloadError;
};
