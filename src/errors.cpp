#include "errors.hpp"

#include <fmt/core.h>

InvalidInputError::InvalidInputError(const std::string &input)
    : DownloadError(fmt::format("not a recognized model identifier or download URL: '{}'", input)),
      input_(input)
{
}

AlreadyExistsError::AlreadyExistsError(const std::filesystem::path &path)
    : DownloadError(fmt::format("File already exists, refusing to overwrite: {}", path.string())),
      path_(path)
{
}

TransferError::TransferError(int code, const std::string &message)
    : DownloadError(message), code_(code)
{
}

int TransferError::exitCode() const
{
    if (code_ <= 0)
    {
        return 1;
    }
    return code_ > 255 ? 255 : code_;
}
