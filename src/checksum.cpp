#include "checksum.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <fmt/core.h>

namespace
{
    const EVP_MD *digestFor(ChecksumSpec::Algorithm algorithm)
    {
        switch (algorithm)
        {
        case ChecksumSpec::Algorithm::SHA1:
            return EVP_sha1();
        case ChecksumSpec::Algorithm::MD5:
            return EVP_md5();
        case ChecksumSpec::Algorithm::SHA256:
        case ChecksumSpec::Algorithm::AutoV2:
        default:
            return EVP_sha256();
        }
    }

    // Lowercase, drop whitespace and ':'/'-' separators, reject anything else
    std::string normalizeHex(const std::string &hex)
    {
        std::string result;
        result.reserve(hex.length());

        for (char ch : hex)
        {
            unsigned char byte = static_cast<unsigned char>(ch);
            if (std::isspace(byte) || ch == ':' || ch == '-')
            {
                continue;
            }
            if (!std::isxdigit(byte))
            {
                throw std::runtime_error(fmt::format("Invalid character in checksum: '{}'", ch));
            }
            result += static_cast<char>(std::tolower(byte));
        }
        return result;
    }

    std::string toHex(const unsigned char *data, size_t size)
    {
        std::ostringstream oss;
        oss << std::hex << std::setfill('0');
        for (size_t i = 0; i < size; ++i)
        {
            oss << std::setw(2) << static_cast<unsigned int>(data[i]);
        }
        return oss.str();
    }
}

ChecksumSpec ChecksumSpec::parse(const std::string &text)
{
    size_t colonPos = text.find(':');
    if (colonPos == std::string::npos)
    {
        throw std::runtime_error("Invalid checksum format. Expected 'algorithm:hexhash'");
    }

    std::string algorithmStr = text.substr(0, colonPos);
    std::transform(algorithmStr.begin(), algorithmStr.end(), algorithmStr.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    ChecksumSpec spec;
    size_t expectedLength = 0;
    if (algorithmStr == "sha256")
    {
        spec.algorithm = Algorithm::SHA256;
        expectedLength = 64;
    }
    else if (algorithmStr == "autov2")
    {
        spec.algorithm = Algorithm::AutoV2;
        expectedLength = 10;
    }
    else if (algorithmStr == "sha1")
    {
        spec.algorithm = Algorithm::SHA1;
        expectedLength = 40;
    }
    else if (algorithmStr == "md5")
    {
        spec.algorithm = Algorithm::MD5;
        expectedLength = 32;
    }
    else
    {
        throw std::runtime_error(fmt::format("Unsupported algorithm: '{}'", algorithmStr));
    }

    spec.hex = normalizeHex(text.substr(colonPos + 1));
    if (spec.hex.length() != expectedLength)
    {
        throw std::runtime_error(
            fmt::format("Invalid {} hash length. Expected {} hex characters, got {}",
                        algorithmStr, expectedLength, spec.hex.length()));
    }
    return spec;
}

bool ChecksumSpec::matches(const std::string &digestHex) const
{
    if (algorithm == Algorithm::AutoV2)
    {
        return digestHex.compare(0, hex.size(), hex) == 0;
    }
    return digestHex == hex;
}

std::string ChecksumSpec::algorithmName() const
{
    switch (algorithm)
    {
    case Algorithm::AutoV2:
        return "AutoV2";
    case Algorithm::SHA1:
        return "SHA-1";
    case Algorithm::MD5:
        return "MD5";
    case Algorithm::SHA256:
    default:
        return "SHA-256";
    }
}

DigestStream::DigestStream(ChecksumSpec::Algorithm algorithm)
    : context_(EVP_MD_CTX_new(), EVP_MD_CTX_free)
{
    if (!context_)
    {
        throw std::runtime_error("Failed to create OpenSSL context");
    }
    if (EVP_DigestInit_ex(context_.get(), digestFor(algorithm), nullptr) != 1)
    {
        throw std::runtime_error("Failed to initialize digest");
    }
}

void DigestStream::update(const char *data, size_t size)
{
    if (finished_)
    {
        throw std::runtime_error("Digest already finalized");
    }
    if (EVP_DigestUpdate(context_.get(), data, size) != 1)
    {
        throw std::runtime_error("Failed to update digest");
    }
}

std::string DigestStream::finalHex()
{
    if (finished_)
    {
        throw std::runtime_error("Digest already finalized");
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLength = 0;
    if (EVP_DigestFinal_ex(context_.get(), hash, &hashLength) != 1)
    {
        throw std::runtime_error("Failed to finalize digest");
    }
    finished_ = true;
    return toHex(hash, hashLength);
}
