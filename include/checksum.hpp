#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include <openssl/evp.h>

/**
 * Expected checksum given on the command line as "algorithm:hexhash".
 */
struct ChecksumSpec
{
    enum class Algorithm
    {
        SHA256,
        AutoV2, // Civitai short hash: first 10 hex digits of SHA-256
        SHA1,
        MD5
    };

    Algorithm algorithm = Algorithm::SHA256;
    std::string hex; // lowercase, no separators

    /**
     * Parse "sha256:abc123...", "autov2:0123456789", "sha1:...", "md5:...".
     * @throws std::runtime_error if the format, algorithm or length is wrong
     */
    static ChecksumSpec parse(const std::string &text);

    /**
     * True if a full digest (as produced by DigestStream) satisfies this spec.
     */
    bool matches(const std::string &digestHex) const;

    std::string algorithmName() const;
};

/**
 * Incremental digest over the bytes of a download, fed chunk by chunk so the
 * artifact never has to be read back from disk.
 */
class DigestStream
{
public:
    explicit DigestStream(ChecksumSpec::Algorithm algorithm);

    DigestStream(const DigestStream &) = delete;
    DigestStream &operator=(const DigestStream &) = delete;

    /**
     * @throws std::runtime_error on OpenSSL failure
     */
    void update(const char *data, size_t size);

    /**
     * Hex-encoded digest. The stream cannot be updated afterwards.
     */
    std::string finalHex();

private:
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> context_;
    bool finished_ = false;
};
