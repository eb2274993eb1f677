#include "checksum.hpp"
#include "test_support.hpp"

int main()
{
    try
    {
        const std::string abcSha256 = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

        // Test 1: streaming digest over several chunks equals the one-shot digest
        DigestStream chunked(ChecksumSpec::Algorithm::SHA256);
        chunked.update("a", 1);
        chunked.update("bc", 2);
        std::string hash = chunked.finalHex();
        fmt::print("Computed SHA-256: {}\n", hash);
        check(hash == abcSha256, "SHA-256 of \"abc\"");

        DigestStream md5(ChecksumSpec::Algorithm::MD5);
        md5.update("abc", 3);
        check(md5.finalHex() == "900150983cd24fb0d6963f7d28e17f72", "MD5 of \"abc\"");

        DigestStream sha1(ChecksumSpec::Algorithm::SHA1);
        sha1.update("abc", 3);
        check(sha1.finalHex() == "a9993e364706816aba3e25717850c26c9cd0d89d", "SHA-1 of \"abc\"");

        check(throwsError<std::runtime_error>([&] { chunked.update("x", 1); }),
              "Finalized digest rejects more data");

        // Test 2: parsing
        auto spec = ChecksumSpec::parse("SHA256:" + std::string("BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD"));
        check(spec.algorithm == ChecksumSpec::Algorithm::SHA256 && spec.hex == abcSha256,
              "Algorithm and hex are normalized to lowercase");
        check(spec.matches(abcSha256), "Full SHA-256 matches");
        check(!spec.matches(std::string(64, '0')), "Wrong SHA-256 rejected");

        auto autoV2 = ChecksumSpec::parse("autov2:BA7816BF8F");
        check(autoV2.algorithm == ChecksumSpec::Algorithm::AutoV2, "AutoV2 parsed");
        check(autoV2.matches(abcSha256), "AutoV2 matches the SHA-256 prefix");
        check(!ChecksumSpec::parse("autov2:0000000000").matches(abcSha256), "Wrong AutoV2 rejected");

        check(throwsError<std::runtime_error>([] { ChecksumSpec::parse("ba7816bf"); }),
              "Missing algorithm rejected");
        check(throwsError<std::runtime_error>([] { ChecksumSpec::parse("crc32:12345678"); }),
              "Unsupported algorithm rejected");
        check(throwsError<std::runtime_error>([] { ChecksumSpec::parse("sha256:abc"); }),
              "Short SHA-256 rejected");
        check(throwsError<std::runtime_error>([] { ChecksumSpec::parse("md5:zz0150983cd24fb0d6963f7d28e17f72"); }),
              "Non-hex characters rejected");
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        return 1;
    }

    return finishTests();
}
