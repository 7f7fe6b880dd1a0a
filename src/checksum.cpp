#include "checksum.hpp"
#include <fstream>
#include <algorithm>
#include <cctype>
#include <memory>
#include <stdexcept>
#include <fmt/core.h>

// OpenSSL EVP digests
#include <openssl/evp.h>

namespace
{
    const EVP_MD *digestFor(ChecksumVerifier::Algorithm algorithm)
    {
        switch (algorithm)
        {
        case ChecksumVerifier::Algorithm::SHA256:
            return EVP_sha256();
        case ChecksumVerifier::Algorithm::SHA1:
            return EVP_sha1();
        case ChecksumVerifier::Algorithm::MD5:
            return EVP_md5();
        }
        return nullptr;
    }

    std::size_t hexLengthFor(ChecksumVerifier::Algorithm algorithm)
    {
        switch (algorithm)
        {
        case ChecksumVerifier::Algorithm::SHA256:
            return 64; // 256 bits / 4 bits per hex digit
        case ChecksumVerifier::Algorithm::SHA1:
            return 40;
        case ChecksumVerifier::Algorithm::MD5:
            return 32;
        }
        return 0;
    }
}

const char *ChecksumVerifier::algorithmName(Algorithm algorithm)
{
    switch (algorithm)
    {
    case Algorithm::SHA256:
        return "sha256";
    case Algorithm::SHA1:
        return "sha1";
    case Algorithm::MD5:
        return "md5";
    }
    return "unknown";
}

ChecksumVerifier::Expectation ChecksumVerifier::parse(const std::string &checksum)
{
    size_t colonPos = checksum.find(':');
    if (colonPos == std::string::npos)
    {
        throw std::runtime_error("Invalid checksum format. Expected 'algorithm:hexhash'");
    }

    std::string name = checksum.substr(0, colonPos);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    Algorithm algorithm;
    if (name == "sha256")
    {
        algorithm = Algorithm::SHA256;
    }
    else if (name == "sha1")
    {
        algorithm = Algorithm::SHA1;
    }
    else if (name == "md5")
    {
        algorithm = Algorithm::MD5;
    }
    else
    {
        throw std::runtime_error(fmt::format("Unsupported algorithm: '{}'", name));
    }

    std::string hex = normalizeHex(checksum.substr(colonPos + 1));
    if (hex.length() != hexLengthFor(algorithm))
    {
        throw std::runtime_error(
            fmt::format("Invalid {} hash length. Expected {} hex characters, got {}",
                        name, hexLengthFor(algorithm), hex.length()));
    }

    return {algorithm, hex};
}

std::string ChecksumVerifier::digestFile(const std::filesystem::path &filePath, Algorithm algorithm)
{
    std::ifstream file(filePath, std::ios::binary);
    if (!file)
    {
        throw std::runtime_error(
            fmt::format("Cannot open file for checksum: {}", filePath.string()));
    }

    // RAII wrapper to ensure context is freed even if exception occurs
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> context(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!context)
    {
        throw std::runtime_error("Failed to create OpenSSL context");
    }

    if (EVP_DigestInit_ex(context.get(), digestFor(algorithm), nullptr) != 1)
    {
        throw std::runtime_error(fmt::format("Failed to initialize {} digest", algorithmName(algorithm)));
    }

    std::vector<char> buffer(CHUNK_SIZE);
    while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || file.gcount() > 0)
    {
        if (EVP_DigestUpdate(context.get(), buffer.data(), static_cast<size_t>(file.gcount())) != 1)
        {
            throw std::runtime_error(fmt::format("Failed to update {} digest", algorithmName(algorithm)));
        }
    }

    if (file.bad())
    {
        throw std::runtime_error(fmt::format("Read error while hashing {}", filePath.string()));
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLength = 0;
    if (EVP_DigestFinal_ex(context.get(), hash, &hashLength) != 1)
    {
        throw std::runtime_error(fmt::format("Failed to finalize {} digest", algorithmName(algorithm)));
    }

    return toHex(hash, hashLength);
}

bool ChecksumVerifier::verify(const std::filesystem::path &filePath, const std::string &expectedChecksum)
{
    Expectation expected = parse(expectedChecksum);
    return digestFile(filePath, expected.algorithm) == expected.hex;
}

std::filesystem::path ChecksumVerifier::quarantine(const std::filesystem::path &filePath)
{
    std::filesystem::path quarantineDir = filePath.parent_path() / "quarantine";
    std::filesystem::create_directories(quarantineDir);

    std::filesystem::path target = quarantineDir / filePath.filename();
    std::filesystem::rename(filePath, target);
    return target;
}

std::string ChecksumVerifier::toHex(const unsigned char *data, std::size_t length)
{
    static const char digits[] = "0123456789abcdef";

    std::string result;
    result.reserve(length * 2);
    for (std::size_t i = 0; i < length; ++i)
    {
        result += digits[data[i] >> 4];
        result += digits[data[i] & 0x0f];
    }
    return result;
}

std::string ChecksumVerifier::normalizeHex(const std::string &hex)
{
    std::string result;
    result.reserve(hex.length());

    for (char ch : hex)
    {
        unsigned char uch = static_cast<unsigned char>(ch);

        // Skip whitespace and common separators
        if (std::isspace(uch) || ch == ':' || ch == '-')
        {
            continue;
        }

        if (!std::isxdigit(uch))
        {
            throw std::runtime_error(
                fmt::format("Invalid character in checksum: '{}'", ch));
        }
        result += static_cast<char>(std::tolower(uch));
    }

    return result;
}
