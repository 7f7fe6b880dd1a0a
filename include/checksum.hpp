#pragma once

#include <string>
#include <vector>
#include <filesystem>

/**
 * Integrity check for the combined video against a user-supplied digest.
 */
class ChecksumVerifier
{
public:
    /**
     * Supported hash algorithms.
     */
    enum class Algorithm
    {
        SHA256,
        SHA1,
        MD5
    };

    /**
     * Parsed "algorithm:hexhash" expectation.
     */
    struct Expectation
    {
        Algorithm algorithm;
        std::string hex; // Lower-case, separators removed
    };

    /**
     * Parse "sha256:abc123...", "sha1:..." or "md5:...".
     *
     * @throws std::runtime_error if the format, algorithm or length is wrong
     */
    static Expectation parse(const std::string &checksum);

    /**
     * Hash a file in 1 MB chunks.
     *
     * @return Lower-case hex digest
     * @throws std::runtime_error if the file cannot be read or OpenSSL fails
     */
    static std::string digestFile(const std::filesystem::path &filePath, Algorithm algorithm);

    /**
     * @return true if the file matches the expected "algorithm:hexhash"
     * @throws std::runtime_error on a malformed expectation or unreadable file
     */
    static bool verify(const std::filesystem::path &filePath, const std::string &expectedChecksum);

    /**
     * Move a file that failed verification into "<dir>/quarantine/".
     *
     * @return New location
     * @throws std::filesystem::filesystem_error if the move fails
     */
    static std::filesystem::path quarantine(const std::filesystem::path &filePath);

    static const char *algorithmName(Algorithm algorithm);

private:
    /**
     * Lower-case hex digits only; ':' '-' and whitespace are dropped.
     * @throws std::runtime_error on any other character
     */
    static std::string normalizeHex(const std::string &hex);

    static std::string toHex(const unsigned char *data, std::size_t length);

    // Chunk size for file reading (1 MB)
    static constexpr size_t CHUNK_SIZE = 1024 * 1024;
};
