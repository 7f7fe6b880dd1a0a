#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <optional> // C++17 feature for optional values

using HeaderMap = std::map<std::string, std::string>;

/**
 * Security and timing bounds applied to every download attempt.
 */
struct DownloadLimits
{
    std::size_t maxSegments = 1000;                  // Truncation point for resolved playlists
    std::uint64_t maxSegmentBytes = 10 * 1024 * 1024; // 10 MB per segment
    std::size_t chunkBytes = 8192;                   // Receive buffer size
    int requestTimeoutSeconds = 30;                  // Per HTTP call
    int assemblyTimeoutSeconds = 300;                // ffmpeg concat
    int maxPlaylistHops = 5;                         // Nested master playlists followed
    int maxRetries = 0;                              // Transport retries for transient errors
};

/**
 * Headers sent when the user did not supply a captured request.
 */
inline HeaderMap defaultRequestHeaders()
{
    return {
        {"User-Agent", "Mozilla/5.0 (Macintosh; Intel Mac OS X 10.15; rv:137.0) Gecko/20100101 Firefox/137.0"},
        {"Accept", "*/*"},
        {"Accept-Language", "en-US,en;q=0.5"},
    };
}

/**
 * Configuration for the HLS downloader.
 * Populated by CLI11 argument parser from command-line arguments.
 */
struct DownloadConfig
{
    // Required parameters
    std::string input; // Playlist URL or captured curl command

    // Output
    std::optional<std::string> outputName;
    std::string outputDir = "downloads";

    // Transcription
    bool transcript = false;
    std::string transcriptModel = "medium";

    // Network / safety bounds
    DownloadLimits limits;
    std::optional<std::string> segmentOrigin; // Overrides origin for "/"-rooted segments
    int maxSegmentMegabytes = 10;

    // Checksum verification of the combined file (optional)
    std::optional<std::string> expectedChecksum; // Format: "sha256:abc123..."

    // Flags
    bool curlMode = false;
    bool verbose = false;
    bool showVersion = false; // Display version and exit
};
