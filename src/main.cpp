#include <cstdint>
#include <cstdio>
#include <iostream>
#include <string>
#include <fmt/core.h>
#include <CLI/CLI.hpp> // CLI11 main header
#include "assembler.hpp"
#include "checksum.hpp"
#include "config.hpp"
#include "diagnostics.hpp"
#include "http_client.hpp"
#include "output.hpp"
#include "pipeline.hpp"
#include "transcriber.hpp"
#include "url_tools.hpp"

int main(int argc, char *argv[])
{
    // Quick check for --version flag before full parsing
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--version")
        {
            fmt::print("hlsgrab v1.0\n");
            fmt::print("Built with:\n");
            fmt::print("  - libcurl: HTTP/HTTPS support\n");
            fmt::print("  - CLI11: Command-line parsing\n");
            fmt::print("  - fmt: Modern string formatting\n");
            fmt::print("  - OpenSSL: Output checksum verification\n");
            return 0;
        }
    }

    // Create CLI11 app
    CLI::App app{"hlsgrab v1.0 - Download an HLS video into a single MP4"};

    // Configuration struct to be populated
    DownloadConfig config;

    // ====================================================================
    // DEFINE ARGUMENTS
    // ====================================================================

    // Required positional argument: playlist URL or captured curl command
    app.add_option("INPUT", config.input, "URL of the m3u8 playlist or curl command")
        ->required();

    app.add_option("-o,--output-name", config.outputName,
                   "Name for the output video file (can include extension)");

    app.add_option("-d,--output-dir", config.outputDir,
                   "Directory where videos will be saved")
        ->default_val("downloads");

    app.add_flag("-c,--curl", config.curlMode, "Input is a curl command");
    app.add_flag("-v,--verbose", config.verbose, "Enable verbose logging");
    app.add_flag("-t,--transcript", config.transcript, "Generate transcript for the video");

    app.add_option("--transcript-model", config.transcriptModel,
                   "Whisper model size for transcription")
        ->check(CLI::IsMember({"tiny", "base", "small", "medium", "large"}))
        ->default_val("medium");

    app.add_option("--timeout", config.limits.requestTimeoutSeconds,
                   "Timeout in seconds for each HTTP request")
        ->check(CLI::PositiveNumber) // Built-in validator: must be positive
        ->default_val(30);

    app.add_option("--max-segments", config.limits.maxSegments,
                   "Maximum number of segments to download")
        ->check(CLI::Range(1, 100000))
        ->default_val(1000);

    app.add_option("--max-segment-size", config.maxSegmentMegabytes,
                   "Maximum size of one segment in MB")
        ->check(CLI::Range(1, 4096))
        ->default_val(10);

    app.add_option("--max-hops", config.limits.maxPlaylistHops,
                   "Maximum number of nested playlists to follow")
        ->check(CLI::Range(0, 20))
        ->default_val(5);

    app.add_option("--segment-origin", config.segmentOrigin,
                   "Origin (scheme://host) for segment paths starting with '/'")
        ->check([](const std::string &origin) -> std::string {
            if (UrlTools::isValidUrl(origin)) {
                return "";  // Empty string = valid
            }
            return "Origin must be an http:// or https:// URL";
        });

    // Optional flag: --retry-count (or --max-retries)
    app.add_option("-r,--retry-count,--max-retries", config.limits.maxRetries,
                   "Retry attempts for transient network errors")
        ->check(CLI::Range(0, 10)) // Built-in validator: 0-10 range
        ->default_val(0);

    // Optional flag: --checksum
    app.add_option("--checksum", config.expectedChecksum,
                   "Expected checksum of the final video, 'algorithm:hexhash' (sha256, sha1, md5)")
        ->check([](const std::string &cs) -> std::string {
            if (cs.empty()) return "";
            try {
                ChecksumVerifier::parse(cs);
                return ""; // Valid
            } catch (const std::exception &e) {
                return std::string("Invalid checksum format: ") + e.what();
            }
        });

    // Optional flag: --version (for help display only, actual handling is done above)
    app.add_flag("--version", config.showVersion, "Display version information");

    // ====================================================================
    // PARSE ARGUMENTS
    // ====================================================================

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e)
    {
        return app.exit(e);
    }

    config.limits.maxSegmentBytes = static_cast<std::uint64_t>(config.maxSegmentMegabytes) * 1024 * 1024;

    ConsoleDiagnostics diagnostics(config.verbose);

    // If no output name is provided, prompt the user
    if (!config.outputName)
    {
        fmt::print("Enter a name for the output video file (without extension): ");
        std::fflush(stdout);
        std::string answer;
        std::getline(std::cin, answer);
        config.outputName = answer.empty() ? "video" : answer;
    }

    diagnostics.debug("Output directory: {}", config.outputDir);
    diagnostics.debug("Request timeout: {}s, max segments: {}, max segment size: {} MB",
                      config.limits.requestTimeoutSeconds, config.limits.maxSegments, config.maxSegmentMegabytes);

    // ====================================================================
    // PERFORM DOWNLOAD
    // ====================================================================

    try
    {
        // Create HTTP client (RAII ensures cleanup)
        HttpClient client(diagnostics, config.limits.chunkBytes, config.limits.maxRetries);
        FfmpegAssembler assembler(diagnostics, config.limits.assemblyTimeoutSeconds);
        WhisperTranscriber transcriber(diagnostics);

        PipelineOptions options;
        options.limits = config.limits;
        options.outputDirectory = config.outputDir;
        options.segmentOrigin = config.segmentOrigin;
        options.expectedChecksum = config.expectedChecksum;
        options.transcriptModel = config.transcriptModel;

        VideoPipeline pipeline(client, assembler, transcriber, diagnostics, options);

        auto output = pipeline.run(config.input, config.curlMode, *config.outputName, config.transcript);
        if (!output)
        {
            const Failure &failure = pipeline.getLastError();
            fmt::print(stderr, "✗ Download failed [{}]: {}\n", errorKindName(failure.kind), failure.message);
            return 1;
        }

        fmt::print("✓ Saved {}\n", output->path().string());
        return 0;
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "✗ Fatal error: {}\n", e.what());
        return 1;
    }
}
