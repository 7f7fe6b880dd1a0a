#include "pipeline.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/core.h>

#include "checksum.hpp"
#include "url_tools.hpp"
#include "workspace.hpp"

VideoPipeline::VideoPipeline(HttpTransport &transport,
                             Assembler &assembler,
                             Transcriber &transcriber,
                             Diagnostics &diagnostics,
                             PipelineOptions options)
    : assembler_(assembler),
      diagnostics_(diagnostics),
      options_(std::move(options)),
      parser_(diagnostics),
      resolver_(transport, diagnostics, options_.limits),
      acquirer_(transport, diagnostics, options_.limits),
      transcriptWriter_(transcriber, diagnostics)
{
    acquirer_.setOriginOverride(options_.segmentOrigin);
}

std::optional<OutputDescriptor> VideoPipeline::fail(ErrorKind kind, const std::string &message)
{
    lastError_ = {kind, message};
    diagnostics_.error(message);
    return std::nullopt;
}

std::optional<OutputDescriptor> VideoPipeline::run(const std::string &input,
                                                   bool capturedMode,
                                                   const std::string &outputName,
                                                   bool wantTranscript)
{
    lastError_ = Failure{};
    lastWorkingArea_.clear();
    transcriptPath_.reset();

    auto reference = parser_.parseReference(input, capturedMode);
    if (!reference)
    {
        lastError_ = parser_.getLastError();
        return std::nullopt;
    }

    return downloadVideo(*reference, outputName, wantTranscript);
}

std::optional<OutputDescriptor> VideoPipeline::downloadVideo(const PlaylistReference &reference,
                                                             const std::string &outputName,
                                                             bool wantTranscript)
{
    lastError_ = Failure{};
    lastWorkingArea_.clear();
    transcriptPath_.reset();

    OutputDescriptor descriptor = OutputNaming::makeDescriptor(outputName, options_.outputDirectory);

    // 1. Playlist -> ordered segment references
    ResolvedSegmentList segments = resolver_.resolve(reference.url(), reference.headers());
    if (segments.empty())
    {
        const Failure &cause = resolver_.getLastError();
        return fail(ErrorKind::ResolutionFailure,
                    cause.empty() ? "No segments found in the m3u8 playlist"
                                  : fmt::format("No segments found in the m3u8 playlist ({})", cause.message));
    }

    // Relative segments belong to the playlist that listed them
    std::string baseUrl = UrlTools::directoryOf(resolver_.getMediaPlaylistUrl());
    diagnostics_.info("Base URL for segments: {}", baseUrl);

    // 2. Segments -> numbered slot files in a private working area
    std::unique_ptr<WorkingArea> area = acquirer_.acquire(segments, baseUrl, reference.headers());
    if (!area)
    {
        const Failure &cause = acquirer_.getLastError();
        return fail(cause.kind, fmt::format("Failed to download segments: {}", cause.message));
    }
    lastWorkingArea_ = area->path();

    const AcquisitionReport &report = acquirer_.getReport();
    diagnostics_.info("Downloaded {} of {} segments", report.stored.size(), segments.size());

    // 3. Gaps are dropped here: only slot files that exist are handed over
    std::vector<std::filesystem::path> files = area->segmentFiles();
    if (files.empty())
    {
        return fail(ErrorKind::AssemblyFailed,
                    fmt::format("None of the {} segments could be downloaded", segments.size()));
    }

    std::error_code ec;
    std::filesystem::create_directories(descriptor.directory, ec);
    if (ec)
    {
        return fail(ErrorKind::AssemblyFailed,
                    fmt::format("Cannot create output directory {}: {}", descriptor.directory.string(), ec.message()));
    }

    diagnostics_.info("Combining segments into a single video file...");
    if (!assembler_.assemble(files, descriptor.path()))
    {
        return fail(ErrorKind::AssemblyFailed, fmt::format("Assembly failed: {}", assembler_.getLastError()));
    }

    // The segments are no longer needed once the combined file exists
    area->destroy();

    if (options_.expectedChecksum && !verifyOutput(descriptor.path()))
    {
        return std::nullopt;
    }

    diagnostics_.info("Video has been successfully saved as '{}'", descriptor.path().string());

    // 4. Optional transcript; a failure here keeps the video
    if (wantTranscript)
    {
        transcriptPath_ = transcriptWriter_.generate(descriptor.path(), options_.transcriptModel);
        if (transcriptPath_)
        {
            diagnostics_.info("Transcript has been saved as '{}'", transcriptPath_->string());
        }
        else
        {
            diagnostics_.warn("Video kept without transcript: {}", transcriptWriter_.getLastError().message);
        }
    }

    return descriptor;
}

bool VideoPipeline::verifyOutput(const std::filesystem::path &output)
{
    diagnostics_.info("Verifying checksum...");

    std::string problem;
    try
    {
        if (ChecksumVerifier::verify(output, *options_.expectedChecksum))
        {
            diagnostics_.info("Checksum verification passed");
            return true;
        }
        problem = fmt::format("Checksum verification FAILED (expected {})", *options_.expectedChecksum);
    }
    catch (const std::exception &e)
    {
        problem = fmt::format("Checksum verification error: {}", e.what());
    }

    // Never leave an unverified file where a good one is expected
    try
    {
        std::filesystem::path moved = ChecksumVerifier::quarantine(output);
        problem += fmt::format("; file moved to {}", moved.string());
    }
    catch (const std::filesystem::filesystem_error &e)
    {
        std::error_code ec;
        std::filesystem::remove(output, ec);
        problem += fmt::format("; quarantine failed ({}), file removed", e.what());
    }

    fail(ErrorKind::VerificationFailed, problem);
    return false;
}
