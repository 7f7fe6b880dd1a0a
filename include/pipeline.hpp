#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "assembler.hpp"
#include "config.hpp"
#include "diagnostics.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "output.hpp"
#include "playlist_resolver.hpp"
#include "reference_parser.hpp"
#include "segment_acquirer.hpp"
#include "transcriber.hpp"

/**
 * Per-run settings of the pipeline.
 */
struct PipelineOptions
{
    DownloadLimits limits;
    std::filesystem::path outputDirectory = "downloads";
    std::optional<std::string> segmentOrigin;
    std::optional<std::string> expectedChecksum; // "algorithm:hexhash"
    std::string transcriptModel = "medium";
};

/**
 * One download attempt from reference to combined file:
 * resolve playlist -> acquire segments -> assemble -> (transcribe) -> clean up.
 *
 * Collaborators are injected so tests can run the whole flow without a
 * network, ffmpeg or whisper.
 */
class VideoPipeline
{
public:
    VideoPipeline(HttpTransport &transport,
                  Assembler &assembler,
                  Transcriber &transcriber,
                  Diagnostics &diagnostics,
                  PipelineOptions options);

    /**
     * Download a video described by a user reference.
     *
     * @param input Playlist URL, or a captured curl command if capturedMode
     * @param capturedMode Interpret input as a captured request
     * @param outputName Requested file name (sanitized, ".mp4" forced)
     * @param wantTranscript Also write "<stem>_transcript.txt"
     * @return Descriptor of the combined file, or std::nullopt (see getLastError())
     */
    std::optional<OutputDescriptor> run(const std::string &input,
                                        bool capturedMode,
                                        const std::string &outputName,
                                        bool wantTranscript);

    /**
     * Download a video from an already validated reference.
     */
    std::optional<OutputDescriptor> downloadVideo(const PlaylistReference &reference,
                                                  const std::string &outputName,
                                                  bool wantTranscript);

    const Failure &getLastError() const { return lastError_; }

    const AcquisitionReport &getReport() const { return acquirer_.getReport(); }

    /**
     * Working directory used by the last attempt (already removed once the
     * attempt returns). Empty if no working area was created.
     */
    const std::filesystem::path &getLastWorkingArea() const { return lastWorkingArea_; }

    /**
     * Transcript written by the last attempt, if any.
     */
    const std::optional<std::filesystem::path> &getTranscriptPath() const { return transcriptPath_; }

private:
    std::optional<OutputDescriptor> fail(ErrorKind kind, const std::string &message);

    /**
     * Check the combined file against the expected checksum; a file that
     * does not verify is moved to quarantine.
     */
    bool verifyOutput(const std::filesystem::path &output);

    Assembler &assembler_;
    Diagnostics &diagnostics_;
    PipelineOptions options_;

    ReferenceParser parser_;
    PlaylistResolver resolver_;
    SegmentAcquirer acquirer_;
    TranscriptWriter transcriptWriter_;

    Failure lastError_;
    std::filesystem::path lastWorkingArea_;
    std::optional<std::filesystem::path> transcriptPath_;
};
