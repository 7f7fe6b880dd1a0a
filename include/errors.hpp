#pragma once

#include <string>

/**
 * Failure categories reported by the download pipeline.
 * Components below the pipeline absorb these and log them; only the
 * pipeline turns them into a user-visible failure.
 */
enum class ErrorKind
{
    None,
    InvalidReference,       // Malformed URL or disallowed scheme
    ResolutionFailure,      // Playlist fetch/parse error, no segments, hop limit
    NoSegments,             // Acquisition asked to fetch an empty list
    AcquisitionSetupFailed, // Working area could not be created
    SegmentSkipped,         // One segment dropped (size limit or network)
    AssemblyFailed,         // ffmpeg missing, non-zero exit or timeout
    TranscriptionFailed,    // Missing file, bad model or transcriber error
    VerificationFailed      // Combined file does not match the expected checksum
};

/**
 * Last failure recorded by a component.
 */
struct Failure
{
    ErrorKind kind = ErrorKind::None;
    std::string message;

    bool empty() const { return kind == ErrorKind::None; }
};

/**
 * Short stable name for an error kind (e.g. "ResolutionFailure").
 */
inline const char *errorKindName(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::None:
        return "None";
    case ErrorKind::InvalidReference:
        return "InvalidReference";
    case ErrorKind::ResolutionFailure:
        return "ResolutionFailure";
    case ErrorKind::NoSegments:
        return "NoSegments";
    case ErrorKind::AcquisitionSetupFailed:
        return "AcquisitionSetupFailed";
    case ErrorKind::SegmentSkipped:
        return "SegmentSkipped";
    case ErrorKind::AssemblyFailed:
        return "AssemblyFailed";
    case ErrorKind::TranscriptionFailed:
        return "TranscriptionFailed";
    case ErrorKind::VerificationFailed:
        return "VerificationFailed";
    }
    return "Unknown";
}
