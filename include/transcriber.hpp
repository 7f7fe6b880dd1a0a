#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>

#include "diagnostics.hpp"
#include "errors.hpp"

/**
 * Speech model sizes understood by the transcriber.
 */
enum class ModelSize
{
    Tiny,
    Base,
    Small,
    Medium,
    Large
};

/**
 * Parse "tiny", "base", "small", "medium" or "large" (exact spelling).
 */
std::optional<ModelSize> parseModelSize(const std::string &name);

const char *modelSizeName(ModelSize size);

/**
 * Turns the audio of a media file into plain text.
 */
class Transcriber
{
public:
    virtual ~Transcriber() = default;

    /**
     * @return UTF-8 text, or std::nullopt on failure (reason in getLastError())
     */
    virtual std::optional<std::string> transcribe(const std::filesystem::path &media, ModelSize model) = 0;

    virtual std::string getLastError() const = 0;
};

/**
 * Transcriber backed by the openai-whisper command line tool.
 */
class WhisperTranscriber : public Transcriber
{
public:
    explicit WhisperTranscriber(Diagnostics &diagnostics, std::string program = "whisper", int timeoutSeconds = 0)
        : diagnostics_(diagnostics), program_(std::move(program)), timeoutSeconds_(timeoutSeconds)
    {
    }

    std::optional<std::string> transcribe(const std::filesystem::path &media, ModelSize model) override;

    std::string getLastError() const override { return lastError_; }

private:
    Diagnostics &diagnostics_;
    std::string program_;
    int timeoutSeconds_;
    std::string lastError_;
};

/**
 * Validates a transcription request, runs the transcriber and stores the
 * text as "<stem>_transcript.txt" next to the media file.
 */
class TranscriptWriter
{
public:
    TranscriptWriter(Transcriber &transcriber, Diagnostics &diagnostics)
        : transcriber_(transcriber), diagnostics_(diagnostics)
    {
    }

    /**
     * @param media Combined video file
     * @param modelName One of the five model size names
     * @return Transcript path, or std::nullopt with TranscriptionFailed.
     *         An unknown model or missing file never reaches the transcriber.
     */
    std::optional<std::filesystem::path> generate(const std::filesystem::path &media,
                                                  const std::string &modelName = "medium");

    static std::filesystem::path transcriptPathFor(const std::filesystem::path &media);

    const Failure &getLastError() const { return lastError_; }

private:
    void fail(const std::string &message);

    Transcriber &transcriber_;
    Diagnostics &diagnostics_;
    Failure lastError_;
};
