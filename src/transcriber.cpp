#include "transcriber.hpp"

#include <fstream>
#include <iterator>
#include <memory>
#include <vector>

#include <fmt/core.h>

#include "process_runner.hpp"
#include "workspace.hpp"

namespace
{
    const char *const VALID_MODELS = "tiny, base, small, medium, large";
}

std::optional<ModelSize> parseModelSize(const std::string &name)
{
    if (name == "tiny")
        return ModelSize::Tiny;
    if (name == "base")
        return ModelSize::Base;
    if (name == "small")
        return ModelSize::Small;
    if (name == "medium")
        return ModelSize::Medium;
    if (name == "large")
        return ModelSize::Large;
    return std::nullopt;
}

const char *modelSizeName(ModelSize size)
{
    switch (size)
    {
    case ModelSize::Tiny:
        return "tiny";
    case ModelSize::Base:
        return "base";
    case ModelSize::Small:
        return "small";
    case ModelSize::Medium:
        return "medium";
    case ModelSize::Large:
        return "large";
    }
    return "medium";
}

std::optional<std::string> WhisperTranscriber::transcribe(const std::filesystem::path &media, ModelSize model)
{
    lastError_.clear();

    // whisper writes "<stem>.txt" into --output_dir; keep that out of the user's directory
    std::unique_ptr<WorkingArea> scratch;
    try
    {
        scratch = WorkingArea::create(diagnostics_, "video_transcript_");
    }
    catch (const std::exception &e)
    {
        lastError_ = e.what();
        return std::nullopt;
    }

    diagnostics_.info("Loading Whisper model ({})...", modelSizeName(model));

    std::vector<std::string> args = {
        std::filesystem::absolute(media).string(),
        "--model", modelSizeName(model),
        "--output_format", "txt",
        "--output_dir", scratch->path().string(),
        "--verbose", "False",
    };

    ProcessResult result = ProcessRunner::run(program_, args, timeoutSeconds_);
    if (!result.succeeded())
    {
        lastError_ = result.status == ProcessResult::Status::SpawnFailed
                         ? fmt::format("'{}' is not installed (pip install openai-whisper)", program_)
                         : result.error;
        return std::nullopt;
    }

    std::filesystem::path produced = scratch->path() / (media.stem().string() + ".txt");
    std::ifstream in(produced, std::ios::binary);
    if (!in)
    {
        lastError_ = fmt::format("{} produced no transcript at {}", program_, produced.string());
        return std::nullopt;
    }

    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return text;
}

std::filesystem::path TranscriptWriter::transcriptPathFor(const std::filesystem::path &media)
{
    return media.parent_path() / (media.stem().string() + "_transcript.txt");
}

void TranscriptWriter::fail(const std::string &message)
{
    lastError_ = {ErrorKind::TranscriptionFailed, message};
    diagnostics_.error(message);
}

std::optional<std::filesystem::path> TranscriptWriter::generate(const std::filesystem::path &media,
                                                                const std::string &modelName)
{
    lastError_ = Failure{};

    std::error_code ec;
    if (!std::filesystem::is_regular_file(media, ec))
    {
        fail(fmt::format("Video file not found: {}", media.string()));
        return std::nullopt;
    }

    auto model = parseModelSize(modelName);
    if (!model)
    {
        fail(fmt::format("Invalid model size '{}'. Must be one of: {}", modelName, VALID_MODELS));
        return std::nullopt;
    }

    diagnostics_.info("Generating transcript...");
    auto text = transcriber_.transcribe(media, *model);
    if (!text)
    {
        fail(fmt::format("Error generating transcript: {}", transcriber_.getLastError()));
        return std::nullopt;
    }

    std::filesystem::path transcriptPath = transcriptPathFor(media);
    diagnostics_.info("Saving transcript to {}", transcriptPath.string());

    std::ofstream out(transcriptPath, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        fail(fmt::format("Cannot open {} for writing", transcriptPath.string()));
        return std::nullopt;
    }
    out.write(text->data(), static_cast<std::streamsize>(text->size()));
    out.close();
    if (out.fail())
    {
        std::filesystem::remove(transcriptPath, ec);
        fail(fmt::format("Cannot write transcript {}", transcriptPath.string()));
        return std::nullopt;
    }

    return transcriptPath;
}
