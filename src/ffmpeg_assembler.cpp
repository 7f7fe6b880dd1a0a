#include "assembler.hpp"

#include <fstream>
#include <utility>

#include <fmt/core.h>

#include "process_runner.hpp"

FfmpegAssembler::FfmpegAssembler(Diagnostics &diagnostics,
                                 int timeoutSeconds,
                                 std::string program)
    : diagnostics_(diagnostics),
      timeoutSeconds_(timeoutSeconds),
      program_(std::move(program))
{
}

bool FfmpegAssembler::writeConcatList(const std::vector<std::filesystem::path> &segments,
                                      const std::filesystem::path &listPath)
{
    std::ofstream list(listPath, std::ios::trunc);
    if (!list)
    {
        return false;
    }

    for (const auto &segment : segments)
    {
        std::string quoted;
        for (char ch : std::filesystem::absolute(segment).string())
        {
            if (ch == '\'')
            {
                quoted += "'\\''";
            }
            else
            {
                quoted += ch;
            }
        }
        list << "file '" << quoted << "'\n";
    }

    list.close();
    return !list.fail();
}

std::vector<std::string> FfmpegAssembler::buildArguments(const std::filesystem::path &listPath,
                                                         const std::filesystem::path &output)
{
    return {
        "-y",
        "-hide_banner",
        "-loglevel", "error",
        "-f", "concat",
        "-safe", "0",
        "-i", std::filesystem::absolute(listPath).string(),
        "-c", "copy",
        std::filesystem::absolute(output).string(),
    };
}

bool FfmpegAssembler::assemble(const std::vector<std::filesystem::path> &segments,
                               const std::filesystem::path &output)
{
    lastError_.clear();

    if (segments.empty())
    {
        lastError_ = "No segment files to combine";
        diagnostics_.error(lastError_);
        return false;
    }

    std::filesystem::path listPath = segments.front().parent_path() / "file_list.txt";
    if (!writeConcatList(segments, listPath))
    {
        lastError_ = fmt::format("Cannot write concat list {}", listPath.string());
        diagnostics_.error(lastError_);
        return false;
    }

    diagnostics_.info("Combining {} segments into {}", segments.size(), output.string());

    ProcessResult result = ProcessRunner::run(program_, buildArguments(listPath, output), timeoutSeconds_);

    std::error_code ec;
    if (!result.succeeded())
    {
        switch (result.status)
        {
        case ProcessResult::Status::SpawnFailed:
            lastError_ = "ffmpeg is not installed. Please install ffmpeg to combine the video segments.";
            break;
        case ProcessResult::Status::TimedOut:
            lastError_ = "ffmpeg operation timed out";
            break;
        default:
            lastError_ = fmt::format("Error combining video segments: {}", result.error);
            break;
        }
        diagnostics_.error(lastError_);

        // Never leave a half-written output behind
        std::filesystem::remove(output, ec);
        return false;
    }

    if (!std::filesystem::exists(output, ec))
    {
        lastError_ = fmt::format("ffmpeg reported success but {} was not created", output.string());
        diagnostics_.error(lastError_);
        return false;
    }

    return true;
}
