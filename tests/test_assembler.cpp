#include "assembler.hpp"
#include "process_runner.hpp"
#include "test_support.hpp"

#include <sys/stat.h>

namespace
{
    // Stand-in for ffmpeg: writes its arguments into the output (last argument)
    std::filesystem::path writeFakeFfmpeg(const std::filesystem::path &dir, int exitCode)
    {
        std::filesystem::path script = dir / fmt::format("fake_ffmpeg_{}", exitCode);
        writeFile(script, fmt::format("#!/bin/sh\n"
                                      "for last; do :; done\n"
                                      "printf '%s\\n' \"$@\" > \"$last\"\n"
                                      "exit {}\n",
                                      exitCode));
        ::chmod(script.c_str(), 0755);
        return script;
    }
}

int main()
{
    TestRun run("assembler");

    try
    {
        NullDiagnostics quiet;
        ScratchDir scratch;

        std::vector<std::filesystem::path> segments = {
            scratch.path() / "segment_000.ts",
            scratch.path() / "segment_002.ts",
            scratch.path() / "it's.ts",
        };
        for (const auto &segment : segments)
        {
            writeFile(segment, "data");
        }

        // Concat list
        std::filesystem::path listPath = scratch.path() / "list.txt";
        run.check(FfmpegAssembler::writeConcatList(segments, listPath), "concat list written");
        std::string expected = fmt::format("file '{}'\nfile '{}'\nfile '{}'\n",
                                           segments[0].string(), segments[1].string(),
                                           (scratch.path() / "it'\\''s.ts").string());
        run.check(readFile(listPath) == expected, "one quoted line per segment, in order, quotes escaped");

        // Argument vector
        auto args = FfmpegAssembler::buildArguments(listPath, scratch.path() / "out.mp4");
        run.check(args == std::vector<std::string>{"-y", "-hide_banner", "-loglevel", "error", "-f", "concat",
                                                   "-safe", "0", "-i", listPath.string(), "-c", "copy",
                                                   (scratch.path() / "out.mp4").string()},
                  "concat demuxer with stream copy");

        // Nothing to combine
        {
            FfmpegAssembler assembler(quiet);
            run.check(!assembler.assemble({}, scratch.path() / "none.mp4"), "empty segment list fails");
            run.check(!assembler.getLastError().empty(), "empty segment list explains itself");
        }

        // Missing program
        {
            FfmpegAssembler assembler(quiet, 10, "hlsgrab-no-such-ffmpeg");
            std::filesystem::path output = scratch.path() / "missing.mp4";
            run.check(!assembler.assemble(segments, output), "missing ffmpeg fails");
            run.check(!std::filesystem::exists(output), "no output left behind");
        }

        // Successful run
        {
            FfmpegAssembler assembler(quiet, 10, writeFakeFfmpeg(scratch.path(), 0).string());
            std::filesystem::path output = scratch.path() / "video.mp4";
            run.check(assembler.assemble(segments, output), "successful ffmpeg run");
            run.check(std::filesystem::exists(scratch.path() / "file_list.txt"),
                      "concat list placed beside the segments");

            std::string invocation = readFile(output);
            run.check(invocation.find("concat\n") != std::string::npos &&
                          invocation.find((scratch.path() / "file_list.txt").string()) != std::string::npos,
                      "ffmpeg invoked with the concat list");
        }

        // Failing run
        {
            FfmpegAssembler assembler(quiet, 10, writeFakeFfmpeg(scratch.path(), 1).string());
            std::filesystem::path output = scratch.path() / "broken.mp4";
            run.check(!assembler.assemble(segments, output), "non-zero exit fails");
            run.check(!std::filesystem::exists(output), "partial output removed after failure");
            run.check(assembler.getLastError().find("Error combining video segments") != std::string::npos,
                      "exit failure reported");
        }

        // Process runner edge cases
        {
            ProcessResult ok = ProcessRunner::run("true", {}, 5);
            run.check(ok.succeeded(), "true succeeds");

            ProcessResult timedOut = ProcessRunner::run("sleep", {"10"}, 1);
            run.check(timedOut.status == ProcessResult::Status::TimedOut, "long-running program is timed out");
        }
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    }

    return run.finish();
}
