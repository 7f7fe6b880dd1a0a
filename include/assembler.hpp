#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "diagnostics.hpp"

/**
 * Concatenates ordered segment files into one media file.
 */
class Assembler
{
public:
    virtual ~Assembler() = default;

    /**
     * @param segments Segment files in playback order (no gaps)
     * @param output Path of the combined file to create
     * @return true if the combined file exists afterwards
     */
    virtual bool assemble(const std::vector<std::filesystem::path> &segments,
                          const std::filesystem::path &output) = 0;

    virtual std::string getLastError() const = 0;
};

/**
 * Assembler backed by the ffmpeg concat demuxer with stream copy.
 */
class FfmpegAssembler : public Assembler
{
public:
    /**
     * The concat list is written as "file_list.txt" beside the first segment.
     *
     * @param diagnostics Sink for progress and failures
     * @param timeoutSeconds Limit for the ffmpeg run
     * @param program ffmpeg executable name or path
     */
    explicit FfmpegAssembler(Diagnostics &diagnostics,
                             int timeoutSeconds = 300,
                             std::string program = "ffmpeg");

    bool assemble(const std::vector<std::filesystem::path> &segments,
                  const std::filesystem::path &output) override;

    std::string getLastError() const override { return lastError_; }

    /**
     * Write a concat demuxer list: one "file '<absolute path>'" line per
     * segment, single quotes escaped as '\''.
     *
     * @return false if the list file cannot be written
     */
    static bool writeConcatList(const std::vector<std::filesystem::path> &segments,
                                const std::filesystem::path &listPath);

    /**
     * Argument vector passed to ffmpeg (without argv[0]).
     */
    static std::vector<std::string> buildArguments(const std::filesystem::path &listPath,
                                                   const std::filesystem::path &output);

private:
    Diagnostics &diagnostics_;
    int timeoutSeconds_;
    std::string program_;
    std::string lastError_;
};
