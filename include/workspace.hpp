#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "diagnostics.hpp"

/**
 * Private temporary directory holding the segment files of one download
 * attempt. Owned exclusively by that attempt and removed when it ends:
 * destroy() is idempotent and the destructor calls it.
 */
class WorkingArea
{
    // Only create() can name this, so only create() can construct
    struct PrivateTag
    {
        explicit PrivateTag() = default;
    };

public:
    /**
     * Create a fresh, uniquely named directory under the system temp root.
     *
     * @param diagnostics Sink for cleanup messages
     * @param prefix Recognizable directory name prefix
     * @return Owning handle
     * @throws std::runtime_error if the directory cannot be created
     */
    static std::unique_ptr<WorkingArea> create(Diagnostics &diagnostics,
                                               const std::string &prefix = "video_segments_");

    WorkingArea(PrivateTag, std::filesystem::path path, Diagnostics &diagnostics);
    ~WorkingArea();

    WorkingArea(const WorkingArea &) = delete;
    WorkingArea &operator=(const WorkingArea &) = delete;

    /**
     * Remove the directory and everything in it.
     * A directory that is already gone counts as success.
     *
     * @return false only if something could not be removed
     */
    bool destroy();

    const std::filesystem::path &path() const { return path_; }

    bool exists() const;

    /**
     * Slot file for a playlist position: segment_000.ts, segment_001.ts, ...
     */
    std::filesystem::path segmentPath(std::size_t index) const;

    /**
     * Slot files present on disk, ascending by index. Missing indices
     * (skipped segments) are simply absent from the result.
     */
    std::vector<std::filesystem::path> segmentFiles() const;

    /**
     * Slot file name for an index, zero-padded to three digits.
     */
    static std::string segmentFileName(std::size_t index);

private:
    std::filesystem::path path_;
    Diagnostics &diagnostics_;
    bool destroyed_ = false;
};
