#pragma once

#include <filesystem>
#include <string>

/**
 * Where the combined video of one run goes. Computed once per run.
 */
struct OutputDescriptor
{
    std::filesystem::path directory;
    std::string filename; // Sanitized, always ends in ".mp4"

    std::filesystem::path path() const { return directory / filename; }
};

/**
 * Filename policy for downloaded videos.
 */
class OutputNaming
{
public:
    /**
     * Make a user-supplied name safe to use as a single file name.
     * Path separators and every character outside [A-Za-z0-9_.-] become
     * '_'; an empty name becomes "video".
     *
     * Example: "a/b\\c:d.mp4" -> "a_b_c_d.mp4"
     */
    static std::string sanitizeFilename(const std::string &name);

    /**
     * Sanitize the name and force the ".mp4" extension (case-insensitive check).
     */
    static std::string mediaFilename(const std::string &name);

    /**
     * @param name User-supplied output name (may include an extension)
     * @param directory Destination directory (made absolute)
     */
    static OutputDescriptor makeDescriptor(const std::string &name, const std::filesystem::path &directory);
};
