#include "workspace.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <utility>

#include <fmt/core.h>

namespace
{
    const char *const SEGMENT_PREFIX = "segment_";
    const char *const SEGMENT_SUFFIX = ".ts";

    // "segment_012.ts" -> 12; false for anything else
    bool parseSegmentIndex(const std::string &name, std::size_t &index)
    {
        const std::string prefix = SEGMENT_PREFIX;
        const std::string suffix = SEGMENT_SUFFIX;
        if (name.size() <= prefix.size() + suffix.size() ||
            name.compare(0, prefix.size(), prefix) != 0 ||
            name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0)
        {
            return false;
        }

        std::string digits = name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
        if (!std::all_of(digits.begin(), digits.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; }))
        {
            return false;
        }
        index = static_cast<std::size_t>(std::stoull(digits));
        return true;
    }
}

WorkingArea::WorkingArea(PrivateTag, std::filesystem::path path, Diagnostics &diagnostics)
    : path_(std::move(path)), diagnostics_(diagnostics)
{
}

std::unique_ptr<WorkingArea> WorkingArea::create(Diagnostics &diagnostics, const std::string &prefix)
{
    std::filesystem::path root;
    try
    {
        root = std::filesystem::temp_directory_path();
    }
    catch (const std::filesystem::filesystem_error &e)
    {
        throw std::runtime_error(fmt::format("No usable temporary directory: {}", e.what()));
    }

    // mkdtemp() creates the directory with mode 0700 and a unique suffix
    std::string pattern = (root / (prefix + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    if (::mkdtemp(buffer.data()) == nullptr)
    {
        throw std::runtime_error(fmt::format("Cannot create working directory under {}: {}",
                                             root.string(), std::strerror(errno)));
    }

    std::filesystem::path created(buffer.data());
    diagnostics.debug("Created working directory {}", created.string());
    return std::make_unique<WorkingArea>(PrivateTag{}, created, diagnostics);
}

WorkingArea::~WorkingArea()
{
    destroy();
}

bool WorkingArea::exists() const
{
    std::error_code ec;
    return std::filesystem::exists(path_, ec);
}

bool WorkingArea::destroy()
{
    if (destroyed_)
    {
        return true;
    }

    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec && ec != std::errc::no_such_file_or_directory)
    {
        diagnostics_.error("Error cleaning up temporary files in {}: {}", path_.string(), ec.message());
        return false;
    }

    destroyed_ = true;
    diagnostics_.info("Cleaned up temporary files in {}", path_.string());
    return true;
}

std::string WorkingArea::segmentFileName(std::size_t index)
{
    return fmt::format("{}{:03d}{}", SEGMENT_PREFIX, index, SEGMENT_SUFFIX);
}

std::filesystem::path WorkingArea::segmentPath(std::size_t index) const
{
    return path_ / segmentFileName(index);
}

std::vector<std::filesystem::path> WorkingArea::segmentFiles() const
{
    std::vector<std::pair<std::size_t, std::filesystem::path>> found;

    std::error_code ec;
    for (std::filesystem::directory_iterator it(path_, ec), end; !ec && it != end; it.increment(ec))
    {
        std::size_t index = 0;
        std::error_code typeError;
        if (it->is_regular_file(typeError) && parseSegmentIndex(it->path().filename().string(), index))
        {
            found.emplace_back(index, std::filesystem::absolute(it->path()));
        }
    }

    std::sort(found.begin(), found.end(),
              [](const auto &a, const auto &b) { return a.first < b.first; });

    std::vector<std::filesystem::path> files;
    files.reserve(found.size());
    for (auto &entry : found)
    {
        files.push_back(std::move(entry.second));
    }
    return files;
}
