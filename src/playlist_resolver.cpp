#include "playlist_resolver.hpp"

#include <sstream>

#include <fmt/core.h>

#include "url_tools.hpp"

namespace
{
    const char *const SEGMENT_EXTENSION = ".ts";
    const char *const PLAYLIST_EXTENSION = ".m3u8";

    std::string trimLine(const std::string &line)
    {
        size_t first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos)
        {
            return "";
        }
        size_t last = line.find_last_not_of(" \t\r");
        return line.substr(first, last - first + 1);
    }

    // Tags and comments start with '#'; a query string does not change the file type
    bool referencesExtension(const std::string &line, const std::string &extension)
    {
        if (line.empty() || line.front() == '#')
        {
            return false;
        }
        std::string path = line.substr(0, line.find_first_of("?#"));
        return path.size() >= extension.size() &&
               path.compare(path.size() - extension.size(), extension.size(), extension) == 0;
    }

    std::vector<std::string> referenceLines(const std::string &document, const std::string &extension)
    {
        std::vector<std::string> lines;
        std::istringstream input(document);
        std::string line;
        while (std::getline(input, line))
        {
            line = trimLine(line);
            if (referencesExtension(line, extension))
            {
                lines.push_back(line);
            }
        }
        return lines;
    }
}

ResolvedSegmentList PlaylistResolver::extractSegments(const std::string &document)
{
    return referenceLines(document, SEGMENT_EXTENSION);
}

std::string PlaylistResolver::findNestedPlaylist(const std::string &document)
{
    auto playlists = referenceLines(document, PLAYLIST_EXTENSION);
    return playlists.empty() ? "" : playlists.front();
}

void PlaylistResolver::fail(ErrorKind kind, const std::string &message)
{
    lastError_ = {kind, message};
    diagnostics_.error(message);
}

ResolvedSegmentList PlaylistResolver::resolve(const std::string &playlistUrl, const HeaderMap &headers)
{
    lastError_ = Failure{};
    mediaPlaylistUrl_.clear();

    std::set<std::string> visited;
    ResolvedSegmentList segments = resolveWithin(playlistUrl, headers, limits_.maxPlaylistHops, visited);

    if (segments.size() > limits_.maxSegments)
    {
        diagnostics_.debug("Playlist lists {} segments; keeping the first {}", segments.size(), limits_.maxSegments);
        segments.resize(limits_.maxSegments);
    }
    return segments;
}

ResolvedSegmentList PlaylistResolver::resolveWithin(const std::string &playlistUrl,
                                                    const HeaderMap &headers,
                                                    int remainingHops,
                                                    std::set<std::string> &visited)
{
    if (!UrlTools::isValidUrl(playlistUrl))
    {
        fail(ErrorKind::InvalidReference, fmt::format("Invalid m3u8 URL provided: '{}'", playlistUrl));
        return {};
    }

    if (!visited.insert(playlistUrl).second)
    {
        fail(ErrorKind::ResolutionFailure, fmt::format("Playlist cycle detected at {}", playlistUrl));
        return {};
    }

    HttpRequest request;
    request.url = playlistUrl;
    request.headers = headers.empty() ? defaultRequestHeaders() : headers;
    request.timeoutSeconds = limits_.requestTimeoutSeconds;

    std::string document;
    if (!transport_.fetchText(request, document))
    {
        fail(ErrorKind::ResolutionFailure,
             fmt::format("Error downloading m3u8 playlist {}: {}", playlistUrl, transport_.getLastError()));
        return {};
    }

    diagnostics_.debug("M3U8 playlist content: {}", document.substr(0, 500));

    ResolvedSegmentList segments = extractSegments(document);
    if (!segments.empty())
    {
        mediaPlaylistUrl_ = playlistUrl;
        return segments;
    }

    diagnostics_.warn("No .ts segments found in the playlist {}", playlistUrl);

    std::string nested = findNestedPlaylist(document);
    if (nested.empty())
    {
        fail(ErrorKind::ResolutionFailure, fmt::format("Playlist {} lists no segments or playlists", playlistUrl));
        return {};
    }

    if (remainingHops <= 0)
    {
        fail(ErrorKind::ResolutionFailure,
             fmt::format("Gave up at {}: nested playlist limit of {} reached", playlistUrl, limits_.maxPlaylistHops));
        return {};
    }

    std::string nestedUrl = UrlTools::resolve(nested, UrlTools::directoryOf(playlistUrl), UrlTools::originOf(playlistUrl));
    diagnostics_.info("Found master playlist URL: {}", nestedUrl);

    return resolveWithin(nestedUrl, headers, remainingHops - 1, visited);
}
