#pragma once

#include <set>
#include <string>
#include <vector>

#include "config.hpp"
#include "diagnostics.hpp"
#include "errors.hpp"
#include "http_client.hpp"

/**
 * Ordered segment references in playback order.
 */
using ResolvedSegmentList = std::vector<std::string>;

/**
 * Fetches a playlist and turns it into segment references, following
 * master playlists for a bounded number of hops.
 *
 * Fails closed: every problem ends in an empty list and a logged
 * diagnostic, never an exception.
 */
class PlaylistResolver
{
public:
    PlaylistResolver(HttpTransport &transport, Diagnostics &diagnostics, const DownloadLimits &limits)
        : transport_(transport), diagnostics_(diagnostics), limits_(limits)
    {
    }

    /**
     * Resolve a playlist URL to its segment references.
     *
     * @param playlistUrl http/https playlist URL
     * @param headers Request headers (used for nested playlists too)
     * @return Segment references, at most limits.maxSegments; empty on failure
     */
    ResolvedSegmentList resolve(const std::string &playlistUrl, const HeaderMap &headers);

    /**
     * Split a playlist document into its segment references.
     * Lines are trimmed; a line whose path ends in ".ts" is a segment, the
     * "?query" or "#fragment" after the path not counted ("b.ts?token=1"
     * matches). '#' lines and everything else are ignored.
     */
    static ResolvedSegmentList extractSegments(const std::string &document);

    /**
     * First nested playlist reference (path ending in ".m3u8", query and
     * fragment ignored as for segments), or "".
     */
    static std::string findNestedPlaylist(const std::string &document);

    /**
     * URL of the playlist that actually produced the segments of the last
     * successful resolve(); differs from the input after a master hop.
     */
    const std::string &getMediaPlaylistUrl() const { return mediaPlaylistUrl_; }

    const Failure &getLastError() const { return lastError_; }

private:
    ResolvedSegmentList resolveWithin(const std::string &playlistUrl,
                                      const HeaderMap &headers,
                                      int remainingHops,
                                      std::set<std::string> &visited);

    void fail(ErrorKind kind, const std::string &message);

    HttpTransport &transport_;
    Diagnostics &diagnostics_;
    DownloadLimits limits_;
    std::string mediaPlaylistUrl_;
    Failure lastError_;
};
