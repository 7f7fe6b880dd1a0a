#pragma once

#include <optional>
#include <string>

/**
 * Minimal URL handling for playlist and segment locations.
 * Only what the downloader needs: scheme/host validation and the
 * directory/origin arithmetic used to resolve relative references.
 */
class UrlTools
{
public:
    struct Parts
    {
        std::string scheme;   // Lower-cased ("https")
        std::string host;     // Network location, may include userinfo and port
        std::string path;     // Everything after the host, query included
    };

    /**
     * Split an absolute URL into scheme, host and remainder.
     *
     * @param url Candidate URL
     * @return Parts, or std::nullopt if there is no "scheme://" prefix
     */
    static std::optional<Parts> split(const std::string &url);

    /**
     * Check that a URL is absolute, uses http/https and names a host.
     * Whitespace and control characters anywhere in the URL are rejected.
     */
    static bool isValidUrl(const std::string &url);

    /**
     * Directory component of a URL: everything before the final '/' of the
     * path (query and fragment are ignored when looking for it).
     * "https://example.com/v/index.m3u8" -> "https://example.com/v"
     */
    static std::string directoryOf(const std::string &url);

    /**
     * Scheme and host of a URL: "https://example.com:8443/a/b" -> "https://example.com:8443".
     * Returns an empty string when the URL cannot be split.
     */
    static std::string originOf(const std::string &url);

    static bool isAbsolute(const std::string &reference);

    /**
     * Resolve a playlist or segment reference.
     *
     * @param reference Absolute URL, "/"-rooted path or relative path
     * @param directory Directory URL that relative paths are joined to
     * @param origin Origin that "/"-rooted paths are appended to
     */
    static std::string resolve(const std::string &reference,
                               const std::string &directory,
                               const std::string &origin);
};
