#pragma once

#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "diagnostics.hpp"
#include "errors.hpp"

/**
 * A validated playlist location plus the headers to send with every
 * request made for it and its segments. Immutable once built.
 */
class PlaylistReference
{
public:
    /**
     * @param url Absolute http/https playlist URL
     * @param headers Request headers; empty means "use the defaults"
     * @throws std::invalid_argument if the URL does not validate
     */
    explicit PlaylistReference(std::string url, HeaderMap headers = {});

    const std::string &url() const { return url_; }
    const HeaderMap &headers() const { return headers_; }

private:
    std::string url_;
    HeaderMap headers_;
};

/**
 * URL and headers lifted from a captured request ("Copy as cURL").
 * An empty url means the capture could not be used.
 */
struct CapturedRequest
{
    std::optional<std::string> url;
    HeaderMap headers;
};

/**
 * Turns user input into a PlaylistReference.
 */
class ReferenceParser
{
public:
    explicit ReferenceParser(Diagnostics &diagnostics) : diagnostics_(diagnostics) {}

    /**
     * Split a command line into words using POSIX shell quoting rules.
     *
     * @param text Command line text
     * @param tokens Receives the words
     * @return false on an unterminated quote or a dangling backslash
     */
    static bool tokenize(const std::string &text, std::vector<std::string> &tokens);

    /**
     * Extract URL and headers from a captured curl invocation.
     * Never throws: any tokenization failure yields an empty result.
     */
    CapturedRequest parseCapturedRequest(const std::string &command);

    /**
     * Build a reference from either a bare URL or a captured request.
     *
     * @param input URL, or curl command when capturedMode is set
     * @param capturedMode Treat input as a captured request
     * @return Reference, or std::nullopt with an InvalidReference error
     */
    std::optional<PlaylistReference> parseReference(const std::string &input, bool capturedMode);

    /**
     * Strip a trailing "/seg-..." suffix so a copied segment request points
     * back at its playlist. URLs without the marker are returned unchanged.
     */
    static std::string derivePlaylistUrl(const std::string &url);

    const Failure &getLastError() const { return lastError_; }

private:
    Diagnostics &diagnostics_;
    Failure lastError_;
};
