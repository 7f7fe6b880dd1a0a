#pragma once

#include <string>
#include <memory>
#include <optional>
#include <cstdint>
#include <curl/curl.h>

#include "config.hpp"
#include "diagnostics.hpp"

/**
 * One GET request as the downloader issues it.
 */
struct HttpRequest
{
    std::string url;
    HeaderMap headers;
    int timeoutSeconds = 30;
    bool verifyTls = true;
};

/**
 * Receives a streamed response body.
 * Either callback may return false to stop the transfer early.
 */
class StreamSink
{
public:
    virtual ~StreamSink() = default;

    /**
     * Called once the status line and headers are in, before any body data.
     *
     * @param status HTTP status code
     * @param contentLength Declared Content-Length, if the server sent one
     */
    virtual bool onResponse(long status, std::optional<std::uint64_t> contentLength) = 0;

    /**
     * Called for each body chunk (at most the configured chunk size).
     */
    virtual bool onData(const char *data, std::size_t size) = 0;
};

/**
 * Transport seam between the downloader and the network.
 * Both calls report failure by return value and leave the reason in
 * getLastError(); neither throws for network problems.
 */
class HttpTransport
{
public:
    virtual ~HttpTransport() = default;

    /**
     * Fetch a small text document (a playlist).
     *
     * @param request URL, headers and timeout
     * @param body Receives the response body on success
     * @return true on a 2xx response whose body was fully read
     */
    virtual bool fetchText(const HttpRequest &request, std::string &body) = 0;

    /**
     * Stream a response body into a sink.
     *
     * @return true if the transfer completed with a 2xx status and the sink
     *         never asked to stop
     */
    virtual bool stream(const HttpRequest &request, StreamSink &sink) = 0;

    virtual std::string getLastError() const = 0;
};

/**
 * HTTP client for downloading playlists and segments using libcurl.
 * Uses RAII to manage CURL handle lifecycle.
 */
class HttpClient : public HttpTransport
{
public:
    /**
     * @param diagnostics Sink for retry notices
     * @param chunkBytes Receive buffer size handed to libcurl
     * @param maxRetries Extra attempts for transient errors (0 = none)
     */
    explicit HttpClient(Diagnostics &diagnostics, std::size_t chunkBytes = 8192, int maxRetries = 0);
    ~HttpClient() override;

    // Delete copy operations (CURL handles aren't copyable)
    HttpClient(const HttpClient &) = delete;
    HttpClient &operator=(const HttpClient &) = delete;

    bool fetchText(const HttpRequest &request, std::string &body) override;
    bool stream(const HttpRequest &request, StreamSink &sink) override;

    /**
     * Get detailed error message from last operation.
     */
    std::string getLastError() const override { return lastError_; }

private:
    /**
     * Per-transfer state shared with the libcurl callbacks.
     */
    struct Transfer
    {
        HttpClient *client = nullptr;
        StreamSink *sink = nullptr;
        bool responseSeen = false;  // onResponse() already called
        bool bodyStarted = false;   // At least one byte went to the sink
        bool stoppedBySink = false; // Sink returned false
        long status = 0;
    };

    /**
     * Whether a failed transfer is worth another attempt.
     */
    enum class ErrorType
    {
        Transient, // Timeouts, resets, 5xx, 408/429
        Permanent, // Bad URL, TLS failure, other 4xx
        Unknown    // Anything else; retried like Transient
    };

    /**
     * CURLOPT_WRITEFUNCTION: forwards body bytes to the Transfer's sink.
     * @return size * nmemb, or 0 to make libcurl abort the transfer
     */
    static size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata);

    /**
     * Deliver the status and Content-Length to the sink once per transfer.
     * @return false if the sink declined the response
     */
    static bool announceResponse(Transfer &transfer, CURL *handle);

    /**
     * Run one request with the retry policy applied.
     */
    bool perform(const HttpRequest &request, StreamSink &sink);

    /**
     * Apply URL, headers, TLS and timeout options for a request.
     * @return Header list owned by the caller (freed after the transfer)
     */
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> configure(const HttpRequest &request,
                                                                          Transfer &transfer);

    // Reason phrase for the common status codes
    std::string getHttpStatusText(long code) const;

    /**
     * @param code Result of curl_easy_perform
     * @param httpCode Response status, 0 if none arrived
     */
    ErrorType classifyError(CURLcode code, long httpCode) const;

    // One easy handle reused for every request (reset in configure())
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl_;

    Diagnostics &diagnostics_;

    std::string lastError_;

    std::size_t chunkBytes_;

    // Retry configuration
    int maxRetryAttempts_;
    static constexpr int INITIAL_RETRY_DELAY_MS = 1000; // 1 second
};
