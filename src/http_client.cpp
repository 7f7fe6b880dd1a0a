#include "http_client.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>

#include <fmt/core.h>
#include <thread>
#include <random>

namespace
{
    // Playlists are small text files; anything bigger is not a manifest
    constexpr std::size_t MAX_PLAYLIST_BYTES = 16 * 1024 * 1024;

    /**
     * Collects a text body in memory.
     */
    class StringSink : public StreamSink
    {
    public:
        explicit StringSink(std::string &body) : body_(body) { body_.clear(); }

        bool onResponse(long, std::optional<std::uint64_t> contentLength) override
        {
            overflowed_ = contentLength && *contentLength > MAX_PLAYLIST_BYTES;
            return !overflowed_;
        }

        bool onData(const char *data, std::size_t size) override
        {
            if (body_.size() + size > MAX_PLAYLIST_BYTES)
            {
                overflowed_ = true;
                return false;
            }
            body_.append(data, size);
            return true;
        }

        bool overflowed() const { return overflowed_; }

    private:
        std::string &body_;
        bool overflowed_ = false;
    };
}

HttpClient::HttpClient(Diagnostics &diagnostics, std::size_t chunkBytes, int maxRetries)
    : curl_(curl_easy_init(), curl_easy_cleanup),
      diagnostics_(diagnostics),
      chunkBytes_(chunkBytes),
      maxRetryAttempts_(maxRetries)
{
    if (!curl_)
    {
        lastError_ = "Failed to initialize CURL (out of memory or library error)";
        throw std::runtime_error(lastError_);
    }
}

// Destructor: unique_ptr handles cleanup automatically
HttpClient::~HttpClient() = default;

bool HttpClient::announceResponse(Transfer &transfer, CURL *handle)
{
    transfer.responseSeen = true;

    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &transfer.status);
    if (transfer.status < 200 || transfer.status >= 300)
    {
        return false;
    }

    curl_off_t declared = -1;
    std::optional<std::uint64_t> contentLength;
    if (curl_easy_getinfo(handle, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &declared) == CURLE_OK && declared >= 0)
    {
        contentLength = static_cast<std::uint64_t>(declared);
    }

    if (!transfer.sink->onResponse(transfer.status, contentLength))
    {
        transfer.stoppedBySink = true;
        return false;
    }
    return true;
}

// Static callback: libcurl calls this with chunks of downloaded data
size_t HttpClient::writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    // Calculate total bytes in this chunk
    size_t totalSize = size * nmemb;

    // userdata is our Transfer* (we pass it in configure)
    auto *transfer = static_cast<Transfer *>(userdata);

    if (!transfer->responseSeen && !announceResponse(*transfer, transfer->client->curl_.get()))
    {
        return 0; // Abort transfer
    }

    // Hand the data over in pieces no larger than the configured chunk size
    size_t offset = 0;
    while (offset < totalSize)
    {
        size_t piece = std::min(transfer->client->chunkBytes_, totalSize - offset);
        transfer->bodyStarted = true;
        if (!transfer->sink->onData(ptr + offset, piece))
        {
            transfer->stoppedBySink = true;
            return 0;
        }
        offset += piece;
    }

    // If we return 0 or a different value, libcurl aborts the transfer
    return totalSize;
}

std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> HttpClient::configure(const HttpRequest &request,
                                                                                  Transfer &transfer)
{
    CURL *handle = curl_.get();
    curl_easy_reset(handle);

    // 1. Set URL
    curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str());

    // 2. Set write callback and pass transfer state as context
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &transfer);
    curl_easy_setopt(handle, CURLOPT_BUFFERSIZE, static_cast<long>(chunkBytes_));

    // 3. HTTPS settings (CRITICAL for security)
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, request.verifyTls ? 1L : 0L);
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, request.verifyTls ? 2L : 0L);
#if LIBCURL_VERSION_NUM >= 0x075500
    curl_easy_setopt(handle, CURLOPT_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(handle, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
#else
    curl_easy_setopt(handle, CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
    curl_easy_setopt(handle, CURLOPT_REDIR_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
#endif

    // 4. Follow HTTP redirects, fail on 4xx/5xx without delivering the body
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle, CURLOPT_MAXREDIRS, 5L); // Limit redirect chain
    curl_easy_setopt(handle, CURLOPT_FAILONERROR, 1L);

    // 5. Bound the whole call
    long timeout = static_cast<long>(request.timeoutSeconds);
    curl_easy_setopt(handle, CURLOPT_TIMEOUT, timeout);
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, std::min(timeout, 30L));
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);

    // Decode gzip/deflate bodies; a captured Accept-Encoding header still wins on the wire
    curl_easy_setopt(handle, CURLOPT_ACCEPT_ENCODING, "");

    // 6. Request headers
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headerList(nullptr, curl_slist_free_all);
    for (const auto &[name, value] : request.headers)
    {
        std::string line = value.empty() ? fmt::format("{};", name) : fmt::format("{}: {}", name, value);
        curl_slist *extended = curl_slist_append(headerList.get(), line.c_str());
        if (!extended)
        {
            throw std::runtime_error("Failed to allocate CURL header list");
        }
        headerList.release();
        headerList.reset(extended);
    }
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headerList.get());

    return headerList;
}

bool HttpClient::perform(const HttpRequest &request, StreamSink &sink)
{
    lastError_.clear();

    int attemptCount = 0;

    while (true)
    {
        Transfer transfer;
        transfer.client = this;
        transfer.sink = &sink;

        auto headerList = configure(request, transfer);
        CURLcode res = curl_easy_perform(curl_.get());

        long httpCode = 0;
        curl_easy_getinfo(curl_.get(), CURLINFO_RESPONSE_CODE, &httpCode);

        if (res == CURLE_OK)
        {
            // Empty bodies never reach the write callback
            if (!transfer.responseSeen && !announceResponse(transfer, curl_.get()))
            {
                lastError_ = transfer.stoppedBySink
                                 ? "Response rejected"
                                 : fmt::format("HTTP error {}: {}", transfer.status, getHttpStatusText(transfer.status));
                return false;
            }
            return true;
        }

        if (transfer.stoppedBySink)
        {
            lastError_ = "Transfer stopped by receiver";
            return false;
        }

        // Classify before deciding on a retry
        ErrorType errorType = classifyError(res, httpCode);
        if (res == CURLE_HTTP_RETURNED_ERROR || (res == CURLE_WRITE_ERROR && httpCode >= 300))
        {
            lastError_ = fmt::format("HTTP error {}: {}", httpCode, getHttpStatusText(httpCode));
        }
        else
        {
            lastError_ = curl_easy_strerror(res);
        }

        attemptCount++;

        // Body bytes already went to the sink: a retry would duplicate them
        bool shouldRetry = !transfer.bodyStarted &&
                           (errorType == ErrorType::Transient || errorType == ErrorType::Unknown) &&
                           (attemptCount <= maxRetryAttempts_);
        if (!shouldRetry)
        {
            return false;
        }

        // Calculate exponential backoff delay: 1s, 2s, 4s + jitter to prevent thundering herd
        int baseDelayMs = INITIAL_RETRY_DELAY_MS * (1 << (attemptCount - 1));
        // Add random jitter: +/-20% variation
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(-20, 20);
        int jitterPercent = dis(gen);
        int delayMs = baseDelayMs + (baseDelayMs * jitterPercent / 100);

        diagnostics_.warn("Request for {} failed (attempt {}/{}): {}. Retrying in {} ms",
                          request.url, attemptCount, maxRetryAttempts_ + 1, lastError_, delayMs);

        // Wait before retry
        std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));
    }
}

bool HttpClient::fetchText(const HttpRequest &request, std::string &body)
{
    StringSink sink(body);
    if (!perform(request, sink))
    {
        if (sink.overflowed())
        {
            lastError_ = fmt::format("Playlist larger than {} bytes", MAX_PLAYLIST_BYTES);
        }
        body.clear();
        return false;
    }
    return true;
}

bool HttpClient::stream(const HttpRequest &request, StreamSink &sink)
{
    return perform(request, sink);
}

// Helper: Get human-readable HTTP status text
std::string HttpClient::getHttpStatusText(long code) const
{
    switch (code)
    {
    case 200:
        return "OK";
    case 204:
        return "No Content";
    case 301:
        return "Moved Permanently";
    case 302:
        return "Found";
    case 304:
        return "Not Modified";
    case 400:
        return "Bad Request";
    case 401:
        return "Unauthorized";
    case 403:
        return "Forbidden";
    case 404:
        return "Not Found";
    case 410:
        return "Gone";
    case 429:
        return "Too Many Requests";
    case 500:
        return "Internal Server Error";
    case 502:
        return "Bad Gateway";
    case 503:
        return "Service Unavailable";
    case 504:
        return "Gateway Timeout";
    default:
        return "Unknown Status";
    }
}

// Classify error for retry logic
HttpClient::ErrorType HttpClient::classifyError(CURLcode code, long httpCode) const
{
    switch (code)
    {
    // Transient network errors - worth retrying
    case CURLE_OPERATION_TIMEDOUT:   // Server didn't respond in time
    case CURLE_COULDNT_RESOLVE_HOST: // DNS lookup failed (might be temporary)
    case CURLE_COULDNT_CONNECT:      // Connection refused (server might be restarting)
    case CURLE_PARTIAL_FILE:         // Transfer ended early (network interruption)
    case CURLE_RECV_ERROR:           // Error receiving data (network glitch)
    case CURLE_SEND_ERROR:           // Error sending data (network glitch)
    case CURLE_GOT_NOTHING:          // Server sent no data (might be overloaded)
        return ErrorType::Transient;

    // Permanent errors - retrying won't help
    case CURLE_URL_MALFORMAT:        // Invalid URL syntax
    case CURLE_UNSUPPORTED_PROTOCOL: // Only http/https are allowed
    case CURLE_OUT_OF_MEMORY:        // System resource exhaustion
    case CURLE_SSL_CERTPROBLEM:      // SSL certificate invalid
    case CURLE_SSL_CIPHER:           // SSL cipher negotiation failed
    case CURLE_PEER_FAILED_VERIFICATION: // Certificate did not verify
    case CURLE_TOO_MANY_REDIRECTS:   // Redirect loop
        return ErrorType::Permanent;

    // The server answered with a status code
    case CURLE_HTTP_RETURNED_ERROR:
    case CURLE_WRITE_ERROR:
        if (httpCode >= 400 && httpCode < 500)
        {
            // 4xx Client Errors - usually permanent (408 and 429 excepted)
            return (httpCode == 408 || httpCode == 429) ? ErrorType::Transient : ErrorType::Permanent;
        }
        else if (httpCode >= 500 && httpCode < 600)
        {
            // 5xx Server Errors - usually transient (server overload, temporary issues)
            return ErrorType::Transient;
        }
        return ErrorType::Permanent;

    // Unknown CURL error - be conservative and retry
    default:
        return ErrorType::Unknown;
    }
}
