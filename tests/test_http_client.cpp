#include "http_client.hpp"
#include "playlist_resolver.hpp"
#include "test_support.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace
{
    const unsigned char GZIP_PLAYLIST[] = {
        0x1f, 0x8b, 0x08, 0x00, 0x00, 0x00, 0x00, 0x00, 0x02, 0x03, 0x53, 0x76, 0x8d, 0x08, 0xf1, 0x35,
        0x0e, 0xe5, 0x52, 0x06, 0xd2, 0x9e, 0x7e, 0x6e, 0x56, 0x86, 0x06, 0x3a, 0x5c, 0xc5, 0xa9, 0xe9,
        0xb9, 0xa9, 0x79, 0x25, 0x86, 0x7a, 0x25, 0xc5, 0x60, 0x71, 0xdd, 0x08, 0x5d, 0x57, 0x3f, 0x17,
        0x1f, 0xcf, 0xe0, 0x10, 0x2e, 0x00, 0x96, 0x8f, 0xea, 0xc8, 0x2f, 0x00, 0x00, 0x00};

    // Decoded form of GZIP_PLAYLIST
    const char *const PLAIN_PLAYLIST = "#EXTM3U\n#EXTINF:10,\nsegment1.ts\n#EXT-X-ENDLIST\n";

    std::string response(const std::string &status, const std::string &body,
                         const std::string &extraHeaders = "")
    {
        return fmt::format("HTTP/1.1 {}\r\nContent-Length: {}\r\nConnection: close\r\n{}\r\n{}",
                           status, body.size(), extraHeaders, body);
    }

    /**
     * One-connection-at-a-time HTTP/1.1 server on 127.0.0.1. Each route
     * returns the raw response bytes for its n-th hit (1-based); the
     * connection is closed after every response.
     */
    class LoopbackServer
    {
    public:
        using Route = std::function<std::string(int hit)>;

        explicit LoopbackServer(std::map<std::string, Route> routes) : routes_(std::move(routes))
        {
            listenFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
            if (listenFd_ < 0)
            {
                throw std::runtime_error("Cannot create listening socket");
            }
            int reuse = 1;
            ::setsockopt(listenFd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

            sockaddr_in address{};
            address.sin_family = AF_INET;
            address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
            address.sin_port = 0; // Any free port
            socklen_t length = sizeof(address);
            if (::bind(listenFd_, reinterpret_cast<sockaddr *>(&address), sizeof(address)) != 0 ||
                ::listen(listenFd_, 8) != 0 ||
                ::getsockname(listenFd_, reinterpret_cast<sockaddr *>(&address), &length) != 0)
            {
                ::close(listenFd_);
                throw std::runtime_error("Cannot listen on 127.0.0.1");
            }
            port_ = ntohs(address.sin_port);

            worker_ = std::thread([this] { serve(); });
        }

        ~LoopbackServer()
        {
            stop_ = true;
            if (worker_.joinable())
            {
                worker_.join();
            }
            ::close(listenFd_);
        }

        LoopbackServer(const LoopbackServer &) = delete;
        LoopbackServer &operator=(const LoopbackServer &) = delete;

        std::string url(const std::string &path) const { return fmt::format("http://127.0.0.1:{}{}", port_, path); }

        int hits(const std::string &path)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = hits_.find(path);
            return it == hits_.end() ? 0 : it->second;
        }

        // Header block of the last request for a path
        std::string lastRequest(const std::string &path)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = requests_.find(path);
            return it == requests_.end() ? "" : it->second;
        }

    private:
        void serve()
        {
            while (!stop_)
            {
                pollfd waiting{listenFd_, POLLIN, 0};
                if (::poll(&waiting, 1, 100) <= 0)
                {
                    continue;
                }
                int client = ::accept(listenFd_, nullptr, nullptr);
                if (client < 0)
                {
                    continue;
                }
                handle(client);
                ::close(client);
            }
        }

        void handle(int client)
        {
            std::string request;
            char buffer[4096];
            while (request.find("\r\n\r\n") == std::string::npos)
            {
                ssize_t received = ::recv(client, buffer, sizeof(buffer), 0);
                if (received <= 0)
                {
                    return;
                }
                request.append(buffer, static_cast<std::size_t>(received));
            }

            // "GET /path HTTP/1.1"
            std::size_t pathStart = request.find(' ') + 1;
            std::string path = request.substr(pathStart, request.find(' ', pathStart) - pathStart);

            std::string reply;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                int hit = ++hits_[path];
                requests_[path] = request;
                auto route = routes_.find(path);
                reply = route == routes_.end() ? response("404 Not Found", "no route") : route->second(hit);
            }

            std::size_t sent = 0;
            while (sent < reply.size())
            {
                ssize_t written = ::send(client, reply.data() + sent, reply.size() - sent, MSG_NOSIGNAL);
                if (written <= 0)
                {
                    return;
                }
                sent += static_cast<std::size_t>(written);
            }
        }

        std::map<std::string, Route> routes_;
        std::map<std::string, int> hits_;
        std::map<std::string, std::string> requests_;
        std::mutex mutex_;
        int listenFd_ = -1;
        unsigned short port_ = 0;
        std::atomic<bool> stop_{false};
        std::thread worker_;
    };

    /**
     * Records the order and size of every sink callback.
     */
    class RecordingSink : public StreamSink
    {
    public:
        bool onResponse(long status, std::optional<std::uint64_t> contentLength) override
        {
            responseCalls++;
            lastStatus = status;
            declared = contentLength;
            responseBeforeData = received == 0;
            return !maxDeclared || !contentLength || *contentLength <= *maxDeclared;
        }

        bool onData(const char *data, std::size_t size) override
        {
            if (responseCalls == 0)
            {
                dataBeforeResponse = true;
            }
            received += size;
            largestPiece = std::max(largestPiece, size);
            body.append(data, size);
            return true;
        }

        std::optional<std::uint64_t> maxDeclared; // Refuse responses declaring more
        int responseCalls = 0;
        long lastStatus = 0;
        std::optional<std::uint64_t> declared;
        bool responseBeforeData = false;
        bool dataBeforeResponse = false;
        std::size_t received = 0;
        std::size_t largestPiece = 0;
        std::string body;
    };

    HttpRequest requestFor(const std::string &url)
    {
        HttpRequest request;
        request.url = url;
        request.timeoutSeconds = 10;
        return request;
    }
}

int main()
{
    TestRun run("http_client");

    // The loopback server must be reached directly
    ::setenv("no_proxy", "127.0.0.1", 1);
    ::setenv("NO_PROXY", "127.0.0.1", 1);

    try
    {
        NullDiagnostics quiet;
        const std::string large(20000, 'x');
        const std::string gzipBody(reinterpret_cast<const char *>(GZIP_PLAYLIST), sizeof(GZIP_PLAYLIST));

        LoopbackServer server({
            {"/plain.m3u8", [](int) { return response("200 OK", PLAIN_PLAYLIST); }},
            {"/gzip.m3u8", [&](int) { return response("200 OK", gzipBody, "Content-Encoding: gzip\r\n"); }},
            {"/missing.ts", [](int) { return response("404 Not Found", "missing body"); }},
            {"/large.ts", [&](int) { return response("200 OK", large); }},
            {"/empty.ts", [](int) { return response("200 OK", ""); }},
            {"/truncated.ts",
             [](int) {
                 return std::string("HTTP/1.1 200 OK\r\nContent-Length: 1000\r\nConnection: close\r\n\r\n") +
                        std::string(100, 't');
             }},
            {"/flaky.m3u8",
             [](int hit) { return hit == 1 ? response("503 Service Unavailable", "busy") : response("200 OK", "recovered"); }},
        });

        HttpClient client(quiet, 1024);

        // Plain text fetch
        {
            std::string body;
            run.check(client.fetchText(requestFor(server.url("/plain.m3u8")), body) && body == PLAIN_PLAYLIST,
                      "plain playlist fetched");

            HttpRequest withHeaders = requestFor(server.url("/plain.m3u8"));
            withHeaders.headers = {{"Referer", "https://site/page"}};
            client.fetchText(withHeaders, body);
            run.check(server.lastRequest("/plain.m3u8").find("Referer: https://site/page\r\n") != std::string::npos,
                      "request headers sent to the server");
        }

        // Compressed playlist with a captured Accept-Encoding header
        {
            HttpRequest request = requestFor(server.url("/gzip.m3u8"));
            request.headers = {{"Accept-Encoding", "gzip, deflate, br"}};
            std::string body;
            run.check(client.fetchText(request, body), "gzip playlist fetched");
            run.check(body == PLAIN_PLAYLIST, "gzip body decoded before it reaches the caller");
            run.check(server.lastRequest("/gzip.m3u8").find("Accept-Encoding: gzip, deflate, br\r\n") !=
                          std::string::npos,
                      "captured Accept-Encoding sent unchanged");

            DownloadLimits limits;
            PlaylistResolver resolver(client, quiet, limits);
            auto segments = resolver.resolve(server.url("/gzip.m3u8"), request.headers);
            run.check(segments == ResolvedSegmentList{"segment1.ts"}, "resolver reads a gzip playlist");
        }

        // Non-2xx response
        {
            RecordingSink sink;
            run.check(!client.stream(requestFor(server.url("/missing.ts")), sink), "404 fails the transfer");
            run.check(sink.responseCalls == 0 && sink.received == 0, "no response or body delivered for a 404");
            run.check(client.getLastError().find("404") != std::string::npos, "status code kept in the error");

            std::string body = "stale";
            run.check(!client.fetchText(requestFor(server.url("/missing.ts")), body) && body.empty(),
                      "failed fetch leaves no body");
        }

        // Declared length, chunking
        {
            RecordingSink sink;
            run.check(client.stream(requestFor(server.url("/large.ts")), sink), "large body streamed");
            run.check(sink.responseCalls == 1 && sink.responseBeforeData && !sink.dataBeforeResponse,
                      "response announced once, before any body byte");
            run.check(sink.declared && *sink.declared == large.size(), "declared Content-Length reaches the sink");
            run.check(sink.received == large.size() && sink.body == large, "whole body delivered");
            run.check(sink.largestPiece > 0 && sink.largestPiece <= 1024, "body arrives in pieces of at most chunkBytes");
        }

        // Sink refuses on the declared length
        {
            RecordingSink sink;
            sink.maxDeclared = 100;
            run.check(!client.stream(requestFor(server.url("/large.ts")), sink), "refused response fails the transfer");
            run.check(sink.received == 0, "refused response delivers no body");
        }

        // Empty body
        {
            RecordingSink sink;
            run.check(client.stream(requestFor(server.url("/empty.ts")), sink), "empty 200 succeeds");
            run.check(sink.responseCalls == 1 && sink.lastStatus == 200, "empty body still announces the response");
            run.check(sink.declared && *sink.declared == 0, "empty body declares zero length");
        }

        // Retries
        {
            HttpClient retrying(quiet, 1024, 2);

            RecordingSink sink;
            run.check(!retrying.stream(requestFor(server.url("/truncated.ts")), sink), "truncated body fails");
            run.check(sink.received == 100, "bytes before the cut were delivered");
            run.check(server.hits("/truncated.ts") == 1, "no retry once body bytes reached the sink");

            std::string body;
            run.check(retrying.fetchText(requestFor(server.url("/flaky.m3u8")), body) && body == "recovered",
                      "transient 503 retried");
            run.check(server.hits("/flaky.m3u8") == 2, "one retry for one transient failure");

            int before = server.hits("/missing.ts");
            retrying.fetchText(requestFor(server.url("/missing.ts")), body);
            run.check(server.hits("/missing.ts") == before + 1, "404 is not retried");
        }
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    }

    return run.finish();
}
