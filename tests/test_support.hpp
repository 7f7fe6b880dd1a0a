#pragma once

// Shared helpers for the test executables: a result counter, a scratch
// directory, and in-memory stand-ins for the network, ffmpeg and whisper.

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "assembler.hpp"
#include "diagnostics.hpp"
#include "http_client.hpp"
#include "transcriber.hpp"

/**
 * Counts checks and prints one PASS/FAIL line per check.
 */
class TestRun
{
public:
    explicit TestRun(std::string suite) : suite_(std::move(suite)) {}

    void check(bool condition, const std::string &description)
    {
        if (condition)
        {
            passed_++;
            fmt::print("  PASS  {}\n", description);
        }
        else
        {
            failed_++;
            fmt::print(stderr, "  FAIL  {}\n", description);
        }
    }

    int finish() const
    {
        fmt::print("\n{}: {} passed, {} failed\n", suite_, passed_, failed_);
        return failed_ == 0 ? 0 : 1;
    }

private:
    std::string suite_;
    int passed_ = 0;
    int failed_ = 0;
};

/**
 * Scratch directory removed at scope exit.
 */
class ScratchDir
{
public:
    ScratchDir()
    {
        std::string pattern = (std::filesystem::temp_directory_path() / "hlsgrab_test_XXXXXX").string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        if (::mkdtemp(buffer.data()) == nullptr)
        {
            throw std::runtime_error("Cannot create scratch directory");
        }
        path_ = buffer.data();
    }

    ~ScratchDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    ScratchDir(const ScratchDir &) = delete;
    ScratchDir &operator=(const ScratchDir &) = delete;

    const std::filesystem::path &path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline void writeFile(const std::filesystem::path &path, const std::string &content)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string readFile(const std::filesystem::path &path)
{
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

/**
 * Keeps every message so tests can assert on diagnostics.
 */
class RecordingDiagnostics : public Diagnostics
{
public:
    void log(Level level, const std::string &message) override { entries.emplace_back(level, message); }

    bool contains(Level level, const std::string &fragment) const
    {
        return std::any_of(entries.begin(), entries.end(), [&](const auto &entry) {
            return entry.first == level && entry.second.find(fragment) != std::string::npos;
        });
    }

    std::vector<std::pair<Level, std::string>> entries;
};

/**
 * Canned HTTP responses keyed by URL. Unknown URLs fail like a DNS error.
 */
class FakeTransport : public HttpTransport
{
public:
    struct Response
    {
        long status = 200;
        std::string body;
        std::optional<std::uint64_t> declaredLength; // Content-Length to announce
        bool networkError = false;
    };

    void add(const std::string &url, std::string body)
    {
        Response response;
        response.declaredLength = body.size();
        response.body = std::move(body);
        responses[url] = std::move(response);
    }

    void add(const std::string &url, Response response) { responses[url] = std::move(response); }

    bool fetchText(const HttpRequest &request, std::string &body) override
    {
        requests.push_back(request);
        const Response *response = lookup(request.url);
        if (!response)
        {
            return false;
        }
        body = response->body;
        return true;
    }

    bool stream(const HttpRequest &request, StreamSink &sink) override
    {
        requests.push_back(request);
        const Response *response = lookup(request.url);
        if (!response)
        {
            return false;
        }

        if (!sink.onResponse(response->status, response->declaredLength))
        {
            lastError_ = "Transfer stopped by receiver";
            return false;
        }

        for (std::size_t offset = 0; offset < response->body.size(); offset += chunkBytes)
        {
            std::size_t piece = std::min(chunkBytes, response->body.size() - offset);
            if (!sink.onData(response->body.data() + offset, piece))
            {
                lastError_ = "Transfer stopped by receiver";
                return false;
            }
        }
        return true;
    }

    std::string getLastError() const override { return lastError_; }

    std::vector<std::string> requestedUrls() const
    {
        std::vector<std::string> urls;
        for (const auto &request : requests)
        {
            urls.push_back(request.url);
        }
        return urls;
    }

    std::map<std::string, Response> responses;
    std::vector<HttpRequest> requests;
    std::size_t chunkBytes = 8192;

private:
    const Response *lookup(const std::string &url)
    {
        auto it = responses.find(url);
        if (it == responses.end())
        {
            lastError_ = fmt::format("Could not resolve host for {}", url);
            return nullptr;
        }
        if (it->second.networkError)
        {
            lastError_ = "Connection reset by peer";
            return nullptr;
        }
        if (it->second.status < 200 || it->second.status >= 300)
        {
            lastError_ = fmt::format("HTTP error {}", it->second.status);
            return nullptr;
        }
        return &it->second;
    }

    std::string lastError_;
};

/**
 * Concatenates segment files in-process instead of running ffmpeg.
 */
class FakeAssembler : public Assembler
{
public:
    bool assemble(const std::vector<std::filesystem::path> &segments,
                  const std::filesystem::path &output) override
    {
        calls++;
        received = segments;
        if (fail)
        {
            return false;
        }

        std::ofstream out(output, std::ios::binary | std::ios::trunc);
        for (const auto &segment : segments)
        {
            out << readFile(segment);
        }
        return true;
    }

    std::string getLastError() const override { return fail ? "ffmpeg exited with status 1" : ""; }

    bool fail = false;
    int calls = 0;
    std::vector<std::filesystem::path> received;
};

/**
 * Returns canned text and counts invocations.
 */
class FakeTranscriber : public Transcriber
{
public:
    std::optional<std::string> transcribe(const std::filesystem::path &, ModelSize model) override
    {
        calls++;
        lastModel = model;
        if (fail)
        {
            return std::nullopt;
        }
        return text;
    }

    std::string getLastError() const override { return "model crashed"; }

    std::string text = "This is a test transcription";
    bool fail = false;
    int calls = 0;
    std::optional<ModelSize> lastModel;
};
