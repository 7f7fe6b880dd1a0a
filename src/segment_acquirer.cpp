#include "segment_acquirer.hpp"

#include <fstream>
#include <stdexcept>
#include <utility>

#include <fmt/core.h>

#include "url_tools.hpp"

namespace
{
    /**
     * Writes a segment body to its slot file, enforcing the size ceiling.
     * The file is only created once the response has been accepted.
     */
    class SlotWriter : public StreamSink
    {
    public:
        SlotWriter(std::filesystem::path slot, std::uint64_t maxBytes)
            : slot_(std::move(slot)), maxBytes_(maxBytes)
        {
        }

        bool onResponse(long, std::optional<std::uint64_t> contentLength) override
        {
            if (contentLength && *contentLength > maxBytes_)
            {
                declaredTooLarge_ = true;
                return false;
            }

            out_.open(slot_, std::ios::binary | std::ios::trunc);
            if (!out_)
            {
                writeFailed_ = true;
                return false;
            }
            return true;
        }

        bool onData(const char *data, std::size_t size) override
        {
            received_ += size;
            if (received_ > maxBytes_)
            {
                exceededLimit_ = true;
                return false;
            }

            out_.write(data, static_cast<std::streamsize>(size));
            if (!out_.good())
            {
                writeFailed_ = true;
                return false;
            }
            return true;
        }

        bool finish()
        {
            if (out_.is_open())
            {
                out_.close();
                return !out_.fail();
            }
            return false;
        }

        // Drop whatever was written so far
        void discard()
        {
            if (out_.is_open())
            {
                out_.close();
            }
            std::error_code ec;
            std::filesystem::remove(slot_, ec);
        }

        bool declaredTooLarge() const { return declaredTooLarge_; }
        bool exceededLimit() const { return exceededLimit_; }
        bool writeFailed() const { return writeFailed_; }
        std::uint64_t received() const { return received_; }

    private:
        std::filesystem::path slot_;
        std::uint64_t maxBytes_;
        std::ofstream out_;
        std::uint64_t received_ = 0;
        bool declaredTooLarge_ = false;
        bool exceededLimit_ = false;
        bool writeFailed_ = false;
    };
}

std::string SegmentAcquirer::segmentUrl(const std::string &segment, const std::string &baseUrl) const
{
    std::string origin = originOverride_ ? *originOverride_ : UrlTools::originOf(baseUrl);
    if (!origin.empty() && origin.back() == '/')
    {
        origin.pop_back();
    }
    return UrlTools::resolve(segment, baseUrl, origin);
}

std::unique_ptr<WorkingArea> SegmentAcquirer::acquire(const std::vector<std::string> &segments,
                                                      const std::string &baseUrl,
                                                      const HeaderMap &headers)
{
    lastError_ = Failure{};
    report_ = AcquisitionReport{};

    if (segments.empty())
    {
        lastError_ = {ErrorKind::NoSegments, "No segments to download"};
        diagnostics_.error(lastError_.message);
        return nullptr;
    }

    std::unique_ptr<WorkingArea> area;
    try
    {
        area = WorkingArea::create(diagnostics_);
    }
    catch (const std::exception &e)
    {
        lastError_ = {ErrorKind::AcquisitionSetupFailed, e.what()};
        diagnostics_.error("Cannot set up segment download: {}", e.what());
        return nullptr;
    }

    HttpRequest request;
    request.headers = headers.empty() ? defaultRequestHeaders() : headers;
    request.timeoutSeconds = limits_.requestTimeoutSeconds;

    for (std::size_t i = 0; i < segments.size(); ++i)
    {
        request.url = segmentUrl(segments[i], baseUrl);
        report_.attempted++;

        diagnostics_.info("Downloading segment {}/{}", i + 1, segments.size());

        std::string reason;
        if (fetchSegment(request, area->segmentPath(i), i, segments.size(), reason))
        {
            report_.stored.push_back(i);
        }
        else
        {
            report_.skipped.push_back(i);
            report_.skipReasons.push_back({ErrorKind::SegmentSkipped, reason});
        }
    }

    if (!report_.skipped.empty())
    {
        diagnostics_.warn("{} of {} segments were skipped", report_.skipped.size(), segments.size());
    }

    return area;
}

bool SegmentAcquirer::fetchSegment(const HttpRequest &request, const std::filesystem::path &slot,
                                   std::size_t position, std::size_t total, std::string &reason)
{
    SlotWriter writer(slot, limits_.maxSegmentBytes);

    bool transferred = transport_.stream(request, writer);

    if (writer.declaredTooLarge())
    {
        reason = fmt::format("Segment {} exceeds maximum size limit", position + 1);
        diagnostics_.warn(reason);
        return false;
    }

    if (writer.exceededLimit())
    {
        writer.discard();
        reason = fmt::format("Segment {} download exceeded size limit", position + 1);
        diagnostics_.warn(reason);
        return false;
    }

    if (writer.writeFailed())
    {
        writer.discard();
        reason = fmt::format("Cannot write segment {} to {}", position + 1, slot.string());
        diagnostics_.error(reason);
        return false;
    }

    if (!transferred)
    {
        writer.discard();
        reason = fmt::format("Error downloading segment {}/{} ({}): {}", position + 1, total, request.url,
                             transport_.getLastError());
        diagnostics_.error(reason);
        return false;
    }

    if (!writer.finish())
    {
        writer.discard();
        reason = fmt::format("Cannot finish writing segment {} to {}", position + 1, slot.string());
        diagnostics_.error(reason);
        return false;
    }

    diagnostics_.debug("Stored segment {} ({} bytes)", position + 1, writer.received());
    return true;
}
