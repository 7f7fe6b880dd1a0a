#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "config.hpp"
#include "diagnostics.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "workspace.hpp"

/**
 * What happened to each position of a segment batch.
 */
struct AcquisitionReport
{
    std::size_t attempted = 0;
    std::vector<std::size_t> stored;  // Indices with a slot file
    std::vector<std::size_t> skipped; // Indices left as gaps
    std::vector<Failure> skipReasons; // SegmentSkipped, parallel to skipped
};

/**
 * Downloads segments one by one into numbered slot files of a fresh
 * WorkingArea. A failing segment is logged and left out; the batch
 * itself only fails when there is nothing to do or nowhere to put it.
 */
class SegmentAcquirer
{
public:
    SegmentAcquirer(HttpTransport &transport, Diagnostics &diagnostics, const DownloadLimits &limits)
        : transport_(transport), diagnostics_(diagnostics), limits_(limits)
    {
    }

    /**
     * Origin used for "/"-rooted segment paths. Without it the origin of
     * the base URL is used.
     */
    void setOriginOverride(std::optional<std::string> origin) { originOverride_ = std::move(origin); }

    /**
     * Fetch every segment into a new working area.
     *
     * @param segments References in playback order
     * @param baseUrl Directory URL relative references are joined to
     * @param headers Request headers; empty means the default set
     * @return Working area (possibly with gaps), or nullptr with
     *         NoSegments / AcquisitionSetupFailed in getLastError()
     */
    std::unique_ptr<WorkingArea> acquire(const std::vector<std::string> &segments,
                                         const std::string &baseUrl,
                                         const HeaderMap &headers);

    /**
     * Absolute URL for one segment reference.
     */
    std::string segmentUrl(const std::string &segment, const std::string &baseUrl) const;

    const AcquisitionReport &getReport() const { return report_; }
    const Failure &getLastError() const { return lastError_; }

private:
    /**
     * Download one segment into its slot.
     * @param reason Set when the segment is skipped
     * @return true if the slot file was written completely
     */
    bool fetchSegment(const HttpRequest &request, const std::filesystem::path &slot, std::size_t position,
                      std::size_t total, std::string &reason);

    HttpTransport &transport_;
    Diagnostics &diagnostics_;
    DownloadLimits limits_;
    std::optional<std::string> originOverride_;
    AcquisitionReport report_;
    Failure lastError_;
};
