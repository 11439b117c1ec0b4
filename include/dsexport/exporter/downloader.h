#pragma once

#include <dsexport/exporter/discovery.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace dsexport::exporter {

// Terminal result of one resource download
struct DownloadOutcome {
    std::string id;
    bool success{false};
    std::uint64_t bytes{0};
    std::string error; // set when !success
};

// "{id}.pdf" for combined output, "{id}.zip" for individual (archive) output
std::string documentFileName(const std::string& id, config::OutputMode mode);

// "{accountUrl}/envelopes/{id}/documents/combined" (or ".../archive")
std::string documentUrl(const config::SessionConfig& config, const std::string& id);

/**
 * Chunked, bounded-parallel document downloader.
 *
 * The list is split into consecutive chunks of maxConcurrent entries. Chunks run strictly
 * one after another; every member of a chunk runs on its own task and the chunk is joined
 * before the next one starts. The cancellation flag is checked before each chunk.
 *
 * A failed resource yields a failed outcome and a download-failed event; it never stops its
 * chunk or later chunks. The exception is an expired token: the current chunk is allowed to
 * finish, no further chunk starts, batch-complete is published and AuthExpiredError is
 * rethrown to the caller.
 */
class ConcurrentDownloader {
public:
    ConcurrentDownloader(const config::SessionConfig& config,
                         const std::vector<http::Header>& headers, http::IHttpClient& http,
                         RequestExecutor& executor, events::EventChannel& events,
                         const CancellationFlag& cancel);

    // Outcomes in completion order, one per started resource
    std::vector<DownloadOutcome> run(const std::vector<Envelope>& list);

    // Outcomes of the most recent run, also after it threw
    [[nodiscard]] std::vector<DownloadOutcome> outcomes() const;

private:
    DownloadOutcome downloadOne(const Envelope& envelope, std::size_t total);
    std::uint64_t fetchDocument(const std::string& id);

    const config::SessionConfig& config_;
    const std::vector<http::Header>& headers_;
    http::IHttpClient& http_;
    RequestExecutor& executor_;
    events::EventChannel& events_;
    const CancellationFlag& cancel_;

    mutable std::mutex outcomesMutex_;
    std::vector<DownloadOutcome> outcomes_;
    std::atomic<std::size_t> completed_{0};
    std::atomic<bool> authExpired_{false};
};

} // namespace dsexport::exporter
