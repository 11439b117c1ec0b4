#pragma once

#include <dsexport/config/session_config.h>
#include <dsexport/events/event_channel.h>
#include <dsexport/exporter/cancellation.h>
#include <dsexport/exporter/discovery.h>
#include <dsexport/exporter/downloader.h>
#include <dsexport/exporter/request_executor.h>
#include <dsexport/http/http_client.h>

#include <memory>
#include <string_view>
#include <vector>

namespace dsexport::exporter {

/**
 * One export run: discovery of envelopes in a date range, then download of every
 * discovered envelope's documents into the configured output directory.
 *
 * The session owns the result set, the shared executor (one pacing clock for discovery and
 * downloads), the cancellation flag and the event channel. Construction validates the
 * configuration and throws ConfigurationError before any request is made.
 */
class ExportSession {
public:
    explicit ExportSession(const config::ConfigOptions& options,
                           std::unique_ptr<http::IHttpClient> http = nullptr,
                           Sleeper sleeper = threadSleeper());

    explicit ExportSession(config::SessionConfig config,
                           std::unique_ptr<http::IHttpClient> http = nullptr,
                           Sleeper sleeper = threadSleeper());

    ~ExportSession();

    ExportSession(const ExportSession&) = delete;
    ExportSession& operator=(const ExportSession&) = delete;

    /**
     * Page through envelopes between the two dates (inclusive) and append them to the
     * session's result set. Repeated calls keep accumulating. Returns the whole result set.
     * A cancelled discovery returns what was gathered without throwing.
     */
    const std::vector<Envelope>& discover(std::string_view fromDate, std::string_view toDate);

    /**
     * Download every envelope currently in the result set. Per-resource failures are
     * recorded (see failures()) and never thrown; AuthExpiredError is.
     */
    void downloadAll();

    // Stop issuing new requests at the next checkpoint. Idempotent.
    void cancel();

    [[nodiscard]] bool cancelled() const noexcept { return cancel_.isSet(); }

    events::EventChannel::SubscriptionId subscribe(events::EventChannel::Subscriber subscriber);
    void unsubscribe(events::EventChannel::SubscriptionId id);
    events::EventChannel& events() noexcept { return events_; }

    [[nodiscard]] const config::SessionConfig& config() const noexcept { return config_; }
    [[nodiscard]] const std::vector<Envelope>& envelopes() const noexcept { return envelopes_; }
    [[nodiscard]] DiscoveryState discoveryState() const noexcept { return discovery_.state(); }
    [[nodiscard]] std::vector<DownloadOutcome> outcomes() const;
    [[nodiscard]] std::vector<DownloadOutcome> failures() const;

    // Accept, Authorization and Cookie headers sent with every request
    [[nodiscard]] const std::vector<http::Header>& defaultHeaders() const noexcept {
        return headers_;
    }

private:
    config::SessionConfig config_;
    std::vector<http::Header> headers_;
    std::unique_ptr<http::IHttpClient> http_;
    events::EventChannel events_;
    CancellationFlag cancel_;
    RequestExecutor executor_;
    std::vector<Envelope> envelopes_;
    EnvelopeDiscovery discovery_;
    ConcurrentDownloader downloader_;
};

} // namespace dsexport::exporter
