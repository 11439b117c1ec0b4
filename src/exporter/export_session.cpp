#include <dsexport/core/errors.h>
#include <dsexport/exporter/export_session.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <utility>

namespace dsexport::exporter {

namespace {

std::vector<http::Header> makeDefaultHeaders(const config::SessionConfig& cfg) {
    return {
        {"Accept", "application/json"},
        {"Authorization", "Bearer " + cfg.token()},
        {"Cookie", cfg.cookie()},
    };
}

} // namespace

ExportSession::ExportSession(const config::ConfigOptions& options,
                             std::unique_ptr<http::IHttpClient> http, Sleeper sleeper)
    : ExportSession(config::SessionConfig::fromOptions(options), std::move(http),
                    std::move(sleeper)) {}

ExportSession::ExportSession(config::SessionConfig config, std::unique_ptr<http::IHttpClient> http,
                             Sleeper sleeper)
    : config_(std::move(config)), headers_(makeDefaultHeaders(config_)),
      http_(http ? std::move(http) : http::makeCurlHttpClient()),
      executor_(RetryPolicy::fromConfig(config_), events_, std::move(sleeper)),
      discovery_(config_, headers_, *http_, executor_, events_, cancel_, envelopes_),
      downloader_(config_, headers_, *http_, executor_, events_, cancel_) {
    spdlog::debug("Export session: environment={} account={} output={} mode={} concurrency={}",
                  config::environmentToString(config_.environment()), config_.accountId(),
                  config_.outputDir().string(), config::outputModeToString(config_.outputMode()),
                  config_.maxConcurrent());
}

ExportSession::~ExportSession() = default;

const std::vector<Envelope>& ExportSession::discover(std::string_view fromDate,
                                                     std::string_view toDate) {
    discovery_.discover(fromDate, toDate);
    return envelopes_;
}

void ExportSession::downloadAll() {
    downloader_.run(envelopes_);
}

void ExportSession::cancel() {
    if (cancel_.set()) {
        spdlog::info("Cancellation requested");
        events_.publish(events::Cancelled{});
    }
}

events::EventChannel::SubscriptionId
ExportSession::subscribe(events::EventChannel::Subscriber subscriber) {
    return events_.subscribe(std::move(subscriber));
}

void ExportSession::unsubscribe(events::EventChannel::SubscriptionId id) {
    events_.unsubscribe(id);
}

std::vector<DownloadOutcome> ExportSession::outcomes() const {
    return downloader_.outcomes();
}

std::vector<DownloadOutcome> ExportSession::failures() const {
    auto all = downloader_.outcomes();
    std::vector<DownloadOutcome> failed;
    std::copy_if(all.begin(), all.end(), std::back_inserter(failed),
                 [](const DownloadOutcome& o) { return !o.success; });
    return failed;
}

} // namespace dsexport::exporter
