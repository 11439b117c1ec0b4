#include <dsexport/config/session_config.h>
#include <dsexport/core/errors.h>
#include <dsexport/events/event_channel.h>
#include <dsexport/exporter/cancellation.h>
#include <dsexport/exporter/downloader.h>
#include <dsexport/exporter/part_file.h>
#include <dsexport/exporter/request_executor.h>
#include <dsexport/http/http_client.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>

namespace dsexport::exporter {

namespace {

constexpr std::chrono::minutes kDocumentTimeout{10};

bool isSafeFileStem(const std::string& id) {
    if (id.empty() || id == "." || id == "..")
        return false;
    return id.find_first_of("/\\") == std::string::npos;
}

} // namespace

std::string documentFileName(const std::string& id, config::OutputMode mode) {
    return id + (mode == config::OutputMode::Individual ? ".zip" : ".pdf");
}

std::string documentUrl(const config::SessionConfig& config, const std::string& id) {
    const char* kind = config.outputMode() == config::OutputMode::Individual ? "archive" : "combined";
    return config.accountUrl() + "/envelopes/" + id + "/documents/" + kind;
}

ConcurrentDownloader::ConcurrentDownloader(const config::SessionConfig& config,
                                           const std::vector<http::Header>& headers,
                                           http::IHttpClient& http, RequestExecutor& executor,
                                           events::EventChannel& events,
                                           const CancellationFlag& cancel)
    : config_(config), headers_(headers), http_(http), executor_(executor), events_(events),
      cancel_(cancel) {}

std::vector<DownloadOutcome> ConcurrentDownloader::run(const std::vector<Envelope>& list) {
    {
        std::lock_guard<std::mutex> lk(outcomesMutex_);
        outcomes_.clear();
    }
    completed_ = 0;
    authExpired_ = false;

    const std::size_t total = list.size();
    const std::size_t chunkSize =
        static_cast<std::size_t>(std::max(1, std::min(config_.maxConcurrent(),
                                                      config::kMaxConcurrentCeiling)));

    spdlog::info("Downloading {} document(s), {} at a time", total, chunkSize);

    for (std::size_t start = 0; start < total; start += chunkSize) {
        if (cancel_.isSet()) {
            spdlog::info("Download cancelled; {} document(s) not started", total - start);
            break;
        }
        if (authExpired_) {
            spdlog::error("Authentication expired; {} document(s) not started", total - start);
            break;
        }

        const std::size_t end = std::min(start + chunkSize, total);
        spdlog::debug("Chunk [{}, {}) of {}", start, end, total);

        std::vector<std::future<DownloadOutcome>> tasks;
        tasks.reserve(end - start);
        for (std::size_t i = start; i < end; ++i) {
            const Envelope& env = list[i];
            tasks.push_back(std::async(std::launch::async,
                                       [this, &env, total]() { return downloadOne(env, total); }));
        }
        for (auto& task : tasks) {
            task.get();
        }
    }

    const std::size_t succeeded = completed_.load();
    events_.publish(events::BatchComplete{succeeded});
    spdlog::info("Batch complete: {}/{} document(s) downloaded", succeeded, total);

    if (authExpired_) {
        throw AuthExpiredError();
    }

    std::lock_guard<std::mutex> lk(outcomesMutex_);
    return outcomes_;
}

std::vector<DownloadOutcome> ConcurrentDownloader::outcomes() const {
    std::lock_guard<std::mutex> lk(outcomesMutex_);
    return outcomes_;
}

DownloadOutcome ConcurrentDownloader::downloadOne(const Envelope& envelope, std::size_t total) {
    DownloadOutcome outcome;
    outcome.id = envelope.id;
    events_.publish(events::DownloadStarted{envelope.id});

    try {
        outcome.bytes = fetchDocument(envelope.id);
        outcome.success = true;
    } catch (const AuthExpiredError& e) {
        authExpired_ = true;
        outcome.error = e.what();
    } catch (const std::exception& e) {
        outcome.error = e.what();
    }

    if (outcome.success) {
        const std::size_t done = ++completed_;
        const double percent =
            total == 0 ? 100.0 : static_cast<double>(done) * 100.0 / static_cast<double>(total);
        events_.publish(events::DownloadProgress{envelope.id, percent});
    } else {
        spdlog::warn("Failed to download {}: {}", envelope.id, outcome.error);
        events_.publish(events::DownloadFailed{envelope.id, outcome.error});
    }

    std::lock_guard<std::mutex> lk(outcomesMutex_);
    outcomes_.push_back(outcome);
    return outcome;
}

std::uint64_t ConcurrentDownloader::fetchDocument(const std::string& id) {
    if (!isSafeFileStem(id)) {
        throw ExportException(ExportError::InvalidArgument,
                              "Envelope id is not usable as a file name: '" + id + "'");
    }

    http::HttpRequest req;
    req.url = documentUrl(config_, id);
    req.headers = headers_;
    req.timeout = kDocumentTimeout;

    PartFile file(config_.outputDir() / documentFileName(id, config_.outputMode()));

    executor_.execute<http::HttpResponse>(
        "download " + id, [&]() -> Expected<http::HttpResponse> {
            if (auto opened = file.open(); !opened)
                return opened.error();
            auto resp = http_.get(req, [&file](ByteSpan bytes) { return file.write(bytes); });
            if (!resp)
                file.discard();
            return resp;
        });

    const auto bytes = file.bytesWritten();
    if (auto committed = file.commit(); !committed) {
        throw ExportException(ExportError::Io, committed.error().message);
    }
    return bytes;
}

} // namespace dsexport::exporter
