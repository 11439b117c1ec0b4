/*
 * export_command.cpp
 *
 * `dsexport` command: discover envelopes in a date range and download their documents.
 * - Options merge over environment (.env underneath the real environment) and config file
 * - SIGINT/SIGTERM request cooperative cancellation; in-flight downloads finish
 * - Human progress on stdout, or JSON lines with --json
 *
 * Exit codes: 0 on success (including partial download failures), 1 when the run halts on
 * configuration, authentication, API or network errors.
 */

#include <dsexport/cli/console_presenter.h>
#include <dsexport/cli/export_command.h>
#include <dsexport/config/config_helpers.h>
#include <dsexport/core/errors.h>
#include <dsexport/exporter/export_session.h>

#include <CLI/CLI.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iostream>
#include <memory>
#include <system_error>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

namespace dsexport::cli {

namespace {

std::atomic<bool> g_interrupted{false};

void installSignalHandlers() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = [](int) { g_interrupted = true; };
    sa.sa_flags = 0;
    if (sigaction(SIGINT, &sa, nullptr) == -1)
        spdlog::warn("Failed to install SIGINT handler");
    if (sigaction(SIGTERM, &sa, nullptr) == -1)
        spdlog::warn("Failed to install SIGTERM handler");
}

// Forwards a received signal to session.cancel() from a normal thread
class InterruptWatcher {
public:
    explicit InterruptWatcher(exporter::ExportSession& session)
        : thread_([this, &session]() {
              while (!done_) {
                  if (g_interrupted) {
                      session.cancel();
                      return;
                  }
                  std::this_thread::sleep_for(std::chrono::milliseconds(100));
              }
          }) {}

    ~InterruptWatcher() {
        done_ = true;
        if (thread_.joinable())
            thread_.join();
    }

    InterruptWatcher(const InterruptWatcher&) = delete;
    InterruptWatcher& operator=(const InterruptWatcher&) = delete;

private:
    std::atomic<bool> done_{false};
    std::thread thread_;
};

} // namespace

void configureLogging(const ExportCliOptions& opts) {
    // stdout carries progress or JSON lines; diagnostics go to stderr
    auto stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("dsexport", stderr_sink);
    spdlog::set_default_logger(logger);

    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet || opts.json) {
        spdlog::set_level(spdlog::level::warn);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

void registerExportOptions(CLI::App& app, ExportCliOptions& opts) {
    app.add_option("-f,--from", opts.from, "Start date, YYYY-MM-DD (default: 2024-01-01)")
        ->check(CLI::NonEmpty());
    app.add_option("-t,--to", opts.to, "End date, YYYY-MM-DD (default: today)");
    app.add_option("-o,--output", opts.output,
                   "Output directory (default: DSEXPORT_OUTPUT_DIR, config, ./docusign_downloads)");
    app.add_option("-c,--concurrent", opts.concurrent, "Concurrent downloads, 1-5 (default: 3)")
        ->check(CLI::Range(1, config::kMaxConcurrentCeiling));
    app.add_option("-r,--rate-limit", opts.rateLimit, "Requests per second (default: 5)")
        ->check(CLI::PositiveNumber);
    app.add_option("--retry-attempts", opts.retryAttempts, "Retries per request (default: 3)")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--retry-delay", opts.retryDelayMs,
                   "Base retry delay in ms, doubled per attempt (default: 1000)")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--environment", opts.environment, "API environment")
        ->check(CLI::IsMember({"production", "sandbox", "demo"}, CLI::ignore_case));
    app.add_option("--output-mode", opts.outputMode,
                   "combined: one PDF per envelope; individual: ZIP of the documents")
        ->check(CLI::IsMember({"combined", "individual"}, CLI::ignore_case));
    app.add_option("--config", opts.configFile, "Config file ([exporter] section)");
    app.add_option("--env-file", opts.envFile, "dotenv file with credentials (default: .env)");
    app.add_flag("--json", opts.json, "Emit events as JSON lines on stdout");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_flag("-q,--quiet", opts.quiet, "Warnings and errors only");
}

std::string todayUtc() {
    const std::time_t now = std::time(nullptr);
    std::tm tm = {};
    gmtime_r(&now, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return buf;
}

void validateDateRange(const std::string& from, const std::string& to) {
    auto f = exporter::normalizeTimestamp(from);
    if (!f)
        throw ExportException(ExportError::InvalidArgument, f.error().message);
    auto t = exporter::normalizeTimestamp(to);
    if (!t)
        throw ExportException(ExportError::InvalidArgument, t.error().message);
    // Normalized timestamps share one fixed-width UTC layout, so they order lexically
    if (f.value() > t.value()) {
        throw ExportException(ExportError::InvalidArgument,
                              "Start date " + from + " is after end date " + to);
    }
}

config::EnvLookup layeredEnvironment(std::map<std::string, std::string> dotenv) {
    return [dotenv = std::move(dotenv)](std::string_view name) -> std::optional<std::string> {
        const std::string key(name);
        if (const char* v = std::getenv(key.c_str()))
            return std::string(v);
        auto it = dotenv.find(key);
        if (it != dotenv.end())
            return it->second;
        return std::nullopt;
    };
}

config::ConfigOptions toConfigOptions(const ExportCliOptions& opts) {
    config::ConfigOptions out;
    out.environment = opts.environment;
    out.outputMode = opts.outputMode;
    out.outputDir = opts.output;
    out.maxConcurrent = opts.concurrent;
    out.retryAttempts = opts.retryAttempts;
    if (opts.retryDelayMs)
        out.retryDelay = std::chrono::milliseconds(*opts.retryDelayMs);
    out.requestsPerSecond = opts.rateLimit;
    out.configFile = opts.configFile;
    return out;
}

int runExport(const ExportCliOptions& opts) {
    configureLogging(opts);

    const std::string to = opts.to.value_or(todayUtc());
    try {
        validateDateRange(opts.from, to);

        auto env = layeredEnvironment(config::load_dotenv(opts.envFile));
        auto sessionConfig = config::SessionConfig::fromOptions(toConfigOptions(opts), env);

        std::error_code ec;
        fs::create_directories(sessionConfig.outputDir(), ec);
        if (ec) {
            spdlog::error("Cannot create output directory {}: {}",
                          sessionConfig.outputDir().string(), ec.message());
            return 1;
        }

        exporter::ExportSession session(std::move(sessionConfig));

        ConsolePresenter console(std::cout, isatty(STDOUT_FILENO) == 1);
        JsonLinesPresenter jsonLines(std::cout);
        if (opts.json) {
            session.subscribe([&jsonLines](const events::ExportEvent& e) { jsonLines.onEvent(e); });
        } else {
            session.subscribe([&console](const events::ExportEvent& e) { console.onEvent(e); });
        }

        installSignalHandlers();
        InterruptWatcher watcher(session);

        try {
            const auto& envelopes = session.discover(opts.from, to);
            if (envelopes.empty()) {
                if (!opts.json)
                    console.noDocuments();
                return 0;
            }
            if (!opts.json)
                console.beginDownloads(envelopes.size());

            session.downloadAll();

            if (!opts.json)
                console.printSummary(envelopes.size(), session.failures());
            return 0;
        } catch (const AuthExpiredError&) {
            std::cerr << reauthenticationHelp();
            return 1;
        }
    } catch (const ConfigurationError& e) {
        spdlog::error("Configuration error ({}): {}", e.field(), e.what());
        return 1;
    } catch (const ExportException& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
}

} // namespace dsexport::cli
