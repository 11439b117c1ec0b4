#include <dsexport/cli/console_presenter.h>

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <type_traits>
#include <variant>

namespace dsexport::cli {

namespace {

std::string progressBar(double fraction, int width) {
    fraction = std::clamp(fraction, 0.0, 1.0);
    const int filled = static_cast<int>(fraction * width + 0.5);
    std::string bar = "[";
    for (int i = 0; i < width; ++i)
        bar += i < filled ? "█" : "░";
    bar += "]";
    return bar;
}

} // namespace

constexpr int ProgressIndicator::SPINNER_COUNT;

ProgressIndicator::ProgressIndicator(std::ostream& out, bool interactive)
    : out_(out), interactive_(interactive) {}

ProgressIndicator::~ProgressIndicator() {
    if (active_) {
        stop();
    }
}

void ProgressIndicator::start(Style style, const std::string& message) {
    style_ = style;
    message_ = message;
    active_ = true;
    current_ = 0;
    total_ = 0;
    spinnerIndex_ = 0;
    lastUpdate_ = std::chrono::steady_clock::now();
    render();
}

void ProgressIndicator::update(std::size_t current, std::size_t total) {
    if (!active_)
        return;

    current_ = current;
    total_ = total;

    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - lastUpdate_).count();
    // Always draw the final state
    const bool finished = total_ > 0 && current_ >= total_;
    if (elapsed >= updateIntervalMs_ || finished) {
        spinnerIndex_ = (spinnerIndex_ + 1) % SPINNER_COUNT;
        lastUpdate_ = now;
        render();
    }
}

void ProgressIndicator::stop() {
    if (!active_)
        return;
    if (interactive_) {
        out_ << "\r\033[K" << std::flush;
    }
    active_ = false;
}

void ProgressIndicator::resume() {
    if (active_)
        return;
    active_ = true;
    render();
}

void ProgressIndicator::render() {
    if (!active_)
        return;

    std::ostringstream oss;
    if (interactive_)
        oss << "\r\033[K";

    if (style_ == Style::Bar && total_ > 0) {
        const double fraction = static_cast<double>(current_) / static_cast<double>(total_);
        if (interactive_) {
            oss << progressBar(fraction, 20) << " " << message_;
        } else {
            oss << "[" << std::setw(3) << static_cast<int>(fraction * 100) << "%] " << message_;
        }
        oss << " (" << current_ << "/" << total_ << ")";
    } else {
        if (interactive_) {
            oss << SPINNER_CHARS[spinnerIndex_] << " " << message_;
        } else {
            oss << message_ << "...";
        }
        if (current_ > 0) {
            oss << " (" << current_ << ")";
        }
    }

    if (!interactive_)
        oss << "\n";
    out_ << oss.str() << std::flush;
}

ConsolePresenter::ConsolePresenter(std::ostream& out, bool interactive)
    : out_(out), progress_(out, interactive) {}

void ConsolePresenter::line(const std::string& text) {
    const bool wasActive = progress_.isActive();
    progress_.stop();
    out_ << text << "\n" << std::flush;
    if (wasActive)
        progress_.resume();
}

void ConsolePresenter::beginDownloads(std::size_t total) {
    progress_.stop();
    total_ = total;
    completed_ = 0;
    failed_ = 0;
    out_ << fmt::format("Downloading {} document(s)", total) << "\n" << std::flush;
}

void ConsolePresenter::onEvent(const events::ExportEvent& event) {
    std::visit(
        [this](const auto& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, events::SearchStarted>) {
                out_ << fmt::format("Searching envelopes from {} to {}", e.fromDate, e.toDate)
                     << "\n";
                progress_.start(ProgressIndicator::Style::Spinner, "Searching");
            } else if constexpr (std::is_same_v<T, events::PageFound>) {
                progress_.setMessage(fmt::format("Found {} envelope(s)", e.total));
            } else if constexpr (std::is_same_v<T, events::DownloadStarted>) {
                if (!progress_.isActive())
                    progress_.start(ProgressIndicator::Style::Bar, "Downloading");
            } else if constexpr (std::is_same_v<T, events::DownloadProgress>) {
                ++completed_;
                progress_.update(completed_, total_);
            } else if constexpr (std::is_same_v<T, events::DownloadFailed>) {
                ++failed_;
                line(fmt::format("  failed {}: {}", e.id, e.error));
            } else if constexpr (std::is_same_v<T, events::Retrying>) {
                line(fmt::format("  retrying (attempt {}) in {} ms: {}", e.attempt, e.delayMs,
                                 e.cause));
            } else if constexpr (std::is_same_v<T, events::TokenExpired>) {
                tokenExpired_ = true;
                progress_.stop();
            } else if constexpr (std::is_same_v<T, events::BatchComplete>) {
                progress_.stop();
                out_ << fmt::format("Downloaded {} of {} document(s)", e.total, total_);
                if (failed_ > 0)
                    out_ << fmt::format(", {} failed", failed_);
                out_ << "\n";
            } else if constexpr (std::is_same_v<T, events::Cancelled>) {
                line("Cancelling; waiting for in-flight requests to finish");
            }
        },
        event);
    out_ << std::flush;
}

void ConsolePresenter::noDocuments() {
    progress_.stop();
    out_ << "No documents found\n" << std::flush;
}

void ConsolePresenter::printSummary(std::size_t discovered,
                                    const std::vector<exporter::DownloadOutcome>& failures) {
    progress_.stop();
    out_ << fmt::format("Envelopes found: {}", discovered) << "\n";
    if (failures.empty()) {
        out_ << "All downloads completed successfully\n" << std::flush;
        return;
    }
    out_ << fmt::format("Failed downloads ({}):", failures.size()) << "\n";
    for (const auto& f : failures) {
        out_ << fmt::format("  {}: {}", f.id, f.error) << "\n";
    }
    out_ << std::flush;
}

void JsonLinesPresenter::onEvent(const events::ExportEvent& event) {
    out_ << events::toJson(event).dump() << "\n" << std::flush;
}

std::string reauthenticationHelp() {
    return "Authentication token expired.\n"
           "  1. Sign in to DocuSign in your browser.\n"
           "  2. Copy a fresh Authorization token and session cookie from the browser's\n"
           "     developer tools (Network tab, any API request).\n"
           "  3. Update DSEXPORT_TOKEN and DSEXPORT_COOKIE (or your .env file) and run again.\n";
}

} // namespace dsexport::cli
