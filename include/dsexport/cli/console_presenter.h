#pragma once

#include <dsexport/events/event_channel.h>
#include <dsexport/exporter/downloader.h>

#include <chrono>
#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace dsexport::cli {

/**
 * @brief Single-line progress display for the export run
 *
 * Spinner while the total is unknown (discovery), percentage bar once it is. On a
 * non-terminal stream it degrades to plain "[ 40%]" style updates.
 */
class ProgressIndicator {
public:
    enum class Style {
        Spinner, // ⠋⠙⠹⠸⠼⠴⠦⠧⠇⠏
        Bar      // [████████░░░░░░░░]
    };

    ProgressIndicator(std::ostream& out, bool interactive);
    ~ProgressIndicator();

    ProgressIndicator(const ProgressIndicator&) = delete;
    ProgressIndicator& operator=(const ProgressIndicator&) = delete;

    void start(Style style, const std::string& message);

    /**
     * @brief Update progress
     * @param current Current progress value
     * @param total Total expected value (0 for indeterminate)
     */
    void update(std::size_t current, std::size_t total = 0);

    // Clear the line
    void stop();

    // Redraw after stop(), keeping style, message and counts
    void resume();

    bool isActive() const { return active_; }

    void setMessage(const std::string& message) {
        message_ = message;
        render();
    }

private:
    void render();

    std::ostream& out_;
    bool interactive_;
    Style style_{Style::Spinner};
    std::string message_;
    bool active_{false};
    std::size_t current_{0};
    std::size_t total_{0};
    int spinnerIndex_{0};
    int updateIntervalMs_{100};
    std::chrono::steady_clock::time_point lastUpdate_;

    static constexpr const char* SPINNER_CHARS[] = {"⠋", "⠙", "⠹", "⠸", "⠼",
                                                    "⠴", "⠦", "⠧", "⠇", "⠏"};
    static constexpr int SPINNER_COUNT = 10;
};

/**
 * Human-readable rendering of pipeline events.
 *
 * Called from whichever thread published the event; the event channel serializes calls.
 */
class ConsolePresenter {
public:
    ConsolePresenter(std::ostream& out, bool interactive);

    void onEvent(const events::ExportEvent& event);

    // Number of documents about to be downloaded; sizes the progress bar
    void beginDownloads(std::size_t total);

    // Discovery came back empty; clears the search spinner first
    void noDocuments();

    // Final report; lists each failed resource
    void printSummary(std::size_t discovered, const std::vector<exporter::DownloadOutcome>& failures);

    [[nodiscard]] bool tokenExpired() const noexcept { return tokenExpired_; }

private:
    void line(const std::string& text);

    std::ostream& out_;
    ProgressIndicator progress_;
    std::size_t total_{0};
    std::size_t completed_{0};
    std::size_t failed_{0};
    bool tokenExpired_{false};
};

// One JSON object per line: {"event": "...", ...}
class JsonLinesPresenter {
public:
    explicit JsonLinesPresenter(std::ostream& out) : out_(out) {}

    void onEvent(const events::ExportEvent& event);

private:
    std::ostream& out_;
};

// Instructions printed when the session token was rejected
std::string reauthenticationHelp();

} // namespace dsexport::cli
