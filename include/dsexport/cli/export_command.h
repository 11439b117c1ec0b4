#pragma once

#include <dsexport/config/session_config.h>

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace CLI {
class App;
}

namespace dsexport::cli {

// Command-line surface of `dsexport`
struct ExportCliOptions {
    std::string from{"2024-01-01"};
    std::optional<std::string> to; // default: today (UTC)
    std::optional<std::filesystem::path> output;
    std::optional<int> concurrent;
    std::optional<int> rateLimit;
    std::optional<int> retryAttempts;
    std::optional<int> retryDelayMs;
    std::optional<std::string> environment;
    std::optional<std::string> outputMode;
    std::optional<std::filesystem::path> configFile;
    std::filesystem::path envFile{".env"};
    bool json{false};
    bool verbose{false};
    bool quiet{false};
};

void registerExportOptions(CLI::App& app, ExportCliOptions& opts);

// Default logger on stderr, level from --verbose/--quiet/--json
void configureLogging(const ExportCliOptions& opts);

// YYYY-MM-DD for the current UTC day
std::string todayUtc();

// Both dates must parse and from must not be later than to; throws ExportException otherwise
void validateDateRange(const std::string& from, const std::string& to);

// Process environment first, dotenv values underneath
config::EnvLookup layeredEnvironment(std::map<std::string, std::string> dotenv);

config::ConfigOptions toConfigOptions(const ExportCliOptions& opts);

// Runs discovery and download; returns the process exit code
int runExport(const ExportCliOptions& opts);

} // namespace dsexport::cli
