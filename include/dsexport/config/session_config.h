#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace dsexport::config {

enum class Environment { Production, Sandbox };

enum class OutputMode { Combined, Individual };

inline constexpr int kMaxConcurrentCeiling = 5;

inline constexpr const char* kProductionBaseUrl =
    "https://apps.docusign.com/api/esign/na3/restapi/v2.1";
inline constexpr const char* kSandboxBaseUrl = "https://demo.docusign.net/restapi/v2.1";

const char* environmentToString(Environment env);
const char* outputModeToString(OutputMode mode);
std::optional<Environment> parseEnvironment(std::string_view s);
std::optional<OutputMode> parseOutputMode(std::string_view s);

/**
 * Caller-supplied session parameters. Unset fields fall back to the environment,
 * then to the [exporter] section of the config file, then to built-in defaults.
 */
struct ConfigOptions {
    std::optional<std::string> token;
    std::optional<std::string> accountId;
    std::optional<std::string> userId;
    std::optional<std::string> cookie;
    std::optional<std::string> environment;
    std::optional<std::string> outputMode;
    std::optional<std::filesystem::path> outputDir;
    std::optional<int> maxConcurrent;
    std::optional<int> retryAttempts;
    std::optional<std::chrono::milliseconds> retryDelay;
    std::optional<int> requestsPerSecond;

    // Config file to consult; nullopt = default location, empty path = none
    std::optional<std::filesystem::path> configFile;
};

// Returns the value of an environment variable, or nullopt when unset
using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

EnvLookup processEnvironment();

/**
 * Validated, immutable session parameters.
 *
 * Construction checks token, account id, cookie, environment and then the numeric
 * bounds, in that order, and throws ConfigurationError for the first failure.
 */
class SessionConfig {
public:
    static SessionConfig fromOptions(const ConfigOptions& options,
                                     const EnvLookup& env = processEnvironment());

    [[nodiscard]] const std::string& token() const noexcept { return token_; }
    [[nodiscard]] const std::string& accountId() const noexcept { return accountId_; }
    [[nodiscard]] const std::string& userId() const noexcept { return userId_; }
    [[nodiscard]] const std::string& cookie() const noexcept { return cookie_; }
    [[nodiscard]] Environment environment() const noexcept { return environment_; }
    [[nodiscard]] OutputMode outputMode() const noexcept { return outputMode_; }
    [[nodiscard]] const std::filesystem::path& outputDir() const noexcept { return outputDir_; }
    [[nodiscard]] int maxConcurrent() const noexcept { return maxConcurrent_; }
    [[nodiscard]] int retryAttempts() const noexcept { return retryAttempts_; }
    [[nodiscard]] std::chrono::milliseconds retryDelay() const noexcept { return retryDelay_; }
    [[nodiscard]] int requestsPerSecond() const noexcept { return requestsPerSecond_; }

    // API base endpoint for the configured environment
    [[nodiscard]] std::string baseUrl() const;
    // baseUrl() + "/accounts/{accountId}"
    [[nodiscard]] std::string accountUrl() const;

private:
    SessionConfig() = default;

    std::string token_;
    std::string accountId_;
    std::string userId_;
    std::string cookie_;
    Environment environment_{Environment::Production};
    OutputMode outputMode_{OutputMode::Combined};
    std::filesystem::path outputDir_{"./docusign_downloads"};
    int maxConcurrent_{3};
    int retryAttempts_{3};
    std::chrono::milliseconds retryDelay_{1000};
    int requestsPerSecond_{5};
};

} // namespace dsexport::config
