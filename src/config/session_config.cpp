#include <dsexport/config/config_helpers.h>
#include <dsexport/config/session_config.h>
#include <dsexport/core/errors.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <initializer_list>
#include <limits>
#include <utility>

namespace dsexport::config {

namespace {

constexpr const char* kSection = "exporter";

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Resolution chain for one field: explicit option, environment, config file.
class FieldResolver {
public:
    FieldResolver(const EnvLookup& env, std::filesystem::path configFile)
        : env_(env), configFile_(std::move(configFile)) {}

    std::optional<std::string> lookup(const std::optional<std::string>& option,
                                      std::initializer_list<const char*> envNames,
                                      const char* fileKey) const {
        if (option && !option->empty())
            return option;
        if (env_) {
            for (const char* name : envNames) {
                auto v = env_(name);
                if (v && !v->empty())
                    return v;
            }
        }
        if (!configFile_.empty()) {
            auto v = parse_config_value(configFile_, kSection, fileKey);
            if (!v.empty())
                return v;
        }
        return std::nullopt;
    }

    std::optional<std::string> lookupFile(const char* fileKey) const {
        if (configFile_.empty())
            return std::nullopt;
        auto v = parse_config_value(configFile_, kSection, fileKey);
        if (v.empty())
            return std::nullopt;
        return v;
    }

private:
    const EnvLookup& env_;
    std::filesystem::path configFile_;
};

int parseIntField(const std::string& raw, const char* field) {
    int value = 0;
    const char* first = raw.data();
    const char* last = raw.data() + raw.size();
    auto res = std::from_chars(first, last, value);
    if (res.ec != std::errc() || res.ptr != last) {
        throw ConfigurationError(field, std::string(field) + " must be an integer (got '" + raw +
                                            "')");
    }
    return value;
}

int resolveInt(const std::optional<int>& option, const FieldResolver& resolver,
               const char* fileKey, const char* field, int fallback) {
    if (option)
        return *option;
    if (auto raw = resolver.lookupFile(fileKey))
        return parseIntField(*raw, field);
    return fallback;
}

std::string stripBearer(std::string token) {
    constexpr std::string_view kPrefix = "Bearer ";
    if (token.rfind(kPrefix, 0) == 0) {
        token.erase(0, kPrefix.size());
    }
    return token;
}

} // namespace

const char* environmentToString(Environment env) {
    switch (env) {
        case Environment::Production: return "production";
        case Environment::Sandbox: return "sandbox";
    }
    return "production";
}

const char* outputModeToString(OutputMode mode) {
    switch (mode) {
        case OutputMode::Combined: return "combined";
        case OutputMode::Individual: return "individual";
    }
    return "combined";
}

std::optional<Environment> parseEnvironment(std::string_view s) {
    auto v = to_lower(s);
    if (v == "production")
        return Environment::Production;
    if (v == "sandbox" || v == "demo")
        return Environment::Sandbox;
    return std::nullopt;
}

std::optional<OutputMode> parseOutputMode(std::string_view s) {
    auto v = to_lower(s);
    if (v == "combined")
        return OutputMode::Combined;
    if (v == "individual")
        return OutputMode::Individual;
    return std::nullopt;
}

EnvLookup processEnvironment() {
    return [](std::string_view name) -> std::optional<std::string> {
        const char* v = std::getenv(std::string(name).c_str());
        if (!v)
            return std::nullopt;
        return std::string(v);
    };
}

SessionConfig SessionConfig::fromOptions(const ConfigOptions& options, const EnvLookup& env) {
    std::filesystem::path configFile;
    if (options.configFile) {
        configFile = *options.configFile;
    } else {
        auto candidate = get_config_path();
        std::error_code ec;
        if (std::filesystem::exists(candidate, ec))
            configFile = candidate;
    }
    if (!configFile.empty()) {
        spdlog::debug("Reading [{}] settings from {}", kSection, configFile.string());
    }

    FieldResolver resolver(env, configFile);
    SessionConfig cfg;

    auto token = resolver.lookup(options.token, {"DSEXPORT_TOKEN", "DOCUSIGN_TOKEN"}, "token");
    if (!token || stripBearer(*token).empty()) {
        throw ConfigurationError("token", "Access token is required");
    }
    cfg.token_ = stripBearer(*token);

    auto accountId =
        resolver.lookup(options.accountId, {"DSEXPORT_ACCOUNT_ID", "DOCUSIGN_ACCOUNT_ID"},
                        "account_id");
    if (!accountId) {
        throw ConfigurationError("accountId", "Account ID is required");
    }
    cfg.accountId_ = *accountId;

    cfg.userId_ =
        resolver.lookup(options.userId, {"DSEXPORT_USER_ID", "DOCUSIGN_USER_ID"}, "user_id")
            .value_or("");

    auto cookie = resolver.lookup(options.cookie, {"DSEXPORT_COOKIE", "DOCUSIGN_COOKIE"}, "cookie");
    if (!cookie) {
        throw ConfigurationError("cookie", "Session cookie is required");
    }
    cfg.cookie_ = *cookie;

    auto envName = resolver.lookup(options.environment,
                                   {"DSEXPORT_ENVIRONMENT", "DOCUSIGN_ENVIRONMENT"}, "environment");
    if (envName) {
        auto parsed = parseEnvironment(*envName);
        if (!parsed) {
            throw ConfigurationError("environment",
                                     "Environment must be either \"production\" or \"sandbox\"");
        }
        cfg.environment_ = *parsed;
    }

    const int maxConcurrent =
        resolveInt(options.maxConcurrent, resolver, "max_concurrent", "maxConcurrent", 3);
    if (maxConcurrent < 1) {
        throw ConfigurationError("maxConcurrent", "maxConcurrent must be at least 1");
    }
    if (maxConcurrent > kMaxConcurrentCeiling) {
        spdlog::debug("maxConcurrent {} capped at {}", maxConcurrent, kMaxConcurrentCeiling);
    }
    cfg.maxConcurrent_ = std::min(maxConcurrent, kMaxConcurrentCeiling);

    cfg.retryAttempts_ =
        resolveInt(options.retryAttempts, resolver, "retry_attempts", "retryAttempts", 3);
    if (cfg.retryAttempts_ < 0) {
        throw ConfigurationError("retryAttempts", "retryAttempts must be non-negative");
    }

    std::optional<int> delayOption;
    if (options.retryDelay) {
        const auto ms = options.retryDelay->count();
        if (ms < 0) {
            throw ConfigurationError("retryDelay", "retryDelay must be non-negative");
        }
        if (ms > std::numeric_limits<int>::max()) {
            throw ConfigurationError("retryDelay", "retryDelay is out of range");
        }
        delayOption = static_cast<int>(ms);
    }
    const int retryDelayMs = resolveInt(delayOption, resolver, "retry_delay_ms", "retryDelay", 1000);
    if (retryDelayMs < 0) {
        throw ConfigurationError("retryDelay", "retryDelay must be non-negative");
    }
    cfg.retryDelay_ = std::chrono::milliseconds(retryDelayMs);

    cfg.requestsPerSecond_ =
        resolveInt(options.requestsPerSecond, resolver, "rate_limit", "rateLimit", 5);
    if (cfg.requestsPerSecond_ < 1) {
        throw ConfigurationError("rateLimit", "rateLimit must be at least 1");
    }

    auto mode = resolver.lookup(options.outputMode, {"DSEXPORT_OUTPUT_MODE"}, "output_mode");
    if (mode) {
        auto parsed = parseOutputMode(*mode);
        if (!parsed) {
            throw ConfigurationError("outputMode",
                                     "Output mode must be either \"combined\" or \"individual\"");
        }
        cfg.outputMode_ = *parsed;
    }

    if (options.outputDir && !options.outputDir->empty()) {
        cfg.outputDir_ = *options.outputDir;
    } else if (auto dir = resolver.lookup(std::nullopt, {"DSEXPORT_OUTPUT_DIR"}, "output_dir")) {
        cfg.outputDir_ = expand_tilde(*dir);
    }

    return cfg;
}

std::string SessionConfig::baseUrl() const {
    return environment_ == Environment::Production ? kProductionBaseUrl : kSandboxBaseUrl;
}

std::string SessionConfig::accountUrl() const {
    return baseUrl() + "/accounts/" + accountId_;
}

} // namespace dsexport::config
