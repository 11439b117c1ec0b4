#pragma once

#include <dsexport/core/types.h>

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string_view>
#include <utility>

namespace dsexport::config {
class SessionConfig;
}

namespace dsexport::events {
class EventChannel;
}

namespace dsexport::exporter {

/**
 * Retry/backoff and pacing policy.
 */
struct RetryPolicy {
    int maxRetries{3};                            // retries after the first attempt
    std::chrono::milliseconds baseDelay{1000};    // delay before retry n = base * 2^(n-1)
    int requestsPerSecond{5};                     // dispatch ceiling shared by all callers

    static RetryPolicy fromConfig(const config::SessionConfig& cfg);
};

// Suspends the calling thread; injectable so tests can record backoff delays
using Sleeper = std::function<void(std::chrono::milliseconds)>;

Sleeper threadSleeper();

enum class FailureClass { AuthExpired, Retryable, Fatal };

// 401 -> AuthExpired; 429 and 5xx -> Retryable; anything else -> Fatal
FailureClass classifyFailure(const Error& error);

// base * 2^(attempt-1), saturating
std::chrono::milliseconds backoffDelay(std::chrono::milliseconds base, int attempt);

/**
 * Runs one logical request with pacing and bounded exponential-backoff retry.
 *
 * The request-producing function is invoked exactly once per attempt. Each logical call
 * either returns the value or throws exactly one terminal exception (AuthExpiredError,
 * ApiError, NetworkError or ExportException); intermediate attempts only surface as
 * `retrying` events.
 */
class RequestExecutor {
public:
    using Clock = std::chrono::steady_clock;

    RequestExecutor(RetryPolicy policy, events::EventChannel& events,
                    Sleeper sleeper = threadSleeper());

    RequestExecutor(const RequestExecutor&) = delete;
    RequestExecutor& operator=(const RequestExecutor&) = delete;

    template <typename T> T execute(std::string_view what, const std::function<Expected<T>()>& fn) {
        for (int attempt = 1;; ++attempt) {
            pace();
            auto result = fn();
            if (result.ok()) {
                return std::move(result).value();
            }
            // Throws when the failure is terminal, otherwise sleeps the backoff delay
            handleFailure(what, result.error(), attempt);
        }
    }

    // Minimum spacing between two dispatches
    [[nodiscard]] std::chrono::microseconds minInterval() const noexcept;

    [[nodiscard]] const RetryPolicy& policy() const noexcept { return policy_; }

private:
    void pace();
    void handleFailure(std::string_view what, const Error& error, int attempt);

    RetryPolicy policy_;
    events::EventChannel& events_;
    Sleeper sleeper_;

    std::mutex paceMutex_;
    std::optional<Clock::time_point> lastDispatch_;
};

} // namespace dsexport::exporter
