#include <dsexport/config/session_config.h>
#include <dsexport/core/errors.h>
#include <dsexport/events/event_channel.h>
#include <dsexport/exporter/request_executor.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <thread>

namespace dsexport::exporter {

RetryPolicy RetryPolicy::fromConfig(const config::SessionConfig& cfg) {
    RetryPolicy p;
    p.maxRetries = cfg.retryAttempts();
    p.baseDelay = cfg.retryDelay();
    p.requestsPerSecond = cfg.requestsPerSecond();
    return p;
}

Sleeper threadSleeper() {
    return [](std::chrono::milliseconds d) {
        if (d.count() > 0)
            std::this_thread::sleep_for(d);
    };
}

FailureClass classifyFailure(const Error& error) {
    if (!error.httpStatus)
        return FailureClass::Fatal;
    const int status = *error.httpStatus;
    if (status == 401)
        return FailureClass::AuthExpired;
    if (status == 429 || (status >= 500 && status <= 599))
        return FailureClass::Retryable;
    return FailureClass::Fatal;
}

std::chrono::milliseconds backoffDelay(std::chrono::milliseconds base, int attempt) {
    const int shift = std::clamp(attempt - 1, 0, 30);
    const auto factor = static_cast<std::int64_t>(1) << shift;
    const auto limit = std::numeric_limits<std::int64_t>::max() / factor;
    if (base.count() > limit)
        return std::chrono::milliseconds(std::numeric_limits<std::int64_t>::max());
    return std::chrono::milliseconds(base.count() * factor);
}

RequestExecutor::RequestExecutor(RetryPolicy policy, events::EventChannel& events,
                                 Sleeper sleeper)
    : policy_(policy), events_(events), sleeper_(std::move(sleeper)) {
    if (policy_.requestsPerSecond < 1)
        policy_.requestsPerSecond = 1;
    if (!sleeper_)
        sleeper_ = threadSleeper();
}

std::chrono::microseconds RequestExecutor::minInterval() const noexcept {
    return std::chrono::microseconds(1'000'000 / policy_.requestsPerSecond);
}

void RequestExecutor::pace() {
    // Reserve a dispatch slot under the lock, sleep outside it. Concurrent callers each get
    // a distinct slot at least one interval after the previous one.
    Clock::time_point slot;
    {
        std::lock_guard<std::mutex> lk(paceMutex_);
        const auto now = Clock::now();
        slot = now;
        if (lastDispatch_ && now - *lastDispatch_ < minInterval()) {
            slot = *lastDispatch_ + minInterval();
        }
        lastDispatch_ = slot;
    }
    if (slot > Clock::now()) {
        std::this_thread::sleep_until(slot);
    }
}

void RequestExecutor::handleFailure(std::string_view what, const Error& error, int attempt) {
    switch (classifyFailure(error)) {
        case FailureClass::AuthExpired:
            spdlog::error("{}: authentication rejected (401)", what);
            events_.publish(events::TokenExpired{});
            throw AuthExpiredError();

        case FailureClass::Retryable:
            if (attempt <= policy_.maxRetries) {
                const auto delay = backoffDelay(policy_.baseDelay, attempt);
                spdlog::warn("{}: {} (status {}); retry {}/{} in {} ms", what, error.message,
                             *error.httpStatus, attempt, policy_.maxRetries, delay.count());
                events_.publish(events::Retrying{attempt, delay.count(), error.message});
                sleeper_(delay);
                return;
            }
            throw ApiError(error.httpStatus, error.message);

        case FailureClass::Fatal:
            break;
    }

    if (error.httpStatus) {
        throw ApiError(error.httpStatus, error.message);
    }
    switch (error.code) {
        case ErrorCode::NetworkError:
        case ErrorCode::Timeout:
        case ErrorCode::Unknown:
            throw NetworkError(error.message);
        case ErrorCode::MalformedResponse:
        case ErrorCode::HttpStatus:
            throw ApiError(std::nullopt, error.message);
        case ErrorCode::IoError:
            throw ExportException(ExportError::Io, error.message);
        case ErrorCode::InvalidArgument:
            throw ExportException(ExportError::InvalidArgument, error.message);
        case ErrorCode::Cancelled:
        case ErrorCode::None:
            break;
    }
    throw ExportException(ExportError::Unknown, error.message);
}

} // namespace dsexport::exporter
