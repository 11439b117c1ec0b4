#include <catch2/catch_test_macros.hpp>

#include <dsexport/core/errors.h>
#include <dsexport/events/event_channel.h>
#include <dsexport/exporter/request_executor.h>

#include "../../common/fake_http_client.h"

#include <algorithm>
#include <chrono>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

using namespace dsexport;
using namespace dsexport::exporter;
using namespace std::chrono_literals;
using dsexport::test::EventLog;
using dsexport::test::RecordingSleeper;

namespace {

RetryPolicy fastPolicy(int maxRetries = 3) {
    RetryPolicy p;
    p.maxRetries = maxRetries;
    p.baseDelay = 1000ms;
    p.requestsPerSecond = 1000;
    return p;
}

// Replays the given results in order, one per attempt
class Script {
public:
    explicit Script(std::vector<Expected<int>> results) : results_(results.begin(), results.end()) {}

    std::function<Expected<int>()> fn() {
        return [this]() -> Expected<int> {
            ++calls;
            auto r = results_.front();
            if (results_.size() > 1)
                results_.pop_front();
            return r;
        };
    }

    int calls{0};

private:
    std::deque<Expected<int>> results_;
};

Error httpError(int status, std::string message = "Service Unavailable") {
    return Error{ErrorCode::HttpStatus, std::move(message), status};
}

} // namespace

TEST_CASE("RequestExecutor returns the first successful result", "[executor]") {
    events::EventChannel channel;
    EventLog log(channel);
    RecordingSleeper sleeper;
    RequestExecutor executor(fastPolicy(), channel, sleeper.fn());

    Script script({Expected<int>(42)});
    CHECK(executor.execute<int>("ok", script.fn()) == 42);
    CHECK(script.calls == 1);
    CHECK(sleeper.delays().empty());
    CHECK(log.names().empty());
}

TEST_CASE("RequestExecutor backs off exponentially on retryable status", "[executor]") {
    events::EventChannel channel;
    EventLog log(channel);
    RecordingSleeper sleeper;
    RequestExecutor executor(fastPolicy(3), channel, sleeper.fn());

    SECTION("ceiling+1 failures propagate ApiError after 1000/2000/4000 ms") {
        Script script({Expected<int>(httpError(503))});
        try {
            (void)executor.execute<int>("listing", script.fn());
            FAIL("expected ApiError");
        } catch (const ApiError& e) {
            CHECK(e.status() == 503);
            CHECK(e.apiMessage() == "Service Unavailable");
        }
        CHECK(script.calls == 4);
        CHECK(sleeper.delays() == std::vector<std::chrono::milliseconds>{1000ms, 2000ms, 4000ms});

        auto retries = log.of<events::Retrying>();
        REQUIRE(retries.size() == 3);
        for (int i = 0; i < 3; ++i) {
            CHECK(retries[i].attempt == i + 1);
            CHECK(retries[i].delayMs == 1000 * (1 << i));
            CHECK(retries[i].cause == "Service Unavailable");
        }
    }

    SECTION("429 then success recovers without surfacing the failures") {
        Script script({Expected<int>(httpError(429, "Too Many Requests")),
                       Expected<int>(httpError(502)), Expected<int>(7)});
        CHECK(executor.execute<int>("listing", script.fn()) == 7);
        CHECK(script.calls == 3);
        CHECK(sleeper.delays() == std::vector<std::chrono::milliseconds>{1000ms, 2000ms});
        CHECK(log.count("retrying") == 2);
    }

    SECTION("a zero retry ceiling fails on the first retryable status") {
        RequestExecutor noRetry(fastPolicy(0), channel, sleeper.fn());
        Script script({Expected<int>(httpError(500))});
        CHECK_THROWS_AS(noRetry.execute<int>("listing", script.fn()), ApiError);
        CHECK(script.calls == 1);
        CHECK(sleeper.delays().empty());
    }
}

TEST_CASE("RequestExecutor treats 401 as fatal", "[executor]") {
    events::EventChannel channel;
    EventLog log(channel);
    RecordingSleeper sleeper;
    RequestExecutor executor(fastPolicy(), channel, sleeper.fn());

    Script script({Expected<int>(httpError(401, "Unauthorized")), Expected<int>(1)});
    CHECK_THROWS_AS(executor.execute<int>("listing", script.fn()), AuthExpiredError);
    CHECK(script.calls == 1);
    CHECK(sleeper.delays().empty());
    CHECK(log.names() == std::vector<std::string>{"token-expired"});
}

TEST_CASE("RequestExecutor does not retry other failures", "[executor]") {
    events::EventChannel channel;
    EventLog log(channel);
    RecordingSleeper sleeper;
    RequestExecutor executor(fastPolicy(), channel, sleeper.fn());

    SECTION("4xx other than 401/429") {
        Script script({Expected<int>(httpError(404, "ENVELOPE_DOES_NOT_EXIST"))});
        try {
            (void)executor.execute<int>("doc", script.fn());
            FAIL("expected ApiError");
        } catch (const ApiError& e) {
            CHECK(e.status() == 404);
        }
        CHECK(script.calls == 1);
    }

    SECTION("transport failure") {
        Script script({Expected<int>(Error{ErrorCode::NetworkError, "connection reset"})});
        CHECK_THROWS_AS(executor.execute<int>("doc", script.fn()), NetworkError);
        CHECK(script.calls == 1);
    }

    SECTION("timeout") {
        Script script({Expected<int>(Error{ErrorCode::Timeout, "timed out"})});
        CHECK_THROWS_AS(executor.execute<int>("doc", script.fn()), NetworkError);
    }

    SECTION("malformed response") {
        Script script({Expected<int>(Error{ErrorCode::MalformedResponse, "not JSON"})});
        try {
            (void)executor.execute<int>("doc", script.fn());
            FAIL("expected ApiError");
        } catch (const ApiError& e) {
            CHECK_FALSE(e.status().has_value());
        }
    }

    SECTION("local write failure") {
        Script script({Expected<int>(Error{ErrorCode::IoError, "disk full"})});
        try {
            (void)executor.execute<int>("doc", script.fn());
            FAIL("expected ExportException");
        } catch (const ExportException& e) {
            CHECK(e.getError() == ExportError::Io);
        }
    }

    CHECK(sleeper.delays().empty());
    CHECK(log.names().empty());
}

TEST_CASE("RequestExecutor paces dispatches", "[executor]") {
    events::EventChannel channel;
    RecordingSleeper sleeper;

    SECTION("two requests per second keeps consecutive dispatches 500 ms apart") {
        RetryPolicy p = fastPolicy();
        p.requestsPerSecond = 2;
        RequestExecutor executor(p, channel, sleeper.fn());
        CHECK(executor.minInterval() == 500000us);

        std::vector<std::chrono::steady_clock::time_point> stamps;
        auto fn = [&]() -> Expected<int> {
            stamps.push_back(std::chrono::steady_clock::now());
            return 1;
        };
        for (int i = 0; i < 3; ++i)
            (void)executor.execute<int>("paced", fn);

        REQUIRE(stamps.size() == 3);
        for (std::size_t i = 1; i < stamps.size(); ++i) {
            CHECK(stamps[i] - stamps[i - 1] >= 495ms);
        }
    }

    SECTION("concurrent callers get distinct slots") {
        RetryPolicy p = fastPolicy();
        p.requestsPerSecond = 10;
        RequestExecutor executor(p, channel, sleeper.fn());

        std::mutex m;
        std::vector<std::chrono::steady_clock::time_point> stamps;
        auto fn = [&]() -> Expected<int> {
            std::lock_guard<std::mutex> lk(m);
            stamps.push_back(std::chrono::steady_clock::now());
            return 1;
        };

        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t)
            threads.emplace_back([&]() { (void)executor.execute<int>("paced", fn); });
        for (auto& th : threads)
            th.join();

        REQUIRE(stamps.size() == 4);
        std::sort(stamps.begin(), stamps.end());
        for (std::size_t i = 1; i < stamps.size(); ++i) {
            CHECK(stamps[i] - stamps[i - 1] >= 95ms);
        }
    }
}

TEST_CASE("backoffDelay doubles per attempt", "[executor]") {
    CHECK(backoffDelay(1000ms, 1) == 1000ms);
    CHECK(backoffDelay(1000ms, 2) == 2000ms);
    CHECK(backoffDelay(1000ms, 3) == 4000ms);
    CHECK(backoffDelay(0ms, 5) == 0ms);
    CHECK(backoffDelay(1000ms, 200) > backoffDelay(1000ms, 20));
}

TEST_CASE("classifyFailure", "[executor]") {
    CHECK(classifyFailure(httpError(401)) == FailureClass::AuthExpired);
    CHECK(classifyFailure(httpError(429)) == FailureClass::Retryable);
    CHECK(classifyFailure(httpError(500)) == FailureClass::Retryable);
    CHECK(classifyFailure(httpError(599)) == FailureClass::Retryable);
    CHECK(classifyFailure(httpError(400)) == FailureClass::Fatal);
    CHECK(classifyFailure(httpError(403)) == FailureClass::Fatal);
    CHECK(classifyFailure(Error{ErrorCode::NetworkError, "reset"}) == FailureClass::Fatal);
}
