#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <dsexport/core/errors.h>
#include <dsexport/events/event_channel.h>
#include <dsexport/exporter/cancellation.h>
#include <dsexport/exporter/discovery.h>
#include <dsexport/exporter/request_executor.h>

#include "../../common/fake_http_client.h"
#include "../../common/test_helpers_catch2.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

using namespace dsexport;
using namespace dsexport::exporter;
using dsexport::test::EventLog;
using dsexport::test::FakeHttpClient;
using dsexport::test::RecordingSleeper;
using dsexport::test::ScriptedResponse;
using json = nlohmann::json;

namespace {

std::string page(const std::string& prefix, std::size_t n) {
    json envelopes = json::array();
    for (std::size_t i = 0; i < n; ++i) {
        envelopes.push_back({{"envelopeId", prefix + std::to_string(i)},
                             {"status", "completed"},
                             {"emailSubject", "Subject " + std::to_string(i)}});
    }
    return json{{"resultSetSize", n}, {"envelopes", envelopes}}.dump();
}

struct DiscoveryFixture {
    DiscoveryFixture() : config(makeConfig()), executor(policy(), channel, sleeper.fn()), log(channel) {}

    static config::SessionConfig makeConfig() {
        auto o = dsexport::test::valid_options();
        o.userId = "user-9";
        o.requestsPerSecond = 1000;
        return dsexport::test::make_config(o);
    }

    static RetryPolicy policy() {
        RetryPolicy p;
        p.maxRetries = 3;
        p.requestsPerSecond = 1000;
        return p;
    }

    EnvelopeDiscovery discovery() {
        return EnvelopeDiscovery(config, headers, http, executor, channel, cancel, results);
    }

    config::SessionConfig config;
    std::vector<http::Header> headers{{"Accept", "application/json"}};
    FakeHttpClient http;
    events::EventChannel channel;
    RecordingSleeper sleeper;
    RequestExecutor executor;
    CancellationFlag cancel;
    std::vector<Envelope> results;
    EventLog log;
};

} // namespace

TEST_CASE("normalizeTimestamp", "[discovery]") {
    SECTION("date only is midnight UTC") {
        auto r = normalizeTimestamp("2024-01-01");
        REQUIRE(r.ok());
        CHECK(r.value() == "2024-01-01T00:00:00.000Z");
    }
    SECTION("full timestamp keeps milliseconds") {
        CHECK(normalizeTimestamp("2024-03-05T10:20:30.5Z").value() == "2024-03-05T10:20:30.500Z");
        CHECK(normalizeTimestamp("2024-03-05T10:20:30").value() == "2024-03-05T10:20:30.000Z");
    }
    SECTION("offsets are converted to UTC") {
        CHECK(normalizeTimestamp("2024-03-05T01:00:00+02:00").value() ==
              "2024-03-04T23:00:00.000Z");
        CHECK(normalizeTimestamp("2024-12-31T23:30:00-0100").value() ==
              "2025-01-01T00:30:00.000Z");
    }
    SECTION("invalid input") {
        CHECK_FALSE(normalizeTimestamp("").ok());
        CHECK_FALSE(normalizeTimestamp("yesterday").ok());
        CHECK_FALSE(normalizeTimestamp("2024-02-30").ok());
        CHECK_FALSE(normalizeTimestamp("2024-01-01junk").ok());
        CHECK(normalizeTimestamp("2024-13-01").error().code == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("parseEnvelopePage", "[discovery]") {
    SECTION("maps fields") {
        auto r = parseEnvelopePage(
            R"({"envelopes":[{"envelopeId":"e1","status":"sent","emailSubject":"Hi",)"
            R"("sentDateTime":"2024-01-02T00:00:00Z"},{"envelopeId":"e2","status":"completed",)"
            R"("completedDateTime":"2024-01-03T00:00:00Z"}]})");
        REQUIRE(r.ok());
        REQUIRE(r.value().size() == 2);
        const auto& e1 = r.value()[0];
        CHECK(e1.id == "e1");
        CHECK(e1.status == "sent");
        CHECK(e1.subject == std::optional<std::string>("Hi"));
        CHECK(e1.sentDateTime.has_value());
        CHECK_FALSE(e1.completedDateTime.has_value());
        CHECK(r.value()[1].completedDateTime.has_value());
    }
    SECTION("missing envelopes member is an empty page") {
        auto r = parseEnvelopePage(R"({"resultSetSize":"0"})");
        REQUIRE(r.ok());
        CHECK(r.value().empty());
    }
    SECTION("malformed bodies") {
        CHECK(parseEnvelopePage("<html>").error().code == ErrorCode::MalformedResponse);
        CHECK(parseEnvelopePage(R"({"envelopes":{}})").error().code ==
              ErrorCode::MalformedResponse);
        CHECK(parseEnvelopePage(R"({"envelopes":[{"status":"sent"}]})").error().code ==
              ErrorCode::MalformedResponse);
    }
}

TEST_CASE_METHOD(DiscoveryFixture, "Discovery stops after a short page", "[discovery]") {
    http.on("/envelopes", {ScriptedResponse::ok(page("a", 100)), ScriptedResponse::ok(page("b", 100)),
                           ScriptedResponse::ok(page("c", 7)), ScriptedResponse::ok(page("d", 100))});

    auto d = discovery();
    CHECK(d.state() == DiscoveryState::Idle);
    CHECK(d.discover("2024-01-01", "2024-06-30") == 207);
    CHECK(d.state() == DiscoveryState::Complete);

    auto reqs = http.requests();
    REQUIRE(reqs.size() == 3);

    SECTION("result set is the concatenation of pages in order") {
        REQUIRE(results.size() == 207);
        CHECK(results[0].id == "a0");
        CHECK(results[99].id == "a99");
        CHECK(results[100].id == "b0");
        CHECK(results[200].id == "c0");
        CHECK(results[206].id == "c6");
    }

    SECTION("offsets advance by the records received") {
        CHECK_THAT(reqs[0].url, Catch::Matchers::ContainsSubstring("start_position=0&"));
        CHECK_THAT(reqs[1].url, Catch::Matchers::ContainsSubstring("start_position=100&"));
        CHECK_THAT(reqs[2].url, Catch::Matchers::ContainsSubstring("start_position=200&"));
    }

    SECTION("listing parameters") {
        const auto& url = reqs[0].url;
        CHECK_THAT(url, Catch::Matchers::StartsWith(config.accountUrl() + "/envelopes?"));
        CHECK_THAT(url, Catch::Matchers::ContainsSubstring("from_date=2024-01-01T00%3A00%3A00.000Z"));
        CHECK_THAT(url, Catch::Matchers::ContainsSubstring("to_date=2024-06-30T00%3A00%3A00.000Z"));
        CHECK_THAT(url, Catch::Matchers::ContainsSubstring("user_id=user-9"));
        CHECK_THAT(url, Catch::Matchers::ContainsSubstring("count=100"));
        CHECK_THAT(url, Catch::Matchers::ContainsSubstring("order=desc"));
        CHECK_THAT(url, Catch::Matchers::ContainsSubstring("order_by=last_modified"));
        CHECK_THAT(url, Catch::Matchers::ContainsSubstring("folder_types=normal%2Cinbox%2Csentitems"));
        REQUIRE(reqs[0].request.headers.size() == 1);
        CHECK(reqs[0].request.headers[0].name == "Accept");
    }

    SECTION("events") {
        CHECK(log.names() == std::vector<std::string>{"search-started", "page-found", "page-found",
                                                      "page-found"});
        auto started = log.of<events::SearchStarted>();
        REQUIRE(started.size() == 1);
        CHECK(started[0].fromDate == "2024-01-01T00:00:00.000Z");
        auto pages = log.of<events::PageFound>();
        CHECK(pages[0].count == 100);
        CHECK(pages[0].total == 100);
        CHECK(pages[2].count == 7);
        CHECK(pages[2].total == 207);
    }
}

TEST_CASE_METHOD(DiscoveryFixture, "Discovery of an empty range", "[discovery]") {
    http.on("/envelopes", {ScriptedResponse::ok(R"({"resultSetSize":"0"})")});
    auto d = discovery();
    CHECK(d.discover("2024-01-01", "2024-01-02") == 0);
    CHECK(results.empty());
    CHECK(http.requests().size() == 1);
    CHECK(d.state() == DiscoveryState::Complete);
}

TEST_CASE_METHOD(DiscoveryFixture, "Repeated discovery accumulates", "[discovery]") {
    http.on("/envelopes", {ScriptedResponse::ok(page("a", 3)), ScriptedResponse::ok(page("b", 2))});
    auto d = discovery();
    d.discover("2024-01-01", "2024-01-31");
    d.discover("2024-02-01", "2024-02-28");
    REQUIRE(results.size() == 5);
    CHECK(results[3].id == "b0");
    auto pages = log.of<events::PageFound>();
    REQUIRE(pages.size() == 2);
    CHECK(pages[1].total == 5);
    // Each call pages from its own start
    CHECK_THAT(http.requests()[1].url, Catch::Matchers::ContainsSubstring("start_position=0&"));
}

TEST_CASE_METHOD(DiscoveryFixture, "Discovery observes cancellation", "[discovery]") {
    SECTION("cancel mid-loop returns the partial result without error") {
        http.on("/envelopes", {ScriptedResponse::ok(page("a", 100)), ScriptedResponse::ok(page("b", 100)),
                               ScriptedResponse::ok(page("c", 100))});
        channel.subscribe([this](const events::ExportEvent& e) {
            if (auto* p = std::get_if<events::PageFound>(&e); p && p->total == 200)
                cancel.set();
        });
        auto d = discovery();
        CHECK_NOTHROW(d.discover("2024-01-01", "2024-12-31"));
        CHECK(results.size() == 200);
        CHECK(http.requests().size() == 2);
        CHECK(d.state() == DiscoveryState::Cancelled);
    }

    SECTION("cancel before start issues no request") {
        http.on("/envelopes", {ScriptedResponse::ok(page("a", 5))});
        cancel.set();
        auto d = discovery();
        CHECK(d.discover("2024-01-01", "2024-12-31") == 0);
        CHECK(http.requests().empty());
        CHECK(log.names().empty());
        CHECK(d.state() == DiscoveryState::Cancelled);
    }
}

TEST_CASE_METHOD(DiscoveryFixture, "Discovery failure keeps accumulated records", "[discovery]") {
    http.on("/envelopes", {ScriptedResponse::ok(page("a", 100)),
                           ScriptedResponse::status_code(400, R"({"message":"Invalid date range"})")});
    auto d = discovery();
    try {
        d.discover("2024-01-01", "2024-12-31");
        FAIL("expected ApiError");
    } catch (const ApiError& e) {
        CHECK(e.status() == 400);
        CHECK(e.apiMessage() == "Invalid date range");
    }
    CHECK(results.size() == 100);
    CHECK(d.state() == DiscoveryState::Failed);

    SECTION("invalid dates fail before any request") {
        auto d2 = discovery();
        try {
            d2.discover("not-a-date", "2024-12-31");
            FAIL("expected ExportException");
        } catch (const ExportException& e) {
            CHECK(e.getError() == ExportError::InvalidArgument);
        }
        CHECK(http.requests().size() == 2);
    }
}

TEST_CASE_METHOD(DiscoveryFixture, "Discovery retries a throttled page", "[discovery]") {
    http.on("/envelopes", {ScriptedResponse::status_code(429, R"({"message":"Too many"})"),
                           ScriptedResponse::ok(page("a", 4))});
    auto d = discovery();
    CHECK(d.discover("2024-01-01", "2024-12-31") == 4);
    CHECK(http.requests().size() == 2);
    CHECK(sleeper.delays() == std::vector<std::chrono::milliseconds>{std::chrono::milliseconds(1000)});
    CHECK(log.names() == std::vector<std::string>{"search-started", "retrying", "page-found"});
}
