#include <catch2/catch_test_macros.hpp>

#include <dsexport/events/event_channel.h>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace dsexport::events;

TEST_CASE("EventChannel delivers in publish order", "[events]") {
    EventChannel channel;
    std::vector<std::string> a;
    std::vector<std::string> b;
    channel.subscribe([&](const ExportEvent& e) { a.emplace_back(eventName(e)); });
    channel.subscribe([&](const ExportEvent& e) { b.emplace_back(eventName(e)); });

    channel.publish(SearchStarted{"2024-01-01T00:00:00.000Z", "2024-02-01T00:00:00.000Z"});
    channel.publish(PageFound{100, 100});
    channel.publish(PageFound{3, 103});
    channel.publish(BatchComplete{0});

    const std::vector<std::string> expected{"search-started", "page-found", "page-found",
                                            "batch-complete"};
    CHECK(a == expected);
    CHECK(b == expected);
}

TEST_CASE("EventChannel subscription management", "[events]") {
    EventChannel channel;
    int calls = 0;
    auto id = channel.subscribe([&](const ExportEvent&) { ++calls; });
    CHECK(channel.subscriberCount() == 1);

    channel.publish(Cancelled{});
    channel.unsubscribe(id);
    channel.publish(Cancelled{});
    CHECK(calls == 1);
    CHECK(channel.subscriberCount() == 0);

    SECTION("unsubscribing an unknown id is a no-op") {
        channel.unsubscribe(9999);
        CHECK(channel.subscriberCount() == 0);
    }
}

TEST_CASE("EventChannel allows re-entrant publish from a subscriber", "[events]") {
    EventChannel channel;
    std::vector<std::string> seen;
    channel.subscribe([&](const ExportEvent& e) {
        seen.emplace_back(eventName(e));
        if (std::holds_alternative<TokenExpired>(e))
            channel.publish(Cancelled{});
    });

    channel.publish(TokenExpired{});
    CHECK(seen == std::vector<std::string>{"token-expired", "cancelled"});
}

TEST_CASE("EventChannel keeps delivering after a throwing subscriber", "[events]") {
    EventChannel channel;
    int delivered = 0;
    channel.subscribe([](const ExportEvent&) { throw std::runtime_error("presenter failed"); });
    channel.subscribe([&](const ExportEvent&) { ++delivered; });

    CHECK_NOTHROW(channel.publish(DownloadStarted{"e1"}));
    CHECK(delivered == 1);
}

TEST_CASE("EventChannel serializes concurrent publishers", "[events]") {
    EventChannel channel;
    int inside = 0;
    int maxInside = 0;
    int total = 0;
    channel.subscribe([&](const ExportEvent&) {
        ++inside;
        maxInside = std::max(maxInside, inside);
        ++total;
        --inside;
    });

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&channel, t]() {
            for (int i = 0; i < 250; ++i)
                channel.publish(DownloadProgress{"e" + std::to_string(t), 0.0});
        });
    }
    for (auto& th : threads)
        th.join();

    CHECK(total == 1000);
    CHECK(maxInside == 1);
}

TEST_CASE("toJson renders wire names and fields", "[events]") {
    auto j = toJson(Retrying{2, 2000, "Service Unavailable"});
    CHECK(j["event"] == "retrying");
    CHECK(j["attempt"] == 2);
    CHECK(j["delayMs"] == 2000);
    CHECK(j["cause"] == "Service Unavailable");

    auto p = toJson(DownloadProgress{"abc", 40.0});
    CHECK(p["event"] == "download-progress");
    CHECK(p["id"] == "abc");
    CHECK(p["percent"].get<double>() == 40.0);

    auto f = toJson(DownloadFailed{"abc", "boom"});
    CHECK(f["error"] == "boom");

    auto t = toJson(TokenExpired{});
    CHECK(t.size() == 1);
    CHECK(t["event"] == "token-expired");

    CHECK(toJson(BatchComplete{7})["total"] == 7);
    CHECK(toJson(PageFound{5, 105})["count"] == 5);
    CHECK(toJson(SearchStarted{"a", "b"})["toDate"] == "b");
    CHECK(std::string(eventName(DownloadStarted{"x"})) == "download-started");
    CHECK(std::string(eventName(Cancelled{})) == "cancelled");
}
