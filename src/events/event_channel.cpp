#include <dsexport/events/event_channel.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

namespace dsexport::events {

namespace {

template <class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

const char* eventName(const ExportEvent& event) {
    return std::visit(overloaded{
                          [](const SearchStarted&) { return "search-started"; },
                          [](const PageFound&) { return "page-found"; },
                          [](const DownloadStarted&) { return "download-started"; },
                          [](const DownloadProgress&) { return "download-progress"; },
                          [](const DownloadFailed&) { return "download-failed"; },
                          [](const Retrying&) { return "retrying"; },
                          [](const TokenExpired&) { return "token-expired"; },
                          [](const BatchComplete&) { return "batch-complete"; },
                          [](const Cancelled&) { return "cancelled"; },
                      },
                      event);
}

nlohmann::json toJson(const ExportEvent& event) {
    nlohmann::json j = nlohmann::json::object();
    j["event"] = eventName(event);
    std::visit(overloaded{
                   [&](const SearchStarted& e) {
                       j["fromDate"] = e.fromDate;
                       j["toDate"] = e.toDate;
                   },
                   [&](const PageFound& e) {
                       j["count"] = e.count;
                       j["total"] = e.total;
                   },
                   [&](const DownloadStarted& e) { j["id"] = e.id; },
                   [&](const DownloadProgress& e) {
                       j["id"] = e.id;
                       j["percent"] = e.percent;
                   },
                   [&](const DownloadFailed& e) {
                       j["id"] = e.id;
                       j["error"] = e.error;
                   },
                   [&](const Retrying& e) {
                       j["attempt"] = e.attempt;
                       j["delayMs"] = e.delayMs;
                       j["cause"] = e.cause;
                   },
                   [](const TokenExpired&) {},
                   [&](const BatchComplete& e) { j["total"] = e.total; },
                   [](const Cancelled&) {},
               },
               event);
    return j;
}

EventChannel::SubscriptionId EventChannel::subscribe(Subscriber subscriber) {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    const auto id = nextId_++;
    subscribers_.emplace_back(id, std::move(subscriber));
    return id;
}

void EventChannel::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    subscribers_.erase(std::remove_if(subscribers_.begin(), subscribers_.end(),
                                      [id](const auto& entry) { return entry.first == id; }),
                       subscribers_.end());
}

void EventChannel::publish(const ExportEvent& event) {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    // Snapshot so callbacks may (un)subscribe without invalidating the iteration
    const auto snapshot = subscribers_;
    for (const auto& [id, subscriber] : snapshot) {
        if (!subscriber)
            continue;
        try {
            subscriber(event);
        } catch (const std::exception& ex) {
            spdlog::warn("Event subscriber {} failed on '{}': {}", id, eventName(event), ex.what());
        }
    }
}

std::size_t EventChannel::subscriberCount() const {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    return subscribers_.size();
}

} // namespace dsexport::events
