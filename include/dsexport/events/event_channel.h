#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace dsexport::events {

// ---------------------------------
// Lifecycle notifications (one struct per wire event)
// ---------------------------------

struct SearchStarted {
    std::string fromDate;
    std::string toDate;
};

struct PageFound {
    std::size_t count{0}; // records in this page
    std::size_t total{0}; // records accumulated so far
};

struct DownloadStarted {
    std::string id;
};

struct DownloadProgress {
    std::string id;
    double percent{0.0};
};

struct DownloadFailed {
    std::string id;
    std::string error;
};

struct Retrying {
    int attempt{0};
    std::int64_t delayMs{0};
    std::string cause;
};

struct TokenExpired {};

struct BatchComplete {
    std::size_t total{0}; // successful downloads
};

struct Cancelled {};

using ExportEvent = std::variant<SearchStarted, PageFound, DownloadStarted, DownloadProgress,
                                 DownloadFailed, Retrying, TokenExpired, BatchComplete, Cancelled>;

// Wire name, e.g. "page-found"
const char* eventName(const ExportEvent& event);

// {"event": <name>, ...fields}
nlohmann::json toJson(const ExportEvent& event);

/**
 * Single observable channel for pipeline notifications.
 *
 * publish() delivers synchronously to every subscriber while holding the delivery lock,
 * so all subscribers see one global order equal to the publish order, even when several
 * download tasks publish concurrently. A subscriber may publish or (un)subscribe from
 * inside its callback on the same thread.
 */
class EventChannel {
public:
    using Subscriber = std::function<void(const ExportEvent&)>;
    using SubscriptionId = std::uint64_t;

    EventChannel() = default;
    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    SubscriptionId subscribe(Subscriber subscriber);
    void unsubscribe(SubscriptionId id);

    void publish(const ExportEvent& event);

    [[nodiscard]] std::size_t subscriberCount() const;

private:
    mutable std::recursive_mutex mutex_;
    std::vector<std::pair<SubscriptionId, Subscriber>> subscribers_;
    SubscriptionId nextId_{1};
};

} // namespace dsexport::events
