#pragma once

#include <dsexport/config/session_config.h>
#include <dsexport/core/types.h>
#include <dsexport/http/http_client.h>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dsexport::events {
class EventChannel;
}

namespace dsexport::exporter {

class CancellationFlag;
class RequestExecutor;

// One discoverable document-bearing record
struct Envelope {
    std::string id;
    std::string status;
    std::optional<std::string> subject;
    std::optional<std::string> sentDateTime;
    std::optional<std::string> completedDateTime;
};

enum class DiscoveryState { Idle, Searching, Complete, Cancelled, Failed };

const char* discoveryStateToString(DiscoveryState state);

/**
 * Normalize a caller-supplied date to the listing API's timestamp form
 * (YYYY-MM-DDTHH:MM:SS.mmmZ).
 *
 * Accepts YYYY-MM-DD and YYYY-MM-DDTHH:MM:SS[.fff][Z|+HH:MM|-HH:MM]. Values without an
 * offset are taken as UTC.
 */
Expected<std::string> normalizeTimestamp(std::string_view input);

/**
 * Parse one listing page. A missing "envelopes" member is an empty page; a body that is not
 * a JSON object, or a record without "envelopeId", is MalformedResponse.
 */
Expected<std::vector<Envelope>> parseEnvelopePage(const std::string& body);

/**
 * Paginated listing of envelopes in a date range.
 *
 * Pages are requested one at a time through the shared executor and appended, in request
 * order, to the caller-owned result set. Paging stops on a short page or when the
 * cancellation flag is observed at the top of the loop.
 */
class EnvelopeDiscovery {
public:
    static constexpr std::size_t kPageSize = 100;

    EnvelopeDiscovery(const config::SessionConfig& config, const std::vector<http::Header>& headers,
                      http::IHttpClient& http, RequestExecutor& executor,
                      events::EventChannel& events, const CancellationFlag& cancel,
                      std::vector<Envelope>& results);

    // Returns the number of records appended by this call. Throws on executor failure.
    std::size_t discover(std::string_view fromDate, std::string_view toDate);

    [[nodiscard]] DiscoveryState state() const noexcept { return state_; }

private:
    std::vector<Envelope> fetchPage(const std::string& from, const std::string& to,
                                    std::size_t offset);

    const config::SessionConfig& config_;
    const std::vector<http::Header>& headers_;
    http::IHttpClient& http_;
    RequestExecutor& executor_;
    events::EventChannel& events_;
    const CancellationFlag& cancel_;
    std::vector<Envelope>& results_;
    DiscoveryState state_{DiscoveryState::Idle};
};

} // namespace dsexport::exporter
