#include <dsexport/config/session_config.h>
#include <dsexport/core/errors.h>
#include <dsexport/events/event_channel.h>
#include <dsexport/exporter/cancellation.h>
#include <dsexport/exporter/discovery.h>
#include <dsexport/exporter/request_executor.h>
#include <dsexport/http/http_client.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace dsexport::exporter {

namespace {

constexpr const char* kFolderTypes = "normal,inbox,sentitems";

std::optional<std::string> optionalString(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string())
        return std::nullopt;
    return it->get<std::string>();
}

Error invalidDate(std::string_view input) {
    return Error{ErrorCode::InvalidArgument,
                 "Invalid date '" + std::string(input) +
                     "'. Expected YYYY-MM-DD or YYYY-MM-DDTHH:MM:SS[.fff][Z|+HH:MM]"};
}

} // namespace

const char* discoveryStateToString(DiscoveryState state) {
    switch (state) {
        case DiscoveryState::Idle: return "idle";
        case DiscoveryState::Searching: return "searching";
        case DiscoveryState::Complete: return "complete";
        case DiscoveryState::Cancelled: return "cancelled";
        case DiscoveryState::Failed: return "failed";
    }
    return "idle";
}

Expected<std::string> normalizeTimestamp(std::string_view input) {
    std::tm tm = {};
    std::istringstream ss{std::string(input)};

    ss >> std::get_time(&tm, "%Y-%m-%d");
    if (ss.fail())
        return invalidDate(input);

    int millis = 0;
    long offsetSeconds = 0;

    const int sep = ss.peek();
    if (sep == 'T' || sep == 't' || sep == ' ') {
        ss.get();
        ss >> std::get_time(&tm, "%H:%M:%S");
        if (ss.fail())
            return invalidDate(input);

        if (ss.peek() == '.') {
            ss.get();
            int digits = 0;
            while (std::isdigit(ss.peek())) {
                const int d = ss.get() - '0';
                if (digits < 3)
                    millis = millis * 10 + d;
                ++digits;
            }
            if (digits == 0)
                return invalidDate(input);
            for (; digits < 3; ++digits)
                millis *= 10;
        }

        const int tz = ss.peek();
        if (tz == 'Z' || tz == 'z') {
            ss.get();
        } else if (tz == '+' || tz == '-') {
            ss.get();
            std::string off;
            while (off.size() < 5 && (std::isdigit(ss.peek()) || ss.peek() == ':'))
                off.push_back(static_cast<char>(ss.get()));
            if (off.size() == 5 && off[2] == ':')
                off.erase(2, 1);
            if (off.size() != 4 || !std::all_of(off.begin(), off.end(), ::isdigit))
                return invalidDate(input);
            const int hours = std::stoi(off.substr(0, 2));
            const int minutes = std::stoi(off.substr(2, 2));
            if (hours > 23 || minutes > 59)
                return invalidDate(input);
            offsetSeconds = (hours * 3600L + minutes * 60L) * (tz == '+' ? 1 : -1);
        }
    }

    if (ss.peek() != std::char_traits<char>::eof())
        return invalidDate(input);

    // timegm reads the fields as UTC; reject dates it had to normalize (e.g. 2024-02-30)
    const int wantYear = tm.tm_year, wantMonth = tm.tm_mon, wantDay = tm.tm_mday;
    std::time_t t = timegm(&tm);
    if (t == static_cast<std::time_t>(-1) || tm.tm_year != wantYear || tm.tm_mon != wantMonth ||
        tm.tm_mday != wantDay)
        return invalidDate(input);

    t -= offsetSeconds;
    std::tm utc = {};
    gmtime_r(&t, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
        << millis << 'Z';
    return out.str();
}

Expected<std::vector<Envelope>> parseEnvelopePage(const std::string& body) {
    auto j = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (!j.is_object()) {
        return Error{ErrorCode::MalformedResponse, "Envelope listing is not a JSON object"};
    }

    std::vector<Envelope> page;
    auto it = j.find("envelopes");
    if (it == j.end() || it->is_null())
        return page;
    if (!it->is_array()) {
        return Error{ErrorCode::MalformedResponse, "'envelopes' is not an array"};
    }

    page.reserve(it->size());
    for (const auto& item : *it) {
        if (!item.is_object()) {
            return Error{ErrorCode::MalformedResponse, "Envelope entry is not an object"};
        }
        auto id = optionalString(item, "envelopeId");
        if (!id || id->empty()) {
            return Error{ErrorCode::MalformedResponse, "Envelope entry without envelopeId"};
        }
        Envelope env;
        env.id = std::move(*id);
        env.status = optionalString(item, "status").value_or("");
        env.subject = optionalString(item, "emailSubject");
        env.sentDateTime = optionalString(item, "sentDateTime");
        env.completedDateTime = optionalString(item, "completedDateTime");
        page.push_back(std::move(env));
    }
    return page;
}

EnvelopeDiscovery::EnvelopeDiscovery(const config::SessionConfig& config,
                                     const std::vector<http::Header>& headers,
                                     http::IHttpClient& http, RequestExecutor& executor,
                                     events::EventChannel& events, const CancellationFlag& cancel,
                                     std::vector<Envelope>& results)
    : config_(config), headers_(headers), http_(http), executor_(executor), events_(events),
      cancel_(cancel), results_(results) {}

std::size_t EnvelopeDiscovery::discover(std::string_view fromDate, std::string_view toDate) {
    auto from = normalizeTimestamp(fromDate);
    if (!from)
        throw ExportException(ExportError::InvalidArgument, from.error().message);
    auto to = normalizeTimestamp(toDate);
    if (!to)
        throw ExportException(ExportError::InvalidArgument, to.error().message);

    if (cancel_.isSet()) {
        state_ = DiscoveryState::Cancelled;
        return 0;
    }

    state_ = DiscoveryState::Searching;
    events_.publish(events::SearchStarted{from.value(), to.value()});
    spdlog::info("Searching envelopes from {} to {}", from.value(), to.value());

    const std::size_t before = results_.size();
    std::size_t offset = 0;
    try {
        for (;;) {
            if (cancel_.isSet()) {
                state_ = DiscoveryState::Cancelled;
                spdlog::info("Discovery cancelled after {} envelope(s)", results_.size() - before);
                return results_.size() - before;
            }

            auto page = fetchPage(from.value(), to.value(), offset);
            const std::size_t count = page.size();
            results_.insert(results_.end(), std::make_move_iterator(page.begin()),
                            std::make_move_iterator(page.end()));
            events_.publish(events::PageFound{count, results_.size()});
            spdlog::debug("Page at offset {}: {} envelope(s), {} total", offset, count,
                          results_.size());

            if (count != kPageSize)
                break;
            offset += count;
        }
    } catch (const std::exception& e) {
        state_ = DiscoveryState::Failed;
        spdlog::error("Discovery failed: {}", e.what());
        throw;
    }

    state_ = DiscoveryState::Complete;
    return results_.size() - before;
}

std::vector<Envelope> EnvelopeDiscovery::fetchPage(const std::string& from, const std::string& to,
                                                   std::size_t offset) {
    http::HttpRequest req;
    req.url = config_.accountUrl() + "/envelopes";
    req.headers = headers_;
    req.query = {
        {"from_date", from},
        {"to_date", to},
        {"user_id", config_.userId()},
        {"start_position", std::to_string(offset)},
        {"count", std::to_string(kPageSize)},
        {"order", "desc"},
        {"order_by", "last_modified"},
        {"folder_types", kFolderTypes},
    };

    return executor_.execute<std::vector<Envelope>>(
        "list envelopes", [&]() -> Expected<std::vector<Envelope>> {
            auto resp = http_.get(req);
            if (!resp)
                return resp.error();
            return parseEnvelopePage(resp.value().body);
        });
}

} // namespace dsexport::exporter
