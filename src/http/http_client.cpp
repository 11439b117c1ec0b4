#include <dsexport/http/http_client.h>

#include <nlohmann/json.hpp>

#include <cctype>

namespace dsexport::http {

namespace {

std::string percentEncode(std::string_view in) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(in.size());
    for (unsigned char c : in) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

} // namespace

std::string buildUrl(const HttpRequest& request) {
    if (request.query.empty())
        return request.url;

    std::string url = request.url;
    url.push_back(request.url.find('?') == std::string::npos ? '?' : '&');
    bool first = true;
    for (const auto& [key, value] : request.query) {
        if (!first)
            url.push_back('&');
        first = false;
        url.append(percentEncode(key));
        url.push_back('=');
        url.append(percentEncode(value));
    }
    return url;
}

std::string errorMessageFromBody(long status, const std::string& body) {
    if (!body.empty()) {
        auto j = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
        if (j.is_object()) {
            if (j.contains("message") && j["message"].is_string())
                return j["message"].get<std::string>();
            if (j.contains("errorCode") && j["errorCode"].is_string())
                return j["errorCode"].get<std::string>();
        }
    }
    return "Request failed with status code " + std::to_string(status);
}

} // namespace dsexport::http
