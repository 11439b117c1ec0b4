/*
 * http_client_curl.cpp
 *
 * Notes
 * - IHttpClient on top of the libcurl easy API; one easy handle per call so concurrent
 *   downloads share no transfer state.
 * - Honors timeout and headers, follows redirects, verifies TLS.
 * - 2xx bodies stream to the caller's sink; error bodies are buffered for the message.
 *
 * Build
 * - Linked via CURL::libcurl. Depends on spdlog for logging.
 */

#include <dsexport/http/http_client.h>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace dsexport::http {

namespace {

std::once_flag curlInitFlag;

struct CurlEasyDeleter {
    void operator()(CURL* curl) const noexcept { curl_easy_cleanup(curl); }
};
struct CurlSlistDeleter {
    void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};

using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlSlistPtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;

// Map CURLcode to Error
Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
            err.code = ErrorCode::NetworkError;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

// Transfer state shared with the write callback
struct WriteContext {
    CURL* curl{nullptr};
    const BodySink* sink{nullptr};
    std::string buffer;
    std::uint64_t received{0};
    std::optional<bool> streaming; // decided on the first body chunk
    std::optional<Error> sinkError;
};

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;
    auto* ctx = static_cast<WriteContext*>(userdata);
    if (total == 0)
        return 0;

    if (!ctx->streaming) {
        long status = 0;
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);
        ctx->streaming = (ctx->sink != nullptr && *ctx->sink && status < 400);
    }

    ctx->received += static_cast<std::uint64_t>(total);
    if (!*ctx->streaming) {
        ctx->buffer.append(ptr, total);
        return total;
    }

    ByteSpan bytes{reinterpret_cast<const std::byte*>(ptr), total};
    auto r = (*ctx->sink)(bytes);
    if (!r.ok()) {
        ctx->sinkError = r.error();
        return 0; // signal error to curl => CURLE_WRITE_ERROR
    }
    return total;
}

CurlSlistPtr build_header_list(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        curl_slist* next = curl_slist_append(list, line.c_str());
        if (!next)
            break;
        list = next;
    }
    return CurlSlistPtr(list);
}

void configure_common(CURL* curl, std::chrono::milliseconds timeout) {
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(std::min<long long>(timeout.count(), 30000)));

    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    // Worker threads must not receive SIGALRM from the resolver
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "dsexport/1.0");
}

class CurlHttpClient final : public IHttpClient {
public:
    CurlHttpClient() {
        std::call_once(curlInitFlag, []() { curl_global_init(CURL_GLOBAL_ALL); });
    }
    ~CurlHttpClient() override = default;

    Expected<HttpResponse> get(const HttpRequest& request, const BodySink& sink) override {
        CurlEasyPtr curl(curl_easy_init());
        if (!curl) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }

        const std::string url = buildUrl(request);
        auto headers = build_header_list(request.headers);

        WriteContext wctx;
        wctx.curl = curl.get();
        wctx.sink = &sink;

        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &wctx);
        configure_common(curl.get(), request.timeout);

        spdlog::debug("GET {}", request.url);
        CURLcode rc = curl_easy_perform(curl.get());

        long status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);

        if (wctx.sinkError) {
            return *wctx.sinkError;
        }
        if (rc != CURLE_OK) {
            auto err = makeCurlError(rc, "GET");
            // A transfer that broke after the server answered with an error status
            if (status >= 400)
                err.httpStatus = static_cast<int>(status);
            return err;
        }
        if (status >= 400) {
            return Error{ErrorCode::HttpStatus, errorMessageFromBody(status, wctx.buffer),
                         static_cast<int>(status)};
        }

        HttpResponse out;
        out.status = status;
        out.body = std::move(wctx.buffer);
        out.bytesReceived = wctx.received;
        return out;
    }
};

} // namespace

std::unique_ptr<IHttpClient> makeCurlHttpClient() {
    return std::make_unique<CurlHttpClient>();
}

} // namespace dsexport::http
