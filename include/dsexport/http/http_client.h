#pragma once

/*
 * HTTP transport abstraction for the export pipeline.
 *
 * The pipeline only issues GET requests: paginated listings (small JSON bodies, buffered)
 * and document streams (large binary bodies, pushed to a sink as they arrive).
 * Implementations never throw; failures come back as Error values, with httpStatus set
 * whenever the server produced a status line >= 400.
 */

#include <dsexport/core/types.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace dsexport::http {

struct Header {
    std::string name;
    std::string value;
};

struct HttpRequest {
    std::string url;
    std::vector<Header> headers;
    // Appended as ?k=v&k2=v2, values URL-encoded by the client
    std::vector<std::pair<std::string, std::string>> query;
    std::chrono::milliseconds timeout{60000};
};

struct HttpResponse {
    long status{0};
    // Buffered body; empty when a sink consumed it
    std::string body;
    std::uint64_t bytesReceived{0};
};

// Receives 2xx body bytes in order; returning an error aborts the transfer
using BodySink = std::function<Expected<void>(ByteSpan)>;

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    /**
     * Perform a GET. Without a sink the body is buffered into HttpResponse::body.
     * With a sink, 2xx body bytes are streamed to it; bodies of error responses are
     * always buffered (for the error message) and never reach the sink.
     */
    virtual Expected<HttpResponse> get(const HttpRequest& request, const BodySink& sink = {}) = 0;
};

// Extracts a human-readable message from an error body ({"message": ...} when JSON)
std::string errorMessageFromBody(long status, const std::string& body);

// Build "url?k=v&..." with percent-encoded values
std::string buildUrl(const HttpRequest& request);

std::unique_ptr<IHttpClient> makeCurlHttpClient();

} // namespace dsexport::http
