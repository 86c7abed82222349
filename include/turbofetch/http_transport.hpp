#pragma once

#include "cancellation.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace turbofetch {

using HeaderMap = std::map<std::string, std::string>;

struct HttpRequest {
    std::string url;
    HeaderMap headers;
    // libcurl range syntax without the "bytes=" prefix, e.g. "0-1023" or "512-".
    std::optional<std::string> range;
    std::optional<long> timeout_seconds;
    std::size_t receive_buffer_size{8 * 1024};
    const CancellationToken* cancel_token{nullptr};
};

struct HttpResponse {
    long status_code{0};
    // Keys are lower-case.
    HeaderMap headers;
};

struct ResponseCallbacks {
    // Called once with the final status, before the first body byte.
    std::function<void(long status_code)> on_status;
    // Called once per network read. May throw; the transfer is aborted and
    // the exception is rethrown from get().
    std::function<void(const char* data, std::size_t size)> on_data;
};

// Seam between the transfer engine and the HTTP stack.
// Implementations throw TransportError for connection level failures,
// HttpStatusError for non-2xx final responses and TransferCancelled when the
// request's cancel token fires mid-transfer.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse head(const HttpRequest& request) = 0;
    virtual HttpResponse get(const HttpRequest& request, const ResponseCallbacks& callbacks) = 0;
};

using HttpTransportPtr = std::shared_ptr<HttpTransport>;

} // namespace turbofetch
