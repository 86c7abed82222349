#include "turbofetch/curl_transport.hpp"

#include "turbofetch/detail/curl_utils.hpp"
#include "turbofetch/errors.hpp"

#include <exception>
#include <string>

#include <curl/curl.h>
#include <fmt/format.h>

namespace turbofetch {

namespace {

struct TransferContext {
    CURL* handle{nullptr};
    const ResponseCallbacks* callbacks{nullptr};
    const CancellationToken* cancel_token{nullptr};
    HttpResponse response;
    bool status_reported{false};
    std::exception_ptr error;
};

bool isSuccess(long status_code) { return status_code >= 200 && status_code < 300; }

size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    if (!ctx) {
        return 0;
    }
    const size_t total = size * nitems;
    detail::parseHeaderLine(buffer, total, ctx->response.headers);
    return total;
}

size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    if (!ctx || !ctx->callbacks) {
        return 0;
    }

    const size_t total = size * nmemb;
    // Exceptions must not unwind through libcurl; park them and abort the transfer.
    try {
        if (!ctx->status_reported) {
            ctx->status_reported = true;
            long code = 0;
            curl_easy_getinfo(ctx->handle, CURLINFO_RESPONSE_CODE, &code);
            if (code != 0 && !isSuccess(code)) {
                throw HttpStatusError(code, fmt::format("HTTP status {}", code));
            }
            if (ctx->callbacks->on_status) {
                ctx->callbacks->on_status(code);
            }
        }
        if (ctx->callbacks->on_data) {
            ctx->callbacks->on_data(ptr, total);
        }
    } catch (...) {
        ctx->error = std::current_exception();
        return 0;
    }
    return total;
}

int progressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* ctx = static_cast<const TransferContext*>(clientp);
    return (ctx && ctx->cancel_token && ctx->cancel_token->isCancelled()) ? 1 : 0;
}

HttpResponse perform(const HttpRequest& request, bool head_only,
                     const ResponseCallbacks* callbacks) {
    const detail::CurlHandle curl = detail::makeCurlHandle();

    TransferContext ctx;
    ctx.handle = curl.get();
    ctx.callbacks = callbacks;
    ctx.cancel_token = request.cancel_token;

    const detail::HeaderList header_list = detail::buildHeaderList(request.headers);
    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &headerCallback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_BUFFERSIZE, static_cast<long>(request.receive_buffer_size));

    if (request.timeout_seconds) {
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, *request.timeout_seconds);
    }
    if (request.range) {
        curl_easy_setopt(curl.get(), CURLOPT_RANGE, request.range->c_str());
    }
    if (request.cancel_token) {
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &progressCallback);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);
    } else {
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
    }

    if (head_only) {
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
    } else {
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
    }

    const CURLcode res = curl_easy_perform(curl.get());
    if (ctx.error) {
        std::rethrow_exception(ctx.error);
    }

    long code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
    ctx.response.status_code = code;

    if (res == CURLE_ABORTED_BY_CALLBACK) {
        throw TransferCancelled();
    }
    if (res == CURLE_HTTP_RETURNED_ERROR) {
        throw HttpStatusError(code, fmt::format("HTTP status {} for {}", code, request.url));
    }
    if (res != CURLE_OK) {
        throw TransportError(detail::describeCurlError(res, error_buffer));
    }
    if (code != 0 && !isSuccess(code)) {
        throw HttpStatusError(code, fmt::format("HTTP status {} for {}", code, request.url));
    }
    if (!head_only && !ctx.status_reported && callbacks && callbacks->on_status) {
        callbacks->on_status(code);
    }
    return std::move(ctx.response);
}

} // namespace

CurlTransport::CurlTransport() { detail::ensureCurlInitialized(); }

HttpResponse CurlTransport::head(const HttpRequest& request) {
    return perform(request, true, nullptr);
}

HttpResponse CurlTransport::get(const HttpRequest& request, const ResponseCallbacks& callbacks) {
    return perform(request, false, &callbacks);
}

} // namespace turbofetch
