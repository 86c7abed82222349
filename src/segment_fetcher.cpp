#include "turbofetch/segment_fetcher.hpp"

#include "turbofetch/errors.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace turbofetch {

namespace {
std::string describe(const std::string& url, const ByteRange& range) {
    if (range.isWholeBody()) {
        return fmt::format("GET {}", url);
    }
    return fmt::format("GET {} [{}-{}]", url, range.start, range.end);
}
} // namespace

SegmentFetcher::SegmentFetcher(HttpTransport& transport, Settings settings,
                               const CancellationToken* cancel_token,
                               std::atomic<std::uint64_t>* progress)
    : transport_(transport),
      settings_(std::move(settings)),
      cancel_token_(cancel_token),
      progress_(progress) {}

std::uint64_t SegmentFetcher::fetch(const std::string& url, const ByteRange& range,
                                    const ByteSink& sink) {
    std::uint64_t delivered = 0;
    const std::string what = describe(url, range);

    try {
        retryWithBackoff(settings_.retry, cancel_token_, what,
                         [&](int) { return fetchOnce(url, range, sink, delivered); });
    } catch (const RetryableError& e) {
        throw DownloadError(fmt::format("{} failed: {}", what, e.what()));
    }

    spdlog::debug("{} done, {} bytes", what, delivered);
    return delivered;
}

std::uint64_t SegmentFetcher::fetchOnce(const std::string& url, const ByteRange& range,
                                        const ByteSink& sink, std::uint64_t& delivered) {
    if (cancel_token_ && cancel_token_->isCancelled()) {
        throw TransferCancelled();
    }

    HttpRequest request;
    request.url = url;
    request.headers = settings_.headers;
    request.timeout_seconds = settings_.timeout_seconds;
    request.receive_buffer_size = settings_.read_size;
    request.cancel_token = cancel_token_;

    // Resume after whatever an earlier attempt already handed to the sink.
    const std::uint64_t resume_at = range.start + delivered;
    if (!range.isWholeBody()) {
        request.range = fmt::format("{}-{}", resume_at, range.end);
    } else if (delivered > 0) {
        request.range = fmt::format("{}-", resume_at);
    }

    std::uint64_t skip = 0;
    ResponseCallbacks callbacks;
    callbacks.on_status = [&](long status_code) {
        // 200 means the server ignored Range and sends the resource from byte 0.
        if (status_code != 200 || !request.range) {
            return;
        }
        if (!range.isWholeBody()) {
            throw RangeNotHonoredError(fmt::format("server ignored Range {} for {}",
                                                   *request.range, url));
        }
        skip = resume_at;
    };
    callbacks.on_data = [&](const char* data, std::size_t size) {
        if (cancel_token_ && cancel_token_->isCancelled()) {
            throw TransferCancelled();
        }
        if (skip > 0) {
            const auto dropped = static_cast<std::size_t>(std::min<std::uint64_t>(skip, size));
            data += dropped;
            size -= dropped;
            skip -= dropped;
            if (size == 0) {
                return;
            }
        }
        if (!range.isWholeBody() && size > range.size() - delivered) {
            throw DownloadError(fmt::format("server sent more than the {} bytes of range {}-{}",
                                            range.size(), range.start, range.end));
        }

        sink(data, size);
        delivered += size;
        if (progress_) {
            progress_->fetch_add(size, std::memory_order_relaxed);
        }
    };

    transport_.get(request, callbacks);

    if (!range.isWholeBody() && delivered < range.size()) {
        throw TransportError(fmt::format("connection closed after {} of {} bytes", delivered,
                                         range.size()));
    }
    return delivered;
}

} // namespace turbofetch
