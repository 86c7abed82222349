#pragma once

#include "byte_range.hpp"
#include "cancellation.hpp"
#include "http_transport.hpp"
#include "retry.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace turbofetch {

inline constexpr std::size_t kSimpleReadSize = 8 * 1024;
inline constexpr std::size_t kBufferedReadSize = 1024 * 1024;

class SegmentFetcher {
public:
    using ByteSink = std::function<void(const char* data, std::size_t size)>;

    struct Settings {
        HeaderMap headers;
        std::optional<long> timeout_seconds;
        std::size_t read_size{kSimpleReadSize};
        RetryPolicy retry{segmentRetryPolicy()};
    };

    SegmentFetcher(HttpTransport& transport, Settings settings,
                   const CancellationToken* cancel_token = nullptr,
                   std::atomic<std::uint64_t>* progress = nullptr);

    // Streams `range` of `url` into `sink`, resuming after transient failures
    // at the first byte not yet delivered. Returns the number of bytes handed
    // to the sink.
    std::uint64_t fetch(const std::string& url, const ByteRange& range, const ByteSink& sink);

private:
    std::uint64_t fetchOnce(const std::string& url, const ByteRange& range, const ByteSink& sink,
                            std::uint64_t& delivered);

    HttpTransport& transport_;
    Settings settings_;
    const CancellationToken* cancel_token_;
    std::atomic<std::uint64_t>* progress_;
};

} // namespace turbofetch
