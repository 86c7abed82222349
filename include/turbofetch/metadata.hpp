#pragma once

#include "http_transport.hpp"
#include "retry.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace turbofetch {

struct FileMetadata {
    std::uint64_t size{0};
    std::string mimetype{"application/octet-stream"};
    std::string filename;
    bool accepts_ranges{false};
};

class MetadataResolver {
public:
    MetadataResolver(HttpTransport& transport, HeaderMap headers,
                     std::optional<long> timeout_seconds,
                     RetryPolicy retry = metadataRetryPolicy(),
                     const CancellationToken* cancel_token = nullptr);

    // HEAD probe. A server that refuses the probe with a 4xx status gives
    // "unknown" metadata (size 0, name derived from the URL); 5xx replies and
    // transport failures are retried and then raise RequestError.
    [[nodiscard]] FileMetadata resolve(const std::string& url);

private:
    HttpTransport& transport_;
    HeaderMap headers_;
    std::optional<long> timeout_seconds_;
    RetryPolicy retry_;
    const CancellationToken* cancel_token_;
};

[[nodiscard]] FileMetadata parseMetadata(const std::string& url, const HeaderMap& headers);

// "attachment; filename*=UTF-8''a%20b.zip" -> "a b.zip"
[[nodiscard]] std::optional<std::string> filenameFromContentDisposition(const std::string& value);
[[nodiscard]] std::string filenameFromUrl(const std::string& url);
[[nodiscard]] std::string extensionForMimetype(const std::string& mimetype);
[[nodiscard]] std::string percentDecode(const std::string& text);

} // namespace turbofetch
