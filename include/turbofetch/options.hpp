#pragma once

#include "chunk_buffer.hpp"
#include "connection_sizer.hpp"
#include "http_transport.hpp"
#include "retry.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace turbofetch {

enum class WriteMode {
    Auto,     // buffered unless the destination is RAM-backed or memory is short
    Buffered, // stage in RAM, write through mmap
    Direct,   // write every read under a shared lock
};

struct DownloadOptions {
    ConnectionCount max_connections{ConnectionCount::automatic()};
    double connection_speed_mbps{80.0};
    bool overwrite{true};
    HeaderMap custom_headers;
    std::optional<long> timeout_seconds;

    std::uint64_t flush_threshold{kDefaultFlushThreshold};
    std::uint64_t max_buffer_bytes{kDefaultMaxBufferBytes};
    RetryPolicy segment_retry{segmentRetryPolicy()};
    RetryPolicy metadata_retry{metadataRetryPolicy()};

    // Throws InvalidArgumentError.
    void validate() const;
};

struct DownloadRequest {
    // File or directory; a directory receives the server-derived file name.
    std::string output_path{"."};
    bool pre_allocate{false};
    WriteMode use_ram_buffer{WriteMode::Auto};
    std::optional<std::string> expected_hash;
    std::string hash_type{"md5"};

    void validate() const;
};

// Default request headers merged with `custom`. Custom names are title-cased;
// Accept-Encoding, Range and Connection stay under engine control.
[[nodiscard]] HeaderMap buildRequestHeaders(const HeaderMap& custom);
[[nodiscard]] std::string canonicalHeaderName(const std::string& name);

[[nodiscard]] const char* toString(WriteMode mode);

} // namespace turbofetch
