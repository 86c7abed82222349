#include "turbofetch/options.hpp"

#include "turbofetch/digest.hpp"
#include "turbofetch/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

#include <fmt/format.h>

namespace turbofetch {

namespace {
constexpr const char* kUserAgent =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) "
    "Chrome/131.0.0.0 Safari/537.36";

bool isEngineControlled(const std::string& canonical_name) {
    return canonical_name == "Accept-Encoding" || canonical_name == "Range" ||
           canonical_name == "Connection";
}

void validateRetry(const RetryPolicy& policy, const char* name) {
    if (policy.max_attempts < 1) {
        throw InvalidArgumentError(fmt::format("{} needs at least one attempt", name));
    }
    if (policy.base_delay.count() < 0 || policy.max_delay.count() < 0 || policy.multiplier < 1.0) {
        throw InvalidArgumentError(fmt::format("{} has a negative delay or a multiplier below 1",
                                               name));
    }
}
} // namespace

std::string canonicalHeaderName(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    bool word_start = true;
    for (const char ch : name) {
        const auto c = static_cast<unsigned char>(ch);
        if (std::isalpha(c)) {
            out.push_back(static_cast<char>(word_start ? std::toupper(c) : std::tolower(c)));
            word_start = false;
        } else {
            out.push_back(ch);
            word_start = true;
        }
    }
    return out;
}

HeaderMap buildRequestHeaders(const HeaderMap& custom) {
    HeaderMap headers = {
        {"Accept", "*/*"},
        {"Accept-Encoding", "identity"},
        {"Connection", "keep-alive"},
        {"User-Agent", kUserAgent},
    };
    for (const auto& [name, value] : custom) {
        const std::string canonical = canonicalHeaderName(name);
        if (!isEngineControlled(canonical)) {
            headers[canonical] = value;
        }
    }
    return headers;
}

void DownloadOptions::validate() const {
    if (!max_connections.isAuto() &&
        (max_connections.value() < 1 || max_connections.value() > kMaxConnections)) {
        throw InvalidArgumentError(
            fmt::format("max_connections must be between 1 and {}", kMaxConnections));
    }
    if (!(connection_speed_mbps > 0.0) || !std::isfinite(connection_speed_mbps)) {
        throw InvalidArgumentError("connection_speed must be positive");
    }
    if (timeout_seconds && *timeout_seconds <= 0) {
        throw InvalidArgumentError("timeout must be positive");
    }
    if (flush_threshold == 0 || max_buffer_bytes == 0) {
        throw InvalidArgumentError("buffer sizes must be positive");
    }
    validateRetry(segment_retry, "segment retry policy");
    validateRetry(metadata_retry, "metadata retry policy");
}

void DownloadRequest::validate() const {
    if (output_path.empty()) {
        throw InvalidArgumentError("output path must not be empty");
    }
    if (!isSupportedHashType(hash_type)) {
        throw InvalidArgumentError(fmt::format("Unsupported hash type \"{}\"", hash_type));
    }
    if (expected_hash) {
        const std::string& hex = *expected_hash;
        const bool is_hex = !hex.empty() && hex.size() % 2 == 0 &&
                            std::all_of(hex.begin(), hex.end(), [](unsigned char c) {
                                return std::isxdigit(c) != 0;
                            });
        if (!is_hex) {
            throw InvalidArgumentError("expected hash must be a hex string");
        }
    }
}

const char* toString(WriteMode mode) {
    switch (mode) {
    case WriteMode::Auto:
        return "auto";
    case WriteMode::Buffered:
        return "buffered";
    case WriteMode::Direct:
        return "direct";
    }
    return "unknown";
}

} // namespace turbofetch
