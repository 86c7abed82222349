#include "turbofetch/metadata.hpp"

#include "turbofetch/errors.hpp"

#include <algorithm>
#include <cctype>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace turbofetch {

namespace {

constexpr const char* kFallbackStem = "downloaded_file";

std::string trim(const std::string& text, const char* characters = " \t\r\n") {
    const auto first = text.find_first_not_of(characters);
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(characters);
    return text.substr(first, last - first + 1);
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// Keeps only the last path component so a hostile header cannot escape the
// output directory.
std::string baseName(const std::string& name) {
    const auto slash = name.find_last_of("/\\");
    std::string base = slash == std::string::npos ? name : name.substr(slash + 1);
    if (base == "." || base == "..") {
        return {};
    }
    return base;
}

std::string headerValue(const HeaderMap& headers, const std::string& name) {
    const auto it = headers.find(name);
    return it == headers.end() ? std::string{} : it->second;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

} // namespace

std::string percentDecode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            const int high = hexValue(text[i + 1]);
            const int low = hexValue(text[i + 2]);
            if (high >= 0 && low >= 0) {
                out.push_back(static_cast<char>(high * 16 + low));
                i += 2;
                continue;
            }
        }
        out.push_back(text[i]);
    }
    return out;
}

std::optional<std::string> filenameFromContentDisposition(const std::string& value) {
    std::string name;
    const auto extended = value.find("filename*=");
    if (extended != std::string::npos) {
        std::string raw = value.substr(extended + 10);
        raw = raw.substr(0, raw.find(';'));
        // charset'language'encoded-name
        const auto quote = raw.rfind('\'');
        if (quote != std::string::npos) {
            raw = raw.substr(quote + 1);
        }
        name = percentDecode(trim(raw, " \t\""));
    } else {
        const auto plain = value.find("filename=");
        if (plain != std::string::npos) {
            std::string raw = value.substr(plain + 9);
            raw = raw.substr(0, raw.find(';'));
            name = trim(raw, " \t\"'");
        }
    }

    name = baseName(name);
    if (name.empty()) {
        return std::nullopt;
    }
    return name;
}

std::string filenameFromUrl(const std::string& url) {
    std::string path = url;
    const auto scheme = path.find("://");
    if (scheme != std::string::npos) {
        const auto slash = path.find('/', scheme + 3);
        path = slash == std::string::npos ? std::string{} : path.substr(slash);
    }
    path = path.substr(0, path.find_first_of("?#"));
    return baseName(percentDecode(path));
}

std::string extensionForMimetype(const std::string& mimetype) {
    static const std::vector<std::pair<std::string, std::string>> table = {
        {"application/zip", ".zip"},
        {"application/gzip", ".gz"},
        {"application/x-tar", ".tar"},
        {"application/x-7z-compressed", ".7z"},
        {"application/x-xz", ".xz"},
        {"application/x-bzip2", ".bz2"},
        {"application/pdf", ".pdf"},
        {"application/json", ".json"},
        {"application/xml", ".xml"},
        {"application/x-iso9660-image", ".iso"},
        {"application/vnd.debian.binary-package", ".deb"},
        {"application/x-rpm", ".rpm"},
        {"text/plain", ".txt"},
        {"text/html", ".html"},
        {"text/css", ".css"},
        {"text/csv", ".csv"},
        {"image/jpeg", ".jpg"},
        {"image/png", ".png"},
        {"image/gif", ".gif"},
        {"image/webp", ".webp"},
        {"image/svg+xml", ".svg"},
        {"audio/mpeg", ".mp3"},
        {"audio/ogg", ".ogg"},
        {"audio/wav", ".wav"},
        {"video/mp4", ".mp4"},
        {"video/webm", ".webm"},
        {"video/x-matroska", ".mkv"},
    };
    const std::string key = toLower(mimetype);
    const auto it = std::find_if(table.begin(), table.end(),
                                 [&](const auto& entry) { return entry.first == key; });
    return it == table.end() ? std::string{} : it->second;
}

FileMetadata parseMetadata(const std::string& url, const HeaderMap& headers) {
    FileMetadata meta;

    const std::string length = headerValue(headers, "content-length");
    if (!length.empty()) {
        try {
            meta.size = std::stoull(length);
        } catch (const std::exception& e) {
            spdlog::warn("Ignoring malformed Content-Length \"{}\": {}", length, e.what());
            meta.size = 0;
        }
    }

    const std::string content_type = headerValue(headers, "content-type");
    if (!content_type.empty()) {
        const std::string mime = trim(content_type.substr(0, content_type.find(';')));
        if (!mime.empty()) {
            meta.mimetype = mime;
        }
    }

    meta.accepts_ranges = toLower(headerValue(headers, "accept-ranges")).find("bytes") !=
                          std::string::npos;

    const std::string disposition = headerValue(headers, "content-disposition");
    if (auto name = filenameFromContentDisposition(disposition)) {
        meta.filename = std::move(*name);
    } else {
        meta.filename = filenameFromUrl(url);
    }
    if (meta.filename.empty()) {
        meta.filename = kFallbackStem + extensionForMimetype(meta.mimetype);
    }
    return meta;
}

MetadataResolver::MetadataResolver(HttpTransport& transport, HeaderMap headers,
                                   std::optional<long> timeout_seconds, RetryPolicy retry,
                                   const CancellationToken* cancel_token)
    : transport_(transport),
      headers_(std::move(headers)),
      timeout_seconds_(timeout_seconds),
      retry_(retry),
      cancel_token_(cancel_token) {}

FileMetadata MetadataResolver::resolve(const std::string& url) {
    HttpRequest request;
    request.url = url;
    request.headers = headers_;
    request.timeout_seconds = timeout_seconds_;
    request.cancel_token = cancel_token_;

    const auto probe = [&](int) -> std::optional<HttpResponse> {
        try {
            return transport_.head(request);
        } catch (const HttpStatusError& e) {
            // Client errors will not change on retry; many servers refuse HEAD.
            if (e.statusCode() >= 400 && e.statusCode() < 500) {
                spdlog::warn("HEAD {} refused: {}", url, e.what());
                return std::nullopt;
            }
            throw;
        }
    };

    std::optional<HttpResponse> response;
    try {
        response = retryWithBackoff(retry_, cancel_token_, fmt::format("HEAD {}", url), probe);
    } catch (const RetryableError& e) {
        throw RequestError(fmt::format("An error occurred while getting file info: {}", e.what()));
    }

    if (!response) {
        return parseMetadata(url, {});
    }
    return parseMetadata(url, response->headers);
}

} // namespace turbofetch
