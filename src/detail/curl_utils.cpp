#include "turbofetch/detail/curl_utils.hpp"

#include "turbofetch/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <stdexcept>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace turbofetch::detail {

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
        spdlog::debug("Using {}", curl_version());
    });
}

CurlHandle makeCurlHandle() {
    CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        throw TransportError("Failed to allocate curl handle");
    }
    return curl;
}

HeaderList buildHeaderList(const HeaderMap& headers) {
    HeaderList list;
    for (const auto& [name, value] : headers) {
        const std::string line = fmt::format("{}: {}", name, value);
        curl_slist* next = curl_slist_append(list.get(), line.c_str());
        if (!next) {
            throw TransportError("Failed to build request headers");
        }
        list.release();
        list.reset(next);
    }
    return list;
}

bool parseHeaderLine(const char* data, std::size_t size, HeaderMap& headers) {
    const std::string line(data, size);
    if (line.rfind("HTTP/", 0) == 0) {
        headers.clear();
        return true;
    }

    const auto colon = line.find(':');
    if (colon != std::string::npos) {
        headers[toLower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return false;
}

std::string describeCurlError(CURLcode code, const char* error_buffer) {
    if (error_buffer && error_buffer[0] != '\0') {
        return fmt::format("curl error {}: {}", static_cast<int>(code), error_buffer);
    }
    return fmt::format("curl error {}: {}", static_cast<int>(code), curl_easy_strerror(code));
}

} // namespace turbofetch::detail
