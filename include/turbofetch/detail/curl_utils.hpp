#pragma once

#include "turbofetch/http_transport.hpp"

#include <cstddef>
#include <memory>
#include <string>

#include <curl/curl.h>

namespace turbofetch::detail {

// curl_global_init once per process; logs the linked libcurl version.
void ensureCurlInitialized();

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

struct SlistDeleter {
    void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

[[nodiscard]] CurlHandle makeCurlHandle();

// "Name: value" lines for CURLOPT_HTTPHEADER.
[[nodiscard]] HeaderList buildHeaderList(const HeaderMap& headers);

// Folds one raw header line into `headers` with a lower-case key. Returns true
// for a status line, which starts a new header block after a redirect or an
// interim response.
bool parseHeaderLine(const char* data, std::size_t size, HeaderMap& headers);

[[nodiscard]] std::string describeCurlError(CURLcode code, const char* error_buffer);

} // namespace turbofetch::detail
