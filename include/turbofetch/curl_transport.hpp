#pragma once

#include "http_transport.hpp"

namespace turbofetch {

// libcurl easy-interface transport; one handle per request, so a single
// instance can be shared by all workers.
class CurlTransport final : public HttpTransport {
public:
    CurlTransport();

    HttpResponse head(const HttpRequest& request) override;
    HttpResponse get(const HttpRequest& request, const ResponseCallbacks& callbacks) override;
};

} // namespace turbofetch
