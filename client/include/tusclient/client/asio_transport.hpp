#pragma once

#include <chrono>

#include "tusclient/client/transport.hpp"
#include "tusclient/url.hpp"

namespace tusclient::client
{

    // Blocking HTTP/1.1 over plain TCP, one connection per request. Only the connect phase
    // is bounded by a timeout. https URLs are rejected with TransportError. When redirects are
    // followed, Set-Cookie headers from every hop are returned ahead of the final response's own.
    class AsioTransport : public HttpTransport
    {
    public:
        static constexpr int kMaxRedirects = 10;

        http::HttpResponse send(const http::HttpRequest &request, const TransportOptions &options) override;

    private:
        http::HttpResponse exchange(const http::Url &url, const http::HttpRequest &request,
                                    std::chrono::milliseconds connect_timeout);
    };

} // namespace tusclient::client
