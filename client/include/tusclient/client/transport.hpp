/**
 * tusclient - Narrow HTTP transport seam used by the upload client.
 */
#pragma once

#include <chrono>
#include <stdexcept>

#include "tusclient/http.hpp"

namespace tusclient::client
{

    // The exchange did not complete: resolve or connect failure, timeout, broken or
    // malformed response.
    class TransportError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    struct TransportOptions
    {
        std::chrono::milliseconds connect_timeout{5000};
        // Redirects are followed with method and body unchanged.
        bool follow_redirects{};
    };

    class HttpTransport
    {
    public:
        virtual ~HttpTransport() = default;

        // Returns any response the server produced, whatever its status. The response's
        // final_url is the URL it was actually received from. Throws TransportError.
        virtual http::HttpResponse send(const http::HttpRequest &request, const TransportOptions &options) = 0;
    };

    // Process-wide switch. Off by default: a redirected creation POST is then reported
    // to the caller instead of being followed.
    void set_strict_post_redirect(bool enabled) noexcept;
    bool strict_post_redirect() noexcept;

} // namespace tusclient::client
