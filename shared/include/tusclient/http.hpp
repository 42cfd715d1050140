/**
 * tusclient - HTTP message model shared by the transport and the protocol layer.
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tusclient::http
{

    // Ordered, may repeat a name (Set-Cookie).
    using HeaderList = std::vector<std::pair<std::string, std::string>>;

    struct HttpRequest
    {
        std::string method{"GET"};
        std::string url;
        HeaderList headers;
        std::string body;
    };

    struct HttpResponse
    {
        int status{};
        std::string reason;
        HeaderList headers;
        // URL the response was received from after any redirects.
        std::string final_url;
        std::string body;
    };

    bool iequals(std::string_view lhs, std::string_view rhs) noexcept;

    std::optional<std::string> header_value(const HeaderList &headers, std::string_view name);

    std::vector<std::string> header_values(const HeaderList &headers, std::string_view name);

    constexpr bool is_success(int status) noexcept
    {
        return status >= 200 && status < 300;
    }

    constexpr bool is_redirect(int status) noexcept
    {
        return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
    }

} // namespace tusclient::http
