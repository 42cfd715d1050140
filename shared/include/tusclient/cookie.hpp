/**
 * tusclient - Set-Cookie parsing and Cookie header serialization.
 *
 * Cookies are keyed by (name, domain, path). Storing a cookie whose key is already
 * present replaces the older record, so a Cookie header never carries two values for
 * the same key.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace tusclient
{

    struct Cookie
    {
        std::string name;
        std::string value;
        // Lower-cased, without a leading dot. Empty when the attribute was absent.
        std::string domain;
        std::string path;
        // Absent for session cookies. Max-Age is converted to an absolute time when parsed.
        std::optional<std::chrono::system_clock::time_point> expires;
        bool secure{};
        bool http_only{};

        bool expired_at(std::chrono::system_clock::time_point now) const noexcept
        {
            return expires && now >= *expires;
        }

        bool operator==(const Cookie &) const = default;
    };

    struct CookieKeyLess
    {
        bool operator()(const Cookie &lhs, const Cookie &rhs) const noexcept;
    };

    using CookieSet = std::set<Cookie, CookieKeyLess>;

    std::optional<Cookie> parse_set_cookie_line(std::string_view line, std::chrono::system_clock::time_point now);

    // Each value is parsed on its own; values that fail to parse are dropped.
    CookieSet parse_set_cookie(const std::vector<std::string> &values,
                               std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    // "name=value" pairs joined by "; " for every cookie still live at now, or std::nullopt
    // when there is nothing to send.
    std::optional<std::string> serialize_cookie_header(
        const CookieSet &cookies, std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    // Union of both sets; on a key collision the record from incoming wins.
    CookieSet merge_cookies(CookieSet base, const CookieSet &incoming);

    std::optional<std::chrono::system_clock::time_point> parse_http_date(std::string_view text);

    // Seconds since the epoch as a clock time point. Values past the clock's range saturate
    // at time_point::max() or min(), so far-future expiry dates stay live.
    std::chrono::system_clock::time_point time_point_from_seconds(std::int64_t seconds) noexcept;

} // namespace tusclient
