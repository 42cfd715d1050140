#include "tusclient/cookie.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>
#include <tuple>

namespace tusclient
{

    namespace
    {

        using Clock = std::chrono::system_clock;

        constexpr std::int64_t kClockLimitSeconds =
            std::chrono::duration_cast<std::chrono::seconds>(Clock::duration::max()).count();

        std::string_view trim(std::string_view input)
        {
            const auto begin = input.find_first_not_of(" \t");
            if (begin == std::string_view::npos)
            {
                return {};
            }
            const auto end = input.find_last_not_of(" \t");
            return input.substr(begin, end - begin + 1);
        }

        std::string to_lower(std::string_view input)
        {
            std::string out(input);
            std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return out;
        }

        bool is_token(std::string_view name)
        {
            constexpr std::string_view kSeparators = "()<>@,;:\\\"/[]?={} \t";
            if (name.empty() || name.front() == '$')
            {
                return false;
            }
            return std::none_of(name.begin(), name.end(), [&](char ch)
                                {
                                    const auto c = static_cast<unsigned char>(ch);
                                    return c < 0x20 || c == 0x7F || kSeparators.find(ch) != std::string_view::npos; });
        }

        std::string_view strip_quotes(std::string_view value)
        {
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
            {
                return value.substr(1, value.size() - 2);
            }
            return value;
        }

        std::optional<long long> parse_max_age(std::string_view text)
        {
            long long seconds = 0;
            const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), seconds);
            if (ec != std::errc{} || ptr != text.data() + text.size())
            {
                return std::nullopt;
            }
            return seconds;
        }

    } // namespace

    bool CookieKeyLess::operator()(const Cookie &lhs, const Cookie &rhs) const noexcept
    {
        return std::tie(lhs.name, lhs.domain, lhs.path) < std::tie(rhs.name, rhs.domain, rhs.path);
    }

    Clock::time_point time_point_from_seconds(std::int64_t seconds) noexcept
    {
        if (seconds >= kClockLimitSeconds)
        {
            return Clock::time_point::max();
        }
        if (seconds <= -kClockLimitSeconds)
        {
            return Clock::time_point::min();
        }
        return Clock::time_point{std::chrono::seconds{seconds}};
    }

    std::optional<Clock::time_point> parse_http_date(std::string_view text)
    {
        // RFC 1123 first, then the Netscape form with dashes.
        constexpr std::array<const char *, 2> kFormats = {"%a, %d %b %Y %H:%M:%S", "%a, %d-%b-%Y %H:%M:%S"};
        const std::string input(trim(text));
        for (const auto *format : kFormats)
        {
            std::tm tm{};
            std::istringstream in(input);
            in.imbue(std::locale::classic());
            in >> std::get_time(&tm, format);
            if (in.fail())
            {
                continue;
            }
            int year = tm.tm_year + 1900;
            if (year < 100)
            {
                year += year < 70 ? 2000 : 1900;
            }
            const std::chrono::year_month_day date{std::chrono::year{year},
                                                   std::chrono::month{static_cast<unsigned>(tm.tm_mon + 1)},
                                                   std::chrono::day{static_cast<unsigned>(tm.tm_mday)}};
            if (!date.ok())
            {
                continue;
            }
            const std::chrono::sys_seconds when = std::chrono::sys_days{date} + std::chrono::hours{tm.tm_hour} +
                                                  std::chrono::minutes{tm.tm_min} +
                                                  std::chrono::seconds{tm.tm_sec};
            return time_point_from_seconds(when.time_since_epoch().count());
        }
        return std::nullopt;
    }

    std::optional<Cookie> parse_set_cookie_line(std::string_view line, Clock::time_point now)
    {
        const auto first_semicolon = line.find(';');
        const auto pair = line.substr(0, first_semicolon);
        const auto equals = pair.find('=');
        if (equals == std::string_view::npos)
        {
            return std::nullopt;
        }

        Cookie cookie;
        const auto name = trim(pair.substr(0, equals));
        if (!is_token(name))
        {
            return std::nullopt;
        }
        cookie.name = std::string(name);
        cookie.value = std::string(strip_quotes(trim(pair.substr(equals + 1))));

        std::optional<long long> max_age;
        std::optional<Clock::time_point> expires;

        auto rest = first_semicolon == std::string_view::npos ? std::string_view{} : line.substr(first_semicolon + 1);
        while (!rest.empty())
        {
            const auto next = rest.find(';');
            const auto attribute = trim(rest.substr(0, next));
            rest = next == std::string_view::npos ? std::string_view{} : rest.substr(next + 1);
            if (attribute.empty())
            {
                continue;
            }

            const auto attr_equals = attribute.find('=');
            const auto key = to_lower(trim(attribute.substr(0, attr_equals)));
            const auto value = attr_equals == std::string_view::npos ? std::string_view{}
                                                                      : trim(attribute.substr(attr_equals + 1));
            if (key == "domain")
            {
                auto domain = to_lower(value);
                if (domain.starts_with('.'))
                {
                    domain.erase(0, 1);
                }
                cookie.domain = std::move(domain);
            }
            else if (key == "path")
            {
                cookie.path = std::string(value);
            }
            else if (key == "max-age")
            {
                // Unparseable values are ignored, per RFC 6265.
                if (auto seconds = parse_max_age(value))
                {
                    max_age = seconds;
                }
            }
            else if (key == "expires")
            {
                if (auto when = parse_http_date(value))
                {
                    expires = when;
                }
            }
            else if (key == "secure")
            {
                cookie.secure = true;
            }
            else if (key == "httponly")
            {
                cookie.http_only = true;
            }
        }

        if (max_age)
        {
            const auto base = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
            if (*max_age <= 0)
            {
                cookie.expires = Clock::time_point{};
            }
            else if (*max_age >= kClockLimitSeconds - base)
            {
                cookie.expires = Clock::time_point::max();
            }
            else
            {
                cookie.expires = now + std::chrono::seconds{*max_age};
            }
        }
        else
        {
            cookie.expires = expires;
        }
        return cookie;
    }

    CookieSet parse_set_cookie(const std::vector<std::string> &values, Clock::time_point now)
    {
        CookieSet cookies;
        for (const auto &value : values)
        {
            if (auto cookie = parse_set_cookie_line(value, now))
            {
                cookies.erase(*cookie);
                cookies.insert(std::move(*cookie));
            }
        }
        return cookies;
    }

    std::optional<std::string> serialize_cookie_header(const CookieSet &cookies, Clock::time_point now)
    {
        std::string header;
        for (const auto &cookie : cookies)
        {
            if (cookie.expired_at(now))
            {
                continue;
            }
            if (!header.empty())
            {
                header += "; ";
            }
            header += cookie.name;
            header += '=';
            header += cookie.value;
        }
        if (header.empty())
        {
            return std::nullopt;
        }
        return header;
    }

    CookieSet merge_cookies(CookieSet base, const CookieSet &incoming)
    {
        for (const auto &cookie : incoming)
        {
            base.erase(cookie);
            base.insert(cookie);
        }
        return base;
    }

} // namespace tusclient
