#include "tusclient/client/session_entry.hpp"

#include <chrono>
#include <cstdint>
#include <utility>

namespace tusclient::client
{

    namespace
    {

        nlohmann::json cookie_to_json(const Cookie &cookie)
        {
            nlohmann::json json = {
                {"name", cookie.name},
                {"value", cookie.value},
                {"domain", cookie.domain},
                {"path", cookie.path},
                {"secure", cookie.secure},
                {"http_only", cookie.http_only},
            };
            if (cookie.expires)
            {
                json["expires"] =
                    std::chrono::duration_cast<std::chrono::seconds>(cookie.expires->time_since_epoch()).count();
            }
            return json;
        }

        Cookie cookie_from_json(const nlohmann::json &json)
        {
            Cookie cookie;
            cookie.name = json.at("name").get<std::string>();
            cookie.value = json.value("value", std::string{});
            cookie.domain = json.value("domain", std::string{});
            cookie.path = json.value("path", std::string{});
            cookie.secure = json.value("secure", false);
            cookie.http_only = json.value("http_only", false);
            if (auto it = json.find("expires"); it != json.end())
            {
                cookie.expires = time_point_from_seconds(it->get<std::int64_t>());
            }
            return cookie;
        }

    } // namespace

    SessionEntry::SessionEntry(std::string location, CookieSet cookies)
        : location_(std::move(location)),
          cookies_(std::move(cookies)) {}

    SessionEntry SessionEntry::merged_with(const CookieSet &cookies) const
    {
        return SessionEntry(location_, merge_cookies(cookies_, cookies));
    }

    void to_json(nlohmann::json &json, const SessionEntry &entry)
    {
        auto cookies = nlohmann::json::array();
        for (const auto &cookie : entry.cookies())
        {
            cookies.push_back(cookie_to_json(cookie));
        }
        json = {
            {"location", entry.location()},
            {"cookies", std::move(cookies)},
        };
    }

    void from_json(const nlohmann::json &json, SessionEntry &entry)
    {
        CookieSet cookies;
        if (auto it = json.find("cookies"); it != json.end())
        {
            for (const auto &item : *it)
            {
                auto cookie = cookie_from_json(item);
                cookies.erase(cookie);
                cookies.insert(std::move(cookie));
            }
        }
        entry = SessionEntry(json.value("location", std::string{}), std::move(cookies));
    }

} // namespace tusclient::client
