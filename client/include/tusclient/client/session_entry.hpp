#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "tusclient/cookie.hpp"

namespace tusclient::client
{

    // Where an upload lives and the cookies that keep requests on the same backend.
    // Immutable; merging cookies yields a new entry.
    class SessionEntry
    {
    public:
        SessionEntry() = default;
        explicit SessionEntry(std::string location, CookieSet cookies = {});

        const std::string &location() const noexcept { return location_; }
        const CookieSet &cookies() const noexcept { return cookies_; }

        SessionEntry merged_with(const CookieSet &cookies) const;

        bool operator==(const SessionEntry &) const = default;

    private:
        std::string location_;
        CookieSet cookies_;
    };

    void to_json(nlohmann::json &json, const SessionEntry &entry);
    void from_json(const nlohmann::json &json, SessionEntry &entry);

} // namespace tusclient::client
