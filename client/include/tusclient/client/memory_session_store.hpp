#pragma once

#include <map>
#include <mutex>
#include <string>

#include "tusclient/client/session_store.hpp"

namespace tusclient::client
{

    // Lives as long as the process; nothing is written to disk.
    class MemorySessionStore : public SessionStore
    {
    public:
        void set(const std::string &fingerprint, SessionEntry entry) override;
        std::optional<SessionEntry> get(const std::string &fingerprint) const override;
        void update_cookies(const std::string &fingerprint, const CookieSet &cookies) override;
        void remove(const std::string &fingerprint) override;

        std::size_t size() const;

    private:
        mutable std::mutex mutex_;
        std::map<std::string, SessionEntry> entries_;
    };

} // namespace tusclient::client
