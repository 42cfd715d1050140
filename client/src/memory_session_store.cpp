#include "tusclient/client/memory_session_store.hpp"

#include <utility>

namespace tusclient::client
{

    void MemorySessionStore::set(const std::string &fingerprint, SessionEntry entry)
    {
        std::lock_guard lock(mutex_);
        entries_.insert_or_assign(fingerprint, std::move(entry));
    }

    std::optional<SessionEntry> MemorySessionStore::get(const std::string &fingerprint) const
    {
        std::lock_guard lock(mutex_);
        const auto it = entries_.find(fingerprint);
        if (it == entries_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    void MemorySessionStore::update_cookies(const std::string &fingerprint, const CookieSet &cookies)
    {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(fingerprint);
        if (it != entries_.end())
        {
            it->second = it->second.merged_with(cookies);
        }
    }

    void MemorySessionStore::remove(const std::string &fingerprint)
    {
        std::lock_guard lock(mutex_);
        entries_.erase(fingerprint);
    }

    std::size_t MemorySessionStore::size() const
    {
        std::lock_guard lock(mutex_);
        return entries_.size();
    }

} // namespace tusclient::client
