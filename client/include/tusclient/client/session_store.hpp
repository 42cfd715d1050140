/**
 * tusclient - Fingerprint to session mapping used for resuming uploads.
 */
#pragma once

#include <optional>
#include <string>

#include "tusclient/client/session_entry.hpp"
#include "tusclient/cookie.hpp"

namespace tusclient::client
{

    // Implementations decide durability. They must tolerate concurrent calls for
    // different fingerprints when shared across threads.
    class SessionStore
    {
    public:
        virtual ~SessionStore() = default;

        // Replaces any entry already stored for the fingerprint.
        virtual void set(const std::string &fingerprint, SessionEntry entry) = 0;

        // std::nullopt for unknown fingerprints; never throws for a missing key.
        virtual std::optional<SessionEntry> get(const std::string &fingerprint) const = 0;

        // Merges into an existing entry. Does nothing when the fingerprint is unknown.
        virtual void update_cookies(const std::string &fingerprint, const CookieSet &cookies) = 0;

        // Removing an unknown fingerprint is not an error.
        virtual void remove(const std::string &fingerprint) = 0;
    };

} // namespace tusclient::client
