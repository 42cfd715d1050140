#include "tusclient/client/transport.hpp"

#include <atomic>

namespace tusclient::client
{

    namespace
    {
        std::atomic<bool> g_strict_post_redirect{false};
    } // namespace

    void set_strict_post_redirect(bool enabled) noexcept
    {
        g_strict_post_redirect.store(enabled);
    }

    bool strict_post_redirect() noexcept
    {
        return g_strict_post_redirect.load();
    }

} // namespace tusclient::client
