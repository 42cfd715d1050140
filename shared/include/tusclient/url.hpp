#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tusclient::http
{

    struct Url
    {
        std::string scheme;
        std::string host;
        std::uint16_t port{};
        // Path plus query, always starting with '/'.
        std::string target{"/"};

        std::string host_header() const;
    };

    // Accepts absolute http/https URLs only; the fragment is dropped.
    std::optional<Url> parse_url(std::string_view text);

    // RFC 3986 section 5.2 reference resolution. Returns std::nullopt when the base is not an
    // absolute URL and the reference is not absolute either.
    std::optional<std::string> resolve_url(std::string_view base, std::string_view reference);

    std::string remove_dot_segments(std::string_view path);

} // namespace tusclient::http
