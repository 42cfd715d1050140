/**
 * tusclient - tus 1.0.0 header names and header value codecs.
 */
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace tusclient::protocol
{

    inline constexpr std::string_view kTusVersion = "1.0.0";

    inline constexpr std::string_view kTusResumable = "Tus-Resumable";
    inline constexpr std::string_view kUploadLength = "Upload-Length";
    inline constexpr std::string_view kUploadOffset = "Upload-Offset";
    inline constexpr std::string_view kUploadMetadata = "Upload-Metadata";
    inline constexpr std::string_view kLocation = "Location";
    inline constexpr std::string_view kCookie = "Cookie";
    inline constexpr std::string_view kSetCookie = "Set-Cookie";
    inline constexpr std::string_view kContentType = "Content-Type";

    inline constexpr std::string_view kOffsetOctetStream = "application/offset+octet-stream";

    using Metadata = std::map<std::string, std::string>;

    // Non-negative decimal integer, surrounding blanks allowed.
    std::optional<std::uint64_t> parse_offset(std::string_view value) noexcept;

    // "key base64(value)" pairs joined by ','; an empty value leaves the bare key.
    // Throws std::invalid_argument for an empty key or one containing a space or comma.
    std::string encode_metadata(const Metadata &metadata);

    std::optional<Metadata> decode_metadata(std::string_view header);

} // namespace tusclient::protocol
