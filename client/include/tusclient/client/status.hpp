#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "tusclient/error_codes.hpp"
#include "tusclient/http.hpp"

namespace tusclient::client
{

    struct Status
    {
        ErrorCode code{ErrorCode::Ok};
        std::string message;
        // Kept for protocol violations so callers can branch on the HTTP status.
        std::optional<http::HttpResponse> response;

        bool ok() const noexcept { return code == ErrorCode::Ok; }

        int http_status() const noexcept { return response ? response->status : 0; }

        static Status failure(ErrorCode code, std::string message,
                              std::optional<http::HttpResponse> response = std::nullopt);
    };

    struct UploadHandle
    {
        // Absolute upload URL.
        std::string url;
        std::uint64_t offset{};
    };

    struct Resolution
    {
        Status status;
        std::optional<UploadHandle> handle;

        bool ok() const noexcept { return status.ok() && handle.has_value(); }
    };

    // Whether a failed resume should be answered by creating a fresh upload: the session is
    // unknown locally, resuming is off, or the server answered 404 for the stored location.
    bool should_create_after_resume(const Status &status) noexcept;

} // namespace tusclient::client
