#include "tusclient/client/status.hpp"

#include <utility>

namespace tusclient::client
{

    Status Status::failure(ErrorCode code, std::string message, std::optional<http::HttpResponse> response)
    {
        return Status{code, std::move(message), std::move(response)};
    }

    bool should_create_after_resume(const Status &status) noexcept
    {
        switch (status.code)
        {
        case ErrorCode::FingerprintNotFound:
        case ErrorCode::ResumingDisabled:
            return true;
        case ErrorCode::ProtocolViolation:
            return status.http_status() == 404;
        default:
            return false;
        }
    }

} // namespace tusclient::client
