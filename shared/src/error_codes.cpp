#include "tusclient/error_codes.hpp"

#include <array>

namespace tusclient
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 7> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::MissingCreationUrl, "missing_creation_url"},
            {ErrorCode::ResumingDisabled, "resuming_disabled"},
            {ErrorCode::FingerprintNotFound, "fingerprint_not_found"},
            {ErrorCode::ProtocolViolation, "protocol_violation"},
            {ErrorCode::TransportFailure, "transport_failure"},
            {ErrorCode::SourceUnreadable, "source_unreadable"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    std::optional<ErrorCode> error_code_from_string(std::string_view value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.description == value)
            {
                return entry.code;
            }
        }
        return std::nullopt;
    }

} // namespace tusclient
