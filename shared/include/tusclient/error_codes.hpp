/**
 * tusclient - Error codes reported by session resolution and transfers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace tusclient
{

    enum class ErrorCode : std::uint8_t
    {
        Ok = 0,
        MissingCreationUrl = 1,
        ResumingDisabled = 2,
        FingerprintNotFound = 3,
        ProtocolViolation = 4,
        TransportFailure = 5,
        SourceUnreadable = 6
    };

    std::string_view to_string(ErrorCode code) noexcept;

    std::optional<ErrorCode> error_code_from_string(std::string_view value) noexcept;

    // Configuration errors are never fixed by trying again with the same setup.
    constexpr bool is_configuration_error(ErrorCode code) noexcept
    {
        return code == ErrorCode::MissingCreationUrl || code == ErrorCode::ResumingDisabled;
    }

} // namespace tusclient
