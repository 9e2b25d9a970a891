/**
 * ShareBox - Shared error codes used across client and server layers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace sharebox
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        FramingError = 1,
        ProtocolViolation = 2,
        UnknownCommand = 3,
        NotFound = 4,
        NotADirectory = 5,
        IsADirectory = 6,
        QuotaExceeded = 7,
        Conflict = 8,
        PathViolation = 9,
        IOError = 10,
        ServiceUnavailable = 11,
        InvalidPayload = 12,
        Refused = 13,
        InternalError = 14
    };

    std::string_view to_string(ErrorCode code) noexcept;

    std::optional<ErrorCode> error_code_from_string(std::string_view value) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    // Framing and protocol errors terminate the connection; everything else is
    // reported to the client and the session continues.
    constexpr bool is_connection_fatal(ErrorCode code) noexcept
    {
        return code == ErrorCode::FramingError || code == ErrorCode::ProtocolViolation;
    }

} // namespace sharebox
