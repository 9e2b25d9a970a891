#include "sharebox/error_codes.hpp"

#include <array>

namespace sharebox
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 15> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::FramingError, "framing_error"},
            {ErrorCode::ProtocolViolation, "protocol_violation"},
            {ErrorCode::UnknownCommand, "unknown_command"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::NotADirectory, "not_a_directory"},
            {ErrorCode::IsADirectory, "is_a_directory"},
            {ErrorCode::QuotaExceeded, "quota_exceeded"},
            {ErrorCode::Conflict, "conflict"},
            {ErrorCode::PathViolation, "path_violation"},
            {ErrorCode::IOError, "io_error"},
            {ErrorCode::ServiceUnavailable, "service_unavailable"},
            {ErrorCode::InvalidPayload, "invalid_payload"},
            {ErrorCode::Refused, "refused"},
            {ErrorCode::InternalError, "internal_error"},
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

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

} // namespace sharebox
