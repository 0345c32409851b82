#include "minishare/error_codes.hpp"

#include <array>

namespace minishare
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 11> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::ConnectionClosed, "connection_closed"},
            {ErrorCode::InvalidName, "invalid_name"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::LocalIOError, "local_io_error"},
            {ErrorCode::StreamTruncated, "stream_truncated"},
            {ErrorCode::ProtocolDesync, "protocol_desync"},
            {ErrorCode::ProtocolError, "protocol_error"},
            {ErrorCode::Timeout, "timeout"},
            {ErrorCode::InvalidCommand, "invalid_command"},
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

    Error::Error(ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

} // namespace minishare
