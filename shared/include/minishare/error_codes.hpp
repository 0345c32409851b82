/**
 * MiniShare - Shared error codes used across client and server layers.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace minishare
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        ConnectionClosed = 1,
        InvalidName = 2,
        NotFound = 3,
        LocalIOError = 4,
        StreamTruncated = 5,
        ProtocolDesync = 6,
        ProtocolError = 7,
        Timeout = 8,
        InvalidCommand = 9,
        InternalError = 10
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    // Connection level failures end the session; everything else is reported
    // to the peer as a command error.
    constexpr bool is_connection_fatal(ErrorCode code) noexcept
    {
        return code == ErrorCode::ConnectionClosed || code == ErrorCode::StreamTruncated ||
               code == ErrorCode::ProtocolDesync || code == ErrorCode::ProtocolError || code == ErrorCode::Timeout;
    }

    class Error : public std::runtime_error
    {
    public:
        Error(ErrorCode code, std::string message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

} // namespace minishare
