/**
 * MiniShare - Command and response shapes of the exchange protocol.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace minishare
{
    class FramedChannel;
}

namespace minishare::protocol
{

    enum class CommandKind : std::uint8_t
    {
        List,
        Upload,
        Download,
        Delete,
        Quit,
        Unknown
    };

    std::string_view to_string(CommandKind kind) noexcept;

    // Matches the command word case-insensitively, ignoring surrounding whitespace.
    std::optional<CommandKind> command_from_string(std::string_view value) noexcept;

    struct Command
    {
        CommandKind kind{CommandKind::Unknown};
        std::string name{};
        std::uint64_t size{};
        std::string raw{};

        static Command list() { return Command{.kind = CommandKind::List}; }
        static Command upload(std::string name, std::uint64_t size)
        {
            return Command{.kind = CommandKind::Upload, .name = std::move(name), .size = size};
        }
        static Command download(std::string name)
        {
            return Command{.kind = CommandKind::Download, .name = std::move(name)};
        }
        static Command remove(std::string name)
        {
            return Command{.kind = CommandKind::Delete, .name = std::move(name)};
        }
        static Command quit() { return Command{.kind = CommandKind::Quit}; }
    };

    enum class ResponseKind : std::uint8_t
    {
        Ok,
        OkWithPayload,
        Error
    };

    struct Response
    {
        ResponseKind kind{ResponseKind::Ok};
        std::string message{};
        std::uint64_t size{};

        bool ok() const noexcept { return kind != ResponseKind::Error; }

        static Response success(std::string message)
        {
            return Response{.kind = ResponseKind::Ok, .message = std::move(message)};
        }
        static Response failure(std::string message)
        {
            return Response{.kind = ResponseKind::Error, .message = std::move(message)};
        }
        static Response payload(std::uint64_t size)
        {
            return Response{.kind = ResponseKind::OkWithPayload, .size = size};
        }
    };

    struct FileEntry
    {
        std::string name;
        std::uint64_t size{};
    };

    inline constexpr std::string_view kErrorPrefix = "ERROR: ";
    inline constexpr std::string_view kStatusSuccess = "SUCCESS";
    inline constexpr std::string_view kStatusError = "ERROR";
    inline constexpr std::string_view kInvalidFilename = "Invalid filename";

    // Base names only: no '/', '\\' or "..", not empty and not ".".
    bool is_valid_file_name(std::string_view name) noexcept;

    std::string valid_commands_message();

    std::string format_listing(const std::vector<FileEntry> &entries);

    // Text responses carry Ok messages verbatim and errors behind kErrorPrefix.
    std::string encode_text_response(const Response &response);
    Response decode_text_response(std::string text);

    // Reads the command word and the operands it announces. Unknown words are
    // returned with kind Unknown and nothing further consumed.
    Command read_command(FramedChannel &channel);

    // Buffers the command frames; the caller flushes (after the payload for UPLOAD).
    void write_command(FramedChannel &channel, const Command &command);

    void write_text_response(FramedChannel &channel, const Response &response);
    Response read_text_response(FramedChannel &channel);

    // DOWNLOAD reply header: SUCCESS + size, or ERROR + reason.
    void write_download_header(FramedChannel &channel, const Response &response);
    Response read_download_header(FramedChannel &channel);

} // namespace minishare::protocol
