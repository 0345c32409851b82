#include "minishare/protocol.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>

#include <spdlog/common.h>
#include <spdlog/fmt/fmt.h>

#include "minishare/channel.hpp"
#include "minishare/format.hpp"

namespace minishare::protocol
{

    namespace
    {

        struct CommandMapping
        {
            CommandKind kind;
            std::string_view label;
        };

        constexpr std::array<CommandMapping, 5> kCommandMappings{{
            {CommandKind::List, "LIST"},
            {CommandKind::Upload, "UPLOAD"},
            {CommandKind::Download, "DOWNLOAD"},
            {CommandKind::Delete, "DELETE"},
            {CommandKind::Quit, "QUIT"},
        }};

        constexpr std::size_t kListingRuleWidth = 40;

        std::string_view trim(std::string_view input) noexcept
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string_view::npos)
            {
                return {};
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return input.substr(begin, end - begin + 1);
        }

        bool equals_ignore_case(std::string_view lhs, std::string_view rhs) noexcept
        {
            return lhs.size() == rhs.size() &&
                   std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b)
                              { return std::toupper(static_cast<unsigned char>(a)) ==
                                       std::toupper(static_cast<unsigned char>(b)); });
        }

    } // namespace

    std::string_view to_string(CommandKind kind) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<CommandKind> command_from_string(std::string_view value) noexcept
    {
        const auto word = trim(value);
        for (const auto &mapping : kCommandMappings)
        {
            if (equals_ignore_case(mapping.label, word))
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    bool is_valid_file_name(std::string_view name) noexcept
    {
        if (name.empty() || name == ".")
        {
            return false;
        }
        if (name.find_first_of("/\\") != std::string_view::npos)
        {
            return false;
        }
        if (name.find('\0') != std::string_view::npos)
        {
            return false;
        }
        return name.find("..") == std::string_view::npos;
    }

    std::string valid_commands_message()
    {
        std::string message = "Unknown command. Available:";
        for (std::size_t i = 0; i < kCommandMappings.size(); ++i)
        {
            message += i == 0 ? " " : ", ";
            message += kCommandMappings[i].label;
        }
        return message;
    }

    std::string format_listing(const std::vector<FileEntry> &entries)
    {
        if (entries.empty())
        {
            return "No files available on the server.";
        }
        const std::string rule(kListingRuleWidth, '=');
        std::string listing = "Files available on server:\n";
        listing += rule + '\n';
        std::uint64_t total = 0;
        for (const auto &entry : entries)
        {
            listing += spdlog::fmt_lib::format("{:<30} {:>10} ({} bytes)\n", entry.name, format_size(entry.size),
                                               entry.size);
            total += entry.size;
        }
        listing += rule + '\n';
        listing += spdlog::fmt_lib::format("Total: {} files, {}", entries.size(), format_size(total));
        return listing;
    }

    std::string encode_text_response(const Response &response)
    {
        if (response.kind == ResponseKind::Error)
        {
            return std::string(kErrorPrefix) + response.message;
        }
        return response.message;
    }

    Response decode_text_response(std::string text)
    {
        if (text.starts_with(kErrorPrefix))
        {
            return Response::failure(text.substr(kErrorPrefix.size()));
        }
        return Response::success(std::move(text));
    }

    Command read_command(FramedChannel &channel)
    {
        auto word = channel.read_text();
        const auto kind = command_from_string(word);
        if (!kind)
        {
            return Command{.kind = CommandKind::Unknown, .raw = std::move(word)};
        }

        Command command{.kind = *kind, .raw = std::move(word)};
        switch (command.kind)
        {
        case CommandKind::Upload:
            command.name = channel.read_text();
            command.size = channel.read_u64();
            break;
        case CommandKind::Download:
        case CommandKind::Delete:
            command.name = channel.read_text();
            break;
        default:
            break;
        }
        return command;
    }

    void write_command(FramedChannel &channel, const Command &command)
    {
        if (command.kind == CommandKind::Unknown)
        {
            channel.write_text(command.raw);
            return;
        }
        channel.write_text(to_string(command.kind));
        switch (command.kind)
        {
        case CommandKind::Upload:
            channel.write_text(command.name);
            channel.write_u64(command.size);
            break;
        case CommandKind::Download:
        case CommandKind::Delete:
            channel.write_text(command.name);
            break;
        default:
            break;
        }
    }

    void write_text_response(FramedChannel &channel, const Response &response)
    {
        if (response.kind == ResponseKind::OkWithPayload)
        {
            throw std::invalid_argument("Payload responses use write_download_header");
        }
        channel.write_text(encode_text_response(response));
        channel.flush();
    }

    Response read_text_response(FramedChannel &channel)
    {
        return decode_text_response(channel.read_text());
    }

    void write_download_header(FramedChannel &channel, const Response &response)
    {
        switch (response.kind)
        {
        case ResponseKind::OkWithPayload:
            channel.write_text(kStatusSuccess);
            channel.write_u64(response.size);
            break;
        case ResponseKind::Error:
            channel.write_text(kStatusError);
            channel.write_text(response.message);
            channel.flush();
            break;
        case ResponseKind::Ok:
            throw std::invalid_argument("Download header requires a size or an error");
        }
    }

    Response read_download_header(FramedChannel &channel)
    {
        const auto status = channel.read_text();
        if (status == kStatusSuccess)
        {
            return Response::payload(channel.read_u64());
        }
        if (status == kStatusError)
        {
            return Response::failure(channel.read_text());
        }
        throw ChannelError(ErrorCode::ProtocolError, "Unexpected download status: " + status);
    }

} // namespace minishare::protocol
