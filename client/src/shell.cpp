#include "minishare/client/shell.hpp"

#include <cctype>
#include <chrono>
#include <filesystem>
#include <istream>
#include <ostream>
#include <string>

#include <spdlog/common.h>
#include <spdlog/fmt/fmt.h>

#include "minishare/format.hpp"

namespace minishare::client
{

    namespace
    {

        constexpr std::chrono::milliseconds kProgressInterval{100};

        std::string trim(const std::string &input)
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
            {
                return "";
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return input.substr(begin, end - begin + 1);
        }

        std::string to_lower(std::string value)
        {
            for (auto &ch : value)
            {
                ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
            }
            return value;
        }

        // The first token is the command; the rest of the line is kept whole
        // so that paths containing spaces survive.
        std::vector<std::string> split_command(const std::string &line)
        {
            std::vector<std::string> tokens;
            const auto space = line.find_first_of(" \t");
            tokens.push_back(line.substr(0, space));
            if (space != std::string::npos)
            {
                auto rest = trim(line.substr(space));
                if (!rest.empty())
                {
                    tokens.push_back(std::move(rest));
                }
            }
            return tokens;
        }

        std::string separator()
        {
            return std::string(50, '=');
        }

    } // namespace

    Shell::Shell(ClientSession &session, std::istream &input, std::ostream &output)
        : session_(session),
          input_(input),
          output_(output) {}

    int Shell::run()
    {
        print_banner();
        print_menu();
        while (session_.connected())
        {
            output_ << "\n> " << std::flush;
            std::string line;
            if (!std::getline(input_, line))
            {
                output_ << std::endl;
                handle_quit();
                return 0;
            }
            line = trim(line);
            if (line.empty())
            {
                continue;
            }

            try
            {
                if (execute(split_command(line)) == Outcome::Quit)
                {
                    return 0;
                }
            }
            catch (const Error &ex)
            {
                output_ << "Connection lost: " << ex.what() << std::endl;
                return 1;
            }
        }
        output_ << "Connection closed by server." << std::endl;
        return 1;
    }

    Shell::Outcome Shell::execute(const std::vector<std::string> &tokens)
    {
        const auto command = to_lower(tokens[0]);
        const std::vector<std::string> args(tokens.begin() + 1, tokens.end());

        if (command == "1" || command == "list")
        {
            return handle_list();
        }
        if (command == "2" || command == "upload")
        {
            return handle_upload(args);
        }
        if (command == "3" || command == "download")
        {
            return handle_download(args);
        }
        if (command == "4" || command == "delete")
        {
            return handle_delete(args);
        }
        if (command == "5" || command == "help")
        {
            print_menu();
            return Outcome::Continue;
        }
        if (command == "6" || command == "quit" || command == "exit")
        {
            return handle_quit();
        }
        output_ << "Invalid choice. Please enter a command or a number between 1-6." << std::endl;
        output_ << "Type 'help' to show the menu again." << std::endl;
        return Outcome::Continue;
    }

    Shell::Outcome Shell::handle_list()
    {
        output_ << "\n";
        print_response(session_.list());
        return Outcome::Continue;
    }

    Shell::Outcome Shell::handle_upload(const std::vector<std::string> &args)
    {
        const auto argument = argument_or_prompt(args, "Enter the full path of the file to upload: ");
        if (!argument)
        {
            output_ << "File path cannot be empty." << std::endl;
            return Outcome::Continue;
        }
        const std::filesystem::path path(*argument);

        std::error_code ec;
        if (std::filesystem::is_regular_file(path, ec))
        {
            const auto size = std::filesystem::file_size(path, ec);
            if (!ec && size > 0)
            {
                output_ << "File: " << path.filename().string() << "\n"
                        << "Size: " << minishare::format_size(size) << std::endl;
                if (!confirm("Proceed with upload?"))
                {
                    output_ << "Upload cancelled." << std::endl;
                    return Outcome::Continue;
                }
                output_ << "\nUploading " << path.filename().string() << "..." << std::endl;
            }
        }

        const auto outcome = session_.upload(path, progress_printer());
        if (outcome.transfer)
        {
            output_ << std::endl;
            print_transfer_summary(*outcome.transfer);
            output_ << "Server response: ";
        }
        print_response(outcome.response);
        return Outcome::Continue;
    }

    Shell::Outcome Shell::handle_download(const std::vector<std::string> &args)
    {
        const auto name = argument_or_prompt(args, "Enter the name of the file to download: ");
        if (!name)
        {
            output_ << "Filename cannot be empty." << std::endl;
            return Outcome::Continue;
        }

        std::error_code ec;
        if (std::filesystem::exists(session_.download_target(*name), ec) &&
            !confirm("File already exists locally. Overwrite?"))
        {
            output_ << "Download cancelled." << std::endl;
            return Outcome::Continue;
        }

        output_ << "\nDownloading " << *name << "..." << std::endl;
        const auto outcome = session_.download(*name, progress_printer());
        if (!outcome.transfer)
        {
            output_ << "Download failed: " << outcome.response.message << std::endl;
            return Outcome::Continue;
        }
        output_ << std::endl;
        print_transfer_summary(*outcome.transfer);
        output_ << "File downloaded successfully!" << std::endl;
        print_response(outcome.response);
        return Outcome::Continue;
    }

    Shell::Outcome Shell::handle_delete(const std::vector<std::string> &args)
    {
        const auto name = argument_or_prompt(args, "Enter the name of the file to delete: ");
        if (!name)
        {
            output_ << "Filename cannot be empty." << std::endl;
            return Outcome::Continue;
        }
        if (!confirm("Are you sure you want to delete '" + *name + "' from the server?"))
        {
            output_ << "Delete cancelled." << std::endl;
            return Outcome::Continue;
        }
        output_ << "Server response: ";
        print_response(session_.remove(*name));
        return Outcome::Continue;
    }

    Shell::Outcome Shell::handle_quit()
    {
        if (session_.connected())
        {
            print_response(session_.quit());
        }
        output_ << "Goodbye!" << std::endl;
        return Outcome::Quit;
    }

    std::optional<std::string> Shell::argument_or_prompt(const std::vector<std::string> &args,
                                                         const std::string &prompt)
    {
        if (!args.empty())
        {
            return args.front();
        }
        output_ << prompt << std::flush;
        std::string line;
        if (!std::getline(input_, line))
        {
            return std::nullopt;
        }
        line = trim(line);
        if (line.empty())
        {
            return std::nullopt;
        }
        return line;
    }

    bool Shell::confirm(const std::string &question)
    {
        output_ << question << " (y/N): " << std::flush;
        std::string answer;
        if (!std::getline(input_, answer))
        {
            return false;
        }
        answer = to_lower(trim(answer));
        return answer == "y" || answer == "yes";
    }

    void Shell::print_banner() const
    {
        const auto &config = session_.config();
        output_ << "\n"
                << separator() << "\n"
                << "         FILE SHARING CLIENT\n"
                << separator() << "\n"
                << "Connected to: " << config.host << ":" << config.port << "\n"
                << "Download folder: " << std::filesystem::absolute(config.downloads_dir).string() << "\n"
                << separator() << std::endl;
    }

    void Shell::print_menu() const
    {
        output_ << "\nAvailable commands:\n"
                << "  1. list               List files on server\n"
                << "  2. upload <path>      Upload file to server\n"
                << "  3. download <name>    Download file from server\n"
                << "  4. delete <name>      Delete file from server\n"
                << "  5. help               Show this menu\n"
                << "  6. quit               Disconnect and exit" << std::endl;
    }

    void Shell::print_response(const minishare::protocol::Response &response) const
    {
        output_ << minishare::protocol::encode_text_response(response) << std::endl;
    }

    void Shell::print_transfer_summary(const minishare::transfer::TransferResult &result) const
    {
        output_ << "Transferred " << minishare::format_size(result.bytes) << " in "
                << spdlog::fmt_lib::format("{:.2f}", std::chrono::duration<double>(result.elapsed).count()) << "s ("
                << minishare::format_rate(result.bytes_per_second()) << ")\n"
                << "Checksum (BLAKE2b): " << result.digest << std::endl;
    }

    minishare::transfer::ProgressCallback Shell::progress_printer() const
    {
        auto &output = output_;
        return minishare::transfer::throttle(
            [&output](const minishare::transfer::TransferProgress &progress)
            {
                output << spdlog::fmt_lib::format("\rProgress: {:3.0f}% ({} / {}, {})", progress.percent(),
                                                  minishare::format_size(progress.bytes_transferred),
                                                  minishare::format_size(progress.total_bytes),
                                                  minishare::format_rate(progress.bytes_per_second()))
                       << std::flush;
            },
            kProgressInterval);
    }

} // namespace minishare::client
