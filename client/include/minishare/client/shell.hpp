#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "minishare/client/session.hpp"

namespace minishare::client
{

    // Line oriented front end over a connected ClientSession. Accepts the
    // command words list, upload, download, delete, help and quit or their
    // menu numbers 1-6.
    class Shell
    {
    public:
        Shell(ClientSession &session, std::istream &input, std::ostream &output);

        // Returns the process exit status once the user quits, input ends or
        // the connection is lost.
        int run();

    private:
        enum class Outcome
        {
            Continue,
            Quit
        };

        Outcome execute(const std::vector<std::string> &tokens);
        Outcome handle_list();
        Outcome handle_upload(const std::vector<std::string> &args);
        Outcome handle_download(const std::vector<std::string> &args);
        Outcome handle_delete(const std::vector<std::string> &args);
        Outcome handle_quit();

        std::optional<std::string> argument_or_prompt(const std::vector<std::string> &args, const std::string &prompt);
        bool confirm(const std::string &question);
        void print_banner() const;
        void print_menu() const;
        void print_response(const minishare::protocol::Response &response) const;
        void print_transfer_summary(const minishare::transfer::TransferResult &result) const;
        minishare::transfer::ProgressCallback progress_printer() const;

        ClientSession &session_;
        std::istream &input_;
        std::ostream &output_;
    };

} // namespace minishare::client
