#pragma once

#include <asio/io_context.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "minishare/channel.hpp"
#include "minishare/client/config.hpp"
#include "minishare/client/logger.hpp"
#include "minishare/protocol.hpp"
#include "minishare/transfer.hpp"

namespace minishare::client
{

    // Reply to a transfer command. transfer is set only when file bytes
    // actually moved.
    struct TransferOutcome
    {
        minishare::protocol::Response response;
        std::optional<minishare::transfer::TransferResult> transfer;
    };

    // Blocking client side of the exchange protocol. A ChannelError or a
    // connection-fatal TransferError leaves the session disconnected; every
    // other failure is reported through the returned Response.
    class ClientSession
    {
    public:
        ClientSession(ClientConfig config, Logger logger);
        ~ClientSession();

        ClientSession(const ClientSession &) = delete;
        ClientSession &operator=(const ClientSession &) = delete;

        void connect();
        bool connected() const noexcept;
        void disconnect() noexcept;

        minishare::protocol::Response list();
        minishare::protocol::Response remove(const std::string &name);
        minishare::protocol::Response quit();

        // Refuses missing, non-regular and empty files without contacting
        // the server. The remote name is the file name of local_path.
        TransferOutcome upload(const std::filesystem::path &local_path,
                               const minishare::transfer::ProgressCallback &progress = {});

        // Writes to download_target(name), replacing an existing file only
        // once the whole payload has arrived.
        TransferOutcome download(const std::string &name,
                                 const minishare::transfer::ProgressCallback &progress = {});

        std::filesystem::path download_target(const std::string &name) const;

        const ClientConfig &config() const noexcept { return config_; }

    private:
        FramedChannel &channel();
        minishare::protocol::Response round_trip(const minishare::protocol::Command &command);

        ClientConfig config_;
        Logger logger_;
        asio::io_context io_context_;
        std::unique_ptr<FramedChannel> channel_;
    };

} // namespace minishare::client
