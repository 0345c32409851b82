#include "minishare/client/session.hpp"

#include <asio/connect.hpp>
#include <asio/ip/tcp.hpp>

#include <stdexcept>
#include <string>

namespace minishare::client
{

    ClientSession::ClientSession(ClientConfig config, Logger logger)
        : config_(std::move(config)),
          logger_(std::move(logger)) {}

    ClientSession::~ClientSession()
    {
        disconnect();
    }

    void ClientSession::connect()
    {
        asio::ip::tcp::resolver resolver(io_context_);
        const auto results = resolver.resolve(config_.host, std::to_string(config_.port));
        asio::ip::tcp::socket socket(io_context_);
        asio::connect(socket, results);
        socket.set_option(asio::ip::tcp::no_delay(true));
        channel_ = std::make_unique<FramedChannel>(FramedChannel::Socket(std::move(socket)));
        logger_.log("info", "connected to ", config_.host, ':', config_.port);
    }

    bool ClientSession::connected() const noexcept
    {
        return channel_ && channel_->is_open();
    }

    void ClientSession::disconnect() noexcept
    {
        if (channel_)
        {
            channel_->close();
        }
    }

    FramedChannel &ClientSession::channel()
    {
        if (!connected())
        {
            throw ChannelError(ErrorCode::ConnectionClosed, "Not connected to server");
        }
        return *channel_;
    }

    minishare::protocol::Response ClientSession::round_trip(const minishare::protocol::Command &command)
    {
        auto &framed = channel();
        try
        {
            minishare::protocol::write_command(framed, command);
            framed.flush();
            auto response = minishare::protocol::read_text_response(framed);
            logger_.log("rpc", minishare::protocol::to_string(command.kind), ' ', command.name, " -> ",
                        response.ok() ? "ok" : "error", ": ", response.message);
            return response;
        }
        catch (const ChannelError &ex)
        {
            logger_.log("error", "connection lost during ", minishare::protocol::to_string(command.kind), ": ",
                        ex.what());
            disconnect();
            throw;
        }
    }

    minishare::protocol::Response ClientSession::list()
    {
        return round_trip(minishare::protocol::Command::list());
    }

    minishare::protocol::Response ClientSession::remove(const std::string &name)
    {
        return round_trip(minishare::protocol::Command::remove(name));
    }

    minishare::protocol::Response ClientSession::quit()
    {
        auto response = round_trip(minishare::protocol::Command::quit());
        disconnect();
        logger_.log("info", "disconnected");
        return response;
    }

    std::filesystem::path ClientSession::download_target(const std::string &name) const
    {
        return config_.downloads_dir / std::filesystem::path(name).filename();
    }

} // namespace minishare::client
