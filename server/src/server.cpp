#include "minishare/server/server.hpp"

#include <asio/ip/address.hpp>
#include <asio/post.hpp>

#include <csignal>
#include <string>

#include <spdlog/spdlog.h>

#include "minishare/channel.hpp"
#include "minishare/server/session.hpp"

namespace minishare::server
{

    namespace
    {

        std::string describe_peer(const asio::ip::tcp::socket &socket)
        {
            std::error_code ec;
            const auto endpoint = socket.remote_endpoint(ec);
            if (ec)
            {
                return "unknown";
            }
            return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
        }

    } // namespace

    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          store_(config_.root),
          acceptor_(io_context_),
          signals_(io_context_),
          workers_(config_.max_sessions == 0 ? 1 : config_.max_sessions)
    {
        const auto address = asio::ip::make_address(config_.address);
        const asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();
        port_ = acceptor_.local_endpoint().port();

        spdlog::info("Listening on {}:{} with shared folder {}", config_.address, port_,
                     std::filesystem::absolute(config_.root).string());
        spdlog::info("Max concurrent clients: {}", config_.max_sessions);

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int signal_number)
                            {
                                if (!ec)
                                {
                                    spdlog::info("Signal {} received, shutting down", signal_number);
                                    stopping_ = true;
                                    stop_accepting();
                                } });
    }

    Server::~Server()
    {
        shutdown(std::chrono::milliseconds{0});
    }

    void Server::run()
    {
        if (!stopping_)
        {
            accept_next();
            spdlog::info("Server is ready to accept connections");
            io_context_.run();
        }
        shutdown(config_.grace_period);
    }

    void Server::shutdown(std::chrono::milliseconds grace_period)
    {
        std::lock_guard lock(shutdown_mutex_);
        if (stopped_)
        {
            return;
        }
        stopping_ = true;
        asio::post(io_context_, [this]
                   { stop_accepting(); });

        registry_.request_stop_all();
        if (!registry_.wait_until_empty(grace_period))
        {
            spdlog::warn("{} sessions still active after {} ms, terminating them", registry_.size(),
                         grace_period.count());
            registry_.interrupt_all();
            workers_.stop();
        }
        workers_.join();
        stopped_ = true;
        spdlog::info("Server stopped");
    }

    void Server::accept_next()
    {
        acceptor_.async_accept([this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(std::error_code ec, asio::ip::tcp::socket socket)
    {
        if (!ec)
        {
            auto peer = describe_peer(socket);
            std::error_code option_ec;
            socket.set_option(asio::ip::tcp::no_delay(true), option_ec);

            auto session = std::make_shared<Session>(FramedChannel::Socket(std::move(socket)), peer,
                                                     SessionServices{store_, config_.read_timeout});
            if (stopping_ || !registry_.try_register(session))
            {
                spdlog::info("Refusing connection from {} during shutdown", peer);
            }
            else
            {
                spdlog::info("New client connected: {} ({} active)", peer, registry_.size());
                asio::post(workers_, [this, session]
                           { run_session(session); });
            }
        }
        if (!ec || ec == asio::error::operation_aborted)
        {
            if (acceptor_.is_open())
            {
                accept_next();
            }
        }
        else
        {
            spdlog::error("Error accepting client connection: {}", ec.message());
            if (acceptor_.is_open())
            {
                accept_next();
            }
        }
    }

    void Server::stop_accepting()
    {
        std::error_code ec;
        acceptor_.close(ec);
        signals_.cancel(ec);
    }

    void Server::run_session(const std::shared_ptr<Session> &session)
    {
        session->run();
        registry_.unregister(session.get());
    }

} // namespace minishare::server
