#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>

#include "minishare/server/config.hpp"
#include "minishare/server/file_store.hpp"
#include "minishare/server/session_registry.hpp"

namespace minishare::server
{

    class Session;

    // Accepts connections and runs one Session per connection on a fixed
    // size worker pool. Connections beyond the pool size wait in its queue.
    class Server
    {
    public:
        explicit Server(ServerConfig config);
        ~Server();

        Server(const Server &) = delete;
        Server &operator=(const Server &) = delete;

        // Blocks until the server has shut down (signal or shutdown()).
        void run();

        // Stops accepting, lets sessions finish their current command for up
        // to grace_period, then interrupts the rest. Safe from any thread;
        // later calls wait for the first one to complete.
        void shutdown(std::chrono::milliseconds grace_period);

        std::uint16_t port() const noexcept { return port_; }
        const FileStore &store() const noexcept { return store_; }
        std::size_t active_sessions() const { return registry_.size(); }

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void stop_accepting();
        void run_session(const std::shared_ptr<Session> &session);

        ServerConfig config_;
        FileStore store_;

        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;
        std::uint16_t port_{0};

        SessionRegistry registry_;
        asio::thread_pool workers_;

        std::atomic<bool> stopping_{false};
        std::mutex shutdown_mutex_;
        bool stopped_{false};
    };

} // namespace minishare::server
