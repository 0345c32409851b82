#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "minishare/channel.hpp"
#include "minishare/protocol.hpp"
#include "minishare/server/file_store.hpp"
#include "minishare/transfer.hpp"

namespace minishare::server
{

    enum class SessionState : std::uint8_t
    {
        Active,
        Closing,
        Closed
    };

    std::string_view to_string(SessionState state) noexcept;

    struct SessionServices
    {
        FileStore &store;
        std::optional<std::chrono::milliseconds> read_timeout;
    };

    // Serves one client connection on the calling thread: read a command,
    // dispatch it, respond, until QUIT, a connection failure or a stop request.
    class Session
    {
    public:
        Session(FramedChannel::Socket socket, std::string peer, SessionServices services);
        ~Session();

        Session(const Session &) = delete;
        Session &operator=(const Session &) = delete;

        void run();

        // Safe from any thread. The current command completes; an idle
        // session is woken and closes.
        void request_stop() noexcept;

        // Safe from any thread. Fails any blocked I/O of the session.
        void interrupt() noexcept;

        SessionState state() const noexcept { return state_.load(); }
        const std::string &peer() const noexcept { return peer_; }

    private:
        void dispatch(const minishare::protocol::Command &command);
        void send(const minishare::protocol::Response &response);
        void close() noexcept;

        void handle_list();
        void handle_delete(const minishare::protocol::Command &command);
        void handle_upload(const minishare::protocol::Command &command);
        void handle_download(const minishare::protocol::Command &command);
        void handle_quit();
        void handle_unknown(const minishare::protocol::Command &command);

        minishare::transfer::ProgressCallback progress_logger(
            const minishare::transfer::TransferDescriptor &descriptor) const;

        FramedChannel channel_;
        std::string peer_;
        SessionServices services_;

        // Written by the session's own thread only.
        std::atomic<SessionState> state_{SessionState::Active};
        std::atomic<bool> stop_requested_{false};
        std::atomic<bool> awaiting_command_{false};
    };

} // namespace minishare::server
