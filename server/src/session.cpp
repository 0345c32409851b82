#include "minishare/server/session.hpp"

#include <spdlog/spdlog.h>

#include "minishare/error_codes.hpp"
#include "minishare/format.hpp"

namespace minishare::server
{

    namespace
    {
        constexpr auto kFarewell = "Goodbye! Connection closed.";
        constexpr auto kProgressInterval = std::chrono::seconds(1);
    } // namespace

    std::string_view to_string(SessionState state) noexcept
    {
        switch (state)
        {
        case SessionState::Active:
            return "active";
        case SessionState::Closing:
            return "closing";
        case SessionState::Closed:
            return "closed";
        }
        return "unknown";
    }

    Session::Session(FramedChannel::Socket socket, std::string peer, SessionServices services)
        : channel_(std::move(socket), services.read_timeout), peer_(std::move(peer)), services_(services) {}

    Session::~Session()
    {
        close();
    }

    void Session::run()
    {
        spdlog::info("[{}] Session started", peer_);
        try
        {
            while (state_ == SessionState::Active)
            {
                awaiting_command_ = true;
                if (stop_requested_)
                {
                    spdlog::info("[{}] Server shutting down, closing session", peer_);
                    break;
                }
                const auto command = minishare::protocol::read_command(channel_);
                awaiting_command_ = false;
                dispatch(command);
            }
        }
        catch (const ChannelError &ex)
        {
            if (stop_requested_)
            {
                spdlog::info("[{}] Session stopped by server shutdown", peer_);
            }
            else if (ex.code() == minishare::ErrorCode::ConnectionClosed)
            {
                spdlog::info("[{}] Client disconnected: {}", peer_, ex.what());
            }
            else
            {
                spdlog::warn("[{}] Connection error ({}): {}", peer_, minishare::to_string(ex.code()), ex.what());
            }
        }
        catch (const minishare::transfer::TransferError &ex)
        {
            spdlog::warn("[{}] Transfer aborted ({}), closing connection: {}", peer_,
                         minishare::to_string(ex.code()), ex.what());
        }
        catch (const std::exception &ex)
        {
            spdlog::error("[{}] Session failed: {}", peer_, ex.what());
        }
        close();
    }

    void Session::request_stop() noexcept
    {
        stop_requested_ = true;
        if (awaiting_command_)
        {
            channel_.interrupt();
        }
    }

    void Session::interrupt() noexcept
    {
        stop_requested_ = true;
        channel_.interrupt();
    }

    void Session::dispatch(const minishare::protocol::Command &command)
    {
        using minishare::protocol::CommandKind;
        using minishare::protocol::Response;

        spdlog::info("[{}] Command: {}{}", peer_, minishare::protocol::to_string(command.kind),
                     command.name.empty() ? std::string{} : " " + command.name);
        try
        {
            switch (command.kind)
            {
            case CommandKind::List:
                handle_list();
                break;
            case CommandKind::Upload:
                handle_upload(command);
                break;
            case CommandKind::Download:
                handle_download(command);
                break;
            case CommandKind::Delete:
                handle_delete(command);
                break;
            case CommandKind::Quit:
                handle_quit();
                break;
            case CommandKind::Unknown:
                handle_unknown(command);
                break;
            }
        }
        catch (const ChannelError &)
        {
            throw;
        }
        catch (const StoreError &ex)
        {
            send(Response::failure(ex.what()));
        }
        catch (const minishare::transfer::TransferError &ex)
        {
            if (minishare::is_connection_fatal(ex.code()))
            {
                throw;
            }
            send(Response::failure(ex.what()));
        }
        catch (const std::exception &ex)
        {
            spdlog::error("[{}] Internal error: {}", peer_, ex.what());
            send(Response::failure(std::string(minishare::to_string(minishare::ErrorCode::InternalError)) + ": " +
                                   ex.what()));
        }
    }

    void Session::send(const minishare::protocol::Response &response)
    {
        if (!response.ok())
        {
            spdlog::warn("[{}] Error response: {}", peer_, response.message);
        }
        minishare::protocol::write_text_response(channel_, response);
    }

    void Session::close() noexcept
    {
        if (state_ == SessionState::Closed)
        {
            return;
        }
        state_ = SessionState::Closing;
        channel_.close();
        state_ = SessionState::Closed;
        spdlog::debug("[{}] Connection closed ({} bytes in, {} bytes out)", peer_, channel_.bytes_read(),
                      channel_.bytes_written());
    }

    void Session::handle_quit()
    {
        send(minishare::protocol::Response::success(kFarewell));
        state_ = SessionState::Closing;
        spdlog::info("[{}] Client disconnected gracefully", peer_);
    }

    void Session::handle_unknown(const minishare::protocol::Command &command)
    {
        spdlog::warn("[{}] Unknown command '{}'", peer_, command.raw);
        send(minishare::protocol::Response::failure(minishare::protocol::valid_commands_message()));
    }

    minishare::transfer::ProgressCallback Session::progress_logger(
        const minishare::transfer::TransferDescriptor &descriptor) const
    {
        const auto label = descriptor.direction == minishare::transfer::Direction::Inbound ? "Upload" : "Download";
        return minishare::transfer::throttle(
            [peer = peer_, label, name = descriptor.name](const minishare::transfer::TransferProgress &progress)
            {
                if (progress.complete())
                {
                    return;
                }
                spdlog::info("[{}] {} progress {}: {:.0f}% ({} / {}, {})", peer, label, name, progress.percent(),
                             minishare::format_size(progress.bytes_transferred),
                             minishare::format_size(progress.total_bytes),
                             minishare::format_rate(progress.bytes_per_second()));
            },
            kProgressInterval);
    }

} // namespace minishare::server
