#include "minishare/server/session.hpp"

#include <optional>

#include <spdlog/spdlog.h>

#include "minishare/format.hpp"

namespace minishare::server
{

    void Session::handle_upload(const minishare::protocol::Command &command)
    {
        using minishare::protocol::Response;

        const minishare::transfer::TransferDescriptor descriptor{
            .name = command.name,
            .total_bytes = command.size,
            .direction = minishare::transfer::Direction::Inbound,
        };

        if (!minishare::protocol::is_valid_file_name(descriptor.name))
        {
            // The client streams the payload right behind the header; drop it
            // so the next frame read is a command again.
            spdlog::warn("[{}] Rejecting upload '{}', discarding {} payload bytes", peer_, descriptor.name,
                         descriptor.total_bytes);
            minishare::transfer::discard_payload(channel_, descriptor.total_bytes);
            send(Response::failure(std::string(minishare::protocol::kInvalidFilename)));
            return;
        }

        auto staged = services_.store.stage(descriptor.name);
        spdlog::info("[{}] Uploading: {} ({})", peer_, descriptor.name, minishare::format_size(descriptor.total_bytes));

        minishare::transfer::TransferResult result;
        try
        {
            result = minishare::transfer::receive_file(channel_, staged.path(), descriptor.total_bytes,
                                                       progress_logger(descriptor));
        }
        catch (const minishare::transfer::TransferError &ex)
        {
            if (minishare::is_connection_fatal(ex.code()))
            {
                throw;
            }
            send(Response::failure("Upload failed - " + std::string(ex.what())));
            return;
        }
        staged.commit();

        spdlog::info("[{}] Upload completed: {} ({} in {:.2f}s, {}, blake2b {})", peer_, descriptor.name,
                     minishare::format_size(result.bytes), std::chrono::duration<double>(result.elapsed).count(),
                     minishare::format_rate(result.bytes_per_second()), result.digest);
        send(Response::success("uploaded: " + descriptor.name));
    }

    void Session::handle_download(const minishare::protocol::Command &command)
    {
        using minishare::protocol::Response;

        // Open before answering, so a file deleted since the client's last
        // LIST is still reported in-band.
        std::optional<OpenedFile> source;
        try
        {
            source.emplace(services_.store.open(command.name));
        }
        catch (const StoreError &ex)
        {
            spdlog::warn("[{}] Download of '{}' refused: {}", peer_, command.name, ex.what());
            minishare::protocol::write_download_header(channel_, Response::failure(ex.what()));
            return;
        }

        const minishare::transfer::TransferDescriptor descriptor{
            .name = source->entry.name,
            .total_bytes = source->entry.size,
            .direction = minishare::transfer::Direction::Outbound,
        };
        spdlog::info("[{}] Downloading: {} ({})", peer_, descriptor.name, minishare::format_size(descriptor.total_bytes));

        // After the size header the reply can no longer carry an error: a
        // failing source ends the session and the client sees a short stream.
        minishare::protocol::write_download_header(channel_, Response::payload(descriptor.total_bytes));
        minishare::transfer::TransferResult result;
        try
        {
            result = minishare::transfer::send_stream(channel_, source->stream, descriptor.total_bytes,
                                                      progress_logger(descriptor));
        }
        catch (const minishare::transfer::TransferError &ex)
        {
            throw minishare::transfer::TransferError(minishare::ErrorCode::ProtocolDesync,
                                                     "Download of " + descriptor.name + " aborted mid-stream: " +
                                                         ex.what());
        }

        spdlog::info("[{}] Download completed: {} ({} in {:.2f}s, {}, blake2b {})", peer_, descriptor.name,
                     minishare::format_size(result.bytes), std::chrono::duration<double>(result.elapsed).count(),
                     minishare::format_rate(result.bytes_per_second()), result.digest);
    }

} // namespace minishare::server
