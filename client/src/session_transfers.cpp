#include "minishare/client/session.hpp"

#include <filesystem>
#include <string>
#include <system_error>

#include "minishare/format.hpp"

namespace minishare::client
{

    TransferOutcome ClientSession::upload(const std::filesystem::path &local_path,
                                          const minishare::transfer::ProgressCallback &progress)
    {
        using minishare::protocol::Response;

        std::error_code ec;
        const auto status = std::filesystem::status(local_path, ec);
        if (ec || !std::filesystem::exists(status))
        {
            return {Response::failure("File not found: " + local_path.string()), std::nullopt};
        }
        if (!std::filesystem::is_regular_file(status))
        {
            return {Response::failure("Path is not a file: " + local_path.string()), std::nullopt};
        }
        const auto size = std::filesystem::file_size(local_path, ec);
        if (ec)
        {
            return {Response::failure("Cannot read file size: " + ec.message()), std::nullopt};
        }
        if (size == 0)
        {
            return {Response::failure("Cannot upload empty file."), std::nullopt};
        }

        const auto name = local_path.filename().string();
        auto &framed = channel();
        logger_.log("upload", "start ", name, " (", minishare::format_size(size), ")");

        minishare::transfer::TransferResult result;
        try
        {
            minishare::protocol::write_command(framed, minishare::protocol::Command::upload(name, size));
            result = minishare::transfer::send_file(framed, local_path, size, progress);
        }
        catch (const minishare::transfer::TransferError &ex)
        {
            // The server still expects the announced byte count; the stream
            // cannot be resynchronised.
            logger_.log("error", "upload of ", name, " aborted: ", ex.what());
            disconnect();
            throw minishare::transfer::TransferError(ErrorCode::ProtocolDesync,
                                                     "Upload aborted mid-stream: " + std::string(ex.what()));
        }
        catch (const ChannelError &ex)
        {
            logger_.log("error", "connection lost during upload of ", name, ": ", ex.what());
            disconnect();
            throw;
        }

        Response response;
        try
        {
            response = minishare::protocol::read_text_response(framed);
        }
        catch (const ChannelError &ex)
        {
            logger_.log("error", "connection lost awaiting upload reply: ", ex.what());
            disconnect();
            throw;
        }
        logger_.log("upload", name, " -> ", response.ok() ? "ok" : "error", ": ", response.message,
                    " blake2b=", result.digest);
        return {std::move(response), result};
    }

    TransferOutcome ClientSession::download(const std::string &name,
                                            const minishare::transfer::ProgressCallback &progress)
    {
        using minishare::protocol::Response;

        auto &framed = channel();
        Response header;
        try
        {
            minishare::protocol::write_command(framed, minishare::protocol::Command::download(name));
            framed.flush();
            header = minishare::protocol::read_download_header(framed);
        }
        catch (const Error &ex)
        {
            logger_.log("error", "download of ", name, " failed: ", ex.what());
            disconnect();
            throw;
        }
        if (!header.ok())
        {
            logger_.log("download", name, " refused: ", header.message);
            return {std::move(header), std::nullopt};
        }

        const auto target = download_target(name);
        auto partial = target;
        partial += ".part";

        std::error_code ec;
        std::filesystem::create_directories(config_.downloads_dir, ec);
        logger_.log("download", "start ", name, " (", minishare::format_size(header.size), ")");

        minishare::transfer::TransferResult result;
        try
        {
            result = minishare::transfer::receive_file(framed, partial, header.size, progress);
        }
        catch (const minishare::transfer::TransferError &ex)
        {
            logger_.log("error", "download of ", name, " failed: ", ex.what());
            if (minishare::is_connection_fatal(ex.code()))
            {
                disconnect();
                throw;
            }
            return {Response::failure("Download failed - " + std::string(ex.what())), std::nullopt};
        }

        std::filesystem::rename(partial, target, ec);
        if (ec)
        {
            const auto reason = ec.message();
            std::filesystem::remove(partial, ec);
            return {Response::failure("Cannot save " + target.string() + ": " + reason), std::nullopt};
        }
        logger_.log("download", name, " -> ", target.string(), " blake2b=", result.digest);
        return {Response::success("Saved to: " + std::filesystem::absolute(target).string()), result};
    }

} // namespace minishare::client
