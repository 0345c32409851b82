/**
 * MiniShare - Chunked streaming of file contents over a framed channel.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <string>
#include <string_view>

#include "minishare/error_codes.hpp"

namespace minishare
{
    class FramedChannel;
}

namespace minishare::transfer
{

    constexpr std::size_t kChunkSize = 4096;

    enum class Direction : std::uint8_t
    {
        Inbound,
        Outbound
    };

    std::string_view to_string(Direction direction) noexcept;

    struct TransferDescriptor
    {
        std::string name;
        std::uint64_t total_bytes{};
        Direction direction{Direction::Inbound};
    };

    struct TransferProgress
    {
        std::uint64_t bytes_transferred{};
        std::uint64_t total_bytes{};
        std::chrono::steady_clock::duration elapsed{};

        double percent() const noexcept;
        double bytes_per_second() const noexcept;
        bool complete() const noexcept { return bytes_transferred >= total_bytes; }
    };

    using ProgressCallback = std::function<void(const TransferProgress &)>;

    struct TransferResult
    {
        std::uint64_t bytes{};
        std::chrono::steady_clock::duration elapsed{};
        std::string digest;

        double bytes_per_second() const noexcept;
    };

    class TransferError : public Error
    {
    public:
        using Error::Error;
    };

    // Streams exactly total_bytes of source to the channel and flushes it.
    // Throws TransferError(LocalIOError) if the file cannot be opened or ends
    // early; the peer then sees a short stream. Channel failures propagate as
    // ChannelError.
    TransferResult send_file(FramedChannel &channel, const std::filesystem::path &source, std::uint64_t total_bytes,
                             const ProgressCallback &report_progress = {});

    // Same as send_file for a source the caller has already opened.
    TransferResult send_stream(FramedChannel &channel, std::istream &source, std::uint64_t total_bytes,
                               const ProgressCallback &report_progress = {});

    // Reads exactly total_bytes from the channel into destination. Throws
    // TransferError(StreamTruncated) when the channel fails first, and
    // TransferError(LocalIOError) when the destination cannot be written, in
    // which case the remaining payload is still consumed. The destination is
    // removed on every failure.
    TransferResult receive_file(FramedChannel &channel, const std::filesystem::path &destination,
                                std::uint64_t total_bytes, const ProgressCallback &report_progress = {});

    // Consumes and drops a payload the receiver does not want.
    void discard_payload(FramedChannel &channel, std::uint64_t total_bytes);

    // Forwards at most one update per interval; the final update always passes.
    ProgressCallback throttle(ProgressCallback callback, std::chrono::milliseconds interval);

} // namespace minishare::transfer
