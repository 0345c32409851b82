/**
 * MiniShare - Blocking framed channel over a connected stream socket.
 */
#pragma once

#include <asio/generic/stream_protocol.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "minishare/error_codes.hpp"

namespace minishare
{

    class ChannelError : public Error
    {
    public:
        using Error::Error;
    };

    // Owns the socket of one peer connection. Reads block the calling thread
    // until the requested amount is buffered; writes are buffered until
    // flush(). Only interrupt() and close() may be called from another thread.
    class FramedChannel
    {
    public:
        using Socket = asio::generic::stream_protocol::socket;

        explicit FramedChannel(Socket socket,
                               std::optional<std::chrono::milliseconds> read_timeout = std::nullopt);
        ~FramedChannel();

        FramedChannel(const FramedChannel &) = delete;
        FramedChannel &operator=(const FramedChannel &) = delete;

        void write_text(std::string_view text);
        std::string read_text();

        void write_u64(std::uint64_t value);
        std::uint64_t read_u64();

        void write_bytes(std::span<const std::byte> data);
        void read_exactly(std::span<std::byte> data);

        void flush();

        void close() noexcept;

        // Shuts the socket down so that a read or write blocked on another
        // thread fails with ConnectionClosed. The descriptor stays owned by
        // the channel until close().
        void interrupt() noexcept;

        bool is_open() const noexcept;

        std::uint64_t bytes_read() const noexcept { return bytes_read_; }
        std::uint64_t bytes_written() const noexcept { return bytes_written_; }

    private:
        std::size_t buffered() const noexcept { return input_end_ - input_begin_; }
        void fill_input();
        void wait_readable();

        Socket socket_;
        std::optional<std::chrono::milliseconds> read_timeout_;

        std::vector<std::uint8_t> input_;
        std::size_t input_begin_{0};
        std::size_t input_end_{0};
        std::vector<std::uint8_t> output_;

        std::uint64_t bytes_read_{0};
        std::uint64_t bytes_written_{0};

        mutable std::mutex close_mutex_;
        bool closed_{false};
    };

} // namespace minishare
