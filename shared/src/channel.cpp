#include "minishare/channel.hpp"

#include <asio/buffer.hpp>
#include <asio/error.hpp>
#include <asio/write.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <limits>

#include <poll.h>
#include <sys/socket.h>

#include "minishare/framing.hpp"

namespace minishare
{

    namespace
    {
        constexpr std::size_t kInputBufferSize = 64 * 1024;
        constexpr std::size_t kFlushThreshold = 64 * 1024;
    } // namespace

    FramedChannel::FramedChannel(Socket socket, std::optional<std::chrono::milliseconds> read_timeout)
        : socket_(std::move(socket)), read_timeout_(read_timeout), input_(kInputBufferSize)
    {
        output_.reserve(kFlushThreshold);
    }

    FramedChannel::~FramedChannel()
    {
        close();
    }

    void FramedChannel::write_text(std::string_view text)
    {
        if (text.size() > protocol::kMaxTextFrameSize)
        {
            throw ChannelError(ErrorCode::ProtocolError, "Text frame exceeds maximum size");
        }
        const auto frame = protocol::encode_text_frame(text);
        output_.insert(output_.end(), frame.begin(), frame.end());
        if (output_.size() >= kFlushThreshold)
        {
            flush();
        }
    }

    std::string FramedChannel::read_text()
    {
        std::array<std::uint8_t, protocol::kTextHeaderSize> header{};
        read_exactly(std::as_writable_bytes(std::span(header)));
        const auto size = protocol::read_u32_be(header);
        if (size > protocol::kMaxTextFrameSize)
        {
            throw ChannelError(ErrorCode::ProtocolError,
                               "Malformed frame: text length " + std::to_string(size) + " exceeds limit");
        }
        std::string text(size, '\0');
        read_exactly(std::as_writable_bytes(std::span(text.data(), text.size())));
        return text;
    }

    void FramedChannel::write_u64(std::uint64_t value)
    {
        std::array<std::uint8_t, protocol::kNumericFrameSize> frame{};
        protocol::write_u64_be(value, frame);
        output_.insert(output_.end(), frame.begin(), frame.end());
    }

    std::uint64_t FramedChannel::read_u64()
    {
        std::array<std::uint8_t, protocol::kNumericFrameSize> frame{};
        read_exactly(std::as_writable_bytes(std::span(frame)));
        return protocol::read_u64_be(frame);
    }

    void FramedChannel::write_bytes(std::span<const std::byte> data)
    {
        const auto *begin = reinterpret_cast<const std::uint8_t *>(data.data());
        output_.insert(output_.end(), begin, begin + data.size());
        if (output_.size() >= kFlushThreshold)
        {
            flush();
        }
    }

    void FramedChannel::read_exactly(std::span<std::byte> data)
    {
        std::size_t copied = 0;
        while (copied < data.size())
        {
            if (buffered() == 0)
            {
                fill_input();
            }
            const auto count = std::min(buffered(), data.size() - copied);
            std::memcpy(data.data() + copied, input_.data() + input_begin_, count);
            input_begin_ += count;
            copied += count;
        }
    }

    void FramedChannel::flush()
    {
        if (output_.empty())
        {
            return;
        }
        std::error_code ec;
        const auto written = asio::write(socket_, asio::buffer(output_), ec);
        bytes_written_ += written;
        output_.clear();
        if (ec)
        {
            throw ChannelError(ErrorCode::ConnectionClosed, "Write failed: " + ec.message());
        }
    }

    void FramedChannel::close() noexcept
    {
        std::lock_guard lock(close_mutex_);
        if (closed_)
        {
            return;
        }
        closed_ = true;
        output_.clear();
        std::error_code ec;
        if (socket_.is_open())
        {
            socket_.shutdown(Socket::shutdown_both, ec);
            socket_.close(ec);
        }
    }

    void FramedChannel::interrupt() noexcept
    {
        std::lock_guard lock(close_mutex_);
        if (closed_ || !socket_.is_open())
        {
            return;
        }
        ::shutdown(socket_.native_handle(), SHUT_RDWR);
    }

    bool FramedChannel::is_open() const noexcept
    {
        std::lock_guard lock(close_mutex_);
        return !closed_;
    }

    void FramedChannel::fill_input()
    {
        input_begin_ = 0;
        input_end_ = 0;
        wait_readable();
        std::error_code ec;
        const auto received = socket_.read_some(asio::buffer(input_.data(), input_.size()), ec);
        if (ec == asio::error::eof)
        {
            throw ChannelError(ErrorCode::ConnectionClosed, "Peer closed the connection");
        }
        if (ec)
        {
            throw ChannelError(ErrorCode::ConnectionClosed, "Read failed: " + ec.message());
        }
        input_end_ = received;
        bytes_read_ += received;
    }

    void FramedChannel::wait_readable()
    {
        if (!read_timeout_)
        {
            return;
        }
        pollfd descriptor{};
        descriptor.fd = socket_.native_handle();
        descriptor.events = POLLIN;
        const auto timeout_ms = static_cast<int>(
            std::clamp<std::chrono::milliseconds::rep>(read_timeout_->count(), 0, std::numeric_limits<int>::max()));
        for (;;)
        {
            const int rc = ::poll(&descriptor, 1, timeout_ms);
            if (rc > 0)
            {
                return;
            }
            if (rc == 0)
            {
                throw ChannelError(ErrorCode::Timeout,
                                   "No data received for " + std::to_string(read_timeout_->count()) + " ms");
            }
            if (errno != EINTR)
            {
                throw ChannelError(ErrorCode::ConnectionClosed, std::string("poll failed: ") + std::strerror(errno));
            }
        }
    }

} // namespace minishare
